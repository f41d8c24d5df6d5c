#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Tower Metadata
// ═══════════════════════════════════════════════════════════════════════════
// The list of workspaces (projects) and terminal sessions the tower exposes.
// Served on GET /__tower/metadata and pushed to the relay as a Metadata frame
// whenever it changes while connected.

#include <nlohmann/json.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace towerlink {

using Json = nlohmann::json;

struct ProjectInfo {
    std::string path;
    std::string name;

    bool operator==(const ProjectInfo&) const = default;
};

struct TerminalInfo {
    std::string id;
    std::string project_path;

    bool operator==(const TerminalInfo&) const = default;
};

struct TowerMetadata {
    std::vector<ProjectInfo> projects;
    std::vector<TerminalInfo> terminals;

    /// {"projects":[{"path","name"}], "terminals":[{"id","projectPath"}]}
    [[nodiscard]] Json to_json() const;

    /// Entries with missing or mistyped fields are skipped.
    static TowerMetadata from_json(const Json& j);

    bool operator==(const TowerMetadata&) const = default;
};

/// Latest snapshot, shared by the client and every stream proxy.
class MetadataCache {
public:
    /// Returns the new version number.
    std::uint64_t replace(TowerMetadata metadata);

    [[nodiscard]] TowerMetadata snapshot() const;
    [[nodiscard]] Json to_json() const;

    /// 0 until the first replace().
    [[nodiscard]] std::uint64_t version() const;

private:
    mutable std::mutex mutex_;
    TowerMetadata metadata_;
    std::uint64_t version_{0};
};

}  // namespace towerlink
