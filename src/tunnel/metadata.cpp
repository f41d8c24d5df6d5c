#include "towerlink/tunnel/metadata.hpp"

namespace towerlink {

namespace {

[[nodiscard]] std::optional<std::string> string_member(const Json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_string() == false) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

}  // namespace

Json TowerMetadata::to_json() const {
    Json projects_json = Json::array();
    for (const auto& project : projects) {
        projects_json.push_back({{"path", project.path}, {"name", project.name}});
    }

    Json terminals_json = Json::array();
    for (const auto& terminal : terminals) {
        terminals_json.push_back({{"id", terminal.id}, {"projectPath", terminal.project_path}});
    }

    return Json{{"projects", std::move(projects_json)}, {"terminals", std::move(terminals_json)}};
}

TowerMetadata TowerMetadata::from_json(const Json& j) {
    TowerMetadata metadata;
    if (j.is_object() == false) {
        return metadata;
    }

    if (const auto it = j.find("projects"); it != j.end() && it->is_array()) {
        for (const auto& entry : *it) {
            if (entry.is_object() == false) {
                continue;
            }
            auto path = string_member(entry, "path");
            auto name = string_member(entry, "name");
            if (path && name) {
                metadata.projects.push_back(ProjectInfo{std::move(*path), std::move(*name)});
            }
        }
    }

    if (const auto it = j.find("terminals"); it != j.end() && it->is_array()) {
        for (const auto& entry : *it) {
            if (entry.is_object() == false) {
                continue;
            }
            auto id = string_member(entry, "id");
            auto project_path = string_member(entry, "projectPath");
            if (id && project_path) {
                metadata.terminals.push_back(TerminalInfo{std::move(*id), std::move(*project_path)});
            }
        }
    }

    return metadata;
}

std::uint64_t MetadataCache::replace(TowerMetadata metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    metadata_ = std::move(metadata);
    return ++version_;
}

TowerMetadata MetadataCache::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metadata_;
}

Json MetadataCache::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metadata_.to_json();
}

std::uint64_t MetadataCache::version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return version_;
}

}  // namespace towerlink
