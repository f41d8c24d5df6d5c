#pragma once

#include "towerlink/tunnel/tunnel_client.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace towerlink {

/// `${server_url}/t/${tower_name}/`. A trailing slash on server_url is not doubled.
[[nodiscard]] std::string public_access_url(std::string_view server_url, std::string_view tower_name);

/// Point-in-time view of a client for status endpoints and the CLI.
struct TunnelStatus {
    TunnelState state{TunnelState::Disconnected};
    std::optional<std::chrono::milliseconds> uptime;
    std::string tower_id;
    std::optional<std::string> access_url;
    std::size_t consecutive_failures{0};

    /// {"state","uptimeMs"|null,"towerId","accessUrl"|null,"consecutiveFailures"}
    [[nodiscard]] Json to_json() const;
};

/// access_url is filled only when both server_url and tower_name are known.
[[nodiscard]] TunnelStatus make_status(
    const TunnelClient& client,
    std::string_view server_url = {},
    std::string_view tower_name = {}
);

}  // namespace towerlink
