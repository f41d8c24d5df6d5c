#include "towerlink/tunnel/tunnel_status.hpp"

namespace towerlink {

std::string public_access_url(std::string_view server_url, std::string_view tower_name) {
    while (!server_url.empty() && server_url.back() == '/') {
        server_url.remove_suffix(1);
    }
    std::string url(server_url);
    url.append("/t/").append(tower_name).append("/");
    return url;
}

Json TunnelStatus::to_json() const {
    Json j = {
        {"state", std::string(to_string(state))},
        {"towerId", tower_id},
        {"consecutiveFailures", consecutive_failures}
    };
    j["uptimeMs"] = uptime ? Json(uptime->count()) : Json(nullptr);
    j["accessUrl"] = access_url ? Json(*access_url) : Json(nullptr);
    return j;
}

TunnelStatus make_status(const TunnelClient& client, std::string_view server_url, std::string_view tower_name) {
    TunnelStatus status;
    status.state = client.state();
    status.uptime = client.uptime();
    status.tower_id = client.confirmed_tower_id();
    status.consecutive_failures = client.consecutive_failures();
    if (server_url.empty() == false && tower_name.empty() == false) {
        status.access_url = public_access_url(server_url, tower_name);
    }
    return status;
}

}  // namespace towerlink
