#include "towerlink/tunnel/tunnel_config.hpp"

#include <ada.h>

#include <fstream>
#include <limits>
#include <sstream>

namespace towerlink {

// ─────────────────────────────────────────────────────────────────────────────
// Builders
// ─────────────────────────────────────────────────────────────────────────────

TunnelClientConfig& TunnelClientConfig::with_relay(std::string host, std::uint16_t port) {
    server_host = std::move(host);
    tunnel_port = port;
    return *this;
}

TunnelClientConfig& TunnelClientConfig::with_credentials(std::string key, std::string tower) {
    api_key = std::move(key);
    tower_id = std::move(tower);
    return *this;
}

TunnelClientConfig& TunnelClientConfig::with_local_port(std::uint16_t port) {
    local_port = port;
    return *this;
}

TunnelClientConfig& TunnelClientConfig::with_plain_tcp(bool enabled) {
    use_plain_tcp = enabled;
    return *this;
}

TunnelClientConfig& TunnelClientConfig::with_heartbeat(
    std::chrono::milliseconds interval,
    std::chrono::milliseconds timeout
) {
    heartbeat.ping_interval = interval;
    heartbeat.pong_timeout = timeout;
    return *this;
}

TunnelClientConfig& TunnelClientConfig::with_handshake_timeout(std::chrono::milliseconds timeout) {
    handshake_timeout = timeout;
    return *this;
}

TunnelClientConfig& TunnelClientConfig::with_backoff_policy(std::shared_ptr<IBackoffPolicy> policy) {
    backoff_policy = std::move(policy);
    return *this;
}

std::optional<std::string> TunnelClientConfig::validate() const {
    if (server_host.empty()) {
        return "server host is required";
    }
    if (tunnel_port == 0) {
        return "tunnel port must be non-zero";
    }
    if (api_key.empty()) {
        return "api key is required";
    }
    if (local_port == 0) {
        return "local port must be non-zero";
    }
    if (heartbeat.ping_interval.count() <= 0 || heartbeat.pong_timeout.count() <= 0) {
        return "heartbeat interval and pong timeout must be positive";
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// Credential File
// ─────────────────────────────────────────────────────────────────────────────

namespace {

[[nodiscard]] std::optional<std::uint16_t> port_field(const Json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_number_unsigned() == false) {
        return std::nullopt;
    }
    const auto value = it->get<std::uint64_t>();
    if (value == 0 || value > std::numeric_limits<std::uint16_t>::max()) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(value);
}

[[nodiscard]] std::string string_field(const Json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_string() == false) {
        return {};
    }
    return it->get<std::string>();
}

}  // namespace

TunnelResult<TunnelCredentials> TunnelCredentials::from_json(const Json& j) {
    if (j.is_object() == false) {
        return tl::unexpected(TunnelError::invalid_config("credential document must be a JSON object"));
    }

    TunnelCredentials creds;
    creds.server_url = string_field(j, "server_url");
    creds.tower_name = string_field(j, "tower_name");

    auto& config = creds.config;
    config.api_key = string_field(j, "api_key");
    config.tower_id = string_field(j, "tower_id");
    config.server_host = string_field(j, "server_host");

    // Host and default port come from server_url unless given explicitly.
    bool secure_url = true;
    if (creds.server_url.empty() == false) {
        auto url = ada::parse<ada::url>(creds.server_url);
        if (!url) {
            return tl::unexpected(TunnelError::invalid_config("server_url is not a valid URL: " + creds.server_url));
        }
        secure_url = (url->get_protocol() == "https:");
        if (config.server_host.empty()) {
            config.server_host = std::string(url->get_hostname());
        }
    }
    config.tunnel_port = secure_url ? 443 : 80;

    if (j.contains("tunnel_port")) {
        const auto port = port_field(j, "tunnel_port");
        if (!port) {
            return tl::unexpected(TunnelError::invalid_config("tunnel_port must be between 1 and 65535"));
        }
        config.tunnel_port = *port;
    }
    if (j.contains("local_port")) {
        const auto port = port_field(j, "local_port");
        if (!port) {
            return tl::unexpected(TunnelError::invalid_config("local_port must be between 1 and 65535"));
        }
        config.local_port = *port;
    }
    if (const auto it = j.find("use_plain_tcp"); it != j.end() && it->is_boolean()) {
        config.use_plain_tcp = it->get<bool>();
    }

    if (auto problem = config.validate()) {
        return tl::unexpected(TunnelError::invalid_config(*problem));
    }
    return creds;
}

TunnelResult<TunnelCredentials> load_credentials(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return tl::unexpected(TunnelError::invalid_config("cannot open credential file " + path.string()));
    }

    std::stringstream contents;
    contents << in.rdbuf();

    Json document = Json::parse(contents.str(), nullptr, false);
    if (document.is_discarded()) {
        return tl::unexpected(TunnelError::invalid_config("credential file is not valid JSON: " + path.string()));
    }
    return TunnelCredentials::from_json(document);
}

}  // namespace towerlink
