#include <catch2/catch_test_macros.hpp>

#include "towerlink/transport/backoff_policy.hpp"
#include "towerlink/tunnel/tunnel_config.hpp"
#include "towerlink/tunnel/tunnel_status.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

using namespace towerlink;
using namespace std::chrono_literals;

namespace {

TunnelClientConfig valid_config() {
    TunnelClientConfig config;
    config.with_relay("relay.example.com", 443)
          .with_credentials("key", "tower-1")
          .with_local_port(4100);
    return config;
}

class TempFile {
public:
    explicit TempFile(const std::string& contents)
        : path_(std::filesystem::temp_directory_path() /
                ("towerlink_creds_" + std::to_string(reinterpret_cast<std::uintptr_t>(this)) + ".json"))
    {
        std::ofstream out(path_);
        out << contents;
    }

    ~TempFile() {
        std::error_code ignored;
        std::filesystem::remove(path_, ignored);
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// TunnelClientConfig
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("TunnelClientConfig defaults", "[tunnel][config]") {
    TunnelClientConfig config;

    REQUIRE(config.tunnel_port == 443);
    REQUIRE(config.local_host == "127.0.0.1");
    REQUIRE(config.local_port == 4100);
    REQUIRE(config.use_plain_tcp == false);
    REQUIRE(config.heartbeat.ping_interval == 30s);
    REQUIRE(config.heartbeat.pong_timeout == 10s);
    REQUIRE(config.backoff_policy == nullptr);
}

TEST_CASE("TunnelClientConfig builders chain", "[tunnel][config]") {
    TunnelClientConfig config;
    config.with_relay("127.0.0.1", 9000)
          .with_credentials("k", "t")
          .with_local_port(8080)
          .with_plain_tcp()
          .with_heartbeat(100ms, 50ms)
          .with_handshake_timeout(250ms)
          .with_backoff_policy(std::make_shared<NoBackoff>());

    REQUIRE(config.server_host == "127.0.0.1");
    REQUIRE(config.tunnel_port == 9000);
    REQUIRE(config.api_key == "k");
    REQUIRE(config.tower_id == "t");
    REQUIRE(config.local_port == 8080);
    REQUIRE(config.use_plain_tcp);
    REQUIRE(config.heartbeat.ping_interval == 100ms);
    REQUIRE(config.heartbeat.pong_timeout == 50ms);
    REQUIRE(config.handshake_timeout == 250ms);
    REQUIRE(config.backoff_policy != nullptr);
}

TEST_CASE("TunnelClientConfig validate names the first problem", "[tunnel][config]") {
    REQUIRE_FALSE(valid_config().validate().has_value());

    auto no_host = valid_config();
    no_host.server_host.clear();
    REQUIRE(no_host.validate().value().find("host") != std::string::npos);

    auto no_key = valid_config();
    no_key.api_key.clear();
    REQUIRE(no_key.validate().value().find("api key") != std::string::npos);

    auto zero_port = valid_config();
    zero_port.tunnel_port = 0;
    REQUIRE(zero_port.validate().has_value());

    auto zero_local = valid_config();
    zero_local.local_port = 0;
    REQUIRE(zero_local.validate().has_value());

    auto bad_heartbeat = valid_config();
    bad_heartbeat.heartbeat.pong_timeout = 0ms;
    REQUIRE(bad_heartbeat.validate().has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Credential File
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Credentials take host and port from server_url", "[tunnel][config][credentials]") {
    const auto creds = TunnelCredentials::from_json({
        {"server_url", "https://relay.example.com/"},
        {"api_key", "secret"},
        {"tower_id", "tower-1"},
        {"tower_name", "laptop"}
    });

    REQUIRE(creds.has_value());
    REQUIRE(creds->config.server_host == "relay.example.com");
    REQUIRE(creds->config.tunnel_port == 443);
    REQUIRE(creds->config.api_key == "secret");
    REQUIRE(creds->tower_name == "laptop");
}

TEST_CASE("Credentials default to port 80 for http relays", "[tunnel][config][credentials]") {
    const auto creds = TunnelCredentials::from_json({
        {"server_url", "http://relay.local"},
        {"api_key", "secret"}
    });

    REQUIRE(creds.has_value());
    REQUIRE(creds->config.tunnel_port == 80);
}

TEST_CASE("Credentials honor explicit ports and host override", "[tunnel][config][credentials]") {
    const auto creds = TunnelCredentials::from_json({
        {"server_url", "https://relay.example.com"},
        {"server_host", "10.0.0.5"},
        {"tunnel_port", 7443},
        {"local_port", 5000},
        {"use_plain_tcp", true},
        {"api_key", "secret"}
    });

    REQUIRE(creds.has_value());
    REQUIRE(creds->config.server_host == "10.0.0.5");
    REQUIRE(creds->config.tunnel_port == 7443);
    REQUIRE(creds->config.local_port == 5000);
    REQUIRE(creds->config.use_plain_tcp);
}

TEST_CASE("Credentials reject unusable documents", "[tunnel][config][credentials]") {
    REQUIRE(TunnelCredentials::from_json(Json::array()).error().code == TunnelError::Code::InvalidConfig);

    const auto bad_port = TunnelCredentials::from_json({
        {"server_url", "https://relay.example.com"},
        {"tunnel_port", 70000},
        {"api_key", "secret"}
    });
    REQUIRE(bad_port.error().code == TunnelError::Code::InvalidConfig);

    const auto no_key = TunnelCredentials::from_json({{"server_url", "https://relay.example.com"}});
    REQUIRE_FALSE(no_key.has_value());

    const auto bad_url = TunnelCredentials::from_json({{"server_url", "not a url"}, {"api_key", "x"}});
    REQUIRE_FALSE(bad_url.has_value());
}

TEST_CASE("load_credentials reads a file", "[tunnel][config][credentials]") {
    TempFile file(R"({"server_url":"https://relay.example.com","api_key":"k","tower_id":"t"})");

    const auto creds = load_credentials(file.path());

    REQUIRE(creds.has_value());
    REQUIRE(creds->config.tower_id == "t");
}

TEST_CASE("load_credentials reports missing and malformed files", "[tunnel][config][credentials]") {
    const auto missing = load_credentials("/nonexistent/towerlink/credentials.json");
    REQUIRE(missing.error().code == TunnelError::Code::InvalidConfig);

    TempFile garbage("{ not json");
    const auto malformed = load_credentials(garbage.path());
    REQUIRE(malformed.error().code == TunnelError::Code::InvalidConfig);
    REQUIRE(malformed.error().message.find("not valid JSON") != std::string::npos);
}

// ═══════════════════════════════════════════════════════════════════════════
// Status Helpers
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("public_access_url does not double slashes", "[tunnel][status]") {
    REQUIRE(public_access_url("https://relay.example.com", "laptop") == "https://relay.example.com/t/laptop/");
    REQUIRE(public_access_url("https://relay.example.com/", "laptop") == "https://relay.example.com/t/laptop/");
}

TEST_CASE("TunnelStatus serializes absent fields as null", "[tunnel][status]") {
    TunnelStatus status;
    status.tower_id = "tower-1";

    const Json j = status.to_json();
    REQUIRE(j["state"] == "disconnected");
    REQUIRE(j["uptimeMs"].is_null());
    REQUIRE(j["accessUrl"].is_null());
    REQUIRE(j["towerId"] == "tower-1");

    status.state = TunnelState::Connected;
    status.uptime = 1500ms;
    status.access_url = "https://relay.example.com/t/laptop/";
    const Json connected = status.to_json();
    REQUIRE(connected["state"] == "connected");
    REQUIRE(connected["uptimeMs"] == 1500);
    REQUIRE(connected["accessUrl"] == "https://relay.example.com/t/laptop/");
}
