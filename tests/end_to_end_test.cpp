#include <catch2/catch_test_macros.hpp>

#include "towerlink/transport/backoff_policy.hpp"
#include "towerlink/tunnel/tunnel_client.hpp"
#include "towerlink/tunnel/tunnel_status.hpp"

#include "mocks/mock_local_service.hpp"
#include "mocks/mock_relay.hpp"
#include "test_support.hpp"

#include <memory>
#include <vector>

using namespace towerlink;
using namespace towerlink::testing;

// ═══════════════════════════════════════════════════════════════════════════
// Full Tunnel Lifecycle
// ═══════════════════════════════════════════════════════════════════════════
// Relay, tower and local service all on loopback: connect, serve, survive a
// relay restart, serve again, shut down.

TEST_CASE("Tunnel serves requests across a relay reconnect", "[e2e]") {
    ScopedTestLogger logger(LogLevel::Info);
    asio::io_context io;
    MockRelay relay(io);
    MockLocalService local(io);

    TunnelClientConfig config;
    config.with_relay("127.0.0.1", relay.port())
          .with_credentials("e2e-key", "tower-e2e")
          .with_local_port(local.port())
          .with_plain_tcp()
          .with_heartbeat(50ms, 500ms)
          .with_backoff_policy(std::make_shared<ConstantBackoff>(30ms));

    auto client = std::make_unique<TunnelClient>(io.get_executor(), config);
    std::vector<TunnelState> states;
    client->on_state_change([&states](TunnelState state, TunnelState) { states.push_back(state); });

    TowerMetadata metadata;
    metadata.projects.push_back({"/work/site", "site"});
    client->send_metadata(metadata);

    // ─── connect ───────────────────────────────────────────────────────────
    client->connect();
    REQUIRE(run_until(io, [&] { return client->state() == TunnelState::Connected && relay.peer(); }));

    const auto first_uptime = client->uptime();
    REQUIRE(first_uptime.has_value());
    run_for(io, 120ms);
    const auto later_uptime = client->uptime();
    REQUIRE(later_uptime.has_value());
    REQUIRE(*later_uptime >= *first_uptime + 100ms);

    auto peer = relay.peer();
    REQUIRE(run_until(io, [&] { return peer->metadata().size() == 1 && peer->pings_received() >= 1; }));

    // ─── proxied request ───────────────────────────────────────────────────
    http::RequestHead get;
    get.method = "GET";
    get.path = "/api/projects";
    auto first = peer->open_stream(get);
    REQUIRE(run_until(io, [&] { return first->done(); }));
    REQUIRE(first->status == 200);
    REQUIRE(first->body_json()["path"] == "/api/projects");

    // ─── relay restarts ────────────────────────────────────────────────────
    relay.drop();
    REQUIRE(run_until(io, [&] {
        return relay.sessions() == 2 && client->state() == TunnelState::Connected && relay.peer();
    }));
    REQUIRE(client->consecutive_failures() == 0);

    auto second_peer = relay.peer();
    REQUIRE(run_until(io, [&] { return second_peer->metadata().size() == 1; }));
    REQUIRE(second_peer->metadata()[0]["projects"][0]["name"] == "site");

    get.path = "/api/terminals";
    auto second = second_peer->open_stream(get);
    REQUIRE(run_until(io, [&] { return second->done(); }));
    REQUIRE(second->body_json()["path"] == "/api/terminals");

    const auto status = make_status(*client, "https://relay.example.com", "laptop");
    REQUIRE(status.state == TunnelState::Connected);
    REQUIRE(status.tower_id == "tower-e2e");
    REQUIRE(status.to_json()["accessUrl"] == "https://relay.example.com/t/laptop/");

    // ─── shutdown ──────────────────────────────────────────────────────────
    client->disconnect();
    REQUIRE(client->state() == TunnelState::Disconnected);
    REQUIRE_FALSE(client->uptime().has_value());

    run_for(io, 100ms);
    REQUIRE(relay.sessions() == 2);
    REQUIRE(local.requests().size() == 2);
    REQUIRE(states == std::vector<TunnelState>{
        TunnelState::Connecting, TunnelState::Connected,
        TunnelState::Disconnected, TunnelState::Connecting, TunnelState::Connected,
        TunnelState::Disconnected
    });
    REQUIRE(logger->contains("tunnel connected"));

    client.reset();
    relay.stop();
    local.stop();
    run_for(io, 10ms);
}
