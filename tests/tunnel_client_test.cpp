#include <catch2/catch_test_macros.hpp>

#include "towerlink/transport/backoff_policy.hpp"
#include "towerlink/tunnel/tunnel_client.hpp"
#include "towerlink/tunnel/tunnel_status.hpp"

#include "mocks/mock_relay.hpp"
#include "test_support.hpp"

#include <memory>
#include <stdexcept>
#include <vector>

using namespace towerlink;
using namespace towerlink::testing;

namespace {

struct ClientFixture {
    asio::io_context io;
    MockRelay relay{io};
    std::unique_ptr<TunnelClient> client;
    std::vector<TunnelState> states;

    ClientFixture() = default;

    ~ClientFixture() {
        client.reset();
        relay.stop();
        run_for(io, 10ms);
    }

    TunnelClientConfig config() {
        TunnelClientConfig config;
        config.with_relay("127.0.0.1", relay.port())
              .with_credentials("test-key", "tower-1")
              .with_local_port(unused_port(io))
              .with_plain_tcp()
              .with_handshake_timeout(2000ms)
              .with_backoff_policy(std::make_shared<ConstantBackoff>(20ms));
        return config;
    }

    TunnelClient& make(TunnelClientConfig cfg) {
        client = std::make_unique<TunnelClient>(io.get_executor(), std::move(cfg));
        client->on_state_change([this](TunnelState state, TunnelState) { states.push_back(state); });
        return *client;
    }

    TunnelClient& make() { return make(config()); }

    bool wait_for(TunnelState state, std::chrono::milliseconds timeout = 5s) {
        return run_until(io, [&] { return client->state() == state; }, timeout);
    }
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Connecting
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("TunnelClient authenticates and reports Connected", "[tunnel][client]") {
    ClientFixture fx;
    fx.relay.set_confirmed_tower_id("tower-confirmed");
    auto& client = fx.make();

    REQUIRE(client.state() == TunnelState::Disconnected);
    REQUIRE_FALSE(client.uptime().has_value());

    client.connect();
    REQUIRE(fx.wait_for(TunnelState::Connected));

    REQUIRE(fx.states == std::vector<TunnelState>{TunnelState::Connecting, TunnelState::Connected});
    REQUIRE(client.uptime().has_value());
    REQUIRE(client.confirmed_tower_id() == "tower-confirmed");
    REQUIRE(client.consecutive_failures() == 0);

    REQUIRE(fx.relay.auth_frames().size() == 1);
    const Json& auth = fx.relay.auth_frames().front();
    REQUIRE(auth["type"] == "auth");
    REQUIRE(auth["apiKey"] == "test-key");
    REQUIRE(auth["towerId"] == "tower-1");
}

TEST_CASE("TunnelClient connect is a no-op while connecting or connected", "[tunnel][client]") {
    ClientFixture fx;
    auto& client = fx.make();

    client.connect();
    client.connect();
    REQUIRE(fx.wait_for(TunnelState::Connected));
    client.connect();
    run_for(fx.io, 50ms);

    REQUIRE(fx.relay.connections() == 1);
    REQUIRE(client.state() == TunnelState::Connected);
}

TEST_CASE("TunnelClient confirms the tower id echoed by the relay", "[tunnel][client]") {
    ClientFixture fx;
    auto& client = fx.make();

    client.connect();
    REQUIRE(fx.wait_for(TunnelState::Connected));

    // The mock echoes the id it was sent when no override is set.
    REQUIRE(client.confirmed_tower_id() == "tower-1");
}

TEST_CASE("TunnelClient dispatches frames sent with the auth reply", "[tunnel][client]") {
    ClientFixture fx;
    fx.relay.set_trailing_bytes(mux::encode_frame(mux::make_ping_frame(mux::flags::Syn, 3)));
    auto& client = fx.make();

    client.connect();
    REQUIRE(fx.wait_for(TunnelState::Connected));
    REQUIRE(run_until(fx.io, [&] { return fx.relay.peer() && fx.relay.peer()->pongs_received() == 1; }));
}

// ═══════════════════════════════════════════════════════════════════════════
// Authentication Failures
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("TunnelClient stops retrying after an invalid API key", "[tunnel][client][auth]") {
    ScopedTestLogger logger;
    ClientFixture fx;
    fx.relay.set_auth_reply(MockRelay::AuthReply::InvalidApiKey);
    auto& client = fx.make();

    client.connect();
    REQUIRE(fx.wait_for(TunnelState::AuthFailed));
    run_for(fx.io, 200ms);

    REQUIRE(client.state() == TunnelState::AuthFailed);
    REQUIRE(fx.relay.connections() == 1);
    REQUIRE(client.breaker_state() == BreakerState::Tripped);
    REQUIRE(logger->count(LogLevel::Error) >= 1);

    SECTION("connect is ignored") {
        client.connect();
        run_for(fx.io, 50ms);
        REQUIRE(client.state() == TunnelState::AuthFailed);
        REQUIRE(fx.relay.connections() == 1);
        REQUIRE(logger->contains("connect ignored"));
    }

    SECTION("disconnect keeps AuthFailed") {
        client.disconnect();
        REQUIRE(client.state() == TunnelState::AuthFailed);
    }

    SECTION("reset_circuit_breaker allows a fresh attempt") {
        client.reset_circuit_breaker();
        REQUIRE(client.state() == TunnelState::Disconnected);
        REQUIRE(client.breaker_state() == BreakerState::Closed);

        fx.relay.set_auth_reply(MockRelay::AuthReply::Accept);
        client.connect();
        REQUIRE(fx.wait_for(TunnelState::Connected));
    }
}

TEST_CASE("TunnelClient retries rate-limited auth with backoff", "[tunnel][client][auth]") {
    ClientFixture fx;
    fx.relay.set_auth_reply(MockRelay::AuthReply::RateLimited);
    auto& client = fx.make();

    client.connect();
    REQUIRE(run_until(fx.io, [&] { return fx.relay.connections() >= 3; }));
    REQUIRE(client.state() != TunnelState::AuthFailed);
    REQUIRE(client.consecutive_failures() >= 2);

    fx.relay.set_auth_reply(MockRelay::AuthReply::Accept);
    REQUIRE(fx.wait_for(TunnelState::Connected));
    REQUIRE(client.consecutive_failures() == 0);
}

TEST_CASE("TunnelClient retries a malformed auth reply", "[tunnel][client][auth]") {
    ClientFixture fx;
    fx.relay.set_auth_reply(MockRelay::AuthReply::Malformed);
    auto& client = fx.make();

    client.connect();
    REQUIRE(run_until(fx.io, [&] { return fx.relay.connections() >= 2; }));
    REQUIRE(client.state() != TunnelState::AuthFailed);
}

TEST_CASE("TunnelClient gives up on a silent relay after the handshake timeout", "[tunnel][client][auth]") {
    ScopedTestLogger logger;
    ClientFixture fx;
    fx.relay.set_auth_reply(MockRelay::AuthReply::NoReply);
    auto cfg = fx.config();
    cfg.with_handshake_timeout(100ms);
    auto& client = fx.make(std::move(cfg));

    client.connect();
    REQUIRE(run_until(fx.io, [&] { return fx.relay.connections() >= 2; }));
    REQUIRE(client.consecutive_failures() >= 1);
    REQUIRE(logger->contains("timed out"));
}

// ═══════════════════════════════════════════════════════════════════════════
// Disconnect
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("TunnelClient disconnect before connect is harmless", "[tunnel][client]") {
    ClientFixture fx;
    auto& client = fx.make();

    client.disconnect();
    client.disconnect();

    REQUIRE(client.state() == TunnelState::Disconnected);
    REQUIRE(fx.states.empty());
}

TEST_CASE("TunnelClient disconnect tears down and stays down", "[tunnel][client]") {
    ClientFixture fx;
    auto& client = fx.make();

    client.connect();
    REQUIRE(fx.wait_for(TunnelState::Connected));

    client.disconnect();
    client.disconnect();

    REQUIRE(client.state() == TunnelState::Disconnected);
    REQUIRE_FALSE(client.uptime().has_value());
    REQUIRE(fx.states.back() == TunnelState::Disconnected);

    run_for(fx.io, 150ms);
    REQUIRE(fx.relay.sessions() == 1);
    REQUIRE(client.state() == TunnelState::Disconnected);
}

TEST_CASE("TunnelClient disconnect during the handshake abandons it", "[tunnel][client]") {
    ClientFixture fx;
    fx.relay.set_auth_reply(MockRelay::AuthReply::NoReply);
    auto& client = fx.make();

    client.connect();
    REQUIRE(run_until(fx.io, [&] { return fx.relay.auth_frames().size() == 1; }));
    REQUIRE(client.state() == TunnelState::Connecting);

    client.disconnect();
    REQUIRE(client.state() == TunnelState::Disconnected);

    run_for(fx.io, 150ms);
    REQUIRE(client.state() == TunnelState::Disconnected);
    REQUIRE(fx.relay.connections() == 1);
}

TEST_CASE("TunnelClient can be destroyed mid-attempt", "[tunnel][client]") {
    ClientFixture fx;
    fx.relay.set_auth_reply(MockRelay::AuthReply::NoReply);
    auto& client = fx.make();

    client.connect();
    REQUIRE(run_until(fx.io, [&] { return fx.relay.connections() == 1; }));

    fx.client.reset();
    run_for(fx.io, 100ms);

    REQUIRE(fx.states == std::vector<TunnelState>{TunnelState::Connecting});
}

// ═══════════════════════════════════════════════════════════════════════════
// Reconnect
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("TunnelClient reconnects after the relay drops", "[tunnel][client][reconnect]") {
    ClientFixture fx;
    auto& client = fx.make();

    client.connect();
    REQUIRE(fx.wait_for(TunnelState::Connected));

    fx.relay.drop();
    REQUIRE(run_until(fx.io, [&] {
        return fx.relay.sessions() == 2 && client.state() == TunnelState::Connected;
    }));

    // Connected → Disconnected → Connecting → Connected again.
    REQUIRE(fx.states.size() == 5);
    REQUIRE(fx.states[2] == TunnelState::Disconnected);
    REQUIRE(client.consecutive_failures() == 0);
}

TEST_CASE("TunnelClient reconnects after missed pongs", "[tunnel][client][reconnect]") {
    ScopedTestLogger logger;
    ClientFixture fx;
    fx.relay.set_answer_pings(false);
    auto cfg = fx.config();
    cfg.with_heartbeat(30ms, 60ms);
    auto& client = fx.make(std::move(cfg));

    client.connect();
    REQUIRE(fx.wait_for(TunnelState::Connected));
    REQUIRE(run_until(fx.io, [&] { return fx.relay.sessions() >= 2; }));

    REQUIRE(logger->contains("no pong"));
}

TEST_CASE("TunnelClient keeps the connection while pongs arrive", "[tunnel][client][reconnect]") {
    ClientFixture fx;
    auto cfg = fx.config();
    cfg.with_heartbeat(20ms, 200ms);
    auto& client = fx.make(std::move(cfg));

    client.connect();
    REQUIRE(fx.wait_for(TunnelState::Connected));
    run_for(fx.io, 200ms);

    REQUIRE(client.state() == TunnelState::Connected);
    REQUIRE(fx.relay.sessions() == 1);
    REQUIRE(fx.relay.peer()->pings_received() >= 3);
}

TEST_CASE("TunnelClient retries when the relay is unreachable", "[tunnel][client][reconnect]") {
    ClientFixture fx;
    auto cfg = fx.config();
    cfg.with_relay("127.0.0.1", unused_port(fx.io));
    auto& client = fx.make(std::move(cfg));

    client.connect();
    REQUIRE(run_until(fx.io, [&] { return client.consecutive_failures() >= 3; }));
    REQUIRE(client.state() != TunnelState::AuthFailed);
    REQUIRE(client.state() != TunnelState::Connected);
}

TEST_CASE("TunnelClient treats an unusable config as a retryable failure", "[tunnel][client][reconnect]") {
    ClientFixture fx;
    auto cfg = fx.config();
    cfg.api_key.clear();
    auto& client = fx.make(std::move(cfg));

    client.connect();
    REQUIRE(run_until(fx.io, [&] { return client.consecutive_failures() >= 2; }));
    REQUIRE(client.state() != TunnelState::AuthFailed);
    REQUIRE(fx.relay.connections() == 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Listeners / Metadata / Status
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("TunnelClient transitions even when a listener throws", "[tunnel][client]") {
    ScopedTestLogger logger;
    ClientFixture fx;
    auto& client = fx.make();
    client.on_state_change([](TunnelState, TunnelState) {
        throw std::runtime_error("listener blew up");
    });

    client.connect();
    REQUIRE(fx.wait_for(TunnelState::Connected));

    REQUIRE(fx.states.back() == TunnelState::Connected);
    REQUIRE(logger->contains("listener blew up"));
}

TEST_CASE("TunnelClient survives a listener throwing a non-standard exception", "[tunnel][client]") {
    ScopedTestLogger logger;
    ClientFixture fx;
    auto& client = fx.make();

    client.on_state_change([](TunnelState, TunnelState) {
        throw 42;
    });
    std::vector<TunnelState> later;
    client.on_state_change([&later](TunnelState state, TunnelState) { later.push_back(state); });

    client.connect();
    REQUIRE(fx.wait_for(TunnelState::Connected));
    REQUIRE(later == std::vector<TunnelState>{TunnelState::Connecting, TunnelState::Connected});

    // The failure path still schedules a reconnect.
    fx.relay.drop();
    REQUIRE(run_until(fx.io, [&] {
        return fx.relay.sessions() == 2 && client.state() == TunnelState::Connected;
    }));

    REQUIRE(later.size() == 5);
    REQUIRE(later[2] == TunnelState::Disconnected);
    REQUIRE(logger->contains("non-standard exception"));
}

TEST_CASE("TunnelClient pushes metadata on connect and on change", "[tunnel][client][metadata]") {
    ClientFixture fx;
    auto& client = fx.make();

    TowerMetadata first;
    first.projects.push_back({"/srv/app", "app"});
    client.send_metadata(first);

    client.connect();
    REQUIRE(fx.wait_for(TunnelState::Connected));
    REQUIRE(run_until(fx.io, [&] { return fx.relay.peer() && fx.relay.peer()->metadata().size() == 1; }));
    REQUIRE(fx.relay.peer()->metadata()[0]["projects"][0]["name"] == "app");

    TowerMetadata second;
    second.terminals.push_back({"term-1", "/srv/app"});
    client.send_metadata(second);

    REQUIRE(run_until(fx.io, [&] { return fx.relay.peer()->metadata().size() == 2; }));
    REQUIRE(fx.relay.peer()->metadata()[1]["terminals"][0]["id"] == "term-1");
    REQUIRE(client.metadata()->version() == 2);
}

TEST_CASE("TunnelClient caches metadata while disconnected", "[tunnel][client][metadata]") {
    ClientFixture fx;
    auto& client = fx.make();

    TowerMetadata metadata;
    metadata.projects.push_back({"/a", "a"});
    client.send_metadata(metadata);

    REQUIRE(client.metadata()->snapshot() == metadata);
    REQUIRE(fx.relay.connections() == 0);
}

TEST_CASE("make_status reflects the client", "[tunnel][client][status]") {
    ClientFixture fx;
    auto& client = fx.make();

    const auto idle = make_status(client);
    REQUIRE(idle.state == TunnelState::Disconnected);
    REQUIRE_FALSE(idle.uptime.has_value());
    REQUIRE_FALSE(idle.access_url.has_value());

    client.connect();
    REQUIRE(fx.wait_for(TunnelState::Connected));

    const auto status = make_status(client, "https://relay.example.com/", "laptop");
    REQUIRE(status.state == TunnelState::Connected);
    REQUIRE(status.uptime.has_value());
    REQUIRE(status.tower_id == "tower-1");
    REQUIRE(status.access_url == "https://relay.example.com/t/laptop/");
    REQUIRE(status.to_json()["state"] == "connected");
}
