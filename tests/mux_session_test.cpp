#include <catch2/catch_test_macros.hpp>

#include "towerlink/mux/mux_session.hpp"
#include "towerlink/transport/byte_stream.hpp"

#include "mocks/mock_relay.hpp"
#include "test_support.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/write.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace towerlink;
using namespace towerlink::testing;

namespace {

struct SessionFixture {
    asio::io_context io;
    std::shared_ptr<mux::MuxSession> session;
    std::shared_ptr<RelayPeer> relay;

    std::vector<std::uint32_t> pongs;
    std::optional<TunnelError> closed_with;

    explicit SessionFixture(mux::MuxSessionConfig config = {}) {
        auto [client, server] = make_socket_pair(io);
        session = std::make_shared<mux::MuxSession>(
            io.get_executor(),
            std::make_shared<transport::TcpByteStream>(std::move(client)),
            config
        );
        relay = std::make_shared<RelayPeer>(std::move(server));

        session->set_pong_handler([this](std::uint32_t nonce) { pongs.push_back(nonce); });
        session->set_close_handler([this](const TunnelError& error) { closed_with = error; });
    }

    ~SessionFixture() {
        session->close();
        relay->close();
        run_for(io, 10ms);
    }

    static http::RequestHead get(std::string path) {
        http::RequestHead head;
        head.method = "GET";
        head.path = std::move(path);
        return head;
    }
};

// Answers every stream with 200 and the request path as body.
asio::awaitable<void> answer_with_path(std::shared_ptr<mux::MuxStream> stream, http::RequestHead head) {
    std::string body;
    while (auto chunk = co_await stream->read_some()) {
        body += *chunk;
    }
    http::ResponseHead response;
    response.status = 200;
    response.headers["content-type"] = std::string("text/plain");
    co_await stream->respond(response);
    co_await stream->write(head.path + body);
    co_await stream->end();
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Pings
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("MuxSession answers relay pings with the same nonce", "[mux][session]") {
    SessionFixture fx;
    fx.session->start();
    fx.relay->start();

    fx.relay->send_ping(77);

    REQUIRE(run_until(fx.io, [&] { return fx.relay->pongs_received() == 1; }));
    REQUIRE(fx.session->is_open());
}

TEST_CASE("MuxSession reports pong replies to the pong handler", "[mux][session]") {
    SessionFixture fx;
    fx.session->start();
    fx.relay->start();

    REQUIRE(fx.session->send_ping(5));

    REQUIRE(run_until(fx.io, [&] { return fx.pongs.size() == 1; }));
    REQUIRE(fx.pongs.front() == 5);
    REQUIRE(fx.relay->pings_received() == 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Streams
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("MuxSession hands relay-opened streams to the stream handler", "[mux][session][stream]") {
    SessionFixture fx;
    std::vector<http::RequestHead> heads;
    fx.session->set_stream_handler([&](std::shared_ptr<mux::MuxStream> stream, http::RequestHead head) {
        heads.push_back(head);
        asio::co_spawn(fx.io, answer_with_path(std::move(stream), std::move(head)), asio::detached);
    });
    fx.session->start();
    fx.relay->start();

    auto exchange = fx.relay->open_stream(SessionFixture::get("/status"));

    REQUIRE(run_until(fx.io, [&] { return exchange->done(); }));
    REQUIRE(heads.size() == 1);
    REQUIRE(heads.front().method == "GET");
    REQUIRE(exchange->finished);
    REQUIRE(exchange->status == 200);
    REQUIRE(exchange->body == "/status");
    REQUIRE(run_until(fx.io, [&] { return fx.session->stream_count() == 0; }));
}

TEST_CASE("MuxSession delivers request bodies to the stream", "[mux][session][stream]") {
    SessionFixture fx;
    fx.session->set_stream_handler([&](std::shared_ptr<mux::MuxStream> stream, http::RequestHead head) {
        asio::co_spawn(fx.io, answer_with_path(std::move(stream), std::move(head)), asio::detached);
    });
    fx.session->start();
    fx.relay->start();

    http::RequestHead head = SessionFixture::get("/upload");
    head.method = "POST";
    auto exchange = fx.relay->open_stream(head, "payload", false);
    fx.relay->send_data(exchange->id, "-more", true);

    REQUIRE(run_until(fx.io, [&] { return exchange->done(); }));
    REQUIRE(exchange->body == "/uploadpayload-more");
}

TEST_CASE("MuxSession splits large writes to the frame size", "[mux][session][stream]") {
    mux::MuxSessionConfig config;
    config.max_frame_size = 1024;
    SessionFixture fx(config);

    fx.session->set_stream_handler([&](std::shared_ptr<mux::MuxStream> stream, http::RequestHead) {
        asio::co_spawn(fx.io, [stream]() -> asio::awaitable<void> {
            co_await stream->respond(http::ResponseHead{});
            co_await stream->write(std::string(10000, 'z'));
            co_await stream->end();
        }, asio::detached);
    });
    fx.session->start();
    fx.relay->start();

    auto exchange = fx.relay->open_stream(SessionFixture::get("/big"));

    REQUIRE(run_until(fx.io, [&] { return exchange->done(); }));
    REQUIRE(exchange->finished);
    REQUIRE(exchange->body == std::string(10000, 'z'));
}

TEST_CASE("MuxSession resets streams when no handler is installed", "[mux][session][stream]") {
    SessionFixture fx;
    fx.session->start();
    fx.relay->start();

    auto exchange = fx.relay->open_stream(SessionFixture::get("/nobody"));

    REQUIRE(run_until(fx.io, [&] { return exchange->done(); }));
    REQUIRE(exchange->reset);
    REQUIRE(fx.session->stream_count() == 0);
    REQUIRE(fx.session->is_open());
}

TEST_CASE("MuxSession resets a stream whose head is malformed", "[mux][session][stream]") {
    SessionFixture fx;
    bool handler_called = false;
    fx.session->set_stream_handler([&](std::shared_ptr<mux::MuxStream>, http::RequestHead) {
        handler_called = true;
    });
    fx.session->start();
    fx.relay->start();

    mux::Frame bad;
    bad.type = mux::FrameType::Headers;
    bad.flags = mux::flags::Syn;
    bad.stream_id = 41;
    bad.payload = R"({"path":"/missing-method"})";
    fx.relay->send_frame(bad);

    REQUIRE(run_until(fx.io, [&] { return fx.relay->unknown_resets() == 1; }));
    REQUIRE_FALSE(handler_called);
    REQUIRE(fx.session->is_open());
}

TEST_CASE("MuxSession destroys a stream the relay resets", "[mux][session][stream]") {
    SessionFixture fx;
    std::shared_ptr<mux::MuxStream> held;
    fx.session->set_stream_handler([&](std::shared_ptr<mux::MuxStream> stream, http::RequestHead) {
        held = std::move(stream);
    });
    fx.session->start();
    fx.relay->start();

    auto exchange = fx.relay->open_stream(SessionFixture::get("/long"), {}, false);
    REQUIRE(run_until(fx.io, [&] { return held != nullptr; }));
    REQUIRE(fx.session->stream_count() == 1);

    fx.relay->send_reset(exchange->id);

    REQUIRE(run_until(fx.io, [&] { return held->is_destroyed(); }));
    REQUIRE(fx.session->stream_count() == 0);

    // Writes after teardown are refused.
    REQUIRE_FALSE(run_coroutine(fx.io, held->write("late")));
}

// ═══════════════════════════════════════════════════════════════════════════
// Session Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("MuxSession dispatches frames that arrived with the auth reply", "[mux][session]") {
    SessionFixture fx;
    fx.relay->start();

    fx.session->start(mux::encode_frame(mux::make_ping_frame(mux::flags::Syn, 9)));

    REQUIRE(run_until(fx.io, [&] { return fx.relay->pongs_received() == 1; }));
}

TEST_CASE("MuxSession treats go-away as a closed session", "[mux][session]") {
    SessionFixture fx;
    fx.session->start();
    fx.relay->start();

    fx.relay->send_frame(mux::make_go_away_frame(0));

    REQUIRE(run_until(fx.io, [&] { return fx.closed_with.has_value(); }));
    REQUIRE(fx.closed_with->code == TunnelError::Code::Closed);
    REQUIRE_FALSE(fx.session->is_open());
}

TEST_CASE("MuxSession fails with a protocol error on garbage bytes", "[mux][session]") {
    SessionFixture fx;
    fx.session->start();
    fx.relay->start();

    fx.relay->send_raw(std::string(16, '\x7f'));

    REQUIRE(run_until(fx.io, [&] { return fx.closed_with.has_value(); }));
    REQUIRE(fx.closed_with->code == TunnelError::Code::ProtocolError);
}

TEST_CASE("MuxSession reports the relay hanging up", "[mux][session]") {
    SessionFixture fx;
    std::shared_ptr<mux::MuxStream> held;
    fx.session->set_stream_handler([&](std::shared_ptr<mux::MuxStream> stream, http::RequestHead) {
        held = std::move(stream);
    });
    fx.session->start();
    fx.relay->start();

    fx.relay->open_stream(SessionFixture::get("/pending"), {}, false);
    REQUIRE(run_until(fx.io, [&] { return held != nullptr; }));

    fx.relay->close();

    REQUIRE(run_until(fx.io, [&] { return fx.closed_with.has_value(); }));
    REQUIRE(fx.closed_with->is_retryable());
    REQUIRE(held->is_destroyed());
    REQUIRE(fx.session->stream_count() == 0);
}

TEST_CASE("MuxSession close is silent and refuses further frames", "[mux][session]") {
    SessionFixture fx;
    fx.session->start();
    fx.relay->start();

    fx.session->close();
    run_for(fx.io, 30ms);

    REQUIRE_FALSE(fx.closed_with.has_value());
    REQUIRE_FALSE(fx.session->is_open());
    REQUIRE_FALSE(fx.session->send_ping(1));
    REQUIRE_FALSE(fx.session->send_metadata(Json::object()));
}

TEST_CASE("MuxSession pushes metadata frames", "[mux][session]") {
    SessionFixture fx;
    fx.session->start();
    fx.relay->start();

    REQUIRE(fx.session->send_metadata(Json{{"version", 3}}));

    REQUIRE(run_until(fx.io, [&] { return fx.relay->metadata().size() == 1; }));
    REQUIRE(fx.relay->metadata().front()["version"] == 3);
}
