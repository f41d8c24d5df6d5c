#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Mux Session
// ═══════════════════════════════════════════════════════════════════════════
// Runs the framed protocol over an authenticated relay connection:
//
//   reader_loop ─▶ FrameDecoder ─▶ dispatch ─┬─▶ Ping|Syn  : answer Ping|Ack
//                                            ├─▶ Ping|Ack  : pong handler
//                                            ├─▶ GoAway    : session closed
//                                            ├─▶ Headers|Syn: new MuxStream
//                                            └─▶ Data      : stream inbox
//
//   MuxStream / heartbeat ─▶ outbox ─▶ writer_loop ─▶ relay
//
// Both loops hold a shared_ptr to the session, so it lives until they exit.
// The close handler fires once, for failures only; close() is silent.

#include "towerlink/http/http_types.hpp"
#include "towerlink/mux/frame.hpp"
#include "towerlink/mux/mux_stream.hpp"
#include "towerlink/transport/byte_stream.hpp"
#include "towerlink/tunnel/tunnel_config.hpp"
#include "towerlink/tunnel/tunnel_error.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace towerlink::mux {

class MuxSession : public std::enable_shared_from_this<MuxSession> {
public:
    using StreamHandler = std::function<void(std::shared_ptr<MuxStream>, http::RequestHead)>;
    using PongHandler   = std::function<void(std::uint32_t nonce)>;
    using CloseHandler  = std::function<void(const TunnelError&)>;

    MuxSession(
        asio::any_io_executor executor,
        std::shared_ptr<transport::IByteStream> stream,
        MuxSessionConfig config
    );
    ~MuxSession();

    MuxSession(const MuxSession&) = delete;
    MuxSession& operator=(const MuxSession&) = delete;

    void set_stream_handler(StreamHandler handler) { stream_handler_ = std::move(handler); }
    void set_pong_handler(PongHandler handler) { pong_handler_ = std::move(handler); }
    void set_close_handler(CloseHandler handler) { close_handler_ = std::move(handler); }

    /// Begin reading and writing. `initial_bytes` are frames that arrived in
    /// the same read as the auth reply.
    void start(std::string initial_bytes = {});

    /// Local teardown: closes the connection and destroys every stream
    /// without invoking the close handler.
    void close();

    [[nodiscard]] bool is_open() const noexcept { return open_; }
    [[nodiscard]] asio::any_io_executor get_executor() const { return executor_; }
    [[nodiscard]] std::size_t stream_count() const noexcept { return streams_.size(); }
    [[nodiscard]] std::size_t outbound_bytes() const noexcept { return outbound_bytes_; }
    [[nodiscard]] std::size_t max_frame_size() const noexcept { return config_.max_frame_size; }

    /// Queue a frame, waiting first while the outbox is over its limit.
    asio::awaitable<bool> send(Frame frame);

    /// Queue a frame without waiting. False once the session is closed.
    bool post(Frame frame);

    bool send_ping(std::uint32_t nonce);
    bool send_metadata(const Json& snapshot);

    /// Drop a stream that reached Destroyed.
    void release_stream(std::uint32_t id);

private:
    asio::awaitable<void> reader_loop(std::shared_ptr<MuxSession> self, std::string initial_bytes);
    asio::awaitable<void> writer_loop(std::shared_ptr<MuxSession> self);

    bool consume(std::string_view bytes);
    void dispatch(Frame frame);
    void open_stream(Frame frame);
    void route_data(Frame frame);

    void fail(const TunnelError& error);
    void shutdown();

    asio::any_io_executor executor_;
    std::shared_ptr<transport::IByteStream> stream_;
    MuxSessionConfig config_;
    FrameDecoder decoder_;

    bool open_{false};
    bool started_{false};

    std::deque<std::string> outbox_;
    std::size_t outbound_bytes_{0};
    asio::steady_timer writer_signal_;
    asio::steady_timer drain_signal_;

    std::unordered_map<std::uint32_t, std::shared_ptr<MuxStream>> streams_;

    StreamHandler stream_handler_;
    PongHandler pong_handler_;
    CloseHandler close_handler_;
};

}  // namespace towerlink::mux
