#include "towerlink/mux/mux_session.hpp"
#include "towerlink/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>
#include <vector>

namespace towerlink::mux {

namespace {

// Upper bound on bytes handed to a single async_write.
constexpr std::size_t kMaxWriteBatch = 256 * 1024;

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

MuxSession::MuxSession(
    asio::any_io_executor executor,
    std::shared_ptr<transport::IByteStream> stream,
    MuxSessionConfig config
)
    : executor_(std::move(executor))
    , stream_(std::move(stream))
    , config_(config)
    , decoder_(config.max_frame_size)
    , writer_signal_(executor_)
    , drain_signal_(executor_)
{
    writer_signal_.expires_at(asio::steady_timer::time_point::max());
    drain_signal_.expires_at(asio::steady_timer::time_point::max());
}

MuxSession::~MuxSession() {
    if (open_) {
        shutdown();
    }
}

void MuxSession::start(std::string initial_bytes) {
    if (started_) {
        return;
    }
    started_ = true;
    open_ = true;

    asio::co_spawn(executor_, writer_loop(shared_from_this()), asio::detached);
    asio::co_spawn(executor_, reader_loop(shared_from_this(), std::move(initial_bytes)), asio::detached);
}

void MuxSession::close() {
    if (open_ == false) {
        return;
    }
    TOWERLINK_LOG_DEBUG("closing mux session with {} open streams", streams_.size());
    shutdown();
}

// ═══════════════════════════════════════════════════════════════════════════
// Outbound
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<bool> MuxSession::send(Frame frame) {
    while (open_ && outbound_bytes_ >= config_.max_outbound_buffer) {
        asio::error_code ec;
        co_await drain_signal_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }
    co_return post(std::move(frame));
}

bool MuxSession::post(Frame frame) {
    if (open_ == false) {
        return false;
    }

    std::string encoded;
    try {
        encoded = encode_frame(frame);
    } catch (const FrameError& e) {
        TOWERLINK_LOG_ERROR("dropping outbound frame: {}", e.what());
        return false;
    }

    outbound_bytes_ += encoded.size();
    outbox_.push_back(std::move(encoded));
    writer_signal_.cancel();
    return true;
}

bool MuxSession::send_ping(std::uint32_t nonce) {
    return post(make_ping_frame(flags::Syn, nonce));
}

bool MuxSession::send_metadata(const Json& snapshot) {
    return post(make_metadata_frame(snapshot));
}

void MuxSession::release_stream(std::uint32_t id) {
    streams_.erase(id);
}

asio::awaitable<void> MuxSession::writer_loop(std::shared_ptr<MuxSession> self) {
    std::string batch;

    while (open_) {
        if (outbox_.empty()) {
            asio::error_code ec;
            co_await writer_signal_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
            continue;
        }

        batch.clear();
        while (outbox_.empty() == false &&
               (batch.empty() || batch.size() + outbox_.front().size() <= kMaxWriteBatch)) {
            batch += outbox_.front();
            outbox_.pop_front();
        }

        auto written = co_await stream_->async_write(asio::buffer(batch));

        outbound_bytes_ -= std::min(outbound_bytes_, batch.size());
        drain_signal_.cancel();

        if (!written) {
            fail(written.error());
            co_return;
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Inbound
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> MuxSession::reader_loop(std::shared_ptr<MuxSession> self, std::string initial_bytes) {
    if (initial_bytes.empty() == false && consume(initial_bytes) == false) {
        co_return;
    }

    std::vector<char> buffer(config_.read_buffer_size);
    while (open_) {
        auto n = co_await stream_->async_read_some(asio::buffer(buffer));
        if (open_ == false) {
            break;
        }
        if (!n) {
            fail(n.error());
            co_return;
        }
        if (consume(std::string_view(buffer.data(), *n)) == false) {
            co_return;
        }
    }
}

bool MuxSession::consume(std::string_view bytes) {
    std::vector<Frame> frames;
    try {
        frames = decoder_.feed(bytes);
    } catch (const FrameError& e) {
        fail(TunnelError::protocol_error(e.what()));
        return false;
    }

    for (auto& frame : frames) {
        try {
            dispatch(std::move(frame));
        } catch (const std::exception& e) {
            fail(TunnelError::protocol_error(std::string("frame dispatch failed: ") + e.what()));
            return false;
        }
        if (open_ == false) {
            return false;
        }
    }
    return true;
}

void MuxSession::dispatch(Frame frame) {
    switch (frame.type) {
        case FrameType::Ping:
            if (frame.has_flag(flags::Syn)) {
                post(make_ping_frame(flags::Ack, frame.value));
            } else if (frame.has_flag(flags::Ack) && pong_handler_) {
                pong_handler_(frame.value);
            }
            return;

        case FrameType::GoAway:
            TOWERLINK_LOG_INFO("relay sent go-away (code {})", frame.value);
            fail(TunnelError::closed("relay sent go-away code " + std::to_string(frame.value)));
            return;

        case FrameType::Metadata:
            TOWERLINK_LOG_DEBUG("ignoring inbound metadata frame ({} bytes)", frame.payload.size());
            return;

        case FrameType::Headers:
            if (frame.has_flag(flags::Syn)) {
                open_stream(std::move(frame));
            } else {
                TOWERLINK_LOG_DEBUG("ignoring headers without syn on stream {}", frame.stream_id);
            }
            return;

        case FrameType::Data:
            route_data(std::move(frame));
            return;
    }
}

void MuxSession::open_stream(Frame frame) {
    const std::uint32_t id = frame.stream_id;
    if (id == kSessionStreamId) {
        TOWERLINK_LOG_WARN("relay tried to open reserved stream 0");
        return;
    }
    if (streams_.contains(id)) {
        TOWERLINK_LOG_WARN("relay reopened active stream {}, ignoring", id);
        return;
    }

    const Json parsed = Json::parse(frame.payload, nullptr, false);
    auto head = parsed.is_discarded() ? std::nullopt : http::RequestHead::from_json(parsed);
    if (!head) {
        TOWERLINK_LOG_WARN("malformed request head on stream {}, resetting", id);
        post(make_reset_frame(id));
        return;
    }

    auto stream = std::make_shared<MuxStream>(
        id, weak_from_this(), executor_, config_.max_stream_inbox, config_.max_frame_size
    );
    streams_.emplace(id, stream);
    if (frame.has_flag(flags::Fin)) {
        stream->deliver_end();
    }

    if (!stream_handler_) {
        stream->reset();
        return;
    }
    auto handler = stream_handler_;
    handler(std::move(stream), std::move(*head));
}

void MuxSession::route_data(Frame frame) {
    const auto it = streams_.find(frame.stream_id);
    if (it == streams_.end()) {
        return;  // late frame for a finished stream
    }
    auto stream = it->second;

    if (frame.has_flag(flags::Rst)) {
        TOWERLINK_LOG_DEBUG("relay reset stream {}", frame.stream_id);
        stream->mark_destroyed();
        streams_.erase(frame.stream_id);
        return;
    }

    stream->deliver(std::move(frame.payload));
    if (frame.has_flag(flags::Fin)) {
        stream->deliver_end();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Teardown
// ═══════════════════════════════════════════════════════════════════════════

void MuxSession::fail(const TunnelError& error) {
    if (open_ == false) {
        return;
    }
    TOWERLINK_LOG_DEBUG("mux session failed: {} ({})", error.message, to_string(error.code));

    auto handler = std::move(close_handler_);
    shutdown();
    if (handler) {
        handler(error);
    }
}

void MuxSession::shutdown() {
    open_ = false;
    stream_->close();

    auto streams = std::move(streams_);
    streams_.clear();
    for (auto& [id, stream] : streams) {
        stream->mark_destroyed();
    }

    outbox_.clear();
    outbound_bytes_ = 0;
    writer_signal_.cancel();
    drain_signal_.cancel();

    stream_handler_ = nullptr;
    pong_handler_ = nullptr;
    close_handler_ = nullptr;
}

}  // namespace towerlink::mux
