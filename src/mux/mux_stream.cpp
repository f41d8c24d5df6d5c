#include "towerlink/mux/mux_stream.hpp"
#include "towerlink/mux/mux_session.hpp"
#include "towerlink/log/logger.hpp"

#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>

namespace towerlink::mux {

MuxStream::MuxStream(
    std::uint32_t id,
    std::weak_ptr<MuxSession> session,
    asio::any_io_executor executor,
    std::size_t max_inbox_bytes,
    std::size_t max_chunk_size
)
    : id_(id)
    , session_(std::move(session))
    , signal_(std::move(executor))
    , max_inbox_bytes_(max_inbox_bytes)
    , max_chunk_size_(std::max<std::size_t>(max_chunk_size, 1))
{
    // Armed forever; cancel() wakes whoever is waiting in read_some().
    signal_.expires_at(asio::steady_timer::time_point::max());
}

std::shared_ptr<MuxSession> MuxStream::lock_session() const {
    return session_.lock();
}

// ═══════════════════════════════════════════════════════════════════════════
// Tower Side
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<std::optional<std::string>> MuxStream::read_some() {
    for (;;) {
        if (state_ == StreamState::Destroyed) {
            co_return std::nullopt;
        }
        if (inbox_.empty() == false) {
            std::string chunk = std::move(inbox_.front());
            inbox_.pop_front();
            inbox_bytes_ -= chunk.size();
            co_return chunk;
        }
        if (remote_fin_) {
            co_return std::nullopt;
        }

        asio::error_code ec;
        co_await signal_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }
}

asio::awaitable<bool> MuxStream::respond(const http::ResponseHead& head, bool end_stream) {
    if (state_ == StreamState::Destroyed || head_sent_) {
        co_return false;
    }
    auto session = lock_session();
    if (!session) {
        co_return false;
    }

    head_sent_ = true;
    const std::uint16_t frame_flags = end_stream ? flags::Fin : flags::None;
    const bool queued = co_await session->send(make_headers_frame(id_, frame_flags, head.to_json()));
    if (queued && end_stream) {
        local_fin_ = true;
        update_state();
    }
    co_return queued;
}

asio::awaitable<bool> MuxStream::write(std::string data) {
    if (state_ == StreamState::Destroyed || local_fin_) {
        co_return false;
    }
    auto session = lock_session();
    if (!session) {
        co_return false;
    }

    std::size_t offset = 0;
    while (offset < data.size()) {
        // The stream may be reset while we wait on a full outbox.
        if (state_ == StreamState::Destroyed) {
            co_return false;
        }
        const std::size_t n = std::min(max_chunk_size_, data.size() - offset);
        if (co_await session->send(make_data_frame(id_, data.substr(offset, n))) == false) {
            co_return false;
        }
        offset += n;
    }
    co_return true;
}

asio::awaitable<bool> MuxStream::end() {
    if (state_ == StreamState::Destroyed || local_fin_) {
        co_return false;
    }
    auto session = lock_session();
    if (!session) {
        co_return false;
    }

    const bool queued = co_await session->send(make_data_frame(id_, {}, flags::Fin));
    if (queued) {
        local_fin_ = true;
        update_state();
    }
    co_return queued;
}

void MuxStream::reset() {
    if (state_ == StreamState::Destroyed) {
        return;
    }
    auto session = lock_session();
    mark_destroyed();
    if (session) {
        session->post(make_reset_frame(id_));
        session->release_stream(id_);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Session Side
// ═══════════════════════════════════════════════════════════════════════════

void MuxStream::deliver(std::string data) {
    if (state_ == StreamState::Destroyed || remote_fin_ || data.empty()) {
        return;
    }

    inbox_bytes_ += data.size();
    if (inbox_bytes_ > max_inbox_bytes_) {
        TOWERLINK_LOG_WARN("stream {} exceeded inbound buffer of {} bytes, resetting", id_, max_inbox_bytes_);
        reset();
        return;
    }

    inbox_.push_back(std::move(data));
    signal_.cancel();
}

void MuxStream::deliver_end() {
    if (state_ == StreamState::Destroyed || remote_fin_) {
        return;
    }
    remote_fin_ = true;
    signal_.cancel();
    update_state();
}

void MuxStream::mark_destroyed() {
    if (state_ == StreamState::Destroyed) {
        return;
    }
    state_ = StreamState::Destroyed;
    inbox_.clear();
    inbox_bytes_ = 0;
    signal_.cancel();
}

void MuxStream::update_state() {
    if (state_ == StreamState::Destroyed) {
        return;
    }
    if (remote_fin_ && local_fin_) {
        mark_destroyed();
        if (auto session = lock_session()) {
            session->release_stream(id_);
        }
        return;
    }
    if (remote_fin_ || local_fin_) {
        state_ = StreamState::Closing;
    }
}

}  // namespace towerlink::mux
