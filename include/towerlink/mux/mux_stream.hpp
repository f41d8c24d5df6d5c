#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Mux Stream
// ═══════════════════════════════════════════════════════════════════════════
// One logical request/response exchange inside a MuxSession. Opened by the
// relay with Headers|Syn; the tower answers with a Headers frame followed by
// Data frames.
//
//   Open ──(one side sends Fin)──▶ Closing ──(other side Fin)──▶ Destroyed
//     │                                                            ▲
//     └──────────────(Rst either way, session closed)──────────────┘
//
// All methods run on the session's executor. Writes after the stream is
// Destroyed are refused (they return false) rather than queued.

#include "towerlink/http/http_types.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace towerlink::mux {

class MuxSession;

enum class StreamState {
    Open,
    Closing,
    Destroyed
};

[[nodiscard]] constexpr std::string_view to_string(StreamState state) noexcept {
    switch (state) {
        case StreamState::Open:      return "open";
        case StreamState::Closing:   return "closing";
        case StreamState::Destroyed: return "destroyed";
    }
    return "unknown";
}

class MuxStream : public std::enable_shared_from_this<MuxStream> {
public:
    MuxStream(
        std::uint32_t id,
        std::weak_ptr<MuxSession> session,
        asio::any_io_executor executor,
        std::size_t max_inbox_bytes,
        std::size_t max_chunk_size
    );

    MuxStream(const MuxStream&) = delete;
    MuxStream& operator=(const MuxStream&) = delete;

    [[nodiscard]] std::uint32_t id() const noexcept { return id_; }
    [[nodiscard]] StreamState state() const noexcept { return state_; }
    [[nodiscard]] bool is_destroyed() const noexcept { return state_ == StreamState::Destroyed; }

    /// The relay has finished sending the request body.
    [[nodiscard]] bool remote_ended() const noexcept { return remote_fin_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Tower Side
    // ─────────────────────────────────────────────────────────────────────────

    /// Next chunk of request body, or std::nullopt at end of body / teardown.
    asio::awaitable<std::optional<std::string>> read_some();

    /// Send the response head. Only the first call has any effect.
    asio::awaitable<bool> respond(const http::ResponseHead& head, bool end_stream = false);

    /// Send body bytes, split to the session's frame size.
    asio::awaitable<bool> write(std::string data);

    /// Send Fin.
    asio::awaitable<bool> end();

    /// Abort: send Rst and destroy immediately.
    void reset();

    // ─────────────────────────────────────────────────────────────────────────
    // Session Side
    // ─────────────────────────────────────────────────────────────────────────

    void deliver(std::string data);
    void deliver_end();
    void mark_destroyed();

private:
    void update_state();
    [[nodiscard]] std::shared_ptr<MuxSession> lock_session() const;

    std::uint32_t id_;
    std::weak_ptr<MuxSession> session_;
    asio::steady_timer signal_;

    std::deque<std::string> inbox_;
    std::size_t inbox_bytes_{0};
    std::size_t max_inbox_bytes_;
    std::size_t max_chunk_size_;

    bool head_sent_{false};
    bool remote_fin_{false};
    bool local_fin_{false};
    StreamState state_{StreamState::Open};
};

}  // namespace towerlink::mux
