#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Session Frames
// ═══════════════════════════════════════════════════════════════════════════
// After authentication the relay connection carries a sequence of frames,
// each a 12-byte big-endian header followed by `length` payload bytes:
//
//   0       1       2               4                               8
//   ┌───────┬───────┬───────────────┬───────────────────────────────┐
//   │version│ type  │    flags      │          stream id            │
//   ├───────┴───────┴───────────────┼───────────────────────────────┤
//   │            length             │  payload ...
//   └───────────────────────────────┘
//
// Ping and GoAway carry no payload; their length field holds an opaque
// value (ping nonce, go-away code) instead.

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace towerlink::mux {

using Json = nlohmann::json;

inline constexpr std::uint8_t kProtocolVersion = 0;
inline constexpr std::size_t kFrameHeaderSize = 12;
inline constexpr std::uint32_t kSessionStreamId = 0;

enum class FrameType : std::uint8_t {
    Data     = 0,
    Headers  = 1,
    Ping     = 2,
    GoAway   = 3,
    Metadata = 4
};

[[nodiscard]] constexpr std::string_view to_string(FrameType type) noexcept {
    switch (type) {
        case FrameType::Data:     return "DATA";
        case FrameType::Headers:  return "HEADERS";
        case FrameType::Ping:     return "PING";
        case FrameType::GoAway:   return "GOAWAY";
        case FrameType::Metadata: return "METADATA";
    }
    return "UNKNOWN";
}

namespace flags {
inline constexpr std::uint16_t None = 0x0;
inline constexpr std::uint16_t Syn  = 0x1;  // opens a stream / ping request
inline constexpr std::uint16_t Ack  = 0x2;  // ping reply
inline constexpr std::uint16_t Fin  = 0x4;  // sender's half of the stream is done
inline constexpr std::uint16_t Rst  = 0x8;  // stream aborted
}  // namespace flags

struct Frame {
    FrameType type{FrameType::Data};
    std::uint16_t flags{flags::None};
    std::uint32_t stream_id{0};
    std::uint32_t value{0};   // Ping / GoAway only
    std::string payload;

    [[nodiscard]] bool has_flag(std::uint16_t flag) const noexcept {
        return (flags & flag) != 0;
    }

    /// Frames whose length field is an opaque value rather than a size.
    [[nodiscard]] bool carries_value() const noexcept {
        return type == FrameType::Ping || type == FrameType::GoAway;
    }
};

/// Malformed or oversized frame. Fatal for the session.
class FrameError : public std::runtime_error {
public:
    explicit FrameError(const std::string& what)
        : std::runtime_error("frame error: " + what)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// Encoding
// ─────────────────────────────────────────────────────────────────────────────

/// Throws FrameError if the payload does not fit the 32-bit length field.
[[nodiscard]] std::string encode_frame(const Frame& frame);

[[nodiscard]] Frame make_headers_frame(std::uint32_t stream_id, std::uint16_t frame_flags, const Json& head);
[[nodiscard]] Frame make_data_frame(std::uint32_t stream_id, std::string payload, std::uint16_t frame_flags = flags::None);
[[nodiscard]] Frame make_reset_frame(std::uint32_t stream_id);
[[nodiscard]] Frame make_ping_frame(std::uint16_t frame_flags, std::uint32_t nonce);
[[nodiscard]] Frame make_go_away_frame(std::uint32_t code);
[[nodiscard]] Frame make_metadata_frame(const Json& snapshot);

// ─────────────────────────────────────────────────────────────────────────────
// Decoding
// ─────────────────────────────────────────────────────────────────────────────

/// Incremental decoder: feed arbitrary byte slices, get complete frames back.
class FrameDecoder {
public:
    explicit FrameDecoder(std::size_t max_payload_size = 1024 * 1024)
        : max_payload_size_(max_payload_size)
    {}

    /// Throws FrameError on an unknown version or type, or an oversized payload.
    [[nodiscard]] std::vector<Frame> feed(std::string_view bytes);

    [[nodiscard]] std::size_t buffered() const noexcept { return buffer_.size() - offset_; }

private:
    std::size_t max_payload_size_;
    std::string buffer_;
    std::size_t offset_{0};
};

}  // namespace towerlink::mux
