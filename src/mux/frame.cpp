#include "towerlink/mux/frame.hpp"

#include <limits>

namespace towerlink::mux {

namespace {

// Drop consumed bytes once this many have piled up at the front.
constexpr std::size_t kCompactThreshold = 64 * 1024;

void put_u16(std::string& out, std::uint16_t v) {
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
    out.push_back(static_cast<char>(v & 0xFF));
}

void put_u32(std::string& out, std::uint32_t v) {
    out.push_back(static_cast<char>((v >> 24) & 0xFF));
    out.push_back(static_cast<char>((v >> 16) & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
    out.push_back(static_cast<char>(v & 0xFF));
}

[[nodiscard]] std::uint16_t get_u16(const char* p) noexcept {
    const auto* b = reinterpret_cast<const unsigned char*>(p);
    return static_cast<std::uint16_t>((b[0] << 8) | b[1]);
}

[[nodiscard]] std::uint32_t get_u32(const char* p) noexcept {
    const auto* b = reinterpret_cast<const unsigned char*>(p);
    return (static_cast<std::uint32_t>(b[0]) << 24) |
           (static_cast<std::uint32_t>(b[1]) << 16) |
           (static_cast<std::uint32_t>(b[2]) << 8) |
           static_cast<std::uint32_t>(b[3]);
}

[[nodiscard]] bool known_type(std::uint8_t raw) noexcept {
    return raw <= static_cast<std::uint8_t>(FrameType::Metadata);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Encoding
// ─────────────────────────────────────────────────────────────────────────────

std::string encode_frame(const Frame& frame) {
    if (frame.payload.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw FrameError("payload of " + std::to_string(frame.payload.size()) + " bytes does not fit a frame");
    }

    const std::uint32_t length = frame.carries_value()
        ? frame.value
        : static_cast<std::uint32_t>(frame.payload.size());

    std::string out;
    out.reserve(kFrameHeaderSize + (frame.carries_value() ? 0 : frame.payload.size()));
    out.push_back(static_cast<char>(kProtocolVersion));
    out.push_back(static_cast<char>(frame.type));
    put_u16(out, frame.flags);
    put_u32(out, frame.stream_id);
    put_u32(out, length);
    if (frame.carries_value() == false) {
        out.append(frame.payload);
    }
    return out;
}

Frame make_headers_frame(std::uint32_t stream_id, std::uint16_t frame_flags, const Json& head) {
    return Frame{FrameType::Headers, frame_flags, stream_id, 0, head.dump()};
}

Frame make_data_frame(std::uint32_t stream_id, std::string payload, std::uint16_t frame_flags) {
    return Frame{FrameType::Data, frame_flags, stream_id, 0, std::move(payload)};
}

Frame make_reset_frame(std::uint32_t stream_id) {
    return Frame{FrameType::Data, flags::Rst, stream_id, 0, {}};
}

Frame make_ping_frame(std::uint16_t frame_flags, std::uint32_t nonce) {
    return Frame{FrameType::Ping, frame_flags, kSessionStreamId, nonce, {}};
}

Frame make_go_away_frame(std::uint32_t code) {
    return Frame{FrameType::GoAway, flags::None, kSessionStreamId, code, {}};
}

Frame make_metadata_frame(const Json& snapshot) {
    return Frame{FrameType::Metadata, flags::None, kSessionStreamId, 0, snapshot.dump()};
}

// ─────────────────────────────────────────────────────────────────────────────
// Decoding
// ─────────────────────────────────────────────────────────────────────────────

std::vector<Frame> FrameDecoder::feed(std::string_view bytes) {
    buffer_.append(bytes);
    std::vector<Frame> frames;

    while (buffer_.size() - offset_ >= kFrameHeaderSize) {
        const char* header = buffer_.data() + offset_;

        const auto version = static_cast<std::uint8_t>(header[0]);
        if (version != kProtocolVersion) {
            throw FrameError("unsupported version " + std::to_string(version));
        }
        const auto raw_type = static_cast<std::uint8_t>(header[1]);
        if (known_type(raw_type) == false) {
            throw FrameError("unknown frame type " + std::to_string(raw_type));
        }

        Frame frame;
        frame.type = static_cast<FrameType>(raw_type);
        frame.flags = get_u16(header + 2);
        frame.stream_id = get_u32(header + 4);
        const std::uint32_t length = get_u32(header + 8);

        if (frame.carries_value()) {
            frame.value = length;
            offset_ += kFrameHeaderSize;
            frames.push_back(std::move(frame));
            continue;
        }

        if (length > max_payload_size_) {
            throw FrameError("payload of " + std::to_string(length) + " bytes exceeds limit of " +
                             std::to_string(max_payload_size_));
        }
        if (buffer_.size() - offset_ - kFrameHeaderSize < length) {
            break;
        }

        frame.payload.assign(header + kFrameHeaderSize, length);
        offset_ += kFrameHeaderSize + length;
        frames.push_back(std::move(frame));
    }

    if (offset_ == buffer_.size()) {
        buffer_.clear();
        offset_ = 0;
    } else if (offset_ > kCompactThreshold) {
        buffer_.erase(0, offset_);
        offset_ = 0;
    }
    return frames;
}

}  // namespace towerlink::mux
