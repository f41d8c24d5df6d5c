#include "towerlink/tunnel/handshake.hpp"
#include "towerlink/log/logger.hpp"

#include <array>

namespace towerlink {

std::string make_auth_frame(std::string_view api_key, std::string_view tower_id) {
    Json auth = {
        {"type", "auth"},
        {"apiKey", std::string(api_key)},
        {"towerId", std::string(tower_id)}
    };
    return auth.dump() + "\n";
}

TunnelResult<AuthOk> parse_auth_reply(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    const Json reply = Json::parse(line, nullptr, false);
    if (reply.is_discarded() || reply.is_object() == false) {
        return tl::unexpected(TunnelError::protocol_error("auth reply is not a JSON object"));
    }

    const auto type_it = reply.find("type");
    if (type_it == reply.end() || type_it->is_string() == false) {
        return tl::unexpected(TunnelError::protocol_error("auth reply has no type"));
    }
    const auto& type = type_it->get_ref<const std::string&>();

    if (type == "auth_ok") {
        AuthOk ok;
        if (const auto it = reply.find("towerId"); it != reply.end() && it->is_string()) {
            ok.tower_id = it->get<std::string>();
        }
        return ok;
    }

    if (type == "auth_error") {
        std::string reason = "unknown";
        if (const auto it = reply.find("reason"); it != reply.end() && it->is_string()) {
            reason = it->get<std::string>();
        }
        return tl::unexpected(TunnelError::auth_failed(parse_auth_failure_reason(reason)));
    }

    return tl::unexpected(TunnelError::protocol_error("unexpected auth reply type: " + type));
}

asio::awaitable<TunnelResult<HandshakeOutcome>> perform_handshake(
    transport::IByteStream& stream,
    std::string api_key,
    std::string tower_id
) {
    const std::string auth = make_auth_frame(api_key, tower_id);
    auto sent = co_await stream.async_write(asio::buffer(auth));
    if (!sent) {
        co_return tl::unexpected(sent.error());
    }

    std::string received;
    std::array<char, 4096> chunk{};

    for (;;) {
        const auto newline = received.find('\n');
        if (newline != std::string::npos) {
            auto ack = parse_auth_reply(std::string_view(received).substr(0, newline));
            if (!ack) {
                co_return tl::unexpected(ack.error());
            }
            co_return HandshakeOutcome{std::move(*ack), received.substr(newline + 1)};
        }

        if (received.size() > kMaxAuthReplySize) {
            co_return tl::unexpected(TunnelError::protocol_error(
                "auth reply exceeds " + std::to_string(kMaxAuthReplySize) + " bytes"
            ));
        }

        auto n = co_await stream.async_read_some(asio::buffer(chunk));
        if (!n) {
            if (n.error().code == TunnelError::Code::Closed) {
                co_return tl::unexpected(TunnelError::closed("relay closed the connection during auth"));
            }
            co_return tl::unexpected(n.error());
        }
        received.append(chunk.data(), *n);
    }
}

}  // namespace towerlink
