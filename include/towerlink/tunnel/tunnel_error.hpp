#ifndef TOWERLINK_TUNNEL_TUNNEL_ERROR_HPP
#define TOWERLINK_TUNNEL_TUNNEL_ERROR_HPP

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace towerlink {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Auth Failure Reasons
// ─────────────────────────────────────────────────────────────────────────────
// Reasons the relay attaches to an auth_error reply. Only InvalidApiKey is
// terminal; everything else is retried with backoff.

enum class AuthFailureReason {
    InvalidApiKey,
    InvalidAuthFrame,
    RateLimited,
    InternalError,
    Unknown
};

[[nodiscard]] constexpr std::string_view to_string(AuthFailureReason reason) noexcept {
    switch (reason) {
        case AuthFailureReason::InvalidApiKey:    return "invalid_api_key";
        case AuthFailureReason::InvalidAuthFrame: return "invalid_auth_frame";
        case AuthFailureReason::RateLimited:      return "rate_limited";
        case AuthFailureReason::InternalError:    return "internal_error";
        case AuthFailureReason::Unknown:          return "unknown";
    }
    return "unknown";
}

[[nodiscard]] constexpr AuthFailureReason parse_auth_failure_reason(std::string_view text) noexcept {
    if (text == "invalid_api_key")    return AuthFailureReason::InvalidApiKey;
    if (text == "invalid_auth_frame") return AuthFailureReason::InvalidAuthFrame;
    if (text == "rate_limited")       return AuthFailureReason::RateLimited;
    if (text == "internal_error")     return AuthFailureReason::InternalError;
    return AuthFailureReason::Unknown;
}

// ─────────────────────────────────────────────────────────────────────────────
// Tunnel Error
// ─────────────────────────────────────────────────────────────────────────────

struct TunnelError {
    enum class Code {
        ConnectionFailed,         // TCP connect / resolve / socket I/O failed
        TlsError,                 // TLS handshake or verification failed
        Timeout,                  // Handshake or local connect deadline hit
        AuthRejected,             // Relay rejected the API key (terminal)
        AuthRetryable,            // Relay refused auth for a transient reason
        ProtocolError,            // Malformed reply or frame
        Closed,                   // Peer closed the connection
        HeartbeatTimeout,         // No pong within the pong timeout
        LocalServiceUnavailable,  // Local service refused or dropped us
        InvalidConfig             // Credential file or settings unusable
    };

    Code code;
    std::string message;
    std::optional<AuthFailureReason> auth_reason;

    /// Only an API key rejection stops the reconnect loop.
    [[nodiscard]] bool is_retryable() const noexcept {
        return code != Code::AuthRejected;
    }

    static TunnelError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg, std::nullopt};
    }

    static TunnelError tls_error(const std::string& msg) {
        return {Code::TlsError, msg, std::nullopt};
    }

    static TunnelError timeout(const std::string& msg) {
        return {Code::Timeout, msg, std::nullopt};
    }

    static TunnelError auth_failed(AuthFailureReason reason) {
        const Code code = (reason == AuthFailureReason::InvalidApiKey)
            ? Code::AuthRejected
            : Code::AuthRetryable;
        return {code, "relay rejected auth: " + std::string(to_string(reason)), reason};
    }

    static TunnelError protocol_error(const std::string& msg) {
        return {Code::ProtocolError, msg, std::nullopt};
    }

    static TunnelError closed(const std::string& msg = "connection closed") {
        return {Code::Closed, msg, std::nullopt};
    }

    static TunnelError heartbeat_timeout() {
        return {Code::HeartbeatTimeout, "pong not received within timeout", std::nullopt};
    }

    static TunnelError local_unavailable(const std::string& msg) {
        return {Code::LocalServiceUnavailable, msg, std::nullopt};
    }

    static TunnelError invalid_config(const std::string& msg) {
        return {Code::InvalidConfig, msg, std::nullopt};
    }
};

[[nodiscard]] constexpr std::string_view to_string(TunnelError::Code code) noexcept {
    switch (code) {
        case TunnelError::Code::ConnectionFailed:        return "connection_failed";
        case TunnelError::Code::TlsError:                return "tls_error";
        case TunnelError::Code::Timeout:                 return "timeout";
        case TunnelError::Code::AuthRejected:            return "auth_rejected";
        case TunnelError::Code::AuthRetryable:           return "auth_retryable";
        case TunnelError::Code::ProtocolError:           return "protocol_error";
        case TunnelError::Code::Closed:                  return "closed";
        case TunnelError::Code::HeartbeatTimeout:        return "heartbeat_timeout";
        case TunnelError::Code::LocalServiceUnavailable: return "local_service_unavailable";
        case TunnelError::Code::InvalidConfig:           return "invalid_config";
    }
    return "unknown";
}

template <typename T>
using TunnelResult = tl::expected<T, TunnelError>;

}  // namespace towerlink

#endif  // TOWERLINK_TUNNEL_TUNNEL_ERROR_HPP
