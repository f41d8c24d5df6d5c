#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Byte Streams
// ═══════════════════════════════════════════════════════════════════════════
// Minimal coroutine interface over a connected, ordered byte pipe. The relay
// connection is a TlsByteStream (or TcpByteStream for plaintext relays); the
// local service is always a TcpByteStream.
//
// Instances are shared_ptr-owned: the session reader and writer coroutines
// both hold a reference for as long as they run.

#include "towerlink/tunnel/tunnel_config.hpp"
#include "towerlink/tunnel/tunnel_error.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/buffer.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/ssl.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace towerlink::transport {

class IByteStream {
public:
    virtual ~IByteStream() = default;

    /// Resolve and connect (and for TLS, handshake).
    [[nodiscard]] virtual asio::awaitable<TunnelResult<void>> async_connect(
        std::string host,
        std::uint16_t port
    ) = 0;

    /// Read whatever is available. Orderly EOF is reported as TunnelError::closed.
    [[nodiscard]] virtual asio::awaitable<TunnelResult<std::size_t>> async_read_some(
        asio::mutable_buffer buffer
    ) = 0;

    /// Write the whole buffer.
    [[nodiscard]] virtual asio::awaitable<TunnelResult<void>> async_write(
        asio::const_buffer buffer
    ) = 0;

    /// Close immediately; pending operations complete with an error.
    virtual void close() noexcept = 0;

    [[nodiscard]] virtual bool is_open() const noexcept = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// TcpByteStream
// ─────────────────────────────────────────────────────────────────────────────

class TcpByteStream final : public IByteStream {
public:
    /// Zero connect_timeout = no deadline on resolve + connect.
    TcpByteStream(asio::any_io_executor executor, std::chrono::milliseconds connect_timeout);

    /// Wrap an already-connected socket (accepted connections, tests).
    explicit TcpByteStream(asio::ip::tcp::socket socket);

    TcpByteStream(const TcpByteStream&) = delete;
    TcpByteStream& operator=(const TcpByteStream&) = delete;

    [[nodiscard]] asio::awaitable<TunnelResult<void>> async_connect(std::string host, std::uint16_t port) override;
    [[nodiscard]] asio::awaitable<TunnelResult<std::size_t>> async_read_some(asio::mutable_buffer buffer) override;
    [[nodiscard]] asio::awaitable<TunnelResult<void>> async_write(asio::const_buffer buffer) override;
    void close() noexcept override;
    [[nodiscard]] bool is_open() const noexcept override;

    /// Half-close: tells the peer no more data follows.
    void shutdown_send() noexcept;

private:
    asio::ip::tcp::socket socket_;
    std::chrono::milliseconds connect_timeout_{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// TlsByteStream
// ─────────────────────────────────────────────────────────────────────────────
// Verifies the relay certificate against the system store (or
// TlsConfig::ca_cert_path) and checks the host name. SNI is always sent.

class TlsByteStream final : public IByteStream {
public:
    /// Throws std::system_error if the CA file cannot be loaded.
    TlsByteStream(
        asio::any_io_executor executor,
        const TlsConfig& tls,
        std::chrono::milliseconds connect_timeout
    );

    TlsByteStream(const TlsByteStream&) = delete;
    TlsByteStream& operator=(const TlsByteStream&) = delete;

    [[nodiscard]] asio::awaitable<TunnelResult<void>> async_connect(std::string host, std::uint16_t port) override;
    [[nodiscard]] asio::awaitable<TunnelResult<std::size_t>> async_read_some(asio::mutable_buffer buffer) override;
    [[nodiscard]] asio::awaitable<TunnelResult<void>> async_write(asio::const_buffer buffer) override;
    void close() noexcept override;
    [[nodiscard]] bool is_open() const noexcept override;

private:
    asio::ssl::context context_;
    asio::ssl::stream<asio::ip::tcp::socket> stream_;
    TlsConfig tls_;
    std::chrono::milliseconds connect_timeout_{0};
};

/// Relay stream per config: TLS unless use_plain_tcp is set.
[[nodiscard]] std::shared_ptr<IByteStream> make_relay_stream(
    asio::any_io_executor executor,
    const TunnelClientConfig& config
);

}  // namespace towerlink::transport
