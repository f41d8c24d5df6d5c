#include "towerlink/transport/byte_stream.hpp"
#include "towerlink/transport/deadline.hpp"
#include "towerlink/log/logger.hpp"

#include <asio/connect.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

#include <openssl/ssl.h>

namespace towerlink::transport {

namespace {

[[nodiscard]] bool is_orderly_close(const std::error_code& ec) noexcept {
    return ec == asio::error::eof ||
           ec == asio::ssl::error::stream_truncated ||
           ec == asio::error::connection_reset;
}

[[nodiscard]] TunnelError read_error(const std::system_error& e) {
    if (is_orderly_close(e.code())) {
        return TunnelError::closed("peer closed the connection");
    }
    return TunnelError::connection_failed("read failed: " + std::string(e.what()));
}

// Resolve and connect `socket`, closing it if `timeout` elapses first.
asio::awaitable<TunnelResult<void>> connect_socket(
    asio::ip::tcp::socket& socket,
    const std::string& host,
    std::uint16_t port,
    std::chrono::milliseconds timeout
) {
    auto executor = socket.get_executor();
    asio::ip::tcp::resolver resolver(executor);

    Deadline deadline(executor, timeout, [&socket, &resolver] {
        resolver.cancel();
        asio::error_code ignored;
        socket.close(ignored);
    });

    try {
        auto endpoints = co_await resolver.async_resolve(host, std::to_string(port), asio::use_awaitable);
        if (deadline.expired()) {
            co_return tl::unexpected(TunnelError::timeout("connect to " + host + " timed out"));
        }
        co_await asio::async_connect(socket, endpoints, asio::use_awaitable);
    } catch (const std::system_error& e) {
        if (deadline.expired()) {
            co_return tl::unexpected(TunnelError::timeout(
                "connect to " + host + ":" + std::to_string(port) + " timed out"
            ));
        }
        co_return tl::unexpected(TunnelError::connection_failed(
            "connect to " + host + ":" + std::to_string(port) + " failed: " + e.what()
        ));
    }

    if (deadline.expired()) {
        co_return tl::unexpected(TunnelError::timeout("connect to " + host + " timed out"));
    }
    deadline.cancel();

    asio::error_code ignored;
    socket.set_option(asio::ip::tcp::no_delay(true), ignored);
    co_return TunnelResult<void>{};
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// TcpByteStream
// ═══════════════════════════════════════════════════════════════════════════

TcpByteStream::TcpByteStream(asio::any_io_executor executor, std::chrono::milliseconds connect_timeout)
    : socket_(std::move(executor))
    , connect_timeout_(connect_timeout)
{}

TcpByteStream::TcpByteStream(asio::ip::tcp::socket socket)
    : socket_(std::move(socket))
{}

asio::awaitable<TunnelResult<void>> TcpByteStream::async_connect(std::string host, std::uint16_t port) {
    co_return co_await connect_socket(socket_, host, port, connect_timeout_);
}

asio::awaitable<TunnelResult<std::size_t>> TcpByteStream::async_read_some(asio::mutable_buffer buffer) {
    try {
        const std::size_t n = co_await socket_.async_read_some(buffer, asio::use_awaitable);
        co_return n;
    } catch (const std::system_error& e) {
        co_return tl::unexpected(read_error(e));
    }
}

asio::awaitable<TunnelResult<void>> TcpByteStream::async_write(asio::const_buffer buffer) {
    try {
        co_await asio::async_write(socket_, buffer, asio::use_awaitable);
    } catch (const std::system_error& e) {
        co_return tl::unexpected(TunnelError::connection_failed("write failed: " + std::string(e.what())));
    }
    co_return TunnelResult<void>{};
}

void TcpByteStream::close() noexcept {
    asio::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
}

bool TcpByteStream::is_open() const noexcept {
    return socket_.is_open();
}

void TcpByteStream::shutdown_send() noexcept {
    asio::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_send, ignored);
}

// ═══════════════════════════════════════════════════════════════════════════
// TlsByteStream
// ═══════════════════════════════════════════════════════════════════════════

TlsByteStream::TlsByteStream(
    asio::any_io_executor executor,
    const TlsConfig& tls,
    std::chrono::milliseconds connect_timeout
)
    : context_(asio::ssl::context::tls_client)
    , stream_(executor, context_)
    , tls_(tls)
    , connect_timeout_(connect_timeout)
{
    context_.set_options(
        asio::ssl::context::default_workarounds |
        asio::ssl::context::no_sslv2 |
        asio::ssl::context::no_sslv3 |
        asio::ssl::context::no_tlsv1 |
        asio::ssl::context::no_tlsv1_1
    );

    if (tls_.ca_cert_path.empty()) {
        context_.set_default_verify_paths();
    } else {
        context_.load_verify_file(tls_.ca_cert_path);
    }

    if (tls_.verify_peer == false) {
        TOWERLINK_LOG_WARN("TLS peer verification disabled for relay connection");
    }
}

asio::awaitable<TunnelResult<void>> TlsByteStream::async_connect(std::string host, std::uint16_t port) {
    auto connected = co_await connect_socket(stream_.next_layer(), host, port, connect_timeout_);
    if (!connected) {
        co_return connected;
    }

    if (SSL_set_tlsext_host_name(stream_.native_handle(), host.c_str()) != 1) {
        co_return tl::unexpected(TunnelError::tls_error("failed to set SNI host name " + host));
    }

    stream_.set_verify_mode(tls_.verify_peer ? asio::ssl::verify_peer : asio::ssl::verify_none);
    if (tls_.verify_peer && tls_.verify_hostname) {
        stream_.set_verify_callback(asio::ssl::host_name_verification(host));
    }

    Deadline deadline(stream_.get_executor(), connect_timeout_, [this] {
        asio::error_code ignored;
        stream_.lowest_layer().close(ignored);
    });

    try {
        co_await stream_.async_handshake(asio::ssl::stream_base::client, asio::use_awaitable);
    } catch (const std::system_error& e) {
        if (deadline.expired()) {
            co_return tl::unexpected(TunnelError::timeout("TLS handshake with " + host + " timed out"));
        }
        co_return tl::unexpected(TunnelError::tls_error(
            "TLS handshake with " + host + " failed: " + e.what()
        ));
    }

    co_return TunnelResult<void>{};
}

asio::awaitable<TunnelResult<std::size_t>> TlsByteStream::async_read_some(asio::mutable_buffer buffer) {
    try {
        const std::size_t n = co_await stream_.async_read_some(buffer, asio::use_awaitable);
        co_return n;
    } catch (const std::system_error& e) {
        co_return tl::unexpected(read_error(e));
    }
}

asio::awaitable<TunnelResult<void>> TlsByteStream::async_write(asio::const_buffer buffer) {
    try {
        co_await asio::async_write(stream_, buffer, asio::use_awaitable);
    } catch (const std::system_error& e) {
        co_return tl::unexpected(TunnelError::connection_failed("write failed: " + std::string(e.what())));
    }
    co_return TunnelResult<void>{};
}

void TlsByteStream::close() noexcept {
    // No close_notify: the relay treats a dropped socket the same way.
    asio::error_code ignored;
    stream_.lowest_layer().shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    stream_.lowest_layer().close(ignored);
}

bool TlsByteStream::is_open() const noexcept {
    return stream_.lowest_layer().is_open();
}

// ═══════════════════════════════════════════════════════════════════════════
// Factory
// ═══════════════════════════════════════════════════════════════════════════

std::shared_ptr<IByteStream> make_relay_stream(
    asio::any_io_executor executor,
    const TunnelClientConfig& config
) {
    if (config.use_plain_tcp) {
        return std::make_shared<TcpByteStream>(std::move(executor), config.handshake_timeout);
    }
    return std::make_shared<TlsByteStream>(std::move(executor), config.tls, config.handshake_timeout);
}

}  // namespace towerlink::transport
