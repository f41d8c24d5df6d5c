#include "towerlink/tunnel/stream_proxy.hpp"
#include "towerlink/log/logger.hpp"
#include "towerlink/security/path_filter.hpp"
#include "towerlink/transport/deadline.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>
#include <sstream>
#include <stdexcept>

namespace towerlink {

namespace {

namespace beast_http = boost::beast::http;
using LocalRequest = beast_http::request<beast_http::string_body>;

constexpr std::size_t kLocalReadChunk = 16 * 1024;

// Headers the proxy writes itself.
[[nodiscard]] bool is_proxy_managed_header(std::string_view name) {
    if (name.empty() || name.front() == ':') {
        return true;  // HTTP/2 pseudo-headers
    }
    return http::iequals(name, "host") || http::iequals(name, "content-length");
}

[[nodiscard]] bool is_websocket_handshake_header(std::string_view name) {
    return http::iequals(name, "sec-websocket-key") || http::iequals(name, "sec-websocket-version");
}

template <typename Pred>
void erase_headers_if(http::HeaderMap& headers, Pred pred) {
    for (auto it = headers.begin(); it != headers.end();) {
        if (pred(it->first)) {
            it = headers.erase(it);
        } else {
            ++it;
        }
    }
}

[[nodiscard]] boost::beast::string_view to_beast(std::string_view text) noexcept {
    return {text.data(), text.size()};
}

// Request line and Host for a relayed head. Throws std::invalid_argument on a
// head that would not survive as an HTTP/1.1 request line.
[[nodiscard]] LocalRequest start_local_request(
    std::string_view method,
    const http::RequestHead& head,
    std::string_view host_header
) {
    if (auto problem = head.validate()) {
        throw std::invalid_argument("refusing to forward request head: " + *problem);
    }
    if (http::is_valid_request_target(host_header) == false) {
        throw std::invalid_argument("refusing to forward request head: invalid host");
    }

    LocalRequest request;
    request.method_string(to_beast(method));
    request.target(head.path.empty() ? boost::beast::string_view("/") : to_beast(head.path));
    request.version(11);
    request.set(beast_http::field::host, to_beast(host_header));
    return request;
}

void insert_headers(LocalRequest& request, const http::HeaderMap& headers) {
    for (const auto& [name, value] : headers) {
        if (const auto* single = std::get_if<std::string>(&value)) {
            request.insert(to_beast(name), to_beast(*single));
            continue;
        }
        for (const auto& item : std::get<std::vector<std::string>>(value)) {
            request.insert(to_beast(name), to_beast(item));
        }
    }
}

[[nodiscard]] std::string serialize(const LocalRequest& request) {
    std::ostringstream out;
    out << request;
    return out.str();
}

[[nodiscard]] std::string local_authority(const StreamProxyConfig& config) {
    return config.local_host + ":" + std::to_string(config.local_port);
}

asio::awaitable<void> respond_json(mux::MuxStream& stream, int status, const Json& body) {
    std::string payload = body.dump();

    http::ResponseHead head;
    head.status = status;
    head.headers["content-type"] = std::string("application/json");
    head.headers["content-length"] = std::to_string(payload.size());

    if (co_await stream.respond(head) == false) {
        co_return;
    }
    if (co_await stream.write(std::move(payload)) == false) {
        co_return;
    }
    co_await stream.end();
}

asio::awaitable<void> respond_error(mux::MuxStream& stream, int status, std::string_view message) {
    co_await respond_json(stream, status, Json{{"error", std::string(message)}});
}

}  // namespace

StreamProxyConfig StreamProxyConfig::from(const TunnelClientConfig& config) {
    StreamProxyConfig out;
    out.local_host = config.local_host;
    out.local_port = config.local_port;
    out.connect_timeout = config.local_connect_timeout;
    out.max_request_body_size = config.max_request_body_size;
    out.max_drain_bytes = config.max_drain_bytes;
    return out;
}

StreamProxy::StreamProxy(
    asio::any_io_executor executor,
    StreamProxyConfig config,
    std::shared_ptr<MetadataCache> metadata
)
    : executor_(std::move(executor))
    , config_(std::move(config))
    , metadata_(std::move(metadata))
{}

// ═══════════════════════════════════════════════════════════════════════════
// Entry Points
// ═══════════════════════════════════════════════════════════════════════════

void StreamProxy::spawn(std::shared_ptr<mux::MuxStream> stream, http::RequestHead head) {
    asio::co_spawn(
        executor_,
        [self = shared_from_this(), stream = std::move(stream), head = std::move(head)]() mutable
            -> asio::awaitable<void> {
            co_await self->handle(std::move(stream), std::move(head));
        },
        asio::detached);
}

asio::awaitable<void> StreamProxy::handle(std::shared_ptr<mux::MuxStream> stream, http::RequestHead head) {
    const std::uint32_t id = stream->id();
    bool failed = false;
    try {
        co_await serve(stream, std::move(head));
    } catch (const std::exception& e) {
        TOWERLINK_LOG_DEBUG("stream {} failed: {}", id, e.what());
        failed = true;
    }
    if (failed) {
        stream->reset();
    }
}

asio::awaitable<void> StreamProxy::serve(std::shared_ptr<mux::MuxStream> stream, http::RequestHead head) {
    if (auto problem = head.validate()) {
        TOWERLINK_LOG_WARN("stream {}: malformed request head: {}", stream->id(), *problem);
        stream->reset();
        co_return;
    }

    TOWERLINK_LOG_DEBUG("stream {}: {} {}", stream->id(), head.method, head.path);

    if (security::is_blocked_path(head.path)) {
        TOWERLINK_LOG_WARN("refused relayed request for {} {}", head.method, head.path);
        co_await respond_error(*stream, 403, kForbiddenMessage);
        co_return;
    }

    if (head.method == "GET" && detail::path_only(head.path) == security::kMetadataPath) {
        const Json snapshot = metadata_ ? metadata_->to_json() : TowerMetadata{}.to_json();
        co_await respond_json(*stream, 200, snapshot);
        co_return;
    }

    if (head.is_websocket_connect()) {
        co_await forward_websocket(std::move(stream), std::move(head));
        co_return;
    }

    co_await forward_http(std::move(stream), std::move(head));
}

// ═══════════════════════════════════════════════════════════════════════════
// HTTP
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<std::shared_ptr<transport::TcpByteStream>> StreamProxy::connect_local() {
    auto local = std::make_shared<transport::TcpByteStream>(executor_, config_.connect_timeout);
    auto connected = co_await local->async_connect(config_.local_host, config_.local_port);
    if (!connected) {
        TOWERLINK_LOG_DEBUG("local service unavailable: {}", connected.error().message);
        co_return nullptr;
    }
    co_return local;
}

asio::awaitable<void> StreamProxy::forward_http(std::shared_ptr<mux::MuxStream> stream, http::RequestHead head) {
    std::string body;
    while (auto chunk = co_await stream->read_some()) {
        body += *chunk;
        if (body.size() > config_.max_request_body_size) {
            TOWERLINK_LOG_WARN("stream {}: request body over {} bytes", stream->id(), config_.max_request_body_size);
            co_await respond_error(*stream, 413, kPayloadTooLargeMessage);
            co_return;
        }
    }
    if (stream->is_destroyed()) {
        co_return;
    }

    auto local = co_await connect_local();
    if (!local) {
        co_await respond_error(*stream, 502, kBadGatewayMessage);
        co_return;
    }

    const std::string request = detail::build_local_request(head, local_authority(config_), body);
    auto written = co_await local->async_write(asio::buffer(request));
    if (!written) {
        local->close();
        co_await respond_error(*stream, 502, kBadGatewayMessage);
        co_return;
    }

    http::HttpResponseParserConfig parser_config;
    parser_config.head_request = (head.method == "HEAD");
    http::HttpResponseParser parser(parser_config);

    co_await relay_response(*stream, *local, parser);
    local->close();
}

asio::awaitable<void> StreamProxy::relay_response(
    mux::MuxStream& stream,
    transport::TcpByteStream& local,
    http::HttpResponseParser& parser
) {
    std::array<char, kLocalReadChunk> buffer{};
    bool head_sent = false;

    for (;;) {
        if (stream.is_destroyed()) {
            co_await drain(local);
            co_return;
        }

        if (head_sent == false && parser.head_complete()) {
            http::ResponseHead response;
            response.status = parser.status();
            response.headers = security::filter_hop_by_hop_headers(parser.head().headers);
            head_sent = true;
            if (co_await stream.respond(response) == false) {
                co_await drain(local);
                co_return;
            }
        }

        if (head_sent) {
            std::string body = parser.take_body();
            if (body.empty() == false && co_await stream.write(std::move(body)) == false) {
                co_await drain(local);
                co_return;
            }
        }

        if (parser.message_complete()) {
            co_await stream.end();
            co_return;
        }

        auto n = co_await local.async_read_some(asio::buffer(buffer));

        std::string failure;
        if (!n && n.error().code != TunnelError::Code::Closed) {
            failure = n.error().message;
        } else {
            try {
                if (n) {
                    parser.feed(std::string_view(buffer.data(), *n));
                } else {
                    parser.finish();
                }
            } catch (const http::HttpParseError& e) {
                failure = e.what();
            }
        }

        if (failure.empty() == false) {
            TOWERLINK_LOG_DEBUG("stream {}: local response failed: {}", stream.id(), failure);
            if (head_sent) {
                stream.reset();
            } else {
                co_await respond_error(stream, 502, kBadGatewayMessage);
            }
            co_return;
        }
    }
}

asio::awaitable<void> StreamProxy::drain(transport::TcpByteStream& local) {
    transport::Deadline deadline(executor_, config_.connect_timeout, [&local] { local.close(); });

    std::array<char, kLocalReadChunk> buffer{};
    std::size_t drained = 0;
    while (drained < config_.max_drain_bytes) {
        auto n = co_await local.async_read_some(asio::buffer(buffer));
        if (!n) {
            break;
        }
        drained += *n;
    }
    TOWERLINK_LOG_TRACE("drained {} bytes from local service", drained);
    local.close();
}

// ═══════════════════════════════════════════════════════════════════════════
// WebSocket
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> StreamProxy::forward_websocket(std::shared_ptr<mux::MuxStream> stream, http::RequestHead head) {
    auto local = co_await connect_local();
    if (!local) {
        co_await respond_error(*stream, 502, kBadGatewayMessage);
        co_return;
    }

    const std::string host = (head.authority && head.authority->empty() == false)
        ? *head.authority
        : local_authority(config_);
    const std::string request = detail::build_websocket_request(head, host, detail::make_websocket_key());

    auto written = co_await local->async_write(asio::buffer(request));
    if (!written) {
        local->close();
        co_await respond_error(*stream, 502, kBadGatewayMessage);
        co_return;
    }

    http::HttpResponseParser parser;
    std::array<char, kLocalReadChunk> buffer{};
    while (parser.head_complete() == false) {
        auto n = co_await local->async_read_some(asio::buffer(buffer));
        bool parsed = static_cast<bool>(n);
        if (parsed) {
            try {
                parser.feed(std::string_view(buffer.data(), *n));
            } catch (const http::HttpParseError& e) {
                TOWERLINK_LOG_DEBUG("stream {}: bad upgrade response: {}", stream->id(), e.what());
                parsed = false;
            }
        }
        if (parsed == false) {
            local->close();
            co_await respond_error(*stream, 502, kBadGatewayMessage);
            co_return;
        }
        if (stream->is_destroyed()) {
            local->close();
            co_return;
        }
    }

    if (parser.status() != 101) {
        TOWERLINK_LOG_DEBUG("stream {}: local service declined upgrade with {}", stream->id(), parser.status());
        co_await relay_response(*stream, *local, parser);
        local->close();
        co_return;
    }

    http::ResponseHead accepted;
    accepted.status = 200;
    for (const std::string_view name : {"sec-websocket-protocol", "sec-websocket-extensions"}) {
        if (auto value = http::get_header(parser.head().headers, name)) {
            accepted.headers[std::string(name)] = *value;
        }
    }
    if (co_await stream->respond(accepted) == false) {
        local->close();
        co_return;
    }

    std::string early = parser.take_unparsed();
    if (early.empty() == false && co_await stream->write(std::move(early)) == false) {
        local->close();
        co_return;
    }

    TOWERLINK_LOG_DEBUG("stream {}: websocket upgraded", stream->id());

    asio::co_spawn(
        executor_,
        [self = shared_from_this(), stream, local]() -> asio::awaitable<void> {
            co_await self->pipe_relay_to_local(stream, local);
        },
        asio::detached);

    co_await pipe_local_to_relay(std::move(stream), std::move(local));
}

asio::awaitable<void> StreamProxy::pipe_relay_to_local(
    std::shared_ptr<mux::MuxStream> stream,
    std::shared_ptr<transport::TcpByteStream> local
) {
    while (auto chunk = co_await stream->read_some()) {
        auto written = co_await local->async_write(asio::buffer(*chunk));
        if (!written) {
            stream->reset();
            local->close();
            co_return;
        }
    }

    if (stream->is_destroyed()) {
        local->close();
        co_return;
    }
    local->shutdown_send();
}

asio::awaitable<void> StreamProxy::pipe_local_to_relay(
    std::shared_ptr<mux::MuxStream> stream,
    std::shared_ptr<transport::TcpByteStream> local
) {
    std::array<char, kLocalReadChunk> buffer{};
    for (;;) {
        auto n = co_await local->async_read_some(asio::buffer(buffer));
        if (!n) {
            if (n.error().code == TunnelError::Code::Closed) {
                co_await stream->end();
            } else {
                stream->reset();
            }
            break;
        }
        if (co_await stream->write(std::string(buffer.data(), *n)) == false) {
            break;
        }
    }
    local->close();
}

// ═══════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════

namespace detail {

std::string_view path_only(std::string_view path) noexcept {
    const auto query = path.find_first_of("?#");
    return query == std::string_view::npos ? path : path.substr(0, query);
}

std::string build_local_request(
    const http::RequestHead& head,
    std::string_view host_header,
    std::string_view body
) {
    http::HeaderMap headers = security::filter_hop_by_hop_headers(head.headers);
    erase_headers_if(headers, is_proxy_managed_header);

    LocalRequest request = start_local_request(head.method, head, host_header);
    insert_headers(request, headers);

    const bool method_has_body = head.method == "POST" || head.method == "PUT" || head.method == "PATCH";
    if (body.empty() == false || method_has_body) {
        request.content_length(body.size());
    }
    request.set(beast_http::field::connection, "close");
    request.body().assign(body.data(), body.size());
    return serialize(request);
}

std::string build_websocket_request(
    const http::RequestHead& head,
    std::string_view host_header,
    std::string_view websocket_key
) {
    http::HeaderMap headers = security::filter_hop_by_hop_headers(head.headers);
    erase_headers_if(headers, [](std::string_view name) {
        return is_proxy_managed_header(name) || is_websocket_handshake_header(name);
    });

    LocalRequest request = start_local_request("GET", head, host_header);
    insert_headers(request, headers);
    request.set(beast_http::field::upgrade, "websocket");
    request.set(beast_http::field::connection, "Upgrade");
    request.set(beast_http::field::sec_websocket_version, "13");
    request.set(beast_http::field::sec_websocket_key, to_beast(websocket_key));
    return serialize(request);
}

std::string make_websocket_key() {
    std::array<unsigned char, 16> raw{};
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }

    std::array<unsigned char, 25> encoded{};
    const int length = EVP_EncodeBlock(encoded.data(), raw.data(), static_cast<int>(raw.size()));
    return std::string(reinterpret_cast<const char*>(encoded.data()), static_cast<std::size_t>(length));
}

}  // namespace detail

}  // namespace towerlink
