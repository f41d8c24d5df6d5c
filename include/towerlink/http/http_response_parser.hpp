#pragma once

#include "towerlink/http/http_types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace towerlink::http {

/// Thrown when the local service sends something that is not HTTP/1.x.
class HttpParseError : public std::runtime_error {
public:
    explicit HttpParseError(const std::string& what)
        : std::runtime_error("HTTP parse error: " + what)
    {}
};

struct HttpResponseParserConfig {
    /// The request was HEAD, so no body follows whatever the headers say.
    bool head_request{false};

    /// Status line plus headers may not exceed this.
    std::uint32_t max_head_size{64 * 1024};
};

/// How the end of the body is found.
enum class BodyFraming {
    None,           // HEAD, 1xx, 204, 304
    ContentLength,
    Chunked,
    UntilClose
};

/// Incremental parser for one HTTP/1.1 response read off a local socket,
/// driven by Beast's basic_parser.
///
/// Bytes may arrive in arbitrary pieces. The head becomes available once
/// complete; decoded body bytes (chunked framing removed) accumulate until
/// take_body() collects them.
///
/// Usage:
///   HttpResponseParser parser;
///   while (!parser.message_complete()) {
///       parser.feed(read_some());          // or parser.finish() on EOF
///       if (parser.head_complete()) { ... parser.head() ... }
///       forward(parser.take_body());
///   }
///
/// For a 101 response the message completes right after the head and any
/// bytes past it are left for take_unparsed().
class HttpResponseParser {
public:
    HttpResponseParser();
    explicit HttpResponseParser(HttpResponseParserConfig config);
    ~HttpResponseParser();

    HttpResponseParser(const HttpResponseParser&) = delete;
    HttpResponseParser& operator=(const HttpResponseParser&) = delete;

    /// Throws HttpParseError on malformed input.
    void feed(std::string_view data);

    /// The peer closed the connection. Completes an until-close body;
    /// throws HttpParseError if the message was cut short.
    void finish();

    [[nodiscard]] bool head_complete() const noexcept { return head_complete_; }
    [[nodiscard]] bool message_complete() const noexcept;

    [[nodiscard]] int status() const noexcept;
    [[nodiscard]] const ResponseHead& head() const noexcept;
    [[nodiscard]] const std::string& reason() const noexcept;
    [[nodiscard]] BodyFraming framing() const noexcept { return framing_; }

    /// Decoded body bytes received since the previous call.
    [[nodiscard]] std::string take_body();

    /// Bytes past the end of the message (upgrade payload).
    [[nodiscard]] std::string take_unparsed();

private:
    class Impl;

    void start_message();
    void on_head_complete();

    HttpResponseParserConfig config_;
    std::unique_ptr<Impl> impl_;
    BodyFraming framing_{BodyFraming::None};
    bool head_complete_{false};

    // Bytes the parser has not consumed yet.
    std::string buffer_;
};

}  // namespace towerlink::http
