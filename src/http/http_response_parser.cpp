#include "towerlink/http/http_response_parser.hpp"

#include <boost/beast/core/error.hpp>
#include <boost/beast/http/basic_parser.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/asio/buffer.hpp>

namespace towerlink::http {

namespace beast_http = boost::beast::http;

namespace {

[[nodiscard]] std::string_view to_std(boost::beast::string_view text) noexcept {
    return {text.data(), text.size()};
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Beast Callbacks
// ─────────────────────────────────────────────────────────────────────────────
// Collects the head and decoded body of one response. Trailer fields arrive
// through on_field_impl after the head and are dropped.

class HttpResponseParser::Impl final : public beast_http::basic_parser<false> {
public:
    ResponseHead head;
    std::string reason;
    std::string body;

private:
    void on_request_impl(
        beast_http::verb,
        boost::beast::string_view,
        boost::beast::string_view,
        int,
        boost::beast::error_code& ec) override {
        ec = beast_http::error::bad_method;
    }

    void on_response_impl(
        int code,
        boost::beast::string_view reason_phrase,
        int,
        boost::beast::error_code&) override {
        head.status = code;
        reason = std::string(to_std(reason_phrase));
    }

    void on_field_impl(
        beast_http::field,
        boost::beast::string_view name,
        boost::beast::string_view value,
        boost::beast::error_code&) override {
        if (in_head_) {
            append_header(head.headers, to_std(name), to_std(value));
        }
    }

    void on_header_impl(boost::beast::error_code&) override {
        in_head_ = false;
    }

    void on_body_init_impl(const boost::optional<std::uint64_t>&, boost::beast::error_code&) override {}

    std::size_t on_body_impl(boost::beast::string_view data, boost::beast::error_code&) override {
        body.append(data.data(), data.size());
        return data.size();
    }

    void on_chunk_header_impl(std::uint64_t, boost::beast::string_view, boost::beast::error_code&) override {}

    std::size_t on_chunk_body_impl(
        std::uint64_t,
        boost::beast::string_view data,
        boost::beast::error_code&) override {
        body.append(data.data(), data.size());
        return data.size();
    }

    void on_finish_impl(boost::beast::error_code&) override {}

    bool in_head_{true};
};

// ─────────────────────────────────────────────────────────────────────────────
// Driving
// ─────────────────────────────────────────────────────────────────────────────

HttpResponseParser::HttpResponseParser() : HttpResponseParser(HttpResponseParserConfig{}) {}

HttpResponseParser::HttpResponseParser(HttpResponseParserConfig config)
    : config_(config)
{
    start_message();
}

HttpResponseParser::~HttpResponseParser() = default;

void HttpResponseParser::start_message() {
    impl_ = std::make_unique<Impl>();
    impl_->eager(true);
    impl_->skip(config_.head_request);
    impl_->header_limit(config_.max_head_size);
    // Bodies are streamed through, never held whole.
    impl_->body_limit(boost::none);
    head_complete_ = false;
    framing_ = BodyFraming::None;
}

void HttpResponseParser::feed(std::string_view data) {
    buffer_.append(data);

    while (buffer_.empty() == false && impl_->is_done() == false) {
        boost::beast::error_code ec;
        const std::size_t used = impl_->put(boost::asio::buffer(buffer_.data(), buffer_.size()), ec);
        buffer_.erase(0, used);

        const bool need_more = (ec == beast_http::error::need_more);
        if (ec && need_more == false) {
            throw HttpParseError(ec.message());
        }

        if (impl_->is_header_done() && head_complete_ == false) {
            const int status = impl_->head.status;
            if (status >= 100 && status < 200 && status != 101) {
                // Interim response (100 Continue); the real head follows.
                start_message();
                continue;
            }
            on_head_complete();
        }
        if (need_more || used == 0) {
            break;
        }
    }
}

void HttpResponseParser::on_head_complete() {
    head_complete_ = true;

    const int status = impl_->head.status;
    if (config_.head_request || status == 101 || status == 204 || status == 304) {
        framing_ = BodyFraming::None;
    } else if (impl_->chunked()) {
        framing_ = BodyFraming::Chunked;
    } else if (impl_->content_length()) {
        framing_ = BodyFraming::ContentLength;
    } else {
        framing_ = BodyFraming::UntilClose;
    }
}

void HttpResponseParser::finish() {
    if (impl_->is_done()) {
        return;
    }
    if (impl_->got_some() == false) {
        throw HttpParseError("connection closed before the response was complete");
    }

    boost::beast::error_code ec;
    impl_->put_eof(ec);
    if (ec) {
        throw HttpParseError("connection closed before the response was complete: " + ec.message());
    }
}

bool HttpResponseParser::message_complete() const noexcept {
    return head_complete_ && impl_->is_done();
}

int HttpResponseParser::status() const noexcept {
    return impl_->head.status;
}

const ResponseHead& HttpResponseParser::head() const noexcept {
    return impl_->head;
}

const std::string& HttpResponseParser::reason() const noexcept {
    return impl_->reason;
}

std::string HttpResponseParser::take_body() {
    std::string out;
    out.swap(impl_->body);
    return out;
}

std::string HttpResponseParser::take_unparsed() {
    std::string out;
    out.swap(buffer_);
    return out;
}

}  // namespace towerlink::http
