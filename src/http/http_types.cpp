#include "towerlink/http/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <ranges>

namespace towerlink::http {

namespace {

[[nodiscard]] std::optional<HeaderValue> header_value_from_json(const Json& value) {
    if (value.is_string()) {
        return HeaderValue{value.get<std::string>()};
    }
    if (value.is_number()) {
        return HeaderValue{value.dump()};
    }
    if (value.is_array()) {
        std::vector<std::string> items;
        for (const auto& item : value) {
            if (item.is_string()) {
                items.push_back(item.get<std::string>());
            }
        }
        return HeaderValue{std::move(items)};
    }
    return std::nullopt;
}

[[nodiscard]] Json header_value_to_json(const HeaderValue& value) {
    if (const auto* single = std::get_if<std::string>(&value)) {
        return *single;
    }
    return std::get<std::vector<std::string>>(value);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Case-Insensitive Helpers
// ─────────────────────────────────────────────────────────────────────────────

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::ranges::equal(a, b, [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string to_lower(std::string_view text) {
    std::string lowered(text);
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

const HeaderValue* find_header(const HeaderMap& headers, std::string_view name) {
    const auto it = std::ranges::find_if(headers, [&name](const auto& entry) {
        return iequals(entry.first, name);
    });
    if (it == headers.end()) {
        return nullptr;
    }
    return &it->second;
}

std::optional<std::string> get_header(const HeaderMap& headers, std::string_view name) {
    const HeaderValue* value = find_header(headers, name);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (const auto* single = std::get_if<std::string>(value)) {
        return *single;
    }
    const auto& list = std::get<std::vector<std::string>>(*value);
    if (list.empty()) {
        return std::nullopt;
    }
    return list.front();
}

void append_header(HeaderMap& headers, std::string_view name, std::string_view value) {
    std::string key = to_lower(name);
    auto it = headers.find(key);

    if (key == "set-cookie") {
        if (it == headers.end()) {
            headers.emplace(std::move(key), std::vector<std::string>{std::string(value)});
            return;
        }
        if (auto* single = std::get_if<std::string>(&it->second)) {
            it->second = std::vector<std::string>{*single, std::string(value)};
        } else {
            std::get<std::vector<std::string>>(it->second).emplace_back(value);
        }
        return;
    }

    if (it == headers.end()) {
        headers.emplace(std::move(key), std::string(value));
        return;
    }
    if (auto* single = std::get_if<std::string>(&it->second)) {
        single->append(", ").append(value);
    } else {
        std::get<std::vector<std::string>>(it->second).emplace_back(value);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Serialization
// ─────────────────────────────────────────────────────────────────────────────

Json headers_to_json(const HeaderMap& headers) {
    Json j = Json::object();
    for (const auto& [name, value] : headers) {
        j[name] = header_value_to_json(value);
    }
    return j;
}

RawHeaderMap raw_headers_from_json(const Json& j) {
    RawHeaderMap headers;
    if (j.is_object() == false) {
        return headers;
    }
    for (const auto& [name, value] : j.items()) {
        headers[name] = header_value_from_json(value);
    }
    return headers;
}

// ─────────────────────────────────────────────────────────────────────────────
// Syntax Checks
// ─────────────────────────────────────────────────────────────────────────────

bool is_token(std::string_view text) noexcept {
    constexpr std::string_view kTokenSymbols = "!#$%&'*+-.^_`|~";
    return text.empty() == false && std::ranges::all_of(text, [&](char c) {
        const auto byte = static_cast<unsigned char>(c);
        return (byte < 0x80 && std::isalnum(byte) != 0) || kTokenSymbols.find(c) != std::string_view::npos;
    });
}

bool is_valid_request_target(std::string_view text) noexcept {
    return std::ranges::none_of(text, [](char c) {
        const auto byte = static_cast<unsigned char>(c);
        return byte <= 0x20 || byte == 0x7f;
    });
}

bool is_valid_header_value(std::string_view text) noexcept {
    return std::ranges::none_of(text, [](char c) {
        const auto byte = static_cast<unsigned char>(c);
        return (byte < 0x20 && byte != '\t') || byte == 0x7f;
    });
}

// ─────────────────────────────────────────────────────────────────────────────
// Heads
// ─────────────────────────────────────────────────────────────────────────────

Json RequestHead::to_json() const {
    Json headers_json = Json::object();
    for (const auto& [name, value] : headers) {
        headers_json[name] = value.has_value() ? header_value_to_json(*value) : Json(nullptr);
    }

    Json j = {
        {"method", method},
        {"path", path},
        {"headers", std::move(headers_json)}
    };
    if (protocol) {
        j["protocol"] = *protocol;
    }
    if (authority) {
        j["authority"] = *authority;
    }
    return j;
}

std::optional<std::string> RequestHead::validate() const {
    if (is_token(method) == false) {
        return "invalid method";
    }
    if (is_valid_request_target(path) == false) {
        return "invalid path";
    }
    if (authority && is_valid_request_target(*authority) == false) {
        return "invalid authority";
    }
    for (const auto& [name, value] : headers) {
        // HTTP/2 pseudo-headers (":authority") are allowed and dropped later.
        const std::string_view bare = name.starts_with(':') ? std::string_view(name).substr(1) : std::string_view(name);
        if (is_token(bare) == false) {
            return "invalid header name";
        }
        if (value.has_value() == false) {
            continue;
        }
        if (const auto* single = std::get_if<std::string>(&*value)) {
            if (is_valid_header_value(*single) == false) {
                return "invalid value for header " + name;
            }
            continue;
        }
        for (const auto& item : std::get<std::vector<std::string>>(*value)) {
            if (is_valid_header_value(item) == false) {
                return "invalid value for header " + name;
            }
        }
    }
    return std::nullopt;
}

std::optional<RequestHead> RequestHead::from_json(const Json& j) {
    if (j.is_object() == false) {
        return std::nullopt;
    }
    const auto method = j.find("method");
    const auto path = j.find("path");
    if (method == j.end() || path == j.end() || !method->is_string() || !path->is_string()) {
        return std::nullopt;
    }

    RequestHead head;
    head.method = method->get<std::string>();
    head.path = path->get<std::string>();
    if (const auto headers = j.find("headers"); headers != j.end()) {
        head.headers = raw_headers_from_json(*headers);
    }
    if (const auto protocol = j.find("protocol"); protocol != j.end() && protocol->is_string()) {
        head.protocol = protocol->get<std::string>();
    }
    if (const auto authority = j.find("authority"); authority != j.end() && authority->is_string()) {
        head.authority = authority->get<std::string>();
    }
    if (head.validate()) {
        return std::nullopt;
    }
    return head;
}

Json ResponseHead::to_json() const {
    return Json{
        {"status", status},
        {"headers", headers_to_json(headers)}
    };
}

std::optional<ResponseHead> ResponseHead::from_json(const Json& j) {
    if (j.is_object() == false) {
        return std::nullopt;
    }
    const auto status = j.find("status");
    if (status == j.end() || status->is_number_integer() == false) {
        return std::nullopt;
    }

    ResponseHead head;
    head.status = status->get<int>();
    if (const auto headers = j.find("headers"); headers != j.end()) {
        for (auto& [name, value] : raw_headers_from_json(*headers)) {
            if (value) {
                head.headers.emplace(name, std::move(*value));
            }
        }
    }
    return head;
}

}  // namespace towerlink::http
