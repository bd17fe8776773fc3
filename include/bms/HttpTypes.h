//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpTypes.h
// Purpose: Value types for HTTP requests, responses, header maps and completion callbacks
//==========================================================================================================

#pragma once

#include <filesystem>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "bms/errors/Errors.h"

namespace bms {

struct HeaderKV {
    std::string name;
    std::string value;
};

//==========================================================================================================
// HttpHeaders
// Purpose: Header collection with case-insensitive names. set() replaces every existing value of a
//          name; add() appends (used for multi-valued response headers such as Set-Cookie).
//          Equality ignores insertion order and name case.
//==========================================================================================================
class HttpHeaders {
public:
    HttpHeaders() = default;
    HttpHeaders(std::initializer_list<HeaderKV> init);

    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    bool erase(const std::string& name);

    // First value for name, if any.
    std::optional<std::string> get(const std::string& name) const;
    bool contains(const std::string& name) const;

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const std::vector<HeaderKV>& entries() const { return entries_; }

    bool operator==(const HttpHeaders& other) const;
    bool operator!=(const HttpHeaders& other) const { return !(*this == other); }

private:
    std::vector<HeaderKV> entries_;
};

// Case-insensitive ASCII comparison of header names.
bool headerNameEquals(const std::string& a, const std::string& b);

//==========================================================================================================
// RequestBody
// Purpose: Optional request payload: none, in-memory bytes, or a file whose contents are sent.
//==========================================================================================================
using RequestBody = std::variant<std::monostate, std::string, std::filesystem::path>;

//==========================================================================================================
// HttpRequest
// Purpose: Outgoing request value. Decoration produces a modified copy and never mutates the source.
//==========================================================================================================
struct HttpRequest {
    std::string url;
    std::string method{"GET"};
    HttpHeaders headers;
    RequestBody body;

    HttpRequest() = default;
    explicit HttpRequest(std::string url, std::string method = "GET")
        : url(std::move(url)), method(std::move(method)) {}

    void setValue(const std::string& name, const std::string& value) { headers.set(name, value); }
    std::optional<std::string> value(const std::string& name) const { return headers.get(name); }
    bool hasBody() const { return !std::holds_alternative<std::monostate>(body); }

    bool operator==(const HttpRequest& other) const {
        return url == other.url && method == other.method && headers == other.headers && body == other.body;
    }
    bool operator!=(const HttpRequest& other) const { return !(*this == other); }
};

//==========================================================================================================
// HttpResponse
// Purpose: Status line, headers and body of a completed exchange.
//==========================================================================================================
struct HttpResponse {
    int status{0};
    HttpHeaders headers;
    std::string body;

    std::optional<std::string> header(const std::string& name) const { return headers.get(name); }
    bool isSuccess() const { return status >= 200 && status < 300; }
};

//==========================================================================================================
// CompletionHandler
// Purpose: Callback receiving the outcome of a task. Exactly one of response/error is normally set;
//          a transport error never carries a response.
//==========================================================================================================
using CompletionHandler =
    std::function<void(std::optional<HttpResponse> response, std::optional<errors::SessionError> error)>;

//==========================================================================================================
// UrlParts
// Purpose: Components of an absolute http(s) URL. target is path plus query, "/" when absent.
//==========================================================================================================
struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;

    // Value for the Host header; the port is omitted when it is the scheme default.
    std::string hostHeader() const;
};

//==========================================================================================================
// parseUrl
// Purpose: Split an absolute URL of the form scheme://host[:port][/path][?query][#fragment].
// Returns:
//   std::nullopt when the scheme is not http/https, the host is empty or the port is not numeric.
//==========================================================================================================
std::optional<UrlParts> parseUrl(const std::string& url);

} // namespace bms
