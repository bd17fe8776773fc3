//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/bms/auth/OAuth2ClientCredentialsProvider.cpp
// Purpose: OAuth 2.0 client-credentials authorization provider with token caching
//==========================================================================================================

#include "bms/auth/OAuth2ClientCredentialsProvider.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "bms/auth/WwwAuthenticate.hpp"
#include "bms/errors/Errors.h"
#include "logging/Logger.h"

using namespace std::chrono;

namespace bms::auth {

namespace {

constexpr long long kDefaultTokenLifetimeSeconds = 3600;
// Server-supplied lifetimes are capped at one year
constexpr long long kMaxTokenLifetimeSeconds = 365LL * 24 * 3600;

std::string urlEncodeForm(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::ostringstream oss;
    for (unsigned char c : s) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else if (c == ' ') {
            oss << '+';
        } else {
            oss << '%' << hex[(c >> 4) & 0xFu] << hex[c & 0xFu];
        }
    }
    return oss.str();
}

// Position just past `"key"` and the following colon, or npos
std::size_t findJsonValue(const std::string& json, const std::string& key) {
    const std::string needle = "\"" + key + "\"";
    std::size_t k = json.find(needle);
    if (k == std::string::npos) {
        return std::string::npos;
    }
    std::size_t colon = json.find(':', k + needle.size());
    if (colon == std::string::npos) {
        return std::string::npos;
    }
    std::size_t i = colon + 1;
    while (i < json.size() && (json[i] == ' ' || json[i] == '\t' || json[i] == '\r' || json[i] == '\n')) {
        ++i;
    }
    return i;
}

bool parseJsonStringField(const std::string& json, const std::string& key, std::string& out) {
    out.clear();
    std::size_t i = findJsonValue(json, key);
    if (i == std::string::npos || i >= json.size() || json[i] != '"') {
        return false;
    }
    for (++i; i < json.size(); ++i) {
        char c = json[i];
        if (c == '"') {
            return true;
        }
        if (c == '\\' && i + 1 < json.size()) {
            char e = json[++i];
            switch (e) {
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                case 'r': out.push_back('\r'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                default: out.push_back(e); break; // \" \\ \/
            }
            continue;
        }
        out.push_back(c);
    }
    out.clear();
    return false;
}

// Accepts a bare number or a quoted one; some token endpoints send "expires_in":"3600"
bool parseJsonIntField(const std::string& json, const std::string& key, long long& out) {
    std::size_t i = findJsonValue(json, key);
    if (i == std::string::npos || i >= json.size()) {
        return false;
    }
    if (json[i] == '"') {
        ++i;
    }
    const char* first = json.data() + i;
    const char* last = json.data() + json.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr != first;
}

} // namespace

OAuth2ClientCredentialsProvider::OAuth2ClientCredentialsProvider(OAuth2ClientCredentialsOptions options,
                                                                 std::shared_ptr<ITransportSession> transport)
    : opts(std::move(options)), transport(std::move(transport)), cache(std::make_shared<TokenCache>()) {
    if (!this->transport) {
        throw std::invalid_argument("OAuth2ClientCredentialsProvider requires a transport session");
    }
    if (opts.tokenUrl.empty()) {
        throw std::invalid_argument("OAuth2ClientCredentialsProvider requires a token URL");
    }
}

std::optional<std::string> OAuth2ClientCredentialsProvider::cachedAuthorizationHeader() const {
    std::lock_guard<std::mutex> lk(cache->mtx);
    if (cache->accessToken.empty()) {
        return std::nullopt;
    }
    if (steady_clock::now() + seconds(opts.tokenRefreshSkewSeconds) >= cache->expiry) {
        return std::nullopt;
    }
    return std::string("Bearer ") + cache->accessToken;
}

bool OAuth2ClientCredentialsProvider::isAuthorizationRequired(int statusCode,
                                                              const std::string& wwwAuthenticateHeader) const {
    return isBearerChallenge(statusCode, wwwAuthenticateHeader);
}

void OAuth2ClientCredentialsProvider::clearAuthorizationData() {
    std::lock_guard<std::mutex> lk(cache->mtx);
    cache->accessToken.clear();
    cache->expiry = steady_clock::time_point{};
}

std::string OAuth2ClientCredentialsProvider::buildTokenRequestForm() const {
    std::ostringstream form;
    form << "grant_type=client_credentials";
    if (!opts.clientId.empty()) { form << "&client_id=" << urlEncodeForm(opts.clientId); }
    if (!opts.clientSecret.empty()) { form << "&client_secret=" << urlEncodeForm(opts.clientSecret); }
    if (!opts.scope.empty()) { form << "&scope=" << urlEncodeForm(opts.scope); }
    return form.str();
}

void OAuth2ClientCredentialsProvider::obtainAuthorization(CompletionHandler onComplete) {
    HttpRequest tokenRequest(opts.tokenUrl, "POST");
    tokenRequest.setValue("Content-Type", "application/x-www-form-urlencoded");
    tokenRequest.setValue("Accept", "application/json");
    tokenRequest.body = buildTokenRequestForm();

    LOG_DEBUG("OAuth2: requesting token from {}", opts.tokenUrl);

    CompletionHandler onRefused = onComplete;

    // Only the cache is captured so an in-flight fetch never extends the provider's lifetime
    auto onToken = [cache = cache, onComplete = std::move(onComplete)](
                       std::optional<HttpResponse> response, std::optional<errors::SessionError> error) {
        auto report = [&onComplete](std::optional<HttpResponse> r, std::optional<errors::SessionError> e) {
            if (onComplete) {
                onComplete(std::move(r), std::move(e));
            }
        };
        if (error.has_value() || !response.has_value()) {
            LOG_WARN("OAuth2: token request failed: {}",
                     error ? errors::describe(*error) : std::string("no response"));
            report(std::move(response), std::move(error));
            return;
        }
        if (!response->isSuccess()) {
            LOG_WARN("OAuth2: token endpoint returned HTTP {}", response->status);
            {
                std::lock_guard<std::mutex> lk(cache->mtx);
                cache->accessToken.clear();
            }
            report(std::move(response), std::nullopt);
            return;
        }

        std::string accessToken;
        long long expiresIn = 0;
        const bool haveToken = parseJsonStringField(response->body, "access_token", accessToken) &&
                               !accessToken.empty();
        const bool haveExpiry = parseJsonIntField(response->body, "expires_in", expiresIn);
        if (!haveToken) {
            LOG_ERROR("OAuth2: token endpoint response missing access_token");
            report(std::move(response), errors::makeError(errors::ErrorCategory::Authorization,
                                                          "token endpoint response missing access_token"));
            return;
        }
        const long long lifetime = haveExpiry && expiresIn > 0 ? std::min(expiresIn, kMaxTokenLifetimeSeconds)
                                                               : kDefaultTokenLifetimeSeconds;
        {
            std::lock_guard<std::mutex> lk(cache->mtx);
            cache->accessToken = accessToken;
            cache->expiry = steady_clock::now() + seconds(lifetime);
        }
        LOG_DEBUG("OAuth2: token cached, expires in {}s", lifetime);
        report(std::move(response), std::nullopt);
    };

    auto task = transport->dataTask(tokenRequest, std::move(onToken));
    if (!task) {
        LOG_ERROR("OAuth2: transport refused the token request");
        if (onRefused) {
            onRefused(std::nullopt, errors::makeError(errors::ErrorCategory::Transport,
                                                      "transport refused the token request"));
        }
        return;
    }
    task->resume();
}

} // namespace bms::auth
