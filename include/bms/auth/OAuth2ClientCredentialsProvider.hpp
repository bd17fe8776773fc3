//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/bms/auth/OAuth2ClientCredentialsProvider.hpp
// Purpose: OAuth 2.0 client-credentials authorization provider with token caching
//==========================================================================================================
#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "bms/TransportSession.h"
#include "bms/auth/IAuthorizationProvider.hpp"

namespace bms::auth {

struct OAuth2ClientCredentialsOptions {
    std::string tokenUrl;
    std::string clientId;
    std::string clientSecret;
    std::string scope;
    unsigned int tokenRefreshSkewSeconds{60};
};

//==========================================================================================================
// OAuth2ClientCredentialsProvider
// Purpose: Fetches access tokens with grant_type=client_credentials and exposes them as
//          `Bearer <token>`. The token request goes through the supplied transport, which must not be
//          an AuthorizingSession transport (the token endpoint is never decorated).
// Notes:
//   - A cached token is reported only while now + tokenRefreshSkewSeconds is before its expiry.
//   - expires_in defaults to 3600 seconds when the endpoint omits it.
//   - obtainAuthorization always contacts the endpoint; the caller asked because the cached token
//     was rejected.
//==========================================================================================================
class OAuth2ClientCredentialsProvider final : public IAuthorizationProvider {
public:
    // Throws std::invalid_argument when transport is null or tokenUrl is empty.
    OAuth2ClientCredentialsProvider(OAuth2ClientCredentialsOptions options,
                                    std::shared_ptr<ITransportSession> transport);

    std::optional<std::string> cachedAuthorizationHeader() const override;
    bool isAuthorizationRequired(int statusCode, const std::string& wwwAuthenticateHeader) const override;
    void obtainAuthorization(CompletionHandler onComplete) override;

    // Drops the cached token; the next request goes out without Authorization.
    void clearAuthorizationData();

    const OAuth2ClientCredentialsOptions& options() const { return opts; }

private:
    struct TokenCache {
        mutable std::mutex mtx;
        std::string accessToken;
        std::chrono::steady_clock::time_point expiry{};
    };

    std::string buildTokenRequestForm() const;

    OAuth2ClientCredentialsOptions opts;
    std::shared_ptr<ITransportSession> transport;
    std::shared_ptr<TokenCache> cache;
};

} // namespace bms::auth
