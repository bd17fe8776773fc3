//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/bms/auth/BearerAuthorizationProvider.hpp
// Purpose: Static bearer token authorization provider
//==========================================================================================================
#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "bms/auth/IAuthorizationProvider.hpp"
#include "bms/auth/WwwAuthenticate.hpp"
#include "bms/errors/Errors.h"

namespace bms::auth {

class BearerAuthorizationProvider final : public IAuthorizationProvider {
public:
    explicit BearerAuthorizationProvider(std::string token) : token(std::move(token)) {}

    std::optional<std::string> cachedAuthorizationHeader() const override {
        std::lock_guard<std::mutex> lk(mtx);
        if (token.empty()) return std::nullopt;
        return std::string("Bearer ") + token;
    }

    bool isAuthorizationRequired(int statusCode, const std::string& wwwAuthenticateHeader) const override {
        return isBearerChallenge(statusCode, wwwAuthenticateHeader);
    }

    // No token endpoint to call: succeeds with a synthetic 200 whenever a token is configured
    void obtainAuthorization(CompletionHandler onComplete) override {
        if (!onComplete) return;
        if (!cachedAuthorizationHeader().has_value()) {
            onComplete(std::nullopt, errors::makeError(errors::ErrorCategory::Authorization,
                                                       "no bearer token configured"));
            return;
        }
        HttpResponse ok;
        ok.status = 200;
        onComplete(std::move(ok), std::nullopt);
    }

    void setToken(std::string newToken) {
        std::lock_guard<std::mutex> lk(mtx);
        token = std::move(newToken);
    }

private:
    mutable std::mutex mtx;
    std::string token;
};

using BearerAuthorizationProviderPtr = std::shared_ptr<BearerAuthorizationProvider>;

} // namespace bms::auth
