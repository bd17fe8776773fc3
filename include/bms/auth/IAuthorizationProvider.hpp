//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/bms/auth/IAuthorizationProvider.hpp
// Purpose: Authorization provider interface consumed by the request decorator and challenge handler
//==========================================================================================================
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "bms/HttpTypes.h"

namespace bms::auth {

class IAuthorizationProvider {
public:
    virtual ~IAuthorizationProvider() = default;

    // Cached value for the Authorization header, if the provider currently holds one
    virtual std::optional<std::string> cachedAuthorizationHeader() const = 0;

    // Whether a response with this status and WWW-Authenticate value asks for (re)authorization
    virtual bool isAuthorizationRequired(int statusCode, const std::string& wwwAuthenticateHeader) const = 0;

    // Refresh the cached authorization. onComplete is invoked once with the outcome of the attempt;
    // a 2xx response with no error means the cache now holds a usable header.
    virtual void obtainAuthorization(CompletionHandler onComplete) = 0;
};

using AuthorizationProviderPtr = std::shared_ptr<IAuthorizationProvider>;

} // namespace bms::auth
