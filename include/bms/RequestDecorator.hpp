//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestDecorator.hpp
// Purpose: Injects authorization and analytics headers into copies of outgoing requests
//==========================================================================================================

#pragma once

#include <functional>
#include <string>

#include "bms/HttpTypes.h"
#include "bms/analytics/IAnalyticsMetadataProvider.hpp"
#include "bms/auth/IAuthorizationProvider.hpp"

namespace bms {

namespace headers {
inline constexpr char kAuthorization[] = "Authorization";
inline constexpr char kTrackingId[] = "x-wl-analytics-tracking-id";
inline constexpr char kAnalyticsMetadata[] = "x-mfp-analytics-metadata";
inline constexpr char kWwwAuthenticate[] = "WWW-Authenticate";
} // namespace headers

//==========================================================================================================
// RequestDecorator
// Purpose: Produces a decorated copy of a request:
//   - Authorization: the provider's cached header, when one exists
//   - x-wl-analytics-tracking-id: a fresh identifier on every call
//   - x-mfp-analytics-metadata: the current analytics metadata, when available
// Notes:
//   - Existing headers with these names are replaced. The source request is never modified.
//   - Providers are borrowed; they must outlive the decorator.
//==========================================================================================================
class RequestDecorator {
public:
    using IdGenerator = std::function<std::string()>;

    RequestDecorator(const auth::IAuthorizationProvider& authProvider,
                     const analytics::IAnalyticsMetadataProvider& analyticsProvider);
    RequestDecorator(const auth::IAuthorizationProvider& authProvider,
                     const analytics::IAnalyticsMetadataProvider& analyticsProvider,
                     IdGenerator idGenerator);

    HttpRequest decorate(const HttpRequest& request) const;

    //==========================================================================================================
    // generateTrackingId
    // Purpose: Random (version 4) UUID in canonical upper-case 8-4-4-4-12 form.
    //==========================================================================================================
    static std::string generateTrackingId();

private:
    const auth::IAuthorizationProvider& authProvider;
    const analytics::IAnalyticsMetadataProvider& analyticsProvider;
    IdGenerator idGenerator;
};

} // namespace bms
