//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestDecorator.cpp
// Purpose: Injects authorization and analytics headers into copies of outgoing requests
//==========================================================================================================

#include "bms/RequestDecorator.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace bms {

RequestDecorator::RequestDecorator(const auth::IAuthorizationProvider& authProvider,
                                   const analytics::IAnalyticsMetadataProvider& analyticsProvider)
    : RequestDecorator(authProvider, analyticsProvider, &RequestDecorator::generateTrackingId) {}

RequestDecorator::RequestDecorator(const auth::IAuthorizationProvider& authProvider,
                                   const analytics::IAnalyticsMetadataProvider& analyticsProvider,
                                   IdGenerator idGenerator)
    : authProvider(authProvider),
      analyticsProvider(analyticsProvider),
      idGenerator(idGenerator ? std::move(idGenerator) : IdGenerator(&RequestDecorator::generateTrackingId)) {}

HttpRequest RequestDecorator::decorate(const HttpRequest& request) const {
    HttpRequest decorated = request;

    // Security
    if (auto authHeader = authProvider.cachedAuthorizationHeader()) {
        decorated.setValue(headers::kAuthorization, *authHeader);
    }

    // Analytics
    decorated.setValue(headers::kTrackingId, idGenerator());
    if (auto metadata = analyticsProvider.currentAnalyticsMetadata()) {
        decorated.setValue(headers::kAnalyticsMetadata, *metadata);
    }

    return decorated;
}

std::string RequestDecorator::generateTrackingId() {
    // random_generator is not thread-safe; one per thread
    thread_local boost::uuids::random_generator generator;
    std::string id = boost::uuids::to_string(generator());
    std::transform(id.begin(), id.end(), id.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return id;
}

} // namespace bms
