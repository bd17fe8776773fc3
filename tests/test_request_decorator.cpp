//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_request_decorator.cpp
// Purpose: RequestDecorator header injection and tracking id tests
//==========================================================================================================

#include <gtest/gtest.h>

#include <regex>
#include <set>
#include <string>

#include "bms/RequestDecorator.hpp"
#include "bms/analytics/AnalyticsMetadataProvider.hpp"
#include "fakes/FakeAuthorizationProvider.hpp"

using namespace bms;
using bms::fakes::FakeAuthorizationProvider;

namespace {

HttpRequest sampleRequest() {
    HttpRequest r("https://api.example.com/api/data?x=1", "POST");
    r.setValue("Content-Type", "application/json");
    r.setValue("X-Custom", "keep-me");
    r.body = std::string("{\"a\":1}");
    return r;
}

} // namespace

TEST(RequestDecorator, AddsAllThreeHeadersWhenProvidersHaveValues) {
    FakeAuthorizationProvider authProvider;
    authProvider.header = "Bearer abc";
    analytics::AnalyticsMetadataProvider analyticsProvider("{\"app\":\"demo\"}");
    RequestDecorator decorator(authProvider, analyticsProvider, [] { return std::string("TRACK-1"); });

    const HttpRequest original = sampleRequest();
    const HttpRequest decorated = decorator.decorate(original);

    EXPECT_EQ(decorated.value("Authorization"), std::optional<std::string>("Bearer abc"));
    EXPECT_EQ(decorated.value("x-wl-analytics-tracking-id"), std::optional<std::string>("TRACK-1"));
    EXPECT_EQ(decorated.value("x-mfp-analytics-metadata"), std::optional<std::string>("{\"app\":\"demo\"}"));
    EXPECT_EQ(decorated.headers.size(), original.headers.size() + 3);
}

TEST(RequestDecorator, LeavesUrlMethodBodyAndOtherHeadersUntouched) {
    FakeAuthorizationProvider authProvider;
    authProvider.header = "Bearer abc";
    analytics::AnalyticsMetadataProvider analyticsProvider("meta");
    RequestDecorator decorator(authProvider, analyticsProvider);

    const HttpRequest original = sampleRequest();
    const HttpRequest snapshot = original;
    HttpRequest decorated = decorator.decorate(original);

    EXPECT_EQ(original, snapshot);
    EXPECT_EQ(decorated.url, original.url);
    EXPECT_EQ(decorated.method, original.method);
    EXPECT_EQ(decorated.body, original.body);
    EXPECT_EQ(decorated.value("X-Custom"), std::optional<std::string>("keep-me"));

    // Removing the three documented headers gives back the original
    decorated.headers.erase(headers::kAuthorization);
    decorated.headers.erase(headers::kTrackingId);
    decorated.headers.erase(headers::kAnalyticsMetadata);
    EXPECT_EQ(decorated, original);
}

TEST(RequestDecorator, OmitsAuthorizationAndMetadataWhenProvidersHaveNone) {
    FakeAuthorizationProvider authProvider;
    analytics::AnalyticsMetadataProvider analyticsProvider;
    RequestDecorator decorator(authProvider, analyticsProvider);

    const HttpRequest decorated = decorator.decorate(HttpRequest("https://api.example.com/api/data"));

    EXPECT_FALSE(decorated.headers.contains("Authorization"));
    EXPECT_FALSE(decorated.headers.contains("x-mfp-analytics-metadata"));
    EXPECT_TRUE(decorated.headers.contains("x-wl-analytics-tracking-id"));
}

TEST(RequestDecorator, ReplacesExistingAuthorizationHeader) {
    FakeAuthorizationProvider authProvider;
    authProvider.header = "Bearer fresh";
    analytics::AnalyticsMetadataProvider analyticsProvider;
    RequestDecorator decorator(authProvider, analyticsProvider);

    HttpRequest original("https://api.example.com/");
    original.setValue("authorization", "Bearer stale");
    const HttpRequest decorated = decorator.decorate(original);

    EXPECT_EQ(decorated.value("Authorization"), std::optional<std::string>("Bearer fresh"));
    std::size_t count = 0;
    for (const auto& h : decorated.headers.entries()) {
        if (headerNameEquals(h.name, "Authorization")) ++count;
    }
    EXPECT_EQ(count, 1u);
}

TEST(RequestDecorator, TrackingIdIsFreshOnEveryCall) {
    FakeAuthorizationProvider authProvider;
    analytics::AnalyticsMetadataProvider analyticsProvider;
    RequestDecorator decorator(authProvider, analyticsProvider);

    const HttpRequest original("https://api.example.com/api/data");
    std::set<std::string> seen;
    for (int i = 0; i < 50; ++i) {
        auto id = decorator.decorate(original).value(headers::kTrackingId);
        ASSERT_TRUE(id.has_value());
        seen.insert(*id);
    }
    EXPECT_EQ(seen.size(), 50u);
}

TEST(RequestDecorator, GeneratedTrackingIdIsUpperCaseUuid) {
    const std::regex uuid("^[0-9A-F]{8}-[0-9A-F]{4}-4[0-9A-F]{3}-[89AB][0-9A-F]{3}-[0-9A-F]{12}$");
    for (int i = 0; i < 10; ++i) {
        const std::string id = RequestDecorator::generateTrackingId();
        EXPECT_TRUE(std::regex_match(id, uuid)) << id;
    }
}

TEST(RequestDecorator, MetadataChangesAreSeenByNextDecoration) {
    FakeAuthorizationProvider authProvider;
    analytics::AnalyticsMetadataProvider analyticsProvider;
    RequestDecorator decorator(authProvider, analyticsProvider);
    const HttpRequest original("https://api.example.com/");

    EXPECT_FALSE(decorator.decorate(original).headers.contains(headers::kAnalyticsMetadata));
    analyticsProvider.setMetadata("v2");
    EXPECT_EQ(decorator.decorate(original).value(headers::kAnalyticsMetadata), std::optional<std::string>("v2"));
    authProvider.header = "Bearer later";
    EXPECT_EQ(decorator.decorate(original).value(headers::kAuthorization), std::optional<std::string>("Bearer later"));
}
