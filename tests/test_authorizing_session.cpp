//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_authorizing_session.cpp
// Purpose: AuthorizingSession task dispatch, decoration and challenge wrapping
//==========================================================================================================

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "bms/AuthorizingSession.hpp"
#include "bms/analytics/AnalyticsMetadataProvider.hpp"
#include "bms/auth/OAuth2ClientCredentialsProvider.hpp"
#include "fakes/FakeAuthorizationProvider.hpp"
#include "fakes/FakeTransportSession.hpp"

using namespace bms;
using bms::fakes::CallKind;
using bms::fakes::FakeAuthorizationProvider;
using bms::fakes::FakeTransportSession;

namespace {

class AuthorizingSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport = std::make_shared<FakeTransportSession>();
        authProvider = std::make_shared<FakeAuthorizationProvider>();
        analyticsProvider = std::make_shared<analytics::AnalyticsMetadataProvider>("{\"app\":\"demo\"}");
        session = std::make_unique<AuthorizingSession>(transport, authProvider, analyticsProvider);
    }

    CompletionHandler capture() {
        return [this](std::optional<HttpResponse> r, std::optional<errors::SessionError> e) {
            ++calls;
            response = std::move(r);
            error = std::move(e);
        };
    }

    static HttpResponse challenge() {
        return FakeTransportSession::makeResponse(401, "", HttpHeaders{{"WWW-Authenticate", "Bearer"}});
    }

    std::shared_ptr<FakeTransportSession> transport;
    std::shared_ptr<FakeAuthorizationProvider> authProvider;
    std::shared_ptr<analytics::AnalyticsMetadataProvider> analyticsProvider;
    std::unique_ptr<AuthorizingSession> session;

    int calls{0};
    std::optional<HttpResponse> response;
    std::optional<errors::SessionError> error;
};

} // namespace

TEST(AuthorizingSessionConstruction, RejectsNullCollaborators) {
    auto transport = std::make_shared<FakeTransportSession>();
    auto authProvider = std::make_shared<FakeAuthorizationProvider>();
    auto analyticsProvider = std::make_shared<analytics::AnalyticsMetadataProvider>();
    EXPECT_THROW(AuthorizingSession(nullptr, authProvider, analyticsProvider), std::invalid_argument);
    EXPECT_THROW(AuthorizingSession(transport, nullptr, analyticsProvider), std::invalid_argument);
    EXPECT_THROW(AuthorizingSession(transport, authProvider, nullptr), std::invalid_argument);
}

TEST_F(AuthorizingSessionTest, DataTaskFromUrlIsDecoratedGet) {
    authProvider->header = "Bearer cached";
    auto task = session->dataTask("https://api.example.com/api/data");
    ASSERT_TRUE(task);
    EXPECT_EQ(task->state(), TaskState::Suspended);

    ASSERT_EQ(transport->calls.size(), 1u);
    const auto& call = transport->calls[0];
    EXPECT_EQ(call.kind, CallKind::Data);
    EXPECT_EQ(call.request.method, "GET");
    EXPECT_EQ(call.request.url, "https://api.example.com/api/data");
    EXPECT_EQ(call.request.value("Authorization"), std::optional<std::string>("Bearer cached"));
    EXPECT_TRUE(call.request.headers.contains("x-wl-analytics-tracking-id"));
    EXPECT_EQ(call.request.value("x-mfp-analytics-metadata"), std::optional<std::string>("{\"app\":\"demo\"}"));
    EXPECT_FALSE(call.handler);
}

TEST_F(AuthorizingSessionTest, EveryConstructorDecorates) {
    HttpRequest post("https://api.example.com/items", "POST");
    session->dataTask(post);
    session->dataTask(post, capture());
    session->dataTask(std::string("https://api.example.com/"), capture());
    session->uploadTask(post, std::string("bytes"));
    session->uploadTask(post, std::string("bytes"), capture());
    session->uploadTask(post, std::filesystem::path("/tmp/f.bin"));
    session->uploadTask(post, std::filesystem::path("/tmp/f.bin"), capture());

    ASSERT_EQ(transport->calls.size(), 7u);
    for (const auto& call : transport->calls) {
        EXPECT_TRUE(call.request.headers.contains("x-wl-analytics-tracking-id"));
    }
    EXPECT_EQ(transport->calls[3].kind, CallKind::UploadData);
    EXPECT_EQ(transport->calls[3].uploadData, "bytes");
    EXPECT_EQ(transport->calls[5].kind, CallKind::UploadFile);
    EXPECT_EQ(transport->calls[5].uploadFile, std::filesystem::path("/tmp/f.bin"));
}

TEST_F(AuthorizingSessionTest, NonChallengeOutcomesPassThrough) {
    session->dataTask(HttpRequest("https://api.example.com/a"), capture());
    transport->complete(0, FakeTransportSession::makeResponse(404, "missing"));
    EXPECT_EQ(calls, 1);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->status, 404);
    EXPECT_FALSE(error.has_value());
    EXPECT_EQ(authProvider->obtainCalls, 0);

    session->dataTask(HttpRequest("https://api.example.com/b"), capture());
    transport->complete(1, std::nullopt, errors::makeError(errors::ErrorCategory::Timeout, "read timed out"));
    EXPECT_EQ(calls, 2);
    EXPECT_FALSE(response.has_value());
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->category, errors::ErrorCategory::Timeout);
    EXPECT_EQ(error->message, "read timed out");
}

TEST_F(AuthorizingSessionTest, UnauthorizedWithoutChallengeHeaderPassesThrough) {
    session->dataTask(HttpRequest("https://api.example.com/a"), capture());
    transport->complete(0, FakeTransportSession::makeResponse(401));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(response->status, 401);
    EXPECT_EQ(authProvider->obtainCalls, 0);
}

TEST_F(AuthorizingSessionTest, ReauthorizationFailureReachesCallerAsAuthorizationError) {
    authProvider->mode = FakeAuthorizationProvider::Mode::FailWithStatus;
    session->dataTask(HttpRequest("https://api.example.com/a"), capture());
    transport->complete(0, challenge());

    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(response.has_value());
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->category, errors::ErrorCategory::Authorization);
    EXPECT_EQ(transport->calls.size(), 1u);
}

TEST_F(AuthorizingSessionTest, UploadDataRetryCarriesSameBody) {
    HttpRequest put("https://api.example.com/upload", "PUT");
    session->uploadTask(put, std::string("payload-bytes"), capture());
    transport->complete(0, challenge());

    ASSERT_EQ(transport->calls.size(), 2u);
    const auto& retry = transport->calls[1];
    EXPECT_EQ(retry.kind, CallKind::Data);
    EXPECT_EQ(retry.request.method, "PUT");
    EXPECT_EQ(retry.request.body, RequestBody(std::string("payload-bytes")));
    EXPECT_EQ(retry.request.value("Authorization"), std::optional<std::string>("Bearer refreshed"));

    transport->complete(1, FakeTransportSession::makeResponse(201));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(response->status, 201);
}

TEST_F(AuthorizingSessionTest, UploadFileRetryCarriesSameFile) {
    HttpRequest put("https://api.example.com/upload", "PUT");
    session->uploadTask(put, std::filesystem::path("/tmp/data.bin"), capture());
    transport->complete(0, challenge());

    ASSERT_EQ(transport->calls.size(), 2u);
    EXPECT_EQ(transport->calls[1].kind, CallKind::UploadFile);
    EXPECT_EQ(transport->calls[1].uploadFile, std::filesystem::path("/tmp/data.bin"));
}

TEST_F(AuthorizingSessionTest, TasksWithoutHandlerAreNotChallengeChecked) {
    session->dataTask(HttpRequest("https://api.example.com/a"));
    ASSERT_EQ(transport->calls.size(), 1u);
    EXPECT_FALSE(transport->calls[0].handler);
    transport->complete(0, challenge());
    EXPECT_EQ(authProvider->obtainCalls, 0);
}

TEST_F(AuthorizingSessionTest, HandlerOutlivesFacade) {
    session->dataTask(HttpRequest("https://api.example.com/a"), capture());
    session.reset();
    transport->complete(0, challenge());
    ASSERT_EQ(transport->calls.size(), 2u);
    transport->complete(1, FakeTransportSession::makeResponse(200));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(response->status, 200);
}

// The transport drops the challenged handler after delivery and the caller has released every
// collaborator; the pending token request alone keeps the provider alive for the retry
TEST(AuthorizingSessionLifetime, ProviderSurvivesUntilTokenArrives) {
    auto api = std::make_shared<FakeTransportSession>();
    auto tokenTransport = std::make_shared<FakeTransportSession>();
    auth::OAuth2ClientCredentialsOptions options;
    options.tokenUrl = "https://auth.example.com/oauth/token";
    options.clientId = "demo";
    auto provider = std::make_shared<auth::OAuth2ClientCredentialsProvider>(options, tokenTransport);
    std::weak_ptr<auth::OAuth2ClientCredentialsProvider> weakProvider = provider;

    int calls = 0;
    std::optional<HttpResponse> response;
    auto session = std::make_unique<AuthorizingSession>(api, provider,
                                                        std::make_shared<analytics::AnalyticsMetadataProvider>());
    session->dataTask(HttpRequest("https://api.example.com/api/data"),
                      [&](std::optional<HttpResponse> r, std::optional<errors::SessionError>) {
                          ++calls;
                          response = std::move(r);
                      })->resume();
    session.reset();
    provider.reset();

    {
        CompletionHandler delivered = std::move(api->calls[0].handler);
        api->calls[0].handler = nullptr;
        api->calls[0].task->markCompleted();
        delivered(FakeTransportSession::makeResponse(401, "", HttpHeaders{{"WWW-Authenticate", "Bearer"}}),
                  std::nullopt);
    }
    ASSERT_EQ(tokenTransport->calls.size(), 1u);
    EXPECT_FALSE(weakProvider.expired());

    tokenTransport->complete(0, FakeTransportSession::makeResponse(200, "{\"access_token\":\"fresh\"}"));
    ASSERT_EQ(api->calls.size(), 2u);
    EXPECT_EQ(api->calls[1].request.value("Authorization"), std::optional<std::string>("Bearer fresh"));
    api->complete(1, FakeTransportSession::makeResponse(200));
    EXPECT_EQ(calls, 1);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->status, 200);
}

// GET /api/data with no cached token: 401 Bearer, token refresh, retry with the fresh token
TEST_F(AuthorizingSessionTest, EndToEndUnauthorizedRefreshRetry) {
    authProvider->refreshedHeader = "Bearer fresh-token";
    transport->responder = [this](fakes::RecordedCall& call) {
        if (call.request.value("Authorization") == std::optional<std::string>("Bearer fresh-token")) {
            call.task->markCompleted();
            call.handler(FakeTransportSession::makeResponse(200, "{\"data\":[1,2,3]}"), std::nullopt);
        } else {
            call.task->markCompleted();
            call.handler(challenge(), std::nullopt);
        }
    };

    auto task = session->dataTask(HttpRequest("https://api.example.com/api/data"), capture());
    EXPECT_EQ(calls, 0);
    task->resume();

    ASSERT_EQ(transport->calls.size(), 2u);
    const auto& first = transport->calls[0];
    EXPECT_TRUE(first.request.headers.contains("x-wl-analytics-tracking-id"));
    EXPECT_FALSE(first.request.headers.contains("Authorization"));

    const auto& retry = transport->calls[1];
    EXPECT_EQ(retry.request.method, "GET");
    EXPECT_EQ(retry.request.url, "https://api.example.com/api/data");
    EXPECT_EQ(retry.request.value("Authorization"), std::optional<std::string>("Bearer fresh-token"));
    EXPECT_EQ(retry.task->resumeCount, 1);

    EXPECT_EQ(authProvider->obtainCalls, 1);
    EXPECT_EQ(calls, 1);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->status, 200);
    EXPECT_EQ(response->body, "{\"data\":[1,2,3]}");
    EXPECT_FALSE(error.has_value());
}
