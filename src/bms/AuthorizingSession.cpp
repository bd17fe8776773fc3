//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AuthorizingSession.cpp
// Purpose: Session facade that decorates requests and handles authorization challenges
//==========================================================================================================

#include "bms/AuthorizingSession.hpp"

#include <stdexcept>
#include <utility>

#include "bms/BeastTransportSession.hpp"
#include "bms/ForwardingSessionDelegate.hpp"
#include "logging/Logger.h"

namespace bms {

namespace {

template <typename T>
std::shared_ptr<T> requireNonNull(std::shared_ptr<T> ptr, const char* what) {
    if (!ptr) {
        throw std::invalid_argument(std::string("AuthorizingSession requires a ") + what);
    }
    return ptr;
}

} // namespace

AuthorizingSession::AuthorizingSession(std::shared_ptr<ITransportSession> transport,
                                       std::shared_ptr<auth::IAuthorizationProvider> authProvider,
                                       std::shared_ptr<analytics::IAnalyticsMetadataProvider> analyticsProvider)
    : transport(requireNonNull(std::move(transport), "transport session")),
      authProvider(requireNonNull(std::move(authProvider), "authorization provider")),
      analyticsProvider(requireNonNull(std::move(analyticsProvider), "analytics metadata provider")),
      decorator(*this->authProvider, *this->analyticsProvider),
      challengeHandler(this->authProvider) {}

AuthorizingSession AuthorizingSession::create(const SessionConfiguration& config,
                                              std::shared_ptr<auth::IAuthorizationProvider> authProvider,
                                              std::shared_ptr<analytics::IAnalyticsMetadataProvider> analyticsProvider,
                                              std::shared_ptr<ISessionDelegate> delegate) {
    std::shared_ptr<ISessionDelegate> installed;
    if (delegate) {
        installed = std::make_shared<ForwardingSessionDelegate>(std::move(delegate));
    }
    auto transport = std::make_shared<BeastTransportSession>(config, std::move(installed));
    LOG_DEBUG("[bms.urlSession] created session {}", transport->sessionId());
    return AuthorizingSession(std::move(transport), std::move(authProvider), std::move(analyticsProvider));
}

////////////////////////////////////////////// Data tasks //////////////////////////////////////////////

SessionTaskPtr AuthorizingSession::dataTask(const std::string& url) const {
    return dataTask(HttpRequest(url));
}

SessionTaskPtr AuthorizingSession::dataTask(const std::string& url, CompletionHandler completionHandler) const {
    return dataTask(HttpRequest(url), std::move(completionHandler));
}

SessionTaskPtr AuthorizingSession::dataTask(const HttpRequest& request) const {
    return transport->dataTask(decorator.decorate(request), nullptr);
}

SessionTaskPtr AuthorizingSession::dataTask(const HttpRequest& request, CompletionHandler completionHandler) const {
    auto wrapped = wrapCompletion(request, std::move(completionHandler));
    return transport->dataTask(decorator.decorate(request), std::move(wrapped));
}

///////////////////////////////////////////// Upload tasks /////////////////////////////////////////////

SessionTaskPtr AuthorizingSession::uploadTask(const HttpRequest& request, const std::string& bodyData) const {
    return transport->uploadTask(decorator.decorate(request), bodyData, nullptr);
}

SessionTaskPtr AuthorizingSession::uploadTask(const HttpRequest& request, const std::string& bodyData,
                                              CompletionHandler completionHandler) const {
    // The retry is a data task, so the upload body travels on the request itself
    HttpRequest retryRequest = request;
    retryRequest.body = bodyData;
    auto wrapped = wrapCompletion(std::move(retryRequest), std::move(completionHandler));
    return transport->uploadTask(decorator.decorate(request), bodyData, std::move(wrapped));
}

SessionTaskPtr AuthorizingSession::uploadTask(const HttpRequest& request, const std::filesystem::path& file) const {
    return transport->uploadTask(decorator.decorate(request), file, nullptr);
}

SessionTaskPtr AuthorizingSession::uploadTask(const HttpRequest& request, const std::filesystem::path& file,
                                              CompletionHandler completionHandler) const {
    HttpRequest retryRequest = request;
    retryRequest.body = file;
    auto wrapped = wrapCompletion(std::move(retryRequest), std::move(completionHandler));
    return transport->uploadTask(decorator.decorate(request), file, std::move(wrapped));
}

CompletionHandler AuthorizingSession::wrapCompletion(HttpRequest originalRequest,
                                                     CompletionHandler completionHandler) const {
    if (!completionHandler) {
        return nullptr;
    }
    // Captures copies only; tasks may outlive this facade
    return [transport = transport, authProvider = authProvider, challengeHandler = challengeHandler,
            request = std::move(originalRequest), completion = std::move(completionHandler)](
               std::optional<HttpResponse> response, std::optional<errors::SessionError> error) {
        if (!isAuthorizationChallenge(response, *authProvider)) {
            completion(std::move(response), std::move(error));
            return;
        }
        LOG_INFO("[bms.urlSession] Authorization challenge ({}) for {} {}; reauthorizing",
                 response->status, request.method, request.url);
        challengeHandler.handleChallenge(
            transport, request, completion,
            [completion](const errors::SessionError& failure) { completion(std::nullopt, failure); });
    };
}

} // namespace bms
