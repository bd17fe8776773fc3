//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChallengeHandler.cpp
// Purpose: Authorization challenge detection and the single reauthorize-and-retry cycle
//==========================================================================================================

#include "bms/ChallengeHandler.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "logging/Logger.h"
#include "bms/RequestDecorator.hpp"

namespace bms {

bool isAuthorizationChallenge(const std::optional<HttpResponse>& response,
                              const auth::IAuthorizationProvider& authProvider) {
    if (!response.has_value()) {
        return false;
    }
    const auto wwwAuthenticate = response->header(headers::kWwwAuthenticate);
    if (!wwwAuthenticate.has_value()) {
        return false;
    }
    return authProvider.isAuthorizationRequired(response->status, *wwwAuthenticate);
}

ChallengeHandler::ChallengeHandler(std::shared_ptr<auth::IAuthorizationProvider> authProvider)
    : authProvider(std::move(authProvider)) {
    if (!this->authProvider) {
        throw std::invalid_argument("ChallengeHandler: authorization provider must not be null");
    }
}

std::shared_ptr<const ChallengeAttempt> ChallengeHandler::handleChallenge(std::shared_ptr<ITransportSession> session,
                                                                          HttpRequest originalRequest,
                                                                          CompletionHandler onRetryComplete,
                                                                          FailureHandler onFailure) const {
    auto attempt = std::make_shared<ChallengeAttempt>();
    attempt->current.store(ChallengeState::AwaitingAuthorization);

    auto authCallback = [attempt, provider = authProvider, session = std::move(session),
                         request = std::move(originalRequest),
                         onRetryComplete = std::move(onRetryComplete), onFailure = std::move(onFailure)](
                            std::optional<HttpResponse> response, std::optional<errors::SessionError> error) mutable {
        const bool authorized = !error.has_value() && response.has_value() && response->isSuccess();
        auto expected = ChallengeState::AwaitingAuthorization;
        const auto next = authorized ? ChallengeState::Retried : ChallengeState::Failed;
        if (!attempt->current.compare_exchange_strong(expected, next)) {
            LOG_WARN("[bms.urlSession] Ignoring repeated authorization callback for {} {}", request.method, request.url);
            return;
        }

        if (authorized) {
            // Resend the original request with the refreshed Authorization header
            if (auto authHeader = provider->cachedAuthorizationHeader()) {
                request.setValue(headers::kAuthorization, *authHeader);
            }
            LOG_DEBUG("[bms.urlSession] Authorization obtained; resending {} {}", request.method, request.url);
            SessionTaskPtr retry;
            if (const auto* file = std::get_if<std::filesystem::path>(&request.body)) {
                const std::filesystem::path bodyFile = *file;
                retry = session->uploadTask(request, bodyFile, std::move(onRetryComplete));
            } else {
                retry = session->dataTask(request, std::move(onRetryComplete));
            }
            if (retry) {
                retry->resume();
            }
            return;
        }

        const std::string errorText = error ? errors::describe(*error) : std::string("none");
        const std::string responseText = response ? std::to_string(response->status) : std::string("none");
        LOG_ERROR("[bms.urlSession] Authorization process failed. Error: {}. Response status: {}.", errorText, responseText);
        errors::SessionError failure = error ? *error : errors::makeError(
            errors::ErrorCategory::Authorization,
            "authorization attempt returned status " + responseText);
        failure.category = errors::ErrorCategory::Authorization;
        if (onFailure) {
            onFailure(failure);
        }
    };

    authProvider->obtainAuthorization(std::move(authCallback));
    return attempt;
}

} // namespace bms
