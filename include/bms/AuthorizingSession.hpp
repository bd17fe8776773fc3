//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AuthorizingSession.hpp
// Purpose: Session facade that decorates requests and handles authorization challenges
//==========================================================================================================

#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "bms/ChallengeHandler.hpp"
#include "bms/HttpTypes.h"
#include "bms/RequestDecorator.hpp"
#include "bms/SessionConfiguration.hpp"
#include "bms/TransportSession.h"
#include "bms/analytics/IAnalyticsMetadataProvider.hpp"
#include "bms/auth/IAuthorizationProvider.hpp"

namespace bms {

//==========================================================================================================
// AuthorizingSession
// Purpose: Wraps a transport session. Every task constructor decorates the request (Authorization,
//          tracking id, analytics metadata) and hands it to the transport unchanged. When a completion
//          handler is supplied it is wrapped so that an authorization challenge triggers one
//          reauthorize-and-retry cycle instead of reaching the caller.
// Notes:
//   - Tasks are returned suspended; call resume() to start them.
//   - Tasks created without a completion handler are not challenge-checked; their events go to the
//     transport's delegate.
//   - When reauthorization fails the caller's handler receives (nullopt, Authorization error).
//   - The retried response is final, even if it is itself a challenge.
//==========================================================================================================
class AuthorizingSession {
public:
    // Throws std::invalid_argument when any collaborator is null.
    AuthorizingSession(std::shared_ptr<ITransportSession> transport,
                       std::shared_ptr<auth::IAuthorizationProvider> authProvider,
                       std::shared_ptr<analytics::IAnalyticsMetadataProvider> analyticsProvider);

    //==========================================================================================================
    // create
    // Purpose: Builds a BeastTransportSession for config. A caller delegate is wrapped in a
    //          ForwardingSessionDelegate before it is installed on the transport.
    //==========================================================================================================
    static AuthorizingSession create(const SessionConfiguration& config,
                                     std::shared_ptr<auth::IAuthorizationProvider> authProvider,
                                     std::shared_ptr<analytics::IAnalyticsMetadataProvider> analyticsProvider,
                                     std::shared_ptr<ISessionDelegate> delegate = nullptr);

    /////////////////////////////////////////// Data tasks ///////////////////////////////////////////
    SessionTaskPtr dataTask(const std::string& url) const;
    SessionTaskPtr dataTask(const std::string& url, CompletionHandler completionHandler) const;
    SessionTaskPtr dataTask(const HttpRequest& request) const;
    SessionTaskPtr dataTask(const HttpRequest& request, CompletionHandler completionHandler) const;

    /////////////////////////////////////////// Upload tasks ///////////////////////////////////////////
    SessionTaskPtr uploadTask(const HttpRequest& request, const std::string& bodyData) const;
    SessionTaskPtr uploadTask(const HttpRequest& request, const std::string& bodyData,
                              CompletionHandler completionHandler) const;
    SessionTaskPtr uploadTask(const HttpRequest& request, const std::filesystem::path& file) const;
    SessionTaskPtr uploadTask(const HttpRequest& request, const std::filesystem::path& file,
                              CompletionHandler completionHandler) const;

    const std::shared_ptr<ITransportSession>& transportSession() const { return transport; }
    const RequestDecorator& requestDecorator() const { return decorator; }

private:
    CompletionHandler wrapCompletion(HttpRequest originalRequest, CompletionHandler completionHandler) const;

    std::shared_ptr<ITransportSession> transport;
    std::shared_ptr<auth::IAuthorizationProvider> authProvider;
    std::shared_ptr<analytics::IAnalyticsMetadataProvider> analyticsProvider;
    RequestDecorator decorator;
    ChallengeHandler challengeHandler;
};

} // namespace bms
