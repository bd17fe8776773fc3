//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChallengeHandler.hpp
// Purpose: Authorization challenge detection and the single reauthorize-and-retry cycle
//==========================================================================================================

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>

#include "bms/HttpTypes.h"
#include "bms/TransportSession.h"
#include "bms/auth/IAuthorizationProvider.hpp"

namespace bms {

//==========================================================================================================
// isAuthorizationChallenge
// Purpose: True only when the response exists, carries a WWW-Authenticate header and the provider's
//          isAuthorizationRequired(status, header) accepts it. Each check short-circuits; the provider
//          is not consulted when the response or header is missing.
//==========================================================================================================
bool isAuthorizationChallenge(const std::optional<HttpResponse>& response,
                              const auth::IAuthorizationProvider& authProvider);

enum class ChallengeState {
    Idle,
    AwaitingAuthorization,
    Retried,
    Failed
};

//==========================================================================================================
// ChallengeAttempt
// Purpose: Observable state of one challenge cycle. Resolution happens at most once; later
//          invocations of the provider's callback are ignored.
//==========================================================================================================
class ChallengeAttempt {
public:
    ChallengeState state() const { return current.load(); }
    bool resolved() const {
        auto s = current.load();
        return s == ChallengeState::Retried || s == ChallengeState::Failed;
    }

private:
    friend class ChallengeHandler;
    std::atomic<ChallengeState> current{ChallengeState::Idle};
};

using FailureHandler = std::function<void(const errors::SessionError& error)>;

//==========================================================================================================
// ChallengeHandler
// Purpose: Drives Idle -> AwaitingAuthorization -> Retried | Failed for a challenged request.
//   On a successful authorization (no error, 2xx) the refreshed Authorization header is copied onto the
//   original, undecorated request, which is resubmitted once and resumed. Its outcome goes to
//   onRetryComplete unchanged: a second challenge is not handled. Any other outcome is logged and
//   reported to onFailure with an Authorization error.
// Notes:
//   - The provider is shared with every pending attempt, so it stays alive until the callback resolves.
//   - A request with a file body is resubmitted as a file upload, any other request as a data task.
//==========================================================================================================
class ChallengeHandler {
public:
    explicit ChallengeHandler(std::shared_ptr<auth::IAuthorizationProvider> authProvider);

    std::shared_ptr<const ChallengeAttempt> handleChallenge(std::shared_ptr<ITransportSession> session,
                                                            HttpRequest originalRequest,
                                                            CompletionHandler onRetryComplete,
                                                            FailureHandler onFailure) const;

private:
    std::shared_ptr<auth::IAuthorizationProvider> authProvider;
};

} // namespace bms
