//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/fakes/FakeAuthorizationProvider.hpp
// Purpose: Scriptable IAuthorizationProvider for unit tests
//==========================================================================================================
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "bms/auth/IAuthorizationProvider.hpp"
#include "bms/errors/Errors.h"

namespace bms::fakes {

//==========================================================================================================
// FakeAuthorizationProvider
// Purpose: Holds a settable Authorization header and a status code that counts as a challenge.
//          obtainAuthorization either stores the callback (Manual) or completes immediately.
//==========================================================================================================
class FakeAuthorizationProvider final : public auth::IAuthorizationProvider {
public:
    enum class Mode { Manual, Succeed, FailWithError, FailWithStatus, SucceedTwice };

    std::optional<std::string> cachedAuthorizationHeader() const override {
        ++headerQueries;
        return header;
    }

    bool isAuthorizationRequired(int statusCode, const std::string& wwwAuthenticateHeader) const override {
        ++requiredQueries;
        lastChallengeHeader = wwwAuthenticateHeader;
        return statusCode == challengeStatus;
    }

    void obtainAuthorization(CompletionHandler onComplete) override {
        ++obtainCalls;
        switch (mode) {
            case Mode::Manual:
                pending.push_back(std::move(onComplete));
                break;
            case Mode::Succeed:
                header = refreshedHeader;
                onComplete(ok(), std::nullopt);
                break;
            case Mode::SucceedTwice:
                header = refreshedHeader;
                onComplete(ok(), std::nullopt);
                onComplete(ok(), std::nullopt);
                break;
            case Mode::FailWithError:
                onComplete(std::nullopt, errors::makeError(errors::ErrorCategory::Transport, "token endpoint down"));
                break;
            case Mode::FailWithStatus: {
                HttpResponse denied;
                denied.status = 400;
                onComplete(std::move(denied), std::nullopt);
                break;
            }
        }
    }

    static HttpResponse ok() {
        HttpResponse r;
        r.status = 200;
        return r;
    }

    std::optional<std::string> header;
    std::string refreshedHeader{"Bearer refreshed"};
    int challengeStatus{401};
    Mode mode{Mode::Succeed};

    std::vector<CompletionHandler> pending;
    int obtainCalls{0};
    mutable int headerQueries{0};
    mutable int requiredQueries{0};
    mutable std::string lastChallengeHeader;
};

} // namespace bms::fakes
