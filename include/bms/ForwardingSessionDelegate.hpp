//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ForwardingSessionDelegate.hpp
// Purpose: Session delegate that wraps a caller-supplied delegate and forwards every event to it
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "bms/TransportSession.h"

namespace bms {

//==========================================================================================================
// ForwardingSessionDelegate
// Purpose: Installed on the transport in place of the caller's delegate. Implements the full delegate
//          surface and forwards each callback to the wrapped delegate unchanged.
//==========================================================================================================
class ForwardingSessionDelegate final : public ISessionDelegate {
public:
    // Throws std::invalid_argument when parent is null.
    explicit ForwardingSessionDelegate(std::shared_ptr<ISessionDelegate> parent);

    void onResponse(ISessionTask& task, const HttpResponse& response) override;
    void onData(ISessionTask& task, const std::string& bytes) override;
    void onBodySent(ISessionTask& task, std::uint64_t bytesSent, std::uint64_t totalBytes) override;
    void onComplete(ISessionTask& task, const std::optional<errors::SessionError>& error) override;
    void onInvalidated(const std::optional<errors::SessionError>& error) override;

    const std::shared_ptr<ISessionDelegate>& parentDelegate() const { return parent; }

private:
    std::shared_ptr<ISessionDelegate> parent;
};

} // namespace bms
