//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ForwardingSessionDelegate.cpp
// Purpose: Session delegate that wraps a caller-supplied delegate and forwards every event to it
//==========================================================================================================

#include "bms/ForwardingSessionDelegate.hpp"

#include <stdexcept>
#include <utility>

#include "logging/Logger.h"

namespace bms {

ForwardingSessionDelegate::ForwardingSessionDelegate(std::shared_ptr<ISessionDelegate> parent)
    : parent(std::move(parent)) {
    if (!this->parent) {
        throw std::invalid_argument("ForwardingSessionDelegate requires a parent delegate");
    }
}

void ForwardingSessionDelegate::onResponse(ISessionTask& task, const HttpResponse& response) {
    parent->onResponse(task, response);
}

void ForwardingSessionDelegate::onData(ISessionTask& task, const std::string& bytes) {
    parent->onData(task, bytes);
}

void ForwardingSessionDelegate::onBodySent(ISessionTask& task, std::uint64_t bytesSent, std::uint64_t totalBytes) {
    parent->onBodySent(task, bytesSent, totalBytes);
}

void ForwardingSessionDelegate::onComplete(ISessionTask& task, const std::optional<errors::SessionError>& error) {
    if (error) {
        LOG_DEBUG("[bms.urlSession] task {} completed with {}", task.taskIdentifier(), errors::describe(*error));
    }
    parent->onComplete(task, error);
}

void ForwardingSessionDelegate::onInvalidated(const std::optional<errors::SessionError>& error) {
    LOG_DEBUG("[bms.urlSession] session invalidated");
    parent->onInvalidated(error);
}

} // namespace bms
