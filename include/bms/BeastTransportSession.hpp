//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BeastTransportSession.hpp
// Purpose: Coroutine-based HTTP/HTTPS transport session using Boost.Beast
//==========================================================================================================

#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "bms/SessionConfiguration.hpp"
#include "bms/TransportSession.h"

namespace bms {

//==========================================================================================================
// BeastTransportSession
// Purpose: Concrete ITransportSession. Runs one io_context on a worker thread; every resumed task is a
//          coroutine doing resolve, connect, optional TLS handshake, write and read over HTTP/1.1 with
//          `Connection: close`.
// Notes:
//   - Completion handlers and delegate callbacks run on the worker thread.
//   - Tasks hold only a weak reference to the session; resuming a task after the session is gone or
//     invalidated completes it with a Cancelled error.
//==========================================================================================================
class BeastTransportSession : public ITransportSession {
public:
    explicit BeastTransportSession(const SessionConfiguration& config,
                                   std::shared_ptr<ISessionDelegate> delegate = nullptr);
    ~BeastTransportSession() override;

    BeastTransportSession(const BeastTransportSession&) = delete;
    BeastTransportSession& operator=(const BeastTransportSession&) = delete;

    ////////////////////////////////////////// ITransportSession //////////////////////////////////////////
    SessionTaskPtr dataTask(const HttpRequest& request, CompletionHandler handler) override;
    SessionTaskPtr uploadTask(const HttpRequest& request, const std::string& bodyData,
                              CompletionHandler handler) override;
    SessionTaskPtr uploadTask(const HttpRequest& request, const std::filesystem::path& file,
                              CompletionHandler handler) override;
    void invalidateAndCancel() override;
    std::string sessionId() const override;

    const SessionConfiguration& configuration() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

//==========================================================================================================
// BeastTransportSessionFactory
// Purpose: Creates BeastTransportSession instances from `key=value; ...` configuration strings.
//==========================================================================================================
class BeastTransportSessionFactory : public ITransportSessionFactory {
public:
    std::shared_ptr<ITransportSession> CreateSession(const std::string& config,
                                                     std::shared_ptr<ISessionDelegate> delegate) override;
};

} // namespace bms
