//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TransportSession.h
// Purpose: Transport session, task and delegate interfaces
//==========================================================================================================

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "bms/HttpTypes.h"

namespace bms {

//==========================================================================================================
// TaskState
// Purpose: Lifecycle of a session task. Tasks are created Suspended and start on resume().
//==========================================================================================================
enum class TaskState {
    Suspended,
    Running,
    Canceling,
    Completed
};

//==========================================================================================================
// ISessionTask
// Purpose: Handle to a single request/response exchange owned by a transport session.
//==========================================================================================================
class ISessionTask {
public:
    virtual ~ISessionTask() = default;

    //==========================================================================================================
    // Starts a suspended task. Calling resume() on a running or completed task has no effect.
    //==========================================================================================================
    virtual void resume() = 0;

    //==========================================================================================================
    // Cancels the task. The task completes with a Cancelled error unless it has already completed.
    //==========================================================================================================
    virtual void cancel() = 0;

    virtual TaskState state() const = 0;

    //==========================================================================================================
    // Identifier unique within the owning session.
    //==========================================================================================================
    virtual std::uint64_t taskIdentifier() const = 0;

    //==========================================================================================================
    // The request exactly as it was handed to the session.
    //==========================================================================================================
    virtual const HttpRequest& originalRequest() const = 0;
};

using SessionTaskPtr = std::shared_ptr<ISessionTask>;

//==========================================================================================================
// ISessionDelegate
// Purpose: Receives task events for tasks created without a completion handler, plus session-level
//          events. Every method has an empty default so delegates override only what they need.
// Notes:
//   - Callbacks run on the session's I/O thread.
//   - onBodySent is reported for every task that sends a body, with or without a completion handler.
//==========================================================================================================
class ISessionDelegate {
public:
    virtual ~ISessionDelegate() = default;

    virtual void onResponse(ISessionTask& task, const HttpResponse& response) { (void)task; (void)response; }
    virtual void onData(ISessionTask& task, const std::string& bytes) { (void)task; (void)bytes; }
    virtual void onBodySent(ISessionTask& task, std::uint64_t bytesSent, std::uint64_t totalBytes) {
        (void)task; (void)bytesSent; (void)totalBytes;
    }
    virtual void onComplete(ISessionTask& task, const std::optional<errors::SessionError>& error) {
        (void)task; (void)error;
    }
    virtual void onInvalidated(const std::optional<errors::SessionError>& error) { (void)error; }
};

//==========================================================================================================
// ITransportSession
// Purpose: Networking engine that builds tasks for requests. A null completion handler routes the
//          task's events to the session delegate instead.
//==========================================================================================================
class ITransportSession {
public:
    virtual ~ITransportSession() = default;

    //==========================================================================================================
    // Creates a suspended task sending request (including any request body).
    //==========================================================================================================
    virtual SessionTaskPtr dataTask(const HttpRequest& request, CompletionHandler handler) = 0;

    //==========================================================================================================
    // Creates a suspended task sending bodyData in place of the request body.
    //==========================================================================================================
    virtual SessionTaskPtr uploadTask(const HttpRequest& request, const std::string& bodyData,
                                      CompletionHandler handler) = 0;

    //==========================================================================================================
    // Creates a suspended task sending the contents of file in place of the request body.
    //==========================================================================================================
    virtual SessionTaskPtr uploadTask(const HttpRequest& request, const std::filesystem::path& file,
                                      CompletionHandler handler) = 0;

    //==========================================================================================================
    // Cancels outstanding tasks and rejects new ones. The delegate receives onInvalidated.
    //==========================================================================================================
    virtual void invalidateAndCancel() = 0;

    //==========================================================================================================
    // Session identifier for diagnostics.
    //==========================================================================================================
    virtual std::string sessionId() const = 0;
};

//==========================================================================================================
// ITransportSessionFactory
// Purpose: Creates transport sessions from configuration strings.
//==========================================================================================================
class ITransportSessionFactory {
public:
    virtual ~ITransportSessionFactory() = default;

    //==========================================================================================================
    // Creates a session using the provided configuration.
    // Args:
    //   config: Semicolon-delimited key=value configuration string.
    //   delegate: Optional delegate for tasks without completion handlers.
    // Returns:
    //   A shared_ptr to the new session.
    //==========================================================================================================
    virtual std::shared_ptr<ITransportSession> CreateSession(const std::string& config,
                                                             std::shared_ptr<ISessionDelegate> delegate) = 0;
};

} // namespace bms
