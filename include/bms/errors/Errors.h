//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed session errors delivered to completion handlers and delegates
//==========================================================================================================

#pragma once

#include <string>
#include <utility>

#include <boost/system/error_code.hpp>

namespace bms {
namespace errors {

// Categorization of failures surfaced by sessions and authorization providers.
enum class ErrorCategory {
    Transport,
    Timeout,
    Tls,
    InvalidRequest,
    Authorization,
    Cancelled,
    Unknown
};

// Typed error representation used by the library.
struct SessionError {
    ErrorCategory category{ErrorCategory::Unknown};
    std::string message;
    int code{0};
};

// Stable name of a category, used in log lines and diagnostics.
inline const char* categoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Transport: return "Transport";
        case ErrorCategory::Timeout: return "Timeout";
        case ErrorCategory::Tls: return "Tls";
        case ErrorCategory::InvalidRequest: return "InvalidRequest";
        case ErrorCategory::Authorization: return "Authorization";
        case ErrorCategory::Cancelled: return "Cancelled";
        default: return "Unknown";
    }
}

inline SessionError makeError(ErrorCategory category, std::string message, int code = 0) {
    SessionError e;
    e.category = category;
    e.message = std::move(message);
    e.code = code;
    return e;
}

// Render an error as "<Category>: <message>" with the numeric code appended when non-zero.
inline std::string describe(const SessionError& err) {
    std::string out = std::string(categoryName(err.category)) + ": " + err.message;
    if (err.code != 0) {
        out += " (code=" + std::to_string(err.code) + ")";
    }
    return out;
}

// Map a Boost.System error raised by Asio/Beast to a SessionError.
//
// Args:
//   ec: The error code reported by the I/O operation.
//   context: Short description of the failing step (e.g., "connect", "handshake").
//
// Returns:
//   SessionError with Timeout for expired deadlines, Cancelled for aborted operations,
//   Tls for SSL stream failures and Transport otherwise.
SessionError fromBoostError(const boost::system::error_code& ec, const std::string& context);

} // namespace errors
} // namespace bms
