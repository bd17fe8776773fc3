//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.cpp
// Purpose: Mapping of Boost.Asio/Beast error codes onto session error categories
//==========================================================================================================

#include "bms/errors/Errors.h"

#include <boost/asio/error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core/error.hpp>

namespace bms {
namespace errors {

SessionError fromBoostError(const boost::system::error_code& ec, const std::string& context) {
    std::string message = context.empty() ? ec.message() : context + ": " + ec.message();
    if (ec == boost::beast::error::timeout) {
        return makeError(ErrorCategory::Timeout, std::move(message), ec.value());
    }
    if (ec == boost::asio::error::operation_aborted) {
        return makeError(ErrorCategory::Cancelled, std::move(message), ec.value());
    }
    if (ec.category() == boost::asio::error::get_ssl_category() ||
        ec.category() == boost::asio::ssl::error::get_stream_category()) {
        return makeError(ErrorCategory::Tls, std::move(message), ec.value());
    }
    return makeError(ErrorCategory::Transport, std::move(message), ec.value());
}

} // namespace errors
} // namespace bms
