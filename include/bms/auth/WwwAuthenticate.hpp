//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WwwAuthenticate.hpp
// Purpose: Parser for HTTP WWW-Authenticate challenges and Bearer challenge classification
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace bms::auth {

//==========================================================================================================
// WwwAuthChallenge
// Purpose: Parsed representation of a single WWW-Authenticate challenge.
//==========================================================================================================
struct WwwAuthChallenge {
    std::string scheme;                                          // lower-case, e.g. "bearer", "basic"
    std::unordered_map<std::string, std::string> params;         // lower-case key -> unquoted value

    std::optional<std::string> param(const std::string& key) const;
};

//==========================================================================================================
// parseWwwAuthenticate
// Purpose: Parse a WWW-Authenticate header value of the form `scheme [key=value[, key=value ...]]`.
//          Values may be tokens or quoted strings with backslash escapes. A token68 credential
//          (e.g. `Negotiate abc==`) is stored under the key "token68".
// Returns:
//   std::nullopt for an empty header or an unterminated quoted string.
//==========================================================================================================
std::optional<WwwAuthChallenge> parseWwwAuthenticate(const std::string& header);

//==========================================================================================================
// isBearerChallenge
// Purpose: True when statusCode is 401 or 403 and the header parses as a Bearer challenge.
//==========================================================================================================
bool isBearerChallenge(int statusCode, const std::string& header);

} // namespace bms::auth
