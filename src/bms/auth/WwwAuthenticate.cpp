//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WwwAuthenticate.cpp
// Purpose: Parser for HTTP WWW-Authenticate challenges and Bearer challenge classification
//==========================================================================================================

#include "bms/auth/WwwAuthenticate.hpp"

#include <cctype>

namespace bms::auth {

static std::string toLower(std::string s) {
    for (size_t i = 0; i < s.size(); ++i) {
        s[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(s[i])));
    }
    return s;
}

static bool isSpace(char ch) {
    return ch == ' ' || ch == '\t';
}

static void skipSpaces(const std::string& s, size_t& i) {
    while (i < s.size() && isSpace(s[i])) {
        ++i;
    }
}

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && isSpace(s[b])) {
        ++b;
    }
    while (e > b && isSpace(s[e - 1])) {
        --e;
    }
    return s.substr(b, e - b);
}

static bool parseToken(const std::string& s, size_t& i, std::string& out) {
    size_t start = i;
    while (i < s.size()) {
        char ch = s[i];
        if (isSpace(ch) || ch == '=' || ch == ',' || ch == '"') {
            break;
        }
        ++i;
    }
    if (i == start) {
        return false;
    }
    out = s.substr(start, i - start);
    return true;
}

static bool parseQuotedString(const std::string& s, size_t& i, std::string& out) {
    out.clear();
    ++i; // opening quote
    while (i < s.size()) {
        char ch = s[i];
        if (ch == '\\') {
            if ((i + 1) >= s.size()) {
                return false;
            }
            out.push_back(s[i + 1]);
            i += 2;
            continue;
        }
        if (ch == '"') {
            ++i;
            return true;
        }
        out.push_back(ch);
        ++i;
    }
    return false; // unterminated
}

// token68 = 1*( ALPHA / DIGIT / "-" / "." / "_" / "~" / "+" / "/" ) *"="
static bool isToken68(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        unsigned char ch = static_cast<unsigned char>(s[i]);
        if (std::isalnum(ch) || ch == '-' || ch == '.' || ch == '_' || ch == '~' || ch == '+' || ch == '/') {
            ++i;
            continue;
        }
        break;
    }
    if (i == 0) {
        return false;
    }
    while (i < s.size() && s[i] == '=') {
        ++i;
    }
    return i == s.size();
}

std::optional<std::string> WwwAuthChallenge::param(const std::string& key) const {
    auto it = params.find(toLower(key));
    if (it == params.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<WwwAuthChallenge> parseWwwAuthenticate(const std::string& header) {
    WwwAuthChallenge out;

    size_t i = 0;
    skipSpaces(header, i);

    std::string scheme;
    if (!parseToken(header, i, scheme)) {
        return std::nullopt;
    }
    out.scheme = toLower(scheme);

    const std::string rest = trim(header.substr(i));
    if (rest.empty()) {
        return out;
    }
    if (isToken68(rest)) {
        out.params["token68"] = rest;
        return out;
    }

    // auth-param list: key[=value][, key[=value] ...]
    while (i < header.size()) {
        skipSpaces(header, i);
        if (i < header.size() && header[i] == ',') {
            ++i;
            continue;
        }
        if (i >= header.size()) {
            break;
        }

        std::string key;
        if (!parseToken(header, i, key)) {
            break;
        }
        key = toLower(key);

        skipSpaces(header, i);
        if (i >= header.size() || header[i] != '=') {
            out.params[key] = std::string();
            continue;
        }
        ++i; // '='
        skipSpaces(header, i);

        std::string value;
        if (i < header.size() && header[i] == '"') {
            if (!parseQuotedString(header, i, value)) {
                return std::nullopt;
            }
        } else {
            size_t vstart = i;
            while (i < header.size() && header[i] != ',') {
                ++i;
            }
            value = trim(header.substr(vstart, i - vstart));
        }
        out.params[key] = value;
    }

    return out;
}

bool isBearerChallenge(int statusCode, const std::string& header) {
    if (statusCode != 401 && statusCode != 403) {
        return false;
    }
    auto challenge = parseWwwAuthenticate(header);
    return challenge.has_value() && challenge->scheme == "bearer";
}

} // namespace bms::auth
