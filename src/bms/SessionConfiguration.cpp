//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionConfiguration.cpp
// Purpose: Transport session settings and their semicolon-delimited string form
//==========================================================================================================

#include "bms/SessionConfiguration.hpp"

#include <stdexcept>

#include "logging/Logger.h"
#include "bms/version.h"

namespace bms {

SessionConfiguration::SessionConfiguration()
    : userAgent(std::string("bms-session/") + getVersionString()) {}

static std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) {
        ++b;
    }
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) {
        --e;
    }
    return s.substr(b, e - b);
}

template <typename T>
static void parseUnsigned(const std::string& key, const std::string& val, T& out) {
    try {
        std::size_t used = 0;
        const unsigned long long parsed = std::stoull(val, &used);
        if (used != val.size() || val.find('-') != std::string::npos) {
            throw std::invalid_argument("trailing characters");
        }
        out = static_cast<T>(parsed);
    } catch (const std::exception& e) {
        LOG_WARN("Session config: ignoring {}='{}' ({})", key, val, e.what());
    }
}

static void parseBool(const std::string& key, const std::string& val, bool& out) {
    if (val == "1" || val == "true" || val == "TRUE" || val == "yes") {
        out = true;
    } else if (val == "0" || val == "false" || val == "FALSE" || val == "no") {
        out = false;
    } else {
        LOG_WARN("Session config: ignoring {}='{}' (expected true/false)", key, val);
    }
}

SessionConfiguration parseSessionConfiguration(const std::string& config) {
    SessionConfiguration opts;
    std::size_t start = 0;
    while (start < config.size()) {
        std::size_t sep = config.find(';', start);
        if (sep == std::string::npos) {
            sep = config.size();
        }
        const std::string kv = trim(config.substr(start, sep - start));
        start = sep + 1;
        const std::size_t eq = kv.find('=');
        if (kv.empty() || eq == std::string::npos) {
            continue;
        }
        const std::string key = trim(kv.substr(0, eq));
        const std::string val = trim(kv.substr(eq + 1));
        if (key == "connectTimeoutMs") {
            parseUnsigned(key, val, opts.connectTimeoutMs);
        } else if (key == "readTimeoutMs") {
            parseUnsigned(key, val, opts.readTimeoutMs);
        } else if (key == "caFile") {
            opts.caFile = val;
        } else if (key == "caPath") {
            opts.caPath = val;
        } else if (key == "serverName") {
            opts.serverName = val;
        } else if (key == "verifyPeer") {
            parseBool(key, val, opts.verifyPeer);
        } else if (key == "minTlsVersion") {
            if (val == "1.2" || val == "1.3") {
                opts.minTlsVersion = val;
            } else {
                LOG_WARN("Session config: ignoring minTlsVersion='{}' (expected 1.2 or 1.3)", val);
            }
        } else if (key == "userAgent") {
            opts.userAgent = val;
        } else if (key == "maxResponseBodyBytes") {
            parseUnsigned(key, val, opts.maxResponseBodyBytes);
        } else {
            LOG_DEBUG("Session config: unknown key '{}'", key);
        }
    }
    return opts;
}

} // namespace bms
