//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpTypes.cpp
// Purpose: Header map operations and URL splitting
//==========================================================================================================

#include "bms/HttpTypes.h"

#include <algorithm>
#include <cctype>

namespace bms {

static std::string toLower(std::string s) {
    for (std::size_t i = 0; i < s.size(); ++i) {
        s[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(s[i])));
    }
    return s;
}

bool headerNameEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

HttpHeaders::HttpHeaders(std::initializer_list<HeaderKV> init) {
    for (const auto& kv : init) {
        set(kv.name, kv.value);
    }
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    erase(name);
    entries_.push_back(HeaderKV{name, value});
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    entries_.push_back(HeaderKV{name, value});
}

bool HttpHeaders::erase(const std::string& name) {
    const auto before = entries_.size();
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&](const HeaderKV& kv) { return headerNameEquals(kv.name, name); }),
                   entries_.end());
    return entries_.size() != before;
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    for (const auto& kv : entries_) {
        if (headerNameEquals(kv.name, name)) {
            return kv.value;
        }
    }
    return std::nullopt;
}

bool HttpHeaders::contains(const std::string& name) const {
    return get(name).has_value();
}

bool HttpHeaders::operator==(const HttpHeaders& other) const {
    if (entries_.size() != other.entries_.size()) {
        return false;
    }
    auto normalized = [](const std::vector<HeaderKV>& in) {
        std::vector<std::pair<std::string, std::string>> out;
        out.reserve(in.size());
        for (const auto& kv : in) {
            out.emplace_back(toLower(kv.name), kv.value);
        }
        std::sort(out.begin(), out.end());
        return out;
    };
    return normalized(entries_) == normalized(other.entries_);
}

std::string UrlParts::hostHeader() const {
    const bool defaultPort = (scheme == "https" && port == "443") || (scheme == "http" && port == "80");
    return defaultPort ? host : host + ":" + port;
}

std::optional<UrlParts> parseUrl(const std::string& url) {
    UrlParts parts;

    const std::size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return std::nullopt;
    }
    parts.scheme = toLower(url.substr(0, schemeEnd));
    if (parts.scheme != "http" && parts.scheme != "https") {
        return std::nullopt;
    }
    const std::size_t pos = schemeEnd + 3;

    // Authority ends at the first '/', '?' or '#'
    const std::size_t authorityEnd = url.find_first_of("/?#", pos);
    std::string hostPort = url.substr(pos, authorityEnd == std::string::npos ? std::string::npos : authorityEnd - pos);

    std::string target = authorityEnd == std::string::npos ? std::string() : url.substr(authorityEnd);
    const std::size_t fragment = target.find('#');
    if (fragment != std::string::npos) {
        target.erase(fragment);
    }
    if (target.empty() || target[0] != '/') {
        target.insert(0, "/");
    }
    parts.target = target;

    const std::size_t colon = hostPort.rfind(':');
    if (colon == std::string::npos) {
        parts.host = hostPort;
        parts.port = parts.scheme == "https" ? std::string("443") : std::string("80");
    } else {
        parts.host = hostPort.substr(0, colon);
        parts.port = hostPort.substr(colon + 1);
        if (parts.port.empty() ||
            !std::all_of(parts.port.begin(), parts.port.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::nullopt;
        }
    }
    if (parts.host.empty()) {
        return std::nullopt;
    }
    return parts;
}

} // namespace bms
