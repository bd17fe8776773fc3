//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/bms/analytics/AnalyticsMetadataProvider.cpp
// Purpose: Thread-safe holder of the analytics metadata attached to outgoing requests
//==========================================================================================================

#include "bms/analytics/AnalyticsMetadataProvider.hpp"

#include <utility>

namespace bms::analytics {

namespace {

void appendJsonString(std::string& out, const std::string& s) {
    static const char* hex = "0123456789abcdef";
    out.push_back('"');
    for (unsigned char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (c < 0x20) {
                    out += "\\u00";
                    out.push_back(hex[(c >> 4) & 0xFu]);
                    out.push_back(hex[c & 0xFu]);
                } else {
                    out.push_back(static_cast<char>(c));
                }
                break;
        }
    }
    out.push_back('"');
}

} // namespace

AnalyticsMetadataProvider::AnalyticsMetadataProvider(std::string metadata)
    : metadata(std::move(metadata)) {}

std::optional<std::string> AnalyticsMetadataProvider::currentAnalyticsMetadata() const {
    std::lock_guard<std::mutex> lk(mtx);
    return metadata;
}

void AnalyticsMetadataProvider::setMetadata(std::string value) {
    std::lock_guard<std::mutex> lk(mtx);
    metadata = std::move(value);
}

void AnalyticsMetadataProvider::clear() {
    std::lock_guard<std::mutex> lk(mtx);
    metadata.reset();
}

void AnalyticsMetadataProvider::setMetadataFields(const std::map<std::string, std::string>& fields) {
    setMetadata(toJsonObject(fields));
}

std::string AnalyticsMetadataProvider::toJsonObject(const std::map<std::string, std::string>& fields) {
    std::string out = "{";
    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) {
            out.push_back(',');
        }
        first = false;
        appendJsonString(out, key);
        out.push_back(':');
        appendJsonString(out, value);
    }
    out.push_back('}');
    return out;
}

} // namespace bms::analytics
