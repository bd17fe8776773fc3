//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/bms/analytics/AnalyticsMetadataProvider.hpp
// Purpose: Thread-safe holder of the analytics metadata attached to outgoing requests
//==========================================================================================================
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "bms/analytics/IAnalyticsMetadataProvider.hpp"

namespace bms::analytics {

class AnalyticsMetadataProvider final : public IAnalyticsMetadataProvider {
public:
    AnalyticsMetadataProvider() = default;
    explicit AnalyticsMetadataProvider(std::string metadata);

    std::optional<std::string> currentAnalyticsMetadata() const override;

    void setMetadata(std::string metadata);
    void clear();

    //==========================================================================================================
    // setMetadataFields
    // Purpose: Replaces the metadata with a flat JSON object built from fields, keys in sorted order.
    //          An empty map produces "{}".
    //==========================================================================================================
    void setMetadataFields(const std::map<std::string, std::string>& fields);

    static std::string toJsonObject(const std::map<std::string, std::string>& fields);

private:
    mutable std::mutex mtx;
    std::optional<std::string> metadata;
};

using AnalyticsMetadataProviderImplPtr = std::shared_ptr<AnalyticsMetadataProvider>;

} // namespace bms::analytics
