//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/bms/analytics/IAnalyticsMetadataProvider.hpp
// Purpose: Source of the analytics metadata attached to outgoing requests
//==========================================================================================================
#pragma once

#include <memory>
#include <optional>
#include <string>

namespace bms::analytics {

class IAnalyticsMetadataProvider {
public:
    virtual ~IAnalyticsMetadataProvider() = default;

    // Metadata string for the next request, or nullopt when no metadata is available
    virtual std::optional<std::string> currentAnalyticsMetadata() const = 0;
};

using AnalyticsMetadataProviderPtr = std::shared_ptr<IAnalyticsMetadataProvider>;

} // namespace bms::analytics
