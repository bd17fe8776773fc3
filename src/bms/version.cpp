//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Implements version helpers returning semantic version string.
//==========================================================================================================
#include "bms/version.h"

#include <sstream>

namespace bms {

VersionInfo getVersion() {
    return VersionInfo{1, 0, 0};
}

std::string getVersionString() {
    const auto v = getVersion();
    std::ostringstream oss;
    oss << v.major << "." << v.minor << "." << v.patch;
    return oss.str();
}

} // namespace bms
