//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables with defaults.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return defaultValue;
    }
    return std::string(value);
}

//==========================================================================================================
// GetEnvBool
// Purpose: Interprets "1", "true", "TRUE", "yes" as true and "0", "false", "FALSE", "no" as false.
//          Any other value, or an unset variable, yields defaultValue.
//==========================================================================================================
inline bool GetEnvBool(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, std::string());
    if (v == "1" || v == "true" || v == "TRUE" || v == "yes") {
        return true;
    }
    if (v == "0" || v == "false" || v == "FALSE" || v == "no") {
        return false;
    }
    return defaultValue;
}
