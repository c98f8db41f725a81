//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read DTMCP_* and process environment variables.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <optional>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
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
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// GetEnvOptional
// Purpose: Returns the variable's value when it is set and non-empty.
//==========================================================================================================
inline std::optional<std::string> GetEnvOptional(const char* name) {
    std::string v = GetEnvOrDefault(name, std::string());
    if (v.empty()) {
        return std::nullopt;
    }
    return v;
}

// "1", "true" and "TRUE" count as enabled; anything else (or unset) yields defaultValue when unset.
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    auto v = GetEnvOptional(name);
    if (!v.has_value()) {
        return defaultValue;
    }
    return (*v == "1" || *v == "true" || *v == "TRUE");
}
