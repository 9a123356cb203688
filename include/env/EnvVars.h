//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Cross-platform helpers to read environment variables safely.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <cstdint>
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
    return std::getenv(name) ? std::string(std::getenv(name)) : defaultValue;
}

//==========================================================================================================
// GetEnvUnsigned
// Purpose: Reads an environment variable as an unsigned decimal integer.
// Returns:
//   std::nullopt when unset or empty; otherwise the parsed value. Sets *malformed when the value is
//   present but not a plain decimal number that fits in 64 bits.
//==========================================================================================================
inline std::optional<std::uint64_t> GetEnvUnsigned(const char* name, bool* malformed = nullptr) {
    if (malformed != nullptr) {
        *malformed = false;
    }
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (char c : raw) {
        if (c < '0' || c > '9') {
            if (malformed != nullptr) { *malformed = true; }
            return std::nullopt;
        }
        const std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (value > (UINT64_MAX - digit) / 10u) {
            if (malformed != nullptr) { *malformed = true; }
            return std::nullopt;
        }
        value = value * 10u + digit;
    }
    return value;
}
