//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Version helpers backed by the MCPGW_VERSION_* compile definitions.
//==========================================================================================================
#include "mcpgw/version.h"

#include <fmt/format.h>

#ifndef MCPGW_VERSION_MAJOR
#error "MCPGW_VERSION_MAJOR must be defined by the build"
#endif

namespace mcpgw {

VersionInfo getVersion() {
    return VersionInfo{MCPGW_VERSION_MAJOR, MCPGW_VERSION_MINOR, MCPGW_VERSION_PATCH};
}

std::string getVersionString() {
    const VersionInfo v = getVersion();
    return fmt::format("{}.{}.{}", v.major, v.minor, v.patch);
}

std::string getUserAgent() {
    return fmt::format("mcpgw/{}", getVersionString());
}

} // namespace mcpgw
