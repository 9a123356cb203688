//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Gateway version, taken from the CMake project version at build time.
//==========================================================================================================
#pragma once

#include <string>

namespace mcpgw {

struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

// "MAJOR.MINOR.PATCH"; also advertised as serverInfo.version.
std::string getVersionString();

// "mcpgw/MAJOR.MINOR.PATCH", sent as User-Agent on identity provider calls.
std::string getUserAgent();

} // namespace mcpgw
