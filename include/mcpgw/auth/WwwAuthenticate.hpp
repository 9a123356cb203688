//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WwwAuthenticate.hpp
// Purpose: Build and parse HTTP WWW-Authenticate Bearer challenges (RFC 6750 / RFC 9728 parameters)
//==========================================================================================================

#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mcpgw::auth {

//==========================================================================================================
// WwwAuthChallenge
// Purpose: Parsed representation of a single WWW-Authenticate challenge line.
//==========================================================================================================
struct WwwAuthChallenge {
    std::string scheme;                                          // canonicalized lower-case, e.g. "bearer"
    std::unordered_map<std::string, std::string> params;         // lower-case key -> unquoted value
};

//==========================================================================================================
// BearerChallenge
// Purpose: Parameters the gateway emits on 401 responses.
// Fields:
//   realm: Externally visible gateway URL.
//   resourceMetadata: URL of the protected-resource metadata document.
//   error: RFC 6750 error code (e.g. "invalid_token"); omitted when empty.
//==========================================================================================================
struct BearerChallenge {
    std::string realm;
    std::string resourceMetadata;
    std::string error;
};

//==========================================================================================================
// buildBearerChallenge
// Purpose: Renders `Bearer realm="..."[, error="..."], resource_metadata="..."` with quoted-string escaping.
//==========================================================================================================
std::string buildBearerChallenge(const BearerChallenge& challenge);

//==========================================================================================================
// parseWwwAuthenticate
// Purpose: Parse a single WWW-Authenticate header value with comma-separated key=value parameters
//          (values may be quoted). Returns true on successful parse of a Bearer challenge.
// Notes:
//   - Returns false for other schemes (e.g., Basic) and malformed quoted strings.
//==========================================================================================================
bool parseWwwAuthenticate(const std::string& header, WwwAuthChallenge& out);

} // namespace mcpgw::auth
