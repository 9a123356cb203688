//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TokenExpiry.hpp
// Purpose: Advisory, unsigned expiry extraction from JWT-shaped bearer credentials
//==========================================================================================================

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace mcpgw::auth {

using TimePoint = std::chrono::system_clock::time_point;

//==========================================================================================================
// Base64UrlDecode
// Purpose: Decodes base64url text (RFC 4648 section 5); trailing '=' padding is optional.
// Returns:
//   Decoded bytes, or std::nullopt on characters outside the alphabet or an impossible length.
//==========================================================================================================
std::optional<std::string> Base64UrlDecode(const std::string& input);

//==========================================================================================================
// ExtractExpiry
// Purpose: Reads the numeric "exp" claim (seconds since epoch) from a three-segment token.
// Notes:
//   - No signature verification. A result here never authenticates a token; it can only prove that
//     a token is already stale.
//   - Opaque tokens, bad encodings, non-object payloads and missing or non-numeric "exp" all
//     yield std::nullopt.
//==========================================================================================================
std::optional<TimePoint> ExtractExpiry(const std::string& rawToken);

} // namespace mcpgw::auth
