//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TokenHasher.hpp
// Purpose: One-way digest of bearer credentials used as token cache keys
//==========================================================================================================

#pragma once

#include <string>

namespace mcpgw::auth {

// 64-character lowercase hex SHA-256 of a raw credential.
using TokenDigest = std::string;

//==========================================================================================================
// Digest
// Purpose: Computes the SHA-256 digest of rawToken and renders it as lowercase hex.
// Args:
//   rawToken: Credential text. Callers reject empty credentials before hashing.
// Returns:
//   TokenDigest (64 hex characters).
// Throws:
//   std::runtime_error if the OpenSSL digest primitive fails.
//==========================================================================================================
TokenDigest Digest(const std::string& rawToken);

// First 8 hex characters of a digest, for log correlation only.
std::string DigestPrefix(const TokenDigest& digest);

} // namespace mcpgw::auth
