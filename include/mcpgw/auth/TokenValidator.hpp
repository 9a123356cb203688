//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TokenValidator.hpp
// Purpose: Bearer credential verification combining local expiry, cache and identity provider
//==========================================================================================================

#pragma once

#include <chrono>
#include <string>

#include <boost/asio/awaitable.hpp>

#include "mcpgw/auth/Claims.hpp"
#include "mcpgw/auth/IdentityProvider.hpp"
#include "mcpgw/auth/TokenCache.hpp"

namespace mcpgw::auth {

//==========================================================================================================
// VerifyResult
// Purpose: Claims | Invalid. reason is for logs only and is never sent to clients.
//==========================================================================================================
struct VerifyResult {
    bool ok{false};
    Claims claims;
    std::string reason;
};

//==========================================================================================================
// TokenValidator
// Purpose: Verify(token) never throws for authentication concerns; every failure path (malformed,
//          locally expired, provider rejection, network error, timeout) resolves to ok=false.
// Notes:
//   - Negative results are not cached.
//   - A locally decoded expiry can only reject a token, never accept one.
//==========================================================================================================
class TokenValidator {
public:
    TokenValidator(TokenValidationCache& cache, IIdentityProvider& provider,
                   std::chrono::seconds ttl, Clock clock = SystemClock());

    boost::asio::awaitable<VerifyResult> Verify(std::string token);

private:
    TokenValidationCache& cache;
    IIdentityProvider& provider;
    std::chrono::seconds ttl;
    Clock clock;
};

} // namespace mcpgw::auth
