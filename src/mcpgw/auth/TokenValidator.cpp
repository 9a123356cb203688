//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/auth/TokenValidator.cpp
// Purpose: Token verification pipeline
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <optional>
#include <utility>

#include "logging/Logger.h"
#include "mcpgw/errors/Errors.h"
#include "mcpgw/auth/TokenExpiry.hpp"
#include "mcpgw/auth/TokenHasher.hpp"
#include "mcpgw/auth/TokenValidator.hpp"

namespace mcpgw::auth {

namespace {
    bool isBlank(const std::string& s) {
        return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    }
}

TokenValidator::TokenValidator(TokenValidationCache& cache, IIdentityProvider& provider,
                               std::chrono::seconds ttl, Clock clock)
    : cache(cache), provider(provider), ttl(ttl), clock(std::move(clock)) {
}

boost::asio::awaitable<VerifyResult> TokenValidator::Verify(std::string token) {
    VerifyResult r;
    if (isBlank(token)) {
        r.reason = "empty credential";
        co_return r;
    }

    const TokenDigest digest = Digest(token);
    const std::string tag = DigestPrefix(digest);

    const std::optional<TimePoint> tokenExpiry = ExtractExpiry(token);
    if (tokenExpiry.has_value() && tokenExpiry.value() <= clock()) {
        cache.Invalidate(digest);
        r.reason = "token expired";
        LOG_DEBUG("TokenValidator: {} rejected locally (expired)", tag);
        co_return r;
    }

    if (const CacheEntry* hit = cache.Lookup(digest)) {
        r.ok = true;
        r.claims = hit->claims;
        LOG_DEBUG("TokenValidator: {} cache hit (sub={})", tag, r.claims.subject);
        co_return r;
    }

    ProviderResult pr;
    try {
        pr = co_await provider.FetchClaims(token);
    } catch (const std::exception& e) {
        pr.ok = false;
        pr.httpStatus = 0;
        pr.error = e.what();
    }
    if (!pr.ok && pr.httpStatus == 0) {
        // No provider answer at all; reported to the caller as an ordinary rejection
        LOG_WARN("TokenValidator: {} {}: {}", tag,
                 errors::categoryName(errors::ErrorCategory::UpstreamFailure), pr.error);
    }

    if (!pr.ok) {
        r.reason = pr.error.empty() ? std::string("rejected by identity provider") : pr.error;
        LOG_INFO("TokenValidator: {} rejected (status={})", tag, pr.httpStatus);
        co_return r;
    }

    // Re-read the clock: the provider round trip may have taken a while
    const TimePoint now = clock();
    TimePoint expiresAt = now + ttl;
    if (tokenExpiry.has_value()) {
        expiresAt = std::min(expiresAt, tokenExpiry.value());
    }
    cache.Insert(digest, pr.claims, expiresAt);
    LOG_INFO("TokenValidator: {} verified (sub={})", tag, pr.claims.subject);

    r.ok = true;
    r.claims = std::move(pr.claims);
    co_return r;
}

} // namespace mcpgw::auth
