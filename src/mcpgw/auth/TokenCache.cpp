//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/auth/TokenCache.cpp
// Purpose: Token validation cache with lazy expiry and min-expiry eviction
//==========================================================================================================

#include <utility>

#include "logging/Logger.h"
#include "mcpgw/auth/TokenCache.hpp"

namespace mcpgw::auth {

Clock SystemClock() {
    return []() { return std::chrono::system_clock::now(); };
}

TokenValidationCache::TokenValidationCache(std::size_t maxEntries, Clock clock)
    : maxEntries(maxEntries == 0 ? 1 : maxEntries), clock(std::move(clock)) {
}

void TokenValidationCache::erase(std::unordered_map<TokenDigest, Slot>::iterator it) {
    byExpiry.erase(it->second.indexKey);
    entries.erase(it);
}

const CacheEntry* TokenValidationCache::Lookup(const TokenDigest& digest) {
    auto it = entries.find(digest);
    if (it == entries.end()) {
        return nullptr;
    }
    if (it->second.entry.expiresAt <= clock()) {
        LOG_DEBUG("TokenCache: dropping stale entry {}", DigestPrefix(digest));
        erase(it);
        return nullptr;
    }
    return &it->second.entry;
}

void TokenValidationCache::Insert(const TokenDigest& digest, Claims claims, TimePoint expiresAt) {
    auto existing = entries.find(digest);
    if (existing != entries.end()) {
        erase(existing);
    }

    const ExpiryKey key{expiresAt, nextSeq++};
    Slot slot{CacheEntry{digest, std::move(claims), expiresAt}, key};
    entries.emplace(digest, std::move(slot));
    byExpiry.emplace(key, digest);

    while (entries.size() > maxEntries && !byExpiry.empty()) {
        auto victim = byExpiry.begin();
        LOG_DEBUG("TokenCache: capacity {} reached; evicting {}", maxEntries, DigestPrefix(victim->second));
        auto victimIt = entries.find(victim->second);
        if (victimIt == entries.end()) {
            byExpiry.erase(victim);
            continue;
        }
        erase(victimIt);
    }
}

void TokenValidationCache::Invalidate(const TokenDigest& digest) {
    auto it = entries.find(digest);
    if (it != entries.end()) {
        erase(it);
    }
}

std::size_t TokenValidationCache::ActiveCount() const {
    const TimePoint now = clock();
    // byExpiry is ordered by expiresAt, so every entry after the first live one is live too
    std::size_t active = 0;
    for (auto it = byExpiry.rbegin(); it != byExpiry.rend(); ++it) {
        if (it->first.first <= now) {
            break;
        }
        ++active;
    }
    return active;
}

} // namespace mcpgw::auth
