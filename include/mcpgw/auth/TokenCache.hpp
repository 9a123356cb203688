//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TokenCache.hpp
// Purpose: Bounded, TTL-limited cache of successful token validations keyed by credential digest
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <unordered_map>

#include "mcpgw/auth/Claims.hpp"
#include "mcpgw/auth/TokenExpiry.hpp"
#include "mcpgw/auth/TokenHasher.hpp"

namespace mcpgw::auth {

// Injectable wall clock; tests substitute a controllable one.
using Clock = std::function<TimePoint()>;

Clock SystemClock();

//==========================================================================================================
// CacheEntry
// Purpose: One cached validation. An entry whose expiresAt is not after now is logically absent.
//==========================================================================================================
struct CacheEntry {
    TokenDigest digest;
    Claims claims;
    TimePoint expiresAt;
};

//==========================================================================================================
// TokenValidationCache
// Purpose: In-memory accelerator in front of the identity provider. Holds at most maxEntries entries;
//          overflow evicts the entries with the smallest expiresAt first (earliest inserted on ties).
// Notes:
//   - Not synchronized. All calls must come from the gateway's single I/O thread.
//   - No operation fails.
//==========================================================================================================
class TokenValidationCache {
public:
    explicit TokenValidationCache(std::size_t maxEntries, Clock clock = SystemClock());

    // Returns the live entry for digest or nullptr. A stale entry is removed as a side effect.
    // The pointer is valid until the next mutating call.
    const CacheEntry* Lookup(const TokenDigest& digest);

    // Stores or overwrites the entry for digest, then evicts down to capacity.
    void Insert(const TokenDigest& digest, Claims claims, TimePoint expiresAt);

    void Invalidate(const TokenDigest& digest);

    // Physical entry count, stale entries included.
    std::size_t Size() const { return entries.size(); }

    // Entries whose expiresAt is still in the future.
    std::size_t ActiveCount() const;

    std::size_t MaxEntries() const { return maxEntries; }

private:
    // Expiry index key: (expiresAt, insertion sequence) so ties evict the earliest insert.
    using ExpiryKey = std::pair<TimePoint, std::uint64_t>;

    struct Slot {
        CacheEntry entry;
        ExpiryKey indexKey;
    };

    void erase(std::unordered_map<TokenDigest, Slot>::iterator it);

    std::size_t maxEntries;
    Clock clock;
    std::uint64_t nextSeq{0};
    std::unordered_map<TokenDigest, Slot> entries;
    std::map<ExpiryKey, TokenDigest> byExpiry;
};

} // namespace mcpgw::auth
