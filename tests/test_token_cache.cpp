//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_token_cache.cpp
// Purpose: Unit tests for the bounded token validation cache
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "TestSupport.hpp"
#include "mcpgw/auth/TokenCache.hpp"

using namespace mcpgw::auth;
using namespace std::chrono_literals;

namespace {

Claims claimsFor(const std::string& sub) {
    Claims c;
    c.subject = sub;
    return c;
}

} // namespace

TEST(TokenCache, LookupReturnsLiveEntry) {
    mcpgw::test::ManualClock clk;
    TokenValidationCache cache(10, [&clk]() { return clk.now; });

    cache.Insert("d1", claimsFor("auth0|1"), clk.now + 60s);
    const CacheEntry* e = cache.Lookup("d1");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->claims.subject, std::string("auth0|1"));
    EXPECT_EQ(e->digest, std::string("d1"));
    EXPECT_EQ(cache.Lookup("missing"), nullptr);
}

TEST(TokenCache, StaleEntryIsRemovedOnLookup) {
    mcpgw::test::ManualClock clk;
    TokenValidationCache cache(10, [&clk]() { return clk.now; });

    cache.Insert("d1", claimsFor("u"), clk.now + 60s);
    clk.Advance(60s);
    // expiresAt <= now counts as stale
    EXPECT_EQ(cache.Lookup("d1"), nullptr);
    EXPECT_EQ(cache.Size(), 0u);
}

TEST(TokenCache, InsertOverwritesExistingDigest) {
    mcpgw::test::ManualClock clk;
    TokenValidationCache cache(10, [&clk]() { return clk.now; });

    cache.Insert("d1", claimsFor("old"), clk.now + 10s);
    cache.Insert("d1", claimsFor("new"), clk.now + 100s);
    EXPECT_EQ(cache.Size(), 1u);
    clk.Advance(50s);
    const CacheEntry* e = cache.Lookup("d1");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->claims.subject, std::string("new"));
}

TEST(TokenCache, EvictsSoonestToExpireAtCapacity) {
    mcpgw::test::ManualClock clk;
    TokenValidationCache cache(2, [&clk]() { return clk.now; });

    cache.Insert("late", claimsFor("a"), clk.now + 300s);
    cache.Insert("soon", claimsFor("b"), clk.now + 30s);
    cache.Insert("mid", claimsFor("c"), clk.now + 120s);

    EXPECT_EQ(cache.Size(), 2u);
    EXPECT_EQ(cache.Lookup("soon"), nullptr);
    EXPECT_NE(cache.Lookup("late"), nullptr);
    EXPECT_NE(cache.Lookup("mid"), nullptr);
}

TEST(TokenCache, NewEntryCanBeTheVictim) {
    mcpgw::test::ManualClock clk;
    TokenValidationCache cache(1, [&clk]() { return clk.now; });

    cache.Insert("long", claimsFor("a"), clk.now + 300s);
    cache.Insert("short", claimsFor("b"), clk.now + 5s);

    EXPECT_EQ(cache.Size(), 1u);
    EXPECT_NE(cache.Lookup("long"), nullptr);
    EXPECT_EQ(cache.Lookup("short"), nullptr);
}

TEST(TokenCache, ZeroCapacityBehavesAsOne) {
    TokenValidationCache cache(0);
    EXPECT_EQ(cache.MaxEntries(), 1u);
}

TEST(TokenCache, InvalidateRemovesEntry) {
    mcpgw::test::ManualClock clk;
    TokenValidationCache cache(10, [&clk]() { return clk.now; });

    cache.Insert("d1", claimsFor("u"), clk.now + 60s);
    cache.Invalidate("d1");
    cache.Invalidate("never-inserted");
    EXPECT_EQ(cache.Lookup("d1"), nullptr);
    EXPECT_EQ(cache.Size(), 0u);
}

TEST(TokenCache, ActiveCountExcludesStaleEntries) {
    mcpgw::test::ManualClock clk;
    TokenValidationCache cache(10, [&clk]() { return clk.now; });

    cache.Insert("a", claimsFor("a"), clk.now + 10s);
    cache.Insert("b", claimsFor("b"), clk.now + 20s);
    cache.Insert("c", claimsFor("c"), clk.now + 30s);
    EXPECT_EQ(cache.ActiveCount(), 3u);

    clk.Advance(15s);
    EXPECT_EQ(cache.Size(), 3u);
    EXPECT_EQ(cache.ActiveCount(), 2u);

    clk.Advance(100s);
    EXPECT_EQ(cache.ActiveCount(), 0u);
}
