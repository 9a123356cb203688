//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_token_validator.cpp
// Purpose: Unit tests for token verification: caching, TTL, local expiry and provider failures
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include <boost/asio/io_context.hpp>

#include "TestSupport.hpp"
#include "logging/Logger.h"
#include "mcpgw/auth/TokenHasher.hpp"
#include "mcpgw/auth/TokenValidator.hpp"

using namespace mcpgw::auth;
using namespace std::chrono_literals;
using mcpgw::test::ManualClock;
using mcpgw::test::RunAwaitable;
using mcpgw::test::StubIdentityProvider;

namespace {

//==========================================================================================================
// ValidatorFixture
// Purpose: Cache + stub provider + validator sharing one manual clock (ttl 120s, capacity 1000).
//==========================================================================================================
class ValidatorFixture : public ::testing::Test {
protected:
    ValidatorFixture()
        : cache(1000, [this]() { return clk.now; }),
          validator(cache, provider, 120s, [this]() { return clk.now; }) {}

    VerifyResult verify(const std::string& token) {
        return RunAwaitable(ioc, validator.Verify(token));
    }

    boost::asio::io_context ioc;
    ManualClock clk;
    StubIdentityProvider provider;
    TokenValidationCache cache;
    TokenValidator validator;
};

} // namespace

TEST_F(ValidatorFixture, FirstUseCallsProviderThenCacheServes) {
    provider.Accept("tokA", "auth0|alice", std::string("alice@example.com"));

    VerifyResult r1 = verify("tokA");
    ASSERT_TRUE(r1.ok);
    EXPECT_EQ(r1.claims.subject, std::string("auth0|alice"));
    ASSERT_TRUE(r1.claims.email.has_value());
    EXPECT_EQ(r1.claims.email.value(), std::string("alice@example.com"));
    EXPECT_EQ(provider.calls, 1);
    EXPECT_EQ(cache.Size(), 1u);

    clk.Advance(10s);
    VerifyResult r2 = verify("tokA");
    ASSERT_TRUE(r2.ok);
    EXPECT_EQ(r2.claims.subject, std::string("auth0|alice"));
    EXPECT_EQ(provider.calls, 1);
}

TEST_F(ValidatorFixture, CachedClaimsExpireAfterTtl) {
    provider.Accept("tokA", "auth0|alice");
    ASSERT_TRUE(verify("tokA").ok);
    EXPECT_EQ(provider.calls, 1);

    clk.Advance(119s);
    ASSERT_TRUE(verify("tokA").ok);
    EXPECT_EQ(provider.calls, 1);

    clk.Advance(1s);
    ASSERT_TRUE(verify("tokA").ok);
    EXPECT_EQ(provider.calls, 2);
}

TEST_F(ValidatorFixture, RejectionsAreNotCached) {
    VerifyResult r1 = verify("unknown-token");
    EXPECT_FALSE(r1.ok);
    EXPECT_FALSE(r1.reason.empty());
    VerifyResult r2 = verify("unknown-token");
    EXPECT_FALSE(r2.ok);
    EXPECT_EQ(provider.calls, 2);
    EXPECT_EQ(cache.Size(), 0u);
}

TEST_F(ValidatorFixture, BlankTokenNeverReachesProvider) {
    EXPECT_FALSE(verify("").ok);
    EXPECT_FALSE(verify("   ").ok);
    EXPECT_EQ(provider.calls, 0);
}

TEST_F(ValidatorFixture, LocallyExpiredTokenRejectedWithoutProvider) {
    const std::string token = mcpgw::test::MakeJwtWithExp(mcpgw::test::ToUnixSeconds(clk.now) - 5);
    provider.Accept(token, "auth0|late");

    VerifyResult r = verify(token);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(provider.calls, 0);
    EXPECT_EQ(cache.Size(), 0u);
}

TEST_F(ValidatorFixture, CacheEntryBoundedByTokenExpiry) {
    const std::string token = mcpgw::test::MakeJwtWithExp(mcpgw::test::ToUnixSeconds(clk.now) + 30);
    provider.Accept(token, "auth0|short");

    ASSERT_TRUE(verify(token).ok);
    const CacheEntry* e = cache.Lookup(Digest(token));
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(mcpgw::test::ToUnixSeconds(e->expiresAt), mcpgw::test::ToUnixSeconds(clk.now) + 30);

    // Past exp the token is refused locally and its entry is dropped, even though the TTL has not elapsed
    clk.Advance(31s);
    EXPECT_FALSE(verify(token).ok);
    EXPECT_EQ(provider.calls, 1);
    EXPECT_EQ(cache.Size(), 0u);
}

TEST_F(ValidatorFixture, TokenWithDistantExpiryUsesTtl) {
    const std::string token = mcpgw::test::MakeJwtWithExp(mcpgw::test::ToUnixSeconds(clk.now) + 3600);
    provider.Accept(token, "auth0|long");

    ASSERT_TRUE(verify(token).ok);
    const CacheEntry* e = cache.Lookup(Digest(token));
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(mcpgw::test::ToUnixSeconds(e->expiresAt), mcpgw::test::ToUnixSeconds(clk.now) + 120);
}

TEST_F(ValidatorFixture, NeverExpiringTokenReachesProvider) {
    const std::string token = mcpgw::test::MakeJwtWithExp(9999999999);
    provider.Accept(token, "auth0|forever");

    VerifyResult r = verify(token);
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.claims.subject, std::string("auth0|forever"));
    EXPECT_EQ(provider.calls, 1);
    const CacheEntry* e = cache.Lookup(Digest(token));
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(mcpgw::test::ToUnixSeconds(e->expiresAt), mcpgw::test::ToUnixSeconds(clk.now) + 120);
}

TEST_F(ValidatorFixture, ProviderFailureResolvesToRejection) {
    provider.Accept("tokA", "auth0|alice");
    provider.throwOnCall = true;

    VerifyResult r;
    ASSERT_NO_THROW({ r = verify("tokA"); });
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(cache.Size(), 0u);

    provider.throwOnCall = false;
    EXPECT_TRUE(verify("tokA").ok);
    EXPECT_EQ(provider.calls, 2);
}

TEST_F(ValidatorFixture, RawTokenNeverLogged) {
    const std::string secret = "very-secret-bearer-value-123";
    const std::string logPath = ::testing::TempDir() + "mcpgw_validator_log.txt";
    std::remove(logPath.c_str());

    const LogLevel saved = Logger::sLogLevel;
    Logger::setLogLevel(LogLevel::LOG_DEBUG_LEVEL);
    ASSERT_TRUE(Logger::setLogFile(logPath));

    provider.Accept(secret, "auth0|alice");
    (void)verify(secret);
    (void)verify(secret);
    (void)verify("another-secret-credential");

    Logger::setLogFile("");
    Logger::setLogLevel(saved);

    std::ifstream in(logPath);
    std::stringstream ss;
    ss << in.rdbuf();
    const std::string logged = ss.str();
    EXPECT_NE(logged.find(DigestPrefix(Digest(secret))), std::string::npos);
    EXPECT_EQ(logged.find(secret), std::string::npos);
    EXPECT_EQ(logged.find("another-secret-credential"), std::string::npos);
    std::remove(logPath.c_str());
}
