//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_token_expiry.cpp
// Purpose: Unit tests for base64url decoding and unverified exp extraction
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "TestSupport.hpp"
#include "mcpgw/auth/TokenExpiry.hpp"

using namespace mcpgw::auth;
using mcpgw::test::Base64UrlEncode;
using mcpgw::test::MakeJwt;
using mcpgw::test::MakeJwtWithExp;

TEST(TokenExpiry, Base64UrlDecodeUnpadded) {
    auto v = Base64UrlDecode("aGVsbG8");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v.value(), std::string("hello"));
}

TEST(TokenExpiry, Base64UrlDecodeUrlAlphabet) {
    const std::string raw("\xfb\xff", 2);
    const std::string enc = Base64UrlEncode(raw);
    EXPECT_EQ(enc, std::string("-_8"));
    auto v = Base64UrlDecode(enc);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v.value(), raw);
}

TEST(TokenExpiry, Base64UrlDecodeAcceptsPadding) {
    auto v = Base64UrlDecode("aGk=");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v.value(), std::string("hi"));
}

TEST(TokenExpiry, Base64UrlDecodeRejectsMalformed) {
    EXPECT_FALSE(Base64UrlDecode("a").has_value());
    EXPECT_FALSE(Base64UrlDecode("ab+c").has_value());
    EXPECT_FALSE(Base64UrlDecode("ab/c").has_value());
    EXPECT_FALSE(Base64UrlDecode("ab*c").has_value());
}

TEST(TokenExpiry, ExtractsExpFromPayload) {
    auto tp = ExtractExpiry(MakeJwtWithExp(1700000000));
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(mcpgw::test::ToUnixSeconds(tp.value()), 1700000000);
}

TEST(TokenExpiry, FractionalExpKeepsMilliseconds) {
    auto tp = ExtractExpiry(MakeJwt("{\"exp\":1700000000.5}"));
    ASSERT_TRUE(tp.has_value());
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp->time_since_epoch()).count();
    EXPECT_EQ(ms, 1700000000500LL);
}

TEST(TokenExpiry, FarFutureExpSaturates) {
    // 9999999999 is past the year 2262 limit of a nanosecond system_clock
    auto tp = ExtractExpiry(MakeJwtWithExp(9999999999));
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(tp.value(), mcpgw::auth::TimePoint::max());
    EXPECT_GT(tp.value(), std::chrono::system_clock::now());

    auto huge = ExtractExpiry(MakeJwt("{\"exp\":1e300}"));
    ASSERT_TRUE(huge.has_value());
    EXPECT_EQ(huge.value(), mcpgw::auth::TimePoint::max());

    auto ancient = ExtractExpiry(MakeJwt("{\"exp\":-1e300}"));
    ASSERT_TRUE(ancient.has_value());
    EXPECT_EQ(ancient.value(), mcpgw::auth::TimePoint::min());
}

TEST(TokenExpiry, OpaqueTokensHaveNoExpiry) {
    EXPECT_FALSE(ExtractExpiry("tokA").has_value());
    EXPECT_FALSE(ExtractExpiry("").has_value());
    EXPECT_FALSE(ExtractExpiry("a.b").has_value());
    EXPECT_FALSE(ExtractExpiry("a.b.c.d").has_value());
}

TEST(TokenExpiry, UnusablePayloadsHaveNoExpiry) {
    // Payload is not JSON
    EXPECT_FALSE(ExtractExpiry(std::string("x.") + Base64UrlEncode("not json") + ".y").has_value());
    // exp missing
    EXPECT_FALSE(ExtractExpiry(MakeJwt("{\"sub\":\"u\"}")).has_value());
    // exp not numeric
    EXPECT_FALSE(ExtractExpiry(MakeJwt("{\"exp\":\"soon\"}")).has_value());
    // Payload is not an object
    EXPECT_FALSE(ExtractExpiry(MakeJwt("[1,2,3]")).has_value());
    // Payload segment is not base64url
    EXPECT_FALSE(ExtractExpiry("x.@@@@.y").has_value());
}
