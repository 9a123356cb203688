//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_auth_gate.cpp
// Purpose: Unit tests for the bearer authentication middleware
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include <boost/asio/io_context.hpp>

#include "TestSupport.hpp"
#include "mcpgw/auth/AuthGate.hpp"
#include "mcpgw/auth/Claims.hpp"

using namespace mcpgw;
using namespace mcpgw::auth;
using namespace std::chrono_literals;
namespace http = boost::beast::http;
using mcpgw::test::MakeRequest;
using mcpgw::test::RunAwaitable;

namespace {

class AuthGateFixture : public ::testing::Test {
protected:
    AuthGateFixture() : cache(100), validator(cache, provider, 120s) {
        provider.Accept("good-token", "auth0|alice", std::string("alice@example.com"));
    }

    AuthGateOptions configuredOptions() const {
        AuthGateOptions o;
        o.identityProviderConfigured = true;
        o.realm = "https://gw.example.com";
        o.resourceMetadataUrl = "https://gw.example.com/.well-known/oauth-protected-resource";
        return o;
    }

    AuthDecision check(AuthGate& gate, const HttpRequest& req) {
        return RunAwaitable(ioc, gate.Check(req, "127.0.0.1:5555"));
    }

    static std::string header(const HttpResponse& res, http::field f) {
        auto it = res.find(f);
        return it == res.end() ? std::string() : std::string(it->value());
    }

    boost::asio::io_context ioc;
    mcpgw::test::StubIdentityProvider provider;
    TokenValidationCache cache;
    TokenValidator validator;
};

} // namespace

TEST_F(AuthGateFixture, ValidTokenAuthenticates) {
    AuthGate gate(validator, configuredOptions());
    auto req = MakeRequest(http::verb::post, "/mcp", "{}", {{"Authorization", "Bearer good-token"}});
    AuthDecision d = check(gate, req);
    ASSERT_EQ(d.outcome, AuthDecision::Outcome::Authenticated);
    ASSERT_TRUE(d.claims.has_value());
    EXPECT_EQ(d.claims->subject, std::string("auth0|alice"));
    EXPECT_FALSE(d.response.has_value());
}

TEST_F(AuthGateFixture, MissingTokenAnswers401WithChallenge) {
    AuthGate gate(validator, configuredOptions());
    auto req = MakeRequest(http::verb::post, "/mcp", "{}");
    AuthDecision d = check(gate, req);
    ASSERT_EQ(d.outcome, AuthDecision::Outcome::Rejected);
    EXPECT_EQ(d.category, errors::ErrorCategory::AuthenticationFailure);
    ASSERT_TRUE(d.response.has_value());
    EXPECT_EQ(d.response->result_int(), 401u);
    EXPECT_EQ(d.response->body(), std::string("Unauthorized - No token"));
    const std::string www = header(*d.response, http::field::www_authenticate);
    EXPECT_NE(www.find("realm=\"https://gw.example.com\""), std::string::npos);
    EXPECT_NE(www.find("resource_metadata=\"https://gw.example.com/.well-known/oauth-protected-resource\""), std::string::npos);
    EXPECT_EQ(www.find("error="), std::string::npos);
    EXPECT_EQ(provider.calls, 0);
}

TEST_F(AuthGateFixture, InvalidTokenAnswers401WithInvalidTokenError) {
    AuthGate gate(validator, configuredOptions());
    auto req = MakeRequest(http::verb::post, "/mcp", "{}", {{"Authorization", "Bearer nope"}});
    AuthDecision d = check(gate, req);
    ASSERT_EQ(d.outcome, AuthDecision::Outcome::Rejected);
    ASSERT_TRUE(d.response.has_value());
    EXPECT_EQ(d.response->result_int(), 401u);
    EXPECT_EQ(d.response->body(), std::string("Unauthorized"));
    EXPECT_NE(header(*d.response, http::field::www_authenticate).find("error=\"invalid_token\""), std::string::npos);
}

TEST_F(AuthGateFixture, OtherSchemesCountAsNoToken) {
    AuthGate gate(validator, configuredOptions());
    auto req = MakeRequest(http::verb::post, "/mcp", "{}", {{"Authorization", "Basic Zm9vOmJhcg=="}});
    AuthDecision d = check(gate, req);
    ASSERT_EQ(d.outcome, AuthDecision::Outcome::Rejected);
    EXPECT_EQ(d.response->body(), std::string("Unauthorized - No token"));
}

TEST_F(AuthGateFixture, UnconfiguredProviderAnswers500) {
    AuthGateOptions o = configuredOptions();
    o.identityProviderConfigured = false;
    AuthGate gate(validator, o);
    auto req = MakeRequest(http::verb::post, "/mcp", "{}", {{"Authorization", "Bearer good-token"}});
    AuthDecision d = check(gate, req);
    ASSERT_EQ(d.outcome, AuthDecision::Outcome::Rejected);
    EXPECT_EQ(d.category, errors::ErrorCategory::ConfigurationFault);
    EXPECT_EQ(d.response->result_int(), 500u);
    EXPECT_EQ(d.response->body(), std::string("Server misconfigured"));
    EXPECT_EQ(provider.calls, 0);
}

TEST_F(AuthGateFixture, ExemptRoutesNeedNoToken) {
    AuthGateOptions o = configuredOptions();
    o.identityProviderConfigured = false;
    AuthGate gate(validator, o);

    EXPECT_EQ(check(gate, MakeRequest(http::verb::get, "/health")).outcome, AuthDecision::Outcome::Allowed);
    EXPECT_EQ(check(gate, MakeRequest(http::verb::get, "/.well-known/oauth-protected-resource")).outcome,
              AuthDecision::Outcome::Allowed);
    EXPECT_EQ(check(gate, MakeRequest(http::verb::options, "/mcp")).outcome, AuthDecision::Outcome::Allowed);
    EXPECT_EQ(check(gate, MakeRequest(http::verb::get, "/health?verbose=1")).outcome, AuthDecision::Outcome::Allowed);
}

TEST_F(AuthGateFixture, PathsOutsideProtectedPrefixAreAllowed) {
    AuthGate gate(validator, configuredOptions());
    EXPECT_EQ(check(gate, MakeRequest(http::verb::get, "/other")).outcome, AuthDecision::Outcome::Allowed);
    EXPECT_EQ(check(gate, MakeRequest(http::verb::post, "/mcp/extra")).outcome, AuthDecision::Outcome::Rejected);
}

TEST(AuthGateExtractBearer, SchemeAndWhitespaceHandling) {
    EXPECT_EQ(AuthGate::ExtractBearer("Bearer abc").value_or(""), std::string("abc"));
    EXPECT_EQ(AuthGate::ExtractBearer("bearer abc").value_or(""), std::string("abc"));
    EXPECT_EQ(AuthGate::ExtractBearer("BEARER   abc  ").value_or(""), std::string("abc"));
    EXPECT_EQ(AuthGate::ExtractBearer("  Bearer\tabc").value_or(""), std::string("abc"));
    EXPECT_FALSE(AuthGate::ExtractBearer("").has_value());
    EXPECT_FALSE(AuthGate::ExtractBearer("Bearer").has_value());
    EXPECT_FALSE(AuthGate::ExtractBearer("Bearer    ").has_value());
    EXPECT_FALSE(AuthGate::ExtractBearer("Bearerabc").has_value());
    EXPECT_FALSE(AuthGate::ExtractBearer("Basic abc").has_value());
}

TEST(AuthGateOptionsTest, FromConfigUsesServerUrl) {
    GatewayConfig cfg;
    cfg.idpDomain = "tenant.example.com";
    cfg.serverUrl = "https://gw.example.com";
    AuthGateOptions o = AuthGateOptions::FromConfig(cfg);
    EXPECT_TRUE(o.identityProviderConfigured);
    EXPECT_EQ(o.realm, std::string("https://gw.example.com"));
    EXPECT_EQ(o.resourceMetadataUrl, std::string("https://gw.example.com/.well-known/oauth-protected-resource"));
    EXPECT_EQ(o.protectedPrefix, std::string("/mcp"));
}
