//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_config.cpp
// Purpose: GatewayConfig::FromEnvironment defaults, bounds and derived values
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

#include "env/EnvVars.h"
#include "mcpgw/Config.hpp"

using namespace mcpgw;

namespace {

const std::vector<const char*>& configVariables() {
    static const std::vector<const char*> names = {
        "AUTH0_DOMAIN", "AUTH0_AUDIENCE", "AUTH0_CLIENT_ID", "PORT", "MCPGW_BIND_ADDRESS", "MCP_SERVER_URL",
        "MCPGW_USERINFO_URL", "TOKEN_CACHE_TTL_SECONDS", "TOKEN_CACHE_MAX_SIZE", "MCPGW_TLS_CERT", "MCPGW_TLS_KEY",
        "MCPGW_IDP_TIMEOUT_MS", "MCPGW_IDP_CA_FILE", "MCPGW_SSE_KEEPALIVE_MS", "MCPGW_SSE_REPLAY_EVENTS"};
    return names;
}

// Clears every gateway variable before and after each test.
class ConfigEnvFixture : public ::testing::Test {
protected:
    void SetUp() override { clearAll(); }
    void TearDown() override { clearAll(); }

    static void set(const char* name, const char* value) { ::setenv(name, value, 1); }

private:
    static void clearAll() {
        for (const char* n : configVariables()) {
            ::unsetenv(n);
        }
    }
};

} // namespace

TEST_F(ConfigEnvFixture, DefaultsWhenUnset) {
    GatewayConfig cfg = GatewayConfig::FromEnvironment();
    EXPECT_FALSE(cfg.IsIdentityProviderConfigured());
    EXPECT_EQ(cfg.port, 8000);
    EXPECT_EQ(cfg.address, std::string("0.0.0.0"));
    EXPECT_EQ(cfg.serverUrl, std::string("http://localhost:8000"));
    EXPECT_EQ(cfg.cacheTtl.count(), 120);
    EXPECT_EQ(cfg.cacheMaxEntries, 1000u);
    EXPECT_TRUE(cfg.userinfoUrl.empty());
    EXPECT_FALSE(cfg.UsesTls());
    EXPECT_EQ(cfg.idpTimeout.count(), 5000);
    EXPECT_EQ(cfg.sseReplayEvents, 256u);
}

TEST_F(ConfigEnvFixture, ProviderSettingsAndDerivedUrls) {
    set("AUTH0_DOMAIN", "tenant.example.com/");
    set("AUTH0_AUDIENCE", "https://api.example.com");
    set("AUTH0_CLIENT_ID", "abc");
    set("PORT", "9090");
    set("MCP_SERVER_URL", "https://gw.example.com/");
    GatewayConfig cfg = GatewayConfig::FromEnvironment();
    EXPECT_TRUE(cfg.IsIdentityProviderConfigured());
    EXPECT_EQ(cfg.idpDomain, std::string("tenant.example.com"));
    EXPECT_EQ(cfg.IssuerUrl(), std::string("https://tenant.example.com/"));
    EXPECT_EQ(cfg.userinfoUrl, std::string("https://tenant.example.com/userinfo"));
    EXPECT_EQ(cfg.serverUrl, std::string("https://gw.example.com"));
    EXPECT_EQ(cfg.ResourceMetadataUrl(), std::string("https://gw.example.com/.well-known/oauth-protected-resource"));
    EXPECT_EQ(cfg.port, 9090);
    EXPECT_EQ(cfg.audience, std::string("https://api.example.com"));
    EXPECT_EQ(cfg.clientId, std::string("abc"));
}

TEST_F(ConfigEnvFixture, ServerUrlDefaultFollowsPort) {
    set("PORT", "8123");
    EXPECT_EQ(GatewayConfig::FromEnvironment().serverUrl, std::string("http://localhost:8123"));
}

TEST_F(ConfigEnvFixture, ExplicitUserInfoUrlWins) {
    set("AUTH0_DOMAIN", "tenant.example.com");
    set("MCPGW_USERINFO_URL", "http://127.0.0.1:9999/userinfo");
    EXPECT_EQ(GatewayConfig::FromEnvironment().userinfoUrl, std::string("http://127.0.0.1:9999/userinfo"));
}

TEST_F(ConfigEnvFixture, CacheSettingsParsed) {
    set("TOKEN_CACHE_TTL_SECONDS", "30");
    set("TOKEN_CACHE_MAX_SIZE", "5");
    GatewayConfig cfg = GatewayConfig::FromEnvironment();
    EXPECT_EQ(cfg.cacheTtl.count(), 30);
    EXPECT_EQ(cfg.cacheMaxEntries, 5u);
}

TEST_F(ConfigEnvFixture, MalformedOrOutOfRangeFallsBack) {
    set("TOKEN_CACHE_TTL_SECONDS", "ten");
    set("TOKEN_CACHE_MAX_SIZE", "0");
    set("PORT", "70000");
    set("MCPGW_IDP_TIMEOUT_MS", "-5");
    GatewayConfig cfg = GatewayConfig::FromEnvironment();
    EXPECT_EQ(cfg.cacheTtl.count(), 120);
    EXPECT_EQ(cfg.cacheMaxEntries, 1000u);
    EXPECT_EQ(cfg.port, 8000);
    EXPECT_EQ(cfg.idpTimeout.count(), 5000);
}

TEST_F(ConfigEnvFixture, TlsNeedsBothFiles) {
    set("MCPGW_TLS_CERT", "/etc/mcpgw/cert.pem");
    GatewayConfig lone = GatewayConfig::FromEnvironment();
    EXPECT_FALSE(lone.UsesTls());
    EXPECT_TRUE(lone.certFile.empty());

    set("MCPGW_TLS_KEY", "/etc/mcpgw/key.pem");
    GatewayConfig both = GatewayConfig::FromEnvironment();
    EXPECT_TRUE(both.UsesTls());
    EXPECT_EQ(both.keyFile, std::string("/etc/mcpgw/key.pem"));
}

TEST_F(ConfigEnvFixture, GetEnvUnsignedReportsMalformed) {
    bool malformed = false;
    set("PORT", "12a");
    EXPECT_FALSE(GetEnvUnsigned("PORT", &malformed).has_value());
    EXPECT_TRUE(malformed);

    set("PORT", "99999999999999999999999");
    EXPECT_FALSE(GetEnvUnsigned("PORT", &malformed).has_value());
    EXPECT_TRUE(malformed);

    set("PORT", "443");
    EXPECT_EQ(GetEnvUnsigned("PORT", &malformed).value_or(0), 443u);
    EXPECT_FALSE(malformed);

    ::unsetenv("PORT");
    EXPECT_FALSE(GetEnvUnsigned("PORT", &malformed).has_value());
    EXPECT_FALSE(malformed);
}
