//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/Config.cpp
// Purpose: Environment-backed gateway configuration
//==========================================================================================================

#include <cstdint>
#include <optional>
#include <string>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpgw/Config.hpp"

namespace mcpgw {

namespace {
    std::string stripTrailingSlash(std::string s) {
        while (!s.empty() && s.back() == '/') {
            s.pop_back();
        }
        return s;
    }

    // Reads an unsigned setting within [minValue, maxValue]; falls back to defaultValue otherwise.
    std::uint64_t readBounded(const char* name, std::uint64_t defaultValue,
                              std::uint64_t minValue, std::uint64_t maxValue) {
        bool malformed = false;
        std::optional<std::uint64_t> v = GetEnvUnsigned(name, &malformed);
        if (malformed) {
            LOG_WARN("Config: {} is not a valid unsigned integer; using default {}", name, defaultValue);
            return defaultValue;
        }
        if (!v.has_value()) {
            return defaultValue;
        }
        if (v.value() < minValue || v.value() > maxValue) {
            LOG_WARN("Config: {}={} out of range [{}, {}]; using default {}", name, v.value(), minValue, maxValue, defaultValue);
            return defaultValue;
        }
        return v.value();
    }
}

std::string GatewayConfig::IssuerUrl() const {
    return std::string("https://") + idpDomain + "/";
}

std::string GatewayConfig::ResourceMetadataUrl() const {
    return stripTrailingSlash(serverUrl) + "/.well-known/oauth-protected-resource";
}

GatewayConfig GatewayConfig::FromEnvironment() {
    GatewayConfig cfg;

    cfg.idpDomain = stripTrailingSlash(GetEnvOrDefault("AUTH0_DOMAIN", ""));
    cfg.audience = GetEnvOrDefault("AUTH0_AUDIENCE", "");
    cfg.clientId = GetEnvOrDefault("AUTH0_CLIENT_ID", "");

    cfg.port = static_cast<unsigned short>(readBounded("PORT", 8000u, 0u, 65535u));
    cfg.address = GetEnvOrDefault("MCPGW_BIND_ADDRESS", "0.0.0.0");

    cfg.serverUrl = stripTrailingSlash(
        GetEnvOrDefault("MCP_SERVER_URL", std::string("http://localhost:") + std::to_string(cfg.port)));

    cfg.userinfoUrl = GetEnvOrDefault("MCPGW_USERINFO_URL", "");
    if (cfg.userinfoUrl.empty() && !cfg.idpDomain.empty()) {
        cfg.userinfoUrl = std::string("https://") + cfg.idpDomain + "/userinfo";
    }

    cfg.cacheTtl = std::chrono::seconds(readBounded("TOKEN_CACHE_TTL_SECONDS", 120u, 1u, 86400u));
    cfg.cacheMaxEntries = static_cast<std::size_t>(readBounded("TOKEN_CACHE_MAX_SIZE", 1000u, 1u, 10000000u));

    cfg.certFile = GetEnvOrDefault("MCPGW_TLS_CERT", "");
    cfg.keyFile = GetEnvOrDefault("MCPGW_TLS_KEY", "");
    if (cfg.certFile.empty() != cfg.keyFile.empty()) {
        LOG_WARN("Config: MCPGW_TLS_CERT and MCPGW_TLS_KEY must be set together; serving plain HTTP");
        cfg.certFile.clear();
        cfg.keyFile.clear();
    }

    cfg.idpTimeout = std::chrono::milliseconds(readBounded("MCPGW_IDP_TIMEOUT_MS", 5000u, 100u, 120000u));
    cfg.idpCaFile = GetEnvOrDefault("MCPGW_IDP_CA_FILE", "");
    cfg.sseKeepalive = std::chrono::milliseconds(readBounded("MCPGW_SSE_KEEPALIVE_MS", 15000u, 100u, 3600000u));
    cfg.sseReplayEvents = static_cast<std::size_t>(readBounded("MCPGW_SSE_REPLAY_EVENTS", 256u, 0u, 100000u));

    if (!cfg.IsIdentityProviderConfigured()) {
        LOG_ERROR("Config: AUTH0_DOMAIN is not set; protected routes will answer 500");
    }
    return cfg;
}

} // namespace mcpgw
