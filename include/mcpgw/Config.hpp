//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.hpp
// Purpose: Gateway configuration sourced from environment variables
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace mcpgw {

//==========================================================================================================
// GatewayConfig
// Purpose: Settings consumed by the gateway components. Built once at startup and passed by reference.
// Fields:
//   idpDomain: Identity provider domain (AUTH0_DOMAIN). Empty means auth is misconfigured.
//   audience: Expected audience (AUTH0_AUDIENCE); advertised via discovery only.
//   clientId: Public client identifier (AUTH0_CLIENT_ID) for the mcp-oauth discovery document.
//   serverUrl: Externally visible base URL (MCP_SERVER_URL), used in challenges and metadata.
//   userinfoUrl: Provider userinfo endpoint; defaults to https://<idpDomain>/userinfo.
//   cacheTtl: Token validation cache TTL (TOKEN_CACHE_TTL_SECONDS).
//   cacheMaxEntries: Token validation cache capacity (TOKEN_CACHE_MAX_SIZE).
//   address/port: Listener bind address (MCPGW_BIND_ADDRESS) and port (PORT).
//   certFile/keyFile: PEM files; HTTPS is enabled when both are set.
//   idpTimeout: Connect/read bound for each identity provider call.
//   idpCaFile: Optional PEM bundle for verifying the provider (MCPGW_IDP_CA_FILE); system store otherwise.
//   sseKeepalive: Interval between keepalive comments on idle server-push streams.
//   sseReplayEvents: Server-push events retained per session for Last-Event-Id replay.
//==========================================================================================================
struct GatewayConfig {
    std::string idpDomain;
    std::string audience;
    std::string clientId;
    std::string serverUrl;
    std::string userinfoUrl;

    std::chrono::seconds cacheTtl{120};
    std::size_t cacheMaxEntries{1000};

    std::string address{"0.0.0.0"};
    unsigned short port{8000};
    std::string certFile;
    std::string keyFile;

    std::chrono::milliseconds idpTimeout{5000};
    std::string idpCaFile;
    std::chrono::milliseconds sseKeepalive{15000};
    std::size_t sseReplayEvents{256};

    bool IsIdentityProviderConfigured() const { return !idpDomain.empty(); }
    bool UsesTls() const { return !certFile.empty() && !keyFile.empty(); }

    // https://<idpDomain>/ as advertised in discovery documents
    std::string IssuerUrl() const;

    // <serverUrl>/.well-known/oauth-protected-resource
    std::string ResourceMetadataUrl() const;

    //==========================================================================================================
    // FromEnvironment
    // Purpose: Reads every setting from the process environment. Malformed or out-of-range numeric
    //          values are logged and replaced by their defaults; this never throws.
    //==========================================================================================================
    static GatewayConfig FromEnvironment();
};

} // namespace mcpgw
