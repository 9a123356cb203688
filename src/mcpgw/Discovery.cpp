//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/Discovery.cpp
// Purpose: Discovery and health document builders
//==========================================================================================================

#include <cstdint>
#include <memory>

#include "mcpgw/Discovery.h"
#include "mcpgw/JSONRPCTypes.h"

namespace mcpgw::discovery {

namespace {
    std::shared_ptr<JSONValue> scopesArray() {
        JSONValue::Array arr;
        for (const auto& s : SupportedScopes()) {
            arr.push_back(std::make_shared<JSONValue>(s));
        }
        return std::make_shared<JSONValue>(arr);
    }

    std::shared_ptr<JSONValue> count(std::size_t n) {
        return std::make_shared<JSONValue>(static_cast<int64_t>(n));
    }

    std::string providerUrl(const GatewayConfig& config, const char* suffix) {
        return std::string("https://") + config.idpDomain + suffix;
    }
}

const std::vector<std::string>& SupportedScopes() {
    static const std::vector<std::string> scopes = {"openid", "profile", "email", "offline_access"};
    return scopes;
}

std::optional<std::string> ProtectedResourceMetadata(const GatewayConfig& config) {
    if (!config.IsIdentityProviderConfigured()) {
        return std::nullopt;
    }
    JSONValue::Array servers;
    servers.push_back(std::make_shared<JSONValue>(config.IssuerUrl()));

    JSONValue::Object o;
    o["resource"] = std::make_shared<JSONValue>(config.serverUrl);
    o["scopes_supported"] = scopesArray();
    o["authorization_servers"] = std::make_shared<JSONValue>(servers);
    return SerializeJSON(JSONValue{o});
}

std::optional<std::string> AuthorizationServerMetadata(const GatewayConfig& config) {
    if (!config.IsIdentityProviderConfigured()) {
        return std::nullopt;
    }
    JSONValue::Array responseTypes;
    responseTypes.push_back(std::make_shared<JSONValue>("code"));

    JSONValue::Object o;
    o["issuer"] = std::make_shared<JSONValue>(config.IssuerUrl());
    o["authorization_endpoint"] = std::make_shared<JSONValue>(providerUrl(config, "/authorize"));
    o["token_endpoint"] = std::make_shared<JSONValue>(providerUrl(config, "/oauth/token"));
    o["scopes_supported"] = scopesArray();
    o["response_types_supported"] = std::make_shared<JSONValue>(responseTypes);
    return SerializeJSON(JSONValue{o});
}

std::optional<std::string> McpOAuthMetadata(const GatewayConfig& config) {
    if (!config.IsIdentityProviderConfigured() || config.clientId.empty()) {
        return std::nullopt;
    }
    JSONValue::Object o;
    o["authorizationEndpoint"] = std::make_shared<JSONValue>(providerUrl(config, "/authorize"));
    o["tokenEndpoint"] = std::make_shared<JSONValue>(providerUrl(config, "/oauth/token"));
    o["clientId"] = std::make_shared<JSONValue>(config.clientId);
    o["scopes"] = scopesArray();
    if (!config.audience.empty()) {
        o["audience"] = std::make_shared<JSONValue>(config.audience);
    }
    return SerializeJSON(JSONValue{o});
}

std::string HealthDocument(const HealthSnapshot& snapshot) {
    JSONValue::Object cache;
    cache["size"] = count(snapshot.cacheSize);
    cache["active"] = count(snapshot.cacheActive);
    cache["ttl_seconds"] = std::make_shared<JSONValue>(static_cast<int64_t>(snapshot.ttlSeconds));
    cache["max_size"] = count(snapshot.cacheMaxSize);

    JSONValue::Object o;
    o["status"] = std::make_shared<JSONValue>("ok");
    o["transport"] = std::make_shared<JSONValue>("streamable-http");
    o["sessions"] = count(snapshot.sessions);
    o["token_cache"] = std::make_shared<JSONValue>(cache);
    return SerializeJSON(JSONValue{o});
}

} // namespace mcpgw::discovery
