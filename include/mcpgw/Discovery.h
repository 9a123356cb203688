//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Discovery.h
// Purpose: OAuth discovery documents and the health payload served without authentication
//==========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "mcpgw/Config.hpp"

namespace mcpgw::discovery {

// Scopes advertised to clients in every discovery document.
const std::vector<std::string>& SupportedScopes();

//==========================================================================================================
// Discovery documents
// Returns:
//   JSON text, or std::nullopt when the identity provider is not configured (callers answer 501).
//==========================================================================================================
std::optional<std::string> ProtectedResourceMetadata(const GatewayConfig& config);
std::optional<std::string> AuthorizationServerMetadata(const GatewayConfig& config);

// Additionally requires a client id.
std::optional<std::string> McpOAuthMetadata(const GatewayConfig& config);

//==========================================================================================================
// HealthSnapshot
// Purpose: Operational counters reported by GET /health.
//==========================================================================================================
struct HealthSnapshot {
    std::size_t sessions{0};
    std::size_t cacheSize{0};
    std::size_t cacheActive{0};
    long long ttlSeconds{0};
    std::size_t cacheMaxSize{0};
};

std::string HealthDocument(const HealthSnapshot& snapshot);

} // namespace mcpgw::discovery
