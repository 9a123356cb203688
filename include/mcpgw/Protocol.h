//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol constants and HTTP header names shared by the gateway components
//==========================================================================================================

#pragma once

#include <string>

namespace mcpgw {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// MCP protocol revision advertised by the built-in protocol server
constexpr const char* PROTOCOL_VERSION = "2025-03-26";

// Implementation information
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";

    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Cancelled = "notifications/cancelled";
    constexpr const char* Log = "notifications/message";
}

///////////////////////////////////////// HTTP surface ///////////////////////////////////////////
namespace Headers {
    constexpr const char* SessionId = "Mcp-Session-Id";
    constexpr const char* LastEventId = "Last-Event-Id";
}

namespace Paths {
    constexpr const char* Mcp = "/mcp";
    constexpr const char* Health = "/health";
    constexpr const char* WellKnownPrefix = "/.well-known/";
    constexpr const char* ProtectedResource = "/.well-known/oauth-protected-resource";
    constexpr const char* ProtectedResourceMcp = "/.well-known/oauth-protected-resource/mcp";
    constexpr const char* AuthorizationServer = "/.well-known/oauth-authorization-server";
    constexpr const char* AuthorizationServerMcp = "/.well-known/oauth-authorization-server/mcp";
    constexpr const char* McpOAuth = "/.well-known/mcp-oauth";
}

} // namespace mcpgw
