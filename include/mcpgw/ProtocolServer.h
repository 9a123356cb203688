//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolServer.h
// Purpose: Minimal MCP protocol server (initialize, ping, tools) bound to one session transport
//==========================================================================================================

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcpgw/JSONRPCTypes.h"
#include "mcpgw/Protocol.h"
#include "mcpgw/session/StreamableHTTPTransport.hpp"

namespace mcpgw {

// Tool definition advertised through tools/list
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters
};

// Tool call result: content blocks plus the isError flag of a CallToolResult
struct ToolResult {
    JSONValue::Array content;
    bool isError{false};
};

// Single text content block
ToolResult TextResult(const std::string& text, bool isError = false);

// Tool handlers run synchronously on the I/O thread; auth::CurrentClaims() identifies the caller.
using ToolHandler = std::function<ToolResult(const JSONValue& arguments)>;

//==========================================================================================================
// ToolRegistry
// Purpose: Named tools shared by every session's protocol server. Populated before the gateway starts.
//==========================================================================================================
class ToolRegistry {
public:
    void Register(const Tool& tool, ToolHandler handler);
    const ToolHandler* FindHandler(const std::string& name) const;
    std::vector<Tool> List() const;

private:
    struct Entry {
        Tool tool;
        ToolHandler handler;
    };
    std::map<std::string, Entry> entries;
};

//==========================================================================================================
// ProtocolServer
// Purpose: Answers MCP requests arriving on a session transport.
// Notes:
//   - Holds the transport weakly; the transport owns this server through its handlers.
//   - Unknown methods answer -32601.
//==========================================================================================================
class ProtocolServer : public std::enable_shared_from_this<ProtocolServer> {
public:
    ProtocolServer(Implementation info, std::shared_ptr<const ToolRegistry> tools);

    // Installs request/notification handlers on the transport.
    void Connect(const std::shared_ptr<ISessionTransport>& transport);

    std::unique_ptr<JSONRPCResponse> HandleRequest(const JSONRPCRequest& req);
    void HandleNotification(std::unique_ptr<JSONRPCNotification> note);

    //==========================================================================================================
    // Pushes a notifications/message log entry to the client's stream.
    // Returns:
    //   false when no transport is connected or it is closed.
    //==========================================================================================================
    bool SendLogMessage(const std::string& level, const std::string& message);

    bool IsClientInitialized() const { return clientInitialized; }
    const std::optional<Implementation>& ClientInfo() const { return clientInfo; }

private:
    std::unique_ptr<JSONRPCResponse> handleInitialize(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handleToolsList(const JSONRPCRequest& req);
    std::unique_ptr<JSONRPCResponse> handleToolsCall(const JSONRPCRequest& req);

    Implementation info;
    std::shared_ptr<const ToolRegistry> tools;
    std::weak_ptr<ISessionTransport> transport;
    bool clientInitialized{false};
    std::optional<Implementation> clientInfo;
};

//==========================================================================================================
// MakeSessionFactory
// Purpose: Session factory producing a StreamableHTTPTransport connected to a fresh ProtocolServer.
//==========================================================================================================
SessionFactory MakeSessionFactory(Implementation info, std::shared_ptr<const ToolRegistry> tools,
                                  StreamableHTTPTransport::Options transportOptions);

} // namespace mcpgw
