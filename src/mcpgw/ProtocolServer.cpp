//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/ProtocolServer.cpp
// Purpose: Minimal MCP protocol server implementation
//==========================================================================================================

#include <utility>

#include "logging/Logger.h"
#include "mcpgw/ProtocolServer.h"

namespace mcpgw {

namespace {
    const char* kSupportedVersions[] = {"2024-11-05", "2025-03-26", "2025-06-18"};

    std::unique_ptr<JSONRPCResponse> makeResult(const JSONRPCId& id, JSONValue result) {
        auto response = std::make_unique<JSONRPCResponse>();
        response->id = id;
        response->result = std::move(result);
        return response;
    }

    JSONValue emptyObject() {
        return JSONValue{JSONValue::Object{}};
    }
}

ToolResult TextResult(const std::string& text, bool isError) {
    JSONValue::Object block;
    block["type"] = std::make_shared<JSONValue>("text");
    block["text"] = std::make_shared<JSONValue>(text);
    ToolResult r;
    r.content.push_back(std::make_shared<JSONValue>(block));
    r.isError = isError;
    return r;
}

///////////////////////////////////////// ToolRegistry ///////////////////////////////////////////
void ToolRegistry::Register(const Tool& tool, ToolHandler handler) {
    entries[tool.name] = Entry{tool, std::move(handler)};
}

const ToolHandler* ToolRegistry::FindHandler(const std::string& name) const {
    auto it = entries.find(name);
    return (it == entries.end()) ? nullptr : &it->second.handler;
}

std::vector<Tool> ToolRegistry::List() const {
    std::vector<Tool> out;
    out.reserve(entries.size());
    for (const auto& kv : entries) {
        out.push_back(kv.second.tool);
    }
    return out;
}

///////////////////////////////////////// ProtocolServer ///////////////////////////////////////////
ProtocolServer::ProtocolServer(Implementation info, std::shared_ptr<const ToolRegistry> tools)
    : info(std::move(info)), tools(std::move(tools)) {
}

void ProtocolServer::Connect(const std::shared_ptr<ISessionTransport>& t) {
    transport = t;
    // Handlers own the server; the server only observes the transport
    auto self = shared_from_this();
    t->SetRequestHandler([self](const JSONRPCRequest& req) {
        return self->HandleRequest(req);
    });
    t->SetNotificationHandler([self](std::unique_ptr<JSONRPCNotification> note) {
        self->HandleNotification(std::move(note));
    });
}

std::unique_ptr<JSONRPCResponse> ProtocolServer::HandleRequest(const JSONRPCRequest& req) {
    if (req.method == Methods::Initialize) {
        return handleInitialize(req);
    } else if (req.method == Methods::Ping) {
        return makeResult(req.id, emptyObject());
    } else if (req.method == Methods::ListTools) {
        return handleToolsList(req);
    } else if (req.method == Methods::CallTool) {
        return handleToolsCall(req);
    }
    LOG_DEBUG("ProtocolServer: method not found: {}", req.method);
    return CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found");
}

void ProtocolServer::HandleNotification(std::unique_ptr<JSONRPCNotification> note) {
    if (!note) {
        return;
    }
    if (note->method == Methods::Initialized) {
        clientInitialized = true;
        LOG_DEBUG("ProtocolServer: client reported initialized");
    } else if (note->method == Methods::Cancelled) {
        // Requests complete synchronously; there is never anything in flight to cancel
        LOG_DEBUG("ProtocolServer: ignoring cancellation");
    } else {
        LOG_DEBUG("ProtocolServer: unhandled notification {}", note->method);
    }
}

bool ProtocolServer::SendLogMessage(const std::string& level, const std::string& message) {
    auto t = transport.lock();
    if (!t) {
        return false;
    }
    JSONValue::Object params;
    params["level"] = std::make_shared<JSONValue>(level);
    params["logger"] = std::make_shared<JSONValue>(info.name);
    params["data"] = std::make_shared<JSONValue>(message);
    return t->SendNotification(std::make_unique<JSONRPCNotification>(Methods::Log, JSONValue{params}));
}

std::unique_ptr<JSONRPCResponse> ProtocolServer::handleInitialize(const JSONRPCRequest& req) {
    std::string negotiated = PROTOCOL_VERSION;
    if (req.params.has_value()) {
        const std::string requested = GetStringMember(req.params.value(), "protocolVersion").value_or("");
        for (const char* v : kSupportedVersions) {
            if (requested == v) {
                negotiated = requested;
            }
        }
        if (const JSONValue* ci = FindMember(req.params.value(), "clientInfo")) {
            clientInfo = Implementation(GetStringMember(*ci, "name").value_or(""),
                                        GetStringMember(*ci, "version").value_or(""));
        }
    }
    LOG_INFO("ProtocolServer: initialize (client={}, protocol={})",
             clientInfo.has_value() ? clientInfo->name : std::string("unknown"), negotiated);

    JSONValue::Object toolsCap;
    toolsCap["listChanged"] = std::make_shared<JSONValue>(false);
    JSONValue::Object caps;
    caps["tools"] = std::make_shared<JSONValue>(toolsCap);

    JSONValue::Object serverInfo;
    serverInfo["name"] = std::make_shared<JSONValue>(info.name);
    serverInfo["version"] = std::make_shared<JSONValue>(info.version);

    JSONValue::Object result;
    result["protocolVersion"] = std::make_shared<JSONValue>(negotiated);
    result["capabilities"] = std::make_shared<JSONValue>(caps);
    result["serverInfo"] = std::make_shared<JSONValue>(serverInfo);
    return makeResult(req.id, JSONValue{result});
}

std::unique_ptr<JSONRPCResponse> ProtocolServer::handleToolsList(const JSONRPCRequest& req) {
    JSONValue::Array arr;
    if (tools) {
        for (const Tool& t : tools->List()) {
            JSONValue::Object to;
            to["name"] = std::make_shared<JSONValue>(t.name);
            to["description"] = std::make_shared<JSONValue>(t.description);
            to["inputSchema"] = std::make_shared<JSONValue>(t.inputSchema.IsObject() ? t.inputSchema : emptyObject());
            arr.push_back(std::make_shared<JSONValue>(to));
        }
    }
    JSONValue::Object result;
    result["tools"] = std::make_shared<JSONValue>(arr);
    return makeResult(req.id, JSONValue{result});
}

std::unique_ptr<JSONRPCResponse> ProtocolServer::handleToolsCall(const JSONRPCRequest& req) {
    std::string name;
    JSONValue arguments = emptyObject();
    if (req.params.has_value()) {
        name = GetStringMember(req.params.value(), "name").value_or("");
        if (const JSONValue* a = FindMember(req.params.value(), "arguments")) {
            arguments = *a;
        }
    }
    if (name.empty()) {
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "Invalid params: missing tool name");
    }
    const ToolHandler* handler = tools ? tools->FindHandler(name) : nullptr;
    if (handler == nullptr) {
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidParams, std::string("Unknown tool: ") + name);
    }

    ToolResult tr;
    try {
        tr = (*handler)(arguments);
    } catch (const std::exception& e) {
        LOG_WARN("ProtocolServer: tool {} failed: {}", name, e.what());
        tr = TextResult(e.what(), true);
    }

    JSONValue::Object result;
    result["content"] = std::make_shared<JSONValue>(tr.content);
    if (tr.isError) {
        result["isError"] = std::make_shared<JSONValue>(true);
    }
    return makeResult(req.id, JSONValue{result});
}

SessionFactory MakeSessionFactory(Implementation info, std::shared_ptr<const ToolRegistry> tools,
                                  StreamableHTTPTransport::Options transportOptions) {
    return [info = std::move(info), tools = std::move(tools), transportOptions](
               const std::string& sessionId, boost::asio::any_io_executor executor) -> std::shared_ptr<ISessionTransport> {
        auto transport = std::make_shared<StreamableHTTPTransport>(sessionId, executor, transportOptions);
        auto server = std::make_shared<ProtocolServer>(info, tools);
        server->Connect(transport);
        return transport;
    };
}

} // namespace mcpgw
