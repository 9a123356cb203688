//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: mcpgw gateway process: environment config, token validation, sessions and the HTTP listener
//==========================================================================================================

#include <csignal>
#include <exception>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "logging/Logger.h"
#include "mcpgw/Config.hpp"
#include "mcpgw/GatewayRouter.h"
#include "mcpgw/GatewayServer.hpp"
#include "mcpgw/ProtocolServer.h"
#include "mcpgw/auth/AuthGate.hpp"
#include "mcpgw/auth/Claims.hpp"
#include "mcpgw/auth/IdentityProvider.hpp"
#include "mcpgw/auth/TokenCache.hpp"
#include "mcpgw/auth/TokenValidator.hpp"
#include "mcpgw/session/SessionRegistry.hpp"
#include "mcpgw/version.h"

using namespace mcpgw;

//==========================================================================================================
// Builds the tools every session exposes. "whoami" reports the authenticated caller.
//==========================================================================================================
static std::shared_ptr<ToolRegistry> makeTools() {
    auto tools = std::make_shared<ToolRegistry>();

    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>(std::string("object"));
    schema["properties"] = std::make_shared<JSONValue>(JSONValue{JSONValue::Object{}});
    Tool whoami{"whoami", "Return the subject and email of the authenticated caller", JSONValue{schema}};

    tools->Register(whoami, [](const JSONValue& args) -> ToolResult {
        (void)args;
        const auth::Claims* claims = auth::CurrentClaims();
        if (claims == nullptr) {
            return TextResult("No authenticated caller", true);
        }
        JSONValue::Object out;
        out["sub"] = std::make_shared<JSONValue>(claims->subject);
        if (claims->email.has_value()) {
            out["email"] = std::make_shared<JSONValue>(claims->email.value());
        }
        return TextResult(SerializeJSON(JSONValue{out}));
    });
    return tools;
}

int main() {
    FUNC_SCOPE();
    Logger::initFromEnvironment();

    LOG_INFO("mcpgw {} starting (log level {})", getVersionString(), Logger::levelName(Logger::sLogLevel));
    const GatewayConfig config = GatewayConfig::FromEnvironment();

    try {
        auth::TokenValidationCache cache(config.cacheMaxEntries);

        auth::UserInfoClient::Options providerOpts;
        providerOpts.userinfoUrl = config.userinfoUrl;
        providerOpts.connectTimeoutMs = static_cast<unsigned int>(config.idpTimeout.count());
        providerOpts.readTimeoutMs = static_cast<unsigned int>(config.idpTimeout.count());
        providerOpts.totalTimeoutMs = static_cast<unsigned int>(config.idpTimeout.count());
        providerOpts.caFile = config.idpCaFile;
        auth::UserInfoClient provider(providerOpts);

        auth::TokenValidator validator(cache, provider, config.cacheTtl);
        auth::AuthGate gate(validator, auth::AuthGateOptions::FromConfig(config));
        SessionRegistry registry;

        StreamableHTTPTransport::Options transportOpts;
        transportOpts.keepalive = config.sseKeepalive;
        transportOpts.replayEvents = config.sseReplayEvents;
        SessionFactory factory = MakeSessionFactory(Implementation{"mcpgw", getVersionString()}, makeTools(), transportOpts);

        GatewayRouter router(config, gate, registry, cache, factory);
        GatewayServer server(GatewayServer::Options::FromConfig(config), router);
        server.SetErrorHandler([](const std::string& err) {
            LOG_ERROR("Server error: {}", err);
        });

        server.Start().get();
        LOG_INFO("Gateway ready: MCP endpoint {}/mcp (token cache ttl={}s, max={})",
                 config.serverUrl, config.cacheTtl.count(), config.cacheMaxEntries);

        boost::asio::io_context signals;
        boost::asio::signal_set waiter(signals, SIGINT, SIGTERM);
        waiter.async_wait([](const boost::system::error_code& ec, int signo) {
            if (!ec) {
                LOG_INFO("Received signal {}; shutting down", signo);
            }
        });
        signals.run();

        server.Stop().get();
    } catch (const std::exception& e) {
        LOG_ERROR("mcpgw failed: {}", e.what());
        return 1;
    }

    LOG_INFO("mcpgw stopped");
    return 0;
}
