//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayRouter.h
// Purpose: Routes gateway HTTP requests to discovery, health and session lifecycle handlers
//==========================================================================================================

#pragma once

#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "mcpgw/Config.hpp"
#include "mcpgw/auth/AuthGate.hpp"
#include "mcpgw/auth/TokenCache.hpp"
#include "mcpgw/http/HttpTypes.hpp"
#include "mcpgw/session/SessionRegistry.hpp"
#include "mcpgw/session/SessionTransport.hpp"

namespace mcpgw {

// Per-connection facts the router logs with each request.
struct RequestContext {
    std::string remoteAddress;
};

//==========================================================================================================
// GatewayRouter
// Purpose: Entry point for every HTTP request. Applies CORS, the AuthGate, then dispatches:
//   OPTIONS *                      -> 204 preflight
//   GET /health                    -> health document
//   GET /.well-known/...           -> discovery documents (501 when unconfigured)
//   POST /mcp                      -> create (initialize, no session id) or continue
//   GET /mcp                       -> server-push stream for a known session
//   DELETE /mcp                    -> terminate a known session (repeat is idempotent)
// Notes:
//   - Handle() never throws. Unexpected faults answer 500 with a JSON-RPC envelope when nothing has
//     been sent yet; otherwise the connection is closed.
//   - All state lives in the injected objects; the router itself is stateless.
//==========================================================================================================
class GatewayRouter {
public:
    GatewayRouter(const GatewayConfig& config, auth::AuthGate& gate, SessionRegistry& registry,
                  auth::TokenValidationCache& cache, SessionFactory sessionFactory);

    boost::asio::awaitable<void> Handle(const HttpRequest& req, IResponseSink& sink, const RequestContext& ctx);

    // Closes every ACTIVE session (process shutdown).
    void CloseAllSessions();

private:
    boost::asio::awaitable<void> route(const HttpRequest& req, IResponseSink& sink, const RequestContext& ctx);
    boost::asio::awaitable<void> handleWellKnown(const HttpRequest& req, IResponseSink& sink);
    boost::asio::awaitable<void> handleMcpPost(const HttpRequest& req, IResponseSink& sink, const auth::Claims* claims);
    boost::asio::awaitable<void> handleMcpGet(const HttpRequest& req, IResponseSink& sink, const auth::Claims* claims);
    boost::asio::awaitable<void> handleMcpDelete(const HttpRequest& req, IResponseSink& sink, const auth::Claims* claims);

    HttpResponse preflight(const HttpRequest& req) const;
    HttpResponse health(const HttpRequest& req) const;

    const GatewayConfig& config;
    auth::AuthGate& gate;
    SessionRegistry& registry;
    auth::TokenValidationCache& cache;
    SessionFactory sessionFactory;
};

} // namespace mcpgw
