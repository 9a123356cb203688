//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS listener for the gateway using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "mcpgw/Config.hpp"
#include "mcpgw/GatewayRouter.h"

namespace mcpgw {

class GatewayServer {
public:
    using ErrorHandler = std::function<void(const std::string&)>;

    //==========================================================================================================
    // Options
    // Purpose: Listener configuration.
    // Fields:
    //   address: Bind address (default: 0.0.0.0)
    //   port: Listen port; 0 picks a free port (see BoundPort())
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //   maxBodyBytes: Request bodies above this answer 413 and close the connection
    //   idleTimeout: Bound on waiting for the next request on a keep-alive connection
    //   writeTimeout: Bound on each response write, including every server-push chunk
    //   shutdownGrace: How long Stop() waits for busy connections before stopping the I/O context
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        unsigned short port{8000};
        std::string scheme{"http"};
        std::string certFile;
        std::string keyFile;
        std::size_t maxBodyBytes{4 * 1024 * 1024};
        std::chrono::milliseconds idleTimeout{60000};
        std::chrono::milliseconds writeTimeout{30000};
        std::chrono::milliseconds shutdownGrace{3000};

        static Options FromConfig(const GatewayConfig& config);
    };

    //==========================================================================================================
    // Args:
    //   opts: Listener options.
    //   router: Request router; must outlive the server.
    // Throws:
    //   std::exception when the https certificate or key cannot be loaded.
    //==========================================================================================================
    GatewayServer(const Options& opts, GatewayRouter& router);
    ~GatewayServer();

    GatewayServer(const GatewayServer&) = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;

    //==========================================================================================================
    // Binds the listener and starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the listener is bound; it carries the bind error otherwise.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stops accepting, closes every session, drains busy connections for up to shutdownGrace, then
    // stops the I/O context and joins the background thread. Must not be called from the I/O thread.
    // Returns:
    //   Future that completes when shutdown has finished.
    //==========================================================================================================
    std::future<void> Stop();

    // Callback for accept/connection errors that happen while the server is running.
    void SetErrorHandler(ErrorHandler handler);

    // Port the listener is bound to; 0 before Start().
    unsigned short BoundPort() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpgw
