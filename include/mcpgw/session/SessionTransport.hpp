//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionTransport.hpp
// Purpose: Per-session transport interface bound to one logical MCP session
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "mcpgw/JSONRPCTypes.h"
#include "mcpgw/auth/Claims.hpp"
#include "mcpgw/http/HttpTypes.hpp"

namespace mcpgw {

//==========================================================================================================
// ISessionTransport
// Purpose: Carries one session's traffic between HTTP exchanges and the protocol server handlers.
// Notes:
//   - All methods are called on the gateway I/O thread.
//   - Handler signatures mirror the request/notification handlers of the protocol server.
//==========================================================================================================
class ISessionTransport {
public:
    using RequestHandler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)>;
    using NotificationHandler = std::function<void(std::unique_ptr<JSONRPCNotification>)>;
    using CloseHandler = std::function<void(const std::string& sessionId)>;

    virtual ~ISessionTransport() = default;

    //==========================================================================================================
    // Returns the server-assigned session identifier.
    //==========================================================================================================
    virtual std::string GetSessionId() const = 0;

    //==========================================================================================================
    // Serves one HTTP exchange for this session (POST message, GET stream, DELETE termination).
    // Args:
    //   req: The inbound request.
    //   sink: Where the reply is written. A GET keeps the sink open until the stream ends.
    //   claims: Authenticated caller, or nullptr. Installed as the current Claims around handler calls.
    //==========================================================================================================
    virtual boost::asio::awaitable<void> HandleRequest(const HttpRequest& req, IResponseSink& sink,
                                                       const auth::Claims* claims) = 0;

    //==========================================================================================================
    // Closes the transport. Idempotent; the close handler fires exactly once, and an open stream
    // is ended with its final chunk.
    //==========================================================================================================
    virtual void Close() = 0;

    // True after a successful initialize handshake.
    virtual bool IsInitialized() const = 0;

    virtual bool IsClosed() const = 0;

    //==========================================================================================================
    // Queues a server-to-client notification for the session's push stream.
    // Returns:
    //   false when the transport is closed.
    //==========================================================================================================
    virtual bool SendNotification(std::unique_ptr<JSONRPCNotification> notification) = 0;

    virtual void SetRequestHandler(RequestHandler handler) = 0;
    virtual void SetNotificationHandler(NotificationHandler handler) = 0;
    virtual void SetCloseHandler(CloseHandler handler) = 0;
};

//==========================================================================================================
// SessionFactory
// Purpose: Builds a connected transport (protocol server attached) for a freshly allocated id.
//==========================================================================================================
using SessionFactory = std::function<std::shared_ptr<ISessionTransport>(
    const std::string& sessionId, boost::asio::any_io_executor executor)>;

} // namespace mcpgw
