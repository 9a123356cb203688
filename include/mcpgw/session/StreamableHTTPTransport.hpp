//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StreamableHTTPTransport.hpp
// Purpose: Streamable HTTP session transport (JSON replies, SSE push stream with replay)
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>

#include <boost/asio/steady_timer.hpp>

#include "mcpgw/session/SessionTransport.hpp"

namespace mcpgw {

class StreamableHTTPTransport : public ISessionTransport,
                                public std::enable_shared_from_this<StreamableHTTPTransport> {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   keepalive: Interval after which an idle push stream receives a ":" comment.
    //   replayEvents: Delivered events retained for Last-Event-Id resumption (0 disables replay).
    //   maxPending: Events queued while no stream is open; the oldest is dropped beyond this.
    //==========================================================================================================
    struct Options {
        std::chrono::milliseconds keepalive{15000};
        std::size_t replayEvents{256};
        std::size_t maxPending{1024};
    };

    StreamableHTTPTransport(std::string sessionId, boost::asio::any_io_executor executor, Options opts);
    ~StreamableHTTPTransport() override;

    std::string GetSessionId() const override { return sessionId; }

    boost::asio::awaitable<void> HandleRequest(const HttpRequest& req, IResponseSink& sink,
                                               const auth::Claims* claims) override;

    void Close() override;
    bool IsInitialized() const override { return initialized; }
    bool IsClosed() const override { return closed; }
    bool HasOpenStream() const { return streamOpen; }

    bool SendNotification(std::unique_ptr<JSONRPCNotification> notification) override;

    void SetRequestHandler(RequestHandler handler) override { requestHandler = std::move(handler); }
    void SetNotificationHandler(NotificationHandler handler) override { notificationHandler = std::move(handler); }
    void SetCloseHandler(CloseHandler handler) override { closeHandler = std::move(handler); }

private:
    struct Event {
        std::uint64_t id;
        std::string data;
    };

    boost::asio::awaitable<void> handlePost(const HttpRequest& req, IResponseSink& sink, const auth::Claims* claims);
    boost::asio::awaitable<void> handleGet(const HttpRequest& req, IResponseSink& sink);
    boost::asio::awaitable<void> handleDelete(const HttpRequest& req, IResponseSink& sink);

    std::unique_ptr<JSONRPCResponse> dispatchRequest(const JSONRPCRequest& req, const auth::Claims* claims);
    void dispatchNotification(std::unique_ptr<JSONRPCNotification> note, const auth::Claims* claims);

    HttpResponse jsonReply(const HttpRequest& req, HttpStatus status, std::string body) const;
    HttpResponse rpcError(const HttpRequest& req, HttpStatus status, int code, const std::string& message) const;

    static std::string formatEvent(const Event& ev);
    void remember(Event ev);

    std::string sessionId;
    Options opts;
    std::unique_ptr<boost::asio::steady_timer> wake;

    bool initialized{false};
    bool closed{false};
    bool streamOpen{false};

    std::uint64_t nextEventId{1};
    std::deque<Event> pending;
    std::deque<Event> history;

    RequestHandler requestHandler;
    NotificationHandler notificationHandler;
    CloseHandler closeHandler;
};

} // namespace mcpgw
