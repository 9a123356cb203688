//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/session/StreamableHTTPTransport.cpp
// Purpose: Streamable HTTP session transport implementation
//==========================================================================================================

#include <cctype>
#include <stdexcept>
#include <utility>
#include <vector>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "logging/Logger.h"
#include "mcpgw/Protocol.h"
#include "mcpgw/session/StreamableHTTPTransport.hpp"

namespace mcpgw {
namespace net = boost::asio;
namespace http = boost::beast::http;

namespace {
    bool acceptsEventStream(const std::string& accept) {
        if (accept.empty()) {
            return true;
        }
        return accept.find("text/event-stream") != std::string::npos ||
               accept.find("*/*") != std::string::npos;
    }

    bool parseEventId(const std::string& s, std::uint64_t& out) {
        if (s.empty() || s.size() > 19) {
            return false;
        }
        std::uint64_t v = 0;
        for (char c : s) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return false;
            }
            v = v * 10u + static_cast<std::uint64_t>(c - '0');
        }
        out = v;
        return true;
    }
}

StreamableHTTPTransport::StreamableHTTPTransport(std::string sessionId, net::any_io_executor executor, Options opts)
    : sessionId(std::move(sessionId)), opts(opts),
      wake(std::make_unique<net::steady_timer>(executor)) {
}

StreamableHTTPTransport::~StreamableHTTPTransport() = default;

net::awaitable<void> StreamableHTTPTransport::HandleRequest(const HttpRequest& req, IResponseSink& sink,
                                                            const auth::Claims* claims) {
    // Keep this transport alive across suspensions even if the registry drops it meanwhile
    auto self = shared_from_this();
    if (closed) {
        co_await sink.Send(rpcError(req, http::status::not_found, JSONRPCErrorCodes::ServerBadRequest,
                                    "Session terminated"));
        co_return;
    }
    switch (req.method()) {
        case http::verb::post:
            co_await handlePost(req, sink, claims);
            break;
        case http::verb::get:
            co_await handleGet(req, sink);
            break;
        case http::verb::delete_:
            co_await handleDelete(req, sink);
            break;
        default: {
            HttpResponse res = MakeResponse(req, http::status::method_not_allowed, "Method not allowed");
            res.set(http::field::allow, "GET, POST, DELETE");
            co_await sink.Send(std::move(res));
            break;
        }
    }
}

HttpResponse StreamableHTTPTransport::jsonReply(const HttpRequest& req, HttpStatus status, std::string body) const {
    HttpResponse res = MakeJsonResponse(req, status, std::move(body));
    if (initialized) {
        res.set(Headers::SessionId, sessionId);
    }
    return res;
}

HttpResponse StreamableHTTPTransport::rpcError(const HttpRequest& req, HttpStatus status, int code,
                                               const std::string& message) const {
    return jsonReply(req, status, CreateErrorResponse(nullptr, code, message)->Serialize());
}

std::unique_ptr<JSONRPCResponse> StreamableHTTPTransport::dispatchRequest(const JSONRPCRequest& req,
                                                                          const auth::Claims* claims) {
    std::unique_ptr<JSONRPCResponse> out;
    try {
        auth::ClaimsScope scope(claims);
        out = requestHandler ? requestHandler(req) : nullptr;
    } catch (const std::exception& e) {
        LOG_ERROR("Session {}: handler for '{}' threw: {}", sessionId, req.method, e.what());
        out = CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, e.what());
    }
    if (!out) {
        out = CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "No response from handler");
    }
    return out;
}

void StreamableHTTPTransport::dispatchNotification(std::unique_ptr<JSONRPCNotification> note,
                                                   const auth::Claims* claims) {
    if (!notificationHandler) {
        return;
    }
    const std::string method = note->method;
    try {
        auth::ClaimsScope scope(claims);
        notificationHandler(std::move(note));
    } catch (const std::exception& e) {
        LOG_ERROR("Session {}: notification handler for '{}' threw: {}", sessionId, method, e.what());
    }
}

net::awaitable<void> StreamableHTTPTransport::handlePost(const HttpRequest& req, IResponseSink& sink,
                                                         const auth::Claims* claims) {
    JSONValue body;
    bool parsed = true;
    try {
        body = ParseJSON(req.body());
    } catch (const std::runtime_error& e) {
        LOG_DEBUG("Session {}: unparseable body: {}", sessionId, e.what());
        parsed = false;
    }
    if (!parsed) {
        co_await sink.Send(rpcError(req, http::status::bad_request, JSONRPCErrorCodes::ParseError, "Parse error"));
        co_return;
    }

    std::vector<const JSONValue*> messages;
    const bool isBatch = body.IsArray();
    if (isBatch) {
        for (const auto& el : std::get<JSONValue::Array>(body.value)) {
            if (el) {
                messages.push_back(el.get());
            }
        }
    } else {
        messages.push_back(&body);
    }
    if (messages.empty()) {
        co_await sink.Send(rpcError(req, http::status::bad_request, JSONRPCErrorCodes::InvalidRequest,
                                    "Invalid Request: empty batch"));
        co_return;
    }

    bool hasInitialize = false;
    for (const JSONValue* m : messages) {
        if (ClassifyMessage(*m) == JSONRPCMessageKind::Request &&
            GetStringMember(*m, "method").value_or("") == Methods::Initialize) {
            hasInitialize = true;
        }
    }
    if (hasInitialize && initialized) {
        co_await sink.Send(rpcError(req, http::status::bad_request, JSONRPCErrorCodes::InvalidRequest,
                                    "Invalid Request: Server already initialized"));
        co_return;
    }
    if (hasInitialize && messages.size() > 1) {
        co_await sink.Send(rpcError(req, http::status::bad_request, JSONRPCErrorCodes::InvalidRequest,
                                    "Invalid Request: Only one initialization request is allowed"));
        co_return;
    }
    if (!hasInitialize && !initialized) {
        co_await sink.Send(rpcError(req, http::status::bad_request, JSONRPCErrorCodes::ServerBadRequest,
                                    "Bad Request: Server not initialized"));
        co_return;
    }

    std::vector<std::unique_ptr<JSONRPCResponse>> replies;
    for (const JSONValue* m : messages) {
        switch (ClassifyMessage(*m)) {
            case JSONRPCMessageKind::Request: {
                JSONRPCRequest rpc;
                if (!rpc.FromJSON(*m)) {
                    replies.push_back(CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest, "Invalid Request"));
                    break;
                }
                std::unique_ptr<JSONRPCResponse> out = dispatchRequest(rpc, claims);
                if (rpc.method == Methods::Initialize && !out->IsError()) {
                    initialized = true;
                    LOG_INFO("Session {}: initialized", sessionId);
                }
                replies.push_back(std::move(out));
                break;
            }
            case JSONRPCMessageKind::Notification: {
                auto note = std::make_unique<JSONRPCNotification>();
                if (note->FromJSON(*m)) {
                    dispatchNotification(std::move(note), claims);
                }
                break;
            }
            case JSONRPCMessageKind::Response:
                // Server-initiated requests are not issued, so client responses have nothing to complete
                LOG_DEBUG("Session {}: ignoring client response message", sessionId);
                break;
            case JSONRPCMessageKind::Invalid:
                replies.push_back(CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest, "Invalid Request"));
                break;
        }
    }

    if (replies.empty()) {
        HttpResponse res = MakeResponse(req, http::status::accepted, std::string());
        if (initialized) {
            res.set(Headers::SessionId, sessionId);
        }
        co_await sink.Send(std::move(res));
        co_return;
    }

    std::string out;
    if (isBatch) {
        out.push_back('[');
        for (size_t i = 0; i < replies.size(); ++i) {
            if (i > 0) {
                out.push_back(',');
            }
            out += replies[i]->Serialize();
        }
        out.push_back(']');
    } else {
        out = replies.front()->Serialize();
    }
    co_await sink.Send(jsonReply(req, http::status::ok, std::move(out)));
}

net::awaitable<void> StreamableHTTPTransport::handleGet(const HttpRequest& req, IResponseSink& sink) {
    if (!acceptsEventStream(HeaderValue(req, "Accept"))) {
        co_await sink.Send(rpcError(req, http::status::not_acceptable, JSONRPCErrorCodes::ServerBadRequest,
                                    "Not Acceptable: Client must accept text/event-stream"));
        co_return;
    }
    if (!initialized) {
        co_await sink.Send(rpcError(req, http::status::bad_request, JSONRPCErrorCodes::ServerBadRequest,
                                    "Bad Request: Server not initialized"));
        co_return;
    }
    if (streamOpen) {
        co_await sink.Send(rpcError(req, http::status::conflict, JSONRPCErrorCodes::ServerBadRequest,
                                    "Conflict: Only one SSE stream is allowed per session"));
        co_return;
    }

    // Collect replay before the stream header so the first writes are the resumed events
    std::vector<Event> replay;
    const std::string lastEventHeader = HeaderValue(req, Headers::LastEventId);
    if (!lastEventHeader.empty()) {
        std::uint64_t lastSeen = 0;
        if (parseEventId(lastEventHeader, lastSeen)) {
            for (const Event& ev : history) {
                if (ev.id > lastSeen) {
                    replay.push_back(ev);
                }
            }
            LOG_INFO("Session {}: resuming stream after event {} ({} replayed)", sessionId, lastSeen, replay.size());
        } else {
            LOG_WARN("Session {}: ignoring malformed Last-Event-Id", sessionId);
        }
    }

    StreamHeader header{http::status::ok, req.version()};
    header.set(http::field::content_type, "text/event-stream");
    header.set(http::field::cache_control, "no-cache");
    header.set(http::field::server, "mcpgw");
    header.set(Headers::SessionId, sessionId);
    header.keep_alive(req.keep_alive());

    streamOpen = true;
    if (!co_await sink.OpenStream(std::move(header))) {
        streamOpen = false;
        co_return;
    }

    bool peerGone = false;
    for (const Event& ev : replay) {
        if (!co_await sink.WriteStream(formatEvent(ev))) {
            peerGone = true;
            break;
        }
    }

    while (!peerGone && !closed) {
        while (!pending.empty() && !closed) {
            Event ev = std::move(pending.front());
            pending.pop_front();
            const std::string frame = formatEvent(ev);
            remember(std::move(ev));
            if (!co_await sink.WriteStream(frame)) {
                peerGone = true;
                break;
            }
        }
        if (peerGone || closed) {
            break;
        }

        boost::system::error_code ec;
        wake->expires_after(opts.keepalive);
        co_await wake->async_wait(net::redirect_error(net::use_awaitable, ec));
        if (closed) {
            break;
        }
        if (!ec && pending.empty()) {
            if (!co_await sink.WriteStream(": keepalive\n\n")) {
                peerGone = true;
            }
        }
        // operation_aborted: woken by SendNotification or Close
    }

    streamOpen = false;
    if (peerGone) {
        LOG_INFO("Session {}: push stream disconnected", sessionId);
        co_return;
    }
    co_await sink.CloseStream();
    LOG_DEBUG("Session {}: push stream ended", sessionId);
}

net::awaitable<void> StreamableHTTPTransport::handleDelete(const HttpRequest& req, IResponseSink& sink) {
    LOG_INFO("Session {}: terminated by client", sessionId);
    Close();
    co_await sink.Send(MakeResponse(req, http::status::ok, std::string()));
}

void StreamableHTTPTransport::Close() {
    if (closed) {
        return;
    }
    auto self = weak_from_this().lock();
    closed = true;
    wake->cancel();
    pending.clear();
    CloseHandler handler = std::move(closeHandler);
    closeHandler = nullptr;
    if (handler) {
        handler(sessionId);
    }
}

bool StreamableHTTPTransport::SendNotification(std::unique_ptr<JSONRPCNotification> notification) {
    if (closed || !notification) {
        return false;
    }
    if (pending.size() >= opts.maxPending) {
        LOG_WARN("Session {}: push queue full; dropping event {}", sessionId, pending.front().id);
        pending.pop_front();
    }
    pending.push_back(Event{nextEventId++, notification->Serialize()});
    wake->cancel();
    return true;
}

std::string StreamableHTTPTransport::formatEvent(const Event& ev) {
    std::string out = "id: " + std::to_string(ev.id) + "\nevent: message\n";
    // Every line of a multi-line payload needs its own data: prefix
    size_t start = 0;
    while (true) {
        const size_t nl = ev.data.find('\n', start);
        out += "data: ";
        out += ev.data.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        out += "\n";
        if (nl == std::string::npos) {
            break;
        }
        start = nl + 1;
    }
    out += "\n";
    return out;
}

void StreamableHTTPTransport::remember(Event ev) {
    if (opts.replayEvents == 0) {
        return;
    }
    history.push_back(std::move(ev));
    while (history.size() > opts.replayEvents) {
        history.pop_front();
    }
}

} // namespace mcpgw
