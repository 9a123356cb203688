//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/GatewayRouter.cpp
// Purpose: Gateway request routing and session lifecycle transitions
//==========================================================================================================

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/this_coro.hpp>

#include "logging/Logger.h"
#include "mcpgw/Discovery.h"
#include "mcpgw/GatewayRouter.h"
#include "mcpgw/Protocol.h"
#include "mcpgw/errors/Errors.h"

namespace mcpgw {
namespace net = boost::asio;
namespace http = boost::beast::http;

namespace {
    bool startsWith(const std::string& s, const std::string& prefix) {
        return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
    }

    //==========================================================================================================
    // CorsSink
    // Purpose: Adds the CORS response headers to whatever the wrapped sink sends.
    //==========================================================================================================
    class CorsSink : public IResponseSink {
    public:
        explicit CorsSink(IResponseSink& inner) : inner(inner) {}

        net::awaitable<void> Send(HttpResponse res) override {
            decorate(res);
            co_await inner.Send(std::move(res));
        }

        net::awaitable<bool> OpenStream(StreamHeader header) override {
            decorate(header);
            co_return co_await inner.OpenStream(std::move(header));
        }

        net::awaitable<bool> WriteStream(std::string data) override {
            co_return co_await inner.WriteStream(std::move(data));
        }

        net::awaitable<void> CloseStream() override {
            co_await inner.CloseStream();
        }

        bool HeadersSent() const override { return inner.HeadersSent(); }
        void RequestClose() override { inner.RequestClose(); }

    private:
        template <class Message>
        static void decorate(Message& m) {
            m.set(http::field::access_control_allow_origin, "*");
            m.set(http::field::access_control_expose_headers, Headers::SessionId);
        }

        IResponseSink& inner;
    };

    HttpResponse sessionError(const HttpRequest& req, const std::string& message) {
        const errors::GatewayError err = errors::sessionFailure(message);
        return MakeJsonResponse(req, static_cast<http::status>(errors::httpStatusForCategory(err.category)),
                                errors::makeErrorEnvelope(err));
    }

    HttpResponse methodNotAllowed(const HttpRequest& req, const char* allow) {
        HttpResponse res = MakeResponse(req, http::status::method_not_allowed, "Method not allowed");
        res.set(http::field::allow, allow);
        return res;
    }
}

GatewayRouter::GatewayRouter(const GatewayConfig& config, auth::AuthGate& gate, SessionRegistry& registry,
                             auth::TokenValidationCache& cache, SessionFactory sessionFactory)
    : config(config), gate(gate), registry(registry), cache(cache), sessionFactory(std::move(sessionFactory)) {
}

net::awaitable<void> GatewayRouter::Handle(const HttpRequest& req, IResponseSink& sink, const RequestContext& ctx) {
    CorsSink cors(sink);
    bool faulted = false;
    std::string what;
    try {
        co_await route(req, cors, ctx);
    } catch (const std::exception& e) {
        faulted = true;
        what = e.what();
    }
    if (!faulted) {
        co_return;
    }

    LOG_ERROR("GatewayRouter: {} {} failed: {}", std::string(req.method_string()), RequestPath(req), what);
    if (cors.HeadersSent()) {
        // Part of a reply is already on the wire; the only clean signal left is closing the connection
        cors.RequestClose();
        co_return;
    }

    bool sendFailed = false;
    try {
        const errors::GatewayError err = errors::internalFault("Internal server error");
        co_await cors.Send(MakeJsonResponse(req, http::status::internal_server_error, errors::makeErrorEnvelope(err)));
    } catch (const std::exception& e) {
        sendFailed = true;
        what = e.what();
    }
    if (sendFailed) {
        LOG_DEBUG("GatewayRouter: could not deliver 500 reply: {}", what);
        cors.RequestClose();
    }
}

void GatewayRouter::CloseAllSessions() {
    registry.CloseAll();
}

net::awaitable<void> GatewayRouter::route(const HttpRequest& req, IResponseSink& sink, const RequestContext& ctx) {
    if (req.method() == http::verb::options) {
        co_await sink.Send(preflight(req));
        co_return;
    }

    auth::AuthDecision decision = co_await gate.Check(req, ctx.remoteAddress);
    if (decision.outcome == auth::AuthDecision::Outcome::Rejected) {
        co_await sink.Send(std::move(decision.response.value()));
        co_return;
    }
    const auth::Claims* claims = decision.claims.has_value() ? &decision.claims.value() : nullptr;

    const std::string path = RequestPath(req);
    if (path == Paths::Health) {
        if (req.method() != http::verb::get && req.method() != http::verb::head) {
            co_await sink.Send(methodNotAllowed(req, "GET"));
            co_return;
        }
        co_await sink.Send(health(req));
        co_return;
    }
    if (startsWith(path, Paths::WellKnownPrefix)) {
        co_await handleWellKnown(req, sink);
        co_return;
    }
    if (path == Paths::Mcp) {
        switch (req.method()) {
            case http::verb::post:
                co_await handleMcpPost(req, sink, claims);
                break;
            case http::verb::get:
                co_await handleMcpGet(req, sink, claims);
                break;
            case http::verb::delete_:
                co_await handleMcpDelete(req, sink, claims);
                break;
            default:
                co_await sink.Send(methodNotAllowed(req, "GET, POST, DELETE, OPTIONS"));
                break;
        }
        co_return;
    }
    co_await sink.Send(MakeResponse(req, http::status::not_found, "Not found"));
}

HttpResponse GatewayRouter::preflight(const HttpRequest& req) const {
    HttpResponse res = MakeResponse(req, http::status::no_content, std::string());
    res.set(http::field::access_control_allow_methods, "GET, POST, DELETE, OPTIONS");
    const std::string requested = HeaderValue(req, "Access-Control-Request-Headers");
    res.set(http::field::access_control_allow_headers, requested.empty() ? std::string("*") : requested);
    res.set(http::field::vary, "Access-Control-Request-Headers");
    return res;
}

HttpResponse GatewayRouter::health(const HttpRequest& req) const {
    discovery::HealthSnapshot s;
    s.sessions = registry.Size();
    s.cacheSize = cache.Size();
    s.cacheActive = cache.ActiveCount();
    s.ttlSeconds = static_cast<long long>(config.cacheTtl.count());
    s.cacheMaxSize = cache.MaxEntries();
    return MakeJsonResponse(req, http::status::ok, discovery::HealthDocument(s));
}

net::awaitable<void> GatewayRouter::handleWellKnown(const HttpRequest& req, IResponseSink& sink) {
    if (req.method() != http::verb::get && req.method() != http::verb::head) {
        co_await sink.Send(methodNotAllowed(req, "GET"));
        co_return;
    }
    const std::string path = RequestPath(req);
    std::optional<std::string> doc;
    if (path == Paths::ProtectedResource || path == Paths::ProtectedResourceMcp) {
        doc = discovery::ProtectedResourceMetadata(config);
    } else if (path == Paths::AuthorizationServer || path == Paths::AuthorizationServerMcp) {
        doc = discovery::AuthorizationServerMetadata(config);
    } else if (path == Paths::McpOAuth) {
        doc = discovery::McpOAuthMetadata(config);
    } else {
        co_await sink.Send(MakeResponse(req, http::status::not_found, "Not found"));
        co_return;
    }
    if (!doc.has_value()) {
        co_await sink.Send(MakeResponse(req, http::status::not_implemented, "OAuth not configured on this server"));
        co_return;
    }
    co_await sink.Send(MakeJsonResponse(req, http::status::ok, std::move(doc.value())));
}

net::awaitable<void> GatewayRouter::handleMcpPost(const HttpRequest& req, IResponseSink& sink,
                                                  const auth::Claims* claims) {
    const std::string sessionId = HeaderValue(req, Headers::SessionId);
    if (!sessionId.empty()) {
        std::shared_ptr<ISessionTransport> transport = registry.Find(sessionId);
        if (!transport) {
            LOG_WARN("GatewayRouter: POST for unknown session {}", sessionId);
            co_await sink.Send(sessionError(req, "Bad Request: No valid session ID provided"));
            co_return;
        }
        LOG_DEBUG("GatewayRouter: request for session {}", sessionId);
        co_await transport->HandleRequest(req, sink, claims);
        co_return;
    }

    if (!IsInitializeRequest(req.body())) {
        co_await sink.Send(sessionError(req, "Bad Request: No valid session ID provided"));
        co_return;
    }

    auto executor = co_await net::this_coro::executor;
    std::shared_ptr<ISessionTransport> transport = registry.Create(
        [this, &executor](const std::string& id) { return sessionFactory(id, executor); });
    const std::string newId = transport->GetSessionId();
    LOG_INFO("GatewayRouter: new session {} for {}", newId, claims ? claims->subject : std::string("anonymous"));

    std::exception_ptr failure;
    try {
        co_await transport->HandleRequest(req, sink, claims);
    } catch (const std::exception&) {
        failure = std::current_exception();
    }
    if (!transport->IsInitialized()) {
        LOG_WARN("GatewayRouter: session {} did not complete initialization; discarding", newId);
        transport->Close();
        registry.Remove(newId);
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
}

net::awaitable<void> GatewayRouter::handleMcpGet(const HttpRequest& req, IResponseSink& sink,
                                                 const auth::Claims* claims) {
    const std::string sessionId = HeaderValue(req, Headers::SessionId);
    std::shared_ptr<ISessionTransport> transport = sessionId.empty() ? nullptr : registry.Find(sessionId);
    if (!transport) {
        co_await sink.Send(sessionError(req, "Bad Request: Invalid or missing session ID"));
        co_return;
    }
    const std::string lastEventId = HeaderValue(req, Headers::LastEventId);
    if (!lastEventId.empty()) {
        LOG_INFO("GatewayRouter: session {} reconnecting with Last-Event-Id {}", sessionId, lastEventId);
    } else {
        LOG_INFO("GatewayRouter: establishing push stream for session {}", sessionId);
    }
    co_await transport->HandleRequest(req, sink, claims);
}

net::awaitable<void> GatewayRouter::handleMcpDelete(const HttpRequest& req, IResponseSink& sink,
                                                    const auth::Claims* claims) {
    const std::string sessionId = HeaderValue(req, Headers::SessionId);
    if (sessionId.empty()) {
        co_await sink.Send(sessionError(req, "Bad Request: Invalid or missing session ID"));
        co_return;
    }
    std::shared_ptr<ISessionTransport> transport = registry.Find(sessionId);
    if (!transport) {
        if (registry.WasTerminated(sessionId)) {
            LOG_DEBUG("GatewayRouter: repeated termination of session {}", sessionId);
            co_await sink.Send(MakeResponse(req, http::status::ok, std::string()));
            co_return;
        }
        co_await sink.Send(sessionError(req, "Bad Request: Invalid or missing session ID"));
        co_return;
    }
    LOG_INFO("GatewayRouter: termination requested for session {}", sessionId);
    co_await transport->HandleRequest(req, sink, claims);
    registry.Remove(sessionId);
}

} // namespace mcpgw
