//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/GatewayServer.cpp
// Purpose: HTTP/HTTPS gateway listener using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <atomic>
#include <cstdint>
#include <map>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "mcpgw/GatewayServer.hpp"
#include "mcpgw/http/BeastResponseSink.hpp"

namespace mcpgw {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

GatewayServer::Options GatewayServer::Options::FromConfig(const GatewayConfig& config) {
    Options o;
    o.address = config.address;
    o.port = config.port;
    o.scheme = config.UsesTls() ? "https" : "http";
    o.certFile = config.certFile;
    o.keyFile = config.keyFile;
    return o;
}

class GatewayServer::Impl {
public:
    // Connection bookkeeping used by Stop() to wake connections parked between requests.
    struct Connection {
        std::function<void()> cancel;
        bool idle{true};
    };

    GatewayServer::Options opts;
    GatewayRouter& router;
    std::atomic<bool> running{false};
    std::atomic<unsigned short> boundPort{0};
    std::atomic<std::size_t> activeConnections{0};

    net::io_context ioc;
    net::executor_work_guard<net::io_context::executor_type> work;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::thread ioThread;

    std::map<std::uint64_t, Connection> connections; // I/O thread only
    std::uint64_t nextConnectionId{1};

    GatewayServer::ErrorHandler errorHandler;

    Impl(const GatewayServer::Options& o, GatewayRouter& r)
        : opts(o), router(r), work(net::make_work_guard(ioc)) {
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("GatewayServer: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        }
    }

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void setError(const std::string& msg) {
        if (errorHandler) {
            errorHandler(msg);
        } else {
            LOG_WARN("{}", msg);
        }
    }

    void reportConnectionError(const char* kind, const std::exception& e) {
        if (!running.load()) {
            LOG_DEBUG("GatewayServer {} connection ended during shutdown: {}", kind, e.what());
        } else {
            setError(std::string("GatewayServer ") + kind + " connection error: " + e.what());
        }
    }

    std::uint64_t track(std::function<void()> cancel) {
        const std::uint64_t id = nextConnectionId++;
        connections[id] = Connection{std::move(cancel), true};
        activeConnections.fetch_add(1);
        return id;
    }

    void untrack(std::uint64_t id) {
        if (connections.erase(id) > 0) {
            activeConnections.fetch_sub(1);
        }
    }

    static std::string remoteOf(const tcp::socket& socket) {
        boost::system::error_code ec;
        const tcp::endpoint ep = socket.remote_endpoint(ec);
        if (ec) {
            return std::string("unknown");
        }
        return ep.address().to_string() + ":" + std::to_string(ep.port());
    }

    //==========================================================================================================
    // Request/response loop shared by plain and TLS connections. Returns when the peer closes, the
    // idle timeout fires, a response asks for close, or the server stops.
    //==========================================================================================================
    template <class Stream>
    net::awaitable<void> serve(Stream& stream, const std::string& remote, std::uint64_t connectionId) {
        beast::flat_buffer buffer;
        for (;;) {
            if (!running.load()) {
                co_return;
            }
            http::request_parser<http::string_body> parser;
            parser.body_limit(opts.maxBodyBytes);

            connections[connectionId].idle = true;
            beast::get_lowest_layer(stream).expires_after(opts.idleTimeout);
            boost::system::error_code ec;
            co_await http::async_read(stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
            connections[connectionId].idle = false;

            if (ec == http::error::end_of_stream) {
                co_return;
            }
            if (ec == http::error::body_limit) {
                LOG_WARN("GatewayServer: request body from {} exceeds {} bytes", remote, opts.maxBodyBytes);
                co_await sendPayloadTooLarge(stream);
                co_return;
            }
            if (ec) {
                LOG_DEBUG("GatewayServer: read from {} ended: {}", remote, ec.message());
                co_return;
            }

            HttpRequest req = parser.release();
            LOG_DEBUG("GatewayServer: {} {} from {}", std::string(req.method_string()), std::string(req.target()), remote);

            BeastResponseSink<Stream> sink(stream, opts.writeTimeout);
            const RequestContext ctx{remote};
            co_await router.Handle(req, sink, ctx);
            beast::get_lowest_layer(stream).expires_never();

            if (sink.CloseRequested() || !req.keep_alive()) {
                co_return;
            }
        }
    }

    template <class Stream>
    net::awaitable<void> sendPayloadTooLarge(Stream& stream) {
        HttpResponse res{http::status::payload_too_large, 11};
        res.set(http::field::server, "mcpgw");
        res.set(http::field::content_type, "text/plain; charset=utf-8");
        res.keep_alive(false);
        res.body() = "Payload too large";
        res.prepare_payload();
        boost::system::error_code ec;
        beast::get_lowest_layer(stream).expires_after(opts.writeTimeout);
        co_await http::async_write(stream, res, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            LOG_DEBUG("GatewayServer: 413 reply not delivered: {}", ec.message());
        }
    }

    net::awaitable<void> connection_plain(tcp::socket socket) {
        const std::string remote = remoteOf(socket);
        beast::tcp_stream stream(std::move(socket));
        const std::uint64_t id = track([&stream]() { stream.cancel(); });
        try {
            co_await serve(stream, remote, id);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
            if (ec && ec != net::error::not_connected) {
                LOG_DEBUG("GatewayServer: shutdown of {} failed: {}", remote, ec.message());
            }
        } catch (const std::exception& e) {
            reportConnectionError("plain", e);
        }
        untrack(id);
    }

    net::awaitable<void> connection_tls(tcp::socket socket) {
        const std::string remote = remoteOf(socket);
        beast::ssl_stream<beast::tcp_stream> stream(std::move(socket), *sslCtx);
        const std::uint64_t id = track([&stream]() { beast::get_lowest_layer(stream).cancel(); });
        try {
            beast::get_lowest_layer(stream).expires_after(opts.idleTimeout);
            co_await stream.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serve(stream, remote, id);
            boost::system::error_code ec;
            beast::get_lowest_layer(stream).expires_after(opts.writeTimeout);
            co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
            if (ec && ec != net::ssl::error::stream_truncated) {
                LOG_DEBUG("GatewayServer: TLS shutdown of {} failed: {}", remote, ec.message());
            }
        } catch (const std::exception& e) {
            reportConnectionError("TLS", e);
        }
        untrack(id);
    }

    void bind() {
        tcp::resolver resolver(ioc);
        auto results = resolver.resolve(opts.address, std::to_string(opts.port));
        tcp::endpoint ep = *results.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort.store(acceptor->local_endpoint().port());
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (!running.load()) {
                    break;
                }
                if (sslCtx) {
                    net::co_spawn(ioc, connection_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, connection_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const boost::system::system_error& e) {
            if (!running.load()) {
                // operation_aborted once the acceptor is closed
                LOG_DEBUG("GatewayServer accept ended during shutdown: {}", e.what());
            } else {
                setError(std::string("GatewayServer accept error: ") + e.what());
            }
        }
        co_return;
    }

    // Runs on the I/O thread.
    void beginShutdown() {
        if (acceptor) {
            boost::system::error_code ec;
            acceptor->close(ec);
        }
        router.CloseAllSessions();
        for (auto& [id, conn] : connections) {
            if (conn.idle && conn.cancel) {
                conn.cancel();
            }
        }
    }
};

GatewayServer::GatewayServer(const Options& opts, GatewayRouter& router)
    : pImpl(std::make_unique<Impl>(opts, router)) {}

GatewayServer::~GatewayServer() {
    if (pImpl->running.load()) {
        Stop().get();
    }
}

std::future<void> GatewayServer::Start() {
    std::promise<void> ready;
    auto fut = ready.get_future();
    try {
        pImpl->bind();
    } catch (const std::exception& e) {
        LOG_ERROR("GatewayServer: cannot listen on {}:{}: {}", pImpl->opts.address, pImpl->opts.port, e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running.store(true);
    LOG_INFO("GatewayServer: listening on {}://{}:{}", pImpl->opts.scheme, pImpl->opts.address, pImpl->boundPort.load());
    pImpl->ioThread = std::thread([this]() {
        try {
            net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            pImpl->setError(std::string("GatewayServer I/O thread error: ") + e.what());
        }
    });
    ready.set_value();
    return fut;
}

std::future<void> GatewayServer::Stop() {
    std::promise<void> done;
    auto fut = done.get_future();
    if (pImpl->running.exchange(false)) {
        LOG_INFO("GatewayServer: stopping");
        const auto deadline = std::chrono::steady_clock::now() + pImpl->opts.shutdownGrace;
        auto started = std::make_shared<std::promise<void>>();
        std::future<void> startedFuture = started->get_future();
        net::post(pImpl->ioc, [impl = pImpl.get(), started]() {
            impl->beginShutdown();
            started->set_value();
        });
        pImpl->work.reset();
        if (startedFuture.wait_until(deadline) != std::future_status::ready) {
            LOG_WARN("GatewayServer: I/O thread did not acknowledge shutdown in time");
        }

        while (pImpl->activeConnections.load() > 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (pImpl->activeConnections.load() > 0) {
            LOG_WARN("GatewayServer: {} connection(s) still busy after grace period", pImpl->activeConnections.load());
        }
    }
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    done.set_value();
    return fut;
}

void GatewayServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

unsigned short GatewayServer::BoundPort() const {
    return pImpl->boundPort.load();
}

} // namespace mcpgw
