//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/auth/IdentityProvider.cpp
// Purpose: Coroutine HTTP(S) client for the identity provider userinfo endpoint
//==========================================================================================================

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>
#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "mcpgw/JSONRPCTypes.h"
#include "mcpgw/auth/IdentityProvider.hpp"
#include "mcpgw/version.h"

namespace mcpgw::auth {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

UrlParts ParseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t pos = 0;
    std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        parts.scheme = url.substr(0, schemeEnd);
        pos = schemeEnd + 3;
    } else {
        parts.scheme = std::string("http");
        pos = 0;
    }
    std::size_t slash = url.find('/', pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        parts.path = std::string("/");
    } else {
        hostPort = url.substr(pos, slash - pos);
        parts.path = url.substr(slash);
    }
    std::size_t colon = hostPort.find(':');
    if (colon == std::string::npos) {
        parts.host = hostPort;
        parts.port = (parts.scheme == std::string("https")) ? std::string("443") : std::string("80");
    } else {
        parts.host = hostPort.substr(0, colon);
        parts.port = hostPort.substr(colon + 1);
    }
    return parts;
}

namespace {
    // Shared with the deadline handler, which acts only while the call is still in flight
    struct CallDeadline {
        bool finished{false};
        bool fired{false};
        tcp::resolver* resolver{nullptr};
        beast::tcp_stream* stream{nullptr};
    };

    http::request<http::empty_body> makeUserInfoRequest(const UrlParts& u, const std::string& token) {
        http::request<http::empty_body> req{http::verb::get, u.path, 11};
        req.set(http::field::host, u.host);
        req.set(http::field::authorization, std::string("Bearer ") + token);
        req.set(http::field::accept, "application/json");
        req.set(http::field::connection, "close");
        req.set(http::field::user_agent, getUserAgent());
        return req;
    }

    ProviderResult interpret(const http::response<http::string_body>& res) {
        ProviderResult r;
        r.httpStatus = static_cast<int>(res.result_int());
        if (r.httpStatus < 200 || r.httpStatus >= 300) {
            r.error = std::string("provider status ") + std::to_string(r.httpStatus);
            return r;
        }
        JSONValue doc;
        try {
            doc = ParseJSON(res.body());
        } catch (const std::runtime_error& e) {
            r.error = std::string("provider body is not JSON: ") + e.what();
            return r;
        }
        std::optional<Claims> claims = ClaimsFromUserInfo(doc);
        if (!claims.has_value()) {
            r.error = "provider body has no subject";
            return r;
        }
        r.ok = true;
        r.claims = std::move(claims.value());
        return r;
    }
}

UserInfoClient::UserInfoClient(Options o) : opts(std::move(o)), target(ParseUrl(opts.userinfoUrl)) {
    if (target.scheme == std::string("https")) {
        sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
        ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_2_VERSION);
        try {
            if (!opts.caFile.empty()) {
                sslCtx->load_verify_file(opts.caFile);
            } else if (!opts.caPath.empty()) {
                sslCtx->add_verify_path(opts.caPath);
            } else {
                sslCtx->set_default_verify_paths();
            }
        } catch (const boost::system::system_error& e) {
            LOG_WARN("UserInfoClient: loading trust anchors failed: {}", e.what());
        }
        sslCtx->set_verify_mode(ssl::verify_peer);
    } else if (target.scheme != std::string("http")) {
        throw std::invalid_argument(std::string("Unsupported userinfo URL scheme: ") + target.scheme);
    }
}

UserInfoClient::~UserInfoClient() = default;

net::awaitable<ProviderResult> UserInfoClient::FetchClaims(const std::string& token) {
    ProviderResult result;
    const UrlParts& u = target;
    auto executor = co_await net::this_coro::executor;

    auto deadline = std::make_shared<CallDeadline>();
    net::steady_timer deadlineTimer(executor);
    deadlineTimer.expires_after(std::chrono::milliseconds(opts.totalTimeoutMs));
    deadlineTimer.async_wait([deadline](const boost::system::error_code& ec) {
        if (ec || deadline->finished) {
            return;
        }
        deadline->fired = true;
        if (deadline->resolver != nullptr) {
            deadline->resolver->cancel();
        }
        if (deadline->stream != nullptr) {
            deadline->stream->cancel();
        }
    });

    try {
        tcp::resolver resolver(executor);
        deadline->resolver = &resolver;
        auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);
        deadline->resolver = nullptr;
        LOG_DEBUG("UserInfoClient: resolved {}:{} path={}", u.host, u.port, u.path);

        http::request<http::empty_body> req = makeUserInfoRequest(u, token);
        beast::flat_buffer buffer;
        http::response<http::string_body> res;

        if (sslCtx) {
            beast::ssl_stream<beast::tcp_stream> stream(executor, *sslCtx);
            deadline->stream = &beast::get_lowest_layer(stream);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), u.host.c_str())) {
                LOG_WARN("UserInfoClient: SNI set failed for {}", u.host);
            }
            (void)::SSL_set1_host(stream.native_handle(), u.host.c_str());

            beast::get_lowest_layer(stream).expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await beast::get_lowest_layer(stream).async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

            beast::get_lowest_layer(stream).expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
            co_await http::async_write(stream, req, net::use_awaitable);
            co_await http::async_read(stream, buffer, res, net::use_awaitable);

            boost::system::error_code ec;
            co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
        } else {
            beast::tcp_stream stream(executor);
            deadline->stream = &stream;
            stream.expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.async_connect(results, net::use_awaitable);

            stream.expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
            co_await http::async_write(stream, req, net::use_awaitable);
            co_await http::async_read(stream, buffer, res, net::use_awaitable);

            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }
        deadline->stream = nullptr;
        result = interpret(res);
    } catch (const std::exception& e) {
        result.ok = false;
        result.httpStatus = 0;
        result.error = deadline->fired
            ? std::string("userinfo request timed out after ") + std::to_string(opts.totalTimeoutMs) + "ms"
            : std::string("userinfo request failed: ") + e.what();
    }
    deadline->finished = true;
    deadlineTimer.cancel();
    if (!result.ok) {
        LOG_DEBUG("UserInfoClient: {}", result.error);
    }
    co_return result;
}

} // namespace mcpgw::auth
