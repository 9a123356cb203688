//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/TestSupport.hpp
// Purpose: Shared helpers for gateway tests (recording sink, coroutine runner, stub provider, tokens)
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/http.hpp>

#include <openssl/evp.h>

#include "mcpgw/JSONRPCTypes.h"
#include "mcpgw/auth/IdentityProvider.hpp"
#include "mcpgw/auth/TokenExpiry.hpp"
#include "mcpgw/http/HttpTypes.hpp"

namespace mcpgw::test {

//==========================================================================================================
// RecordingSink
// Purpose: IResponseSink that keeps everything written to it.
//==========================================================================================================
class RecordingSink : public IResponseSink {
public:
    boost::asio::awaitable<void> Send(HttpResponse res) override {
        response = std::move(res);
        co_return;
    }

    boost::asio::awaitable<bool> OpenStream(StreamHeader header) override {
        if (failWrites) {
            co_return false;
        }
        streamHeader = std::move(header);
        co_return true;
    }

    boost::asio::awaitable<bool> WriteStream(std::string data) override {
        if (failWrites) {
            co_return false;
        }
        chunks.push_back(std::move(data));
        co_return true;
    }

    boost::asio::awaitable<void> CloseStream() override {
        streamClosed = true;
        co_return;
    }

    bool HeadersSent() const override { return response.has_value() || streamHeader.has_value(); }
    void RequestClose() override { closeRequested = true; }

    int Status() const { return response.has_value() ? static_cast<int>(response->result_int()) : 0; }
    std::string Body() const { return response.has_value() ? response->body() : std::string(); }

    std::string Header(const std::string& name) const {
        if (!response.has_value()) {
            return std::string();
        }
        auto it = response->find(name);
        return it == response->end() ? std::string() : std::string(it->value());
    }

    std::string StreamText() const {
        std::string all;
        for (const auto& c : chunks) {
            all += c;
        }
        return all;
    }

    std::optional<HttpResponse> response;
    std::optional<StreamHeader> streamHeader;
    std::vector<std::string> chunks;
    bool streamClosed{false};
    bool closeRequested{false};
    bool failWrites{false};
};

// Runs aw to completion on ioc and returns its result (rethrows its exception).
template <class T>
T RunAwaitable(boost::asio::io_context& ioc, boost::asio::awaitable<T> aw) {
    auto fut = boost::asio::co_spawn(ioc, std::move(aw), boost::asio::use_future);
    ioc.restart();
    ioc.run();
    return fut.get();
}

inline HttpRequest MakeRequest(boost::beast::http::verb verb, const std::string& target, const std::string& body = std::string(),
                               std::initializer_list<std::pair<std::string, std::string>> headers = {}) {
    HttpRequest req{verb, target, 11};
    req.set(boost::beast::http::field::host, "localhost");
    for (const auto& h : headers) {
        req.set(h.first, h.second);
    }
    if (!body.empty()) {
        req.set(boost::beast::http::field::content_type, "application/json");
        req.body() = body;
    }
    req.prepare_payload();
    return req;
}

inline std::string InitializeBody(const std::string& id = "1") {
    return std::string("{\"jsonrpc\":\"2.0\",\"id\":") + id +
           ",\"method\":\"initialize\",\"params\":{\"protocolVersion\":\"2025-03-26\","
           "\"capabilities\":{},\"clientInfo\":{\"name\":\"test-client\",\"version\":\"1.0\"}}}";
}

inline std::string PingBody(const std::string& id = "2") {
    return std::string("{\"jsonrpc\":\"2.0\",\"id\":") + id + ",\"method\":\"ping\"}";
}

// Base64url without padding.
inline std::string Base64UrlEncode(const std::string& raw) {
    std::string out(4 * ((raw.size() + 2) / 3) + 1, '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(raw.data()), static_cast<int>(raw.size()));
    out.resize(static_cast<size_t>(n));
    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    for (char& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return out;
}

// Three-segment token whose payload is payloadJson. The signature segment is not meaningful.
inline std::string MakeJwt(const std::string& payloadJson) {
    return Base64UrlEncode("{\"alg\":\"RS256\",\"typ\":\"JWT\"}") + "." + Base64UrlEncode(payloadJson) + ".c2ln";
}

inline std::string MakeJwtWithExp(std::int64_t expSeconds) {
    return MakeJwt(std::string("{\"sub\":\"auth0|jwt\",\"exp\":") + std::to_string(expSeconds) + "}");
}

inline std::int64_t ToUnixSeconds(auth::TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

//==========================================================================================================
// StubIdentityProvider
// Purpose: In-memory provider keyed by raw token. Unknown tokens answer 401.
//==========================================================================================================
class StubIdentityProvider : public auth::IIdentityProvider {
public:
    void Accept(const std::string& token, const std::string& sub, const std::optional<std::string>& email = std::nullopt) {
        auth::ProviderResult r;
        r.ok = true;
        r.httpStatus = 200;
        r.claims.subject = sub;
        r.claims.email = email;
        results[token] = r;
    }

    boost::asio::awaitable<auth::ProviderResult> FetchClaims(const std::string& token) override {
        ++calls;
        if (throwOnCall) {
            throw std::runtime_error("connection refused");
        }
        auto it = results.find(token);
        if (it != results.end()) {
            co_return it->second;
        }
        auth::ProviderResult r;
        r.ok = false;
        r.httpStatus = 401;
        r.error = "rejected by identity provider";
        co_return r;
    }

    int calls{0};
    bool throwOnCall{false};
    std::map<std::string, auth::ProviderResult> results;
};

// Manually advanced clock for cache/validator tests.
struct ManualClock {
    auth::TimePoint now{std::chrono::system_clock::time_point(std::chrono::seconds(1700000000))};

    void Advance(std::chrono::seconds d) { now += d; }
};

} // namespace mcpgw::test
