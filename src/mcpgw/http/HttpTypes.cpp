//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/http/HttpTypes.cpp
// Purpose: HTTP request/response helpers
//==========================================================================================================

#include <utility>

#include "mcpgw/http/HttpTypes.hpp"

namespace mcpgw {
namespace http = boost::beast::http;

std::string RequestPath(const HttpRequest& req) {
    const std::string target(req.target());
    const auto q = target.find('?');
    return (q == std::string::npos) ? target : target.substr(0, q);
}

std::string HeaderValue(const HttpRequest& req, const std::string& name) {
    auto it = req.find(name);
    if (it == req.end()) {
        return std::string();
    }
    return std::string(it->value());
}

HttpResponse MakeResponse(const HttpRequest& req, HttpStatus status, std::string body,
                          const std::string& contentType) {
    HttpResponse res{status, req.version()};
    res.set(http::field::server, "mcpgw");
    if (!body.empty() || status != HttpStatus::no_content) {
        res.set(http::field::content_type, contentType);
    }
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

HttpResponse MakeJsonResponse(const HttpRequest& req, HttpStatus status, std::string body) {
    return MakeResponse(req, status, std::move(body), "application/json");
}

} // namespace mcpgw
