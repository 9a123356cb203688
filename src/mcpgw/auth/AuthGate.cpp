//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/auth/AuthGate.cpp
// Purpose: Bearer authentication middleware
//==========================================================================================================

#include <cctype>
#include <utility>

#include "logging/Logger.h"
#include "mcpgw/Protocol.h"
#include "mcpgw/auth/AuthGate.hpp"
#include "mcpgw/auth/WwwAuthenticate.hpp"

namespace mcpgw::auth {
namespace http = boost::beast::http;

namespace {
    bool icaseEqual(char a, char b) {
        return (std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b)));
    }

    bool startsWith(const std::string& s, const std::string& prefix) {
        return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
    }

    std::string trim(const std::string& s) {
        size_t b = 0;
        size_t e = s.size();
        while (b < e && std::isspace(static_cast<unsigned char>(s[b])) != 0) {
            ++b;
        }
        while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])) != 0) {
            --e;
        }
        return s.substr(b, e - b);
    }
}

AuthGateOptions AuthGateOptions::FromConfig(const GatewayConfig& config) {
    AuthGateOptions o;
    o.identityProviderConfigured = config.IsIdentityProviderConfigured();
    o.realm = config.serverUrl;
    o.resourceMetadataUrl = config.ResourceMetadataUrl();
    return o;
}

AuthGate::AuthGate(TokenValidator& validator, AuthGateOptions opts)
    : validator(validator), opts(std::move(opts)) {
}

bool AuthGate::IsExempt(const HttpRequest& req) const {
    if (req.method() == http::verb::options) {
        return true;
    }
    const std::string path = RequestPath(req);
    return path == Paths::Health || startsWith(path, Paths::WellKnownPrefix);
}

std::optional<std::string> AuthGate::ExtractBearer(const std::string& authorization) {
    const std::string value = trim(authorization);
    static const std::string scheme = "bearer";
    if (value.size() <= scheme.size()) {
        return std::nullopt;
    }
    for (size_t i = 0; i < scheme.size(); ++i) {
        if (!icaseEqual(value[i], scheme[i])) {
            return std::nullopt;
        }
    }
    if (std::isspace(static_cast<unsigned char>(value[scheme.size()])) == 0) {
        return std::nullopt;
    }
    std::string token = trim(value.substr(scheme.size()));
    if (token.empty()) {
        return std::nullopt;
    }
    return token;
}

HttpResponse AuthGate::unauthorized(const HttpRequest& req, bool invalidToken) const {
    HttpResponse res = MakeResponse(req, http::status::unauthorized,
                                    invalidToken ? "Unauthorized" : "Unauthorized - No token");
    BearerChallenge challenge;
    challenge.realm = opts.realm;
    challenge.resourceMetadata = opts.resourceMetadataUrl;
    if (invalidToken) {
        challenge.error = "invalid_token";
    }
    res.set(http::field::www_authenticate, buildBearerChallenge(challenge));
    return res;
}

boost::asio::awaitable<AuthDecision> AuthGate::Check(const HttpRequest& req, const std::string& remoteAddress) {
    AuthDecision d;
    if (IsExempt(req) || !startsWith(RequestPath(req), opts.protectedPrefix)) {
        d.outcome = AuthDecision::Outcome::Allowed;
        co_return d;
    }

    if (!opts.identityProviderConfigured) {
        LOG_ERROR("AuthGate: identity provider domain not configured; refusing {}", RequestPath(req));
        d.outcome = AuthDecision::Outcome::Rejected;
        d.category = errors::ErrorCategory::ConfigurationFault;
        d.response = MakeResponse(req, http::status::internal_server_error, "Server misconfigured");
        co_return d;
    }

    std::optional<std::string> token = ExtractBearer(HeaderValue(req, "Authorization"));
    if (!token.has_value()) {
        LOG_WARN("AuthGate: no bearer token from {}", remoteAddress.empty() ? std::string("unknown") : remoteAddress);
        d.outcome = AuthDecision::Outcome::Rejected;
        d.category = errors::ErrorCategory::AuthenticationFailure;
        d.response = unauthorized(req, false);
        co_return d;
    }

    VerifyResult vr = co_await validator.Verify(std::move(token.value()));
    if (!vr.ok) {
        LOG_WARN("AuthGate: authentication failed from {} ({})",
                 remoteAddress.empty() ? std::string("unknown") : remoteAddress, vr.reason);
        d.outcome = AuthDecision::Outcome::Rejected;
        d.category = errors::ErrorCategory::AuthenticationFailure;
        d.response = unauthorized(req, true);
        co_return d;
    }

    LOG_DEBUG("AuthGate: authenticated {}", vr.claims.email.value_or(vr.claims.subject));
    d.outcome = AuthDecision::Outcome::Authenticated;
    d.claims = std::move(vr.claims);
    co_return d;
}

} // namespace mcpgw::auth
