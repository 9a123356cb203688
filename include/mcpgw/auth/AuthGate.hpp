//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AuthGate.hpp
// Purpose: Per-request bearer authentication middleware for the gateway's protected routes
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include <boost/asio/awaitable.hpp>

#include "mcpgw/Config.hpp"
#include "mcpgw/auth/Claims.hpp"
#include "mcpgw/auth/TokenValidator.hpp"
#include "mcpgw/errors/Errors.h"
#include "mcpgw/http/HttpTypes.hpp"

namespace mcpgw::auth {

//==========================================================================================================
// AuthGateOptions
// Fields:
//   identityProviderConfigured: When false every protected request answers 500.
//   realm: Realm advertised in WWW-Authenticate (externally visible gateway URL).
//   resourceMetadataUrl: Protected-resource metadata URL advertised in WWW-Authenticate.
//   protectedPrefix: Requests whose path starts with this prefix need a bearer token.
//==========================================================================================================
struct AuthGateOptions {
    bool identityProviderConfigured{false};
    std::string realm;
    std::string resourceMetadataUrl;
    std::string protectedPrefix{"/mcp"};

    static AuthGateOptions FromConfig(const GatewayConfig& config);
};

//==========================================================================================================
// AuthDecision
// Purpose: Outcome of gating one request.
// Fields:
//   outcome: Allowed (no credential needed), Authenticated (claims set) or Rejected (response set).
//   claims: Caller identity when Authenticated.
//   response: Ready-to-send 401/500 reply when Rejected.
//   category: AuthenticationFailure or ConfigurationFault when Rejected.
//==========================================================================================================
struct AuthDecision {
    enum class Outcome { Allowed, Authenticated, Rejected };

    Outcome outcome{Outcome::Allowed};
    std::optional<Claims> claims;
    std::optional<HttpResponse> response;
    errors::ErrorCategory category{errors::ErrorCategory::AuthenticationFailure};
};

class AuthGate {
public:
    AuthGate(TokenValidator& validator, AuthGateOptions opts);

    //==========================================================================================================
    // Check
    // Purpose: Applies exemptions, extracts the bearer credential and verifies it.
    // Args:
    //   req: Inbound request.
    //   remoteAddress: Peer address, for logs only.
    //==========================================================================================================
    boost::asio::awaitable<AuthDecision> Check(const HttpRequest& req, const std::string& remoteAddress = std::string());

    // True for /health, /.well-known/* and any OPTIONS request.
    bool IsExempt(const HttpRequest& req) const;

    //==========================================================================================================
    // ExtractBearer
    // Purpose: Returns the credential from an Authorization value. The scheme match is case-insensitive
    //          and surrounding whitespace is trimmed.
    // Returns:
    //   std::nullopt when the header is empty, uses another scheme, or carries no credential.
    //==========================================================================================================
    static std::optional<std::string> ExtractBearer(const std::string& authorization);

private:
    HttpResponse unauthorized(const HttpRequest& req, bool invalidToken) const;

    TokenValidator& validator;
    AuthGateOptions opts;
};

} // namespace mcpgw::auth
