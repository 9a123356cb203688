//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: IdentityProvider.hpp
// Purpose: Authoritative remote credential check against an OIDC userinfo endpoint
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>

#include "mcpgw/auth/Claims.hpp"

namespace mcpgw::auth {

//==========================================================================================================
// ProviderResult
// Purpose: Outcome of one identity provider round trip.
// Fields:
//   ok: True when the provider accepted the credential and returned usable claims.
//   httpStatus: Provider HTTP status, or 0 when no response was received.
//   claims: Populated when ok.
//   error: Short diagnostic when !ok. Never contains the credential.
//==========================================================================================================
struct ProviderResult {
    bool ok{false};
    int httpStatus{0};
    Claims claims;
    std::string error;
};

//==========================================================================================================
// IIdentityProvider
// Purpose: Interface for the authoritative credential check. Implementations may throw on transport
//          failures; TokenValidator treats any exception like a rejection.
//==========================================================================================================
class IIdentityProvider {
public:
    virtual ~IIdentityProvider() = default;
    virtual boost::asio::awaitable<ProviderResult> FetchClaims(const std::string& token) = 0;
};

//==========================================================================================================
// UrlParts / ParseUrl
// Purpose: Minimal absolute URL split used by the provider client (scheme, host, port, path).
//          Missing scheme means http; missing port follows the scheme.
//==========================================================================================================
struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
};

UrlParts ParseUrl(const std::string& url);

//==========================================================================================================
// UserInfoClient
// Purpose: Presents the raw bearer token to GET <userinfoUrl> over http or https.
// Notes:
//   - Connect and read phases are each bounded by their own timeout, and totalTimeoutMs bounds the
//     whole call including name resolution.
//   - https uses TLS 1.2+ with peer verification, SNI and host name checking.
//   - 2xx with a JSON object carrying "sub" is success; anything else is a rejection.
//   - Network failures and timeouts are reported as ok=false rather than thrown.
//==========================================================================================================
class UserInfoClient : public IIdentityProvider {
public:
    struct Options {
        std::string userinfoUrl;
        unsigned int connectTimeoutMs{5000};
        unsigned int readTimeoutMs{5000};
        unsigned int totalTimeoutMs{10000};
        std::string caFile;
        std::string caPath;
    };

    explicit UserInfoClient(Options opts);
    ~UserInfoClient() override;

    boost::asio::awaitable<ProviderResult> FetchClaims(const std::string& token) override;

private:
    Options opts;
    UrlParts target;
    std::unique_ptr<boost::asio::ssl::context> sslCtx;
};

} // namespace mcpgw::auth
