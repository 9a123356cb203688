//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Claims.hpp
// Purpose: Identity claims resolved for an authenticated request and the per-request accessor
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "mcpgw/JSONRPCTypes.h"

namespace mcpgw::auth {

//==========================================================================================================
// Claims
// Purpose: Identity data returned by the identity provider for a valid credential.
// Fields:
//   subject: Provider subject identifier ("sub"). Never empty for a successfully verified token.
//   email: Provider "email" claim when present as a string.
//   raw: The complete provider payload (JSON object) for anything else a handler may need.
//==========================================================================================================
struct Claims {
    std::string subject;
    std::optional<std::string> email;
    JSONValue raw;
};

//==========================================================================================================
// ClaimsFromUserInfo
// Purpose: Builds Claims from a parsed userinfo document.
// Returns:
//   std::nullopt when the document is not an object or carries no non-empty string "sub".
//==========================================================================================================
std::optional<Claims> ClaimsFromUserInfo(const JSONValue& doc);

//==========================================================================================================
// Per-request Claims context accessors
// Purpose: Provide access to the current request's Claims for protocol handlers. The scope is only
//          installed around synchronous handler invocations, never across a suspension point.
//==========================================================================================================
const Claims* CurrentClaims();

// RAII helper: sets the current Claims for the lifetime of this object, then restores the previous value.
class ClaimsScope {
public:
    explicit ClaimsScope(const Claims* claims);
    ~ClaimsScope();
    ClaimsScope(const ClaimsScope&) = delete;
    ClaimsScope& operator=(const ClaimsScope&) = delete;
private:
    const Claims* prev{nullptr};
};

} // namespace mcpgw::auth
