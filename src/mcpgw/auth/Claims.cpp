//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/auth/Claims.cpp
// Purpose: Claims construction and thread-local request scope
//==========================================================================================================

#include "mcpgw/auth/Claims.hpp"

namespace mcpgw::auth {

namespace {
    // Thread-local storage for per-request Claims.
    thread_local const Claims* gCurrentClaims = nullptr;
}

std::optional<Claims> ClaimsFromUserInfo(const JSONValue& doc) {
    if (!doc.IsObject()) {
        return std::nullopt;
    }
    std::optional<std::string> sub = GetStringMember(doc, "sub");
    if (!sub.has_value() || sub->empty()) {
        return std::nullopt;
    }
    Claims c;
    c.subject = sub.value();
    c.email = GetStringMember(doc, "email");
    c.raw = doc;
    return c;
}

const Claims* CurrentClaims() {
    return gCurrentClaims;
}

ClaimsScope::ClaimsScope(const Claims* claims) : prev(gCurrentClaims) {
    gCurrentClaims = claims;
}

ClaimsScope::~ClaimsScope() {
    gCurrentClaims = prev;
}

} // namespace mcpgw::auth
