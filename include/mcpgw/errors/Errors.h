//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Gateway error taxonomy and HTTP/JSON-RPC mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "mcpgw/JSONRPCTypes.h"

namespace mcpgw {
namespace errors {

// Categorization of request-level failures surfaced by the gateway.
enum class ErrorCategory {
    ConfigurationFault,     // identity provider settings missing
    AuthenticationFailure,  // missing/invalid/expired credential
    SessionFailure,         // unknown, stale or client-supplied session id
    UpstreamFailure,        // identity provider unreachable; surfaced as AuthenticationFailure
    InternalFault           // anything unexpected while routing
};

// Typed error representation used by the router when building error replies.
struct GatewayError {
    ErrorCategory category{ErrorCategory::InternalFault};
    int rpcCode{JSONRPCErrorCodes::InternalError};
    std::string message;
};

// Map a category to the HTTP status the gateway answers with.
//
// Args:
//   category: Error category.
//
// Returns:
//   HTTP status code. Only ConfigurationFault and InternalFault produce 5xx.
inline int httpStatusForCategory(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::ConfigurationFault: return 500;
        case ErrorCategory::AuthenticationFailure: return 401;
        case ErrorCategory::SessionFailure: return 400;
        case ErrorCategory::UpstreamFailure: return 401;
        case ErrorCategory::InternalFault: return 500;
    }
    return 500;
}

inline const char* categoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::ConfigurationFault: return "ConfigurationFault";
        case ErrorCategory::AuthenticationFailure: return "AuthenticationFailure";
        case ErrorCategory::SessionFailure: return "SessionFailure";
        case ErrorCategory::UpstreamFailure: return "UpstreamFailure";
        case ErrorCategory::InternalFault: return "InternalFault";
    }
    return "Unknown";
}

// Convenience constructors for the two JSON-RPC envelopes the router emits.
inline GatewayError sessionFailure(const std::string& message) {
    return GatewayError{ErrorCategory::SessionFailure, JSONRPCErrorCodes::ServerBadRequest, message};
}

inline GatewayError internalFault(const std::string& message) {
    return GatewayError{ErrorCategory::InternalFault, JSONRPCErrorCodes::InternalError, message};
}

// Render the envelope {jsonrpc:"2.0", error:{code,message}, id:null} for a GatewayError.
//
// Args:
//   err: Error to serialize.
//
// Returns:
//   JSON text of the envelope.
inline std::string makeErrorEnvelope(const GatewayError& err) {
    return CreateErrorResponse(nullptr, err.rpcCode, err.message)->Serialize();
}

} // namespace errors
} // namespace mcpgw
