//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/auth/TokenExpiry.cpp
// Purpose: JWT payload decoding for the local expiry short-circuit
//==========================================================================================================

#include <chrono>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/evp.h>

#include "mcpgw/JSONRPCTypes.h"
#include "mcpgw/auth/TokenExpiry.hpp"

namespace mcpgw::auth {

namespace {
    std::vector<std::string> splitDots(const std::string& s) {
        std::vector<std::string> parts;
        size_t start = 0;
        while (true) {
            size_t dot = s.find('.', start);
            if (dot == std::string::npos) {
                parts.push_back(s.substr(start));
                break;
            }
            parts.push_back(s.substr(start, dot - start));
            start = dot + 1;
        }
        return parts;
    }
}

std::optional<std::string> Base64UrlDecode(const std::string& input) {
    std::string b64;
    b64.reserve(input.size() + 3);
    for (char c : input) {
        if (c == '-') {
            b64.push_back('+');
        } else if (c == '_') {
            b64.push_back('/');
        } else if (c == '+' || c == '/') {
            return std::nullopt;
        } else {
            b64.push_back(c);
        }
    }
    while (!b64.empty() && b64.back() == '=') {
        b64.pop_back();
    }
    if (b64.empty()) {
        return std::string();
    }
    if (b64.size() % 4 == 1) {
        return std::nullopt;
    }
    const size_t padding = (4 - (b64.size() % 4)) % 4;
    b64.append(padding, '=');

    std::vector<unsigned char> out((b64.size() / 4) * 3);
    const int n = ::EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(b64.data()),
                                    static_cast<int>(b64.size()));
    if (n < 0 || static_cast<size_t>(n) < padding) {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts the zero bytes produced by padding
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(n) - padding);
}

std::optional<TimePoint> ExtractExpiry(const std::string& rawToken) {
    const std::vector<std::string> parts = splitDots(rawToken);
    if (parts.size() != 3 || parts[1].empty()) {
        return std::nullopt;
    }
    std::optional<std::string> payload = Base64UrlDecode(parts[1]);
    if (!payload.has_value()) {
        return std::nullopt;
    }

    JSONValue doc;
    try {
        doc = ParseJSON(payload.value());
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
    std::optional<double> exp = GetNumberMember(doc, "exp");
    if (!exp.has_value() || !std::isfinite(exp.value())) {
        return std::nullopt;
    }
    // Saturate values outside what TimePoint::duration can hold (about +/-292 years at nanosecond ticks)
    const double limit =
        std::chrono::duration_cast<std::chrono::duration<double>>(TimePoint::duration::max()).count();
    if (exp.value() >= limit) {
        return TimePoint::max();
    }
    if (exp.value() <= -limit) {
        return TimePoint::min();
    }
    const auto millis = std::chrono::duration<double, std::milli>(exp.value() * 1000.0);
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::duration_cast<std::chrono::milliseconds>(millis)));
}

} // namespace mcpgw::auth
