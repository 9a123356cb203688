//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/auth/TokenHasher.cpp
// Purpose: SHA-256 credential digest via OpenSSL EVP
//==========================================================================================================

#include <stdexcept>
#include <string>

#include <openssl/evp.h>

#include "mcpgw/auth/TokenHasher.hpp"

namespace mcpgw::auth {

TokenDigest Digest(const std::string& rawToken) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;
    if (::EVP_Digest(rawToken.data(), rawToken.size(), md, &mdLen, ::EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    static const char* kHex = "0123456789abcdef";
    TokenDigest out;
    out.reserve(static_cast<size_t>(mdLen) * 2);
    for (unsigned int i = 0; i < mdLen; ++i) {
        out.push_back(kHex[(md[i] >> 4) & 0x0F]);
        out.push_back(kHex[md[i] & 0x0F]);
    }
    return out;
}

std::string DigestPrefix(const TokenDigest& digest) {
    return digest.substr(0, 8);
}

} // namespace mcpgw::auth
