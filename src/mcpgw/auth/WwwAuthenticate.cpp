//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/auth/WwwAuthenticate.cpp
// Purpose: Bearer challenge builder and parser
//==========================================================================================================

#include <cctype>

#include "mcpgw/auth/WwwAuthenticate.hpp"

namespace mcpgw::auth {

namespace {
    std::string toLower(std::string s) {
        for (char& c : s) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return s;
    }

    bool isSpace(char c) {
        return c == ' ' || c == '\t';
    }

    void skipSpaces(const std::string& s, size_t& i) {
        while (i < s.size() && isSpace(s[i])) {
            ++i;
        }
    }

    bool parseToken(const std::string& s, size_t& i, std::string& out) {
        const size_t start = i;
        while (i < s.size() && !isSpace(s[i]) && s[i] != '=' && s[i] != ',' && s[i] != '"') {
            ++i;
        }
        out = s.substr(start, i - start);
        return i != start;
    }

    bool parseQuotedString(const std::string& s, size_t& i, std::string& out) {
        out.clear();
        if (i >= s.size() || s[i] != '"') {
            return false;
        }
        ++i;
        while (i < s.size()) {
            const char ch = s[i];
            if (ch == '\\') {
                if (i + 1 >= s.size()) {
                    return false;
                }
                out.push_back(s[i + 1]);
                i += 2;
                continue;
            }
            ++i;
            if (ch == '"') {
                return true;
            }
            out.push_back(ch);
        }
        return false; // unterminated
    }

    std::string parseBareValue(const std::string& s, size_t& i) {
        const size_t start = i;
        while (i < s.size() && s[i] != ',') {
            ++i;
        }
        size_t end = i;
        while (end > start && isSpace(s[end - 1])) {
            --end;
        }
        return s.substr(start, end - start);
    }

    void appendQuoted(std::string& out, const char* key, const std::string& value) {
        out += key;
        out += "=\"";
        for (char c : value) {
            if (c == '"' || c == '\\') {
                out.push_back('\\');
            }
            out.push_back(c);
        }
        out.push_back('"');
    }
}

std::string buildBearerChallenge(const BearerChallenge& challenge) {
    std::string out = "Bearer ";
    appendQuoted(out, "realm", challenge.realm);
    if (!challenge.error.empty()) {
        out += ", ";
        appendQuoted(out, "error", challenge.error);
    }
    out += ", ";
    appendQuoted(out, "resource_metadata", challenge.resourceMetadata);
    return out;
}

bool parseWwwAuthenticate(const std::string& header, WwwAuthChallenge& out) {
    out.scheme.clear();
    out.params.clear();

    size_t i = 0;
    skipSpaces(header, i);
    std::string scheme;
    if (!parseToken(header, i, scheme) || toLower(scheme) != "bearer") {
        return false;
    }
    out.scheme = toLower(scheme);

    while (i < header.size()) {
        skipSpaces(header, i);
        if (i < header.size() && header[i] == ',') {
            ++i;
            continue;
        }
        std::string key;
        if (!parseToken(header, i, key)) {
            break;
        }
        key = toLower(key);

        skipSpaces(header, i);
        if (i >= header.size() || header[i] != '=') {
            out.params[key] = std::string();
            continue;
        }
        ++i; // '='
        skipSpaces(header, i);

        std::string value;
        if (i < header.size() && header[i] == '"') {
            if (!parseQuotedString(header, i, value)) {
                return false;
            }
        } else {
            value = parseBareValue(header, i);
        }
        out.params[key] = value;
    }
    return true;
}

} // namespace mcpgw::auth
