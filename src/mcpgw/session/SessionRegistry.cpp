//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgw/session/SessionRegistry.cpp
// Purpose: Session registry lifecycle and id generation
//==========================================================================================================

#include <stdexcept>
#include <utility>

#include <openssl/rand.h>

#include "logging/Logger.h"
#include "mcpgw/session/SessionRegistry.hpp"

namespace mcpgw {

SessionRegistry::SessionRegistry(std::size_t terminatedCapacity) : terminatedCapacity(terminatedCapacity) {
}

SessionRegistry::~SessionRegistry() {
    // Transports may outlive the registry (held by in-flight streams); detach their callbacks
    for (auto& kv : sessions) {
        kv.second.transport->SetCloseHandler(nullptr);
    }
}

std::string SessionRegistry::GenerateSessionId() {
    unsigned char b[16];
    if (::RAND_bytes(b, sizeof(b)) != 1) {
        throw std::runtime_error("RAND_bytes failed while generating a session id");
    }
    b[6] = static_cast<unsigned char>((b[6] & 0x0F) | 0x40);
    b[8] = static_cast<unsigned char>((b[8] & 0x3F) | 0x80);

    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(kHex[(b[i] >> 4) & 0x0F]);
        out.push_back(kHex[b[i] & 0x0F]);
    }
    return out;
}

std::shared_ptr<ISessionTransport> SessionRegistry::Create(const TransportBuilder& build) {
    std::string id = GenerateSessionId();
    while (sessions.count(id) != 0 || terminated.count(id) != 0) {
        id = GenerateSessionId();
    }

    std::shared_ptr<ISessionTransport> transport = build(id);
    if (!transport) {
        throw std::runtime_error("Session transport builder returned null");
    }
    transport->SetCloseHandler([this](const std::string& sid) {
        if (Remove(sid)) {
            LOG_INFO("SessionRegistry: transport closed for session {}", sid);
        }
    });
    sessions.emplace(id, Session{transport, std::chrono::steady_clock::now()});
    LOG_DEBUG("SessionRegistry: registered {} ({} active)", id, sessions.size());
    return transport;
}

std::shared_ptr<ISessionTransport> SessionRegistry::Find(const std::string& sessionId) const {
    auto it = sessions.find(sessionId);
    if (it == sessions.end()) {
        return nullptr;
    }
    return it->second.transport;
}

bool SessionRegistry::Remove(const std::string& sessionId) {
    auto it = sessions.find(sessionId);
    if (it == sessions.end()) {
        return false;
    }
    const auto age = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - it->second.createdAt);
    // Keep the transport alive until this call returns; Remove may run inside its close callback
    std::shared_ptr<ISessionTransport> keep = std::move(it->second.transport);
    sessions.erase(it);
    rememberTerminated(sessionId);
    LOG_DEBUG("SessionRegistry: removed {} after {}s ({} active)", sessionId, age.count(), sessions.size());
    return true;
}

bool SessionRegistry::WasTerminated(const std::string& sessionId) const {
    return terminated.count(sessionId) != 0;
}

std::vector<std::shared_ptr<ISessionTransport>> SessionRegistry::CloseAll() {
    std::vector<std::shared_ptr<ISessionTransport>> open;
    open.reserve(sessions.size());
    for (auto& kv : sessions) {
        open.push_back(kv.second.transport);
    }
    for (auto& t : open) {
        t->Close();
        // A transport without a close callback wired back here still has to leave the map
        Remove(t->GetSessionId());
    }
    if (!open.empty()) {
        LOG_INFO("SessionRegistry: closed {} session(s)", open.size());
    }
    return open;
}

void SessionRegistry::rememberTerminated(const std::string& sessionId) {
    if (terminatedCapacity == 0) {
        return;
    }
    if (terminated.insert(sessionId).second) {
        terminatedOrder.push_back(sessionId);
    }
    while (terminatedOrder.size() > terminatedCapacity) {
        terminated.erase(terminatedOrder.front());
        terminatedOrder.pop_front();
    }
}

} // namespace mcpgw
