//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionRegistry.hpp
// Purpose: In-process map of session identifiers to live session transports
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "mcpgw/session/SessionTransport.hpp"

namespace mcpgw {

//==========================================================================================================
// SessionRegistry
// Purpose: Owns the ACTIVE sessions of this process. A closed id and an id that was never issued are
//          indistinguishable to Find().
// Notes:
//   - Not synchronized; use from the gateway I/O thread only.
//   - Ids this process terminated are remembered (bounded) so a repeated DELETE can be answered
//     idempotently via WasTerminated().
//==========================================================================================================
class SessionRegistry {
public:
    using TransportBuilder = std::function<std::shared_ptr<ISessionTransport>(const std::string& sessionId)>;

    explicit SessionRegistry(std::size_t terminatedCapacity = 4096);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    //==========================================================================================================
    // Create
    // Purpose: Allocates a fresh id, builds its transport, wires the transport close callback to
    //          Remove(), and registers the session as ACTIVE.
    // Throws:
    //   std::runtime_error when the builder returns null or random id generation fails.
    //==========================================================================================================
    std::shared_ptr<ISessionTransport> Create(const TransportBuilder& build);

    // Live transport for id, or nullptr.
    std::shared_ptr<ISessionTransport> Find(const std::string& sessionId) const;

    // Drops the session without closing it. Returns true when it was ACTIVE; repeated calls are no-ops.
    bool Remove(const std::string& sessionId);

    // True when this process terminated the id and still remembers doing so.
    bool WasTerminated(const std::string& sessionId) const;

    // Closes every ACTIVE session (shutdown path). Returns the transports that were closed.
    std::vector<std::shared_ptr<ISessionTransport>> CloseAll();

    std::size_t Size() const { return sessions.size(); }

    // 128-bit random identifier in UUID version 4 text form.
    static std::string GenerateSessionId();

private:
    struct Session {
        std::shared_ptr<ISessionTransport> transport;
        std::chrono::steady_clock::time_point createdAt;
    };

    void rememberTerminated(const std::string& sessionId);

    std::unordered_map<std::string, Session> sessions;
    std::size_t terminatedCapacity;
    std::deque<std::string> terminatedOrder;
    std::unordered_set<std::string> terminated;
};

} // namespace mcpgw
