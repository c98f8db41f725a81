//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionRegistry.hpp
// Purpose: Registry of live HTTP sessions keyed by session id
//==========================================================================================================

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "dtmcp/Server.h"
#include "dtmcp/StreamableHttpTransport.hpp"

namespace dtmcp {

struct Session {
    std::string id;
    std::shared_ptr<StreamableHttpTransport> transport;
    std::shared_ptr<Server> server;
};

//==========================================================================================================
// SessionRegistry
// Purpose: The only state shared across HTTP sessions. Sessions enter when their adapter raises the
//          initialized event and leave when it raises the closed event.
// Notes:
//   - Insert/Find/Remove are each a single critical section, so a session is either fully
//     registered or absent.
//   - Must be owned by a std::shared_ptr; event sinks keep only a weak reference.
//==========================================================================================================
class SessionRegistry : public std::enable_shared_from_this<SessionRegistry> {
public:
    // Returns false (and changes nothing) when the id is empty or already present.
    bool Insert(Session session);
    std::optional<Session> Find(const std::string& id) const;
    bool Remove(const std::string& id);

    bool Contains(const std::string& id) const;
    std::size_t Size() const;
    std::vector<std::string> Ids() const;

    //======================================================================================================
    // EventsFor
    // Purpose: Event sink for the adapter of a new session served by `server`. The initialized event
    //          inserts {id, adapter, server}; the closed event removes the id.
    //======================================================================================================
    std::shared_ptr<ISessionEvents> EventsFor(std::shared_ptr<Server> server);

private:
    mutable std::mutex mutex_;
    std::map<std::string, Session> sessions_;
};

} // namespace dtmcp
