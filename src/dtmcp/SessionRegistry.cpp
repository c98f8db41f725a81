//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionRegistry.cpp
// Purpose: Session bookkeeping and the registry-bound session event sink
//==========================================================================================================

#include "dtmcp/SessionRegistry.hpp"

#include "logging/Logger.h"

namespace dtmcp {

namespace {

class RegistrySessionEvents : public ISessionEvents {
public:
    RegistrySessionEvents(std::weak_ptr<SessionRegistry> registry, std::shared_ptr<Server> server)
        : registry_(std::move(registry)), server_(std::move(server)) {}

    void OnSessionInitialized(const std::string& sessionId,
                              const std::shared_ptr<StreamableHttpTransport>& transport) override {
        auto registry = registry_.lock();
        if (!registry) {
            return;
        }
        if (registry->Insert(Session{sessionId, transport, server_})) {
            LOG_INFO("New session created: {}", sessionId);
        } else {
            LOG_WARN("Session {} was not registered (duplicate id)", sessionId);
        }
    }

    void OnSessionClosed(const std::string& sessionId) override {
        auto registry = registry_.lock();
        if (registry && registry->Remove(sessionId)) {
            LOG_INFO("Session closed: {}", sessionId);
        }
    }

private:
    std::weak_ptr<SessionRegistry> registry_;
    std::shared_ptr<Server> server_;
};

} // namespace

bool SessionRegistry::Insert(Session session) {
    if (session.id.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = session.id;
    return sessions_.emplace(std::move(id), std::move(session)).second;
}

std::optional<Session> SessionRegistry::Find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SessionRegistry::Remove(const std::string& id) {
    Session removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            return false;
        }
        removed = std::move(it->second);
        sessions_.erase(it);
    }
    // `removed` releases the adapter and server outside the lock
    return true;
}

bool SessionRegistry::Contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(id) != 0;
}

std::size_t SessionRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionRegistry::Ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        ids.push_back(id);
    }
    return ids;
}

std::shared_ptr<ISessionEvents> SessionRegistry::EventsFor(std::shared_ptr<Server> server) {
    return std::make_shared<RegistrySessionEvents>(weak_from_this(), std::move(server));
}

} // namespace dtmcp
