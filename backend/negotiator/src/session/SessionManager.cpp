#include "SessionManager.hpp"
#include "NegotiationSession.hpp"

#include <exception>
#include <vector>
#include <plog/Log.h>

using namespace negotiator::session;

auto SessionManager::createSession(const std::string& sessionId, OwnerId owner) -> std::expected<std::shared_ptr<NegotiationSession>, CreateSessionError> {
    if (sessionId.empty())
        return std::unexpected(CreateSessionError::InvalidSessionId);

    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.find(sessionId) != sessions_.end())
        return std::unexpected(CreateSessionError::AlreadyExists);

    auto config = defaults_;
    config.id = sessionId;

    std::shared_ptr<NegotiationSession> session;
    try {
        session = NegotiationSession::create(std::move(config), factory_);
    } catch (const std::exception& ex) {
        PLOG_ERROR << "Failed to create session " << sessionId << ": " << ex.what();
        return std::unexpected(CreateSessionError::ResourceUnavailable);
    }

    sessions_.try_emplace(sessionId, Entry{session, owner});
    PLOG_INFO << "Session " << sessionId << " created";
    return session;
}

auto SessionManager::getSession(const std::string& sessionId, OwnerId owner) -> std::expected<std::shared_ptr<NegotiationSession>, std::nullptr_t> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it != sessions_.end() && reachable(it->second, owner))
        return it->second.session;

    return std::unexpected(nullptr);
}

bool SessionManager::closeSession(const std::string& sessionId, OwnerId owner) {
    std::shared_ptr<NegotiationSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end() || !reachable(it->second, owner))
            return false;
        session = std::move(it->second.session);
        sessions_.erase(it);
    }
    session->close();
    PLOG_INFO << "Session " << sessionId << " closed";
    return true;
}

void SessionManager::closeOwnedBy(OwnerId owner) {
    std::vector<std::shared_ptr<NegotiationSession>> owned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->second.owner == owner) {
                owned.push_back(std::move(it->second.session));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& session : owned)
        session->close();
}

void SessionManager::closeAll() {
    std::unordered_map<std::string, Entry> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }
    for (auto& [id, entry] : sessions)
        entry.session->close();
}

size_t SessionManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}
