#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <memory>
#include <expected>
#include <string>
#include "Configuration.hpp"
#include "../rtc/ITransport.hpp"

namespace negotiator::session {

class NegotiationSession;

enum class CreateSessionError {
    AlreadyExists,
    InvalidSessionId,
    ResourceUnavailable
};

class SessionManager {
public:
    // Identifies the signaling stream that opened a session. kAnyOwner is not bound to a
    // stream and may reach every session.
    using OwnerId = std::uint64_t;
    static constexpr OwnerId kAnyOwner = 0;

    SessionManager(Configuration defaults, rtc::TransportFactory factory)
        : defaults_(std::move(defaults)), factory_(std::move(factory)) {};
    ~SessionManager() = default;

    auto createSession(const std::string& sessionId, OwnerId owner = kAnyOwner) -> std::expected<std::shared_ptr<NegotiationSession>, CreateSessionError>;
    auto getSession(const std::string& sessionId, OwnerId owner = kAnyOwner) -> std::expected<std::shared_ptr<NegotiationSession>, std::nullptr_t>;
    bool closeSession(const std::string& sessionId, OwnerId owner = kAnyOwner);
    void closeOwnedBy(OwnerId owner);
    void closeAll();
    size_t size() const;

private:
    struct Entry {
        std::shared_ptr<NegotiationSession> session;
        OwnerId owner;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> sessions_;
    Configuration defaults_;
    rtc::TransportFactory factory_;

    static bool reachable(const Entry& entry, OwnerId owner) {
        return owner == kAnyOwner || entry.owner == owner;
    }
};

}
