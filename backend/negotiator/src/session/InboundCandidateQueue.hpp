#pragma once
#include <deque>
#include <optional>
#include "Error.hpp"
#include "../rtc/ITransport.hpp"
#include "../signaling/SignalingTypes.hpp"

namespace negotiator::session {

// Holds remote candidates until the signaling state allows the transport to take them.
class InboundCandidateQueue {
public:
    explicit InboundCandidateQueue(rtc::ITransport& transport) : transport_(transport) {};

    void submit(std::optional<signaling::IceCandidate> candidate, ResultCallback callback);
    void handleSignalingStateChange(signaling::SignalingState state);
    size_t pending() const { return queue_.size(); }

private:
    struct PendingEntry {
        std::optional<signaling::IceCandidate> candidate;
        ResultCallback callback;
    };

    rtc::ITransport& transport_;
    std::deque<PendingEntry> queue_;
    bool draining_ = false;

    void apply(const std::optional<signaling::IceCandidate>& candidate, ResultCallback callback);
    void drain();
    void failAll();
};

}
