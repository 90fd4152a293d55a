#include "InboundCandidateQueue.hpp"

#include <plog/Log.h>

using namespace negotiator::session;

void InboundCandidateQueue::submit(std::optional<signaling::IceCandidate> candidate, ResultCallback callback) {
    switch (transport_.signalingState()) {
        case signaling::SignalingState::Closed:
            callback(std::unexpected(connectionClosed()));
            return;
        case signaling::SignalingState::Stable:
            if (transport_.remoteDescription() && queue_.empty() && !draining_) {
                apply(candidate, std::move(callback));
                return;
            }
            break;
        default:
            break;
    }

    PLOG_DEBUG << "Queueing remote candidate, " << queue_.size() << " already pending";
    queue_.push_back(PendingEntry{std::move(candidate), std::move(callback)});
}

void InboundCandidateQueue::handleSignalingStateChange(signaling::SignalingState state) {
    if (state == signaling::SignalingState::Stable)
        drain();
    else if (state == signaling::SignalingState::Closed)
        failAll();
}

void InboundCandidateQueue::apply(const std::optional<signaling::IceCandidate>& candidate, ResultCallback callback) {
    transport_.addIceCandidate(candidate, [&transport = transport_, callback = std::move(callback)](Result<void> result) {
        if (transport.signalingState() == signaling::SignalingState::Closed) {
            callback(std::unexpected(connectionClosed()));
            return;
        }
        if (!result && result.error().kind != ErrorKind::ConnectionClosed) {
            callback(std::unexpected(Error{ErrorKind::CandidateRejected, result.error().message}));
            return;
        }
        callback(std::move(result));
    });
}

void InboundCandidateQueue::drain() {
    if (draining_) return;
    draining_ = true;

    // Entries submitted from a callback during the drain join the tail of this pass.
    while (!queue_.empty()) {
        if (transport_.signalingState() == signaling::SignalingState::Closed) {
            draining_ = false;
            failAll();
            return;
        }
        auto entry = std::move(queue_.front());
        queue_.pop_front();
        apply(entry.candidate, std::move(entry.callback));
    }

    draining_ = false;
}

void InboundCandidateQueue::failAll() {
    auto entries = std::move(queue_);
    queue_.clear();
    for (auto& entry : entries)
        entry.callback(std::unexpected(connectionClosed()));
}
