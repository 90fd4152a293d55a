#include "OutboundCandidateBuffer.hpp"

#include <plog/Log.h>

using namespace negotiator::session;

void OutboundCandidateBuffer::onDiscovered(const std::optional<signaling::IceCandidate>& candidate) {
    if (!listeners_.empty()) {
        deliver(candidate);
        return;
    }

    if (candidate) {
        buffer_.push_back(candidate);
        gatheringDone_ = false;
    } else if (!gatheringDone_) {
        buffer_.push_back(std::nullopt);
        gatheringDone_ = true;
    }
}

void OutboundCandidateBuffer::subscribe(CandidateListener listener) {
    listeners_.push_back(listener);
    if (replayed_) return;

    replayed_ = true;
    replay(listener);
}

void OutboundCandidateBuffer::deliver(const std::optional<signaling::IceCandidate>& candidate) {
    // A listener may subscribe another one while being notified.
    const auto listeners = listeners_;
    if (candidate) {
        gatheringDone_ = false;
        for (const auto& listener : listeners) {
            if (listener.onIceCandidate)
                listener.onIceCandidate(*candidate);
        }
    } else if (!gatheringDone_) {
        gatheringDone_ = true;
        for (const auto& listener : listeners) {
            if (listener.onCandidateGatheringDone)
                listener.onCandidateGatheringDone();
        }
    }
}

void OutboundCandidateBuffer::replay(const CandidateListener& listener) {
    auto entries = std::move(buffer_);
    buffer_.clear();

    PLOG_DEBUG << "Replaying " << entries.size() << " buffered local candidates";
    for (const auto& entry : entries) {
        if (entry) {
            if (listener.onIceCandidate)
                listener.onIceCandidate(*entry);
        } else if (gatheringDone_ && listener.onCandidateGatheringDone) {
            listener.onCandidateGatheringDone();
        }
    }
}
