#pragma once
#include <functional>
#include <optional>
#include <vector>
#include "../signaling/SignalingTypes.hpp"

namespace negotiator::session {

struct CandidateListener {
    std::function<void(const signaling::IceCandidate&)> onIceCandidate;
    std::function<void()> onCandidateGatheringDone;
};

// Keeps locally discovered candidates until the first listener subscribes, then replays them
// once and switches to live delivery for good.
class OutboundCandidateBuffer {
public:
    void onDiscovered(const std::optional<signaling::IceCandidate>& candidate);
    void subscribe(CandidateListener listener);

    bool gatheringDone() const { return gatheringDone_; }
    size_t buffered() const { return buffer_.size(); }
    bool hasListeners() const { return !listeners_.empty(); }

private:
    std::vector<std::optional<signaling::IceCandidate>> buffer_;
    std::vector<CandidateListener> listeners_;
    bool gatheringDone_ = false;
    bool replayed_ = false;

    void deliver(const std::optional<signaling::IceCandidate>& candidate);
    void replay(const CandidateListener& listener);
};

}
