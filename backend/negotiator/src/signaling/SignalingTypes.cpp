#include "SignalingTypes.hpp"

namespace negotiator::signaling {

const char* toString(SignalingState state) {
    switch (state) {
        case SignalingState::Stable:
            return "stable";
        case SignalingState::HaveLocalOffer:
            return "have-local-offer";
        case SignalingState::HaveRemoteOffer:
            return "have-remote-offer";
        case SignalingState::Closed:
            return "closed";
    }
    return "unknown";
}

const char* toString(MessageType type) {
    switch (type) {
        case MessageType::Offer:
            return "offer";
        case MessageType::Answer:
            return "answer";
        case MessageType::Pranswer:
            return "pranswer";
        case MessageType::Rollback:
            return "rollback";
        case MessageType::Unspec:
            break;
    }
    return "unspec";
}

}
