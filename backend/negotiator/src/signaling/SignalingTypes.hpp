#pragma once
#include <string>
#include <vector>

namespace negotiator::signaling {

enum class SignalingState {
    Stable,
    HaveLocalOffer,
    HaveRemoteOffer,
    Closed
};

enum class MessageType {
    Unspec,
    Offer,
    Answer,
    Pranswer,
    Rollback
};

struct Description {
    std::string sdp;
    MessageType type;
};

struct IceCandidate {
    std::string candidate;
    std::string sdpMid;
    int sdpMLineIndex;
};

struct MediaStream {
    std::string id;
    std::vector<std::string> audioTracks;
    std::vector<std::string> videoTracks;
};

const char* toString(SignalingState state);
const char* toString(MessageType type);

}
