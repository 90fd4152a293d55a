#pragma once

#include <optional>
#include <string>
#include "SignalingTypes.hpp"

namespace negotiator::signaling {

class ISignalingSink {
public:
    virtual ~ISignalingSink() = default;

    virtual void sendLocalDescription(const Description& desc, const std::string& id) = 0;
    // std::nullopt tells the remote side gathering is complete
    virtual void sendIceCandidate(const std::optional<IceCandidate>& candidate, const std::string& id) = 0;
    virtual void sendFailure(const std::string& kind, const std::string& message, const std::string& id) = 0;
};

}
