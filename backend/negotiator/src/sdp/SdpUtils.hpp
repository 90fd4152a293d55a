#pragma once
#include <optional>
#include <string>
#include <string_view>
#include "../signaling/SignalingTypes.hpp"

namespace negotiator::sdp {

enum class SimulcastOutcome {
    Disabled,
    Applied,
    Unsupported,
    MissingVideoTrack
};

struct SimulcastOptions {
    bool enabled = false;
    std::string engine;
    const signaling::MediaStream* videoStream = nullptr;
};

// Cuts the body at the first "a=ssrc-group:FID" line. Everything after it is dropped,
// including any media section that follows.
std::string removeFidGroup(std::string_view sdp);

// Empty when the stream carries no video track.
std::string simulcastAttributes(const signaling::MediaStream& videoStream);

bool supportsSimulcastMangling(std::string_view engine);

SimulcastOutcome mangleSdp(signaling::Description& description, const SimulcastOptions& options);

std::string dumpDescription(const std::optional<signaling::Description>& description);

const char* toString(SimulcastOutcome outcome);

}
