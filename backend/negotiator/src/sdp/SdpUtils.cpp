#include "SdpUtils.hpp"

#include <array>
#include <sstream>
#include <plog/Log.h>

namespace negotiator::sdp {

namespace {

constexpr std::string_view kFidGroup = "a=ssrc-group:FID";
constexpr std::array<std::string_view, 2> kSimulcastEngines = {"Chrome", "Chromium"};

}

std::string removeFidGroup(std::string_view sdp) {
    const auto n = sdp.find(kFidGroup);
    if (n != std::string_view::npos && n > 0)
        return std::string(sdp.substr(0, n));
    return std::string(sdp);
}

std::string simulcastAttributes(const signaling::MediaStream& videoStream) {
    if (videoStream.videoTracks.empty()) {
        PLOG_WARNING << "No video tracks available in the video stream";
        return {};
    }

    const auto& streamId = videoStream.id;
    const auto& trackId = videoStream.videoTracks.front();

    std::ostringstream lines;
    lines << "a=x-google-flag:conference\n";
    lines << "a=ssrc-group:SIM 1 2 3\n";
    for (int ssrc = 1; ssrc <= 3; ++ssrc) {
        lines << "a=ssrc:" << ssrc << " cname:localVideo\n";
        lines << "a=ssrc:" << ssrc << " msid:" << streamId << ' ' << trackId << '\n';
        lines << "a=ssrc:" << ssrc << " mslabel:" << streamId << '\n';
        lines << "a=ssrc:" << ssrc << " label:" << trackId << '\n';
    }
    return lines.str();
}

bool supportsSimulcastMangling(std::string_view engine) {
    for (auto name : kSimulcastEngines) {
        if (engine == name)
            return true;
    }
    return false;
}

SimulcastOutcome mangleSdp(signaling::Description& description, const SimulcastOptions& options) {
    if (!options.enabled)
        return SimulcastOutcome::Disabled;

    if (!supportsSimulcastMangling(options.engine)) {
        PLOG_WARNING << "Simulcast is only available in Chrome browser, engine is " << options.engine;
        return SimulcastOutcome::Unsupported;
    }

    if (!options.videoStream) {
        PLOG_WARNING << "No video stream configured, skipping simulcast";
        return SimulcastOutcome::MissingVideoTrack;
    }

    auto attributes = simulcastAttributes(*options.videoStream);
    if (attributes.empty())
        return SimulcastOutcome::MissingVideoTrack;

    PLOG_INFO << "Adding multicast info";
    description.sdp = removeFidGroup(description.sdp) + attributes;
    return SimulcastOutcome::Applied;
}

std::string dumpDescription(const std::optional<signaling::Description>& description) {
    if (!description)
        return {};
    return std::string("type: ") + signaling::toString(description->type) + "\r\n" + description->sdp;
}

const char* toString(SimulcastOutcome outcome) {
    switch (outcome) {
        case SimulcastOutcome::Disabled:
            return "disabled";
        case SimulcastOutcome::Applied:
            return "applied";
        case SimulcastOutcome::Unsupported:
            return "unsupported";
        case SimulcastOutcome::MissingVideoTrack:
            return "missing-video-track";
    }
    return "unknown";
}

}
