#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>
#include "Error.hpp"
#include "../rtc/ITransport.hpp"
#include "../signaling/SignalingTypes.hpp"

namespace negotiator::session {

// Unset or non-boolean entries mean "offer it".
struct MediaConstraints {
    std::optional<bool> audio;
    std::optional<bool> video;
};

struct ConnectionConstraints {
    bool offerToReceiveAudio = true;
    bool offerToReceiveVideo = true;
    bool iceRestart = false;
};

struct DataChannelConfig {
    std::optional<std::string> id;
    rtc::DataChannelOptions options;

    std::function<void()> onOpen;
    std::function<void()> onClose;
    std::function<void(const std::string&)> onMessage;
    std::function<void()> onBufferedAmountLow;
    std::function<void(const std::string&)> onError;
};

struct Configuration {
    std::optional<std::string> id;
    MediaConstraints mediaConstraints;
    ConnectionConstraints connectionConstraints;
    rtc::RtcConfiguration rtcConfiguration{fallbackIceServers()};

    bool simulcast = false;
    bool multistream = false;
    bool dataChannels = false;
    std::optional<DataChannelConfig> dataChannelConfig;

    std::optional<signaling::MediaStream> videoStream;
    std::shared_ptr<rtc::IMediaSink> mediaSink;
    std::shared_ptr<rtc::ITransport> transport;

    std::function<void(const signaling::IceCandidate&)> onIceCandidate;
    std::function<void()> onCandidateGatheringDone;

    static std::vector<std::string> fallbackIceServers();
};

Configuration parseConfiguration(const Json::Value& root);
auto loadConfiguration(const std::string& text) -> Result<Configuration>;

}
