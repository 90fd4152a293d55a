#include "Configuration.hpp"

#include <memory>
#include <plog/Log.h>

namespace negotiator::session {

namespace {

std::optional<bool> booleanOrUnset(const Json::Value& value) {
    if (value.isBool())
        return value.asBool();
    return std::nullopt;
}

bool booleanOr(const Json::Value& object, const char* key, bool fallback) {
    const auto& value = object[key];
    return value.isBool() ? value.asBool() : fallback;
}

void appendIceServerUrls(const Json::Value& server, std::vector<std::string>& urls) {
    if (server.isString()) {
        urls.push_back(server.asString());
        return;
    }
    if (!server.isObject())
        return;

    const auto& entry = server["urls"].isNull() ? server["url"] : server["urls"];
    if (entry.isString()) {
        urls.push_back(entry.asString());
    } else if (entry.isArray()) {
        for (const auto& url : entry) {
            if (url.isString())
                urls.push_back(url.asString());
        }
    }
}

// Explicit ICE servers replace the fallback list instead of extending it.
void mergeRtcConfiguration(const Json::Value& object, rtc::RtcConfiguration& rtcConfiguration) {
    if (!object.isObject())
        return;

    const auto& servers = object["iceServers"];
    if (servers.isArray()) {
        std::vector<std::string> urls;
        for (const auto& server : servers)
            appendIceServerUrls(server, urls);
        rtcConfiguration.iceServers = std::move(urls);
    }

    const auto& policy = object["iceTransportPolicy"];
    if (policy.isString())
        rtcConfiguration.relayOnly = policy.asString() == "relay";
}

std::optional<signaling::MediaStream> parseStream(const Json::Value& object) {
    if (!object.isObject())
        return std::nullopt;

    signaling::MediaStream stream;
    if (object["id"].isString())
        stream.id = object["id"].asString();
    for (const auto& track : object["audioTracks"]) {
        if (track.isString())
            stream.audioTracks.push_back(track.asString());
    }
    for (const auto& track : object["videoTracks"]) {
        if (track.isString())
            stream.videoTracks.push_back(track.asString());
    }
    return stream;
}

DataChannelConfig parseDataChannelConfig(const Json::Value& object) {
    DataChannelConfig config;
    if (object["id"].isString())
        config.id = object["id"].asString();

    const auto& options = object["options"].isObject() ? object["options"] : object;
    config.options.ordered = booleanOr(options, "ordered", true);
    if (options["maxRetransmits"].isUInt())
        config.options.maxRetransmits = options["maxRetransmits"].asUInt();
    if (options["protocol"].isString())
        config.options.protocol = options["protocol"].asString();
    if (options["streamId"].isUInt())
        config.options.id = static_cast<uint16_t>(options["streamId"].asUInt());
    return config;
}

}

std::vector<std::string> Configuration::fallbackIceServers() {
    return {
        "stun:stun.l.google.com:19302",
        "stun:stun1.l.google.com:19302",
    };
}

Configuration parseConfiguration(const Json::Value& root) {
    Configuration config;
    if (!root.isObject())
        return config;

    if (root["id"].isString())
        config.id = root["id"].asString();

    const auto& media = root["mediaConstraints"];
    if (media.isObject()) {
        config.mediaConstraints.audio = booleanOrUnset(media["audio"]);
        config.mediaConstraints.video = booleanOrUnset(media["video"]);
    }

    const auto& constraints = root["connectionConstraints"];
    if (constraints.isObject()) {
        config.connectionConstraints.offerToReceiveAudio = booleanOr(constraints, "offerToReceiveAudio", true);
        config.connectionConstraints.offerToReceiveVideo = booleanOr(constraints, "offerToReceiveVideo", true);
        config.connectionConstraints.iceRestart = booleanOr(constraints, "iceRestart", false);
    }

    mergeRtcConfiguration(root["configuration"], config.rtcConfiguration);
    mergeRtcConfiguration(root, config.rtcConfiguration);

    config.simulcast = booleanOr(root, "simulcast", false);
    config.multistream = booleanOr(root, "multistream", false);
    config.dataChannels = booleanOr(root, "dataChannels", false);
    if (root["dataChannelConfig"].isObject())
        config.dataChannelConfig = parseDataChannelConfig(root["dataChannelConfig"]);

    config.videoStream = parseStream(root["videoStream"]);
    return config;
}

auto loadConfiguration(const std::string& text) -> Result<Configuration> {
    Json::CharReaderBuilder factory;
    std::unique_ptr<Json::CharReader> reader(factory.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        PLOG_WARNING << "Can't parse session configuration: " << errors;
        return std::unexpected(Error{ErrorKind::InvalidArgument, "invalid configuration: " + errors});
    }
    return parseConfiguration(root);
}

}
