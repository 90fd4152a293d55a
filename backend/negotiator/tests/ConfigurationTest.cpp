#include <gtest/gtest.h>

#include "session/Configuration.hpp"

using namespace negotiator;
using negotiator::session::Configuration;
using negotiator::session::ErrorKind;
using negotiator::session::loadConfiguration;

TEST(ConfigurationTest, DefaultsUseFallbackIceServers) {
    Configuration config;
    EXPECT_EQ(config.rtcConfiguration.iceServers, Configuration::fallbackIceServers());
    EXPECT_FALSE(config.rtcConfiguration.iceServers.empty());
    EXPECT_FALSE(config.simulcast);
    EXPECT_FALSE(config.multistream);
    EXPECT_FALSE(config.dataChannels);
    EXPECT_FALSE(config.mediaConstraints.audio.has_value());
}

TEST(ConfigurationTest, ParsesRecognizedFields) {
    auto config = loadConfiguration(R"({
        "id": "peer-7",
        "mediaConstraints": {"audio": false, "video": {"width": 640, "framerate": 15}},
        "connectionConstraints": {"offerToReceiveAudio": false, "iceRestart": true},
        "simulcast": true,
        "multistream": true,
        "dataChannels": true,
        "dataChannelConfig": {"id": "chat", "options": {"ordered": false, "maxRetransmits": 3}},
        "videoStream": {"id": "stream0", "videoTracks": ["track0"], "audioTracks": ["mic"]}
    })");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->id, "peer-7");
    EXPECT_EQ(config->mediaConstraints.audio, false);
    EXPECT_FALSE(config->mediaConstraints.video.has_value());
    EXPECT_FALSE(config->connectionConstraints.offerToReceiveAudio);
    EXPECT_TRUE(config->connectionConstraints.offerToReceiveVideo);
    EXPECT_TRUE(config->connectionConstraints.iceRestart);
    EXPECT_TRUE(config->simulcast);
    EXPECT_TRUE(config->multistream);
    EXPECT_TRUE(config->dataChannels);
    ASSERT_TRUE(config->dataChannelConfig.has_value());
    EXPECT_EQ(config->dataChannelConfig->id, "chat");
    EXPECT_FALSE(config->dataChannelConfig->options.ordered);
    EXPECT_EQ(config->dataChannelConfig->options.maxRetransmits, 3u);
    ASSERT_TRUE(config->videoStream.has_value());
    EXPECT_EQ(config->videoStream->id, "stream0");
    EXPECT_EQ(config->videoStream->videoTracks, std::vector<std::string>{"track0"});
    EXPECT_EQ(config->videoStream->audioTracks, std::vector<std::string>{"mic"});
}

TEST(ConfigurationTest, IceServersReplaceFallback) {
    auto config = loadConfiguration(R"({
        "configuration": {
            "iceServers": [
                {"urls": "stun:stun.example.org:3478"},
                {"urls": ["turn:turn.example.org:3478", "turns:turn.example.org:5349"]},
                "stun:plain.example.org"
            ],
            "iceTransportPolicy": "relay"
        }
    })");

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->rtcConfiguration.iceServers,
              (std::vector<std::string>{"stun:stun.example.org:3478", "turn:turn.example.org:3478",
                                        "turns:turn.example.org:5349", "stun:plain.example.org"}));
    EXPECT_TRUE(config->rtcConfiguration.relayOnly);
}

TEST(ConfigurationTest, TopLevelIceServersAccepted) {
    auto config = loadConfiguration(R"({"iceServers": [{"url": "stun:legacy.example.org"}]})");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->rtcConfiguration.iceServers, std::vector<std::string>{"stun:legacy.example.org"});
}

TEST(ConfigurationTest, UnknownFieldsAndWrongTypesIgnored) {
    auto config = loadConfiguration(R"({"unknown": 1, "simulcast": "yes", "mediaConstraints": {"audio": 1}})");

    ASSERT_TRUE(config.has_value());
    EXPECT_FALSE(config->simulcast);
    EXPECT_FALSE(config->mediaConstraints.audio.has_value());
    EXPECT_EQ(config->rtcConfiguration.iceServers, Configuration::fallbackIceServers());
}

TEST(ConfigurationTest, WronglyTypedNestedFieldsIgnored) {
    auto config = loadConfiguration(R"({
        "dataChannelConfig": {"options": "fast", "ordered": false},
        "videoStream": {"id": 3, "videoTracks": "track0"},
        "configuration": {"iceServers": [{"urls": 5}, 7]},
        "connectionConstraints": []
    })");

    ASSERT_TRUE(config.has_value());
    ASSERT_TRUE(config->dataChannelConfig.has_value());
    EXPECT_FALSE(config->dataChannelConfig->options.ordered);
    ASSERT_TRUE(config->videoStream.has_value());
    EXPECT_TRUE(config->videoStream->id.empty());
    EXPECT_TRUE(config->videoStream->videoTracks.empty());
    EXPECT_TRUE(config->rtcConfiguration.iceServers.empty());
    EXPECT_TRUE(config->connectionConstraints.offerToReceiveAudio);
}

TEST(ConfigurationTest, NonObjectDocumentYieldsDefaults) {
    auto config = loadConfiguration("[1, 2]");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->rtcConfiguration.iceServers, Configuration::fallbackIceServers());
}

TEST(ConfigurationTest, MalformedJsonIsInvalidArgument) {
    auto config = loadConfiguration("{\"simulcast\": ");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().kind, ErrorKind::InvalidArgument);
}
