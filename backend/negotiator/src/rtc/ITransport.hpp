#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../session/Error.hpp"
#include "../signaling/SignalingTypes.hpp"

namespace negotiator::rtc {

struct OfferOptions {
    bool offerAudio = true;
    bool offerVideo = true;
    bool offerToReceiveAudio = true;
    bool offerToReceiveVideo = true;
    bool iceRestart = false;
};

struct DataChannelOptions {
    std::optional<uint16_t> id;
    bool ordered = true;
    std::optional<unsigned int> maxRetransmits;
    std::string protocol;
};

class IDataChannel {
public:
    virtual ~IDataChannel() = default;

    virtual std::string label() const = 0;
    virtual bool isOpen() const = 0;
    virtual void send(const std::string& data) = 0;
    virtual void close() = 0;

    std::function<void()> onOpen;
    std::function<void()> onClose;
    std::function<void(const std::string&)> onMessage;
    std::function<void()> onBufferedAmountLow;
    std::function<void(const std::string&)> onError;
};

// Playback surface for streams; the local preview is always muted.
class IMediaSink {
public:
    virtual ~IMediaSink() = default;

    virtual void bindRemoteStream(const signaling::MediaStream& stream) = 0;
    virtual void bindLocalPreview(const signaling::MediaStream& stream) = 0;
};

// Peer connection capability. Every asynchronous operation reports exactly one outcome
// through its callback. Notifications are expected on the thread that owns the session.
class ITransport {
public:
    using DescriptionCallback = std::function<void(session::Result<signaling::Description>)>;

    virtual ~ITransport() = default;

    virtual void createOffer(const OfferOptions& options, DescriptionCallback callback) = 0;
    virtual void createAnswer(DescriptionCallback callback) = 0;
    virtual void setLocalDescription(const signaling::Description& desc, session::ResultCallback callback) = 0;
    virtual void setRemoteDescription(const signaling::Description& desc, session::ResultCallback callback) = 0;
    // std::nullopt signals end-of-candidates
    virtual void addIceCandidate(const std::optional<signaling::IceCandidate>& candidate,
                                 session::ResultCallback callback) = 0;

    virtual signaling::SignalingState signalingState() const = 0;
    virtual std::optional<signaling::Description> localDescription() const = 0;
    virtual std::optional<signaling::Description> remoteDescription() const = 0;
    virtual std::vector<signaling::MediaStream> remoteStreams() const = 0;
    virtual std::string engineName() const = 0;

    virtual std::shared_ptr<IDataChannel> createDataChannel(const std::string& label,
                                                            const DataChannelOptions& options) = 0;
    virtual void close() = 0;

    std::function<void(signaling::SignalingState)> onSignalingStateChange;
    // std::nullopt once gathering has completed
    std::function<void(const std::optional<signaling::IceCandidate>&)> onLocalCandidate;
};

struct RtcConfiguration {
    std::vector<std::string> iceServers;
    bool relayOnly = false;
};

using TransportFactory = std::function<std::shared_ptr<ITransport>(const RtcConfiguration&)>;

}
