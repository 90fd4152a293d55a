#pragma once
#include <functional>
#include <memory>
#include <atomic>
#include <unordered_map>
#include <vector>
#include <rtc/rtc.hpp>
#include "ITransport.hpp"
#include "../dispatcher/Dispatcher.hpp"
#include "../signaling/SignalingTypes.hpp"

namespace negotiator::rtc {

// ITransport over a libdatachannel PeerConnection. libdatachannel reports from its own
// threads, so every notification and every operation outcome is posted to the dispatcher.
class RtcPeer : public ITransport, public std::enable_shared_from_this<RtcPeer> {
public:
    explicit RtcPeer(dispatch::Dispatcher& dispatcher) : dispatcher_(dispatcher) {};
    ~RtcPeer() override { close(); };

    static auto create(dispatch::Dispatcher& dispatcher, const RtcConfiguration& config) -> std::shared_ptr<RtcPeer>;

    void start(const RtcConfiguration& config);
    void close() override;

    void createOffer(const OfferOptions& options, DescriptionCallback callback) override;
    void createAnswer(DescriptionCallback callback) override;
    void setLocalDescription(const signaling::Description& desc, session::ResultCallback callback) override;
    void setRemoteDescription(const signaling::Description& desc, session::ResultCallback callback) override;
    void addIceCandidate(const std::optional<signaling::IceCandidate>& candidate,
                         session::ResultCallback callback) override;

    signaling::SignalingState signalingState() const override { return signalingState_; }
    std::optional<signaling::Description> localDescription() const override;
    std::optional<signaling::Description> remoteDescription() const override;
    std::vector<signaling::MediaStream> remoteStreams() const override;
    std::string engineName() const override { return "libdatachannel"; }

    std::shared_ptr<IDataChannel> createDataChannel(const std::string& label,
                                                    const DataChannelOptions& options) override;

private:
    dispatch::Dispatcher& dispatcher_;
    ::rtc::Configuration config_;
    std::unique_ptr<::rtc::PeerConnection> peerConnection_;
    std::atomic<bool> closed_{false};
    signaling::SignalingState signalingState_ = signaling::SignalingState::Stable;
    std::unordered_map<std::string, int> midToIndexMap_;
    std::vector<std::shared_ptr<::rtc::Track>> localTracks_;
    std::vector<std::shared_ptr<::rtc::Track>> remoteTracks_;

    void populateMidToIndexMap(const ::rtc::Description& desc);
    void ensureLocalMedia(const OfferOptions& options);
    void updateSignalingState(signaling::SignalingState state);
    template <typename Fn> void postToDispatcher(Fn&& fn);
    template <typename Fn>
    static void postTo(dispatch::Dispatcher& dispatcher, const std::weak_ptr<RtcPeer>& weakSelf, Fn&& fn);
};

}
