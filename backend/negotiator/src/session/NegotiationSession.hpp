#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "Configuration.hpp"
#include "Error.hpp"
#include "InboundCandidateQueue.hpp"
#include "OutboundCandidateBuffer.hpp"
#include "../rtc/ITransport.hpp"
#include "../sdp/SdpUtils.hpp"
#include "../signaling/SignalingTypes.hpp"

namespace negotiator::session {

// Drives SDP offer/answer over one transport. Not thread-safe: every call and every
// transport notification must happen on the same thread.
class NegotiationSession : public std::enable_shared_from_this<NegotiationSession> {
public:
    using AnswerProcessor = std::function<void(const std::string& sdpAnswer, ResultCallback callback)>;

    struct OfferResult {
        std::string sdp;
        AnswerProcessor processAnswer;
    };

    using OfferCallback = std::function<void(Result<OfferResult>)>;
    using AnswerCallback = std::function<void(Result<std::string>)>;

    // Throws std::invalid_argument when the configuration injects no transport and no
    // factory is given.
    static auto create(Configuration config, const rtc::TransportFactory& factory = {})
        -> std::shared_ptr<NegotiationSession>;

    ~NegotiationSession();

    NegotiationSession(const NegotiationSession&) = delete;
    NegotiationSession& operator=(const NegotiationSession&) = delete;

    const std::string& id() const { return id_; }
    bool simulcast() const { return config_.simulcast; }
    bool multistream() const { return config_.multistream; }
    signaling::SignalingState signalingState() const { return transport_->signalingState(); }
    const std::shared_ptr<rtc::ITransport>& peerConnection() const { return transport_; }
    const std::shared_ptr<rtc::IDataChannel>& dataChannel() const { return dataChannel_; }

    void start(ResultCallback callback);
    void subscribe(CandidateListener listener);

    void addIceCandidate(const std::optional<signaling::IceCandidate>& candidate, ResultCallback callback = {});
    void generateOffer(OfferCallback callback);
    void processOffer(const std::string& sdpOffer, AnswerCallback callback);
    void processAnswer(const std::string& sdpAnswer, ResultCallback callback = {});

    std::optional<signaling::Description> getLocalSessionDescriptor() const;
    std::optional<signaling::Description> getRemoteSessionDescriptor() const;

    sdp::SimulcastOutcome mangleSdpToAddSimulcast(signaling::Description& description) const;
    void send(const std::string& data);
    void close();

private:
    NegotiationSession(Configuration config, std::shared_ptr<rtc::ITransport> transport);

    Configuration config_;
    std::string id_;
    std::shared_ptr<rtc::ITransport> transport_;
    std::shared_ptr<rtc::IDataChannel> dataChannel_;
    InboundCandidateQueue inboundCandidates_;
    OutboundCandidateBuffer outboundCandidates_;

    void setCallbacks();
    void createDataChannel();
    bool isClosed() const;
    void setRemoteVideo();
    void setLocalDescription(signaling::Description description,
                             std::function<void(Result<std::string>)> callback);
    AnswerProcessor answerProcessor();
};

}
