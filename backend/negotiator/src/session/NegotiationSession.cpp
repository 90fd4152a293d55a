#include "NegotiationSession.hpp"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <plog/Log.h>

using namespace negotiator::session;
using negotiator::signaling::Description;
using negotiator::signaling::MessageType;
using negotiator::signaling::SignalingState;

namespace {

std::string generateUuid() {
    std::random_device device;
    std::mt19937_64 engine(device());
    std::uniform_int_distribution<uint64_t> distribution;
    uint64_t high = distribution(engine);
    uint64_t low = distribution(engine);

    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (high >> 32) << '-'
        << std::setw(4) << ((high >> 16) & 0xFFFF) << '-'
        << std::setw(4) << (high & 0xFFFF) << '-'
        << std::setw(4) << (low >> 48) << '-'
        << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

Error negotiationFailed(const Error& error) {
    if (error.kind == ErrorKind::ConnectionClosed)
        return error;
    return Error{ErrorKind::DescriptionNegotiationFailed, error.message};
}

ResultCallback withDiagnostics(ResultCallback callback, const char* operation) {
    return [callback = std::move(callback), operation](Result<void> result) {
        if (!result)
            PLOG_ERROR << operation << " failed: " << describe(result.error());
        if (callback)
            callback(std::move(result));
    };
}

}

auto NegotiationSession::create(Configuration config, const rtc::TransportFactory& factory)
    -> std::shared_ptr<NegotiationSession> {
    auto transport = config.transport;
    if (!transport && factory)
        transport = factory(config.rtcConfiguration);
    if (!transport)
        throw std::invalid_argument("NegotiationSession requires a transport or a transport factory");

    std::shared_ptr<NegotiationSession> session(new NegotiationSession(std::move(config), std::move(transport)));
    session->setCallbacks();
    return session;
}

NegotiationSession::NegotiationSession(Configuration config, std::shared_ptr<rtc::ITransport> transport)
    : config_(std::move(config)),
      id_(config_.id.value_or(generateUuid())),
      transport_(std::move(transport)),
      inboundCandidates_(*transport_) {
    config_.transport.reset();
    if (config_.dataChannels)
        createDataChannel();
}

NegotiationSession::~NegotiationSession() {
    transport_->onSignalingStateChange = nullptr;
    transport_->onLocalCandidate = nullptr;
    close();
}

void NegotiationSession::setCallbacks() {
    auto weakSelf = weak_from_this();

    transport_->onSignalingStateChange = [weakSelf](SignalingState state) {
        if (auto self = weakSelf.lock()) {
            PLOG_DEBUG << "Session " << self->id_ << " signaling state " << signaling::toString(state);
            self->inboundCandidates_.handleSignalingStateChange(state);
        }
    };

    transport_->onLocalCandidate = [weakSelf](const std::optional<signaling::IceCandidate>& candidate) {
        if (auto self = weakSelf.lock())
            self->outboundCandidates_.onDiscovered(candidate);
    };

    if (config_.onIceCandidate || config_.onCandidateGatheringDone)
        outboundCandidates_.subscribe(CandidateListener{config_.onIceCandidate, config_.onCandidateGatheringDone});
}

void NegotiationSession::createDataChannel() {
    std::string label = "NegotiationSession-" + id_;
    rtc::DataChannelOptions options;
    if (config_.dataChannelConfig) {
        label = config_.dataChannelConfig->id.value_or(label);
        options = config_.dataChannelConfig->options;
    }

    dataChannel_ = transport_->createDataChannel(label, options);
    if (!dataChannel_)
        return;

    dataChannel_->onError = [label](const std::string& error) {
        PLOG_ERROR << "Data channel " << label << " error: " << error;
    };
    if (!config_.dataChannelConfig)
        return;

    const auto& dataConfig = *config_.dataChannelConfig;
    dataChannel_->onOpen = dataConfig.onOpen;
    dataChannel_->onClose = dataConfig.onClose;
    dataChannel_->onMessage = dataConfig.onMessage;
    dataChannel_->onBufferedAmountLow = dataConfig.onBufferedAmountLow;
    if (dataConfig.onError)
        dataChannel_->onError = dataConfig.onError;
}

bool NegotiationSession::isClosed() const {
    return transport_->signalingState() == SignalingState::Closed;
}

void NegotiationSession::start(ResultCallback callback) {
    if (isClosed()) {
        callback(std::unexpected(Error{ErrorKind::ConnectionClosed,
            "The peer connection is in \"closed\" state, it was most likely closed before the session started"}));
        return;
    }

    if (config_.mediaSink && config_.videoStream)
        config_.mediaSink->bindLocalPreview(*config_.videoStream);

    callback({});
}

void NegotiationSession::subscribe(CandidateListener listener) {
    outboundCandidates_.subscribe(std::move(listener));
}

void NegotiationSession::addIceCandidate(const std::optional<signaling::IceCandidate>& candidate, ResultCallback callback) {
    if (candidate) {
        PLOG_DEBUG << "Remote ICE candidate received: " << candidate->candidate;
    } else {
        PLOG_DEBUG << "Remote end-of-candidates received";
    }

    inboundCandidates_.submit(candidate, withDiagnostics(std::move(callback), "addIceCandidate"));
}

void NegotiationSession::generateOffer(OfferCallback callback) {
    if (isClosed()) {
        callback(std::unexpected(connectionClosed()));
        return;
    }

    rtc::OfferOptions options;
    options.offerAudio = config_.mediaConstraints.audio.value_or(true);
    options.offerVideo = config_.mediaConstraints.video.value_or(true);
    options.offerToReceiveAudio = config_.connectionConstraints.offerToReceiveAudio;
    options.offerToReceiveVideo = config_.connectionConstraints.offerToReceiveVideo;
    options.iceRestart = config_.connectionConstraints.iceRestart;

    PLOG_INFO << "constraints: audio=" << options.offerAudio << " video=" << options.offerVideo
              << " receiveAudio=" << options.offerToReceiveAudio
              << " receiveVideo=" << options.offerToReceiveVideo
              << " iceRestart=" << options.iceRestart;

    auto weakSelf = weak_from_this();
    transport_->createOffer(options, [weakSelf, callback](Result<Description> offer) {
        auto self = weakSelf.lock();
        if (!self) {
            callback(std::unexpected(connectionClosed()));
            return;
        }
        if (!offer) {
            callback(std::unexpected(negotiationFailed(offer.error())));
            return;
        }

        PLOG_INFO << "Created SDP offer";
        self->setLocalDescription(std::move(*offer), [weakSelf, callback](Result<std::string> sdp) {
            auto self = weakSelf.lock();
            if (!self) {
                callback(std::unexpected(connectionClosed()));
                return;
            }
            if (!sdp) {
                callback(std::unexpected(sdp.error()));
                return;
            }
            callback(OfferResult{std::move(*sdp), self->answerProcessor()});
        });
    });
}

void NegotiationSession::processOffer(const std::string& sdpOffer, AnswerCallback callback) {
    PLOG_INFO << "SDP offer received, setting remote description";

    if (isClosed()) {
        callback(std::unexpected(connectionClosed()));
        return;
    }

    auto weakSelf = weak_from_this();
    Description offer{sdpOffer, MessageType::Offer};
    transport_->setRemoteDescription(offer, [weakSelf, callback](Result<void> result) {
        auto self = weakSelf.lock();
        if (!self) {
            callback(std::unexpected(connectionClosed()));
            return;
        }
        if (!result) {
            callback(std::unexpected(negotiationFailed(result.error())));
            return;
        }

        self->setRemoteVideo();

        if (self->isClosed()) {
            callback(std::unexpected(connectionClosed()));
            return;
        }

        self->transport_->createAnswer([weakSelf, callback](Result<Description> answer) {
            auto self = weakSelf.lock();
            if (!self) {
                callback(std::unexpected(connectionClosed()));
                return;
            }
            if (!answer) {
                callback(std::unexpected(negotiationFailed(answer.error())));
                return;
            }

            PLOG_INFO << "Created SDP answer";
            self->setLocalDescription(std::move(*answer), callback);
        });
    });
}

void NegotiationSession::processAnswer(const std::string& sdpAnswer, ResultCallback callback) {
    callback = withDiagnostics(std::move(callback), "processAnswer");
    PLOG_INFO << "SDP answer received, setting remote description";

    if (isClosed()) {
        callback(std::unexpected(connectionClosed()));
        return;
    }

    auto weakSelf = weak_from_this();
    Description answer{sdpAnswer, MessageType::Answer};
    transport_->setRemoteDescription(answer, [weakSelf, callback](Result<void> result) {
        auto self = weakSelf.lock();
        if (!self) {
            callback(std::unexpected(connectionClosed()));
            return;
        }
        if (!result) {
            callback(std::unexpected(negotiationFailed(result.error())));
            return;
        }
        if (self->isClosed()) {
            callback(std::unexpected(connectionClosed()));
            return;
        }

        self->setRemoteVideo();
        callback({});
    });
}

void NegotiationSession::setLocalDescription(Description description,
                                             std::function<void(Result<std::string>)> callback) {
    if (isClosed()) {
        callback(std::unexpected(connectionClosed()));
        return;
    }

    auto outcome = mangleSdpToAddSimulcast(description);
    if (outcome != sdp::SimulcastOutcome::Disabled)
        PLOG_DEBUG << "Simulcast: " << sdp::toString(outcome);

    auto weakSelf = weak_from_this();
    auto fallbackSdp = description.sdp;
    transport_->setLocalDescription(description,
        [weakSelf, callback = std::move(callback), fallbackSdp = std::move(fallbackSdp)](Result<void> result) {
            auto self = weakSelf.lock();
            if (!self) {
                callback(std::unexpected(connectionClosed()));
                return;
            }
            if (!result) {
                callback(std::unexpected(negotiationFailed(result.error())));
                return;
            }
            if (self->isClosed()) {
                callback(std::unexpected(connectionClosed()));
                return;
            }

            auto local = self->transport_->localDescription();
            PLOG_INFO << "Local description set";
            PLOG_DEBUG << sdp::dumpDescription(local);
            callback(local ? local->sdp : fallbackSdp);
        });
}

auto NegotiationSession::answerProcessor() -> AnswerProcessor {
    auto weakSelf = weak_from_this();
    return [weakSelf](const std::string& sdpAnswer, ResultCallback callback) {
        if (auto self = weakSelf.lock()) {
            self->processAnswer(sdpAnswer, std::move(callback));
        } else if (callback) {
            callback(std::unexpected(connectionClosed()));
        }
    };
}

std::optional<Description> NegotiationSession::getLocalSessionDescriptor() const {
    return transport_->localDescription();
}

std::optional<Description> NegotiationSession::getRemoteSessionDescriptor() const {
    return transport_->remoteDescription();
}

negotiator::sdp::SimulcastOutcome NegotiationSession::mangleSdpToAddSimulcast(Description& description) const {
    sdp::SimulcastOptions options;
    options.enabled = config_.simulcast;
    options.engine = transport_->engineName();
    options.videoStream = config_.videoStream ? &*config_.videoStream : nullptr;
    return sdp::mangleSdp(description, options);
}

void NegotiationSession::setRemoteVideo() {
    if (!config_.mediaSink)
        return;

    auto streams = transport_->remoteStreams();
    if (streams.empty()) {
        PLOG_INFO << "No remote stream available to render";
        return;
    }
    if (!config_.multistream)
        streams.resize(1);

    for (const auto& stream : streams) {
        config_.mediaSink->bindRemoteStream(stream);
        PLOG_INFO << "Remote stream: " << stream.id;
    }
}

void NegotiationSession::send(const std::string& data) {
    if (dataChannel_ && dataChannel_->isOpen()) {
        dataChannel_->send(data);
    } else {
        PLOG_WARNING << "Trying to send data over a non-existing or closed data channel";
    }
}

void NegotiationSession::close() {
    if (dataChannel_)
        dataChannel_->close();
    transport_->close();
    inboundCandidates_.handleSignalingStateChange(SignalingState::Closed);
}
