#include "RtcPeer.hpp"
#include "RtcDataChannel.hpp"

#include <exception>
#include <plog/Log.h>

using namespace negotiator::rtc;
using negotiator::session::Error;
using negotiator::session::ErrorKind;

namespace {

negotiator::signaling::Description toDescription(const ::rtc::Description& desc) {
    return negotiator::signaling::Description{
        .sdp = std::string(desc),
        .type = static_cast<negotiator::signaling::MessageType>(desc.type())
    };
}

negotiator::signaling::SignalingState toSignalingState(::rtc::PeerConnection::SignalingState state) {
    using State = ::rtc::PeerConnection::SignalingState;
    switch (state) {
        case State::HaveLocalOffer:
        case State::HaveRemotePranswer:
            return negotiator::signaling::SignalingState::HaveLocalOffer;
        case State::HaveRemoteOffer:
        case State::HaveLocalPranswer:
            return negotiator::signaling::SignalingState::HaveRemoteOffer;
        case State::Stable:
        default:
            return negotiator::signaling::SignalingState::Stable;
    }
}

}

template <typename Fn>
void RtcPeer::postTo(dispatch::Dispatcher& dispatcher, const std::weak_ptr<RtcPeer>& weakSelf, Fn&& fn) {
    dispatcher.post([weakSelf, fn = std::forward<Fn>(fn)]() mutable {
        if (auto self = weakSelf.lock()) {
            fn(*self);
        }
    });
}

template <typename Fn>
void RtcPeer::postToDispatcher(Fn&& fn) {
    postTo(dispatcher_, weak_from_this(), std::forward<Fn>(fn));
}

auto RtcPeer::create(dispatch::Dispatcher& dispatcher, const RtcConfiguration& config) -> std::shared_ptr<RtcPeer> {
    auto peer = std::make_shared<RtcPeer>(dispatcher);
    peer->start(config);
    return peer;
}

void RtcPeer::populateMidToIndexMap(const ::rtc::Description& desc) {
    midToIndexMap_.clear(); // With new description, the old sdp becomes invalid, therefore we clear the map
    for (int i = 0; i < desc.mediaCount(); ++i) {
        const auto& mediaVar = desc.media(i);
        std::visit([this, i](auto* media) {
            midToIndexMap_[media->mid()] = i;
        }, mediaVar);
    }
}

void RtcPeer::start(const RtcConfiguration& config) {
    for (const auto& url : config.iceServers)
        config_.iceServers.emplace_back(url);
    if (config.relayOnly)
        config_.iceTransportPolicy = ::rtc::TransportPolicy::Relay;
    config_.disableAutoNegotiation = true;

    peerConnection_ = std::make_unique<::rtc::PeerConnection>(config_);

    // libdatachannel threads may report after this peer is destroyed, so the callbacks hold
    // only a weak reference and the dispatcher.
    std::weak_ptr<RtcPeer> weakSelf = weak_from_this();

    peerConnection_->onLocalCandidate([weakSelf, &dispatcher = dispatcher_](::rtc::Candidate candidate) {
        postTo(dispatcher, weakSelf, [candidate = std::move(candidate)](RtcPeer& self) {
            signaling::IceCandidate iceCandidate;
            iceCandidate.candidate = candidate.candidate();
            iceCandidate.sdpMid = candidate.mid();
            auto it = self.midToIndexMap_.find(candidate.mid());
            iceCandidate.sdpMLineIndex = it != self.midToIndexMap_.end() ? it->second : 0;

            if (self.onLocalCandidate)
                self.onLocalCandidate(iceCandidate);
        });
    });

    peerConnection_->onGatheringStateChange([weakSelf, &dispatcher = dispatcher_](::rtc::PeerConnection::GatheringState state) {
        if (state != ::rtc::PeerConnection::GatheringState::Complete)
            return;
        postTo(dispatcher, weakSelf, [](RtcPeer& self) {
            if (self.onLocalCandidate)
                self.onLocalCandidate(std::nullopt);
        });
    });

    peerConnection_->onSignalingStateChange([weakSelf, &dispatcher = dispatcher_](::rtc::PeerConnection::SignalingState state) {
        postTo(dispatcher, weakSelf, [state](RtcPeer& self) {
            self.updateSignalingState(toSignalingState(state));
        });
    });

    peerConnection_->onStateChange([weakSelf, &dispatcher = dispatcher_](::rtc::PeerConnection::State state) {
        if (state != ::rtc::PeerConnection::State::Closed)
            return;
        postTo(dispatcher, weakSelf, [](RtcPeer& self) {
            self.updateSignalingState(signaling::SignalingState::Closed);
        });
    });

    peerConnection_->onTrack([weakSelf, &dispatcher = dispatcher_](std::shared_ptr<::rtc::Track> track) {
        postTo(dispatcher, weakSelf, [track = std::move(track)](RtcPeer& self) {
            self.remoteTracks_.push_back(track);
        });
    });
}

void RtcPeer::updateSignalingState(signaling::SignalingState state) {
    if (signalingState_ == signaling::SignalingState::Closed || signalingState_ == state)
        return;
    signalingState_ = state;
    if (onSignalingStateChange)
        onSignalingStateChange(state);
}

void RtcPeer::close() {
    if (closed_.exchange(true)) return;
    midToIndexMap_.clear();
    localTracks_.clear();
    remoteTracks_.clear();
    if (peerConnection_) {
        peerConnection_->close();
        peerConnection_.reset();
    }
    updateSignalingState(signaling::SignalingState::Closed);
}

void RtcPeer::ensureLocalMedia(const OfferOptions& options) {
    if (!localTracks_.empty())
        return;

    if (options.offerAudio) {
        auto direction = options.offerToReceiveAudio ? ::rtc::Description::Direction::SendRecv
                                                     : ::rtc::Description::Direction::SendOnly;
        ::rtc::Description::Audio audio("audio", direction);
        audio.addOpusCodec(111);
        localTracks_.push_back(peerConnection_->addTrack(audio));
    }
    if (options.offerVideo) {
        auto direction = options.offerToReceiveVideo ? ::rtc::Description::Direction::SendRecv
                                                     : ::rtc::Description::Direction::SendOnly;
        ::rtc::Description::Video video("video", direction);
        video.addVP8Codec(96);
        localTracks_.push_back(peerConnection_->addTrack(video));
    }
}

void RtcPeer::createOffer(const OfferOptions& options, DescriptionCallback callback) {
    if (!peerConnection_) {
        callback(std::unexpected(session::connectionClosed()));
        return;
    }

    session::Result<signaling::Description> result = std::unexpected(session::connectionClosed());
    try {
        if (options.iceRestart)
            PLOG_WARNING << "ICE restart is not supported by " << engineName() << ", ignoring";
        ensureLocalMedia(options);
        result = toDescription(peerConnection_->createOffer());
    } catch (const std::exception& ex) {
        result = std::unexpected(Error{ErrorKind::DescriptionNegotiationFailed, ex.what()});
    }
    postToDispatcher([callback = std::move(callback), result = std::move(result)](RtcPeer&) {
        callback(result);
    });
}

void RtcPeer::createAnswer(DescriptionCallback callback) {
    if (!peerConnection_) {
        callback(std::unexpected(session::connectionClosed()));
        return;
    }

    session::Result<signaling::Description> result = std::unexpected(session::connectionClosed());
    try {
        result = toDescription(peerConnection_->createAnswer());
    } catch (const std::exception& ex) {
        result = std::unexpected(Error{ErrorKind::DescriptionNegotiationFailed, ex.what()});
    }
    postToDispatcher([callback = std::move(callback), result = std::move(result)](RtcPeer&) {
        callback(result);
    });
}

// libdatachannel regenerates the local description from its own state; the text of desc is
// not applied, only its type.
void RtcPeer::setLocalDescription(const signaling::Description& desc, session::ResultCallback callback) {
    if (!peerConnection_) {
        callback(std::unexpected(session::connectionClosed()));
        return;
    }

    session::Result<void> result;
    try {
        peerConnection_->setLocalDescription(static_cast<::rtc::Description::Type>(desc.type));
        if (auto local = peerConnection_->localDescription())
            populateMidToIndexMap(*local);
    } catch (const std::exception& ex) {
        result = std::unexpected(Error{ErrorKind::DescriptionNegotiationFailed, ex.what()});
    }
    postToDispatcher([callback = std::move(callback), result](RtcPeer&) {
        callback(result);
    });
}

void RtcPeer::setRemoteDescription(const signaling::Description& desc, session::ResultCallback callback) {
    if (!peerConnection_) {
        callback(std::unexpected(session::connectionClosed()));
        return;
    }

    session::Result<void> result;
    try {
        const auto type = static_cast<::rtc::Description::Type>(desc.type);
        ::rtc::Description description(desc.sdp, type);
        peerConnection_->setRemoteDescription(description);
    } catch (const std::exception& ex) {
        result = std::unexpected(Error{ErrorKind::DescriptionNegotiationFailed, ex.what()});
    }
    postToDispatcher([callback = std::move(callback), result](RtcPeer&) {
        callback(result);
    });
}

// libdatachannel has no end-of-candidates call; the marker is accepted as is.
void RtcPeer::addIceCandidate(const std::optional<signaling::IceCandidate>& candidate,
                              session::ResultCallback callback) {
    if (!peerConnection_) {
        callback(std::unexpected(session::connectionClosed()));
        return;
    }

    session::Result<void> result;
    if (candidate) {
        try {
            ::rtc::Candidate rtcCandidate(candidate->candidate, candidate->sdpMid);
            peerConnection_->addRemoteCandidate(rtcCandidate);
        } catch (const std::exception& ex) {
            result = std::unexpected(Error{ErrorKind::CandidateRejected, ex.what()});
        }
    }
    postToDispatcher([callback = std::move(callback), result](RtcPeer&) {
        callback(result);
    });
}

std::optional<negotiator::signaling::Description> RtcPeer::localDescription() const {
    if (!peerConnection_)
        return std::nullopt;
    if (auto desc = peerConnection_->localDescription())
        return toDescription(*desc);
    return std::nullopt;
}

std::optional<negotiator::signaling::Description> RtcPeer::remoteDescription() const {
    if (!peerConnection_)
        return std::nullopt;
    if (auto desc = peerConnection_->remoteDescription())
        return toDescription(*desc);
    return std::nullopt;
}

std::vector<negotiator::signaling::MediaStream> RtcPeer::remoteStreams() const {
    if (remoteTracks_.empty() || !peerConnection_)
        return {};

    signaling::MediaStream stream;
    if (auto remote = peerConnection_->remoteDescription())
        stream.id = remote->sessionId();
    for (const auto& track : remoteTracks_) {
        if (track->description().type() == "video")
            stream.videoTracks.push_back(track->mid());
        else if (track->description().type() == "audio")
            stream.audioTracks.push_back(track->mid());
    }
    return {stream};
}

std::shared_ptr<IDataChannel> RtcPeer::createDataChannel(const std::string& label, const DataChannelOptions& options) {
    if (!peerConnection_)
        return nullptr;

    ::rtc::DataChannelInit init;
    init.reliability.unordered = !options.ordered;
    init.reliability.maxRetransmits = options.maxRetransmits;
    init.id = options.id;
    init.protocol = options.protocol;

    try {
        auto channel = peerConnection_->createDataChannel(label, init);
        return RtcDataChannel::wrap(dispatcher_, std::move(channel));
    } catch (const std::exception& ex) {
        PLOG_ERROR << "Failed to create data channel " << label << ": " << ex.what();
        return nullptr;
    }
}
