#include "SignalStream.hpp"
#include "SignalingTypes.hpp"
#include "../session/NegotiationSession.hpp"

#include <atomic>
#include <future>
#include <plog/Log.h>

using namespace negotiator::signaling;
using negotiator::session::Error;
using negotiator::session::NegotiationSession;
using negotiator::session::Result;

void SignalStream::start() {
    while (!closed_) {
        negotiator::SignalingMessage message;
        if (!stream_->Read(&message) || closed_)
            break;

        switch (message.message_case()) {
            case negotiator::SignalingMessage::kDescription:
                handleRemoteDescription(message);
                break;
            case negotiator::SignalingMessage::kIceCandidate:
                handleIceCandidate(message);
                break;
            case negotiator::SignalingMessage::kControl:
                handleControl(message);
                break;
            default:
                PLOG_WARNING << "Ignoring signaling message without payload for session " << message.session_id();
                break;
        }
    }
}

auto SignalStream::nextOwnerId() -> session::SessionManager::OwnerId {
    static std::atomic<session::SessionManager::OwnerId> counter{session::SessionManager::kAnyOwner};
    return ++counter;
}

template<typename Fn>
void SignalStream::withSession(const std::string& sessionId, Fn&& fn) {
    auto weakSelf = weak_from_this();

    dispatcher_.post([weakSelf, sessionId, fn = std::forward<Fn>(fn)]() mutable {
        auto self = weakSelf.lock();
        if (!self) return;
        if (auto s = self->sessionManager_.getSession(sessionId, self->ownerId_)) {
            fn(*self, *s);
        } else {
            self->sendFailure("UnknownSession", "no session " + sessionId, sessionId);
        }
    });
}

void SignalStream::handleRemoteDescription(const negotiator::SignalingMessage& message) {
    const auto id = message.session_id();
    const auto type = static_cast<MessageType>(message.description().type());
    const auto sdp = message.description().sdp();

    withSession(id, [id, type, sdp](SignalStream& self, const std::shared_ptr<NegotiationSession>& session) {
        auto weakSelf = self.weak_from_this();
        if (type == MessageType::Offer) {
            session->processOffer(sdp, [weakSelf, id](Result<std::string> answer) {
                auto self = weakSelf.lock();
                if (!self) return;
                if (!answer) {
                    self->sendFailure(session::toString(answer.error().kind), answer.error().message, id);
                    return;
                }
                self->sendLocalDescription(Description{.sdp = *answer, .type = MessageType::Answer}, id);
            });
        } else if (type == MessageType::Answer) {
            session->processAnswer(sdp, [weakSelf, id](Result<void> result) {
                auto self = weakSelf.lock();
                if (self && !result)
                    self->sendFailure(session::toString(result.error().kind), result.error().message, id);
            });
        } else {
            self.sendFailure("InvalidArgument", std::string("unsupported description type ") + toString(type), id);
        }
    });
}

void SignalStream::handleIceCandidate(const negotiator::SignalingMessage& message) {
    const auto id = message.session_id();
    std::optional<IceCandidate> candidate;
    if (!message.ice_candidate().end_of_candidates()) {
        candidate = IceCandidate{
            .candidate = message.ice_candidate().candidate(),
            .sdpMid = message.ice_candidate().sdpmid(),
            .sdpMLineIndex = message.ice_candidate().sdpmlineindex()
        };
    }

    withSession(id, [id, candidate](SignalStream& self, const std::shared_ptr<NegotiationSession>& session) {
        auto weakSelf = self.weak_from_this();
        session->addIceCandidate(candidate, [weakSelf, id](Result<void> result) {
            auto self = weakSelf.lock();
            if (self && !result)
                self->sendFailure(session::toString(result.error().kind), result.error().message, id);
        });
    });
}

void SignalStream::handleControl(const negotiator::SignalingMessage& message) {
    const auto id = message.session_id();
    switch (message.control().action()) {
        case negotiator::SessionControl::OPEN:
            return openSession(id);
        case negotiator::SessionControl::OFFER_REQUEST:
            return requestOffer(id);
        case negotiator::SessionControl::CLOSE:
            return closeSession(id);
        default:
            PLOG_WARNING << "Unknown session control action for " << id;
            break;
    }
}

void SignalStream::openSession(const std::string& id) {
    auto weakSelf = weak_from_this();
    dispatcher_.post([weakSelf, id]() {
        auto self = weakSelf.lock();
        if (!self) return;

        auto session = self->sessionManager_.createSession(id, self->ownerId_);
        if (!session) {
            self->sendFailure("InvalidArgument", "cannot open session " + id, id);
            return;
        }

        (*session)->subscribe(session::CandidateListener{
            .onIceCandidate = [weakSelf, id](const IceCandidate& candidate) {
                if (auto self = weakSelf.lock())
                    self->sendIceCandidate(candidate, id);
            },
            .onCandidateGatheringDone = [weakSelf, id]() {
                if (auto self = weakSelf.lock())
                    self->sendIceCandidate(std::nullopt, id);
            }
        });

        (*session)->start([weakSelf, id](Result<void> result) {
            auto self = weakSelf.lock();
            if (self && !result)
                self->sendFailure(session::toString(result.error().kind), result.error().message, id);
        });
    });
}

void SignalStream::requestOffer(const std::string& id) {
    withSession(id, [id](SignalStream& self, const std::shared_ptr<NegotiationSession>& session) {
        auto weakSelf = self.weak_from_this();
        session->generateOffer([weakSelf, id](Result<NegotiationSession::OfferResult> offer) {
            auto self = weakSelf.lock();
            if (!self) return;
            if (!offer) {
                self->sendFailure(session::toString(offer.error().kind), offer.error().message, id);
                return;
            }
            self->sendLocalDescription(Description{.sdp = offer->sdp, .type = MessageType::Offer}, id);
        });
    });
}

void SignalStream::closeSession(const std::string& id) {
    auto weakSelf = weak_from_this();
    dispatcher_.post([weakSelf, id]() {
        auto self = weakSelf.lock();
        if (self && !self->sessionManager_.closeSession(id, self->ownerId_))
            self->sendFailure("UnknownSession", "no session " + id, id);
    });
}

void SignalStream::send(const negotiator::SignalingMessage& message) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    if (closed_.load()) return;
    if (!stream_->Write(message))
        closed_.store(true);
}

// Blocks until the sessions opened through this stream are closed on the dispatcher, so
// nothing writes to the stream once Signal() has returned.
void SignalStream::close() {
    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        closed_.store(true);
    }

    std::promise<void> done;
    auto finished = done.get_future();
    auto self = shared_from_this();
    dispatcher_.post([self, &done]() {
        self->sessionManager_.closeOwnedBy(self->ownerId_);
        done.set_value();
    });
    finished.wait();
}

void SignalStream::sendLocalDescription(const Description& desc, const std::string& id) {
    negotiator::SignalingMessage message;
    message.set_session_id(id);

    auto* protoDesc = message.mutable_description();
    protoDesc->set_sdp(desc.sdp);
    protoDesc->set_type(
        static_cast<negotiator::SessionDescription::Type>(desc.type)
    );

    send(message);
}

void SignalStream::sendIceCandidate(const std::optional<IceCandidate>& candidate, const std::string& id) {
    negotiator::SignalingMessage message;
    message.set_session_id(id);

    auto* protoCandidate = message.mutable_ice_candidate();
    if (candidate) {
        protoCandidate->set_candidate(candidate->candidate);
        protoCandidate->set_sdpmid(candidate->sdpMid);
        protoCandidate->set_sdpmlineindex(candidate->sdpMLineIndex);
    } else {
        protoCandidate->set_end_of_candidates(true);
    }

    send(message);
}

void SignalStream::sendFailure(const std::string& kind, const std::string& text, const std::string& id) {
    negotiator::SignalingMessage message;
    message.set_session_id(id);

    auto* failure = message.mutable_failure();
    failure->set_kind(kind);
    failure->set_message(text);

    send(message);
}
