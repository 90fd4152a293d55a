#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rtc/ITransport.hpp"

namespace negotiator::test {

class FakeDataChannel : public rtc::IDataChannel {
public:
    explicit FakeDataChannel(std::string label) : label_(std::move(label)) {}

    std::string label() const override { return label_; }
    bool isOpen() const override { return open; }
    void send(const std::string& data) override { sent.push_back(data); }
    void close() override { open = false; }

    bool open = false;
    std::vector<std::string> sent;
    rtc::DataChannelOptions options;

private:
    std::string label_;
};

class RecordingMediaSink : public rtc::IMediaSink {
public:
    void bindRemoteStream(const signaling::MediaStream& stream) override { remote.push_back(stream.id); }
    void bindLocalPreview(const signaling::MediaStream& stream) override { preview.push_back(stream.id); }

    std::vector<std::string> remote;
    std::vector<std::string> preview;
};

// Scripted transport. With autoComplete every operation settles synchronously; otherwise
// outcomes wait in `pending` until completeNext() runs them in call order.
class FakeTransport : public rtc::ITransport {
public:
    void createOffer(const rtc::OfferOptions& options, DescriptionCallback callback) override {
        lastOfferOptions = options;
        calls.push_back("createOffer");
        auto result = offerError ? session::Result<signaling::Description>(std::unexpected(*offerError))
                                 : session::Result<signaling::Description>(offer);
        settle([callback, result]() { callback(result); });
    }

    void createAnswer(DescriptionCallback callback) override {
        calls.push_back("createAnswer");
        auto result = answerError ? session::Result<signaling::Description>(std::unexpected(*answerError))
                                  : session::Result<signaling::Description>(answer);
        settle([callback, result]() { callback(result); });
    }

    void setLocalDescription(const signaling::Description& desc, session::ResultCallback callback) override {
        calls.push_back("setLocalDescription");
        settle([this, desc, callback]() {
            if (setLocalError) {
                callback(std::unexpected(*setLocalError));
                return;
            }
            local = desc;
            if (desc.type == signaling::MessageType::Offer)
                changeState(signaling::SignalingState::HaveLocalOffer);
            else
                changeState(signaling::SignalingState::Stable);
            callback({});
        });
    }

    void setRemoteDescription(const signaling::Description& desc, session::ResultCallback callback) override {
        calls.push_back("setRemoteDescription");
        settle([this, desc, callback]() {
            if (setRemoteError) {
                callback(std::unexpected(*setRemoteError));
                return;
            }
            remote = desc;
            if (desc.type == signaling::MessageType::Offer)
                changeState(signaling::SignalingState::HaveRemoteOffer);
            else
                changeState(signaling::SignalingState::Stable);
            callback({});
        });
    }

    void addIceCandidate(const std::optional<signaling::IceCandidate>& candidate,
                         session::ResultCallback callback) override {
        applied.push_back(candidate ? candidate->candidate : std::string());
        calls.push_back("addIceCandidate");
        bool reject = candidate && candidate->candidate == rejectCandidate;
        settle([callback, reject]() {
            if (reject)
                callback(std::unexpected(session::Error{session::ErrorKind::DescriptionNegotiationFailed, "bad candidate"}));
            else
                callback({});
        });
    }

    signaling::SignalingState signalingState() const override { return state; }
    std::optional<signaling::Description> localDescription() const override { return local; }
    std::optional<signaling::Description> remoteDescription() const override { return remote; }
    std::vector<signaling::MediaStream> remoteStreams() const override { return streams; }
    std::string engineName() const override { return engine; }

    std::shared_ptr<rtc::IDataChannel> createDataChannel(const std::string& label,
                                                         const rtc::DataChannelOptions& options) override {
        auto channel = std::make_shared<FakeDataChannel>(label);
        channel->options = options;
        dataChannel = channel;
        return channel;
    }

    void close() override {
        ++closeCalls;
        changeState(signaling::SignalingState::Closed);
    }

    // Closed is terminal, as on a real peer connection.
    void changeState(signaling::SignalingState next) {
        if (state == next || state == signaling::SignalingState::Closed) return;
        state = next;
        if (onSignalingStateChange)
            onSignalingStateChange(next);
    }

    void discover(const std::optional<signaling::IceCandidate>& candidate) {
        if (onLocalCandidate)
            onLocalCandidate(candidate);
    }

    void completeNext() {
        auto task = std::move(pending.front());
        pending.pop_front();
        task();
    }

    void completeAll() {
        while (!pending.empty())
            completeNext();
    }

    bool autoComplete = true;
    std::deque<std::function<void()>> pending;

    signaling::SignalingState state = signaling::SignalingState::Stable;
    std::optional<signaling::Description> local;
    std::optional<signaling::Description> remote;
    std::vector<signaling::MediaStream> streams;
    std::string engine = "Chrome";

    signaling::Description offer{"v=0\r\no=- 1 1 IN IP4 127.0.0.1\r\n", signaling::MessageType::Offer};
    signaling::Description answer{"v=0\r\no=- 2 2 IN IP4 127.0.0.1\r\n", signaling::MessageType::Answer};
    std::optional<session::Error> offerError;
    std::optional<session::Error> answerError;
    std::optional<session::Error> setLocalError;
    std::optional<session::Error> setRemoteError;
    std::string rejectCandidate;

    rtc::OfferOptions lastOfferOptions;
    std::vector<std::string> calls;
    std::vector<std::string> applied;
    std::shared_ptr<FakeDataChannel> dataChannel;
    int closeCalls = 0;

private:
    void settle(std::function<void()> task) {
        if (autoComplete)
            task();
        else
            pending.push_back(std::move(task));
    }
};

inline signaling::IceCandidate candidate(const std::string& text) {
    return signaling::IceCandidate{text, "0", 0};
}

}
