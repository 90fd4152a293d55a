#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <functional>
#include <string>
#include "../dispatcher/Dispatcher.hpp"
#include "../session/SessionManager.hpp"
#include "ISignalingSink.hpp"
#include "negotiator_service.grpc.pb.h"

namespace negotiator::signaling {

// Reads run on the gRPC thread. Every session operation is posted to the Dispatcher, and
// writes happen from there.
class SignalStream final : public ISignalingSink, public std::enable_shared_from_this<SignalStream> {
public:
    using Stream = grpc::ServerReaderWriter<negotiator::SignalingMessage, negotiator::SignalingMessage>;

    SignalStream(dispatch::Dispatcher& dispatcher, session::SessionManager& sessionManager, Stream* stream)
        : dispatcher_(dispatcher), sessionManager_(sessionManager), stream_(stream), ownerId_(nextOwnerId()) {};

    void start();
    void send(const negotiator::SignalingMessage& message);
    void close();

    void sendLocalDescription(const Description& desc, const std::string& id) override;
    void sendIceCandidate(const std::optional<IceCandidate>& candidate, const std::string& id) override;
    void sendFailure(const std::string& kind, const std::string& message, const std::string& id) override;

private:
    dispatch::Dispatcher& dispatcher_;
    session::SessionManager& sessionManager_;
    Stream* stream_;
    std::mutex writeMutex_;
    std::atomic<bool> closed_{false};
    // Sessions opened here are reachable only from this stream.
    const session::SessionManager::OwnerId ownerId_;

    static session::SessionManager::OwnerId nextOwnerId();

    void handleRemoteDescription(const negotiator::SignalingMessage& message);
    void handleIceCandidate(const negotiator::SignalingMessage& message);
    void handleControl(const negotiator::SignalingMessage& message);
    void openSession(const std::string& id);
    void requestOffer(const std::string& id);
    void closeSession(const std::string& id);
    template<typename Fn> void withSession(const std::string& sessionId, Fn&& fn);
};

}
