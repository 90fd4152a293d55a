#include "NegotiatorServiceImpl.hpp"
#include "../signaling/SignalStream.hpp"

#include <plog/Log.h>

using namespace negotiator::rpc;

grpc::Status NegotiatorServiceImpl::Signal(grpc::ServerContext* context,
    grpc::ServerReaderWriter<negotiator::SignalingMessage, negotiator::SignalingMessage>* stream) {

    PLOG_INFO << "Signaling stream opened by " << context->peer();

    auto signalingStream = std::make_shared<signaling::SignalStream>(
        dispatcher_,
        sessionManager_,
        stream
    );

    signalingStream->start();
    signalingStream->close();

    PLOG_INFO << "Signaling stream from " << context->peer() << " finished";
    return grpc::Status::OK;
}
