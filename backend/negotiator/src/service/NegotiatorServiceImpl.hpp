#pragma once

#include "negotiator_service.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <memory>

#include "../session/SessionManager.hpp"
#include "../dispatcher/Dispatcher.hpp"

namespace negotiator::rpc {

class NegotiatorServiceImpl final : public negotiator::NegotiatorService::Service {
public:
    NegotiatorServiceImpl(session::SessionManager& sessionManager, dispatch::Dispatcher& dispatcher)
        : sessionManager_(sessionManager), dispatcher_(dispatcher) {}

    grpc::Status Signal(
        grpc::ServerContext* context,
        grpc::ServerReaderWriter<negotiator::SignalingMessage, negotiator::SignalingMessage>* stream
    ) override;

private:
    session::SessionManager& sessionManager_;
    dispatch::Dispatcher& dispatcher_;
};

}
