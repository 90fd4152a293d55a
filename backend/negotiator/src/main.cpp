#include <iostream>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <plog/Appenders/ColorConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>

#include "dispatcher/Dispatcher.hpp"
#include "rtc/RtcPeer.hpp"
#include "service/NegotiatorServiceImpl.hpp"
#include "service/ServerConfiguration.hpp"
#include "session/SessionManager.hpp"

#include "negotiator_service.grpc.pb.h"

int main(int argc, char** argv) {
    negotiator::rpc::ServerConfiguration config;
    if (argc > 1) {
        auto loaded = negotiator::rpc::loadServerConfiguration(argv[1]);
        if (!loaded) {
            std::cerr << "Failed to load configuration: " << loaded.error().message << "\n";
            return 1;
        }
        config = std::move(*loaded);
    }

    static plog::ColorConsoleAppender<plog::TxtFormatter> consoleAppender;
    plog::init(config.logLevel, &consoleAppender);

    negotiator::dispatch::Dispatcher dispatcher;
    dispatcher.start();

    negotiator::rtc::TransportFactory factory = [&dispatcher](const negotiator::rtc::RtcConfiguration& rtcConfig) {
        return std::static_pointer_cast<negotiator::rtc::ITransport>(
            negotiator::rtc::RtcPeer::create(dispatcher, rtcConfig));
    };
    negotiator::session::SessionManager sessionManager(config.session, factory);

    negotiator::rpc::NegotiatorServiceImpl service(sessionManager, dispatcher);

    // gRPC server setup
    grpc::ServerBuilder builder;
    builder.AddListeningPort(config.listenAddress, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        std::cerr << "Failed to start gRPC server\n";
        return 1;
    }

    PLOG_INFO << "Negotiation signaling server listening on " << config.listenAddress;

    // Block until shutdown
    server->Wait();

    dispatcher.post([&sessionManager]() { sessionManager.closeAll(); });
    dispatcher.stop();
    return 0;
}
