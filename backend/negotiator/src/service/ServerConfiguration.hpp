#pragma once

#include <string>
#include <plog/Severity.h>
#include "../session/Configuration.hpp"
#include "../session/Error.hpp"

namespace negotiator::rpc {

struct ServerConfiguration {
    std::string listenAddress = "0.0.0.0:50051";
    plog::Severity logLevel = plog::info;
    session::Configuration session;
};

// {"listenAddress": ..., "logLevel": "debug", "session": {...}}; missing keys keep defaults.
auto loadServerConfiguration(const std::string& path) -> session::Result<ServerConfiguration>;

}
