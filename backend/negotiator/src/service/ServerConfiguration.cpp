#include "ServerConfiguration.hpp"

#include <fstream>
#include <memory>
#include <sstream>
#include <json/json.h>

namespace negotiator::rpc {

auto loadServerConfiguration(const std::string& path) -> session::Result<ServerConfiguration> {
    std::ifstream file(path);
    if (!file)
        return std::unexpected(session::Error{session::ErrorKind::InvalidArgument, "cannot open " + path});

    std::ostringstream contents;
    contents << file.rdbuf();
    const auto text = contents.str();

    Json::CharReaderBuilder factory;
    std::unique_ptr<Json::CharReader> reader(factory.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors))
        return std::unexpected(session::Error{session::ErrorKind::InvalidArgument, path + ": " + errors});
    if (!root.isObject())
        return std::unexpected(session::Error{session::ErrorKind::InvalidArgument, path + ": expected a JSON object"});

    ServerConfiguration config;
    if (root["listenAddress"].isString())
        config.listenAddress = root["listenAddress"].asString();
    if (root["logLevel"].isString())
        config.logLevel = plog::severityFromString(root["logLevel"].asCString());
    config.session = session::parseConfiguration(root["session"]);
    return config;
}

}
