#pragma once
#include <expected>
#include <functional>
#include <string>

namespace negotiator::session {

enum class ErrorKind {
    ConnectionClosed,
    CandidateRejected,
    DescriptionNegotiationFailed,
    InvalidArgument
};

struct Error {
    ErrorKind kind;
    std::string message;
};

template <typename T>
using Result = std::expected<T, Error>;

using ResultCallback = std::function<void(Result<void>)>;

const char* toString(ErrorKind kind);

Error connectionClosed();

// "<kind>: <message>"
std::string describe(const Error& error);

}
