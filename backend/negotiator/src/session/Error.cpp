#include "Error.hpp"

namespace negotiator::session {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConnectionClosed:
            return "ConnectionClosed";
        case ErrorKind::CandidateRejected:
            return "CandidateRejected";
        case ErrorKind::DescriptionNegotiationFailed:
            return "DescriptionNegotiationFailed";
        case ErrorKind::InvalidArgument:
            return "InvalidArgument";
    }
    return "Unknown";
}

Error connectionClosed() {
    return Error{ErrorKind::ConnectionClosed, "PeerConnection object is closed"};
}

std::string describe(const Error& error) {
    return std::string(toString(error.kind)) + ": " + error.message;
}

}
