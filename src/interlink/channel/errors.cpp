#include <interlink/channel/errors.hpp>

#include <cstring>

namespace interlink::channel {

    const char *to_string(ErrorKind kind) {
        switch (kind) {
        case ErrorKind::OversizedPayload:
            return "oversized payload";
        case ErrorKind::TransportFailure:
            return "transport failure";
        case ErrorKind::Interrupted:
            return "interrupted";
        case ErrorKind::PeerTerminated:
            return "peer terminated";
        case ErrorKind::ReceiveAborted:
            return "receive aborted";
        case ErrorKind::RemoteFailure:
            return "remote failure";
        case ErrorKind::RemoteTimeout:
            return "remote timeout";
        case ErrorKind::ProtocolViolation:
            return "protocol violation";
        }
        return "unknown";
    }

    OversizedPayload::OversizedPayload(size_t actual, size_t allowed)
        : ChannelError(ErrorKind::OversizedPayload, "Data exceeds max transmission length " +
                                                        std::to_string(actual) + " > " + std::to_string(allowed)),
          actual_(actual), allowed_(allowed) {}

    TransportFailure::TransportFailure(const std::string &what, int error_code)
        : ChannelError(ErrorKind::TransportFailure, what + ": " + std::strerror(error_code)), error_code_(error_code) {}

} // namespace interlink::channel
