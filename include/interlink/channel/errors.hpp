#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace interlink::channel {

    // Error categories surfaced by channels
    enum class ErrorKind {
        OversizedPayload,
        TransportFailure,
        Interrupted,
        PeerTerminated,
        ReceiveAborted,
        RemoteFailure,
        RemoteTimeout,
        ProtocolViolation
    };

    const char *to_string(ErrorKind kind);

    // Base class for every error raised by a channel
    class ChannelError : public std::runtime_error {
      public:
        ChannelError(ErrorKind kind, const std::string &message) : std::runtime_error(message), kind_(kind) {}

        ErrorKind kind() const noexcept { return kind_; }

      private:
        ErrorKind kind_;
    };

    // Payload exceeds max_transmission_length; raised before any I/O
    class OversizedPayload : public ChannelError {
      public:
        OversizedPayload(size_t actual, size_t allowed);

        size_t actual() const noexcept { return actual_; }
        size_t allowed() const noexcept { return allowed_; }

      private:
        size_t actual_;
        size_t allowed_;
    };

    // Low-level connect/read/write failure reported by the operating system
    class TransportFailure : public ChannelError {
      public:
        TransportFailure(const std::string &what, int error_code);

        int error_code() const noexcept { return error_code_; }

      private:
        int error_code_;
    };

    // A blocking transport call was interrupted by a signal
    class Interrupted : public ChannelError {
      public:
        explicit Interrupted(const std::string &what) : ChannelError(ErrorKind::Interrupted, what) {}
    };

    // The peer closed the stream while a response was expected
    class PeerTerminated : public ChannelError {
      public:
        PeerTerminated() : ChannelError(ErrorKind::PeerTerminated, "The server unexpectedly died") {}
    };

    // Receive was interrupted; the stream may be desynchronized
    class ReceiveAborted : public ChannelError {
      public:
        ReceiveAborted()
            : ChannelError(ErrorKind::ReceiveAborted,
                           "Receive aborted, you should restart the server or call try_repair() "
                           "if you are sure that the response will arrive") {}
    };

    // The peer answered "failure <message>"
    class RemoteFailure : public ChannelError {
      public:
        explicit RemoteFailure(const std::string &message) : ChannelError(ErrorKind::RemoteFailure, message) {}
    };

    // The peer answered "failure <timeout>"
    class RemoteTimeout : public ChannelError {
      public:
        RemoteTimeout()
            : ChannelError(ErrorKind::RemoteTimeout,
                           "Timeout: you should restart the server and increase its timeout") {}
    };

    // Malformed length header or status line
    class ProtocolViolation : public ChannelError {
      public:
        explicit ProtocolViolation(const std::string &message)
            : ChannelError(ErrorKind::ProtocolViolation, message) {}
    };

} // namespace interlink::channel
