#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

#include <interlink/channel/errors.hpp>

namespace interlink::channel {

    // Request/response channel to a single long-lived interpreter server.
    // One request, one response, synchronously; not safe for concurrent callers
    class Channel {
      public:
        // Result type for operations that report errors as values
        template <typename T> struct Result {
            bool success{false};
            T value{};
            std::string error;
            std::optional<ErrorKind> kind;

            static Result<T> ok(T val) { return Result<T>{true, std::move(val), "", std::nullopt}; }

            static Result<T> failure(std::string err, std::optional<ErrorKind> k = std::nullopt) {
                return Result<T>{false, {}, std::move(err), k};
            }
        };

        explicit Channel(size_t max_transmission_length);

        virtual ~Channel() = default;

        // Disable copy
        Channel(const Channel &) = delete;
        Channel &operator=(const Channel &) = delete;

        // Send one request and block until its response is decoded.
        // Throws a ChannelError subclass on failure
        virtual std::string send(const std::string &data) = 0;

        // Tell the server no further requests will arrive and release the connection
        virtual void close() = 0;

        // Discard responses the server sent but nobody read; never throws
        virtual void flush() noexcept = 0;

        // Read one pending frame after an aborted receive
        virtual Result<std::string> try_repair() = 0;

        size_t max_transmission_length() const { return max_transmission_length_; }

        // Throws std::invalid_argument on zero
        void set_max_transmission_length(size_t value);

      protected:
        size_t max_transmission_length_;
    };

} // namespace interlink::channel
