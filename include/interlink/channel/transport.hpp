#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

#include <interlink/channel/address.hpp>

namespace interlink::channel {

    // Abstract byte-stream transport owned by a SocketChannel
    // Implementations report OS errors as TransportFailure and signal
    // interruptions (EINTR) as Interrupted
    class Transport {
      public:
        virtual ~Transport() = default;

        // Connect with a bounded timeout; afterwards blocking calls have no timeout
        virtual void connect(const Address &address, std::chrono::milliseconds timeout) = 0;

        // Write every byte or throw
        virtual void send_all(const uint8_t *data, size_t len) = 0;

        // Read up to len bytes, blocking until at least one is available.
        // Returns 0 when the peer shut the stream down
        virtual size_t receive(uint8_t *buffer, size_t len) = 0;

        // True when data (or EOF) is readable within timeout
        virtual bool wait_readable(std::chrono::milliseconds timeout) = 0;

        // Release the handle; never throws
        virtual void close() noexcept = 0;

        virtual bool is_open() const = 0;
    };

    // Creates a fresh, unconnected transport
    using TransportFactory = std::function<std::unique_ptr<Transport>()>;

    // Hook applied to each new transport before it connects
    using ConfigureHook = std::function<void(Transport &)>;

} // namespace interlink::channel
