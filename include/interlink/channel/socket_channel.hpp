#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <interlink/channel/address.hpp>
#include <interlink/channel/channel.hpp>
#include <interlink/channel/transport.hpp>

namespace interlink::channel {

    // Largest single receive() issued while reading a frame body
    constexpr size_t RECEIVE_CHUNK_SIZE = 64 * 1024;

    // Socket channel configuration
    struct SocketChannelConfig {
        // Bound on the connect call only; reads and writes never time out
        std::chrono::milliseconds connect_timeout{1000};
        // How long flush() waits for another stray frame
        std::chrono::milliseconds flush_poll_interval{100};
        size_t max_transmission_length{1'000'000};
        // Creates transports; defaults to StreamSocket
        TransportFactory transport_factory;
        // Platform tuning applied to each new transport before connecting
        ConfigureHook configure;

        SocketChannelConfig() = default;
    };

    // Length-prefixed request/response channel over a stream socket.
    // A failed write triggers exactly one reconnect and a full resend of the frame
    class SocketChannel : public Channel {
      public:
        // Connects immediately; throws TransportFailure when the server is unreachable
        explicit SocketChannel(Address address, SocketChannelConfig config = SocketChannelConfig{});

        // Implicit close; errors are reported on stderr and discarded
        ~SocketChannel() override;

        std::string send(const std::string &data) override;
        void close() override;
        void flush() noexcept override;
        Result<std::string> try_repair() override;

        const Address &address() const { return address_; }
        bool connected() const { return connected_; }

        // Number of reconnects performed by the send path
        size_t reconnect_count() const { return reconnect_count_; }

      private:
        void start();
        void reconnect();

        void send_only(const std::string &data);
        std::string receive_only();

        // Header and payload as two sequential writes
        void write_frame(const std::string &frame);

        std::string receive_header();
        std::string receive_exact(size_t length);

        Address address_;
        SocketChannelConfig config_;
        std::unique_ptr<Transport> transport_;
        bool connected_{false};
        size_t reconnect_count_{0};
    };

    // Loopback TCP variant; disables Nagle's algorithm on every connection
    class TcpChannel : public SocketChannel {
      public:
        explicit TcpChannel(TcpAddress address, SocketChannelConfig config = SocketChannelConfig{});
    };

    // Unix domain socket variant
    class UnixChannel : public SocketChannel {
      public:
        explicit UnixChannel(UnixAddress address, SocketChannelConfig config = SocketChannelConfig{});
    };

} // namespace interlink::channel
