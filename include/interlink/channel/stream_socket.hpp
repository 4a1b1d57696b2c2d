#pragma once

#include <interlink/channel/transport.hpp>

namespace interlink::channel {

    // Blocking POSIX stream socket (AF_INET or AF_UNIX)
    class StreamSocket : public Transport {
      public:
        StreamSocket() = default;

        // Adopt an already connected descriptor
        explicit StreamSocket(int fd);

        ~StreamSocket() override;

        StreamSocket(const StreamSocket &) = delete;
        StreamSocket &operator=(const StreamSocket &) = delete;

        StreamSocket(StreamSocket &&other) noexcept;
        StreamSocket &operator=(StreamSocket &&other) noexcept;

        void connect(const Address &address, std::chrono::milliseconds timeout) override;
        void send_all(const uint8_t *data, size_t len) override;
        size_t receive(uint8_t *buffer, size_t len) override;
        bool wait_readable(std::chrono::milliseconds timeout) override;
        void close() noexcept override;
        bool is_open() const override { return fd_ >= 0; }

        // Disable Nagle's algorithm; takes effect on TCP sockets when they are opened
        void set_no_delay(bool enabled);

        int fd() const { return fd_; }

      private:
        void connect_tcp(const TcpAddress &address, std::chrono::milliseconds timeout);
        void connect_unix(const UnixAddress &address, std::chrono::milliseconds timeout);

        int fd_{-1};
        bool no_delay_{false};
        bool tcp_{false};
    };

} // namespace interlink::channel
