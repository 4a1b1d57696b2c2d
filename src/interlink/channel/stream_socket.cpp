#include <interlink/channel/errors.hpp>
#include <interlink/channel/stream_socket.hpp>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace interlink::channel {

    namespace {

        int to_poll_timeout(std::chrono::milliseconds timeout) {
            return timeout.count() < 0 ? -1 : static_cast<int>(timeout.count());
        }

        // Phase one of the connect: non-blocking connect bounded by timeout.
        // Phase two: restore blocking mode so later reads/writes wait indefinitely
        void connect_bounded(int fd, const sockaddr *addr, socklen_t addr_len, std::chrono::milliseconds timeout) {
            int flags = ::fcntl(fd, F_GETFL, 0);
            if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
                throw TransportFailure("fcntl() failed", errno);
            }

            if (::connect(fd, addr, addr_len) < 0) {
                if (errno != EINPROGRESS) {
                    throw TransportFailure("connect() failed", errno);
                }

                pollfd pfd{};
                pfd.fd = fd;
                pfd.events = POLLOUT;
                int ready = 0;
                do {
                    ready = ::poll(&pfd, 1, to_poll_timeout(timeout));
                } while (ready < 0 && errno == EINTR);

                if (ready == 0) {
                    throw TransportFailure("connect() timed out", ETIMEDOUT);
                }
                if (ready < 0) {
                    throw TransportFailure("poll() failed during connect", errno);
                }

                int so_error = 0;
                socklen_t len = sizeof(so_error);
                if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
                    throw TransportFailure("getsockopt(SO_ERROR) failed", errno);
                }
                if (so_error != 0) {
                    throw TransportFailure("connect() failed", so_error);
                }
            }

            if (::fcntl(fd, F_SETFL, flags) < 0) {
                throw TransportFailure("fcntl() failed", errno);
            }
        }

    } // namespace

    StreamSocket::StreamSocket(int fd) : fd_(fd) {}

    StreamSocket::~StreamSocket() { close(); }

    StreamSocket::StreamSocket(StreamSocket &&other) noexcept
        : fd_(other.fd_), no_delay_(other.no_delay_), tcp_(other.tcp_) {
        other.fd_ = -1;
    }

    StreamSocket &StreamSocket::operator=(StreamSocket &&other) noexcept {
        if (this != &other) {
            close();
            fd_ = other.fd_;
            no_delay_ = other.no_delay_;
            tcp_ = other.tcp_;
            other.fd_ = -1;
        }
        return *this;
    }

    void StreamSocket::connect(const Address &address, std::chrono::milliseconds timeout) {
        close();

        if (const auto *tcp = std::get_if<TcpAddress>(&address)) {
            connect_tcp(*tcp, timeout);
        } else {
            connect_unix(std::get<UnixAddress>(address), timeout);
        }
    }

    void StreamSocket::connect_tcp(const TcpAddress &address, std::chrono::milliseconds timeout) {
        addrinfo hints{};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;

        addrinfo *result = nullptr;
        auto service = std::to_string(address.port);
        int ret = ::getaddrinfo(address.host.c_str(), service.c_str(), &hints, &result);
        if (ret != 0) {
            throw TransportFailure("getaddrinfo(" + address.host + ") failed (" + ::gai_strerror(ret) + ")",
                                   EADDRNOTAVAIL);
        }

        int last_error = ECONNREFUSED;
        for (addrinfo *ai = result; ai != nullptr; ai = ai->ai_next) {
            int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) {
                last_error = errno;
                continue;
            }

            fd_ = fd;
            tcp_ = true;
            try {
                if (no_delay_) {
                    set_no_delay(true);
                }
                connect_bounded(fd_, ai->ai_addr, ai->ai_addrlen, timeout);
                ::freeaddrinfo(result);
                return;
            } catch (const TransportFailure &e) {
                last_error = e.error_code();
                close();
            }
        }

        ::freeaddrinfo(result);
        throw TransportFailure("Failed to connect to " + to_string(Address{address}), last_error);
    }

    void StreamSocket::connect_unix(const UnixAddress &address, std::chrono::milliseconds timeout) {
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        if (address.path.size() >= sizeof(addr.sun_path)) {
            throw TransportFailure("Socket path too long '" + address.path + "'", ENAMETOOLONG);
        }
        std::memcpy(addr.sun_path, address.path.c_str(), address.path.size() + 1);

        fd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
        if (fd_ < 0) {
            throw TransportFailure("socket() failed", errno);
        }
        tcp_ = false;

        try {
            connect_bounded(fd_, reinterpret_cast<const sockaddr *>(&addr), sizeof(addr), timeout);
        } catch (const TransportFailure &e) {
            close();
            throw TransportFailure("Failed to connect to " + address.path, e.error_code());
        }
    }

    void StreamSocket::send_all(const uint8_t *data, size_t len) {
        if (fd_ < 0) {
            throw TransportFailure("send() on closed socket", EBADF);
        }

        size_t sent = 0;
        while (sent < len) {
            ssize_t n = ::send(fd_, data + sent, len - sent, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw TransportFailure("send() failed", errno);
            }
            sent += static_cast<size_t>(n);
        }
    }

    size_t StreamSocket::receive(uint8_t *buffer, size_t len) {
        if (fd_ < 0) {
            throw TransportFailure("recv() on closed socket", EBADF);
        }

        ssize_t n = ::recv(fd_, buffer, len, 0);
        if (n < 0) {
            if (errno == EINTR) {
                throw Interrupted("recv() interrupted");
            }
            throw TransportFailure("recv() failed", errno);
        }
        return static_cast<size_t>(n);
    }

    bool StreamSocket::wait_readable(std::chrono::milliseconds timeout) {
        if (fd_ < 0) {
            return false;
        }

        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, to_poll_timeout(timeout));
        if (ready < 0) {
            if (errno == EINTR) {
                throw Interrupted("poll() interrupted");
            }
            throw TransportFailure("poll() failed", errno);
        }
        return ready > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
    }

    void StreamSocket::close() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    void StreamSocket::set_no_delay(bool enabled) {
        no_delay_ = enabled;
        if (fd_ < 0 || !tcp_) {
            return;
        }

        int flag = enabled ? 1 : 0;
        if (::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) < 0) {
            throw TransportFailure("setsockopt(TCP_NODELAY) failed", errno);
        }
    }

} // namespace interlink::channel
