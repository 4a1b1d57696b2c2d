/**
 * Echo Server Example
 *
 * Speaks the length-prefixed frame protocol on a Unix domain socket and
 * answers every request with "success <request>". A request of "timeout"
 * is answered with "failure <timeout>" to exercise client error handling.
 * Stops after a client sends the $close control frame.
 *
 * Build with: cmake -DINTERLINK_BUILD_EXAMPLES=ON
 * Run: ./echo_server [id]
 */

#include <cstdio>
#include <iostream>
#include <interlink/interlink.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using namespace interlink::channel;

namespace {

    bool read_exact(StreamSocket &peer, std::string &out, size_t length) {
        out.assign(length, '\0');
        size_t got = 0;
        while (got < length) {
            auto n = peer.receive(reinterpret_cast<uint8_t *>(&out[got]), length - got);
            if (n == 0) {
                return false;
            }
            got += n;
        }
        return true;
    }

    void reply(StreamSocket &peer, const std::string &payload) {
        auto frame = wire::encode_frame(payload, payload.size());
        peer.send_all(reinterpret_cast<const uint8_t *>(frame.data()), frame.size());
    }

} // namespace

int main(int argc, char *argv[]) {
    std::optional<std::string> id;
    if (argc >= 2) {
        id = argv[1];
    }
    auto address = resolve_unix_address(id);

    int listen_fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (listen_fd < 0) {
        std::perror("socket");
        return 1;
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", address.path.c_str());
    ::unlink(address.path.c_str());
    if (::bind(listen_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0 || ::listen(listen_fd, 1) < 0) {
        std::perror("bind/listen");
        ::close(listen_fd);
        return 1;
    }

    std::cout << "Echo server listening on " << address.path << std::endl;

    bool closed = false;
    while (!closed) {
        int client = ::accept(listen_fd, nullptr, nullptr);
        if (client < 0) {
            std::perror("accept");
            break;
        }

        StreamSocket peer(client);
        try {
            std::string header;
            std::string request;
            while (read_exact(peer, header, wire::HEADER_SIZE) &&
                   read_exact(peer, request, wire::parse_header(header))) {
                if (request == wire::CLOSE_TOKEN) {
                    std::cout << "Client closed the session" << std::endl;
                    closed = true;
                    break;
                }
                if (request == "timeout") {
                    reply(peer, "failure <timeout>");
                } else {
                    reply(peer, "success " + request);
                }
            }
        } catch (const ChannelError &e) {
            std::cerr << "Connection dropped: " << e.what() << std::endl;
        }
    }

    ::close(listen_fd);
    ::unlink(address.path.c_str());
    return 0;
}
