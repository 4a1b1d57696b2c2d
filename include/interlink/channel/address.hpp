#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace interlink::channel {

    // Loopback TCP endpoint
    struct TcpAddress {
        std::string host;
        uint16_t port{0};
    };

    // Unix domain socket path
    struct UnixAddress {
        std::string path;
    };

    using Address = std::variant<TcpAddress, UnixAddress>;

    enum class TransportKind { Tcp, Unix };

    // Defaults used when no server id is given
    constexpr uint16_t DEFAULT_TCP_PORT = 7777;
    constexpr const char *DEFAULT_SERVER_ID = "default";
    constexpr const char *DEFAULT_SOCKET_ENV_VAR = "SKILLBRIDGE_SOCK_FILE";

    // "host:port" or the socket path, for diagnostics
    std::string to_string(const Address &address);

    // ("localhost", 7777), or the id parsed as a port number
    TcpAddress resolve_tcp_address(const std::optional<std::string> &id);

    // $env_var if set, otherwise /tmp/skill-server-<id>.sock
    UnixAddress resolve_unix_address(const std::optional<std::string> &id,
                                     const std::string &env_var = DEFAULT_SOCKET_ENV_VAR);

    Address resolve_address(TransportKind kind, const std::optional<std::string> &id,
                            const std::string &env_var = DEFAULT_SOCKET_ENV_VAR);

    // Socket kind used when none is requested. The library is POSIX-only, where
    // Unix domain sockets are always available
    TransportKind default_transport_kind();

} // namespace interlink::channel
