#include <interlink/channel/address.hpp>

#include <cstdlib>
#include <stdexcept>

namespace interlink::channel {

    std::string to_string(const Address &address) {
        if (const auto *tcp = std::get_if<TcpAddress>(&address)) {
            return tcp->host + ":" + std::to_string(tcp->port);
        }
        return std::get<UnixAddress>(address).path;
    }

    TcpAddress resolve_tcp_address(const std::optional<std::string> &id) {
        if (!id.has_value()) {
            return TcpAddress{"localhost", DEFAULT_TCP_PORT};
        }

        if (id->empty() || id->front() < '0' || id->front() > '9') {
            throw std::invalid_argument("Invalid port '" + *id + "'");
        }

        size_t consumed = 0;
        unsigned long port = 0;
        try {
            port = std::stoul(*id, &consumed);
        } catch (const std::exception &) {
            throw std::invalid_argument("Invalid port '" + *id + "'");
        }
        if (consumed != id->size() || port == 0 || port > 65535) {
            throw std::invalid_argument("Invalid port '" + *id + "'");
        }
        return TcpAddress{"localhost", static_cast<uint16_t>(port)};
    }

    UnixAddress resolve_unix_address(const std::optional<std::string> &id, const std::string &env_var) {
        if (!env_var.empty()) {
            const char *override_path = std::getenv(env_var.c_str());
            if (override_path != nullptr && override_path[0] != '\0') {
                return UnixAddress{override_path};
            }
        }

        const std::string name = id.value_or(DEFAULT_SERVER_ID);
        return UnixAddress{"/tmp/skill-server-" + name + ".sock"};
    }

    Address resolve_address(TransportKind kind, const std::optional<std::string> &id, const std::string &env_var) {
        if (kind == TransportKind::Tcp) {
            return resolve_tcp_address(id);
        }
        return resolve_unix_address(id, env_var);
    }

    TransportKind default_transport_kind() { return TransportKind::Unix; }

} // namespace interlink::channel
