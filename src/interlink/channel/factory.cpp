#include <interlink/channel/direct_channel.hpp>
#include <interlink/channel/factory.hpp>
#include <interlink/channel/socket_channel.hpp>

#include <iostream>
#include <stdexcept>

namespace interlink::channel {

    namespace {

        SocketChannelConfig socket_config(const ChannelConfig &config) {
            SocketChannelConfig socket_cfg;
            socket_cfg.connect_timeout = config.connect_timeout;
            socket_cfg.flush_poll_interval = config.flush_poll_interval;
            if (config.max_transmission_length.has_value()) {
                socket_cfg.max_transmission_length = *config.max_transmission_length;
            }
            socket_cfg.transport_factory = config.transport_factory;
            socket_cfg.configure = config.configure;
            return socket_cfg;
        }

    } // namespace

    std::unique_ptr<Channel> create_channel(const ChannelConfig &config) {
        auto kind = config.kind;
        if (kind == ChannelKind::Auto) {
            kind = default_transport_kind() == TransportKind::Tcp ? ChannelKind::Tcp : ChannelKind::Unix;
        }

        switch (kind) {
        case ChannelKind::Direct: {
            if (config.in == nullptr || config.out == nullptr) {
                throw std::invalid_argument("Direct channel requires input and output streams");
            }
            auto channel = std::make_unique<DirectChannel>(*config.in, *config.out);
            if (config.max_transmission_length.has_value()) {
                channel->set_max_transmission_length(*config.max_transmission_length);
            }
            return channel;
        }
        case ChannelKind::Tcp:
            return std::make_unique<TcpChannel>(resolve_tcp_address(config.id), socket_config(config));
        case ChannelKind::Unix:
        case ChannelKind::Auto:
            break;
        }
        return std::make_unique<UnixChannel>(resolve_unix_address(config.id, config.socket_env_var),
                                             socket_config(config));
    }

    ScopedChannel::ScopedChannel(std::unique_ptr<Channel> channel) : channel_(std::move(channel)) {}

    ScopedChannel::~ScopedChannel() { release(); }

    ScopedChannel::ScopedChannel(ScopedChannel &&other) noexcept : channel_(std::move(other.channel_)) {}

    ScopedChannel &ScopedChannel::operator=(ScopedChannel &&other) noexcept {
        if (this != &other) {
            release();
            channel_ = std::move(other.channel_);
        }
        return *this;
    }

    void ScopedChannel::release() noexcept {
        if (!channel_) {
            return;
        }
        try {
            channel_->close();
        } catch (const std::exception &e) {
            std::cerr << "Ignoring error while closing channel: " << e.what() << std::endl;
        }
        channel_.reset();
    }

    ScopedChannel open_channel(const ChannelConfig &config) { return ScopedChannel(create_channel(config)); }

} // namespace interlink::channel
