#pragma once

#include <chrono>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include <interlink/channel/address.hpp>
#include <interlink/channel/channel.hpp>
#include <interlink/channel/transport.hpp>

namespace interlink::channel {

    enum class ChannelKind {
        Auto,  // default_transport_kind()
        Tcp,   // loopback TCP
        Unix,  // Unix domain socket
        Direct // line-based over the given streams
    };

    // Channel factory configuration
    struct ChannelConfig {
        ChannelKind kind{ChannelKind::Auto};

        // Server id: port number for TCP, socket name for Unix
        std::optional<std::string> id;
        // Environment variable overriding the Unix socket path; empty disables it
        std::string socket_env_var{DEFAULT_SOCKET_ENV_VAR};

        std::chrono::milliseconds connect_timeout{1000};
        std::chrono::milliseconds flush_poll_interval{100};
        // Overrides the variant's default when set
        std::optional<size_t> max_transmission_length;

        ConfigureHook configure;
        TransportFactory transport_factory;

        // Required for ChannelKind::Direct
        std::istream *in{nullptr};
        std::ostream *out{nullptr};

        ChannelConfig() = default;
    };

    // Build the channel variant selected by config. Socket variants connect
    // immediately and propagate connection failures
    std::unique_ptr<Channel> create_channel(const ChannelConfig &config);

    // Owns a channel and closes it on every exit path; close errors are discarded
    class ScopedChannel {
      public:
        explicit ScopedChannel(std::unique_ptr<Channel> channel);

        ~ScopedChannel();

        // Disable copy
        ScopedChannel(const ScopedChannel &) = delete;
        ScopedChannel &operator=(const ScopedChannel &) = delete;

        // Enable move
        ScopedChannel(ScopedChannel &&) noexcept;
        ScopedChannel &operator=(ScopedChannel &&) noexcept;

        Channel &operator*() const { return *channel_; }
        Channel *operator->() const { return channel_.get(); }
        Channel *get() const { return channel_.get(); }

        explicit operator bool() const { return channel_ != nullptr; }

      private:
        void release() noexcept;

        std::unique_ptr<Channel> channel_;
    };

    ScopedChannel open_channel(const ChannelConfig &config);

} // namespace interlink::channel
