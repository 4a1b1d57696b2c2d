#include <doctest/doctest.h>

#include <interlink/interlink.hpp>

#include <sstream>
#include <stdexcept>

#include "scripted_transport.hpp"

using namespace interlink::channel;
using interlink_test::ScriptState;
using interlink_test::scripted_factory;

namespace {

    ChannelConfig scripted_config(const std::shared_ptr<ScriptState> &state, ChannelKind kind) {
        ChannelConfig config;
        config.kind = kind;
        config.transport_factory = scripted_factory(state);
        config.socket_env_var = "";
        return config;
    }

} // namespace

TEST_SUITE("channel/factory") {
    TEST_CASE("direct channel needs streams") {
        ChannelConfig config;
        config.kind = ChannelKind::Direct;
        CHECK_THROWS_AS(create_channel(config), std::invalid_argument);

        std::istringstream in("success ok\n");
        std::ostringstream out;
        config.in = &in;
        config.out = &out;
        auto channel = create_channel(config);

        REQUIRE(channel != nullptr);
        CHECK(dynamic_cast<DirectChannel *>(channel.get()) != nullptr);
        CHECK(channel->max_transmission_length() == DirectChannel::DEFAULT_MAX_TRANSMISSION_LENGTH);
        CHECK(channel->send("hi") == "ok");
    }

    TEST_CASE("socket variants are selected by kind") {
        auto state = std::make_shared<ScriptState>();

        SUBCASE("tcp") {
            auto channel = create_channel(scripted_config(state, ChannelKind::Tcp));
            auto *tcp = dynamic_cast<TcpChannel *>(channel.get());
            REQUIRE(tcp != nullptr);
            CHECK(to_string(tcp->address()) == "localhost:7777");
        }

        SUBCASE("unix") {
            auto config = scripted_config(state, ChannelKind::Unix);
            config.id = "build";
            auto channel = create_channel(config);
            auto *unix_channel = dynamic_cast<UnixChannel *>(channel.get());
            REQUIRE(unix_channel != nullptr);
            CHECK(to_string(unix_channel->address()) == "/tmp/skill-server-build.sock");
        }

        SUBCASE("auto follows the platform") {
            auto channel = create_channel(scripted_config(state, ChannelKind::Auto));
#ifdef _WIN32
            CHECK(dynamic_cast<TcpChannel *>(channel.get()) != nullptr);
#else
            CHECK(dynamic_cast<UnixChannel *>(channel.get()) != nullptr);
#endif
        }

        CHECK(state->connects == 1);
    }

    TEST_CASE("settings are forwarded to socket channels") {
        auto state = std::make_shared<ScriptState>();
        auto config = scripted_config(state, ChannelKind::Unix);
        config.max_transmission_length = 64;
        int configured = 0;
        config.configure = [&configured](Transport &) { ++configured; };

        auto channel = create_channel(config);

        CHECK(channel->max_transmission_length() == 64);
        CHECK(configured == 1);
        CHECK_THROWS_AS(channel->send(std::string(65, 'x')), OversizedPayload);
    }

    TEST_CASE("connection failure propagates from the factory") {
        auto state = std::make_shared<ScriptState>();
        state->connect_failures = 1;

        CHECK_THROWS_AS(create_channel(scripted_config(state, ChannelKind::Unix)), TransportFailure);
    }

    TEST_CASE("scoped channel closes on scope exit") {
        auto state = std::make_shared<ScriptState>();
        {
            auto channel = open_channel(scripted_config(state, ChannelKind::Unix));
            REQUIRE(channel);
            state->queue_frame("success 42");
            CHECK(channel->send("(answer)") == "42");
        }

        REQUIRE(state->writes.size() == 1);
        CHECK(state->writes[0].back() == "         6$close");
        CHECK(state->closes == 1);
    }

    TEST_CASE("scoped channel closes when an error unwinds the scope") {
        auto state = std::make_shared<ScriptState>();
        auto run = [&] {
            auto channel = open_channel(scripted_config(state, ChannelKind::Unix));
            state->queue_frame("failure boom");
            channel->send("(explode)");
        };

        CHECK_THROWS_AS(run(), RemoteFailure);
        CHECK(state->all_writes().find("         6$close") != std::string::npos);
        CHECK(state->closes == 1);
    }

    TEST_CASE("scoped channel discards close errors") {
        auto state = std::make_shared<ScriptState>();
        auto run = [&] {
            auto channel = open_channel(scripted_config(state, ChannelKind::Unix));
            state->failing_sends = {state->send_calls};
        };

        CHECK_NOTHROW(run());
        CHECK(state->closes == 1);
    }

    TEST_CASE("scoped channel moves ownership") {
        auto state = std::make_shared<ScriptState>();
        {
            auto first = open_channel(scripted_config(state, ChannelKind::Unix));
            ScopedChannel second(std::move(first));
            CHECK_FALSE(first);
            CHECK(second);
            CHECK(state->closes == 0);
        }
        CHECK(state->closes == 1);
        CHECK(state->all_writes() == "         6$close");
    }
}
