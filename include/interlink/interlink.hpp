#pragma once

#include "interlink/channel/address.hpp"
#include "interlink/channel/channel.hpp"
#include "interlink/channel/direct_channel.hpp"
#include "interlink/channel/errors.hpp"
#include "interlink/channel/factory.hpp"
#include "interlink/channel/socket_channel.hpp"
#include "interlink/channel/stream_socket.hpp"
#include "interlink/channel/transport.hpp"
#include "interlink/channel/wire_format.hpp"

namespace interlink {

    using Channel = channel::Channel;
    using ChannelConfig = channel::ChannelConfig;
    using ChannelKind = channel::ChannelKind;
    using ScopedChannel = channel::ScopedChannel;

} // namespace interlink
