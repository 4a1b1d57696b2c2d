#include <interlink/channel/socket_channel.hpp>
#include <interlink/channel/stream_socket.hpp>
#include <interlink/channel/wire_format.hpp>

#include <algorithm>
#include <cerrno>
#include <iostream>

namespace interlink::channel {

    namespace {

        SocketChannelConfig with_no_delay(SocketChannelConfig config) {
            auto user_hook = std::move(config.configure);
            config.configure = [user_hook](Transport &transport) {
                if (auto *socket = dynamic_cast<StreamSocket *>(&transport)) {
                    socket->set_no_delay(true);
                }
                if (user_hook) {
                    user_hook(transport);
                }
            };
            return config;
        }

    } // namespace

    SocketChannel::SocketChannel(Address address, SocketChannelConfig config)
        : Channel(config.max_transmission_length), address_(std::move(address)), config_(std::move(config)) {
        if (!config_.transport_factory) {
            config_.transport_factory = [] { return std::make_unique<StreamSocket>(); };
        }
        start();
    }

    SocketChannel::~SocketChannel() {
        try {
            close();
        } catch (const std::exception &e) {
            std::cerr << "Ignoring error while closing channel to " << to_string(address_) << ": " << e.what()
                      << std::endl;
        }
    }

    void SocketChannel::start() {
        auto transport = config_.transport_factory();
        if (config_.configure) {
            config_.configure(*transport);
        }
        transport->connect(address_, config_.connect_timeout);

        transport_ = std::move(transport);
        connected_ = true;
    }

    void SocketChannel::reconnect() {
        if (transport_) {
            transport_->close();
            transport_.reset();
        }
        connected_ = false;
        ++reconnect_count_;
        start();
    }

    std::string SocketChannel::send(const std::string &data) {
        send_only(data);
        return receive_only();
    }

    void SocketChannel::send_only(const std::string &data) {
        // Size check happens here, before any I/O
        auto frame = wire::encode_frame(data, max_transmission_length_);

        try {
            write_frame(frame);
        } catch (const TransportFailure &e) {
            std::cerr << "Send failed (" << e.what() << "), attempting to reconnect to " << to_string(address_)
                      << std::endl;
            reconnect();
            write_frame(frame);
        }
    }

    void SocketChannel::write_frame(const std::string &frame) {
        if (!transport_ || !transport_->is_open()) {
            throw TransportFailure("Channel is not connected", ENOTCONN);
        }

        const auto *bytes = reinterpret_cast<const uint8_t *>(frame.data());
        transport_->send_all(bytes, wire::HEADER_SIZE);
        transport_->send_all(bytes + wire::HEADER_SIZE, frame.size() - wire::HEADER_SIZE);
    }

    std::string SocketChannel::receive_only() {
        try {
            auto header = receive_header();
            auto body = receive_exact(wire::parse_header(header));
            return wire::decode_response(body);
        } catch (const Interrupted &) {
            throw ReceiveAborted();
        }
    }

    std::string SocketChannel::receive_header() { return receive_exact(wire::HEADER_SIZE); }

    std::string SocketChannel::receive_exact(size_t length) {
        if (!transport_ || !transport_->is_open()) {
            throw TransportFailure("Channel is not connected", ENOTCONN);
        }

        // The declared length comes from the peer; grow only as bytes arrive
        std::string buffer;
        size_t received = 0;
        while (received < length) {
            auto step = std::min(length - received, RECEIVE_CHUNK_SIZE);
            buffer.resize(received + step);
            auto n = transport_->receive(reinterpret_cast<uint8_t *>(&buffer[received]), step);
            if (n == 0) {
                throw PeerTerminated();
            }
            received += n;
            buffer.resize(received);
        }
        return buffer;
    }

    Channel::Result<std::string> SocketChannel::try_repair() {
        try {
            auto header = receive_header();
            return Result<std::string>::ok(receive_exact(wire::parse_header(header)));
        } catch (const ChannelError &e) {
            return Result<std::string>::failure(e.what(), e.kind());
        } catch (const std::exception &e) {
            return Result<std::string>::failure(e.what());
        }
    }

    void SocketChannel::close() {
        if (!connected_) {
            return;
        }

        auto frame = wire::close_frame();
        try {
            transport_->send_all(reinterpret_cast<const uint8_t *>(frame.data()), frame.size());
        } catch (const ChannelError &) {
            transport_->close();
            connected_ = false;
            throw;
        }
        transport_->close();
        connected_ = false;
    }

    void SocketChannel::flush() noexcept {
        try {
            while (transport_ && transport_->is_open() && transport_->wait_readable(config_.flush_poll_interval)) {
                auto length = wire::parse_header(receive_header());
                receive_exact(length);
                std::cerr << "Discarded stray frame of " << length << " bytes" << std::endl;
            }
        } catch (const std::exception &e) {
            std::cerr << "Flush stopped: " << e.what() << std::endl;
        }
    }

    TcpChannel::TcpChannel(TcpAddress address, SocketChannelConfig config)
        : SocketChannel(Address{std::move(address)}, with_no_delay(std::move(config))) {}

    UnixChannel::UnixChannel(UnixAddress address, SocketChannelConfig config)
        : SocketChannel(Address{std::move(address)}, std::move(config)) {}

} // namespace interlink::channel
