#include <interlink/channel/direct_channel.hpp>
#include <interlink/channel/wire_format.hpp>

#include <cerrno>
#include <string>

namespace interlink::channel {

    DirectChannel::DirectChannel(std::istream &in, std::ostream &out)
        : Channel(DEFAULT_MAX_TRANSMISSION_LENGTH), in_(in), out_(out) {}

    std::string DirectChannel::escape_newlines(const std::string &data) {
        std::string escaped;
        escaped.reserve(data.size());
        for (char c : data) {
            if (c == '\n') {
                escaped += "\\n";
            } else {
                escaped.push_back(c);
            }
        }
        return escaped;
    }

    std::string DirectChannel::send(const std::string &data) {
        if (data.size() > max_transmission_length_) {
            throw OversizedPayload(data.size(), max_transmission_length_);
        }

        out_ << escape_newlines(data) << '\n';
        out_.flush();
        if (!out_.good()) {
            throw TransportFailure("Failed writing request", EIO);
        }

        std::string line;
        if (!std::getline(in_, line)) {
            throw PeerTerminated();
        }
        return wire::decode_response(line);
    }

    Channel::Result<std::string> DirectChannel::try_repair() {
        return Result<std::string>::failure("try_repair is not supported on a direct channel");
    }

} // namespace interlink::channel
