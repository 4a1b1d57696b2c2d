#include <interlink/channel/channel.hpp>

#include <stdexcept>

namespace interlink::channel {

    Channel::Channel(size_t max_transmission_length) : max_transmission_length_(max_transmission_length) {
        if (max_transmission_length_ == 0) {
            throw std::invalid_argument("max_transmission_length must be positive");
        }
    }

    void Channel::set_max_transmission_length(size_t value) {
        if (value == 0) {
            throw std::invalid_argument("max_transmission_length must be positive");
        }
        max_transmission_length_ = value;
    }

} // namespace interlink::channel
