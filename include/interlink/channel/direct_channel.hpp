#pragma once

#include <istream>
#include <ostream>

#include <interlink/channel/channel.hpp>

namespace interlink::channel {

    // Direct channel - line-based exchange over the standard streams of a
    // co-located server process. No framing, no reconnection
    class DirectChannel : public Channel {
      public:
        static constexpr size_t DEFAULT_MAX_TRANSMISSION_LENGTH = 10'000;

        DirectChannel(std::istream &in, std::ostream &out);

        std::string send(const std::string &data) override;

        void close() override {}
        void flush() noexcept override {}
        Result<std::string> try_repair() override;

        // Replace embedded newlines with the two characters '\' 'n'
        static std::string escape_newlines(const std::string &data);

      private:
        std::istream &in_;
        std::ostream &out_;
    };

} // namespace interlink::channel
