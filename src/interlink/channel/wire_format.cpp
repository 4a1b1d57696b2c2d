#include <interlink/channel/errors.hpp>
#include <interlink/channel/wire_format.hpp>

#include <cctype>

namespace interlink::channel::wire {

    namespace {

        bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

        bool is_digit(char c) { return c >= '0' && c <= '9'; }

    } // namespace

    std::string encode_header(size_t length) {
        if (length > MAX_FRAME_LENGTH) {
            throw ProtocolViolation("Frame length " + std::to_string(length) + " does not fit in the header");
        }

        auto digits = std::to_string(length);
        std::string header(HEADER_SIZE - digits.size(), ' ');
        header += digits;
        return header;
    }

    size_t parse_header(std::string_view raw) {
        size_t begin = 0;
        size_t end = raw.size();
        while (begin < end && is_space(raw[begin])) {
            ++begin;
        }
        while (end > begin && is_space(raw[end - 1])) {
            --end;
        }

        if (begin == end) {
            throw ProtocolViolation("Empty length header");
        }
        if (end - begin > HEADER_SIZE) {
            throw ProtocolViolation("Length header too long");
        }

        size_t value = 0;
        for (size_t i = begin; i < end; ++i) {
            if (!is_digit(raw[i])) {
                throw ProtocolViolation("Invalid length header '" + std::string(raw) + "'");
            }
            value = value * 10 + static_cast<size_t>(raw[i] - '0');
        }
        return value;
    }

    std::string encode_frame(std::string_view payload, size_t max_transmission_length) {
        if (payload.size() > max_transmission_length) {
            throw OversizedPayload(payload.size(), max_transmission_length);
        }

        auto frame = encode_header(payload.size());
        frame.append(payload.data(), payload.size());
        return frame;
    }

    std::string decode_frame(std::string_view frame) {
        if (frame.size() < HEADER_SIZE) {
            throw ProtocolViolation("Frame shorter than its header");
        }

        auto length = parse_header(frame.substr(0, HEADER_SIZE));
        auto payload = frame.substr(HEADER_SIZE);
        if (payload.size() != length) {
            throw ProtocolViolation("Frame declares " + std::to_string(length) + " bytes but carries " +
                                    std::to_string(payload.size()));
        }
        return std::string(payload);
    }

    std::string decode_response(std::string_view response) {
        auto space = response.find(' ');
        if (space == std::string_view::npos) {
            throw ProtocolViolation("Malformed response, missing status separator");
        }

        auto status = response.substr(0, space);
        auto body = response.substr(space + 1);

        if (status == STATUS_SUCCESS) {
            return std::string(body);
        }
        if (status == STATUS_FAILURE) {
            if (body == TIMEOUT_SENTINEL) {
                throw RemoteTimeout();
            }
            throw RemoteFailure(std::string(body));
        }
        throw ProtocolViolation("Unknown response status '" + std::string(status) + "'");
    }

    std::string close_frame() { return encode_header(CLOSE_TOKEN.size()) + std::string(CLOSE_TOKEN); }

} // namespace interlink::channel::wire
