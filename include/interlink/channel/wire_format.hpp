#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace interlink::channel::wire {

    // Frame layout: [10-byte space-padded decimal length][payload]
    constexpr size_t HEADER_SIZE = 10;

    // Largest length representable in the header
    constexpr size_t MAX_FRAME_LENGTH = 9'999'999'999ULL;

    constexpr std::string_view STATUS_SUCCESS = "success";
    constexpr std::string_view STATUS_FAILURE = "failure";
    constexpr std::string_view TIMEOUT_SENTINEL = "<timeout>";

    // Control token asking the server to drop the connection
    constexpr std::string_view CLOSE_TOKEN = "$close";

    // Right-justified, space-padded decimal length
    std::string encode_header(size_t length);

    // Parse a received header; throws ProtocolViolation if it is not a decimal number
    size_t parse_header(std::string_view raw);

    // Header + payload. Throws OversizedPayload when payload.size() > max_transmission_length
    std::string encode_frame(std::string_view payload, size_t max_transmission_length);

    // Inverse of encode_frame for a complete frame held in memory
    std::string decode_frame(std::string_view frame);

    // Decode "<status> <body>" and return body on success.
    // failure <timeout> -> RemoteTimeout, failure <msg> -> RemoteFailure,
    // anything else -> ProtocolViolation
    std::string decode_response(std::string_view response);

    // The 16-byte "         6$close" control frame
    std::string close_frame();

} // namespace interlink::channel::wire
