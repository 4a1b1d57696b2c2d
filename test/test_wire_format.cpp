#include <doctest/doctest.h>

#include <interlink/channel/errors.hpp>
#include <interlink/channel/wire_format.hpp>

TEST_SUITE("channel/wire_format") {
    TEST_CASE("encode_header right-justifies with spaces") {
        using namespace interlink::channel::wire;

        CHECK(encode_header(0) == "         0");
        CHECK(encode_header(6) == "         6");
        CHECK(encode_header(1'000'000) == "   1000000");
        CHECK(encode_header(MAX_FRAME_LENGTH) == "9999999999");
        CHECK(encode_header(42).size() == HEADER_SIZE);
    }

    TEST_CASE("encode_header rejects lengths wider than the header") {
        using namespace interlink::channel;

        CHECK_THROWS_AS(wire::encode_header(wire::MAX_FRAME_LENGTH + 1), ProtocolViolation);
    }

    TEST_CASE("parse_header") {
        using namespace interlink::channel;

        SUBCASE("space padded") { CHECK(wire::parse_header("        17") == 17); }

        SUBCASE("left aligned with trailing padding") { CHECK(wire::parse_header("17        ") == 17); }

        SUBCASE("zero padded") { CHECK(wire::parse_header("0000000017") == 17); }

        SUBCASE("rejects non-digits") {
            CHECK_THROWS_AS(wire::parse_header("      -17"), ProtocolViolation);
            CHECK_THROWS_AS(wire::parse_header("     1 7  "), ProtocolViolation);
            CHECK_THROWS_AS(wire::parse_header("      abc "), ProtocolViolation);
        }

        SUBCASE("rejects blank") {
            CHECK_THROWS_AS(wire::parse_header("          "), ProtocolViolation);
            CHECK_THROWS_AS(wire::parse_header(""), ProtocolViolation);
        }

        SUBCASE("rejects more than ten digits") { CHECK_THROWS_AS(wire::parse_header("12345678901"), ProtocolViolation); }
    }

    TEST_CASE("encode_frame layout") {
        using namespace interlink::channel::wire;

        auto frame = encode_frame("hello", 100);
        CHECK(frame == "         5hello");

        auto empty = encode_frame("", 100);
        CHECK(empty == "         0");
    }

    TEST_CASE("encode_frame enforces the transmission limit") {
        using namespace interlink::channel;

        CHECK_NOTHROW(wire::encode_frame("1234", 4));
        CHECK_THROWS_AS(wire::encode_frame("12345", 4), OversizedPayload);

        try {
            wire::encode_frame(std::string(11, 'a'), 10);
            FAIL("expected OversizedPayload");
        } catch (const OversizedPayload &e) {
            CHECK(e.actual() == 11);
            CHECK(e.allowed() == 10);
            CHECK(std::string(e.what()).find("11 > 10") != std::string::npos);
        }
    }

    TEST_CASE("decode_frame recovers the payload byte-for-byte") {
        using namespace interlink::channel::wire;

        const std::string payloads[] = {"", "a", "with spaces and\nnewlines", std::string("nul\0byte", 8),
                                        "\xe6\x97\xa5\xe6\x9c\xac\xe8\xaa\x9e", std::string(4096, 'z')};
        for (const auto &payload : payloads) {
            CHECK(decode_frame(encode_frame(payload, 1'000'000)) == payload);
        }
    }

    TEST_CASE("decode_frame rejects inconsistent frames") {
        using namespace interlink::channel;

        CHECK_THROWS_AS(wire::decode_frame("     5"), ProtocolViolation);
        CHECK_THROWS_AS(wire::decode_frame("         5hell"), ProtocolViolation);
        CHECK_THROWS_AS(wire::decode_frame("         5hello!"), ProtocolViolation);
    }

    TEST_CASE("decode_response success") {
        using namespace interlink::channel::wire;

        CHECK(decode_response("success hello world") == "hello world");
        CHECK(decode_response("success ") == "");
        CHECK(decode_response("success  leading space") == " leading space");
    }

    TEST_CASE("decode_response failure") {
        using namespace interlink::channel;

        SUBCASE("timeout sentinel") {
            try {
                wire::decode_response("failure <timeout>");
                FAIL("expected RemoteTimeout");
            } catch (const RemoteTimeout &e) {
                CHECK(e.kind() == ErrorKind::RemoteTimeout);
                CHECK(std::string(e.what()).find("increase") != std::string::npos);
            }
        }

        SUBCASE("remote message") {
            try {
                wire::decode_response("failure disk full");
                FAIL("expected RemoteFailure");
            } catch (const RemoteFailure &e) {
                CHECK(std::string(e.what()) == "disk full");
                CHECK(e.kind() == ErrorKind::RemoteFailure);
            }
        }

        SUBCASE("timeout sentinel must match exactly") {
            CHECK_THROWS_AS(wire::decode_response("failure <timeout> later"), RemoteFailure);
        }
    }

    TEST_CASE("decode_response protocol violations") {
        using namespace interlink::channel;

        CHECK_THROWS_AS(wire::decode_response("success"), ProtocolViolation);
        CHECK_THROWS_AS(wire::decode_response(""), ProtocolViolation);
        CHECK_THROWS_AS(wire::decode_response("pending 12"), ProtocolViolation);
        CHECK_THROWS_AS(wire::decode_response("SUCCESS ok"), ProtocolViolation);
    }

    TEST_CASE("close frame is exactly sixteen bytes") {
        using namespace interlink::channel::wire;

        CHECK(close_frame() == "         6$close");
        CHECK(close_frame().size() == 16);
    }

    TEST_CASE("error kinds have names") {
        using namespace interlink::channel;

        CHECK(std::string(to_string(ErrorKind::PeerTerminated)) == "peer terminated");
        CHECK(std::string(to_string(ErrorKind::ReceiveAborted)) == "receive aborted");
    }
}
