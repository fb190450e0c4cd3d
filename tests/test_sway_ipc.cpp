#include <catch2/catch_test_macros.hpp>

#include "sway/ipc.hpp"

#include <cstdint>
#include <cstring>
#include <string>

TEST_CASE("SwayIpc", "[sway_ipc]") {
    SECTION("EncodeWritesHeaderThenPayload") {
        std::string payload = "[con_id=7] focus";
        auto msg = SwayIpc::encode(0, payload);

        REQUIRE(msg.size() == SwayIpc::HEADER_LEN + payload.size());
        CHECK(msg.substr(0, 6) == "i3-ipc");

        uint32_t len = 0, type = 99;
        std::memcpy(&len, msg.data() + 6, sizeof(len));
        std::memcpy(&type, msg.data() + 10, sizeof(type));
        CHECK(len == payload.size());
        CHECK(type == 0);
        CHECK(msg.substr(SwayIpc::HEADER_LEN) == payload);
    }

    SECTION("EmptyPayloadIsHeaderOnly") {
        auto msg = SwayIpc::encode(static_cast<uint32_t>(SwayIpc::Message::GetTree), "");
        REQUIRE(msg.size() == SwayIpc::HEADER_LEN);

        uint32_t type = 0;
        std::memcpy(&type, msg.data() + 10, sizeof(type));
        CHECK(type == 4);
    }

    SECTION("DecodeLengthReadsEncodedHeader") {
        auto msg = SwayIpc::encode(4, std::string(300, 'x'));
        auto len = SwayIpc::decode_length(msg.data());
        REQUIRE(len.has_value());
        CHECK(*len == 300);
    }

    SECTION("DecodeLengthRejectsBadMagic") {
        auto msg = SwayIpc::encode(4, "{}");
        msg[0] = 'x';
        auto len = SwayIpc::decode_length(msg.data());
        REQUIRE_FALSE(len.has_value());
        CHECK(len.error().find("magic") != std::string::npos);
    }

    SECTION("RequestWithoutConnectionFails") {
        SwayIpc ipc;
        CHECK_FALSE(ipc.connected());
        auto reply = ipc.request(SwayIpc::Message::GetTree);
        REQUIRE_FALSE(reply.has_value());
        CHECK(reply.error() == "not connected");
    }

    SECTION("ConnectToMissingSocketFails") {
        SwayIpc ipc;
        auto res = ipc.connect("/tmp/raisenext_no_such_socket.sock");
        REQUIRE_FALSE(res.has_value());
        CHECK(res.error().find("connect") != std::string::npos);
        CHECK_FALSE(ipc.connected());
    }

    SECTION("ConnectRejectsOverlongPath") {
        SwayIpc ipc;
        auto res = ipc.connect("/tmp/" + std::string(200, 'a'));
        REQUIRE_FALSE(res.has_value());
        CHECK(res.error().find("too long") != std::string::npos);
    }
}
