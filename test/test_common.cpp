#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <conpipe/common.hpp>

#include <sys/socket.h>

TEST_CASE("encode_u32_be") {
    auto bytes = conpipe::encode_u32_be(0x12345678);
    CHECK(bytes[0] == 0x12);
    CHECK(bytes[1] == 0x34);
    CHECK(bytes[2] == 0x56);
    CHECK(bytes[3] == 0x78);
}

TEST_CASE("decode_u32_be") {
    dp::Array<dp::u8, 4> bytes = {0x12, 0x34, 0x56, 0x78};
    CHECK(conpipe::decode_u32_be(bytes.data()) == 0x12345678);
}

TEST_CASE("append_u32_be") {
    conpipe::Frame frame = {0xAA};
    conpipe::append_u32_be(frame, 0xDEADBEEF);
    REQUIRE(frame.size() == 5);
    CHECK(frame[0] == 0xAA);
    CHECK(frame[1] == 0xDE);
    CHECK(frame[4] == 0xEF);
}

TEST_CASE("read_some / write_exact over a socket pair") {
    int fds[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);

    SUBCASE("one write is one read") {
        conpipe::Frame out = {0x01, 0x02, 0x03};
        REQUIRE(conpipe::write_exact(fds[0], out.data(), out.size()).is_ok());

        dp::u8 buffer[16];
        auto res = conpipe::read_some(fds[1], buffer, sizeof(buffer));
        REQUIRE(res.is_ok());
        CHECK(res.value() == 3);
        CHECK(buffer[2] == 0x03);
    }

    SUBCASE("orderly close reads as zero bytes") {
        ::close(fds[0]);
        fds[0] = -1;

        dp::u8 buffer[16];
        auto res = conpipe::read_some(fds[1], buffer, sizeof(buffer));
        REQUIRE(res.is_ok());
        CHECK(res.value() == 0);
    }

    SUBCASE("writing to a closed peer fails without SIGPIPE") {
        ::close(fds[1]);
        fds[1] = -1;

        conpipe::Frame out = {0x01};
        auto res = conpipe::write_exact(fds[0], out.data(), out.size());
        CHECK(res.is_err());
    }

    if (fds[0] >= 0)
        ::close(fds[0]);
    if (fds[1] >= 0)
        ::close(fds[1]);
}
