#include <doctest/doctest.h>
#include <conpipe/endpoint.hpp>

TEST_CASE("parse_endpoint - IPv4") {
    SUBCASE("Default remote") {
        auto res = conpipe::parse_endpoint("127.0.0.1:8080");
        REQUIRE(res.is_ok());
        CHECK(res.value().host == "127.0.0.1");
        CHECK(res.value().port == 8080);
        CHECK(res.value().family == conpipe::Family::V4);
        CHECK(res.value().to_string() == "127.0.0.1:8080");
    }

    SUBCASE("Port bounds") {
        CHECK(conpipe::parse_endpoint("10.0.0.1:0").is_ok());
        CHECK(conpipe::parse_endpoint("10.0.0.1:65535").is_ok());
        CHECK(conpipe::parse_endpoint("10.0.0.1:65536").is_err());
    }
}

TEST_CASE("parse_endpoint - IPv6") {
    SUBCASE("Loopback") {
        auto res = conpipe::parse_endpoint("[::1]:9000");
        REQUIRE(res.is_ok());
        CHECK(res.value().host == "::1");
        CHECK(res.value().port == 9000);
        CHECK(res.value().family == conpipe::Family::V6);
        CHECK(res.value().to_string() == "[::1]:9000");
    }

    SUBCASE("Host is canonicalised") {
        auto res = conpipe::parse_endpoint("[0:0:0:0:0:0:0:1]:9000");
        REQUIRE(res.is_ok());
        CHECK(res.value().host == "::1");
    }
}

TEST_CASE("parse_endpoint - malformed input") {
    CHECK(conpipe::parse_endpoint("").is_err());
    CHECK(conpipe::parse_endpoint("127.0.0.1").is_err());
    CHECK(conpipe::parse_endpoint("127.0.0.1:").is_err());
    CHECK(conpipe::parse_endpoint(":8080").is_err());
    CHECK(conpipe::parse_endpoint("127.0.0.1:http").is_err());
    CHECK(conpipe::parse_endpoint("localhost:8080").is_err());
    CHECK(conpipe::parse_endpoint("999.0.0.1:8080").is_err());
    CHECK(conpipe::parse_endpoint("::1:8080").is_err());
    CHECK(conpipe::parse_endpoint("[::1]8080").is_err());
    CHECK(conpipe::parse_endpoint("[::1").is_err());
}

TEST_CASE("Endpoint equality") {
    auto a = conpipe::parse_endpoint("127.0.0.1:9000").value();
    auto b = conpipe::parse_endpoint("127.0.0.1:9000").value();
    auto other_port = conpipe::parse_endpoint("127.0.0.1:9001").value();
    auto other_host = conpipe::parse_endpoint("127.0.0.2:9000").value();

    CHECK(a == b);
    CHECK(a != other_port);
    CHECK(a != other_host);
}

TEST_CASE("Endpoint::any_of") {
    CHECK(conpipe::Endpoint::any_of(conpipe::Family::V4).to_string() == "0.0.0.0:0");
    CHECK(conpipe::Endpoint::any_of(conpipe::Family::V6).to_string() == "[::]:0");
}

TEST_CASE("sockaddr round trip") {
    auto endpoint = conpipe::parse_endpoint("[fe80::1]:4242").value();

    sockaddr_storage storage;
    auto len_res = conpipe::to_sockaddr(endpoint, storage);
    REQUIRE(len_res.is_ok());
    CHECK(len_res.value() == sizeof(sockaddr_in6));

    auto back = conpipe::from_sockaddr(storage);
    REQUIRE(back.is_ok());
    CHECK(back.value() == endpoint);
}
