#include <chrono>
#include <doctest/doctest.h>
#include <conpipe/stream/tcp.hpp>
#include <thread>

TEST_CASE("TcpSocket - connect, send and receive") {
    conpipe::TcpSocket server;
    auto endpoint = conpipe::parse_endpoint("127.0.0.1:21001").value();
    REQUIRE(server.listen(endpoint).is_ok());

    std::thread server_thread([&]() {
        auto accept_res = server.accept();
        CHECK(accept_res.is_ok());
        if (accept_res.is_err())
            return;
        auto client = std::move(accept_res.value());

        auto frame_res = client->recv();
        CHECK(frame_res.is_ok());
        if (frame_res.is_err())
            return;
        CHECK(frame_res.value().size() == 3);

        // Echo back, then hang up
        CHECK(client->send(frame_res.value()).is_ok());
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        client->close();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    conpipe::TcpSocket client;
    REQUIRE(client.connect(endpoint).is_ok());
    CHECK(client.is_connected());
    CHECK(client.remote_endpoint() == endpoint);

    conpipe::Frame frame = {0x0A, 0x0B, 0x0C};
    REQUIRE(client.send(frame).is_ok());

    auto echo_res = client.recv();
    REQUIRE(echo_res.is_ok());
    REQUIRE(echo_res.value().size() == 3);
    CHECK(echo_res.value()[1] == 0x0B);

    auto eof_res = client.recv();
    REQUIRE(eof_res.is_ok());
    CHECK(eof_res.value().empty());

    server_thread.join();
    client.close();
    server.close();
}

TEST_CASE("TcpSocket - connection refused") {
    conpipe::TcpSocket client;
    auto endpoint = conpipe::parse_endpoint("127.0.0.1:21002").value();
    auto res = client.connect(endpoint);
    CHECK(res.is_err());
    CHECK_FALSE(client.is_connected());
}

TEST_CASE("TcpSocket - IPv6 loopback") {
    conpipe::TcpSocket server;
    auto endpoint = conpipe::parse_endpoint("[::1]:21003").value();
    if (server.listen(endpoint).is_err()) {
        MESSAGE("IPv6 loopback unavailable, skipping");
        return;
    }

    std::thread server_thread([&]() {
        auto accept_res = server.accept();
        CHECK(accept_res.is_ok());
        if (accept_res.is_ok())
            CHECK(accept_res.value()->remote_endpoint().family == conpipe::Family::V6);
    });

    conpipe::TcpSocket client;
    CHECK(client.connect(endpoint).is_ok());

    server_thread.join();
}

TEST_CASE("TcpSocket - shutdown wakes a blocked reader") {
    conpipe::TcpSocket server;
    auto endpoint = conpipe::parse_endpoint("127.0.0.1:21004").value();
    REQUIRE(server.listen(endpoint).is_ok());

    std::unique_ptr<conpipe::TcpSocket> accepted;
    std::thread server_thread([&]() {
        auto accept_res = server.accept();
        if (accept_res.is_ok())
            accepted = std::move(accept_res.value());
    });

    conpipe::TcpSocket client;
    REQUIRE(client.connect(endpoint).is_ok());
    server_thread.join();

    std::thread killer([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        client.shutdown();
    });

    auto res = client.recv();
    REQUIRE(res.is_ok());
    CHECK(res.value().empty());

    killer.join();
}

TEST_CASE("TcpSocket - send without connect") {
    conpipe::TcpSocket socket;
    conpipe::Frame frame = {0x01};
    CHECK(socket.send(frame).is_err());
}
