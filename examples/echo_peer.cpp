#include <conpipe/conpipe.hpp>

#include <string>

// Remote side for trying conpipe by hand: echoes every frame back to its sender,
// tagging it Ahead so the round trip is visible.
//
//   conpipe_echo_peer tcp 127.0.0.1:9000
//   conpipe_echo_peer udp 127.0.0.1:9000

static conpipe::Frame tag_frame(const conpipe::Frame &frame) {
    auto decoded = conpipe::codec::decode(frame);
    if (decoded.is_err()) {
        echo::warn("echoing undecodable frame as-is: ", decoded.error().message.c_str());
        return frame;
    }
    conpipe::Message reply = decoded.value();
    reply.category = conpipe::Category::Ahead;
    auto encoded = conpipe::codec::encode(reply);
    if (encoded.is_err()) {
        return frame;
    }
    return encoded.value();
}

static int serve_tcp(const conpipe::Endpoint &endpoint) {
    conpipe::TcpSocket server;
    auto res = server.listen(endpoint);
    if (res.is_err()) {
        echo::error("Failed to listen: ", res.error().message.c_str());
        return 1;
    }

    auto client_res = server.accept();
    if (client_res.is_err()) {
        echo::error("Failed to accept: ", client_res.error().message.c_str());
        return 1;
    }
    auto client = std::move(client_res.value());

    while (true) {
        auto frame_res = client->recv();
        if (frame_res.is_err()) {
            echo::error("Recv failed: ", frame_res.error().message.c_str());
            break;
        }
        if (frame_res.value().empty()) {
            echo::info("Client disconnected");
            break;
        }

        auto send_res = client->send(tag_frame(frame_res.value()));
        if (send_res.is_err()) {
            echo::error("Send failed: ", send_res.error().message.c_str());
            break;
        }
        echo::info("Echoed ", frame_res.value().size(), " bytes back");
    }

    client->close();
    server.close();
    return 0;
}

static int serve_udp(const conpipe::Endpoint &endpoint) {
    conpipe::UdpSocket socket;
    auto res = socket.bind(endpoint);
    if (res.is_err()) {
        echo::error("Bind failed: ", res.error().message.c_str());
        return 1;
    }

    while (true) {
        auto recv_res = socket.recv_from();
        if (recv_res.is_err()) {
            echo::error("Recv failed: ", recv_res.error().message.c_str());
            break;
        }

        const conpipe::Envelope &envelope = recv_res.value();
        auto send_res = socket.send_to(tag_frame(envelope.frame), envelope.peer);
        if (send_res.is_err()) {
            echo::error("Send failed: ", send_res.error().message.c_str());
            continue;
        }
        echo::info("Echoed ", envelope.frame.size(), " bytes to ", envelope.peer.to_string());
    }

    socket.close();
    return 0;
}

int main(int argc, char **argv) {
    if (argc < 3) {
        echo::info("Usage: ", argv[0], " [tcp|udp] ip:port");
        return 1;
    }

    auto endpoint_res = conpipe::parse_endpoint(argv[2]);
    if (endpoint_res.is_err()) {
        echo::error("Bad address: ", endpoint_res.error().message.c_str());
        return 2;
    }

    std::string mode(argv[1]);
    if (mode == "tcp") {
        return serve_tcp(endpoint_res.value());
    }
    if (mode == "udp") {
        return serve_udp(endpoint_res.value());
    }

    echo::error("Unknown mode: ", argv[1]);
    return 1;
}
