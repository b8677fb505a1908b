#pragma once

#include <conpipe/forwarder.hpp>
#include <conpipe/stream/tcp.hpp>

#include <memory>
#include <optional>

namespace conpipe {

    // Lifecycle of a stream session
    enum class StreamState : dp::u8 {
        Idle = 0,       // Constructed, nothing attempted
        Connecting = 1, // connect() in progress
        Connected = 2,  // Connected, forwarding not started
        Forwarding = 3, // Forwarding and receiving concurrently
        Closed = 4      // Terminal; not restartable
    };

    // Connection-oriented transport over TCP
    // Outbound messages are drained from the hand-off queue by a forwarder
    // thread; inbound frames are pulled one read at a time through next().
    class StreamTransport {
      private:
        Endpoint remote_;
        StreamState state_;
        std::unique_ptr<TcpSocket> socket_;
        std::unique_ptr<Forwarder> forwarder_;
        HandoffQueue<Message> *outbound_;

      public:
        explicit StreamTransport(const Endpoint &remote)
            : remote_(remote), state_(StreamState::Idle), socket_(new TcpSocket()), forwarder_(new Forwarder()),
              outbound_(nullptr) {}

        ~StreamTransport() { close(); }

        StreamTransport(StreamTransport &&) = default;
        StreamTransport &operator=(StreamTransport &&) = default;

        // Connect to the remote endpoint
        // Failure leaves the transport Closed
        dp::Res<void> open() {
            if (state_ != StreamState::Idle) {
                return dp::result::err(dp::Error::invalid_argument("stream transport already opened"));
            }

            state_ = StreamState::Connecting;
            auto res = socket_->connect(remote_);
            if (res.is_err()) {
                state_ = StreamState::Closed;
                return res;
            }

            state_ = StreamState::Connected;
            echo::debug("stream transport connected to ", remote_.to_string());
            return dp::result::ok();
        }

        // Start forwarding the queue to the connection
        dp::Res<void> start(HandoffQueue<Message> &outbound) {
            if (state_ != StreamState::Connected) {
                return dp::result::err(dp::Error::invalid_argument("stream transport not connected"));
            }

            outbound_ = &outbound;
            TcpSocket *socket = socket_.get();
            forwarder_->start(
                outbound, [socket](const Frame &frame) { return socket->send(frame); },
                [socket]() { socket->shutdown(); });

            state_ = StreamState::Forwarding;
            return dp::result::ok();
        }

        // Next inbound message, in wire order
        // nullopt once the peer closed the connection; a forwarding failure
        // takes precedence over end-of-stream
        dp::Res<std::optional<Message>> next() {
            if (state_ == StreamState::Closed) {
                return dp::result::ok(std::optional<Message>());
            }
            if (state_ != StreamState::Connected && state_ != StreamState::Forwarding) {
                return dp::result::err(dp::Error::invalid_argument("stream transport not connected"));
            }

            while (true) {
                auto frame_res = socket_->recv();
                if (forwarder_->failed()) {
                    return dp::result::err(forwarder_->status().error());
                }
                if (frame_res.is_err()) {
                    echo::error("stream read failed: ", frame_res.error().message.c_str());
                    return dp::result::err(frame_res.error());
                }

                const Frame &frame = frame_res.value();
                if (frame.empty()) {
                    echo::debug("stream closed by ", remote_.to_string());
                    return dp::result::ok(std::optional<Message>());
                }

                auto message = codec::decode_frame(frame);
                if (message.has_value()) {
                    return dp::result::ok(std::move(message));
                }
            }
        }

        // Wake the receiver and stop forwarding; safe from any thread
        void shutdown() {
            if (outbound_ != nullptr) {
                outbound_->close();
            }
            if (socket_) {
                socket_->shutdown();
            }
        }

        // Shut down both directions and release the connection
        void close() {
            if (!socket_) {
                return;
            }
            shutdown();
            forwarder_->join();
            socket_->close();
            if (state_ != StreamState::Closed) {
                echo::debug("stream transport closed, ", forwarder_->frames_sent(), " frames sent");
            }
            state_ = StreamState::Closed;
        }

        StreamState state() const { return state_; }
        const Endpoint &remote() const { return remote_; }
        const Forwarder &forwarder() const { return *forwarder_; }
    };

} // namespace conpipe
