#pragma once

#include <conpipe/datagram/udp.hpp>
#include <conpipe/forwarder.hpp>

#include <atomic>
#include <memory>
#include <optional>

namespace conpipe {

    // Connectionless transport over UDP
    // Binds an ephemeral local port of the remote's family, sends every
    // message as one datagram to the remote and only surfaces datagrams
    // whose source is exactly the remote endpoint.
    class DatagramTransport {
      private:
        Endpoint remote_;
        std::unique_ptr<UdpSocket> socket_;
        std::unique_ptr<Forwarder> forwarder_;
        std::unique_ptr<std::atomic<bool>> closing_;
        HandoffQueue<Message> *outbound_;
        bool opened_;
        dp::u64 foreign_dropped_;

      public:
        explicit DatagramTransport(const Endpoint &remote)
            : remote_(remote), socket_(new UdpSocket()), forwarder_(new Forwarder()),
              closing_(new std::atomic<bool>(false)), outbound_(nullptr), opened_(false), foreign_dropped_(0) {}

        ~DatagramTransport() { close(); }

        DatagramTransport(DatagramTransport &&) = default;
        DatagramTransport &operator=(DatagramTransport &&) = default;

        // Bind 0.0.0.0:0 or [::]:0 depending on the remote's family
        dp::Res<void> open() {
            if (opened_) {
                return dp::result::err(dp::Error::invalid_argument("datagram transport already opened"));
            }
            auto res = socket_->bind(Endpoint::any_of(remote_.family));
            if (res.is_err()) {
                return res;
            }
            opened_ = true;
            echo::debug("datagram transport ready for ", remote_.to_string());
            return dp::result::ok();
        }

        // Start forwarding the queue to the remote endpoint
        dp::Res<void> start(HandoffQueue<Message> &outbound) {
            if (!opened_) {
                return dp::result::err(dp::Error::invalid_argument("datagram transport not bound"));
            }

            outbound_ = &outbound;
            UdpSocket *socket = socket_.get();
            Endpoint remote = remote_;
            forwarder_->start(
                outbound, [socket, remote](const Frame &frame) { return socket->send_to(frame, remote); },
                [socket]() { socket->interrupt(); });
            return dp::result::ok();
        }

        // Next message from the remote endpoint
        // Datagrams from any other source are discarded unseen; there is no
        // end-of-stream on UDP, so this only returns nullopt after shutdown()
        dp::Res<std::optional<Message>> next() {
            if (!opened_) {
                return dp::result::ok(std::optional<Message>());
            }

            while (true) {
                auto envelope_res = socket_->recv_from();
                if (forwarder_->failed()) {
                    return dp::result::err(forwarder_->status().error());
                }
                if (closing_->load()) {
                    return dp::result::ok(std::optional<Message>());
                }
                if (envelope_res.is_err()) {
                    echo::error("datagram read failed: ", envelope_res.error().message.c_str());
                    return dp::result::err(envelope_res.error());
                }

                const Envelope &envelope = envelope_res.value();
                if (envelope.peer != remote_) {
                    foreign_dropped_++;
                    continue;
                }

                auto message = codec::decode_frame(envelope.frame);
                if (message.has_value()) {
                    return dp::result::ok(std::move(message));
                }
            }
        }

        // Wake the receiver and stop forwarding; safe from any thread
        void shutdown() {
            if (closing_) {
                closing_->store(true);
            }
            if (outbound_ != nullptr) {
                outbound_->close();
            }
            if (socket_) {
                socket_->interrupt();
            }
        }

        // Shut down both directions and release the socket
        void close() {
            if (!socket_) {
                return;
            }
            shutdown();
            forwarder_->join();
            if (opened_) {
                echo::debug("datagram transport closed, ", forwarder_->frames_sent(), " datagrams sent");
            }
            socket_->close();
            opened_ = false;
        }

        const Endpoint &remote() const { return remote_; }
        const Endpoint &local() const { return socket_->local_endpoint(); }
        const Forwarder &forwarder() const { return *forwarder_; }

        /// Datagrams discarded because they came from another source
        dp::u64 foreign_dropped() const { return foreign_dropped_; }
    };

} // namespace conpipe
