#pragma once

#include <conpipe/endpoint.hpp>

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace conpipe {

    // Datagram paired with the address it came from or goes to
    struct Envelope {
        Frame frame;
        Endpoint peer;
    };

    // UDP socket using BSD sockets
    // Unreliable, unordered, connectionless; one datagram carries one frame
    class UdpSocket {
      private:
        dp::i32 fd_;
        dp::i32 wake_[2];
        bool bound_;
        Endpoint local_endpoint_;

      public:
        static constexpr dp::usize MAX_DATAGRAM_SIZE = 65507;

        UdpSocket() : fd_(-1), wake_{-1, -1}, bound_(false) { echo::trace("UdpSocket constructed"); }

        ~UdpSocket() { close(); }

        UdpSocket(const UdpSocket &) = delete;
        UdpSocket &operator=(const UdpSocket &) = delete;

        // Bind to a local address; port 0 lets the kernel pick
        dp::Res<void> bind(const Endpoint &endpoint) {
            echo::trace("binding to ", endpoint.to_string());

            sockaddr_storage addr;
            auto addr_res = to_sockaddr(endpoint, addr);
            if (addr_res.is_err()) {
                return dp::result::err(addr_res.error());
            }

            fd_ = ::socket(to_af(endpoint.family), SOCK_DGRAM | SOCK_CLOEXEC, 0);
            if (fd_ < 0) {
                echo::error("socket creation failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("io error"));
            }
            echo::trace("udp socket created fd=", fd_);

            if (::bind(fd_, reinterpret_cast<sockaddr *>(&addr), addr_res.value()) < 0) {
                echo::error("bind failed: ", strerror(errno));
                ::close(fd_);
                fd_ = -1;
                return dp::result::err(dp::Error::io_error("io error"));
            }

            if (::pipe2(wake_, O_CLOEXEC | O_NONBLOCK) < 0) {
                echo::error("wake pipe failed: ", strerror(errno));
                ::close(fd_);
                fd_ = -1;
                return dp::result::err(dp::Error::io_error("io error"));
            }

            // Record the port the kernel actually assigned
            sockaddr_storage bound_addr = {};
            socklen_t bound_len = sizeof(bound_addr);
            local_endpoint_ = endpoint;
            if (::getsockname(fd_, reinterpret_cast<sockaddr *>(&bound_addr), &bound_len) == 0) {
                auto local_res = from_sockaddr(bound_addr);
                if (local_res.is_ok()) {
                    local_endpoint_ = local_res.value();
                }
            }

            bound_ = true;
            echo::info("UdpSocket bound to ", local_endpoint_.to_string());
            return dp::result::ok();
        }

        // Send one frame as one datagram
        // Fire and forget - may or may not arrive
        dp::Res<void> send_to(const Frame &frame, const Endpoint &dest) {
            if (!bound_) {
                echo::error("send_to called but not bound");
                return dp::result::err(dp::Error::invalid_argument("not bound"));
            }
            if (frame.size() > MAX_DATAGRAM_SIZE) {
                echo::warn("datagram too large: ", frame.size(), " > ", MAX_DATAGRAM_SIZE);
                return dp::result::err(dp::Error::invalid_argument(dp::String("datagram too large: ") +
                                                                   std::to_string(frame.size()).c_str()));
            }

            sockaddr_storage addr;
            auto addr_res = to_sockaddr(dest, addr);
            if (addr_res.is_err()) {
                return dp::result::err(addr_res.error());
            }

            echo::trace("sendto ", dest.to_string(), " len=", frame.size());

            dp::isize n;
            do {
                n = ::sendto(fd_, frame.data(), frame.size(), 0, reinterpret_cast<sockaddr *>(&addr),
                             addr_res.value());
            } while (n < 0 && errno == EINTR);

            if (n < 0) {
                echo::error("sendto failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error(dp::String("sendto failed: ") + strerror(errno)));
            }

            echo::debug("sent ", n, " bytes to ", dest.to_string());
            return dp::result::ok();
        }

        // Receive one datagram and its source
        // Blocks until a datagram arrives or interrupt() is called;
        // after an interrupt the error is not_found("socket interrupted")
        dp::Res<Envelope> recv_from() {
            if (!bound_) {
                echo::error("recv_from called but not bound");
                return dp::result::err(dp::Error::invalid_argument("not bound"));
            }

            while (true) {
                struct pollfd fds[2];
                fds[0] = {fd_, POLLIN, 0};
                fds[1] = {wake_[0], POLLIN, 0};

                if (::poll(fds, 2, -1) < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    echo::error("poll failed: ", strerror(errno));
                    return dp::result::err(dp::Error::io_error("poll failed"));
                }
                if (fds[1].revents != 0) {
                    echo::trace("recv_from interrupted");
                    return dp::result::err(dp::Error::not_found("socket interrupted"));
                }
                if (fds[0].revents != 0) {
                    break;
                }
            }

            Envelope envelope;
            envelope.frame.resize(MAX_DATAGRAM_SIZE);
            sockaddr_storage src_addr = {};
            socklen_t src_len = sizeof(src_addr);

            dp::isize n;
            do {
                n = ::recvfrom(fd_, envelope.frame.data(), envelope.frame.size(), 0,
                               reinterpret_cast<sockaddr *>(&src_addr), &src_len);
            } while (n < 0 && errno == EINTR);

            if (n < 0) {
                echo::error("recvfrom failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error(dp::String("recvfrom failed: ") + strerror(errno)));
            }
            envelope.frame.resize(static_cast<dp::usize>(n));

            auto src_res = from_sockaddr(src_addr);
            if (src_res.is_err()) {
                return dp::result::err(src_res.error());
            }
            envelope.peer = src_res.value();

            echo::trace("recvfrom got ", n, " bytes from ", envelope.peer.to_string());
            return dp::result::ok(std::move(envelope));
        }

        // Wake a thread blocked in recv_from(); later calls keep failing
        // Never blocks: once the wake pipe is full it is already readable
        void interrupt() {
            if (wake_[1] >= 0) {
                dp::u8 b = 0;
                while (::write(wake_[1], &b, 1) < 0 && errno == EINTR) {
                }
            }
        }

        // Close the socket
        void close() {
            if (fd_ >= 0) {
                echo::trace("closing fd=", fd_);
                ::close(fd_);
                fd_ = -1;
                bound_ = false;
                echo::debug("UdpSocket closed");
            }
            if (wake_[0] >= 0) {
                ::close(wake_[0]);
                ::close(wake_[1]);
                wake_[0] = -1;
                wake_[1] = -1;
            }
        }

        const Endpoint &local_endpoint() const { return local_endpoint_; }
    };

} // namespace conpipe
