#pragma once

#include <conpipe/endpoint.hpp>

#include <atomic>
#include <memory>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace conpipe {

    /// Largest single read on a stream socket
    /// One read is treated as one frame, so this bounds the frame size on TCP
    constexpr dp::usize MAX_STREAM_READ = 64 * 1024;

    // TCP socket using BSD sockets
    // Frames go out as raw bytes with no length prefix; each read is one frame
    class TcpSocket {
      private:
        dp::i32 fd_;
        std::atomic<bool> connected_;
        bool listening_;
        Endpoint local_endpoint_;
        Endpoint remote_endpoint_;

        // Private constructor for accepted connections
        TcpSocket(dp::i32 fd, const Endpoint &local, const Endpoint &remote)
            : fd_(fd), connected_(true), listening_(false), local_endpoint_(local), remote_endpoint_(remote) {
            echo::debug("TcpSocket created from accepted connection fd=", fd);
        }

        dp::Res<void> open_socket(Family family) {
            fd_ = ::socket(to_af(family), SOCK_STREAM | SOCK_CLOEXEC, 0);
            if (fd_ < 0) {
                echo::error("socket creation failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("io error"));
            }
            echo::trace("socket created fd=", fd_);
            return dp::result::ok();
        }

        void fail_closed() {
            ::close(fd_);
            fd_ = -1;
        }

      public:
        TcpSocket() : fd_(-1), connected_(false), listening_(false) { echo::trace("TcpSocket constructed"); }

        ~TcpSocket() {
            if (fd_ >= 0) {
                close();
            }
        }

        TcpSocket(const TcpSocket &) = delete;
        TcpSocket &operator=(const TcpSocket &) = delete;

        // Client side: connect to remote endpoint
        // No timeout; blocks until the kernel gives up
        dp::Res<void> connect(const Endpoint &endpoint) {
            echo::trace("connecting to ", endpoint.to_string());

            sockaddr_storage addr;
            auto addr_res = to_sockaddr(endpoint, addr);
            if (addr_res.is_err()) {
                return dp::result::err(addr_res.error());
            }

            auto sock_res = open_socket(endpoint.family);
            if (sock_res.is_err()) {
                return sock_res;
            }

            dp::i32 ret;
            do {
                ret = ::connect(fd_, reinterpret_cast<sockaddr *>(&addr), addr_res.value());
            } while (ret < 0 && errno == EINTR);

            if (ret < 0) {
                dp::String reason(strerror(errno));
                fail_closed();
                echo::error("connect to ", endpoint.to_string(), " failed: ", reason.c_str());
                return dp::result::err(dp::Error::io_error(dp::String("connect failed: ") + reason));
            }

            // Frames are small and latency matters more than batching
            dp::i32 opt = 1;
            if (::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) < 0) {
                echo::warn("setsockopt TCP_NODELAY failed: ", strerror(errno));
            }

            connected_ = true;
            remote_endpoint_ = endpoint;
            echo::info("TcpSocket connected to ", endpoint.to_string());

            return dp::result::ok();
        }

        // Server side: bind and listen (used by peers and tests)
        dp::Res<void> listen(const Endpoint &endpoint) {
            echo::trace("listening on ", endpoint.to_string());

            sockaddr_storage addr;
            auto addr_res = to_sockaddr(endpoint, addr);
            if (addr_res.is_err()) {
                return dp::result::err(addr_res.error());
            }

            auto sock_res = open_socket(endpoint.family);
            if (sock_res.is_err()) {
                return sock_res;
            }

            dp::i32 opt = 1;
            if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
                echo::warn("setsockopt SO_REUSEADDR failed: ", strerror(errno));
            }

            if (::bind(fd_, reinterpret_cast<sockaddr *>(&addr), addr_res.value()) < 0) {
                echo::error("bind failed: ", strerror(errno));
                fail_closed();
                return dp::result::err(dp::Error::io_error("io error"));
            }

            if (::listen(fd_, SOMAXCONN) < 0) {
                echo::error("listen failed: ", strerror(errno));
                fail_closed();
                return dp::result::err(dp::Error::io_error("io error"));
            }

            listening_ = true;
            local_endpoint_ = endpoint;
            echo::info("TcpSocket listening on ", endpoint.to_string());

            return dp::result::ok();
        }

        // Server side: accept one incoming connection
        dp::Res<std::unique_ptr<TcpSocket>> accept() {
            if (!listening_) {
                echo::error("accept called but not listening");
                return dp::result::err(dp::Error::invalid_argument("not listening"));
            }

            echo::trace("waiting for connection on fd=", fd_);

            sockaddr_storage client_addr = {};
            socklen_t client_len = sizeof(client_addr);

            dp::i32 client_fd;
            do {
                client_fd = ::accept4(fd_, reinterpret_cast<sockaddr *>(&client_addr), &client_len, SOCK_CLOEXEC);
            } while (client_fd < 0 && errno == EINTR);

            if (client_fd < 0) {
                echo::error("accept failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("io error"));
            }

            auto client_res = from_sockaddr(client_addr);
            if (client_res.is_err()) {
                ::close(client_fd);
                return dp::result::err(client_res.error());
            }

            echo::info("TcpSocket accepted connection from ", client_res.value().to_string());
            return dp::result::ok(
                std::unique_ptr<TcpSocket>(new TcpSocket(client_fd, local_endpoint_, client_res.value())));
        }

        // Send one frame as-is
        dp::Res<void> send(const Frame &frame) {
            if (!connected_) {
                echo::error("send called but not connected");
                return dp::result::err(dp::Error::not_found("not connected"));
            }
            if (frame.empty()) {
                return dp::result::ok();
            }

            auto res = write_exact(fd_, frame.data(), frame.size());
            if (res.is_err()) {
                connected_ = false;
                echo::error("send failed: ", res.error().message.c_str());
                return res;
            }

            echo::debug("sent ", frame.size(), " bytes");
            return dp::result::ok();
        }

        // Receive whatever one read returns
        // An empty frame means the peer closed the connection
        dp::Res<Frame> recv(dp::usize max_size = MAX_STREAM_READ) {
            if (fd_ < 0) {
                return dp::result::err(dp::Error::not_found("not connected"));
            }

            Frame frame(max_size);
            auto res = read_some(fd_, frame.data(), frame.size());
            if (res.is_err()) {
                connected_ = false;
                echo::debug("recv failed: ", res.error().message.c_str());
                return dp::result::err(res.error());
            }

            frame.resize(res.value());
            if (frame.empty()) {
                echo::debug("connection closed by peer");
            } else {
                echo::debug("received ", frame.size(), " bytes");
            }
            return dp::result::ok(std::move(frame));
        }

        // Shut down both directions without releasing the descriptor
        // A thread blocked in recv() returns end-of-stream
        void shutdown() {
            if (fd_ >= 0) {
                echo::trace("shutdown fd=", fd_);
                ::shutdown(fd_, SHUT_RDWR);
            }
        }

        // Close the connection
        void close() {
            if (fd_ >= 0) {
                echo::trace("closing fd=", fd_);
                ::close(fd_);
                fd_ = -1;
                connected_ = false;
                listening_ = false;
                echo::debug("TcpSocket closed");
            }
        }

        bool is_connected() const { return connected_.load(); }

        const Endpoint &remote_endpoint() const { return remote_endpoint_; }
    };

} // namespace conpipe
