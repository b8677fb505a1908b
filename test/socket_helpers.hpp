#pragma once

#include <arpa/inet.h>
#include <doctest/doctest.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace conpipe_test {

    // Loopback listener that answers a connection with a reset instead of a close
    struct ResettingListener {
        int fd = -1;

        explicit ResettingListener(unsigned short port) {
            fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
            REQUIRE(fd >= 0);
            int one = 1;
            ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

            sockaddr_in addr = {};
            addr.sin_family = AF_INET;
            addr.sin_port = htons(port);
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            REQUIRE(::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0);
            REQUIRE(::listen(fd, 1) == 0);
        }

        ~ResettingListener() { ::close(fd); }

        ResettingListener(const ResettingListener &) = delete;
        ResettingListener &operator=(const ResettingListener &) = delete;

        // SO_LINGER 0 turns close() into a RST
        bool accept_and_reset() {
            int client = ::accept(fd, nullptr, nullptr);
            if (client < 0) {
                return false;
            }
            linger lg = {1, 0};
            ::setsockopt(client, SOL_SOCKET, SO_LINGER, &lg, sizeof(lg));
            ::close(client);
            return true;
        }
    };

} // namespace conpipe_test
