#pragma once

#include <conpipe/common.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>

namespace conpipe {

    // Address family of a resolved endpoint
    enum class Family : dp::u8 { V4 = 0, V6 = 1 };

    inline int to_af(Family family) { return family == Family::V4 ? AF_INET : AF_INET6; }

    // Resolved network endpoint - numeric IP, port and family
    // Immutable once resolved; host is always in inet_ntop canonical form
    struct Endpoint {
        dp::String host;
        dp::u16 port = 0;
        Family family = Family::V4;

        inline dp::String to_string() const {
            dp::String port_str(std::to_string(port).c_str());
            if (family == Family::V6) {
                return dp::String("[") + host + "]:" + port_str;
            }
            return host + ":" + port_str;
        }

        // Wildcard ephemeral endpoint for the given family (0.0.0.0:0 or [::]:0)
        static Endpoint any_of(Family family) {
            if (family == Family::V4) {
                return Endpoint{"0.0.0.0", 0, Family::V4};
            }
            return Endpoint{"::", 0, Family::V6};
        }

        inline bool operator==(const Endpoint &other) const {
            return family == other.family && port == other.port && host == other.host;
        }
        inline bool operator!=(const Endpoint &other) const { return !(*this == other); }
    };

    // Fill a sockaddr_storage from an endpoint
    // Returns the address length, or invalid_argument if the host is not a numeric address
    inline dp::Res<socklen_t> to_sockaddr(const Endpoint &endpoint, sockaddr_storage &out) {
        out = {};
        if (endpoint.family == Family::V4) {
            auto *addr = reinterpret_cast<sockaddr_in *>(&out);
            addr->sin_family = AF_INET;
            addr->sin_port = htons(endpoint.port);
            if (::inet_pton(AF_INET, endpoint.host.c_str(), &addr->sin_addr) <= 0) {
                echo::debug("invalid address: ", endpoint.host.c_str());
                return dp::result::err(dp::Error::invalid_argument("invalid ipv4 address"));
            }
            return dp::result::ok(static_cast<socklen_t>(sizeof(sockaddr_in)));
        }

        auto *addr = reinterpret_cast<sockaddr_in6 *>(&out);
        addr->sin6_family = AF_INET6;
        addr->sin6_port = htons(endpoint.port);
        if (::inet_pton(AF_INET6, endpoint.host.c_str(), &addr->sin6_addr) <= 0) {
            echo::debug("invalid address: ", endpoint.host.c_str());
            return dp::result::err(dp::Error::invalid_argument("invalid ipv6 address"));
        }
        return dp::result::ok(static_cast<socklen_t>(sizeof(sockaddr_in6)));
    }

    // Build an endpoint from an address returned by the kernel (recvfrom, getsockname)
    inline dp::Res<Endpoint> from_sockaddr(const sockaddr_storage &in) {
        if (in.ss_family == AF_INET) {
            const auto *addr = reinterpret_cast<const sockaddr_in *>(&in);
            char ip[INET_ADDRSTRLEN];
            ::inet_ntop(AF_INET, &addr->sin_addr, ip, sizeof(ip));
            return dp::result::ok(Endpoint{dp::String(ip), ntohs(addr->sin_port), Family::V4});
        }
        if (in.ss_family == AF_INET6) {
            const auto *addr = reinterpret_cast<const sockaddr_in6 *>(&in);
            char ip[INET6_ADDRSTRLEN];
            ::inet_ntop(AF_INET6, &addr->sin6_addr, ip, sizeof(ip));
            return dp::result::ok(Endpoint{dp::String(ip), ntohs(addr->sin6_port), Family::V6});
        }
        return dp::result::err(dp::Error::invalid_argument("unsupported address family"));
    }

    // Parse "a.b.c.d:port" or "[v6]:port" into a resolved endpoint
    // Only numeric addresses are accepted; no name lookup happens here
    inline dp::Res<Endpoint> parse_endpoint(const dp::String &text) {
        std::string input(text.c_str());
        echo::trace("parsing endpoint '", input.c_str(), "'");

        std::string host;
        std::string port_str;
        Family family = Family::V4;

        if (!input.empty() && input.front() == '[') {
            auto close = input.find(']');
            if (close == std::string::npos || close + 1 >= input.size() || input[close + 1] != ':') {
                return dp::result::err(dp::Error::invalid_argument("malformed ipv6 endpoint"));
            }
            host = input.substr(1, close - 1);
            port_str = input.substr(close + 2);
            family = Family::V6;
        } else {
            auto colon = input.rfind(':');
            if (colon == std::string::npos || input.find(':') != colon) {
                return dp::result::err(dp::Error::invalid_argument("endpoint must be ip:port"));
            }
            host = input.substr(0, colon);
            port_str = input.substr(colon + 1);
        }

        if (host.empty() || port_str.empty() || port_str.size() > 5) {
            return dp::result::err(dp::Error::invalid_argument("endpoint must be ip:port"));
        }
        dp::u32 port = 0;
        for (char c : port_str) {
            if (c < '0' || c > '9') {
                return dp::result::err(dp::Error::invalid_argument("port is not a number"));
            }
            port = port * 10 + static_cast<dp::u32>(c - '0');
        }
        if (port > 65535) {
            return dp::result::err(dp::Error::invalid_argument("port out of range"));
        }

        // Round-trip through the kernel's parser to validate and canonicalise
        Endpoint parsed{dp::String(host.c_str()), static_cast<dp::u16>(port), family};
        sockaddr_storage storage;
        auto addr_res = to_sockaddr(parsed, storage);
        if (addr_res.is_err()) {
            return dp::result::err(addr_res.error());
        }
        return from_sockaddr(storage);
    }

} // namespace conpipe
