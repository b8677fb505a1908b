#pragma once

#include <conpipe/datagram.hpp>
#include <conpipe/stream.hpp>

#include <variant>

namespace conpipe {

    // Which transport carries the session
    enum class TransportKind : dp::u8 { Stream = 0, Datagram = 1 };

    inline const char *transport_name(TransportKind kind) { return kind == TransportKind::Stream ? "tcp" : "udp"; }

    // Exactly two transports exist, so the choice is a closed variant
    // Both alternatives expose open/start/next/shutdown/close
    using Transport = std::variant<StreamTransport, DatagramTransport>;

    inline Transport make_transport(TransportKind kind, const Endpoint &remote) {
        if (kind == TransportKind::Datagram) {
            return Transport(std::in_place_type<DatagramTransport>, remote);
        }
        return Transport(std::in_place_type<StreamTransport>, remote);
    }

    inline dp::Res<void> open(Transport &transport) {
        return std::visit([](auto &t) { return t.open(); }, transport);
    }

    inline dp::Res<void> start(Transport &transport, HandoffQueue<Message> &outbound) {
        return std::visit([&outbound](auto &t) { return t.start(outbound); }, transport);
    }

    inline dp::Res<std::optional<Message>> next(Transport &transport) {
        return std::visit([](auto &t) { return t.next(); }, transport);
    }

    inline void shutdown(Transport &transport) {
        std::visit([](auto &t) { t.shutdown(); }, transport);
    }

    inline void close(Transport &transport) {
        std::visit([](auto &t) { t.close(); }, transport);
    }

} // namespace conpipe
