#include <conpipe/conpipe.hpp>

#include <iostream>

// Hook stdin/stdout up to a remote peer over TCP (default) or UDP.
//
//   conpipe 127.0.0.1:9000          # TCP
//   conpipe --udp [::1]:9000        # UDP over IPv6
//
// Every chunk read from stdin goes out as one message; every message from
// the peer is printed as "New Message" followed by its display form.
int main(int argc, char **argv) {
    auto config_res = conpipe::parse_args(argc, argv);
    if (config_res.is_err()) {
        std::cerr << config_res.error().message.c_str() << "\n\n" << conpipe::usage();
        return conpipe::exit_code::Usage;
    }
    const conpipe::Config &config = config_res.value();
    if (config.help) {
        std::cout << conpipe::usage();
        return conpipe::exit_code::Ok;
    }

    auto remote_res = conpipe::parse_endpoint(config.remote);
    if (remote_res.is_err()) {
        std::cerr << conpipe::error_kind_name(conpipe::ErrorKind::AddressResolution) << ": "
                  << config.remote.c_str() << ": " << remote_res.error().message.c_str() << "\n";
        return conpipe::to_exit_code(conpipe::ErrorKind::AddressResolution);
    }

    conpipe::Bridge bridge(config, remote_res.value(), std::cout);

    auto open_res = bridge.open();
    if (open_res.is_err()) {
        // A UDP bind failure is local I/O, not a refused connection
        auto kind = config.transport == conpipe::TransportKind::Stream ? conpipe::ErrorKind::Connection
                                                                       : conpipe::ErrorKind::Io;
        std::cerr << conpipe::error_kind_name(kind) << ": " << open_res.error().message.c_str() << "\n";
        return conpipe::to_exit_code(kind);
    }

    auto run_res = bridge.run();
    if (run_res.is_err()) {
        std::cerr << conpipe::error_kind_name(conpipe::ErrorKind::Io) << ": " << run_res.error().message.c_str()
                  << "\n";
        return conpipe::to_exit_code(conpipe::ErrorKind::Io);
    }

    return conpipe::exit_code::Ok;
}
