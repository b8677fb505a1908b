#pragma once

#include <conpipe/input.hpp>
#include <conpipe/transport.hpp>

#include <algorithm>
#include <string>

namespace conpipe {

    constexpr const char *DEFAULT_REMOTE = "127.0.0.1:8080";

    // -v/-q repeat counts saturate here
    constexpr dp::u8 MAX_VERBOSITY = 255;

    // Settings handed to the forwarding driver
    // verbose/quiet only change what the driver reports, never the protocol
    // remote is the unresolved address text; parse_endpoint() turns it into an Endpoint
    struct Config {
        dp::String remote = DEFAULT_REMOTE;
        TransportKind transport = TransportKind::Stream;
        InputMode input_mode = InputMode::Content;
        dp::u8 verbose = 0;
        dp::u8 quiet = 0;
        bool help = false;
    };

    inline const char *usage() {
        return "usage: conpipe [OPTIONS] [ADDR]\n"
               "\n"
               "Hook stdin/stdout up to a remote peer over TCP or UDP.\n"
               "\n"
               "  ADDR          remote ip:port or [ipv6]:port (default 127.0.0.1:8080)\n"
               "  -u, --udp     use UDP instead of TCP\n"
               "      --pulse   send a placeholder message per input chunk instead of its bytes\n"
               "  -v            more driver output (repeatable)\n"
               "  -q            less driver output (repeatable)\n"
               "  -h, --help    print this help\n";
    }

    // Parse command line arguments
    // The address is only stored here; it is resolved by parse_endpoint()
    inline dp::Res<Config> parse_args(int argc, const char *const *argv) {
        Config config;
        bool have_remote = false;

        for (int i = 1; i < argc; i++) {
            std::string arg(argv[i]);

            if (arg == "-u" || arg == "--udp") {
                config.transport = TransportKind::Datagram;
            } else if (arg == "--pulse") {
                config.input_mode = InputMode::Pulse;
            } else if (arg == "-h" || arg == "--help") {
                config.help = true;
            } else if (arg.size() > 1 && arg[0] == '-' && arg[1] != '-' &&
                       arg.find_first_not_of(arg[1], 1) == std::string::npos && (arg[1] == 'v' || arg[1] == 'q')) {
                // -v, -vv, -qqq ...
                dp::usize count = arg.size() - 1;
                dp::u8 &level = arg[1] == 'v' ? config.verbose : config.quiet;
                level = static_cast<dp::u8>(std::min<dp::usize>(level + count, MAX_VERBOSITY));
            } else if (!arg.empty() && arg[0] == '-') {
                return dp::result::err(dp::Error::invalid_argument(dp::String("unknown option: ") + arg.c_str()));
            } else if (have_remote) {
                return dp::result::err(dp::Error::invalid_argument(dp::String("unexpected argument: ") + arg.c_str()));
            } else {
                config.remote = dp::String(arg.c_str());
                have_remote = true;
            }
        }

        return dp::result::ok(std::move(config));
    }

} // namespace conpipe
