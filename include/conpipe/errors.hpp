#pragma once

#include <conpipe/common.hpp>

namespace conpipe {

    /// Stage at which a session failed
    /// - AddressResolution: the remote endpoint string did not parse (before any I/O)
    /// - Connection: the transport could not be opened (connect or bind)
    /// - Io: a read or write failed while the session was running
    enum class ErrorKind : dp::u8 { AddressResolution = 0, Connection = 1, Io = 2 };

    /// Process exit codes used by the command line front end
    namespace exit_code {
        constexpr dp::i32 Ok = 0;
        constexpr dp::i32 Usage = 1;
        constexpr dp::i32 AddressResolution = 2;
        constexpr dp::i32 Connection = 3;
        constexpr dp::i32 Io = 4;
    } // namespace exit_code

    inline dp::i32 to_exit_code(ErrorKind kind) {
        switch (kind) {
        case ErrorKind::AddressResolution:
            return exit_code::AddressResolution;
        case ErrorKind::Connection:
            return exit_code::Connection;
        case ErrorKind::Io:
            return exit_code::Io;
        }
        return exit_code::Io;
    }

    inline const char *error_kind_name(ErrorKind kind) {
        switch (kind) {
        case ErrorKind::AddressResolution:
            return "address resolution failed";
        case ErrorKind::Connection:
            return "connection failed";
        case ErrorKind::Io:
            return "i/o failed";
        }
        return "unknown failure";
    }

} // namespace conpipe
