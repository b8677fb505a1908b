#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace conpipe {

    // Frame type - the encoded bytes of exactly one message
    using Frame = dp::Vector<dp::u8>;

    // Big-endian encoding for the frame header
    inline dp::Array<dp::u8, 4> encode_u32_be(dp::u32 value) {
        dp::Array<dp::u8, 4> bytes;
        bytes[0] = static_cast<dp::u8>((value >> 24) & 0xFF);
        bytes[1] = static_cast<dp::u8>((value >> 16) & 0xFF);
        bytes[2] = static_cast<dp::u8>((value >> 8) & 0xFF);
        bytes[3] = static_cast<dp::u8>(value & 0xFF);
        return bytes;
    }

    inline dp::u32 decode_u32_be(const dp::u8 *bytes) {
        return (static_cast<dp::u32>(bytes[0]) << 24) | (static_cast<dp::u32>(bytes[1]) << 16) |
               (static_cast<dp::u32>(bytes[2]) << 8) | static_cast<dp::u32>(bytes[3]);
    }

    inline void append_u32_be(Frame &buffer, dp::u32 value) {
        auto bytes = encode_u32_be(value);
        buffer.insert(buffer.end(), bytes.begin(), bytes.end());
    }

    // Single read syscall - the caller treats whatever arrives as one unit
    // Returns the number of bytes read, 0 on orderly EOF
    // ERROR CATEGORIZATION:
    // - timeout: EAGAIN/EWOULDBLOCK
    // - not_found: connection closed (ECONNRESET, EPIPE, EBADF, ENOTCONN)
    // - io_error: anything else
    inline dp::Res<dp::usize> read_some(dp::i32 fd, dp::u8 *buffer, dp::usize capacity) {
        while (true) {
            dp::isize n = ::read(fd, buffer, capacity);
            if (n >= 0) {
                echo::trace("read ", n, " bytes (fd=", fd, ")");
                return dp::result::ok(static_cast<dp::usize>(n));
            }

            if (errno == EINTR) {
                echo::trace("read interrupted by signal, retrying");
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return dp::result::err(dp::Error::timeout("read timeout"));
            }
            if (errno == ECONNRESET) {
                echo::trace("read failed: connection reset by peer (fd=", fd, ")");
                return dp::result::err(dp::Error::not_found("connection reset by peer"));
            }
            if (errno == EPIPE || errno == EBADF || errno == ENOTCONN) {
                echo::trace("read failed: ", strerror(errno), " (fd=", fd, ")");
                return dp::result::err(dp::Error::not_found("connection closed"));
            }

            echo::trace("read failed: ", strerror(errno), " (errno=", errno, ", fd=", fd, ")");
            return dp::result::err(dp::Error::io_error(dp::String("read error: ") + strerror(errno)));
        }
    }

    // Write exactly n bytes to a socket
    // ERROR CATEGORIZATION:
    // - not_found: connection closed (ECONNRESET, EPIPE, EBADF, ENOTCONN)
    // - io_error: other I/O errors
    inline dp::Res<void> write_exact(dp::i32 fd, const dp::u8 *buffer, dp::usize count) {
        dp::usize total_written = 0;
        while (total_written < count) {
            // MSG_NOSIGNAL keeps a dead peer from raising SIGPIPE
            dp::isize n = ::send(fd, buffer + total_written, count - total_written, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) {
                    echo::trace("write interrupted by signal, retrying");
                    continue;
                }

                if (errno == ECONNRESET) {
                    echo::trace("write failed: connection reset by peer (fd=", fd, ")");
                    return dp::result::err(dp::Error::not_found("connection reset by peer"));
                }
                if (errno == EPIPE) {
                    echo::trace("write failed: broken pipe (fd=", fd, ")");
                    return dp::result::err(dp::Error::not_found("broken pipe"));
                }
                if (errno == EBADF) {
                    echo::trace("write failed: bad file descriptor (fd=", fd, ")");
                    return dp::result::err(dp::Error::not_found("bad file descriptor"));
                }
                if (errno == ENOTCONN) {
                    echo::trace("write failed: socket not connected (fd=", fd, ")");
                    return dp::result::err(dp::Error::not_found("socket not connected"));
                }

                echo::trace("write failed: ", strerror(errno), " (errno=", errno, ", fd=", fd, ")");
                return dp::result::err(dp::Error::io_error(dp::String("write error: ") + strerror(errno)));
            }

            total_written += static_cast<dp::usize>(n);
            echo::trace("wrote ", n, " bytes, total=", total_written, "/", count, " (fd=", fd, ")");
        }
        return dp::result::ok();
    }

} // namespace conpipe
