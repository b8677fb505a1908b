#pragma once

#include <conpipe/message.hpp>

#include <optional>
#include <string>

namespace conpipe {
    namespace codec {

        /// Wire format version
        constexpr dp::u8 WIRE_VERSION = 1;

        /// Frame layout: [version:1][category:1][length:4][text:N]
        /// All multi-byte integers are big-endian
        /// A frame is always a whole buffer: no delimiter, no resynchronisation
        constexpr dp::usize HEADER_SIZE = 6;

        /// Largest text a single frame may carry
        constexpr dp::usize MAX_TEXT_SIZE = 16 * 1024 * 1024;

        /// Encode one message into one frame
        inline dp::Res<Frame> encode(const Message &message) {
            if (message.text.size() > MAX_TEXT_SIZE) {
                return dp::result::err(dp::Error::invalid_argument(
                    dp::String("message text too large: ") + std::to_string(message.text.size()).c_str()));
            }

            Frame frame;
            frame.reserve(HEADER_SIZE + message.text.size());

            frame.push_back(WIRE_VERSION);
            frame.push_back(static_cast<dp::u8>(message.category));
            append_u32_be(frame, static_cast<dp::u32>(message.text.size()));
            frame.insert(frame.end(), message.text.begin(), message.text.end());

            echo::trace("encoded frame len=", frame.size());
            return dp::result::ok(std::move(frame));
        }

        /// Decode a whole buffer as exactly one frame
        inline dp::Res<Message> decode(const Frame &frame) {
            if (frame.empty()) {
                return dp::result::err(dp::Error::not_found("empty frame"));
            }
            if (frame.size() < HEADER_SIZE) {
                return dp::result::err(dp::Error::invalid_argument("frame too short"));
            }
            if (frame[0] != WIRE_VERSION) {
                return dp::result::err(dp::Error::invalid_argument(
                    dp::String("unsupported wire version: ") + std::to_string(frame[0]).c_str()));
            }
            if (frame[1] >= CATEGORY_COUNT) {
                return dp::result::err(dp::Error::invalid_argument(
                    dp::String("unknown category: ") + std::to_string(frame[1]).c_str()));
            }

            dp::u32 length = decode_u32_be(frame.data() + 2);
            if (frame.size() != HEADER_SIZE + length) {
                return dp::result::err(dp::Error::invalid_argument(
                    dp::String("frame size mismatch: expected ") + std::to_string(HEADER_SIZE + length).c_str() +
                    " got " + std::to_string(frame.size()).c_str()));
            }

            Message message;
            message.category = static_cast<Category>(frame[1]);
            message.text = dp::String(reinterpret_cast<const char *>(frame.data() + HEADER_SIZE), length);
            return dp::result::ok(std::move(message));
        }

        /// Decode policy shared by both transports:
        /// - empty buffer: no message, nothing reported
        /// - malformed buffer: no message, reported on the diagnostic channel
        inline std::optional<Message> decode_frame(const Frame &frame) {
            if (frame.empty()) {
                return std::nullopt;
            }
            auto res = decode(frame);
            if (res.is_err()) {
                echo::warn("dropping undecodable frame (", frame.size(), " bytes): ", res.error().message.c_str());
                return std::nullopt;
            }
            return std::move(res.value());
        }

    } // namespace codec
} // namespace conpipe
