#pragma once

#include <conpipe/common.hpp>

namespace conpipe {

    /// Message category carried on the wire
    /// The bridge never branches on it, it only passes it through
    enum class Category : dp::u8 {
        Info = 0,    // Free-form information
        Ahead = 1,   // Local branch ahead of its upstream
        Behind = 2,  // Local branch behind its upstream
        UpToDate = 3 // Local branch matches its upstream
    };

    constexpr dp::u8 CATEGORY_COUNT = 4;

    inline const char *category_name(Category category) {
        switch (category) {
        case Category::Info:
            return "Info";
        case Category::Ahead:
            return "Ahead";
        case Category::Behind:
            return "Behind";
        case Category::UpToDate:
            return "UpToDate";
        }
        return "?";
    }

    /// Application message relayed between the console and the remote peer
    /// A default-constructed Message ({Info, ""}) is the placeholder value
    struct Message {
        Category category = Category::Info;
        dp::String text;

        /// Info message whose text is the raw bytes of one input chunk
        static Message from_bytes(const dp::u8 *data, dp::usize len) {
            return Message{Category::Info, dp::String(reinterpret_cast<const char *>(data), len)};
        }

        /// Human-readable form written to the output sink
        dp::String display() const { return dp::String("[") + category_name(category) + "] " + text; }

        inline bool operator==(const Message &other) const {
            return category == other.category && text == other.text;
        }
        inline bool operator!=(const Message &other) const { return !(*this == other); }
    };

} // namespace conpipe
