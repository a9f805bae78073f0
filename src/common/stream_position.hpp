#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace instream {

/// Position of the next unread byte of a stream. `offset` counts bytes
/// consumed so far; line and column are 1-based.
struct StreamPosition {
    uint64_t offset = 0;
    uint32_t line   = 1;
    uint32_t column = 1;

    /// Step past one consumed byte.
    void advance(uint8_t byte) {
        ++offset;
        if (byte == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }

    [[nodiscard]] bool operator==(const StreamPosition&) const = default;

    [[nodiscard]] std::string to_string() const {
        return std::to_string(line) + ":" + std::to_string(column);
    }
};

/// A position within a named stream ("<stdin>", a file path, ...).
struct StreamLocation {
    std::string_view source;
    StreamPosition position;

    [[nodiscard]] std::string to_string() const {
        if (source.empty()) {
            return position.to_string();
        }
        return std::string(source) + ":" + position.to_string();
    }
};

} // namespace instream
