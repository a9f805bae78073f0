#pragma once

#include "common/result.hpp"
#include "common/stream_position.hpp"
#include "io/byte_buffer.hpp"
#include "io/byte_source.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <system_error>

namespace instream {

/// Read position over a ByteSource. Owns the buffer, borrows the source.
///
/// A failed source read is remembered: once refill() has returned an error,
/// every later refill() returns the same error without touching the source.
class Cursor {
public:
    Cursor(ByteSource& source, size_t initial_capacity, size_t read_chunk);

    Cursor(const Cursor&)            = delete;
    Cursor& operator=(const Cursor&) = delete;

    /// The next unread byte, without consuming it. Never refills.
    [[nodiscard]] std::optional<uint8_t> peek() const;

    /// Consume one buffered byte. Requires peek() to have a value.
    void advance();

    /// Pull more bytes from the source. Returns whether new bytes arrived;
    /// false means the source reported end of input.
    [[nodiscard]] Result<bool, std::error_code> refill();

    /// True once the buffer is drained and the last refill() hit end of input.
    [[nodiscard]] bool at_end() const { return buffer_.empty() && eof_; }

    /// Unread buffered bytes.
    [[nodiscard]] std::span<const uint8_t> buffered() const { return buffer_.unread(); }

    /// Consume the first `n` buffered bytes. Requires n <= buffered().size().
    void consume(size_t n);

    /// Copy buffered bytes into `dest` and, once the buffer is drained, read
    /// straight from the source. Returns bytes delivered; 0 at end of input.
    [[nodiscard]] Result<size_t, std::error_code> read_through(std::span<uint8_t> dest);

    [[nodiscard]] const StreamPosition& position() const { return position_; }

    /// The remembered source error, if any.
    [[nodiscard]] const std::error_code& pending_error() const { return error_; }

    [[nodiscard]] const ByteBuffer& buffer() const { return buffer_; }

private:
    ByteSource& source_;
    ByteBuffer buffer_;
    size_t read_chunk_;
    bool eof_ = false;
    std::error_code error_;
    StreamPosition position_;
};

} // namespace instream
