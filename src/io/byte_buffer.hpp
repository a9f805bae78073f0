#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

namespace instream {

/// A single owned block of bytes with a read offset and a fill mark.
///
///     [0, pos)        already consumed
///     [pos, len)      unread data
///     [len, capacity) spare room for the next read
///
/// Invariant: pos <= len <= capacity. Making room first slides the unread
/// bytes down to offset 0 and only then grows the block, so a buffer whose
/// reader keeps up never grows past its initial capacity.
class ByteBuffer {
public:
    static constexpr size_t kDefaultCapacity = 8 * 1024; // 8 KB

    explicit ByteBuffer(size_t capacity = kDefaultCapacity);

    // Non-copyable, movable
    ByteBuffer(const ByteBuffer&)            = delete;
    ByteBuffer& operator=(const ByteBuffer&) = delete;
    ByteBuffer(ByteBuffer&&)                 = default;
    ByteBuffer& operator=(ByteBuffer&&)      = default;

    [[nodiscard]] size_t pos() const { return pos_; }
    [[nodiscard]] size_t len() const { return len_; }
    [[nodiscard]] size_t capacity() const { return capacity_; }

    /// Number of unread bytes.
    [[nodiscard]] size_t size() const { return len_ - pos_; }
    [[nodiscard]] bool empty() const { return pos_ == len_; }

    /// Room left after len.
    [[nodiscard]] size_t spare() const { return capacity_ - len_; }

    [[nodiscard]] std::span<const uint8_t> unread() const {
        return {data_.get() + pos_, len_ - pos_};
    }

    /// Mark `n` unread bytes as consumed. Requires n <= size().
    void consume(size_t n);

    /// Ensure at least `wanted` bytes of spare room, compacting and then
    /// growing as needed. Returns the writable region [len, capacity).
    [[nodiscard]] std::span<uint8_t> prepare(size_t wanted);

    /// Extend the unread region by `n` bytes just written into the region
    /// returned by prepare(). Requires n <= spare().
    void commit(size_t n);

    /// Slide unread bytes to offset 0.
    void compact();

    /// Drop all data; capacity is kept.
    void clear() {
        pos_ = 0;
        len_ = 0;
    }

    /// How often the block had to be reallocated.
    [[nodiscard]] size_t growth_count() const { return growth_count_; }

private:
    void grow(size_t min_capacity);

    std::unique_ptr<uint8_t[]> data_;
    size_t capacity_      = 0;
    size_t pos_           = 0;
    size_t len_           = 0;
    size_t growth_count_  = 0;
};

} // namespace instream
