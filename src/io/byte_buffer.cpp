#include "io/byte_buffer.hpp"

#include <algorithm>
#include <cassert>
#include <cstring>

namespace instream {

ByteBuffer::ByteBuffer(size_t capacity)
    : data_(std::make_unique<uint8_t[]>(std::max<size_t>(capacity, 1))),
      capacity_(std::max<size_t>(capacity, 1)) {}

void ByteBuffer::consume(size_t n) {
    assert(n <= size() && "consume past the fill mark");
    pos_ += n;
    if (pos_ == len_) {
        // Nothing unread: rewind for free instead of compacting later.
        pos_ = 0;
        len_ = 0;
    }
}

std::span<uint8_t> ByteBuffer::prepare(size_t wanted) {
    wanted = std::max<size_t>(wanted, 1);
    if (spare() < wanted && pos_ > 0) {
        compact();
    }
    if (spare() < wanted) {
        grow(len_ + wanted);
    }
    return {data_.get() + len_, capacity_ - len_};
}

void ByteBuffer::commit(size_t n) {
    assert(n <= spare() && "commit past capacity");
    len_ += n;
}

void ByteBuffer::compact() {
    if (pos_ == 0) {
        return;
    }
    size_t unread = len_ - pos_;
    if (unread > 0) {
        std::memmove(data_.get(), data_.get() + pos_, unread);
    }
    pos_ = 0;
    len_ = unread;
}

void ByteBuffer::grow(size_t min_capacity) {
    size_t new_capacity = std::max(capacity_ * 2, min_capacity);
    auto block = std::make_unique<uint8_t[]>(new_capacity);
    if (len_ > pos_) {
        std::memcpy(block.get(), data_.get() + pos_, len_ - pos_);
    }
    len_ -= pos_;
    pos_ = 0;
    data_ = std::move(block);
    capacity_ = new_capacity;
    ++growth_count_;
}

} // namespace instream
