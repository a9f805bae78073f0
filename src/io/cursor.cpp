#include "io/cursor.hpp"

#include <algorithm>
#include <cassert>
#include <cstring>

namespace instream {

Cursor::Cursor(ByteSource& source, size_t initial_capacity, size_t read_chunk)
    : source_(source),
      buffer_(initial_capacity),
      read_chunk_(std::max<size_t>(read_chunk, 1)) {}

std::optional<uint8_t> Cursor::peek() const {
    if (buffer_.empty()) return std::nullopt;
    return buffer_.unread().front();
}

void Cursor::advance() {
    assert(!buffer_.empty() && "advance on an empty buffer");
    position_.advance(buffer_.unread().front());
    buffer_.consume(1);
}

void Cursor::consume(size_t n) {
    auto bytes = buffer_.unread().first(n);
    for (uint8_t c : bytes) {
        position_.advance(c);
    }
    buffer_.consume(n);
}

Result<bool, std::error_code> Cursor::refill() {
    using R = Result<bool, std::error_code>;
    if (error_) {
        return R::err(error_);
    }

    auto room = buffer_.prepare(read_chunk_);
    auto got = source_.read(room.first(std::min(room.size(), read_chunk_)));
    if (!got) {
        error_ = got.error();
        return R::err(error_);
    }

    size_t n = got.value();
    buffer_.commit(n);
    eof_ = (n == 0);
    return R::ok(n > 0);
}

Result<size_t, std::error_code> Cursor::read_through(std::span<uint8_t> dest) {
    using R = Result<size_t, std::error_code>;
    if (dest.empty()) {
        return R::ok(0);
    }

    if (!buffer_.empty()) {
        size_t n = std::min(dest.size(), buffer_.size());
        std::memcpy(dest.data(), buffer_.unread().data(), n);
        consume(n);
        return R::ok(n);
    }

    if (error_) {
        return R::err(error_);
    }
    auto got = source_.read(dest);
    if (!got) {
        error_ = got.error();
        return R::err(error_);
    }
    size_t n = got.value();
    for (uint8_t c : dest.first(n)) {
        position_.advance(c);
    }
    eof_ = (n == 0);
    return R::ok(n);
}

} // namespace instream
