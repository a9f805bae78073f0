#pragma once

#include "io/byte_buffer.hpp"
#include "scan/whitespace.hpp"

#include <cstddef>
#include <string>

namespace instream {

/// Per-stream configuration for InputStream.
struct StreamOptions {
    WhitespaceSet delimiters{};
    size_t initial_capacity = ByteBuffer::kDefaultCapacity;
    size_t read_chunk       = ByteBuffer::kDefaultCapacity; // bytes asked of the source per refill
    size_t default_limit    = 0;                            // applied by scan<T>(); 0 = unbounded
    std::string source_name;                                // used in diagnostics only
};

} // namespace instream
