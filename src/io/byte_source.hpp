#pragma once

#include "common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <span>
#include <string>
#include <system_error>

namespace instream {

/// A pull-based provider of raw bytes. Implementations own whatever they
/// read from; the scanning layer only borrows them.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Read up to dest.size() bytes into dest. Returns the number of bytes
    /// written, 0 at end of input, or the underlying error.
    [[nodiscard]] virtual Result<size_t, std::error_code> read(std::span<uint8_t> dest) = 0;
};

/// Bytes held in memory. `chunk_size` caps how much a single read returns
/// (0 means no cap), which is handy for exercising refill boundaries.
class MemorySource final : public ByteSource {
public:
    explicit MemorySource(std::string data, size_t chunk_size = 0)
        : data_(std::move(data)), chunk_size_(chunk_size) {}

    [[nodiscard]] Result<size_t, std::error_code> read(std::span<uint8_t> dest) override;

    [[nodiscard]] size_t remaining() const { return data_.size() - offset_; }

private:
    std::string data_;
    size_t chunk_size_;
    size_t offset_ = 0;
};

/// A POSIX file descriptor. EINTR is retried here; any other failure of
/// ::read is returned as a system_category error code.
class FdSource final : public ByteSource {
public:
    /// Borrow an open descriptor; it is not closed by this object.
    explicit FdSource(int fd) : fd_(fd) {}

    /// Open `path` read-only. The returned source owns the descriptor.
    [[nodiscard]] static Result<std::unique_ptr<FdSource>, std::error_code> open(const std::string& path);

    ~FdSource() override;

    FdSource(const FdSource&)            = delete;
    FdSource& operator=(const FdSource&) = delete;

    [[nodiscard]] Result<size_t, std::error_code> read(std::span<uint8_t> dest) override;

    [[nodiscard]] int fd() const { return fd_; }

private:
    FdSource(int fd, bool owned) : fd_(fd), owned_(owned) {}

    int fd_;
    bool owned_ = false;
};

/// A std::istream such as std::cin. Blocks for at most one byte per read and
/// then takes whatever else the stream buffer already holds.
class IstreamSource final : public ByteSource {
public:
    explicit IstreamSource(std::istream& in) : in_(in) {}

    [[nodiscard]] Result<size_t, std::error_code> read(std::span<uint8_t> dest) override;

private:
    std::istream& in_;
};

} // namespace instream
