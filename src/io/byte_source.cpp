#include "io/byte_source.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <istream>

#include <fcntl.h>
#include <unistd.h>

namespace instream {

// ============================================================================
// MemorySource
// ============================================================================

Result<size_t, std::error_code> MemorySource::read(std::span<uint8_t> dest) {
    size_t n = std::min(dest.size(), remaining());
    if (chunk_size_ > 0) {
        n = std::min(n, chunk_size_);
    }
    if (n > 0) {
        std::memcpy(dest.data(), data_.data() + offset_, n);
        offset_ += n;
    }
    return Result<size_t, std::error_code>::ok(n);
}

// ============================================================================
// FdSource
// ============================================================================

Result<std::unique_ptr<FdSource>, std::error_code> FdSource::open(const std::string& path) {
    using R = Result<std::unique_ptr<FdSource>, std::error_code>;
    int fd;
    do {
        fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        return R::err(std::error_code(errno, std::system_category()));
    }
    return R::ok(std::unique_ptr<FdSource>(new FdSource(fd, true)));
}

FdSource::~FdSource() {
    if (owned_ && fd_ >= 0) {
        ::close(fd_);
    }
}

Result<size_t, std::error_code> FdSource::read(std::span<uint8_t> dest) {
    using R = Result<size_t, std::error_code>;
    for (;;) {
        ssize_t n = ::read(fd_, dest.data(), dest.size());
        if (n >= 0) {
            return R::ok(static_cast<size_t>(n));
        }
        if (errno != EINTR) {
            return R::err(std::error_code(errno, std::system_category()));
        }
    }
}

// ============================================================================
// IstreamSource
// ============================================================================

Result<size_t, std::error_code> IstreamSource::read(std::span<uint8_t> dest) {
    using R = Result<size_t, std::error_code>;
    if (dest.empty()) {
        return R::ok(0);
    }

    auto first = in_.get();
    if (first == std::istream::traits_type::eof()) {
        if (in_.bad()) {
            return R::err(std::make_error_code(std::errc::io_error));
        }
        return R::ok(0);
    }
    dest[0] = static_cast<uint8_t>(first);

    std::streamsize more = 0;
    if (dest.size() > 1) {
        more = in_.readsome(reinterpret_cast<char*>(dest.data() + 1),
                            static_cast<std::streamsize>(dest.size() - 1));
        if (in_.bad()) {
            return R::err(std::make_error_code(std::errc::io_error));
        }
    }
    return R::ok(1 + static_cast<size_t>(more));
}

} // namespace instream
