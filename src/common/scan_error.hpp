#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace instream {

/// The closed set of ways a scan can fail.
enum class ErrorKind : uint8_t {
    UnexpectedEof,
    InvalidFormat,
    Overflow,
    LimitExceeded,
    Io,
};

/// A failed scan. Exactly one kind per failure; `io` is only set for
/// ErrorKind::Io and carries the source's error code unchanged.
struct ScanError {
    ErrorKind kind = ErrorKind::InvalidFormat;
    std::string message;
    std::error_code io;

    [[nodiscard]] static ScanError unexpected_eof();
    [[nodiscard]] static ScanError invalid_format(std::string_view token, std::string_view type_name);
    [[nodiscard]] static ScanError overflow(std::string_view token, std::string_view type_name);
    [[nodiscard]] static ScanError limit_exceeded(size_t limit);
    [[nodiscard]] static ScanError from_io(std::error_code ec);

    [[nodiscard]] bool is(ErrorKind k) const { return kind == k; }
};

[[nodiscard]] std::string_view error_kind_to_string(ErrorKind kind);

/// Render an error as "<kind>: <message>".
[[nodiscard]] std::string format_error(const ScanError& error);

} // namespace instream
