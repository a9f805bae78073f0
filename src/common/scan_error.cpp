#include "common/scan_error.hpp"

#include <fmt/format.h>

namespace instream {

namespace {

// Tokens can be arbitrarily long; only a prefix goes into messages.
constexpr size_t kMaxQuotedToken = 32;

std::string quote_token(std::string_view token) {
    if (token.size() <= kMaxQuotedToken) {
        return std::string(token);
    }
    return fmt::format("{}...", token.substr(0, kMaxQuotedToken));
}

} // namespace

ScanError ScanError::unexpected_eof() {
    return ScanError{ErrorKind::UnexpectedEof, "end of input before a token", {}};
}

ScanError ScanError::invalid_format(std::string_view token, std::string_view type_name) {
    return ScanError{ErrorKind::InvalidFormat,
                     fmt::format("'{}' is not a valid {}", quote_token(token), type_name), {}};
}

ScanError ScanError::overflow(std::string_view token, std::string_view type_name) {
    return ScanError{ErrorKind::Overflow,
                     fmt::format("'{}' is out of range for {}", quote_token(token), type_name), {}};
}

ScanError ScanError::limit_exceeded(size_t limit) {
    return ScanError{ErrorKind::LimitExceeded,
                     fmt::format("token not delimited within {} bytes", limit), {}};
}

ScanError ScanError::from_io(std::error_code ec) {
    return ScanError{ErrorKind::Io, ec.message(), ec};
}

std::string_view error_kind_to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::UnexpectedEof: return "unexpected end of input";
    case ErrorKind::InvalidFormat: return "invalid format";
    case ErrorKind::Overflow:      return "overflow";
    case ErrorKind::LimitExceeded: return "limit exceeded";
    case ErrorKind::Io:            return "I/O error";
    }
    return "unknown";
}

std::string format_error(const ScanError& error) {
    return fmt::format("{}: {}", error_kind_to_string(error.kind), error.message);
}

} // namespace instream
