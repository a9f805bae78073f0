#pragma once

#include "common/diagnostic.hpp"
#include "common/result.hpp"
#include "common/scan_error.hpp"
#include "common/stream_position.hpp"
#include "io/byte_source.hpp"
#include "io/cursor.hpp"
#include "scan/convert.hpp"
#include "scan/stream_options.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace instream {

/// Formatted extraction of whitespace-delimited tokens from a ByteSource,
/// in the manner of `std::istream >> value`.
///
///     MemorySource src("  42 -17\n");
///     InputStream in(src);
///     auto a = in.scan<int32_t>();   // 42
///     auto b = in.scan<int32_t>();   // -17
///     bool done = in.at_end();       // true
///
/// Each scan skips leading delimiters and consumes exactly one token, whether
/// or not the token converts. Whitespace after the token is left for the
/// next call.
///
/// The source is borrowed and must outlive the stream. Not thread-safe.
class InputStream {
public:
    static constexpr size_t kUnbounded = std::numeric_limits<size_t>::max();

    explicit InputStream(ByteSource& source, StreamOptions options = {});

    InputStream(const InputStream&)            = delete;
    InputStream& operator=(const InputStream&) = delete;

    /// Scan the next token as a T. Uses options().default_limit when set.
    template <TokenConvertible T>
    [[nodiscard]] Result<T> scan() {
        return scan_impl<T>(default_budget());
    }

    /// Scan the next token as a T, examining at most `limit` bytes
    /// (leading whitespace included). Fails with LimitExceeded when the
    /// token is not complete within the limit.
    template <TokenConvertible T>
    [[nodiscard]] Result<T> scan_with_limit(size_t limit) {
        return scan_impl<T>(limit);
    }

    /// Scan one value of each type in order; stops at the first failure.
    template <TokenConvertible... Ts>
    [[nodiscard]] Result<std::tuple<Ts...>> scan_values() {
        std::tuple<Ts...> values;
        std::optional<ScanError> failure;
        std::apply([&](auto&... slot) { (scan_into(slot, failure), ...); }, values);
        if (failure) {
            return Result<std::tuple<Ts...>>::err(std::move(*failure));
        }
        return Result<std::tuple<Ts...>>::ok(std::move(values));
    }

    /// Scan `count` values of one type; stops at the first failure.
    template <TokenConvertible T>
    [[nodiscard]] Result<std::vector<T>> scan_n(size_t count) {
        std::vector<T> values;
        values.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            auto value = scan<T>();
            if (!value) {
                return std::move(value).template forward_error<std::vector<T>>();
            }
            values.push_back(std::move(value).value());
        }
        return Result<std::vector<T>>::ok(std::move(values));
    }

    /// Skip whitespace and report whether the input is exhausted. The skip is
    /// bounded by options().default_limit when set; running out of that
    /// budget, or a source error, yields false and the next scan reports it.
    [[nodiscard]] bool at_end();

    /// Unformatted read: buffered bytes first, then straight from the source.
    /// Returns 0 at end of input.
    [[nodiscard]] Result<size_t> read(std::span<uint8_t> dest);

    /// Position of the next unread byte.
    [[nodiscard]] const StreamPosition& position() const { return cursor_.position(); }

    [[nodiscard]] const StreamOptions& options() const { return options_; }

    /// Report every failed scan to `diag` (nullptr to stop reporting).
    void set_diagnostics(DiagnosticEngine* diag) { diag_ = diag; }

private:
    enum class RunEnd : uint8_t {
        Delimited, // stopped in front of a byte the predicate rejected
        Eof,
        Budget,    // the next byte would exceed the limit
    };

    template <TokenConvertible T>
    Result<T> scan_impl(size_t limit) {
        auto token = next_token(limit);
        if (!token) {
            return Result<T>::err(report(std::move(token).error()));
        }
        auto value = TokenConverter<T>::convert(token.value());
        if (!value) {
            return Result<T>::err(report(std::move(value).error()));
        }
        return value;
    }

    template <TokenConvertible T>
    void scan_into(T& slot, std::optional<ScanError>& failure) {
        if (failure) return;
        auto value = scan<T>();
        if (value) {
            slot = std::move(value).value();
        } else {
            failure = std::move(value).error();
        }
    }

    /// Skip delimiters and collect the next token into scratch_, spending at
    /// most `limit` bytes.
    Result<std::string_view> next_token(size_t limit);

    /// Consume bytes for which the delimiter test equals `delimiters`,
    /// appending them to scratch_ when `keep` is set. `budget` is the
    /// remaining scan limit.
    Result<RunEnd> consume_run(bool delimiters, bool keep, size_t& budget);

    [[nodiscard]] size_t default_budget() const {
        return options_.default_limit > 0 ? options_.default_limit : kUnbounded;
    }

    ScanError report(ScanError error);

    StreamOptions options_;
    Cursor cursor_;
    std::string scratch_;
    StreamPosition token_start_;
    DiagnosticEngine* diag_ = nullptr;
};

} // namespace instream
