#pragma once

#include "common/scan_error.hpp"

#include <utility>
#include <variant>

namespace instream {

/// Value-or-error return type for everything that can fail in instream.
/// Scans report a ScanError; byte sources report a std::error_code.
template <typename T, typename E = ScanError>
class Result {
public:
    /// Construct a success result.
    [[nodiscard]] static Result ok(T value) { return Result(std::move(value)); }

    /// Construct an error result.
    [[nodiscard]] static Result err(E error) { return Result(InError{std::move(error)}); }

    [[nodiscard]] bool is_ok() const { return std::holds_alternative<T>(data_); }
    [[nodiscard]] bool is_err() const { return std::holds_alternative<InError>(data_); }

    /// Get the success value. Undefined behavior if is_err().
    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }

    /// Get the error value. Undefined behavior if is_ok().
    [[nodiscard]] E& error() & { return std::get<InError>(data_).err; }
    [[nodiscard]] const E& error() const& { return std::get<InError>(data_).err; }
    [[nodiscard]] E&& error() && { return std::move(std::get<InError>(data_).err); }

    /// The value if ok, otherwise `fallback`.
    [[nodiscard]] T value_or(T fallback) const& {
        return is_ok() ? std::get<T>(data_) : std::move(fallback);
    }

    /// Re-wrap the error into a result of another value type.
    template <typename U>
    [[nodiscard]] Result<U, E> forward_error() && {
        return Result<U, E>::err(std::move(*this).error());
    }

    /// Explicit bool conversion: true if ok.
    [[nodiscard]] explicit operator bool() const { return is_ok(); }

private:
    // Wrap E so T and E can be the same type
    struct InError {
        E err;
    };

    explicit Result(T value) : data_(std::move(value)) {}
    explicit Result(InError error) : data_(std::move(error)) {}

    std::variant<T, InError> data_;
};

} // namespace instream
