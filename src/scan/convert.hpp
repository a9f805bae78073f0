#pragma once

#include "common/result.hpp"
#include "common/scan_error.hpp"

#include <concepts>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace instream {

// ============================================================================
// Conversion rules
//
// Every scannable type has a TokenConverter specialization providing
//
//   static Result<T> convert(std::string_view token);
//
// The token is always the whole non-whitespace run.
//
// The set is closed: a type without a specialization does not satisfy
// TokenConvertible and cannot be scanned.
// ============================================================================

template <typename T>
struct TokenConverter {};

template <typename T>
concept TokenConvertible = requires(std::string_view token) {
    { TokenConverter<T>::convert(token) } -> std::same_as<Result<T>>;
};

/// Integral types scanned as decimal numbers. char is scanned as a single
/// character and bool as a word, so neither counts.
template <typename T>
concept ScannableInteger =
    std::integral<T> && !std::same_as<T, bool> && !std::same_as<T, char> &&
    !std::same_as<T, wchar_t> && !std::same_as<T, char8_t> &&
    !std::same_as<T, char16_t> && !std::same_as<T, char32_t>;

namespace detail {

enum class NumberStatus : uint8_t {
    Ok,
    Invalid,
    Overflow,
};

/// Parse `[+-]digits` into a sign and a magnitude. A magnitude above
/// `max_positive` (or `max_negative` after a '-') is an overflow. A '-' is
/// invalid when `max_negative` is 0, so "-0" is rejected for unsigned types.
/// Any non-digit anywhere in the token makes it invalid, even when the
/// digits before it would already overflow.
[[nodiscard]] NumberStatus parse_decimal(std::string_view token, uint64_t max_positive,
                                         uint64_t max_negative, bool& negative,
                                         uint64_t& magnitude);

/// Parse a decimal float, "inf", "infinity" or "nan". Never reports
/// Overflow: out-of-range values saturate to infinity or a signed zero.
[[nodiscard]] NumberStatus parse_floating(std::string_view token, float& out);
[[nodiscard]] NumberStatus parse_floating(std::string_view token, double& out);
[[nodiscard]] NumberStatus parse_floating(std::string_view token, long double& out);

template <ScannableInteger T>
[[nodiscard]] std::string integer_type_name() {
    return (std::is_signed_v<T> ? "i" : "u") + std::to_string(sizeof(T) * 8);
}

} // namespace detail

template <ScannableInteger T>
struct TokenConverter<T> {
    [[nodiscard]] static Result<T> convert(std::string_view token) {
        using U = std::make_unsigned_t<T>;
        constexpr uint64_t max_positive = static_cast<uint64_t>(std::numeric_limits<T>::max());
        constexpr uint64_t max_negative =
            std::is_signed_v<T> ? max_positive + 1 : 0;

        bool negative = false;
        uint64_t magnitude = 0;
        switch (detail::parse_decimal(token, max_positive, max_negative, negative, magnitude)) {
        case detail::NumberStatus::Invalid:
            return Result<T>::err(ScanError::invalid_format(token, detail::integer_type_name<T>()));
        case detail::NumberStatus::Overflow:
            return Result<T>::err(ScanError::overflow(token, detail::integer_type_name<T>()));
        case detail::NumberStatus::Ok:
            break;
        }

        if constexpr (std::is_signed_v<T>) {
            if (negative && magnitude != 0) {
                // magnitude may be one past max(), so negate via max() to stay in range.
                return Result<T>::ok(static_cast<T>(-static_cast<T>(magnitude - 1) - 1));
            }
        }
        return Result<T>::ok(static_cast<T>(static_cast<U>(magnitude)));
    }
};

template <std::floating_point T>
struct TokenConverter<T> {
    [[nodiscard]] static Result<T> convert(std::string_view token) {
        T value{};
        if (detail::parse_floating(token, value) != detail::NumberStatus::Ok) {
            return Result<T>::err(ScanError::invalid_format(token, type_name()));
        }
        return Result<T>::ok(value);
    }

private:
    static constexpr std::string_view type_name() {
        if constexpr (std::is_same_v<T, float>) return "f32";
        else if constexpr (std::is_same_v<T, double>) return "f64";
        else return "long double";
    }
};

/// A token of exactly one byte.
template <>
struct TokenConverter<char> {
    [[nodiscard]] static Result<char> convert(std::string_view token);
};

/// "true", "false", "1" or "0".
template <>
struct TokenConverter<bool> {
    [[nodiscard]] static Result<bool> convert(std::string_view token);
};

template <>
struct TokenConverter<std::string> {
    [[nodiscard]] static Result<std::string> convert(std::string_view token) {
        return Result<std::string>::ok(std::string(token));
    }
};

template <>
struct TokenConverter<std::vector<uint8_t>> {
    [[nodiscard]] static Result<std::vector<uint8_t>> convert(std::string_view token) {
        return Result<std::vector<uint8_t>>::ok(std::vector<uint8_t>(token.begin(), token.end()));
    }
};

} // namespace instream
