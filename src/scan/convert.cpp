#include "scan/convert.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <system_error>

namespace instream {

namespace {

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool equals_ignore_case(std::string_view text, std::string_view lowercase) {
    if (text.size() != lowercase.size()) return false;
    for (size_t i = 0; i < text.size(); ++i) {
        if ((text[i] | 0x20) != lowercase[i]) return false;
    }
    return true;
}

// [+-] ( digits [. digits*] | . digits ) [ (e|E) [+-] digits ]
bool is_decimal_float(std::string_view body) {
    size_t i = 0;
    size_t mantissa_digits = 0;
    while (i < body.size() && is_digit(body[i])) {
        ++i;
        ++mantissa_digits;
    }
    if (i < body.size() && body[i] == '.') {
        ++i;
        while (i < body.size() && is_digit(body[i])) {
            ++i;
            ++mantissa_digits;
        }
    }
    if (mantissa_digits == 0) return false;

    if (i < body.size() && (body[i] == 'e' || body[i] == 'E')) {
        ++i;
        if (i < body.size() && (body[i] == '+' || body[i] == '-')) {
            ++i;
        }
        size_t exponent_digits = 0;
        while (i < body.size() && is_digit(body[i])) {
            ++i;
            ++exponent_digits;
        }
        if (exponent_digits == 0) return false;
    }
    return i == body.size();
}

// Decimal exponent of the leading significant digit of a body accepted by
// is_decimal_float: 0 for "5.2", -3 for "0.0012", 402 for "12e401". Huge
// exponents saturate.
int64_t leading_exponent(std::string_view body) {
    constexpr int64_t kSaturated = 1'000'000'000'000;

    size_t i = 0;
    while (i < body.size() && is_digit(body[i])) {
        ++i;
    }
    const auto int_digits = static_cast<int64_t>(i);

    int64_t lead = 0;
    bool found = false;
    for (size_t j = 0; j < i; ++j) {
        if (body[j] != '0') {
            lead = int_digits - 1 - static_cast<int64_t>(j);
            found = true;
            break;
        }
    }
    if (i < body.size() && body[i] == '.') {
        ++i;
        for (int64_t k = 1; i < body.size() && is_digit(body[i]); ++i, ++k) {
            if (!found && body[i] != '0') {
                lead = -k;
                found = true;
            }
        }
    }

    int64_t exponent = 0;
    if (i < body.size() && (body[i] == 'e' || body[i] == 'E')) {
        ++i;
        bool negative = false;
        if (i < body.size() && (body[i] == '+' || body[i] == '-')) {
            negative = body[i] == '-';
            ++i;
        }
        for (; i < body.size(); ++i) {
            exponent = std::min(exponent * 10 + (body[i] - '0'), kSaturated);
        }
        if (negative) exponent = -exponent;
    }
    return lead + exponent;
}

template <typename F>
detail::NumberStatus parse_floating_impl(std::string_view token, F& out) {
    if (token.empty()) return detail::NumberStatus::Invalid;

    bool negative = token.front() == '-';
    std::string_view body = token;
    if (token.front() == '+' || token.front() == '-') {
        body.remove_prefix(1);
    }

    if (equals_ignore_case(body, "inf") || equals_ignore_case(body, "infinity")) {
        out = negative ? -std::numeric_limits<F>::infinity() : std::numeric_limits<F>::infinity();
        return detail::NumberStatus::Ok;
    }
    if (equals_ignore_case(body, "nan")) {
        out = std::copysign(std::numeric_limits<F>::quiet_NaN(), negative ? F(-1) : F(1));
        return detail::NumberStatus::Ok;
    }
    if (!is_decimal_float(body)) {
        return detail::NumberStatus::Invalid;
    }

    // from_chars takes a '-' but not a '+'.
    std::string_view digits = negative ? token : body;
    const char* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(digits.data(), last, out, std::chars_format::general);
    if (ec == std::errc::result_out_of_range) {
        // Saturate like strtod: too large is infinity, too small is zero.
        F magnitude = leading_exponent(body) < 0 ? F(0) : std::numeric_limits<F>::infinity();
        out = negative ? -magnitude : magnitude;
        return detail::NumberStatus::Ok;
    }
    if (ec != std::errc() || ptr != last) {
        return detail::NumberStatus::Invalid;
    }
    return detail::NumberStatus::Ok;
}

} // namespace

namespace detail {

NumberStatus parse_decimal(std::string_view token, uint64_t max_positive,
                           uint64_t max_negative, bool& negative, uint64_t& magnitude) {
    negative = false;
    magnitude = 0;

    size_t i = 0;
    if (i < token.size() && (token[i] == '+' || token[i] == '-')) {
        negative = token[i] == '-';
        ++i;
    }
    if (negative && max_negative == 0) return NumberStatus::Invalid;
    if (i == token.size()) return NumberStatus::Invalid; // sign only, or empty

    for (size_t j = i; j < token.size(); ++j) {
        if (!is_digit(token[j])) return NumberStatus::Invalid;
    }

    const uint64_t limit = negative ? max_negative : max_positive;
    const uint64_t limit10 = limit / 10;
    const unsigned limit_rem = static_cast<unsigned>(limit % 10);
    uint64_t value = 0;
    for (; i < token.size(); ++i) {
        unsigned digit = static_cast<unsigned>(token[i] - '0');
        if (value > limit10 || (value == limit10 && digit > limit_rem)) {
            return NumberStatus::Overflow;
        }
        value = value * 10 + digit;
    }
    magnitude = value;
    return NumberStatus::Ok;
}

NumberStatus parse_floating(std::string_view token, float& out) {
    return parse_floating_impl(token, out);
}

NumberStatus parse_floating(std::string_view token, double& out) {
    return parse_floating_impl(token, out);
}

NumberStatus parse_floating(std::string_view token, long double& out) {
    return parse_floating_impl(token, out);
}

} // namespace detail

Result<char> TokenConverter<char>::convert(std::string_view token) {
    if (token.size() != 1) {
        return Result<char>::err(ScanError::invalid_format(token, "char"));
    }
    return Result<char>::ok(token.front());
}

Result<bool> TokenConverter<bool>::convert(std::string_view token) {
    if (token == "true" || token == "1") return Result<bool>::ok(true);
    if (token == "false" || token == "0") return Result<bool>::ok(false);
    return Result<bool>::err(ScanError::invalid_format(token, "bool"));
}

} // namespace instream
