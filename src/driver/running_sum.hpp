#pragma once

#include <limits>
#include <type_traits>

namespace instream {

/// Sum of scanned values kept in the scanned type. Integer sums refuse to
/// leave the type's range; floating point sums follow IEEE rules.
template <typename T>
class RunningSum {
    static_assert(std::is_arithmetic_v<T> && !std::is_same_v<T, bool>);

public:
    /// Add `value`. Returns false and leaves the total unchanged when an
    /// integer total would overflow.
    [[nodiscard]] bool add(T value) {
        if constexpr (std::is_integral_v<T>) {
            if (value > 0 && total_ > std::numeric_limits<T>::max() - value) return false;
            if constexpr (std::is_signed_v<T>) {
                if (value < 0 && total_ < std::numeric_limits<T>::min() - value) return false;
            }
        }
        total_ += value;
        return true;
    }

    [[nodiscard]] T total() const { return total_; }

private:
    T total_{};
};

} // namespace instream
