#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace instream {

/// The set of delimiter bytes that separate tokens. ASCII only: bytes >= 0x80
/// are never whitespace unless added explicitly.
class WhitespaceSet {
public:
    /// Space and \t \n \v \f \r, the set std::isspace uses in the "C" locale.
    constexpr WhitespaceSet() : WhitespaceSet(std::string_view(" \t\n\v\f\r")) {}

    constexpr explicit WhitespaceSet(std::string_view bytes) : table_{} {
        for (char c : bytes) {
            table_[static_cast<uint8_t>(c)] = true;
        }
    }

    [[nodiscard]] constexpr bool contains(uint8_t byte) const { return table_[byte]; }

    [[nodiscard]] constexpr bool operator==(const WhitespaceSet&) const = default;

private:
    std::array<bool, 256> table_;
};

} // namespace instream
