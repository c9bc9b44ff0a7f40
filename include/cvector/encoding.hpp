#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace cvector {

// URL-safe base64 alphabet used for base identifiers
inline constexpr std::string_view base_alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789-_";

// Encode bytes as URL-safe base64 without '=' padding
inline auto encode_base(std::span<const std::uint8_t> data) -> std::string {
    std::string result;
    result.reserve((data.size() * 4 + 2) / 3);

    std::uint32_t val = 0;
    int valb = -6;

    for (auto b : data) {
        val = ((val << 8) | b) & 0xFFFFFFu;
        valb += 8;
        while (valb >= 0) {
            result.push_back(base_alphabet[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }

    if (valb > -6) {
        result.push_back(base_alphabet[((val << 8) >> (valb + 8)) & 0x3F]);
    }

    return result;
}

constexpr auto is_base_character(char c) -> bool {
    return (c >= 'A' && c <= 'Z')
        || (c >= 'a' && c <= 'z')
        || (c >= '0' && c <= '9')
        || c == '-'
        || c == '_';
}

// The last character of a 22 character base carries 2 bits, the low 4 bits are padding
constexpr auto is_canonical_tail(char c) -> bool {
    return c == 'A' || c == 'Q' || c == 'g' || c == 'w';
}

// Number of decimal digits needed to print a component
constexpr auto decimal_length(std::uint32_t value) -> std::size_t {
    std::size_t length = 1;
    while (value >= 10) {
        value /= 10;
        ++length;
    }
    return length;
}

} // namespace cvector
