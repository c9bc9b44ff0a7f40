#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>

namespace cvector {

// Correlation vector protocol versions
enum class protocol_version : std::uint8_t {
    v1,
    v2
};

// Output operator for protocol_version (for testing and logging)
inline auto operator<<(std::ostream& os, protocol_version version) -> std::ostream& {
    switch (version) {
        case protocol_version::v1:
            return os << "v1";
        case protocol_version::v2:
            return os << "v2";
        default:
            return os << "unknown(" << static_cast<int>(version) << ")";
    }
}

// Fixed constants of a protocol version
struct version_traits {
    std::size_t _base_length;
    std::size_t _max_length;
    std::size_t _base_entropy_bytes;

    constexpr auto base_length() const -> std::size_t { return _base_length; }
    constexpr auto max_length() const -> std::size_t { return _max_length; }
    constexpr auto base_entropy_bytes() const -> std::size_t { return _base_entropy_bytes; }
};

inline constexpr version_traits v1_traits{16, 63, 12};
inline constexpr version_traits v2_traits{22, 127, 16};

// Largest serialized length any version accepts
inline constexpr std::size_t max_serialized_length = 127;

constexpr auto traits_of(protocol_version version) -> const version_traits& {
    return version == protocol_version::v1 ? v1_traits : v2_traits;
}

// Infer the version from the length of a base identifier
constexpr auto version_from_base_length(std::size_t length) -> std::optional<protocol_version> {
    if (length == v1_traits.base_length()) {
        return protocol_version::v1;
    }
    if (length == v2_traits.base_length()) {
        return protocol_version::v2;
    }
    return std::nullopt;
}

constexpr auto is_known_version(protocol_version version) -> bool {
    return version == protocol_version::v1 || version == protocol_version::v2;
}

} // namespace cvector
