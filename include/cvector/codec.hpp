#pragma once

#include <cvector/encoding.hpp>
#include <cvector/exceptions.hpp>
#include <cvector/version.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace cvector {

inline constexpr char component_separator = '.';

// Trailing marker other implementations append once a vector can no longer grow
inline constexpr char termination_symbol = '!';

// Fields recovered from a serialized correlation vector
struct decoded_vector {
    protocol_version _version;
    std::string _base;
    std::vector<std::uint32_t> _components;
    bool _terminated;

    auto version() const -> protocol_version { return _version; }
    auto base() const -> const std::string& { return _base; }
    auto components() const -> const std::vector<std::uint32_t>& { return _components; }
    auto terminated() const -> bool { return _terminated; }
};

// Serialized length of a base followed by the given components
inline auto serialized_length(std::size_t base_length, std::span<const std::uint32_t> components) -> std::size_t {
    auto length = base_length;
    for (auto component : components) {
        length += 1 + decimal_length(component);
    }
    return length;
}

namespace detail {

inline auto validate_base(std::string_view base) -> protocol_version {
    auto version = version_from_base_length(base.size());
    if (!version) {
        throw parse_exception(parse_error::malformed_base,
            "Base must be 16 or 22 characters long, got " + std::to_string(base.size()));
    }

    for (auto c : base) {
        if (!is_base_character(c)) {
            throw parse_exception(parse_error::malformed_base,
                "Base contains a character outside the URL-safe base64 alphabet: '" + std::string(1, c) + "'");
        }
    }

    if (*version == protocol_version::v2 && !is_canonical_tail(base.back())) {
        throw parse_exception(parse_error::malformed_base,
            "Base does not encode a 128-bit value: '" + std::string(base) + "'");
    }

    return *version;
}

inline auto parse_component(std::string_view token) -> std::uint32_t {
    constexpr std::size_t max_digits = 10;

    if (token.empty()) {
        throw parse_exception(parse_error::malformed_component, "Empty component");
    }
    if (token.size() > 1 && token.front() == '0') {
        throw parse_exception(parse_error::malformed_component,
            "Component has a leading zero: '" + std::string(token) + "'");
    }
    if (token.size() > max_digits) {
        throw parse_exception(parse_error::malformed_component,
            "Component does not fit in 32 bits: '" + std::string(token) + "'");
    }

    std::uint64_t value = 0;
    for (auto c : token) {
        if (c < '0' || c > '9') {
            throw parse_exception(parse_error::malformed_component,
                "Component is not a non-negative decimal integer: '" + std::string(token) + "'");
        }
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }

    if (value > std::numeric_limits<std::uint32_t>::max()) {
        throw parse_exception(parse_error::malformed_component,
            "Component does not fit in 32 bits: '" + std::string(token) + "'");
    }

    return static_cast<std::uint32_t>(value);
}

} // namespace detail

// Decode a serialized correlation vector, throws parse_exception on malformed input
inline auto decode(std::string_view text) -> decoded_vector {
    bool terminated = !text.empty() && text.back() == termination_symbol;
    if (terminated) {
        text.remove_suffix(1);
    }

    if (text.size() > max_serialized_length) {
        throw parse_exception(parse_error::length_exceeded,
            "Correlation vector is " + std::to_string(text.size()) + " bytes, longer than any version allows");
    }

    auto separator = text.find(component_separator);
    auto base = text.substr(0, separator);

    decoded_vector result{detail::validate_base(base), std::string(base), {}, terminated};

    while (separator != std::string_view::npos) {
        auto start = separator + 1;
        separator = text.find(component_separator, start);
        auto token = separator == std::string_view::npos
            ? text.substr(start)
            : text.substr(start, separator - start);
        result._components.push_back(detail::parse_component(token));
    }

    auto max_length = traits_of(result._version).max_length();
    if (text.size() > max_length) {
        std::string message = "Correlation vector is " + std::to_string(text.size())
            + " bytes, the limit for this version is " + std::to_string(max_length);
        throw parse_exception(parse_error::length_exceeded, message);
    }

    return result;
}

// Encode a base and its components, throws std::logic_error if the result breaks the length limit
inline auto encode(protocol_version version, std::string_view base, std::span<const std::uint32_t> components) -> std::string {
    std::string result;
    result.reserve(serialized_length(base.size(), components));
    result.append(base);
    for (auto component : components) {
        result.push_back(component_separator);
        result.append(std::to_string(component));
    }

    if (result.size() > traits_of(version).max_length()) {
        throw std::logic_error("Correlation vector grew past its length limit: " + result);
    }
    return result;
}

} // namespace cvector
