#pragma once

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>

namespace cvector {

// Reasons a correlation vector string is rejected
enum class parse_error : std::uint8_t {
    malformed_base,
    malformed_component,
    length_exceeded
};

inline auto operator<<(std::ostream& os, parse_error error) -> std::ostream& {
    switch (error) {
        case parse_error::malformed_base: return os << "malformed_base";
        case parse_error::malformed_component: return os << "malformed_component";
        case parse_error::length_exceeded: return os << "length_exceeded";
        default: return os << "unknown(" << static_cast<int>(error) << ")";
    }
}

inline auto to_string(parse_error error) -> std::string {
    switch (error) {
        case parse_error::malformed_base: return "malformed_base";
        case parse_error::malformed_component: return "malformed_component";
        case parse_error::length_exceeded: return "length_exceeded";
    }
    return "unknown";
}

// Base exception for all correlation vector errors
class cvector_exception : public std::runtime_error {
public:
    explicit cvector_exception(const std::string& message)
        : std::runtime_error(message) {}
};

// Exception for rejected inbound correlation vector strings
class parse_exception : public cvector_exception {
public:
    parse_exception(parse_error error, const std::string& message)
        : cvector_exception(message)
        , _error(error) {}

    auto error() const -> parse_error {
        return _error;
    }

private:
    parse_error _error;
};

// Exception for invalid configuration values
class configuration_exception : public cvector_exception {
public:
    explicit configuration_exception(const std::string& message)
        : cvector_exception(message) {}
};

} // namespace cvector
