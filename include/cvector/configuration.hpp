#pragma once

#include <cvector/exceptions.hpp>
#include <cvector/spin.hpp>
#include <cvector/version.hpp>

#include <string>
#include <string_view>

namespace cvector {

// Settings of a correlation_context
struct context_configuration {
    protocol_version _version{protocol_version::v2};
    spin_parameters _spin{};
    bool _extend_on_receive{true};
    bool _reseed_on_invalid{true};
    bool _reseed_on_exhausted{false};

    auto version() const -> protocol_version { return _version; }
    auto spin() const -> const spin_parameters& { return _spin; }
    auto extend_on_receive() const -> bool { return _extend_on_receive; }
    auto reseed_on_invalid() const -> bool { return _reseed_on_invalid; }
    auto reseed_on_exhausted() const -> bool { return _reseed_on_exhausted; }
};

inline auto validate_spin_parameters(const spin_parameters& params) -> void {
    switch (params.periodicity()) {
        case spin_periodicity::short_term:
        case spin_periodicity::medium_term:
        case spin_periodicity::long_term:
            break;
        default:
            throw configuration_exception(
                "Unknown spin periodicity " + std::to_string(static_cast<int>(params.periodicity())));
    }

    if (static_cast<int>(params.entropy()) > static_cast<int>(spin_entropy::four)) {
        throw configuration_exception(
            "Spin entropy must not exceed 4 bytes, got " + std::to_string(static_cast<int>(params.entropy())));
    }
}

inline auto validate_configuration(const context_configuration& config) -> void {
    if (!is_known_version(config.version())) {
        throw configuration_exception(
            "Unknown protocol version " + std::to_string(static_cast<int>(config.version())));
    }

    validate_spin_parameters(config.spin());
}

// Textual names accepted in settings files and command lines

inline auto parse_protocol_version(std::string_view name) -> protocol_version {
    if (name == "v1") {
        return protocol_version::v1;
    }
    if (name == "v2") {
        return protocol_version::v2;
    }
    throw configuration_exception("Unknown protocol version '" + std::string(name) + "' (expected v1 or v2)");
}

inline auto parse_spin_periodicity(std::string_view name) -> spin_periodicity {
    if (name == "short") {
        return spin_periodicity::short_term;
    }
    if (name == "medium") {
        return spin_periodicity::medium_term;
    }
    if (name == "long") {
        return spin_periodicity::long_term;
    }
    throw configuration_exception("Unknown spin periodicity '" + std::string(name) + "' (expected short, medium or long)");
}

inline auto parse_spin_entropy(std::string_view name) -> spin_entropy {
    if (name == "none") {
        return spin_entropy::none;
    }
    if (name == "one") {
        return spin_entropy::one;
    }
    if (name == "two") {
        return spin_entropy::two;
    }
    if (name == "three") {
        return spin_entropy::three;
    }
    if (name == "four") {
        return spin_entropy::four;
    }
    throw configuration_exception("Unknown spin entropy '" + std::string(name) + "' (expected none, one, two, three or four)");
}

} // namespace cvector
