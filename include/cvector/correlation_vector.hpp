#pragma once

#include <cvector/codec.hpp>
#include <cvector/encoding.hpp>
#include <cvector/exceptions.hpp>
#include <cvector/spin.hpp>
#include <cvector/version.hpp>

#include <boost/random/random_device.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cvector {

// Outcome of a mutation, exhausted means the vector has reached its terminal state
enum class mutation_result : std::uint8_t {
    mutated,
    exhausted
};

inline auto operator<<(std::ostream& os, mutation_result result) -> std::ostream& {
    switch (result) {
        case mutation_result::mutated:
            return os << "mutated";
        case mutation_result::exhausted:
            return os << "exhausted";
        default:
            return os << "unknown(" << static_cast<int>(result) << ")";
    }
}

class correlation_vector;

inline auto parse(std::string_view text) -> correlation_vector;

// Correlation vector: an immutable base followed by a mutable sequence of 32-bit clocks
//
// Extend and increment require exclusive access to the instance. Spin only reads
// process-local clock and entropy, so independent copies can be spun concurrently.
class correlation_vector {
public:
    static constexpr std::uint32_t max_component = std::numeric_limits<std::uint32_t>::max();

    // Create a vector with a fresh random base and no components
    static auto seed(protocol_version version = protocol_version::v2) -> correlation_vector {
        if (version == protocol_version::v1) {
            static thread_local boost::random::random_device device;
            std::array<std::uint8_t, v1_traits.base_entropy_bytes()> bytes{};
            for (std::size_t i = 0; i < bytes.size(); i += 4) {
                auto word = static_cast<std::uint32_t>(device());
                bytes[i] = static_cast<std::uint8_t>(word);
                bytes[i + 1] = static_cast<std::uint8_t>(word >> 8);
                bytes[i + 2] = static_cast<std::uint8_t>(word >> 16);
                bytes[i + 3] = static_cast<std::uint8_t>(word >> 24);
            }
            return correlation_vector{protocol_version::v1, encode_base(bytes), {}, false};
        }

        static thread_local boost::uuids::random_generator generator;
        return from_uuid(generator());
    }

    // Create a v2 vector whose base encodes the given UUID
    static auto from_uuid(const boost::uuids::uuid& id) -> correlation_vector {
        std::span<const std::uint8_t> bytes(id.begin(), id.size());
        return correlation_vector{protocol_version::v2, encode_base(bytes), {}, false};
    }

    // Append a new clock with value 0
    [[nodiscard]] auto extend() -> mutation_result {
        if (_exhausted) {
            return mutation_result::exhausted;
        }
        if (!fits(2)) {
            return exhaust();
        }
        _components.push_back(0);
        _serialized_length += 2;
        return mutation_result::mutated;
    }

    // Advance the latest clock by one, an empty vector gets its first clock at 1
    [[nodiscard]] auto increment() -> mutation_result {
        if (_exhausted) {
            return mutation_result::exhausted;
        }

        if (_components.empty()) {
            if (!fits(2)) {
                return exhaust();
            }
            _components.push_back(1);
            _serialized_length += 2;
            return mutation_result::mutated;
        }

        auto& last = _components.back();
        if (last == max_component) {
            return exhaust();
        }

        auto growth = decimal_length(last + 1) - decimal_length(last);
        if (!fits(growth)) {
            return exhaust();
        }
        ++last;
        _serialized_length += growth;
        return mutation_result::mutated;
    }

    // Append time and entropy derived clocks without coordinating with other holders
    [[nodiscard]] auto spin(const spin_parameters& params = {}) -> mutation_result {
        system_tick_source clock;
        thread_entropy_source entropy;
        return spin(params, clock, entropy);
    }

    template<typename Clock, typename Entropy>
    requires tick_source<Clock> && entropy_source<Entropy>
    [[nodiscard]] auto spin(const spin_parameters& params, Clock& clock, Entropy& entropy) -> mutation_result {
        if (_exhausted) {
            return mutation_result::exhausted;
        }

        auto value = compute_spin(clock.now(), entropy.next(), params);
        auto primary_length = 1 + decimal_length(value.counter());
        auto secondary_length = value.entropy().has_value() ? 1 + decimal_length(*value.entropy()) : 0;
        // Trailing ".0" gives the spun child its own sibling counter
        constexpr std::size_t sibling_length = 2;

        // Space runs out: the sibling counter goes first, then the entropy component
        if (fits(primary_length + secondary_length + sibling_length)) {
            append_spin(value, true, true);
            return mutation_result::mutated;
        }
        if (value.entropy().has_value() && fits(primary_length + secondary_length)) {
            append_spin(value, true, false);
            return mutation_result::mutated;
        }
        if (!fits(primary_length)) {
            return exhaust();
        }
        append_spin(value, false, false);
        return mutation_result::mutated;
    }

    auto version() const -> protocol_version { return _version; }
    auto base() const -> const std::string& { return _base; }
    auto components() const -> const std::vector<std::uint32_t>& { return _components; }
    auto is_exhausted() const -> bool { return _exhausted; }
    auto serialized_length() const -> std::size_t { return _serialized_length; }

    // Room left before the version's length limit
    auto remaining_length() const -> std::size_t {
        return traits_of(_version).max_length() - _serialized_length;
    }

    auto to_string() const -> std::string {
        return encode(_version, _base, _components);
    }

    // Identity covers version, base and components but not the exhausted flag
    friend auto operator==(const correlation_vector& lhs, const correlation_vector& rhs) -> bool {
        return lhs._version == rhs._version
            && lhs._base == rhs._base
            && lhs._components == rhs._components;
    }

    friend auto parse(std::string_view text) -> correlation_vector;

private:
    correlation_vector(
        protocol_version version,
        std::string base,
        std::vector<std::uint32_t> components,
        bool exhausted
    )
        : _version{version}
        , _base{std::move(base)}
        , _components{std::move(components)}
        , _serialized_length{cvector::serialized_length(_base.size(), _components)}
        , _exhausted{exhausted}
    {}

    auto fits(std::size_t extra) const -> bool {
        return _serialized_length + extra <= traits_of(_version).max_length();
    }

    auto append_spin(const spin_value& value, bool with_entropy, bool with_sibling) -> void {
        _components.push_back(value.counter());
        if (with_entropy && value.entropy().has_value()) {
            _components.push_back(*value.entropy());
        }
        if (with_sibling) {
            _components.push_back(0);
        }
        _serialized_length = cvector::serialized_length(_base.size(), _components);
    }

    auto exhaust() -> mutation_result {
        _exhausted = true;
        return mutation_result::exhausted;
    }

    protocol_version _version;
    std::string _base;
    std::vector<std::uint32_t> _components;
    std::size_t _serialized_length;
    bool _exhausted;
};

inline auto operator<<(std::ostream& os, const correlation_vector& vector) -> std::ostream& {
    return os << vector.to_string();
}

// Parse a serialized correlation vector, throws parse_exception on malformed input
inline auto parse(std::string_view text) -> correlation_vector {
    auto decoded = decode(text);
    return correlation_vector{
        decoded.version(),
        std::move(decoded._base),
        std::move(decoded._components),
        decoded.terminated()
    };
}

// Parse for callers that treat an invalid inbound vector as absent
inline auto try_parse(std::string_view text) -> std::optional<correlation_vector> {
    try {
        return parse(text);
    } catch (const parse_exception&) {
        return std::nullopt;
    }
}

inline auto format(const correlation_vector& vector) -> std::string {
    return vector.to_string();
}

} // namespace cvector
