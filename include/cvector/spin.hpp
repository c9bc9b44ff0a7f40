#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>
#include <optional>
#include <ostream>
#include <random>

namespace cvector {

// How coarse the time-derived spin component is
enum class spin_periodicity : std::uint8_t {
    short_term,
    medium_term,
    long_term
};

inline auto operator<<(std::ostream& os, spin_periodicity periodicity) -> std::ostream& {
    switch (periodicity) {
        case spin_periodicity::short_term: return os << "short";
        case spin_periodicity::medium_term: return os << "medium";
        case spin_periodicity::long_term: return os << "long";
        default: return os << "unknown(" << static_cast<int>(periodicity) << ")";
    }
}

// Number of random bytes mixed into a spin
enum class spin_entropy : std::uint8_t {
    none = 0,
    one = 1,
    two = 2,
    three = 3,
    four = 4
};

inline auto operator<<(std::ostream& os, spin_entropy entropy) -> std::ostream& {
    switch (entropy) {
        case spin_entropy::none: return os << "none";
        case spin_entropy::one: return os << "one";
        case spin_entropy::two: return os << "two";
        case spin_entropy::three: return os << "three";
        case spin_entropy::four: return os << "four";
        default: return os << "unknown(" << static_cast<int>(entropy) << ")";
    }
}

struct spin_parameters {
    spin_periodicity _periodicity{spin_periodicity::short_term};
    spin_entropy _entropy{spin_entropy::four};

    constexpr auto periodicity() const -> spin_periodicity { return _periodicity; }
    constexpr auto entropy() const -> spin_entropy { return _entropy; }
};

// Low-order 100ns tick bits discarded before the counter is taken
constexpr auto ticks_to_drop(spin_periodicity periodicity) -> unsigned {
    switch (periodicity) {
        case spin_periodicity::short_term: return 16;
        case spin_periodicity::medium_term: return 20;
        case spin_periodicity::long_term: return 24;
    }
    return 16;
}

// Width of the time-derived component; every periodicity wraps after 2^48 ticks
constexpr auto counter_bits(spin_periodicity periodicity) -> unsigned {
    switch (periodicity) {
        case spin_periodicity::short_term: return 32;
        case spin_periodicity::medium_term: return 28;
        case spin_periodicity::long_term: return 24;
    }
    return 32;
}

constexpr auto entropy_bits(spin_entropy entropy) -> unsigned {
    return static_cast<unsigned>(entropy) * 8;
}

// Components appended by one spin
struct spin_value {
    std::uint32_t _counter;
    std::optional<std::uint32_t> _entropy;

    constexpr auto counter() const -> std::uint32_t { return _counter; }
    constexpr auto entropy() const -> const std::optional<std::uint32_t>& { return _entropy; }
};

// Derive the spin components from a tick count and random bits
constexpr auto compute_spin(std::uint64_t ticks, std::uint32_t random_bits, const spin_parameters& params) -> spin_value {
    auto shifted = ticks >> ticks_to_drop(params.periodicity());
    auto counter_mask = (std::uint64_t{1} << counter_bits(params.periodicity())) - 1;
    auto counter = static_cast<std::uint32_t>(shifted & counter_mask);

    auto random_width = entropy_bits(params.entropy());
    if (random_width == 0) {
        return spin_value{counter, std::nullopt};
    }
    auto entropy = random_width == 32
        ? random_bits
        : random_bits & ((std::uint32_t{1} << random_width) - 1);
    return spin_value{counter, entropy};
}

// Clock feeding spin, in 100ns ticks since the Unix epoch
template<typename T>
concept tick_source = requires(T source) {
    { source.now() } -> std::same_as<std::uint64_t>;
};

// Random bits feeding spin
template<typename T>
concept entropy_source = requires(T source) {
    { source.next() } -> std::same_as<std::uint32_t>;
};

class system_tick_source {
public:
    auto now() -> std::uint64_t {
        auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count();
        return static_cast<std::uint64_t>(nanos) / 100;
    }
};

// Per-thread generator, no state is shared between callers
class thread_entropy_source {
public:
    auto next() -> std::uint32_t {
        static thread_local std::mt19937 gen{std::random_device{}()};
        return static_cast<std::uint32_t>(gen());
    }
};

static_assert(tick_source<system_tick_source>,
    "system_tick_source must satisfy tick_source concept");
static_assert(entropy_source<thread_entropy_source>,
    "thread_entropy_source must satisfy entropy_source concept");

} // namespace cvector
