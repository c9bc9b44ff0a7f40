#define BOOST_TEST_MODULE SpinPropertyTest
#include <boost/test/unit_test.hpp>

#include <cvector/correlation_vector.hpp>
#include <cvector/spin.hpp>

#include <boost/uuid/string_generator.hpp>

#include <cstdint>
#include <random>
#include <string>
#include <unordered_set>
#include <vector>

namespace {
    constexpr std::uint64_t sample_ticks = 0x0123456789ABCDEFull;
    constexpr std::uint32_t sample_random_bits = 0xDEADBEEFu;
    constexpr std::size_t independent_callers = 10'000;
    constexpr std::size_t ordering_samples = 1'000;
    constexpr const char* v1_base = "AAAAAAAAAAAAAAAA";
    constexpr const char* parent_uuid = "737c4443-38ea-4659-abef-3710c7db0189";
}

// Clock frozen at one tick
class fixed_tick_source {
public:
    explicit fixed_tick_source(std::uint64_t ticks) : _ticks(ticks) {}
    auto now() -> std::uint64_t { return _ticks; }

private:
    std::uint64_t _ticks;
};

// Clock moving forward by a random step on every read
class advancing_tick_source {
public:
    advancing_tick_source(std::uint64_t start, std::mt19937& rng) : _ticks(start), _rng(rng) {}

    auto now() -> std::uint64_t {
        std::uniform_int_distribution<std::uint64_t> step_dist(1, 1u << 20);
        _ticks += step_dist(_rng);
        return _ticks;
    }

private:
    std::uint64_t _ticks;
    std::mt19937& _rng;
};

class fixed_entropy_source {
public:
    explicit fixed_entropy_source(std::uint32_t value) : _value(value) {}
    auto next() -> std::uint32_t { return _value; }

private:
    std::uint32_t _value;
};

// Entropy of one independent caller, seeded on its own
class caller_entropy_source {
public:
    caller_entropy_source() : _gen(std::random_device{}()) {}
    auto next() -> std::uint32_t { return static_cast<std::uint32_t>(_gen()); }

private:
    std::mt19937 _gen;
};

static_assert(cvector::tick_source<fixed_tick_source>);
static_assert(cvector::tick_source<advancing_tick_source>);
static_assert(cvector::entropy_source<fixed_entropy_source>);
static_assert(cvector::entropy_source<caller_entropy_source>);

static_assert(cvector::compute_spin(sample_ticks, sample_random_bits, cvector::spin_parameters{}).counter() == 0x456789ABu);
static_assert(*cvector::compute_spin(sample_ticks, sample_random_bits, cvector::spin_parameters{}).entropy() == sample_random_bits);
static_assert(!cvector::compute_spin(sample_ticks, sample_random_bits,
    cvector::spin_parameters{cvector::spin_periodicity::long_term, cvector::spin_entropy::none}).entropy().has_value());

auto spun_parent() -> cvector::correlation_vector {
    auto parent = cvector::correlation_vector::from_uuid(boost::uuids::string_generator{}(parent_uuid));
    static_cast<void>(parent.extend());
    return parent;
}

BOOST_AUTO_TEST_SUITE(compute_spin_tests)

BOOST_AUTO_TEST_CASE(test_periodicity_selects_shift_and_width) {
    cvector::spin_parameters params{cvector::spin_periodicity::short_term, cvector::spin_entropy::none};
    BOOST_CHECK_EQUAL(cvector::compute_spin(sample_ticks, sample_random_bits, params).counter(), 0x456789ABu);

    params._periodicity = cvector::spin_periodicity::medium_term;
    BOOST_CHECK_EQUAL(cvector::compute_spin(sample_ticks, sample_random_bits, params).counter(), 0x0456789Au);

    params._periodicity = cvector::spin_periodicity::long_term;
    BOOST_CHECK_EQUAL(cvector::compute_spin(sample_ticks, sample_random_bits, params).counter(), 0x00456789u);
}

BOOST_AUTO_TEST_CASE(test_entropy_width) {
    cvector::spin_parameters params{cvector::spin_periodicity::short_term, cvector::spin_entropy::none};
    BOOST_CHECK(!cvector::compute_spin(sample_ticks, sample_random_bits, params).entropy().has_value());

    params._entropy = cvector::spin_entropy::one;
    BOOST_CHECK_EQUAL(*cvector::compute_spin(sample_ticks, sample_random_bits, params).entropy(), 0xEFu);

    params._entropy = cvector::spin_entropy::two;
    BOOST_CHECK_EQUAL(*cvector::compute_spin(sample_ticks, sample_random_bits, params).entropy(), 0xBEEFu);

    params._entropy = cvector::spin_entropy::three;
    BOOST_CHECK_EQUAL(*cvector::compute_spin(sample_ticks, sample_random_bits, params).entropy(), 0xADBEEFu);

    params._entropy = cvector::spin_entropy::four;
    BOOST_CHECK_EQUAL(*cvector::compute_spin(sample_ticks, sample_random_bits, params).entropy(), 0xDEADBEEFu);
}

BOOST_AUTO_TEST_CASE(test_default_parameters) {
    cvector::spin_parameters params;
    BOOST_CHECK_EQUAL(params.periodicity(), cvector::spin_periodicity::short_term);
    BOOST_CHECK_EQUAL(params.entropy(), cvector::spin_entropy::four);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(spin_mutation_tests)

BOOST_AUTO_TEST_CASE(test_spin_appends_counter_entropy_and_sibling) {
    auto vector = spun_parent();
    fixed_tick_source clock(sample_ticks);
    fixed_entropy_source entropy(sample_random_bits);
    cvector::spin_parameters params{cvector::spin_periodicity::short_term, cvector::spin_entropy::two};

    BOOST_CHECK_EQUAL(vector.spin(params, clock, entropy), cvector::mutation_result::mutated);
    BOOST_CHECK_EQUAL(vector.to_string(), "c3xEQzjqRlmr7zcQx9sBiQ.0.1164413355.48879.0");
}

BOOST_AUTO_TEST_CASE(test_spin_without_entropy_appends_counter_and_sibling) {
    auto vector = spun_parent();
    fixed_tick_source clock(sample_ticks);
    fixed_entropy_source entropy(sample_random_bits);
    cvector::spin_parameters params{cvector::spin_periodicity::long_term, cvector::spin_entropy::none};

    BOOST_CHECK_EQUAL(vector.spin(params, clock, entropy), cvector::mutation_result::mutated);
    BOOST_CHECK_EQUAL(vector.to_string(), "c3xEQzjqRlmr7zcQx9sBiQ.0.4548489.0");
}

// Incrementing a spun child moves its own sibling counter, never the entropy component
BOOST_AUTO_TEST_CASE(test_increment_after_spin_keeps_children_apart) {
    fixed_tick_source clock(sample_ticks);
    cvector::spin_parameters params{cvector::spin_periodicity::short_term, cvector::spin_entropy::two};

    auto first = spun_parent();
    fixed_entropy_source first_entropy(100);
    BOOST_REQUIRE_EQUAL(first.spin(params, clock, first_entropy), cvector::mutation_result::mutated);
    BOOST_REQUIRE_EQUAL(first.increment(), cvector::mutation_result::mutated);

    auto second = spun_parent();
    fixed_entropy_source second_entropy(101);
    BOOST_REQUIRE_EQUAL(second.spin(params, clock, second_entropy), cvector::mutation_result::mutated);

    BOOST_CHECK_EQUAL(first.to_string(), "c3xEQzjqRlmr7zcQx9sBiQ.0.1164413355.100.1");
    BOOST_CHECK_EQUAL(second.to_string(), "c3xEQzjqRlmr7zcQx9sBiQ.0.1164413355.101.0");
    BOOST_CHECK(!(first == second));
}

BOOST_AUTO_TEST_CASE(test_spin_drops_sibling_before_entropy) {
    // 55 bytes: room for ".7.48879" but not ".7.48879.0"
    auto text = std::string(v1_base) + std::string(".0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0") + ".10";
    BOOST_REQUIRE_EQUAL(text.size(), 55u);
    auto vector = cvector::parse(text);

    fixed_tick_source clock(std::uint64_t{7} << 16);
    fixed_entropy_source entropy(sample_random_bits);
    cvector::spin_parameters params{cvector::spin_periodicity::short_term, cvector::spin_entropy::two};

    BOOST_CHECK_EQUAL(vector.spin(params, clock, entropy), cvector::mutation_result::mutated);
    BOOST_CHECK_EQUAL(vector.to_string(), text + ".7.48879");
}

BOOST_AUTO_TEST_CASE(test_spin_drops_entropy_before_exhausting) {
    // 61 bytes: room for ".7" but not ".7.48879"
    auto text = std::string(v1_base) + std::string(".0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0") + ".10";
    BOOST_REQUIRE_EQUAL(text.size(), 61u);
    auto vector = cvector::parse(text);

    fixed_tick_source clock(std::uint64_t{7} << 16);
    fixed_entropy_source entropy(sample_random_bits);
    cvector::spin_parameters params{cvector::spin_periodicity::short_term, cvector::spin_entropy::two};

    BOOST_CHECK_EQUAL(vector.spin(params, clock, entropy), cvector::mutation_result::mutated);
    BOOST_CHECK_EQUAL(vector.to_string(), text + ".7");
    BOOST_CHECK(!vector.is_exhausted());

    BOOST_CHECK_EQUAL(vector.spin(params, clock, entropy), cvector::mutation_result::exhausted);
    BOOST_CHECK_EQUAL(vector.to_string(), text + ".7");
    BOOST_CHECK(vector.is_exhausted());
}

BOOST_AUTO_TEST_CASE(test_repeated_spin_stops_at_limit) {
    auto vector = cvector::correlation_vector::seed();
    auto result = cvector::mutation_result::mutated;
    for (int i = 0; i < 128; ++i) {
        result = vector.spin();
    }
    BOOST_CHECK_EQUAL(result, cvector::mutation_result::exhausted);
    BOOST_CHECK(vector.is_exhausted());
    BOOST_CHECK_LE(vector.to_string().size(), 127u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(spin_property_tests)

/**
 * Property: spinning one parent from many independent callers, each with
 * its own entropy and no shared state, yields distinct vectors.
 *
 * Every caller lands on the same tick here, the worst case. With four bytes
 * of entropy the chance of even one collision among 10 000 callers is about
 * 1.2%, the chance of two is below 1e-4, so a single collision is tolerated.
 */
BOOST_AUTO_TEST_CASE(property_independent_spins_are_distinct, * boost::unit_test::timeout(120)) {
    auto parent = spun_parent();
    cvector::spin_parameters params{cvector::spin_periodicity::short_term, cvector::spin_entropy::four};
    fixed_tick_source clock(sample_ticks);

    std::unordered_set<std::string> spun;
    std::size_t failures = 0;

    for (std::size_t i = 0; i < independent_callers; ++i) {
        auto child = parent;
        caller_entropy_source entropy;
        if (child.spin(params, clock, entropy) != cvector::mutation_result::mutated) {
            ++failures;
            continue;
        }
        spun.insert(child.to_string());
    }

    BOOST_TEST_MESSAGE("Distinct spins: " << spun.size() << "/" << independent_callers);
    BOOST_CHECK_EQUAL(failures, 0u);
    BOOST_CHECK_GE(spun.size() + 1, independent_callers);
}

/**
 * Property: the same holds with default parameters on one shared tick.
 */
BOOST_AUTO_TEST_CASE(property_default_spins_are_distinct, * boost::unit_test::timeout(120)) {
    auto parent = spun_parent();
    cvector::spin_parameters params;
    fixed_tick_source clock(sample_ticks);

    std::unordered_set<std::string> spun;
    for (std::size_t i = 0; i < independent_callers; ++i) {
        auto child = parent;
        caller_entropy_source entropy;
        BOOST_REQUIRE_EQUAL(child.spin(params, clock, entropy), cvector::mutation_result::mutated);
        spun.insert(child.to_string());
    }

    BOOST_TEST_MESSAGE("Distinct default spins: " << spun.size() << "/" << independent_callers);
    BOOST_CHECK_GE(spun.size() + 1, independent_callers);
}

/**
 * Property: spun children and their incremented successors never coincide
 * with another caller's spin on the same tick.
 */
BOOST_AUTO_TEST_CASE(property_incremented_children_stay_distinct, * boost::unit_test::timeout(120)) {
    auto parent = spun_parent();
    cvector::spin_parameters params{cvector::spin_periodicity::short_term, cvector::spin_entropy::one};
    fixed_tick_source clock(sample_ticks);

    // One byte of entropy: every value gets spun, then incremented a few times
    std::unordered_set<std::string> spun;
    std::unordered_set<std::string> incremented;
    for (std::uint32_t value = 0; value < 256; ++value) {
        auto child = parent;
        fixed_entropy_source entropy(value);
        BOOST_REQUIRE_EQUAL(child.spin(params, clock, entropy), cvector::mutation_result::mutated);
        spun.insert(child.to_string());
        for (int i = 0; i < 3; ++i) {
            BOOST_REQUIRE_EQUAL(child.increment(), cvector::mutation_result::mutated);
            incremented.insert(child.to_string());
        }
    }

    std::size_t overlaps = 0;
    for (const auto& text : incremented) {
        if (spun.count(text) != 0) {
            ++overlaps;
        }
    }
    BOOST_CHECK_EQUAL(spun.size(), 256u);
    BOOST_CHECK_EQUAL(incremented.size(), 256u * 3);
    BOOST_CHECK_EQUAL(overlaps, 0u);
}

/**
 * Property: the same holds when the real clock and per-thread entropy are used.
 */
BOOST_AUTO_TEST_CASE(property_system_spins_are_distinct, * boost::unit_test::timeout(120)) {
    auto parent = spun_parent();
    cvector::spin_parameters params{cvector::spin_periodicity::short_term, cvector::spin_entropy::four};

    std::unordered_set<std::string> spun;
    for (std::size_t i = 0; i < independent_callers; ++i) {
        auto child = parent;
        BOOST_REQUIRE_EQUAL(child.spin(params), cvector::mutation_result::mutated);
        spun.insert(child.to_string());
    }

    BOOST_CHECK_GE(spun.size() + 1, independent_callers);
}

/**
 * Property: for strictly increasing timestamps the primary (time derived)
 * component never decreases, whatever the entropy says.
 */
BOOST_AUTO_TEST_CASE(property_spin_follows_time_order, * boost::unit_test::timeout(60)) {
    std::mt19937 rng(std::random_device{}());
    auto parent = spun_parent();
    auto primary_index = parent.components().size();

    for (auto periodicity : {cvector::spin_periodicity::short_term,
                             cvector::spin_periodicity::medium_term,
                             cvector::spin_periodicity::long_term}) {
        cvector::spin_parameters params{periodicity, cvector::spin_entropy::two};
        // Far from the 2^48 tick wrap
        advancing_tick_source clock(std::uint64_t{1} << 40, rng);
        caller_entropy_source entropy;

        std::vector<std::uint32_t> primaries;
        for (std::size_t i = 0; i < ordering_samples; ++i) {
            auto child = parent;
            BOOST_REQUIRE_EQUAL(child.spin(params, clock, entropy), cvector::mutation_result::mutated);
            primaries.push_back(child.components().at(primary_index));
        }

        std::size_t inversions = 0;
        for (std::size_t i = 1; i < primaries.size(); ++i) {
            if (primaries[i] < primaries[i - 1]) {
                ++inversions;
            }
        }
        BOOST_TEST_MESSAGE("Periodicity " << periodicity << ": " << inversions << " inversions");
        BOOST_CHECK_EQUAL(inversions, 0u);
    }
}

BOOST_AUTO_TEST_SUITE_END()
