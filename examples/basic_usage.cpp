/**
 * Example: Correlation Vector Basics
 *
 * This example demonstrates:
 * 1. Seeding V1 and V2 vectors
 * 2. Extending and incrementing as calls fan out
 * 3. Spinning a child without touching the parent
 * 4. Parsing inbound strings and handling rejections
 * 5. Running a vector into its length limit
 */

#include <cvector/cvector.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace {
    constexpr const char* inbound_valid = "c3xEQzjqRlmr7zcQx9sBiQ.4.2";
    constexpr const char* inbound_terminated = "c3xEQzjqRlmr7zcQx9sBiQ.4.2!";
}

auto demonstrate_propagation() -> bool {
    std::cout << "Scenario 1: Seed, extend, increment\n";

    try {
        auto vector = cvector::correlation_vector::seed();
        std::cout << "  Seeded:      " << vector << " (" << vector.version() << ")\n";

        if (vector.extend() != cvector::mutation_result::mutated) {
            std::cerr << "  ✗ Extend of a fresh vector was refused\n";
            return false;
        }
        std::cout << "  Extended:    " << vector << "\n";

        for (int call = 0; call < 3; ++call) {
            if (vector.increment() != cvector::mutation_result::mutated) {
                std::cerr << "  ✗ Increment was refused\n";
                return false;
            }
            std::cout << "  Outbound #" << call + 1 << ": " << vector << "\n";
        }

        auto v1 = cvector::correlation_vector::seed(cvector::protocol_version::v1);
        std::cout << "  V1 seed:     " << v1 << " (" << v1.remaining_length() << " bytes left)\n";

        std::cout << "  ✓ Scenario passed\n\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "  ✗ Scenario failed: " << e.what() << "\n";
        return false;
    }
}

auto demonstrate_spin() -> bool {
    std::cout << "Scenario 2: Spin\n";

    try {
        auto parent = cvector::correlation_vector::seed();
        static_cast<void>(parent.extend());

        for (auto entropy : {cvector::spin_entropy::none, cvector::spin_entropy::two, cvector::spin_entropy::four}) {
            auto child = parent;
            cvector::spin_parameters params{cvector::spin_periodicity::short_term, entropy};
            if (child.spin(params) != cvector::mutation_result::mutated) {
                std::cerr << "  ✗ Spin was refused\n";
                return false;
            }
            std::cout << "  entropy " << entropy << ": " << child << "\n";
        }
        std::cout << "  Parent unchanged: " << parent << "\n";

        std::cout << "  ✓ Scenario passed\n\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "  ✗ Scenario failed: " << e.what() << "\n";
        return false;
    }
}

auto demonstrate_parsing() -> bool {
    std::cout << "Scenario 3: Parsing inbound strings\n";

    try {
        auto vector = cvector::parse(inbound_valid);
        std::cout << "  Parsed " << inbound_valid << " into " << vector.components().size() << " components\n";

        auto terminated = cvector::parse(inbound_terminated);
        std::cout << "  Parsed " << inbound_terminated << ", exhausted: " << std::boolalpha
                  << terminated.is_exhausted() << "\n";

        std::vector<std::string> rejected{"short.0", "c3xEQzjqRlmr7zcQx9sBiQ.01", "c3xEQzjqRlmr7zcQx9sBiQ."};
        for (const auto& text : rejected) {
            try {
                static_cast<void>(cvector::parse(text));
                std::cerr << "  ✗ " << text << " should have been rejected\n";
                return false;
            } catch (const cvector::parse_exception& e) {
                std::cout << "  Rejected " << text << ": " << e.error() << "\n";
            }
        }

        std::cout << "  ✓ Scenario passed\n\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "  ✗ Scenario failed: " << e.what() << "\n";
        return false;
    }
}

auto demonstrate_exhaustion() -> bool {
    std::cout << "Scenario 4: Exhaustion\n";

    try {
        auto vector = cvector::correlation_vector::seed(cvector::protocol_version::v1);
        std::size_t extends = 0;
        while (vector.extend() == cvector::mutation_result::mutated) {
            ++extends;
        }
        std::cout << "  " << extends << " extends until " << vector.serialized_length() << " bytes\n";
        std::cout << "  Final vector: " << vector << "\n";

        if (!vector.is_exhausted() || vector.increment() != cvector::mutation_result::exhausted) {
            std::cerr << "  ✗ Exhausted vector accepted another mutation\n";
            return false;
        }

        std::cout << "  ✓ Scenario passed\n\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "  ✗ Scenario failed: " << e.what() << "\n";
        return false;
    }
}

auto main() -> int {
    std::cout << std::string(60, '=') << "\n";
    std::cout << "  Correlation Vector Basics\n";
    std::cout << std::string(60, '=') << "\n\n";

    int failed_scenarios = 0;

    if (!demonstrate_propagation()) failed_scenarios++;
    if (!demonstrate_spin()) failed_scenarios++;
    if (!demonstrate_parsing()) failed_scenarios++;
    if (!demonstrate_exhaustion()) failed_scenarios++;

    std::cout << std::string(60, '=') << "\n";
    if (failed_scenarios > 0) {
        std::cout << "  " << failed_scenarios << " scenario(s) failed\n";
        return 1;
    }
    std::cout << "  All scenarios passed!\n";
    return 0;
}
