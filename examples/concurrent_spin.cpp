/**
 * Example: Spinning Children From a Thread Pool
 *
 * Many workers derive children of one parent at once. Spin needs no shared
 * counter, so the workers never synchronize; the example counts how many
 * distinct children came back.
 */

#include <cvector/cvector.hpp>

#include <folly/executors/CPUThreadPoolExecutor.h>
#include <folly/futures/Future.h>
#include <folly/init/Init.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

namespace {
    constexpr std::size_t worker_threads = 4;
    constexpr std::size_t jobs = 1000;
}

auto main(int argc, char* argv[]) -> int {
    folly::Init init(&argc, &argv);

    auto parent = cvector::correlation_vector::seed();
    static_cast<void>(parent.extend());
    std::cout << "Parent: " << parent << "\n";

    folly::CPUThreadPoolExecutor executor(worker_threads);
    cvector::spin_parameters params{cvector::spin_periodicity::short_term, cvector::spin_entropy::four};

    std::vector<folly::Future<std::string>> futures;
    futures.reserve(jobs);
    for (std::size_t i = 0; i < jobs; ++i) {
        futures.push_back(folly::via(&executor, [parent, params]() {
            auto child = parent;
            if (child.spin(params) == cvector::mutation_result::exhausted) {
                throw std::runtime_error("Parent has no room for a spin");
            }
            return child.to_string();
        }));
    }

    auto results = folly::collectAll(futures).get();

    std::unordered_set<std::string> distinct;
    std::size_t errors = 0;
    for (const auto& result : results) {
        if (result.hasException()) {
            ++errors;
            continue;
        }
        distinct.insert(result.value());
    }

    std::cout << "Spun " << jobs << " children, " << distinct.size() << " distinct, "
              << errors << " errors\n";
    if (!distinct.empty()) {
        std::cout << "Sample child: " << *distinct.begin() << "\n";
    }
    return errors == 0 ? 0 : 1;
}
