#pragma once

#include <concepts>
#include <string_view>

namespace cvector {

// Metrics concept for counting protocol events
template<typename M>
concept metrics = requires(
    M metric,
    std::string_view name,
    std::string_view dimension_name,
    std::string_view dimension_value
) {
    { metric.set_metric_name(name) } -> std::same_as<void>;
    { metric.add_dimension(dimension_name, dimension_value) } -> std::same_as<void>;

    { metric.add_one() } -> std::same_as<void>;

    { metric.emit() } -> std::same_as<void>;
};

// Default metrics sink, every call compiles away
class noop_metrics {
public:
    auto set_metric_name([[maybe_unused]] std::string_view name) -> void {}

    auto add_dimension(
        [[maybe_unused]] std::string_view dimension_name,
        [[maybe_unused]] std::string_view dimension_value
    ) -> void {}

    auto add_one() -> void {}

    auto emit() -> void {}
};

static_assert(metrics<noop_metrics>, "noop_metrics must satisfy metrics concept");

} // namespace cvector
