#pragma once

#include <cvector/configuration.hpp>
#include <cvector/console_logger.hpp>
#include <cvector/correlation_vector.hpp>
#include <cvector/exceptions.hpp>
#include <cvector/logger.hpp>
#include <cvector/metrics.hpp>

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace cvector {

// Correlation vector of one unit of work inside a service
//
// An inbound vector is adopted and extended, every outbound call gets the
// vector incremented. Spun children are computed on private copies, so callers
// that fan out from several threads never contend on the shared counter.
template<typename Logger = console_logger, typename Metrics = noop_metrics>
requires diagnostic_logger<Logger> && metrics<Metrics>
class correlation_context {
public:
    correlation_context(
        Logger logger,
        Metrics metrics,
        context_configuration config = context_configuration{}
    )
        : _logger{std::move(logger)}
        , _metrics{std::move(metrics)}
        , _config{validated(config)}
        , _vector{new_root(_config.version())}
    {
        _logger.debug("Correlation context created", {
            {"cv", _vector.to_string()}
        });
    }

    correlation_context(const correlation_context&) = delete;
    auto operator=(const correlation_context&) -> correlation_context& = delete;

    // Adopt the vector received from a caller, returns false if a fresh root replaced it
    auto receive(std::string_view inbound) -> bool {
        std::optional<correlation_vector> adopted;
        try {
            adopted = parse(inbound);
        } catch (const parse_exception& e) {
            auto reason = to_string(e.error());
            _logger.warning("Rejected inbound correlation vector", {
                {"reason", reason},
                {"detail", e.what()}
            });

            auto metric = _metrics;
            metric.set_metric_name("cvector.inbound.rejected");
            metric.add_dimension("reason", reason);
            metric.add_one();
            metric.emit();

            if (!_config.reseed_on_invalid()) {
                throw;
            }

            std::lock_guard<std::mutex> lock(_mutex);
            replace_with_root();
            return false;
        }

        if (_config.extend_on_receive() && adopted->extend() == mutation_result::exhausted) {
            report_exhausted("extend", *adopted);
        }

        auto metric = _metrics;
        metric.set_metric_name("cvector.inbound.accepted");
        metric.add_one();
        metric.emit();

        std::lock_guard<std::mutex> lock(_mutex);
        _vector = std::move(*adopted);
        _exhaustion_reported = _vector.is_exhausted();
        if (_vector.is_exhausted() && _config.reseed_on_exhausted()) {
            replace_with_root();
        }
        _logger.debug("Adopted inbound correlation vector", {
            {"cv", _vector.to_string()}
        });
        return true;
    }

    // Serialized vector for the next outbound call
    auto next_outbound() -> std::string {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_vector.increment() == mutation_result::exhausted) {
            if (!_exhaustion_reported) {
                report_exhausted("increment", _vector);
                _exhaustion_reported = true;
            }
            if (_config.reseed_on_exhausted()) {
                replace_with_root();
                // A new root holds only one component, there is room to increment
                static_cast<void>(_vector.increment());
            }
        }
        return _vector.to_string();
    }

    // Serialized spun child of the current vector, the shared vector is untouched
    auto spin_outbound() -> std::string {
        auto child = vector();
        auto before = child.components().size();

        if (child.spin(_config.spin()) == mutation_result::exhausted) {
            report_exhausted("spin", child);
            return child.to_string();
        }

        // A full spin appends counter, entropy (unless disabled) and a sibling 0
        auto full = _config.spin().entropy() == spin_entropy::none ? 2u : 3u;
        if (child.components().size() - before < full) {
            _logger.debug("Spin appended a shortened child", {
                {"cv", child.to_string()}
            });

            auto metric = _metrics;
            metric.set_metric_name("cvector.spin.degraded");
            metric.add_one();
            metric.emit();
        }
        return child.to_string();
    }

    auto current() const -> std::string {
        std::lock_guard<std::mutex> lock(_mutex);
        return _vector.to_string();
    }

    auto vector() const -> correlation_vector {
        std::lock_guard<std::mutex> lock(_mutex);
        return _vector;
    }

    auto config() const -> const context_configuration& {
        return _config;
    }

private:
    static auto validated(const context_configuration& config) -> const context_configuration& {
        validate_configuration(config);
        return config;
    }

    static auto new_root(protocol_version version) -> correlation_vector {
        auto root = correlation_vector::seed(version);
        // A bare base is far below either length limit
        static_cast<void>(root.extend());
        return root;
    }

    // Caller holds _mutex
    auto replace_with_root() -> void {
        _vector = new_root(_config.version());
        _exhaustion_reported = false;
        _logger.info("Started new root correlation vector", {
            {"cv", _vector.to_string()}
        });
    }

    auto report_exhausted(std::string_view operation, const correlation_vector& vector) -> void {
        _logger.warning("Correlation vector exhausted", {
            {"operation", operation},
            {"cv", vector.to_string()}
        });

        auto metric = _metrics;
        metric.set_metric_name("cvector.exhausted");
        metric.add_dimension("operation", operation);
        metric.add_one();
        metric.emit();
    }

    Logger _logger;
    Metrics _metrics;
    context_configuration _config;
    mutable std::mutex _mutex;
    correlation_vector _vector;
    bool _exhaustion_reported{false};
};

} // namespace cvector
