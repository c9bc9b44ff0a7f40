/**
 * Example: Propagating a Correlation Vector Across Services
 *
 * A gateway starts a root vector and calls two backends, one of which
 * fans out to a store. Each hop adopts the inbound vector through its own
 * correlation_context, so the printed chain shows the causal tree.
 *
 * Usage: service_propagation [v1|v2] [short|medium|long] [none|one|two|three|four]
 */

#include <cvector/cvector.hpp>

#include <iostream>
#include <string>
#include <string_view>
#include <utility>

namespace {
    constexpr const char* garbage_header = "not-a-correlation-vector";
}

using service_context = cvector::default_correlation_context;

// A backend handling one inbound request
class service {
public:
    service(std::string name, cvector::console_logger logger, const cvector::context_configuration& config)
        : _name(std::move(name))
        , _context(std::move(logger), cvector::noop_metrics{}, config) {}

    auto handle(std::string_view inbound) -> std::string {
        auto adopted = _context.receive(inbound);
        std::cout << "  " << _name << " received " << inbound
                  << (adopted ? "" : " (rejected)") << ", working as " << _context.current() << "\n";
        return _context.current();
    }

    auto call_out() -> std::string {
        auto outbound = _context.next_outbound();
        std::cout << "  " << _name << " calls out with " << outbound << "\n";
        return outbound;
    }

    auto fire_and_forget() -> std::string {
        auto outbound = _context.spin_outbound();
        std::cout << "  " << _name << " spins " << outbound << "\n";
        return outbound;
    }

private:
    std::string _name;
    service_context _context;
};

auto configuration_from(int argc, char* argv[]) -> cvector::context_configuration {
    cvector::context_configuration config;
    if (argc > 1) {
        config._version = cvector::parse_protocol_version(argv[1]);
    }
    if (argc > 2) {
        config._spin._periodicity = cvector::parse_spin_periodicity(argv[2]);
    }
    if (argc > 3) {
        config._spin._entropy = cvector::parse_spin_entropy(argv[3]);
    }
    cvector::validate_configuration(config);
    return config;
}

auto main(int argc, char* argv[]) -> int {
    try {
        auto config = configuration_from(argc, argv);
        cvector::console_logger logger(cvector::log_level::info);

        std::cout << "Protocol " << config.version() << ", spin " << config.spin().periodicity()
                  << "/" << config.spin().entropy() << "\n\n";

        service gateway("gateway", logger, config);
        service orders("orders", logger, config);
        service billing("billing", logger, config);
        service store("store", logger, config);

        std::cout << "Request 1\n";
        orders.handle(gateway.call_out());
        store.handle(orders.call_out());
        store.handle(orders.call_out());
        billing.handle(gateway.call_out());
        store.handle(billing.fire_and_forget());

        std::cout << "\nRequest 2 with a corrupted header\n";
        billing.handle(garbage_header);
        store.handle(billing.call_out());

        return 0;
    } catch (const cvector::cvector_exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
