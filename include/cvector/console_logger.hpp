#pragma once

#include <cvector/logger.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace cvector {

// Console logger for services and examples
// Thread-safe, timestamped records; error and critical go to stderr
class console_logger {
public:
    explicit console_logger(log_level min_level = log_level::info)
        : _min_level(min_level)
        , _mutex(std::make_shared<std::mutex>()) {}

    auto log(log_level level, std::string_view message) -> void {
        log(level, message, {});
    }

    auto log(log_level level, std::string_view message, const log_fields& key_value_pairs) -> void {
        if (level < _min_level) {
            return;
        }

        std::ostringstream record;
        record << format_timestamp() << " "
               << level_to_string(level) << ": "
               << message;
        for (const auto& [key, value] : key_value_pairs) {
            record << " [" << key << "=" << value << "]";
        }
        record << "\n";

        std::lock_guard<std::mutex> lock(*_mutex);
        auto& stream = get_stream(level);
        stream << record.str();
        stream.flush();
    }

    auto trace(std::string_view message, const log_fields& key_value_pairs = {}) -> void {
        log(log_level::trace, message, key_value_pairs);
    }

    auto debug(std::string_view message, const log_fields& key_value_pairs = {}) -> void {
        log(log_level::debug, message, key_value_pairs);
    }

    auto info(std::string_view message, const log_fields& key_value_pairs = {}) -> void {
        log(log_level::info, message, key_value_pairs);
    }

    auto warning(std::string_view message, const log_fields& key_value_pairs = {}) -> void {
        log(log_level::warning, message, key_value_pairs);
    }

    auto error(std::string_view message, const log_fields& key_value_pairs = {}) -> void {
        log(log_level::error, message, key_value_pairs);
    }

    auto critical(std::string_view message, const log_fields& key_value_pairs = {}) -> void {
        log(log_level::critical, message, key_value_pairs);
    }

    auto set_min_level(log_level level) -> void {
        _min_level = level;
    }

    [[nodiscard]] auto get_min_level() const -> log_level {
        return _min_level;
    }

    [[nodiscard]] static auto level_to_string(log_level level) -> std::string_view {
        switch (level) {
            case log_level::trace:    return "TRACE";
            case log_level::debug:    return "DEBUG";
            case log_level::info:     return "INFO";
            case log_level::warning:  return "WARNING";
            case log_level::error:    return "ERROR";
            case log_level::critical: return "CRITICAL";
        }
        return "UNKNOWN";
    }

private:
    log_level _min_level;
    // Shared so copies handed to several contexts interleave whole records
    std::shared_ptr<std::mutex> _mutex;

    [[nodiscard]] auto get_stream(log_level level) const -> std::ostream& {
        if (level >= log_level::error) {
            return std::cerr;
        }
        return std::cout;
    }

    [[nodiscard]] auto format_timestamp() const -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ) % 1000;

        std::tm local_time{};
        localtime_r(&time_t_now, &local_time);

        std::ostringstream oss;
        oss << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }
};

static_assert(diagnostic_logger<console_logger>,
    "console_logger must satisfy diagnostic_logger concept");

} // namespace cvector
