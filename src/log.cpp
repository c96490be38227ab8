#include "conduit/log.hpp"

#include <atomic>
#include <chrono>
#include <format>
#include <iostream>
#include <mutex>

namespace conduit {

    namespace detail {
        static std::atomic<log_level> threshold{log_level::warning};
        static std::mutex sink_mutex{};

        void write_log_line(log_level level, const std::source_location& loc, std::string_view message) {
            auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());

            std::lock_guard lock{sink_mutex};
            std::cerr << std::format("{:%H:%M:%S} {:<7} ", now, to_string(level));
            if (level == log_level::debug) {
                std::cerr << '[' << sloc_fname(loc) << ':' << loc.line() << "] ";
            }
            std::cerr << message << '\n';
        }
    }  // namespace detail

    void set_log_threshold(log_level level) {
        detail::threshold.store(level, std::memory_order_relaxed);
    }

    log_level log_threshold() {
        return detail::threshold.load(std::memory_order_relaxed);
    }

}  // namespace conduit
