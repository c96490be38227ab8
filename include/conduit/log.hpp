#pragma once

#include "utils.hpp"

#include <cstdint>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace conduit {

    using namespace std::string_view_literals;

    enum class log_level : uint8_t { debug, info, warning, error, off };

    inline constexpr std::string_view to_string(log_level level) {
        switch (level) {
            case log_level::debug:
                return "debug"sv;
            case log_level::info:
                return "info"sv;
            case log_level::warning:
                return "warning"sv;
            case log_level::error:
                return "error"sv;
            case log_level::off:
                return "off"sv;
        }
        return "warning"sv;
    }

    inline constexpr bool try_parse_log_level(std::string_view text, log_level& out) {
        if (utils::str_case_eq(text, "debug"sv) || utils::str_case_eq(text, "trace"sv)) {
            out = log_level::debug;
            return true;
        }
        if (utils::str_case_eq(text, "info"sv)) {
            out = log_level::info;
            return true;
        }
        if (utils::str_case_eq(text, "warning"sv) || utils::str_case_eq(text, "warn"sv)) {
            out = log_level::warning;
            return true;
        }
        if (utils::str_case_eq(text, "error"sv) || utils::str_case_eq(text, "critical"sv)) {
            out = log_level::error;
            return true;
        }
        if (utils::str_case_eq(text, "off"sv) || utils::str_case_eq(text, "none"sv)) {
            out = log_level::off;
            return true;
        }
        return false;
    }

    void set_log_threshold(log_level level);
    log_level log_threshold();

    inline bool log_enabled(log_level level) {
        return level != log_level::off && level >= log_threshold();
    }

    namespace detail {
        constexpr std::string_view sloc_fname(const std::source_location& loc) {
            std::string_view sv{loc.file_name()};
            if (auto p = sv.rfind('/'); p != sv.npos)
                sv.remove_prefix(p + 1);
            return sv;
        }

        // Serializes whole lines so concurrent pumps and callers don't interleave
        void write_log_line(log_level level, const std::source_location& loc, std::string_view message);

        template <typename... Args>
        void emit(log_level level, const std::source_location& loc, Args&&... args) {
            if (!log_enabled(level)) {
                return;
            }
            std::ostringstream os{};
            (os << ... << std::forward<Args>(args));
            write_log_line(level, loc, os.view());
        }
    }  // namespace detail

    template <typename... Args>
    struct log_debug {
        explicit log_debug(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::emit(log_level::debug, loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct log_info {
        explicit log_info(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::emit(log_level::info, loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct log_warn {
        explicit log_warn(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::emit(log_level::warning, loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct log_error {
        explicit log_error(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::emit(log_level::error, loc, std::forward<Args>(args)...);
        }
    };

    // deduction guides
    template <typename... Args>
    log_debug(Args&&...) -> log_debug<Args...>;
    template <typename... Args>
    log_info(Args&&...) -> log_info<Args...>;
    template <typename... Args>
    log_warn(Args&&...) -> log_warn<Args...>;
    template <typename... Args>
    log_error(Args&&...) -> log_error<Args...>;

}  // namespace conduit
