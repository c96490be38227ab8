#pragma once

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cmath>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>

namespace conduit::utils {

    constexpr char char_tolower(char c) {
        if (c >= 'A' && c <= 'Z') {
            return c + ('a' - 'A');
        }
        return c;
    }

    constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
        return std::ranges::equal(
                lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
    }

    constexpr std::string_view trim_view(std::string_view value) {
        auto first = value.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos) {
            return {};
        }
        auto last = value.find_last_not_of(" \t\r\n");
        return value.substr(first, (last - first) + 1U);
    }

    namespace detail {
        template <typename T>
        concept arithmetic_type = std::integral<T> || std::floating_point<T>;
    }

    template <detail::arithmetic_type T>
    constexpr std::optional<T> parse_arithmetic(std::string_view input, [[maybe_unused]] int base = 10) {
        T value{};
        std::from_chars_result result;

        input = trim_view(input);
        if constexpr (std::integral<T>) {
            result = std::from_chars(input.data(), input.data() + input.size(), value, base);
        }
        else {
            result = std::from_chars(input.data(), input.data() + input.size(), value);
        }

        if (input.empty() || result.ec != std::errc{} || result.ptr != input.data() + input.size()) {
            return std::nullopt;
        }

        return {value};
    }

    // Longest duration accepted from config, environment or flags (one year)
    inline constexpr double max_duration_seconds = 365.0 * 24.0 * 60.0 * 60.0;

    // Config and CLI durations are fractional seconds in (0, max_duration_seconds]
    inline std::optional<std::chrono::milliseconds> seconds_to_ms(double seconds) {
        if (!std::isfinite(seconds) || !(seconds > 0.0) || seconds > max_duration_seconds) {
            return std::nullopt;
        }
        return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(seconds * 1000.0)};
    }

    // start + timeout, clamped to time_point::max() instead of overflowing
    inline std::chrono::steady_clock::time_point deadline_after(
            std::chrono::steady_clock::time_point start, std::chrono::milliseconds timeout) {
        using clock = std::chrono::steady_clock;
        if (timeout.count() <= 0) {
            return start;
        }
        auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(clock::time_point::max() - start);
        if (timeout >= headroom) {
            return clock::time_point::max();
        }
        return start + timeout;
    }

    inline double ms_to_seconds(std::chrono::milliseconds ms) {
        return static_cast<double>(ms.count()) / 1000.0;
    }

    inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
        if (values.empty()) {
            return {};
        }
        return values | std::views::join_with(separator) | std::ranges::to<std::string>();
    }

}  // namespace conduit::utils
