#pragma once

extern "C" {
#include <uuid/uuid.h>
}

#include <glaze/base64/base64.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdint>
#include <format>
#include <iostream>
#include <optional>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace termctl {

// Debug logger; no-op on release builds
#ifndef NDEBUG
    constexpr std::string_view sloc_fname(const std::source_location& loc) {
        std::string_view sv{loc.file_name()};
        if (auto p = sv.rfind('/'); p != sv.npos)
            sv.remove_prefix(p + 1);
        return sv;
    }

    inline void prepend_location(std::ostream& os, const std::source_location& loc) {
        os << '[' << sloc_fname(loc) << ':' << loc.line() << "] ";
    }

    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            prepend_location(std::cerr, loc);
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }
    };
#else
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(Args&&...) {}
    };
#endif

    // deduction guide
    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;

    // Runtime log; stdout carries the protocol so everything goes to stderr
    enum class log_level : uint8_t { quiet, normal, verbose };

    namespace detail {
        inline log_level& active_log_level() {
            static log_level level{log_level::normal};
            return level;
        }
    }  // namespace detail

    inline void set_log_level(log_level level) {
        detail::active_log_level() = level;
    }

    inline log_level get_log_level() {
        return detail::active_log_level();
    }

    template <typename... T>
    void log_info(std::format_string<T...> fmt, T&&... args) {
        if (get_log_level() == log_level::quiet) {
            return;
        }
        std::cerr << "termctl: " << std::format(fmt, std::forward<T>(args)...) << '\n';
    }

    template <typename... T>
    void log_verbose(std::format_string<T...> fmt, T&&... args) {
        if (get_log_level() != log_level::verbose) {
            return;
        }
        std::cerr << "termctl: " << std::format(fmt, std::forward<T>(args)...) << '\n';
    }

    template <typename... T>
    void log_error(std::format_string<T...> fmt, T&&... args) {
        std::cerr << "termctl: error: " << std::format(fmt, std::forward<T>(args)...) << '\n';
    }

    namespace utils {
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

        constexpr std::string_view trim(std::string_view value) {
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

            if constexpr (std::integral<T>) {
                result = std::from_chars(input.data(), input.data() + input.size(), value, base);
            }
            else {
                result = std::from_chars(input.data(), input.data() + input.size(), value);
            }

            if (result.ec != std::errc{} || result.ptr != input.data() + input.size()) {
                return std::nullopt;
            }

            return {value};
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

        inline std::vector<std::string> split(std::string_view text, char delimiter) {
            std::vector<std::string> parts{};
            for (auto part : text | std::views::split(delimiter)) {
                if (!part.empty()) {
                    parts.emplace_back(part.begin(), part.end());
                }
            }
            return parts;
        }

        inline std::string base64_encode(std::string_view input) { return glz::write_base64(input); }

        // RFC 4122 version 4, lowercase hex with dashes
        inline std::string random_uuid() {
            uuid_t raw{};
            ::uuid_generate_random(raw);

            std::array<char, 37> text{};
            ::uuid_unparse_lower(raw, text.data());
            return std::string{text.data()};
        }

    }  // namespace utils

}  // namespace termctl
