#pragma once

#include <algorithm>
#include <charconv>
#include <iostream>
#include <optional>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace tandem {

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

        // Splits on '\n', dropping a trailing '\r' from each line.
        inline std::vector<std::string_view> split_lines(std::string_view text) {
            std::vector<std::string_view> lines{};
            while (!text.empty()) {
                auto nl = text.find('\n');
                auto line = text.substr(0U, nl);
                if (!line.empty() && line.back() == '\r') {
                    line.remove_suffix(1U);
                }
                lines.push_back(line);
                if (nl == std::string_view::npos) {
                    break;
                }
                text.remove_prefix(nl + 1U);
            }
            return lines;
        }

        // ISO-8601 calendar date check (YYYY-MM-DD), no calendar validation beyond ranges.
        constexpr bool is_iso_date(std::string_view text) {
            if (text.size() != 10U || text[4] != '-' || text[7] != '-') {
                return false;
            }
            for (size_t i = 0U; i < text.size(); ++i) {
                if (i == 4U || i == 7U) {
                    continue;
                }
                if (text[i] < '0' || text[i] > '9') {
                    return false;
                }
            }
            auto month = (text[5] - '0') * 10 + (text[6] - '0');
            auto day = (text[8] - '0') * 10 + (text[9] - '0');
            return month >= 1 && month <= 12 && day >= 1 && day <= 31;
        }

    }  // namespace utils

}  // namespace tandem
