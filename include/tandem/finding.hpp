#pragma once

#include "config.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tandem {

    enum class finding_kind : uint8_t {
        data_race,
        use_after_free,
        out_of_bounds,
        aliasing_violation,
        invalid_access,
        memory_leak,
        lock_order_inversion,
        thread_leak,
        mutex_misuse,
        deadlock,
        abnormal_termination,
        undefined_behavior,
        test_failure,
    };

    inline constexpr std::string_view to_string(finding_kind kind) {
        switch (kind) {
            case finding_kind::data_race:
                return "data_race"sv;
            case finding_kind::use_after_free:
                return "use_after_free"sv;
            case finding_kind::out_of_bounds:
                return "out_of_bounds"sv;
            case finding_kind::aliasing_violation:
                return "aliasing_violation"sv;
            case finding_kind::invalid_access:
                return "invalid_access"sv;
            case finding_kind::memory_leak:
                return "memory_leak"sv;
            case finding_kind::lock_order_inversion:
                return "lock_order_inversion"sv;
            case finding_kind::thread_leak:
                return "thread_leak"sv;
            case finding_kind::mutex_misuse:
                return "mutex_misuse"sv;
            case finding_kind::deadlock:
                return "deadlock"sv;
            case finding_kind::abnormal_termination:
                return "abnormal_termination"sv;
            case finding_kind::undefined_behavior:
                return "undefined_behavior"sv;
            case finding_kind::test_failure:
                return "test_failure"sv;
        }
        return "undefined_behavior"sv;
    }

    inline constexpr bool try_parse_finding_kind(std::string_view text, finding_kind& out) {
        constexpr finding_kind all_kinds[] = {
                finding_kind::data_race,
                finding_kind::use_after_free,
                finding_kind::out_of_bounds,
                finding_kind::aliasing_violation,
                finding_kind::invalid_access,
                finding_kind::memory_leak,
                finding_kind::lock_order_inversion,
                finding_kind::thread_leak,
                finding_kind::mutex_misuse,
                finding_kind::deadlock,
                finding_kind::abnormal_termination,
                finding_kind::undefined_behavior,
                finding_kind::test_failure,
        };
        for (auto kind : all_kinds) {
            if (text == to_string(kind)) {
                out = kind;
                return true;
            }
        }
        return false;
    }

    enum class finding_severity : uint8_t {
        unsuppressed_failure,
        suppressed_informational,
    };

    inline constexpr std::string_view to_string(finding_severity severity) {
        switch (severity) {
            case finding_severity::unsuppressed_failure:
                return "unsuppressed"sv;
            case finding_severity::suppressed_informational:
                return "suppressed"sv;
        }
        return "unsuppressed"sv;
    }

    enum class reproducibility : uint8_t {
        deterministic,
        schedule_dependent,
    };

    inline constexpr std::string_view to_string(reproducibility hint) {
        switch (hint) {
            case reproducibility::deterministic:
                return "deterministic"sv;
            case reproducibility::schedule_dependent:
                return "schedule_dependent"sv;
        }
        return "schedule_dependent"sv;
    }

    inline constexpr reproducibility reproducibility_for(analysis_mode mode) {
        return mode == analysis_mode::interpreted ? reproducibility::deterministic
                                                  : reproducibility::schedule_dependent;
    }

    // Stable identity of a finding; suppression matching is exact equality on all three fields.
    struct finding_signature {
        static constexpr bool to_string_formattable = true;

        finding_kind kind{finding_kind::undefined_behavior};
        // "path:line" relative to the corpus root
        std::string location{};
        // access pair for races ("write/read"), otherwise the tool message with addresses stripped
        std::string shape{};

        bool operator==(const finding_signature&) const = default;

        std::string to_string() const;
    };

    struct finding {
        finding_signature signature{};
        analysis_mode mode{analysis_mode::interpreted};
        finding_severity severity{finding_severity::unsuppressed_failure};
        reproducibility hint{reproducibility::deterministic};
        std::optional<std::string> test_case{};
        std::string summary{};
        std::optional<std::string> justification{};
    };

    struct test_case_status {
        std::string name{};
        bool passed{false};
        bool ignored{false};
    };

    struct parsed_tool_log {
        std::vector<finding> findings{};
        std::vector<test_case_status> test_cases{};
        // the runner reached its "test result:" line
        bool summary_seen{false};
        std::optional<std::string> crash_marker{};

        size_t failed_test_count() const;
    };

    // Normalises a source location to "path:line" relative to the corpus root; empty when unparseable.
    std::string normalize_location(std::string_view raw, const std::filesystem::path& corpus_root);

    // Parses `cargo miri test` output: UB reports, test-case lines, crash markers.
    parsed_tool_log parse_interpreter_log(std::string_view text, const std::filesystem::path& corpus_root);

    // Parses `cargo test` output of a ThreadSanitizer-instrumented build.
    parsed_tool_log parse_race_detector_log(std::string_view text, const std::filesystem::path& corpus_root);

}  // namespace tandem

namespace std {
    template <>
    struct formatter<tandem::finding_kind, char> : formatter<std::string_view> {
        template <typename FormatContext>
        auto format(const tandem::finding_kind& val, FormatContext& ctx) const {
            return formatter<std::string_view>::format(tandem::to_string(val), ctx);
        }
    };

    template <>
    struct formatter<tandem::finding_severity, char> : formatter<std::string_view> {
        template <typename FormatContext>
        auto format(const tandem::finding_severity& val, FormatContext& ctx) const {
            return formatter<std::string_view>::format(tandem::to_string(val), ctx);
        }
    };

    template <>
    struct formatter<tandem::reproducibility, char> : formatter<std::string_view> {
        template <typename FormatContext>
        auto format(const tandem::reproducibility& val, FormatContext& ctx) const {
            return formatter<std::string_view>::format(tandem::to_string(val), ctx);
        }
    };

}  // namespace std
