#pragma once

#include "format.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tandem {

    using namespace std::string_view_literals;

    /*
     * Tandem Harness Config Options
     *
     * Corpus and working state
     * - corpus_dir: Root of the cargo workspace under test; all finding locations are relative to it.
     * - work_dir: Per-invocation isolated state (target dirs, merged tool logs).
     * - config_file: Optional JSON config loaded before command-line overrides.
     *
     * Analysis selection
     * - selection: Which analysis modes enter the matrix (all|interpreted|instrumented).
     * - test_threads: Harness-side test-case scheduler width for instrumented runs (RUST_TEST_THREADS).
     * - only_position: Restrict execution to one matrix position (1-based) for reproduction.
     * - exclude_expected_panics: Keep should-panic test cases out of the interpreted run.
     *
     * Toolchain resolution
     * - feed_url: Base URL of the component availability feed; "/<capability>" is appended.
     * - feed_file: Local feed listing used instead of fetching feed_url.
     * - capability: Toolchain component the interpreted analysis requires.
     * - channel: Release channel the resolved tag belongs to.
     * - set_default: Switch the host-wide default toolchain for the duration of the run.
     *
     * Tools
     * - cargo_path / rustup_path / curl_path: Executables used for the analysis and resolution steps.
     * - test_target: Integration test target built with race instrumentation (cargo test --test <target>).
     * - cargo_args: Extra arguments appended to every cargo test invocation.
     * - miriflags: MIRIFLAGS forwarded to the interpreted run.
     * - sanitizer_exitcode: TSAN exitcode used to recognise race-detector terminations.
     *
     * Suppressions
     * - suppressions_path: Suppression registry source; default is <corpus>/tests/suppressions.json.
     *
     * Output
     * - output: Report shape on stdout (table|json).
     * - report_path: Optional path that always receives the JSON report.
     * - quiet/verbose: Coarse verbosity knobs for progress lines on stderr.
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print resolved config and exit.
     * - print_matrix: Print the run configuration matrix and exit.
     * - check_suppressions: Load and validate the suppression registry and exit.
     */

    enum class output_mode : uint8_t { table, json };
    enum class analysis_mode : uint8_t { interpreted, instrumented };
    enum class build_profile : uint8_t { debug, release };
    enum class mode_selection : uint8_t { all, interpreted, instrumented };

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::table:
                return "table"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "table"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "table"sv)) {
            out = output_mode::table;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(analysis_mode mode) {
        switch (mode) {
            case analysis_mode::interpreted:
                return "interpreted"sv;
            case analysis_mode::instrumented:
                return "instrumented"sv;
        }
        return "interpreted"sv;
    }

    inline constexpr bool try_parse_analysis_mode(std::string_view text, analysis_mode& out) {
        if (utils::str_case_eq(text, "interpreted"sv) || utils::str_case_eq(text, "miri"sv)) {
            out = analysis_mode::interpreted;
            return true;
        }
        if (utils::str_case_eq(text, "instrumented"sv) || utils::str_case_eq(text, "tsan"sv)) {
            out = analysis_mode::instrumented;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(build_profile profile) {
        switch (profile) {
            case build_profile::debug:
                return "debug"sv;
            case build_profile::release:
                return "release"sv;
        }
        return "debug"sv;
    }

    inline constexpr bool try_parse_build_profile(std::string_view text, build_profile& out) {
        if (utils::str_case_eq(text, "debug"sv) || utils::str_case_eq(text, "dev"sv)) {
            out = build_profile::debug;
            return true;
        }
        if (utils::str_case_eq(text, "release"sv)) {
            out = build_profile::release;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(mode_selection selection) {
        switch (selection) {
            case mode_selection::all:
                return "all"sv;
            case mode_selection::interpreted:
                return "interpreted"sv;
            case mode_selection::instrumented:
                return "instrumented"sv;
        }
        return "all"sv;
    }

    inline constexpr bool try_parse_mode_selection(std::string_view text, mode_selection& out) {
        if (utils::str_case_eq(text, "all"sv)) {
            out = mode_selection::all;
            return true;
        }
        analysis_mode mode{};
        if (try_parse_analysis_mode(text, mode)) {
            out = mode == analysis_mode::interpreted ? mode_selection::interpreted : mode_selection::instrumented;
            return true;
        }
        return false;
    }

    inline constexpr bool selects(mode_selection selection, analysis_mode mode) {
        switch (selection) {
            case mode_selection::all:
                return true;
            case mode_selection::interpreted:
                return mode == analysis_mode::interpreted;
            case mode_selection::instrumented:
                return mode == analysis_mode::instrumented;
        }
        return false;
    }

    inline constexpr auto default_feed_url =
            "https://rust-lang.github.io/rustup-components-history/x86_64-unknown-linux-gnu"sv;

    struct harness_config {
        std::filesystem::path corpus_dir{"."};
        std::filesystem::path work_dir{".tandem"};
        std::optional<std::filesystem::path> config_file{};

        mode_selection selection{mode_selection::all};
        unsigned test_threads{1U};
        std::optional<std::size_t> only_position{};
        bool exclude_expected_panics{true};

        std::string feed_url{default_feed_url};
        std::optional<std::filesystem::path> feed_file{};
        std::string capability{"miri"};
        std::string channel{"nightly"};
        bool set_default{true};

        std::filesystem::path cargo_path{"cargo"};
        std::filesystem::path rustup_path{"rustup"};
        std::filesystem::path curl_path{"curl"};
        std::string test_target{"tsan"};
        std::vector<std::string> cargo_args{};
        std::optional<std::string> miriflags{};
        int sanitizer_exitcode{66};

        std::optional<std::filesystem::path> suppressions_path{};

        output_mode output{output_mode::table};
        std::optional<std::filesystem::path> report_path{};
        bool quiet{false};
        bool verbose{false};

        bool print_config{false};
        bool print_matrix{false};
        bool check_suppressions{false};

        std::filesystem::path resolved_suppressions_path() const {
            if (suppressions_path) {
                return *suppressions_path;
            }
            return corpus_dir / "tests" / "suppressions.json";
        }
    };

}  // namespace tandem

namespace std {
    template <>
    struct formatter<tandem::analysis_mode, char> : formatter<std::string_view> {
        template <typename FormatContext>
        auto format(const tandem::analysis_mode& val, FormatContext& ctx) const {
            return formatter<std::string_view>::format(tandem::to_string(val), ctx);
        }
    };

    template <>
    struct formatter<tandem::build_profile, char> : formatter<std::string_view> {
        template <typename FormatContext>
        auto format(const tandem::build_profile& val, FormatContext& ctx) const {
            return formatter<std::string_view>::format(tandem::to_string(val), ctx);
        }
    };

    template <>
    struct formatter<tandem::mode_selection, char> : formatter<std::string_view> {
        template <typename FormatContext>
        auto format(const tandem::mode_selection& val, FormatContext& ctx) const {
            return formatter<std::string_view>::format(tandem::to_string(val), ctx);
        }
    };

}  // namespace std
