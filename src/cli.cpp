#include "tandem/cli.hpp"

#include "tandem/format.hpp"
#include "tandem/harness.hpp"

#include "internal/platform.hpp"

#include <glaze/glaze.hpp>

#include <CLI/CLI.hpp>

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace tandem::literals;

namespace tandem::cli::detail {

    struct persisted_config {
        int schema_version{1};
        std::optional<std::string> corpus{};
        std::optional<std::string> work_dir{};
        std::optional<std::string> mode{};
        std::optional<unsigned> test_threads{};
        std::optional<std::string> suppressions{};
        std::optional<std::string> feed_url{};
        std::optional<std::string> feed_file{};
        std::optional<std::string> capability{};
        std::optional<std::string> channel{};
        std::optional<std::string> test_target{};
        std::optional<std::string> cargo{};
        std::optional<std::string> rustup{};
        std::optional<std::string> curl{};
        std::optional<std::vector<std::string>> cargo_args{};
        std::optional<std::string> miriflags{};
        std::optional<int> sanitizer_exitcode{};
        std::optional<bool> exclude_expected_panics{};
        std::optional<bool> set_default{};
        std::optional<std::string> output{};
        std::optional<std::string> report{};
    };

}  // namespace tandem::cli::detail

namespace glz {

    template <>
    struct meta<tandem::cli::detail::persisted_config> {
        using T = tandem::cli::detail::persisted_config;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "corpus",
                       &T::corpus,
                       "work_dir",
                       &T::work_dir,
                       "mode",
                       &T::mode,
                       "test_threads",
                       &T::test_threads,
                       "suppressions",
                       &T::suppressions,
                       "feed_url",
                       &T::feed_url,
                       "feed_file",
                       &T::feed_file,
                       "capability",
                       &T::capability,
                       "channel",
                       &T::channel,
                       "test_target",
                       &T::test_target,
                       "cargo",
                       &T::cargo,
                       "rustup",
                       &T::rustup,
                       "curl",
                       &T::curl,
                       "cargo_args",
                       &T::cargo_args,
                       "miriflags",
                       &T::miriflags,
                       "sanitizer_exitcode",
                       &T::sanitizer_exitcode,
                       "exclude_expected_panics",
                       &T::exclude_expected_panics,
                       "set_default",
                       &T::set_default,
                       "output",
                       &T::output,
                       "report",
                       &T::report);
    };

}  // namespace glz

namespace tandem::cli {

    namespace detail {

        namespace fs = std::filesystem;

        static constexpr auto version_text = "tandem 0.1.0"sv;
        static constexpr auto default_value = "<default>"sv;

        namespace env_names {
            static constexpr auto mode = "TANDEM_MODE";
            static constexpr auto test_threads = "TANDEM_TEST_THREADS";
            static constexpr auto suppressions = "TANDEM_SUPPRESSIONS";
        }  // namespace env_names

        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                throw std::runtime_error("failed to open " + path.string());
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (!in.good() && !in.eof()) {
                throw std::runtime_error("failed to read " + path.string());
            }
            return ss.str();
        }

        static void write_text_file(const fs::path& path, std::string_view text) {
            auto parent = path.parent_path();
            if (!parent.empty()) {
                std::error_code ec{};
                fs::create_directories(parent, ec);
                if (ec) {
                    throw std::runtime_error("failed to create directory: {}"_format(parent.string()));
                }
            }
            std::ofstream out{path};
            if (!out) {
                throw std::runtime_error("failed to open {}"_format(path.string()));
            }
            out << text << '\n';
            if (!out) {
                throw std::runtime_error("failed to write {}"_format(path.string()));
            }
        }

        static persisted_config read_config_file(const fs::path& path) {
            persisted_config value{};
            auto json = read_text_file(path);
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(value, json);
            if (ec) {
                throw std::runtime_error(
                        "failed to parse config file {}: {}"_format(path.string(), glz::format_error(ec, json)));
            }
            constexpr int supported_schema_version = 1;
            if (value.schema_version > supported_schema_version) {
                throw std::runtime_error(
                        "unsupported schema_version in {}: {} > {}"_format(
                                path.string(), value.schema_version, supported_schema_version));
            }
            return value;
        }

        static bool parse_test_threads(std::string_view text, unsigned& out) {
            auto parsed = utils::parse_arithmetic<unsigned>(utils::trim_view(text));
            if (!parsed || *parsed == 0U) {
                return false;
            }
            out = *parsed;
            return true;
        }

        static void apply_persisted_config(const persisted_config& data, harness_config& cfg) {
            if (data.corpus) {
                cfg.corpus_dir = *data.corpus;
            }
            if (data.work_dir) {
                cfg.work_dir = *data.work_dir;
            }
            if (data.mode && !try_parse_mode_selection(*data.mode, cfg.selection)) {
                throw std::runtime_error("invalid mode in config file: " + *data.mode);
            }
            if (data.test_threads) {
                if (*data.test_threads == 0U) {
                    throw std::runtime_error("test_threads in config file must be at least 1");
                }
                cfg.test_threads = *data.test_threads;
            }
            if (data.suppressions) {
                cfg.suppressions_path = *data.suppressions;
            }
            if (data.feed_url) {
                cfg.feed_url = *data.feed_url;
            }
            if (data.feed_file) {
                cfg.feed_file = *data.feed_file;
            }
            if (data.capability) {
                cfg.capability = *data.capability;
            }
            if (data.channel) {
                cfg.channel = *data.channel;
            }
            if (data.test_target) {
                cfg.test_target = *data.test_target;
            }
            if (data.cargo) {
                cfg.cargo_path = *data.cargo;
            }
            if (data.rustup) {
                cfg.rustup_path = *data.rustup;
            }
            if (data.curl) {
                cfg.curl_path = *data.curl;
            }
            if (data.cargo_args) {
                cfg.cargo_args = *data.cargo_args;
            }
            if (data.miriflags) {
                cfg.miriflags = *data.miriflags;
            }
            if (data.sanitizer_exitcode) {
                cfg.sanitizer_exitcode = *data.sanitizer_exitcode;
            }
            if (data.exclude_expected_panics) {
                cfg.exclude_expected_panics = *data.exclude_expected_panics;
            }
            if (data.set_default) {
                cfg.set_default = *data.set_default;
            }
            if (data.output && !try_parse_output_mode(*data.output, cfg.output)) {
                throw std::runtime_error("invalid output in config file: " + *data.output);
            }
            if (data.report) {
                cfg.report_path = *data.report;
            }
        }

        static void apply_platform_defaults(harness_config& cfg) {
            namespace tool = internal::platform::tool;
            if (cfg.cargo_path.string() == tool::cargo) {
                cfg.cargo_path = tool::resolved(tool::cargo_path, tool::cargo);
            }
            if (cfg.rustup_path.string() == tool::rustup) {
                cfg.rustup_path = tool::resolved(tool::rustup_path, tool::rustup);
            }
            if (cfg.curl_path.string() == tool::curl) {
                cfg.curl_path = tool::resolved(tool::curl_path, tool::curl);
            }
        }

        static std::string optional_path(const std::optional<fs::path>& value) {
            return value ? value->string() : std::string{default_value};
        }

        static void print_config(const harness_config& cfg, std::ostream& os) {
            os << "corpus=" << cfg.corpus_dir.string() << '\n';
            os << "work_dir=" << cfg.work_dir.string() << '\n';
            os << "mode=" << to_string(cfg.selection) << '\n';
            os << "test_threads=" << cfg.test_threads << '\n';
            os << "only=" << (cfg.only_position ? std::to_string(*cfg.only_position) : std::string{default_value})
               << '\n';
            os << "suppressions=" << cfg.resolved_suppressions_path().string() << '\n';
            os << "feed=" << (cfg.feed_file ? cfg.feed_file->string() : "{}/{}"_format(cfg.feed_url, cfg.capability))
               << '\n';
            os << "capability=" << cfg.capability << '\n';
            os << "channel=" << cfg.channel << '\n';
            os << "set_default=" << (cfg.set_default ? "true" : "false") << '\n';
            os << "cargo=" << cfg.cargo_path.string() << '\n';
            os << "rustup=" << cfg.rustup_path.string() << '\n';
            os << "curl=" << cfg.curl_path.string() << '\n';
            os << "test_target=" << cfg.test_target << '\n';
            os << "cargo_args=" << utils::join_with_separator(cfg.cargo_args, " ") << '\n';
            os << "miriflags=" << (cfg.miriflags ? *cfg.miriflags : std::string{default_value}) << '\n';
            os << "exclude_expected_panics=" << (cfg.exclude_expected_panics ? "true" : "false") << '\n';
            os << "output=" << to_string(cfg.output) << '\n';
            os << "report=" << optional_path(cfg.report_path) << '\n';
        }

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, harness_config& cfg) {
        CLI::App app{"tandem: interpreted + race-detector verification harness"};
        detail::apply_platform_defaults(cfg);

        bool show_version = false;
        std::string config_arg{};
        std::string corpus_arg{cfg.corpus_dir.string()};
        std::string work_dir_arg{cfg.work_dir.string()};
        std::string mode_arg{std::string{to_string(cfg.selection)}};
        std::string threads_arg{std::to_string(cfg.test_threads)};
        std::string suppressions_arg{};
        std::string feed_url_arg{cfg.feed_url};
        std::string feed_file_arg{};
        std::string capability_arg{cfg.capability};
        std::string channel_arg{cfg.channel};
        std::string test_target_arg{cfg.test_target};
        std::string cargo_arg{cfg.cargo_path.string()};
        std::string rustup_arg{cfg.rustup_path.string()};
        std::string curl_arg{cfg.curl_path.string()};
        std::vector<std::string> cargo_args{};
        std::string miriflags_arg{};
        bool exclude_arg = cfg.exclude_expected_panics;
        size_t only_arg{0U};
        std::string output_arg{std::string{to_string(cfg.output)}};
        std::string report_arg{};

        app.add_flag("--version", show_version, "Print version and exit");
        auto* config_opt = app.add_option("--config", config_arg, "JSON harness config file");
        auto* corpus_opt = app.add_option("--corpus", corpus_arg, "Cargo workspace under test");
        auto* work_dir_opt = app.add_option("--work-dir", work_dir_arg, "Isolated working state directory");
        auto* mode_opt = app.add_option("--mode", mode_arg, "Analyses to run: all|interpreted|instrumented")
                                 ->envname(detail::env_names::mode);
        auto* threads_opt =
                app.add_option("--test-threads", threads_arg, "Test-case scheduler width for instrumented runs")
                        ->envname(detail::env_names::test_threads);
        auto* suppressions_opt =
                app.add_option("--suppressions", suppressions_arg, "Suppression registry (JSON)")
                        ->envname(detail::env_names::suppressions);
        auto* feed_url_opt = app.add_option("--feed-url", feed_url_arg, "Component availability feed base URL");
        auto* feed_file_opt = app.add_option("--feed-file", feed_file_arg, "Local component availability listing");
        auto* capability_opt = app.add_option("--capability", capability_arg, "Required interpreter component");
        auto* channel_opt = app.add_option("--channel", channel_arg, "Toolchain release channel");
        auto* test_target_opt =
                app.add_option("--test-target", test_target_arg, "Integration test target for the race detector");
        auto* cargo_opt = app.add_option("--cargo", cargo_arg, "cargo executable path");
        auto* rustup_opt = app.add_option("--rustup", rustup_arg, "rustup executable path");
        auto* curl_opt = app.add_option("--curl", curl_arg, "curl executable path");
        auto* cargo_args_opt = app.add_option("--cargo-arg", cargo_args, "Extra cargo test argument (repeatable)")
                                       ->allow_extra_args(false);
        auto* miriflags_opt = app.add_option("--miriflags", miriflags_arg, "MIRIFLAGS for the interpreted run");
        auto* exclude_opt = app.add_flag(
                "--exclude-expected-panics,!--no-exclude-expected-panics",
                exclude_arg,
                "Keep should-panic test cases out of the interpreted run");
        auto* no_default_opt = app.add_flag("--no-set-default", "Do not switch the host default toolchain");
        auto* only_opt = app.add_option("--only", only_arg, "Run only the matrix entry at this 1-based position");
        auto* output_opt = app.add_option("--output", output_arg, "Output mode: table|json");
        auto* report_opt = app.add_option("--report", report_arg, "Also write the JSON report to this path");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--print-matrix", cfg.print_matrix, "Print the run configuration matrix and exit");
        app.add_flag("--check-suppressions", cfg.check_suppressions, "Validate the suppression registry and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress progress output");
        app.add_flag("--verbose", cfg.verbose, "Enable verbose output");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << detail::version_text << '\n';
            return std::optional<int>{0};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (config_opt->count() > 0U) {
            try {
                cfg.config_file = config_arg;
                detail::apply_persisted_config(detail::read_config_file(config_arg), cfg);
            } catch (const std::exception& e) {
                std::cerr << e.what() << '\n';
                return std::optional<int>{2};
            }
        }

        auto given = [](const CLI::Option* opt) { return opt->count() > 0U; };

        if (given(mode_opt) && !try_parse_mode_selection(mode_arg, cfg.selection)) {
            std::cerr << "invalid --mode value: " << mode_arg << " (expected all|interpreted|instrumented)\n";
            return std::optional<int>{2};
        }
        if (given(threads_opt) && !detail::parse_test_threads(threads_arg, cfg.test_threads)) {
            std::cerr << "invalid --test-threads value: " << threads_arg << " (expected an integer >= 1)\n";
            return std::optional<int>{2};
        }
        if (given(output_opt) && !try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected table|json)\n";
            return std::optional<int>{2};
        }

        if (given(corpus_opt)) {
            cfg.corpus_dir = corpus_arg;
        }
        if (given(work_dir_opt)) {
            cfg.work_dir = work_dir_arg;
        }
        if (given(suppressions_opt)) {
            cfg.suppressions_path = suppressions_arg;
        }
        if (given(feed_url_opt)) {
            cfg.feed_url = feed_url_arg;
        }
        if (given(feed_file_opt)) {
            cfg.feed_file = feed_file_arg;
        }
        if (given(capability_opt)) {
            cfg.capability = capability_arg;
        }
        if (given(channel_opt)) {
            cfg.channel = channel_arg;
        }
        if (given(test_target_opt)) {
            cfg.test_target = test_target_arg;
        }
        if (given(cargo_opt)) {
            cfg.cargo_path = cargo_arg;
        }
        if (given(rustup_opt)) {
            cfg.rustup_path = rustup_arg;
        }
        if (given(curl_opt)) {
            cfg.curl_path = curl_arg;
        }
        if (given(cargo_args_opt)) {
            cfg.cargo_args = cargo_args;
        }
        if (given(miriflags_opt)) {
            cfg.miriflags = miriflags_arg;
        }
        if (given(exclude_opt)) {
            cfg.exclude_expected_panics = exclude_arg;
        }
        if (given(no_default_opt)) {
            cfg.set_default = false;
        }
        if (given(report_opt)) {
            cfg.report_path = report_arg;
        }
        if (given(only_opt)) {
            cfg.only_position = only_arg;
            try {
                static_cast<void>(plan_runs(cfg));
            } catch (const std::exception& e) {
                std::cerr << "invalid --only value: " << e.what() << '\n';
                return std::optional<int>{2};
            }
        }

        if (cfg.print_config) {
            detail::print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

    int run(const harness_config& cfg, const process_runner& runner, std::ostream& out) {
        try {
            if (cfg.print_matrix) {
                for (const auto& configuration : plan_runs(cfg)) {
                    out << configuration.to_string() << '\n';
                }
                return 0;
            }

            if (cfg.check_suppressions) {
                auto path = cfg.resolved_suppressions_path();
                auto registry = load_suppressions(path, today_iso_date(), true);
                out << "{}: {} active, {} expired\n"_format(
                        path.string(), registry.active().size(), registry.expired().size());
                for (const auto& rule : registry.expired()) {
                    out << "  expired: {} ({})\n"_format(rule.signature, rule.expires.value_or(""));
                }
                return 0;
            }

            auto report = run_harness(cfg, runner, today_iso_date());
            auto json = render_json(report);
            if (cfg.output == output_mode::json) {
                out << json << '\n';
            }
            else {
                render_table(report, out);
            }
            if (cfg.report_path) {
                detail::write_text_file(*cfg.report_path, json);
            }
            return exit_status(report.verdict);
        } catch (const registry_load_error& e) {
            std::cerr << "fatal: suppression registry rejected: " << e.what() << '\n';
            return 3;
        } catch (const resolution_error& e) {
            std::cerr << "fatal: toolchain resolution failed: " << e.what() << '\n';
            return 3;
        } catch (const std::invalid_argument& e) {
            std::cerr << "invalid configuration: " << e.what() << '\n';
            return 2;
        } catch (const std::out_of_range& e) {
            std::cerr << "invalid configuration: " << e.what() << '\n';
            return 2;
        }
    }

}  // namespace tandem::cli
