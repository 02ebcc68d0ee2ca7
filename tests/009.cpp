#include "utils.hpp"

namespace tandem::test {

    namespace detail {
        static std::optional<int> parse(std::vector<std::string> args, harness_config& cfg) {
            args.insert(args.begin(), "tandem");
            auto argv = to_argv(args);
            return cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        }
    }  // namespace detail

    TEST_CASE("009: parse_cli accepts harness options", "[009][cli]") {
        harness_config cfg{};
        auto result = detail::parse(
                {"--corpus",
                 "/work/corpus",
                 "--work-dir",
                 "/tmp/tandem_work",
                 "--mode",
                 "instrumented",
                 "--test-threads",
                 "4",
                 "--suppressions",
                 "/work/rules.json",
                 "--feed-file",
                 "/work/feed.txt",
                 "--test-target",
                 "races",
                 "--cargo-arg=--features=loom-free",
                 "--cargo-arg=--locked",
                 "--miriflags=-Zmiri-seed=7",
                 "--no-exclude-expected-panics",
                 "--no-set-default",
                 "--output",
                 "json",
                 "--report",
                 "/tmp/tandem_work/report.json",
                 "--quiet"},
                cfg);

        CHECK_FALSE(result);
        CHECK(cfg.corpus_dir == "/work/corpus");
        CHECK(cfg.work_dir == "/tmp/tandem_work");
        CHECK(cfg.selection == mode_selection::instrumented);
        CHECK(cfg.test_threads == 4U);
        REQUIRE(cfg.suppressions_path);
        CHECK(*cfg.suppressions_path == "/work/rules.json");
        REQUIRE(cfg.feed_file);
        CHECK(*cfg.feed_file == "/work/feed.txt");
        CHECK(cfg.test_target == "races");
        CHECK(cfg.cargo_args == std::vector<std::string>{"--features=loom-free", "--locked"});
        REQUIRE(cfg.miriflags);
        CHECK(*cfg.miriflags == "-Zmiri-seed=7");
        CHECK_FALSE(cfg.exclude_expected_panics);
        CHECK_FALSE(cfg.set_default);
        CHECK(cfg.output == output_mode::json);
        REQUIRE(cfg.report_path);
        CHECK(cfg.quiet);
    }

    TEST_CASE("009: parse_cli defaults", "[009][cli]") {
        harness_config cfg{};
        auto result = detail::parse({}, cfg);
        CHECK_FALSE(result);
        CHECK(cfg.selection == mode_selection::all);
        CHECK(cfg.test_threads == 1U);
        CHECK(cfg.exclude_expected_panics);
        CHECK(cfg.set_default);
        CHECK_FALSE(cfg.suppressions_path);
        CHECK_FALSE(cfg.only_position);
    }

    TEST_CASE("009: environment variables feed the same options", "[009][cli][env]") {
        detail::scoped_env mode{"TANDEM_MODE", "interpreted"};
        detail::scoped_env threads{"TANDEM_TEST_THREADS", "2"};
        detail::scoped_env rules{"TANDEM_SUPPRESSIONS", "/env/rules.json"};

        SECTION("environment applies") {
            harness_config cfg{};
            CHECK_FALSE(detail::parse({}, cfg));
            CHECK(cfg.selection == mode_selection::interpreted);
            CHECK(cfg.test_threads == 2U);
            REQUIRE(cfg.suppressions_path);
            CHECK(*cfg.suppressions_path == "/env/rules.json");
        }

        SECTION("command line wins over environment") {
            harness_config cfg{};
            CHECK_FALSE(detail::parse({"--mode", "all", "--test-threads", "1"}, cfg));
            CHECK(cfg.selection == mode_selection::all);
            CHECK(cfg.test_threads == 1U);
        }
    }

    TEST_CASE("009: config file sits below the command line", "[009][cli][config]") {
        detail::temp_dir temp{"tandem_009_config"};
        auto path = temp.path / "tandem.json";
        detail::write_text_file(
                path,
                R"({"schema_version":1,"corpus":"/cfg/corpus","mode":"instrumented","test_threads":3,)"
                R"("cargo_args":["--locked"],"set_default":false,"comment":"ignored"})");

        SECTION("file values apply") {
            harness_config cfg{};
            CHECK_FALSE(detail::parse({"--config", path.string()}, cfg));
            CHECK(cfg.corpus_dir == "/cfg/corpus");
            CHECK(cfg.selection == mode_selection::instrumented);
            CHECK(cfg.test_threads == 3U);
            CHECK(cfg.cargo_args == std::vector<std::string>{"--locked"});
            CHECK_FALSE(cfg.set_default);
            REQUIRE(cfg.config_file);
        }

        SECTION("command line overrides file") {
            harness_config cfg{};
            CHECK_FALSE(detail::parse({"--config", path.string(), "--test-threads", "1", "--corpus", "/cli"}, cfg));
            CHECK(cfg.test_threads == 1U);
            CHECK(cfg.corpus_dir == "/cli");
            CHECK(cfg.selection == mode_selection::instrumented);
        }

        SECTION("bad file is a usage error") {
            detail::write_text_file(path, R"({"schema_version":1,"test_threads":0})");
            harness_config cfg{};
            auto result = detail::parse({"--config", path.string()}, cfg);
            REQUIRE(result);
            CHECK(*result == 2);
        }
    }

    TEST_CASE("009: parse_cli rejects invalid invocations", "[009][cli]") {
        auto expect_usage_error = [](std::vector<std::string> args) {
            harness_config cfg{};
            auto result = detail::parse(std::move(args), cfg);
            REQUIRE(result);
            CHECK(*result == 2);
        };

        SECTION("unknown mode") { expect_usage_error({"--mode", "valgrind"}); }
        SECTION("zero threads") { expect_usage_error({"--test-threads", "0"}); }
        SECTION("non-numeric threads") { expect_usage_error({"--test-threads", "many"}); }
        SECTION("unknown output") { expect_usage_error({"--output", "yaml"}); }
        SECTION("quiet and verbose") { expect_usage_error({"--quiet", "--verbose"}); }
        SECTION("position outside the matrix") { expect_usage_error({"--only", "4"}); }
        SECTION("position outside a narrowed matrix") { expect_usage_error({"--mode", "interpreted", "--only", "2"}); }
        SECTION("interpreted position under instrumented mode") {
            expect_usage_error({"--mode", "instrumented", "--only", "1"});
        }
    }

    TEST_CASE("009: parse_cli one-shot exits", "[009][cli]") {
        SECTION("version") {
            harness_config cfg{};
            auto result = detail::parse({"--version"}, cfg);
            REQUIRE(result);
            CHECK(*result == 0);
        }

        SECTION("print config") {
            harness_config cfg{};
            auto result = detail::parse({"--print-config"}, cfg);
            REQUIRE(result);
            CHECK(*result == 0);
        }

        SECTION("print matrix is handled by run") {
            harness_config cfg{};
            CHECK_FALSE(detail::parse({"--print-matrix", "--mode", "instrumented", "--test-threads", "2"}, cfg));
            CHECK(cfg.print_matrix);

            std::ostringstream out{};
            detail::fake_tools tools{};
            CHECK(cli::run(cfg, tools.runner(), out) == 0);
            CHECK(out.str() == "#2 instrumented/debug threads=2\n#3 instrumented/release threads=2\n");
            CHECK(tools.calls->empty());
        }
    }

    TEST_CASE("009: check-suppressions validates the registry", "[009][cli][suppression]") {
        detail::temp_dir temp{"tandem_009_check"};
        harness_config cfg{};
        cfg.check_suppressions = true;
        cfg.suppressions_path = temp.path / "rules.json";
        detail::fake_tools tools{};
        std::ostringstream out{};

        SECTION("missing registry") { CHECK(cli::run(cfg, tools.runner(), out) == 3); }

        SECTION("valid registry") {
            detail::write_text_file(*cfg.suppressions_path, detail::racy_flag_registry());
            CHECK(cli::run(cfg, tools.runner(), out) == 0);
            CHECK(out.str().find("1 active, 0 expired") != std::string::npos);
        }

        SECTION("unjustified rule") {
            detail::write_text_file(
                    *cfg.suppressions_path,
                    R"({"rules":[{"kind":"data_race","location":"src/a.rs:1","shape":"read/write"}]})");
            CHECK(cli::run(cfg, tools.runner(), out) == 3);
        }
        CHECK(tools.calls->empty());
    }

    TEST_CASE("009: run renders the report and maps the verdict to an exit status", "[009][cli]") {
        detail::temp_dir temp{"tandem_009_run"};
        auto cfg = detail::scratch_config(temp);
        cfg.selection = mode_selection::instrumented;
        cfg.report_path = temp.path / "out" / "report.json";

        detail::fake_tools tools{};
        auto racy = detail::race_detector_output(cfg.corpus_dir);
        tools.respond = [racy](const process_request&) { return detail::exited(101, racy); };

        SECTION("table output fails on the race") {
            std::ostringstream out{};
            CHECK(cli::run(cfg, tools.runner(), out) == 1);
            CHECK(out.str().find("overall: fail") != std::string::npos);

            auto report = detail::read_text_file(*cfg.report_path);
            CHECK(report.find(R"("outcome":"fail")") != std::string::npos);
        }

        SECTION("json output passes once justified") {
            cfg.output = output_mode::json;
            detail::write_text_file(cfg.corpus_dir / "tests" / "suppressions.json", detail::racy_flag_registry());
            std::ostringstream out{};
            CHECK(cli::run(cfg, tools.runner(), out) == 0);
            CHECK(out.str().starts_with(R"({"schema_version":1,"outcome":"pass")"));
        }

        SECTION("toolchain resolution failure exits 3") {
            cfg.selection = mode_selection::interpreted;
            cfg.feed_file = temp.path / "empty-feed.txt";
            detail::write_text_file(*cfg.feed_file, "\n");
            std::ostringstream out{};
            CHECK(cli::run(cfg, tools.runner(), out) == 3);
            CHECK(tools.count(detail::is_test_run) == 0U);
        }
    }

}  // namespace tandem::test
