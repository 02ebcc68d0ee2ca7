#include "utils.hpp"

namespace tandem::test {

    TEST_CASE("001: mode selection and output parsing", "[001][config]") {
        mode_selection selection{};
        CHECK(try_parse_mode_selection("all", selection));
        CHECK(selection == mode_selection::all);
        CHECK(try_parse_mode_selection("Interpreted", selection));
        CHECK(selection == mode_selection::interpreted);
        CHECK(try_parse_mode_selection("tsan", selection));
        CHECK(selection == mode_selection::instrumented);
        CHECK_FALSE(try_parse_mode_selection("valgrind", selection));

        output_mode output{};
        CHECK(try_parse_output_mode("JSON", output));
        CHECK(output == output_mode::json);
        CHECK_FALSE(try_parse_output_mode("yaml", output));

        build_profile profile{};
        CHECK(try_parse_build_profile("dev", profile));
        CHECK(profile == build_profile::debug);
        CHECK(try_parse_build_profile("release", profile));
        CHECK(profile == build_profile::release);
    }

    TEST_CASE("001: enum string conversion", "[001][config]") {
        CHECK(to_string(analysis_mode::interpreted) == "interpreted");
        CHECK(to_string(analysis_mode::instrumented) == "instrumented");
        CHECK(to_string(build_profile::release) == "release");
        CHECK(to_string(mode_selection::all) == "all");
        CHECK(to_string(run_outcome::resolution_error) == "resolution-error");
        CHECK(std::format("{}", analysis_mode::instrumented) == "instrumented");
    }

    TEST_CASE("001: default suppression path lives beside the corpus tests", "[001][config]") {
        harness_config cfg{};
        cfg.corpus_dir = "/work/corpus";
        CHECK(cfg.resolved_suppressions_path() == std::filesystem::path{"/work/corpus/tests/suppressions.json"});

        cfg.suppressions_path = "/etc/tandem/rules.json";
        CHECK(cfg.resolved_suppressions_path() == std::filesystem::path{"/etc/tandem/rules.json"});
    }

    TEST_CASE("001: full matrix order and positions", "[001][matrix]") {
        auto matrix = build_matrix(mode_selection::all, 1U);
        REQUIRE(matrix.size() == 3U);

        CHECK(matrix[0].mode == analysis_mode::interpreted);
        CHECK(matrix[0].test_threads == 1U);
        CHECK(matrix[0].position == 1U);

        CHECK(matrix[1].mode == analysis_mode::instrumented);
        CHECK(matrix[1].profile == build_profile::debug);
        CHECK(matrix[1].position == 2U);

        CHECK(matrix[2].mode == analysis_mode::instrumented);
        CHECK(matrix[2].profile == build_profile::release);
        CHECK(matrix[2].position == 3U);

        CHECK(matrix == build_matrix(mode_selection::all, 1U));
        CHECK(matrix[0].to_string() == "#1 interpreted threads=1");
        CHECK(matrix[2].to_string() == "#3 instrumented/release threads=1");
    }

    TEST_CASE("001: matrix honours selection and thread override", "[001][matrix]") {
        SECTION("interpreted only") {
            auto matrix = build_matrix(mode_selection::interpreted, 4U);
            REQUIRE(matrix.size() == 1U);
            CHECK(matrix[0].mode == analysis_mode::interpreted);
            // the interpreter is never widened
            CHECK(matrix[0].test_threads == 1U);
        }

        SECTION("instrumented only") {
            auto matrix = build_matrix(mode_selection::instrumented, 4U);
            REQUIRE(matrix.size() == 2U);
            // positions match the full matrix
            CHECK(matrix[0].position == 2U);
            CHECK(matrix[1].position == 3U);
            CHECK(matrix[0].test_threads == 4U);
            CHECK(matrix[1].profile == build_profile::release);
        }

        SECTION("zero threads is rejected") {
            CHECK_THROWS_AS(build_matrix(mode_selection::all, 0U), std::invalid_argument);
        }
    }

    TEST_CASE("001: restricting the matrix to one position", "[001][matrix]") {
        auto matrix = build_matrix(mode_selection::all, 1U);

        auto only = restrict_to_position(matrix, 2U);
        REQUIRE(only.size() == 1U);
        CHECK(only[0] == matrix[1]);

        CHECK_THROWS_AS(restrict_to_position(matrix, 0U), std::out_of_range);
        CHECK_THROWS_AS(restrict_to_position(matrix, 4U), std::out_of_range);

        harness_config cfg{};
        cfg.only_position = 3U;
        auto planned = plan_runs(cfg);
        REQUIRE(planned.size() == 1U);
        CHECK(planned[0].profile == build_profile::release);
    }

    TEST_CASE("001: a position names the same configuration under every selection", "[001][matrix]") {
        harness_config cfg{};
        cfg.selection = mode_selection::instrumented;
        cfg.only_position = 3U;
        auto planned = plan_runs(cfg);
        REQUIRE(planned.size() == 1U);
        CHECK(planned[0] == build_matrix(mode_selection::all, 1U)[2]);
        CHECK(planned[0].to_string() == "#3 instrumented/release threads=1");

        cfg.only_position = 1U;
        CHECK_THROWS_AS(plan_runs(cfg), std::out_of_range);
    }

}  // namespace tandem::test
