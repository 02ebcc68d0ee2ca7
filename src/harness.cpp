#include "tandem/harness.hpp"

#include "tandem/format.hpp"

#include "internal/log.hpp"

#include <algorithm>
#include <optional>

using namespace tandem::literals;

namespace tandem {

    std::vector<run_configuration> plan_runs(const harness_config& cfg) {
        auto matrix = build_matrix(cfg.selection, cfg.test_threads);
        if (cfg.only_position) {
            return restrict_to_position(matrix, *cfg.only_position);
        }
        return matrix;
    }

    harness_report run_harness(const harness_config& cfg, const process_runner& runner, std::string_view today) {
        auto plan = plan_runs(cfg);
        auto needs = [&](analysis_mode mode) {
            return std::ranges::any_of(plan, [mode](const run_configuration& c) { return c.mode == mode; });
        };

        if (cfg.test_threads > 1U && needs(analysis_mode::instrumented)) {
            internal::log::warn(
                    "test scheduler runs {} cases at once; findings may not be attributable to a single test case"_format(
                            cfg.test_threads));
        }

        execution_context ctx{};
        ctx.config = cfg;
        ctx.runner = runner;

        if (needs(analysis_mode::instrumented)) {
            auto path = cfg.resolved_suppressions_path();
            ctx.suppressions = load_suppressions(path, today, cfg.suppressions_path.has_value());
            internal::log::verbose(
                    cfg,
                    "{} active / {} expired suppressions from {}"_format(
                            ctx.suppressions.active().size(), ctx.suppressions.expired().size(), path.string()));
        }

        std::optional<scoped_default_toolchain> default_guard{};
        if (needs(analysis_mode::interpreted)) {
            ctx.toolchain = resolve_toolchain(cfg, runner);
            if (cfg.set_default) {
                default_guard.emplace(cfg, runner, *ctx.toolchain);
            }
        }

        harness_report report{};
        report.toolchain = ctx.toolchain;
        report.results.reserve(plan.size());
        for (const auto& configuration : plan) {
            report.results.push_back(execute(ctx, configuration));
        }

        report.verdict = aggregate(report.results);

        if (needs(analysis_mode::instrumented)) {
            std::vector<finding> instrumented{};
            for (const auto& result : report.results) {
                if (result.configuration.mode == analysis_mode::instrumented) {
                    instrumented.insert(instrumented.end(), result.findings.begin(), result.findings.end());
                }
            }
            report.unused_suppressions = unused_rules(ctx.suppressions, instrumented);
            report.expired_suppressions = ctx.suppressions.expired();
        }
        return report;
    }

}  // namespace tandem
