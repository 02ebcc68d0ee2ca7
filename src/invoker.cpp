#include "tandem/invoker.hpp"

#include "tandem/format.hpp"

#include "internal/log.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;
using namespace tandem::literals;

namespace tandem {

    namespace detail {

        namespace arg_tokens {
            static constexpr auto toolchain_prefix = "+"sv;
            static constexpr auto test = "test"sv;
            static constexpr auto test_target = "--test"sv;
            static constexpr auto release = "--release"sv;
            static constexpr auto no_fail_fast = "--no-fail-fast"sv;
            static constexpr auto passthrough = "--"sv;
            static constexpr auto unstable_options = "-Zunstable-options"sv;
            static constexpr auto exclude_should_panic = "--exclude-should-panic"sv;
            static constexpr auto sanitizer_thread = "-Zsanitizer=thread"sv;
        }  // namespace arg_tokens

        namespace env_keys {
            static constexpr auto test_threads = "RUST_TEST_THREADS"sv;
            static constexpr auto target_dir = "CARGO_TARGET_DIR"sv;
            static constexpr auto miriflags = "MIRIFLAGS"sv;
            static constexpr auto rustflags = "RUSTFLAGS"sv;
            static constexpr auto rustdocflags = "RUSTDOCFLAGS"sv;
            static constexpr auto tsan_options = "TSAN_OPTIONS"sv;
        }  // namespace env_keys

        static fs::path interpreter_target_dir(const harness_config& cfg) {
            return cfg.work_dir / "miri";
        }

        static fs::path race_detector_target_dir(const harness_config& cfg, build_profile profile) {
            return cfg.work_dir / "tsan-{}"_format(profile);
        }

        static fs::path run_log_path(const harness_config& cfg, const run_configuration& configuration) {
            if (configuration.mode == analysis_mode::interpreted) {
                return cfg.work_dir / "logs" / "{}-{}.log"_format(configuration.position, configuration.mode);
            }
            return cfg.work_dir / "logs" /
                   "{}-{}-{}.log"_format(configuration.position, configuration.mode, configuration.profile);
        }

        static std::string sanitizer_options(const harness_config& cfg) {
            // every report must reach the log; suppression happens in the registry, not in the runtime
            return "halt_on_error=0 exitcode={} report_signal_unsafe=0"_format(cfg.sanitizer_exitcode);
        }

        static void env_set(process_request& request, std::string_view key, std::string value) {
            request.env.emplace_back(std::string{key}, std::move(value));
        }

        // Clears interpretation state so nothing leaks between configurations.
        static void clear_state_dir(const fs::path& dir) {
            std::error_code ec{};
            fs::remove_all(dir, ec);
            if (ec) {
                throw std::runtime_error("failed to clear {}: {}"_format(dir.string(), ec.message()));
            }
        }

        static size_t count_unsuppressed(const std::vector<finding>& findings) {
            return static_cast<size_t>(std::ranges::count_if(
                    findings, [](const finding& f) { return f.severity == finding_severity::unsuppressed_failure; }));
        }

        // Shared outcome policy. A tool crash is never a finding and is decided before findings are
        // weighed, so no suppression can absorb it.
        static run_outcome decide_outcome(
                const parsed_tool_log& log,
                const process_outcome& outcome,
                const std::vector<finding>& findings,
                std::optional<std::string_view> tolerated_exit_marker,
                std::vector<std::string>& notes) {
            if (outcome.signaled) {
                notes.push_back("tool crash: terminated by signal {}"_format(outcome.signal));
                return run_outcome::resolution_error;
            }
            if (log.crash_marker) {
                notes.push_back("tool crash: output contains '{}'"_format(*log.crash_marker));
                return run_outcome::resolution_error;
            }

            auto unsuppressed = count_unsuppressed(findings);
            if (unsuppressed > 0U) {
                return run_outcome::fail;
            }
            if (outcome.exit_code == 0) {
                if (!log.summary_seen) {
                    notes.push_back("no test result line in the output; the run may not have executed any test");
                }
                return run_outcome::pass;
            }
            if (!findings.empty() && tolerated_exit_marker &&
                outcome.output.find(*tolerated_exit_marker) != std::string::npos) {
                // the race runtime's exit status for reports that were all suppressed
                return run_outcome::pass;
            }
            if (!log.summary_seen) {
                notes.push_back("tool crash: exited with status {} before the test runner reported a result"_format(
                        outcome.exit_code));
            }
            else {
                notes.push_back(
                        "tool crash: exited with status {} without an unsuppressed finding"_format(outcome.exit_code));
            }
            return run_outcome::resolution_error;
        }

        static void log_run_start(const harness_config& cfg, const run_configuration& configuration) {
            internal::log::info(cfg, "running {}"_format(configuration));
        }

        static void log_run_end(const harness_config& cfg, const run_result& result) {
            internal::log::info(
                    cfg,
                    "{} -> {} ({} unsuppressed, {} suppressed)"_format(
                            result.configuration,
                            result.outcome,
                            result.count(finding_severity::unsuppressed_failure),
                            result.count(finding_severity::suppressed_informational)));
            for (const auto& note : result.notes) {
                internal::log::info(cfg, "  {}"_format(note));
            }
        }

    }  // namespace detail

    process_request build_interpreted_request(const execution_context& ctx, const run_configuration& configuration) {
        if (!ctx.toolchain) {
            throw resolution_error("interpreted run {} requires a resolved toolchain"_format(configuration));
        }
        const auto& cfg = ctx.config;

        process_request request{};
        request.args = {cfg.cargo_path.string(),
                        "{}{}"_format(detail::arg_tokens::toolchain_prefix, ctx.toolchain->name()),
                        cfg.capability,
                        std::string{detail::arg_tokens::test},
                        // keep going past a failing test binary so one run reports every anomaly
                        std::string{detail::arg_tokens::no_fail_fast}};
        request.args.insert(request.args.end(), cfg.cargo_args.begin(), cfg.cargo_args.end());
        if (cfg.exclude_expected_panics) {
            request.args.emplace_back(detail::arg_tokens::passthrough);
            request.args.emplace_back(detail::arg_tokens::unstable_options);
            request.args.emplace_back(detail::arg_tokens::exclude_should_panic);
        }

        request.working_dir = cfg.corpus_dir;
        request.log_path = detail::run_log_path(cfg, configuration);
        detail::env_set(request, detail::env_keys::test_threads, std::to_string(configuration.test_threads));
        detail::env_set(request, detail::env_keys::target_dir, fs::absolute(detail::interpreter_target_dir(cfg)).string());
        if (cfg.miriflags) {
            detail::env_set(request, detail::env_keys::miriflags, *cfg.miriflags);
        }
        return request;
    }

    process_request build_instrumented_request(const execution_context& ctx, const run_configuration& configuration) {
        const auto& cfg = ctx.config;

        process_request request{};
        request.args = {cfg.cargo_path.string(),
                        "{}{}"_format(detail::arg_tokens::toolchain_prefix, cfg.channel),
                        std::string{detail::arg_tokens::test},
                        std::string{detail::arg_tokens::test_target},
                        cfg.test_target};
        if (configuration.profile == build_profile::release) {
            request.args.emplace_back(detail::arg_tokens::release);
        }
        request.args.emplace_back(detail::arg_tokens::no_fail_fast);
        request.args.insert(request.args.end(), cfg.cargo_args.begin(), cfg.cargo_args.end());

        request.working_dir = cfg.corpus_dir;
        request.log_path = detail::run_log_path(cfg, configuration);
        detail::env_set(request, detail::env_keys::rustflags, std::string{detail::arg_tokens::sanitizer_thread});
        detail::env_set(request, detail::env_keys::rustdocflags, std::string{detail::arg_tokens::sanitizer_thread});
        detail::env_set(request, detail::env_keys::test_threads, std::to_string(configuration.test_threads));
        detail::env_set(request, detail::env_keys::tsan_options, detail::sanitizer_options(cfg));
        detail::env_set(
                request,
                detail::env_keys::target_dir,
                fs::absolute(detail::race_detector_target_dir(cfg, configuration.profile)).string());
        return request;
    }

    run_result execute_interpreted(const execution_context& ctx, const run_configuration& configuration) {
        const auto& cfg = ctx.config;
        auto request = build_interpreted_request(ctx, configuration);
        auto state_dir = detail::interpreter_target_dir(cfg);

        detail::log_run_start(cfg, configuration);
        internal::log::verbose(cfg, render_command(request.args));

        detail::clear_state_dir(state_dir);
        auto outcome = ctx.runner(request);

        run_result result{};
        result.configuration = configuration;

        auto log = parse_interpreter_log(outcome.output, cfg.corpus_dir);
        result.findings = std::move(log.findings);
        result.outcome = detail::decide_outcome(log, outcome, result.findings, std::nullopt, result.notes);

        std::error_code ec{};
        fs::remove_all(state_dir, ec);
        if (ec) {
            auto note = "failed to clear interpretation state {}: {}"_format(state_dir.string(), ec.message());
            internal::log::warn(note);
            result.notes.push_back(std::move(note));
        }

        result.diagnostics = interpreted_diagnostics{
                .command = request.args,
                .toolchain = ctx.toolchain->name(),
                .exit_code = outcome.exit_code,
                .signaled = outcome.signaled,
                .log_path = request.log_path,
                .raw_output = std::move(outcome.output)};

        detail::log_run_end(cfg, result);
        return result;
    }

    run_result execute_instrumented(const execution_context& ctx, const run_configuration& configuration) {
        const auto& cfg = ctx.config;
        auto request = build_instrumented_request(ctx, configuration);

        detail::log_run_start(cfg, configuration);
        internal::log::verbose(cfg, render_command(request.args));

        auto outcome = ctx.runner(request);

        run_result result{};
        result.configuration = configuration;

        auto log = parse_race_detector_log(outcome.output, cfg.corpus_dir);
        result.findings = std::move(log.findings);
        for (auto& f : result.findings) {
            if (f.signature.kind == finding_kind::test_failure) {
                continue;
            }
            if (const auto* rule = ctx.suppressions.match(f.signature)) {
                f.severity = finding_severity::suppressed_informational;
                f.justification = rule->justification;
            }
        }

        auto tolerated = "exit status: {}"_format(cfg.sanitizer_exitcode);
        result.outcome = detail::decide_outcome(log, outcome, result.findings, tolerated, result.notes);

        result.diagnostics = instrumented_diagnostics{
                .command = request.args,
                .sanitizer_options = detail::sanitizer_options(cfg),
                .exit_code = outcome.exit_code,
                .signaled = outcome.signaled,
                .log_path = request.log_path,
                .raw_output = std::move(outcome.output)};

        detail::log_run_end(cfg, result);
        return result;
    }

    run_result execute(const execution_context& ctx, const run_configuration& configuration) {
        switch (configuration.mode) {
            case analysis_mode::interpreted:
                return execute_interpreted(ctx, configuration);
            case analysis_mode::instrumented:
                return execute_instrumented(ctx, configuration);
        }
        throw std::logic_error("unknown analysis mode");
    }

}  // namespace tandem
