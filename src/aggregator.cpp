#include "tandem/aggregator.hpp"

#include "tandem/format.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>
#include <stdexcept>

using namespace tandem::literals;

namespace tandem::detail {

    struct finding_payload {
        std::string kind{};
        std::string location{};
        std::string shape{};
        std::string mode{};
        std::string severity{};
        std::string reproducibility{};
        std::optional<std::string> test_case{};
        std::string summary{};
        std::optional<std::string> justification{};
    };

    struct run_payload {
        size_t position{};
        std::string mode{};
        std::string profile{};
        unsigned test_threads{};
        std::string outcome{};
        std::string tool{};
        std::vector<std::string> command{};
        int exit_code{};
        std::string log_path{};
        std::vector<finding_payload> findings{};
        std::vector<std::string> notes{};
        std::optional<std::string> raw_output{};
    };

    struct rule_payload {
        std::string kind{};
        std::string location{};
        std::string shape{};
        std::string justification{};
        std::optional<std::string> owner{};
        std::optional<std::string> expires{};
    };

    struct report_payload {
        int schema_version{1};
        std::string outcome{};
        std::optional<std::string> toolchain{};
        size_t passed{};
        size_t failed{};
        size_t resolution_errors{};
        std::vector<size_t> failing_positions{};
        std::vector<run_payload> runs{};
        std::vector<rule_payload> unused_suppressions{};
        std::vector<rule_payload> expired_suppressions{};
    };

}  // namespace tandem::detail

namespace glz {

    template <>
    struct meta<tandem::detail::finding_payload> {
        using T = tandem::detail::finding_payload;
        static constexpr auto value =
                object("kind",
                       &T::kind,
                       "location",
                       &T::location,
                       "shape",
                       &T::shape,
                       "mode",
                       &T::mode,
                       "severity",
                       &T::severity,
                       "reproducibility",
                       &T::reproducibility,
                       "test_case",
                       &T::test_case,
                       "summary",
                       &T::summary,
                       "justification",
                       &T::justification);
    };

    template <>
    struct meta<tandem::detail::run_payload> {
        using T = tandem::detail::run_payload;
        static constexpr auto value =
                object("position",
                       &T::position,
                       "mode",
                       &T::mode,
                       "profile",
                       &T::profile,
                       "test_threads",
                       &T::test_threads,
                       "outcome",
                       &T::outcome,
                       "tool",
                       &T::tool,
                       "command",
                       &T::command,
                       "exit_code",
                       &T::exit_code,
                       "log_path",
                       &T::log_path,
                       "findings",
                       &T::findings,
                       "notes",
                       &T::notes,
                       "raw_output",
                       &T::raw_output);
    };

    template <>
    struct meta<tandem::detail::rule_payload> {
        using T = tandem::detail::rule_payload;
        static constexpr auto value =
                object("kind",
                       &T::kind,
                       "location",
                       &T::location,
                       "shape",
                       &T::shape,
                       "justification",
                       &T::justification,
                       "owner",
                       &T::owner,
                       "expires",
                       &T::expires);
    };

    template <>
    struct meta<tandem::detail::report_payload> {
        using T = tandem::detail::report_payload;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "outcome",
                       &T::outcome,
                       "toolchain",
                       &T::toolchain,
                       "passed",
                       &T::passed,
                       "failed",
                       &T::failed,
                       "resolution_errors",
                       &T::resolution_errors,
                       "failing_positions",
                       &T::failing_positions,
                       "runs",
                       &T::runs,
                       "unused_suppressions",
                       &T::unused_suppressions,
                       "expired_suppressions",
                       &T::expired_suppressions);
    };

}  // namespace glz

namespace tandem {

    namespace detail {

        static constexpr size_t table_tail_lines = 20U;

        // Tool name per diagnostics alternative; the payloads themselves stay tool-native.
        struct tool_name_visitor {
            std::string_view operator()(const interpreted_diagnostics&) const { return "interpreter"sv; }
            std::string_view operator()(const instrumented_diagnostics&) const { return "race-detector"sv; }
        };

        static std::string_view raw_output_of(const tool_diagnostics& diagnostics) {
            return std::visit([](const auto& d) -> std::string_view { return d.raw_output; }, diagnostics);
        }

        static finding_payload to_payload(const finding& f) {
            return finding_payload{
                    .kind = std::string{to_string(f.signature.kind)},
                    .location = f.signature.location,
                    .shape = f.signature.shape,
                    .mode = std::string{to_string(f.mode)},
                    .severity = std::string{to_string(f.severity)},
                    .reproducibility = std::string{to_string(f.hint)},
                    .test_case = f.test_case,
                    .summary = f.summary,
                    .justification = f.justification};
        }

        static rule_payload to_payload(const suppression_rule& rule) {
            return rule_payload{
                    .kind = std::string{to_string(rule.signature.kind)},
                    .location = rule.signature.location,
                    .shape = rule.signature.shape,
                    .justification = rule.justification,
                    .owner = rule.owner,
                    .expires = rule.expires};
        }

        static run_payload to_payload(const run_result& result) {
            run_payload payload{};
            payload.position = result.configuration.position;
            payload.mode = std::string{to_string(result.configuration.mode)};
            payload.profile = std::string{to_string(result.configuration.profile)};
            payload.test_threads = result.configuration.test_threads;
            payload.outcome = std::string{to_string(result.outcome)};
            payload.tool = std::string{std::visit(tool_name_visitor{}, result.diagnostics)};
            payload.command = command_of(result.diagnostics);
            payload.exit_code = exit_code_of(result.diagnostics);
            payload.log_path = log_path_of(result.diagnostics).string();
            payload.notes = result.notes;
            for (const auto& f : result.findings) {
                payload.findings.push_back(to_payload(f));
            }
            if (result.outcome != run_outcome::pass) {
                payload.raw_output = std::string{raw_output_of(result.diagnostics)};
            }
            return payload;
        }

        static std::vector<std::string_view> tail_lines(std::string_view text, size_t count) {
            auto lines = utils::split_lines(text);
            if (lines.size() > count) {
                lines.erase(lines.begin(), lines.end() - static_cast<std::ptrdiff_t>(count));
            }
            return lines;
        }

        static void render_finding(const finding& f, std::ostream& os) {
            os << "    [" << to_string(f.severity) << "] " << f.signature.to_string();
            os << " (" << to_string(f.hint);
            if (f.test_case) {
                os << ", test " << *f.test_case;
            }
            os << ")\n";
            if (!f.summary.empty()) {
                os << "      " << f.summary << '\n';
            }
            if (f.justification) {
                os << "      justification: " << *f.justification << '\n';
            }
        }

        static void render_rule(std::string_view label, const suppression_rule& rule, std::ostream& os) {
            os << "  " << label << ": " << rule.signature.to_string();
            if (rule.owner) {
                os << " owner=" << *rule.owner;
            }
            if (rule.expires) {
                os << " expires=" << *rule.expires;
            }
            os << '\n';
        }

    }  // namespace detail

    size_t run_result::count(finding_severity severity) const {
        return static_cast<size_t>(std::ranges::count_if(findings, [severity](const finding& f) {
            return f.severity == severity;
        }));
    }

    const std::vector<std::string>& command_of(const tool_diagnostics& diagnostics) {
        return std::visit([](const auto& d) -> const std::vector<std::string>& { return d.command; }, diagnostics);
    }

    const std::filesystem::path& log_path_of(const tool_diagnostics& diagnostics) {
        return std::visit([](const auto& d) -> const std::filesystem::path& { return d.log_path; }, diagnostics);
    }

    int exit_code_of(const tool_diagnostics& diagnostics) {
        return std::visit([](const auto& d) { return d.exit_code; }, diagnostics);
    }

    harness_verdict aggregate(const std::vector<run_result>& results) {
        harness_verdict verdict{};
        for (const auto& result : results) {
            switch (result.outcome) {
                case run_outcome::pass:
                    ++verdict.passed;
                    break;
                case run_outcome::fail:
                    ++verdict.failed;
                    verdict.failing_positions.push_back(result.configuration.position);
                    break;
                case run_outcome::resolution_error:
                    ++verdict.resolution_errors;
                    verdict.failing_positions.push_back(result.configuration.position);
                    break;
            }
        }

        if (results.empty()) {
            verdict.overall = run_outcome::fail;
        }
        else if (verdict.resolution_errors > 0U) {
            verdict.overall = run_outcome::resolution_error;
        }
        else if (verdict.failed > 0U) {
            verdict.overall = run_outcome::fail;
        }
        else {
            verdict.overall = run_outcome::pass;
        }
        return verdict;
    }

    int exit_status(const harness_verdict& verdict) {
        switch (verdict.overall) {
            case run_outcome::pass:
                return 0;
            case run_outcome::fail:
                return 1;
            case run_outcome::resolution_error:
                return 3;
        }
        return 1;
    }

    void render_table(const harness_report& report, std::ostream& os) {
        if (report.toolchain) {
            os << "toolchain: " << report.toolchain->name() << '\n';
        }
        for (const auto& result : report.results) {
            os << "{:<40} {}\n"_format(result.configuration.to_string(), result.outcome);
            for (const auto& f : result.findings) {
                detail::render_finding(f, os);
            }
            for (const auto& note : result.notes) {
                os << "    note: " << note << '\n';
            }
            os << "    log: " << log_path_of(result.diagnostics).string() << " (exit "
               << exit_code_of(result.diagnostics) << ")\n";
            if (result.outcome == run_outcome::resolution_error) {
                for (auto line : detail::tail_lines(detail::raw_output_of(result.diagnostics), detail::table_tail_lines)) {
                    os << "    | " << line << '\n';
                }
            }
        }
        for (const auto& rule : report.unused_suppressions) {
            detail::render_rule("unused suppression", rule, os);
        }
        for (const auto& rule : report.expired_suppressions) {
            detail::render_rule("expired suppression", rule, os);
        }
        os << "overall: {} ({} passed, {} failed, {} resolution errors)\n"_format(
                report.verdict.overall,
                report.verdict.passed,
                report.verdict.failed,
                report.verdict.resolution_errors);
    }

    std::string render_json(const harness_report& report) {
        detail::report_payload payload{};
        payload.outcome = std::string{to_string(report.verdict.overall)};
        if (report.toolchain) {
            payload.toolchain = report.toolchain->name();
        }
        payload.passed = report.verdict.passed;
        payload.failed = report.verdict.failed;
        payload.resolution_errors = report.verdict.resolution_errors;
        payload.failing_positions = report.verdict.failing_positions;
        for (const auto& result : report.results) {
            payload.runs.push_back(detail::to_payload(result));
        }
        for (const auto& rule : report.unused_suppressions) {
            payload.unused_suppressions.push_back(detail::to_payload(rule));
        }
        for (const auto& rule : report.expired_suppressions) {
            payload.expired_suppressions.push_back(detail::to_payload(rule));
        }

        std::string json{};
        auto ec = glz::write_json(payload, json);
        if (ec) {
            throw std::runtime_error("failed to serialize harness report");
        }
        return json;
    }

}  // namespace tandem
