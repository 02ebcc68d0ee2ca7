#include "tandem/finding.hpp"

#include "tandem/format.hpp"

#include <algorithm>
#include <cctype>
#include <span>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace tandem::literals;

namespace tandem {

    namespace detail {

        namespace markers {
            static constexpr auto test_prefix = "test "sv;
            static constexpr auto test_separator = " ... "sv;
            static constexpr auto test_summary = "test result:"sv;

            static constexpr auto ub_header = "error: Undefined Behavior:"sv;
            static constexpr auto leak_header = "error: memory leaked"sv;
            static constexpr auto span_arrow = "--> "sv;
            static constexpr auto inside_note = "note: inside "sv;
            static constexpr auto aborting = "error: aborting due to"sv;

            static constexpr auto tsan_header = "WARNING: ThreadSanitizer: "sv;
            static constexpr auto tsan_summary = "SUMMARY: ThreadSanitizer: "sv;
            static constexpr auto tsan_fence = "=================="sv;
            static constexpr auto previous_access = "Previous "sv;

            static constexpr std::string_view interpreter_crashes[] = {
                    "internal compiler error"sv,
                    "thread 'rustc' panicked"sv,
                    "error: unsupported operation"sv,
                    "could not compile"sv,
            };

            // reports about the evaluated program rather than about the interpreter
            struct program_report {
                std::string_view header{};
                finding_kind kind{finding_kind::undefined_behavior};
            };

            static constexpr program_report program_reports[] = {
                    {"error: deadlock:"sv, finding_kind::deadlock},
                    {"error: the main thread terminated without waiting for all remaining threads"sv,
                     finding_kind::thread_leak},
                    {"error: abnormal termination:"sv, finding_kind::abnormal_termination},
            };

            static constexpr std::string_view race_detector_crashes[] = {
                    "internal compiler error"sv,
                    "thread 'rustc' panicked"sv,
                    "could not compile"sv,
                    "ThreadSanitizer: CHECK failed"sv,
                    "ThreadSanitizer: unexpected memory mapping"sv,
                    "FATAL: ThreadSanitizer"sv,
            };
        }  // namespace markers

        static bool contains(std::string_view haystack, std::string_view needle) {
            return haystack.find(needle) != std::string_view::npos;
        }

        static std::string lowercase(std::string_view text) {
            std::string out{text};
            std::ranges::transform(out, out.begin(), [](unsigned char c) { return std::tolower(c); });
            return out;
        }

        static bool all_digits(std::string_view text) {
            return !text.empty() && std::ranges::all_of(text, [](unsigned char c) { return std::isdigit(c) != 0; });
        }

        // "path:line" or "path:line:col"; bare "28:30" column spans are not locations
        static bool looks_like_location(std::string_view token) {
            auto colon = token.find(':');
            if (colon == std::string_view::npos || colon == 0U) {
                return false;
            }
            if (token.substr(0U, colon).find_first_of("./") == std::string_view::npos) {
                return false;
            }
            auto rest = token.substr(colon + 1U);
            auto second = rest.find(':');
            return all_digits(rest.substr(0U, second)) &&
                   (second == std::string_view::npos || all_digits(rest.substr(second + 1U)));
        }

        static std::vector<std::string_view> split_ws(std::string_view text) {
            std::vector<std::string_view> tokens{};
            size_t i = 0U;
            while (i < text.size()) {
                while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])) != 0) {
                    ++i;
                }
                auto start = i;
                while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])) == 0) {
                    ++i;
                }
                if (i > start) {
                    tokens.push_back(text.substr(start, i - start));
                }
            }
            return tokens;
        }

        static std::optional<std::string_view> last_location_token(std::string_view line) {
            std::optional<std::string_view> found{};
            for (auto token : split_ws(line)) {
                if (token.ends_with(':')) {
                    token.remove_suffix(1U);
                }
                if (looks_like_location(token)) {
                    found = token;
                }
            }
            return found;
        }

        static bool is_in_corpus(std::string_view raw_path, const fs::path& corpus_root) {
            fs::path path{std::string{raw_path}};
            if (path.is_relative()) {
                auto first = path.begin();
                return first == path.end() || *first != "..";
            }
            auto root = fs::absolute(corpus_root).lexically_normal();
            auto rel = path.lexically_normal().lexically_relative(root);
            return !rel.empty() && *rel.begin() != "..";
        }

        static std::string_view location_path(std::string_view raw) { return raw.substr(0U, raw.find(':')); }

        // First in-corpus location; falls back to the first candidate so a finding always carries one.
        static std::string pick_location(const std::vector<std::string_view>& candidates, const fs::path& corpus_root) {
            for (auto candidate : candidates) {
                if (is_in_corpus(location_path(candidate), corpus_root)) {
                    return normalize_location(candidate, corpus_root);
                }
            }
            if (!candidates.empty()) {
                return normalize_location(candidates.front(), corpus_root);
            }
            return {};
        }

        // read / write / atomic-read / atomic-write / dealloc for one side of a racing access pair
        static std::string access_word(std::string_view side) {
            auto lower = lowercase(side);
            std::string base{};
            if (contains(lower, "dealloc")) {
                base = "dealloc";
            }
            else if (contains(lower, "write") || contains(lower, "store") || contains(lower, "rmw")) {
                base = "write";
            }
            else if (contains(lower, "read") || contains(lower, "load")) {
                base = "read";
            }
            else {
                base = "access";
            }
            auto atomic = lower.find("atomic");
            if (atomic != std::string::npos && !(atomic >= 4U && lower.compare(atomic - 4U, 4U, "non-") == 0)) {
                return "atomic-" + base;
            }
            return base;
        }

        // Drops allocation ids, borrow tags and addresses so the message is stable across runs.
        static std::string strip_volatile_tokens(std::string_view text) {
            std::string out{};
            out.reserve(text.size());
            size_t i = 0U;
            while (i < text.size()) {
                if (text.substr(i).starts_with("alloc") && i + 5U < text.size() &&
                    std::isdigit(static_cast<unsigned char>(text[i + 5U])) != 0) {
                    out += "alloc";
                    i += 5U;
                    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])) != 0) {
                        ++i;
                    }
                    continue;
                }
                if (text.substr(i).starts_with("0x")) {
                    out += "0x";
                    i += 2U;
                    while (i < text.size() && std::isxdigit(static_cast<unsigned char>(text[i])) != 0) {
                        ++i;
                    }
                    continue;
                }
                if (text[i] == '<' && i + 1U < text.size() && std::isdigit(static_cast<unsigned char>(text[i + 1U])) != 0) {
                    auto close = text.find('>', i);
                    if (close != std::string_view::npos && all_digits(text.substr(i + 1U, close - i - 1U))) {
                        out += "<tag>";
                        i = close + 1U;
                        continue;
                    }
                }
                out += text[i];
                ++i;
            }
            return std::string{utils::trim_view(out)};
        }

        static finding_kind classify_interpreter_message(std::string_view message) {
            auto lower = lowercase(message);
            if (contains(lower, "data race")) {
                return finding_kind::data_race;
            }
            if (contains(lower, "use-after-free") || contains(lower, "has been freed") || contains(lower, "dangling")) {
                return finding_kind::use_after_free;
            }
            if (contains(lower, "out-of-bounds") || contains(lower, "out of bounds")) {
                return finding_kind::out_of_bounds;
            }
            if (contains(lower, "borrow stack") || contains(lower, "stacked borrows") ||
                contains(lower, "tree borrows") || contains(lower, "is forbidden") ||
                contains(lower, "not granting access")) {
                return finding_kind::aliasing_violation;
            }
            if (contains(lower, "uninitialized") || contains(lower, "unaligned") || contains(lower, "invalid value") ||
                contains(lower, "null pointer")) {
                return finding_kind::invalid_access;
            }
            return finding_kind::undefined_behavior;
        }

        // "(1) non-atomic write on thread `a` and (2) non-atomic read on thread `b` at alloc1." -> "read/write"
        static std::string interpreter_race_shape(std::string_view message) {
            auto between = message.find("between ");
            if (between == std::string_view::npos) {
                return strip_volatile_tokens(message);
            }
            auto pair = message.substr(between + 8U);
            auto sep = pair.find(" and ");
            if (sep == std::string_view::npos) {
                return strip_volatile_tokens(message);
            }
            auto earlier = pair.substr(0U, sep);
            auto current = pair.substr(sep + 5U);
            if (auto on = earlier.find(" on thread"); on != std::string_view::npos) {
                earlier = earlier.substr(0U, on);
            }
            if (auto on = current.find(" on thread"); on != std::string_view::npos) {
                current = current.substr(0U, on);
            }
            // the reported span is the second access; order current/earlier to match race-detector reports
            return "{}/{}"_format(access_word(current), access_word(earlier));
        }

        static finding_kind classify_race_detector_kind(std::string_view kind_text) {
            auto lower = lowercase(kind_text);
            if (lower.starts_with("data race")) {
                return finding_kind::data_race;
            }
            if (contains(lower, "use-after-free")) {
                return finding_kind::use_after_free;
            }
            if (contains(lower, "lock-order-inversion")) {
                return finding_kind::lock_order_inversion;
            }
            if (contains(lower, "thread leak")) {
                return finding_kind::thread_leak;
            }
            if (contains(lower, "mutex")) {
                return finding_kind::mutex_misuse;
            }
            return finding_kind::undefined_behavior;
        }

        struct program_report_match {
            finding_kind kind{finding_kind::undefined_behavior};
            size_t offset{0U};
        };

        static std::optional<program_report_match> match_program_report(std::string_view line) {
            for (const auto& report : markers::program_reports) {
                if (auto pos = line.find(report.header); pos != std::string_view::npos) {
                    return program_report_match{report.kind, pos};
                }
            }
            return std::nullopt;
        }

        struct test_line {
            std::string_view name{};
            std::string_view rest{};
        };

        static std::optional<test_line> parse_test_line(std::string_view line) {
            if (!line.starts_with(markers::test_prefix)) {
                return std::nullopt;
            }
            auto sep = line.find(markers::test_separator);
            if (sep == std::string_view::npos) {
                // status pending; libtest prints "test name ..." before the case finishes
                if (line.ends_with(" ..."sv)) {
                    return test_line{line.substr(5U, line.size() - 9U), {}};
                }
                return std::nullopt;
            }
            return test_line{line.substr(5U, sep - 5U), line.substr(sep + markers::test_separator.size())};
        }

        static bool record_test_status(parsed_tool_log& log, std::string_view name, std::string_view status) {
            status = utils::trim_view(status);
            if (status == "ok"sv) {
                log.test_cases.push_back(test_case_status{std::string{name}, true, false});
                return true;
            }
            if (status == "FAILED"sv) {
                log.test_cases.push_back(test_case_status{std::string{name}, false, false});
                return true;
            }
            if (status.starts_with("ignored"sv)) {
                log.test_cases.push_back(test_case_status{std::string{name}, true, true});
                return true;
            }
            return false;
        }

        // Tracks the running test case. Returns the part of the line left to scan for diagnostics.
        //
        // Tool output is merged into the test runner's stream, so a report can land between
        // "test name ... " and its status, which then arrives on a line of its own.
        static std::string_view track_test_case(
                parsed_tool_log& log,
                std::optional<std::string>& current_test,
                std::optional<std::string>& pending_test,
                std::string_view line) {
            if (auto test = parse_test_line(line)) {
                current_test = std::string{test->name};
                if (record_test_status(log, test->name, test->rest)) {
                    pending_test.reset();
                    return {};
                }
                pending_test = current_test;
                return utils::trim_view(test->rest);
            }
            auto trimmed = utils::trim_view(line);
            if (pending_test && record_test_status(log, *pending_test, trimmed)) {
                pending_test.reset();
                return {};
            }
            return trimmed;
        }

        static void detect_crash(parsed_tool_log& log, std::string_view text, std::span<const std::string_view> crash_markers) {
            for (auto marker : crash_markers) {
                if (contains(text, marker)) {
                    log.crash_marker = std::string{marker};
                    return;
                }
            }
        }

        static void append_test_failures(parsed_tool_log& log, analysis_mode mode) {
            for (const auto& test : log.test_cases) {
                if (test.passed) {
                    continue;
                }
                finding failure{};
                failure.signature = finding_signature{finding_kind::test_failure, test.name, "failed"};
                failure.mode = mode;
                failure.hint = reproducibility_for(mode);
                failure.test_case = test.name;
                failure.summary = "test case {} failed"_format(test.name);
                log.findings.push_back(std::move(failure));
            }
        }

    }  // namespace detail

    std::string finding_signature::to_string() const {
        return "{}@{}[{}]"_format(kind, location, shape);
    }

    size_t parsed_tool_log::failed_test_count() const {
        return static_cast<size_t>(std::ranges::count_if(test_cases, [](const auto& t) { return !t.passed; }));
    }

    std::string normalize_location(std::string_view raw, const fs::path& corpus_root) {
        raw = utils::trim_view(raw);
        auto first_colon = raw.find(':');
        if (first_colon == std::string_view::npos || first_colon == 0U) {
            return {};
        }
        auto path_text = raw.substr(0U, first_colon);
        auto rest = raw.substr(first_colon + 1U);
        auto line_text = rest.substr(0U, rest.find(':'));
        if (!detail::all_digits(line_text)) {
            return {};
        }

        fs::path path{std::string{path_text}};
        if (path.is_absolute()) {
            auto root = fs::absolute(corpus_root).lexically_normal();
            auto rel = path.lexically_normal().lexically_relative(root);
            if (!rel.empty() && *rel.begin() != "..") {
                path = rel;
            }
        }
        path = path.lexically_normal();
        return "{}:{}"_format(path.generic_string(), line_text);
    }

    parsed_tool_log parse_interpreter_log(std::string_view text, const fs::path& corpus_root) {
        parsed_tool_log log{};
        std::optional<std::string> current_test{};
        std::optional<std::string> pending_test{};
        std::optional<finding> open{};
        std::vector<std::string_view> candidates{};

        auto close_open = [&]() {
            if (!open) {
                return;
            }
            open->signature.location = detail::pick_location(candidates, corpus_root);
            log.findings.push_back(std::move(*open));
            open.reset();
            candidates.clear();
        };

        auto open_finding = [&](finding_kind kind, std::string_view message, std::string shape) {
            close_open();
            finding f{};
            f.signature.kind = kind;
            f.signature.shape = std::move(shape);
            f.mode = analysis_mode::interpreted;
            f.hint = reproducibility::deterministic;
            f.test_case = current_test;
            f.summary = std::string{utils::trim_view(message)};
            open = std::move(f);
        };

        for (auto line : utils::split_lines(text)) {
            if (line.starts_with(detail::markers::test_prefix)) {
                close_open();
            }
            // the test line and the first diagnostic share a line when the interpreter stops mid-case
            auto trimmed = detail::track_test_case(log, current_test, pending_test, line);

            if (auto ub = trimmed.find(detail::markers::ub_header); ub != std::string_view::npos) {
                auto message = utils::trim_view(trimmed.substr(ub + detail::markers::ub_header.size()));
                auto kind = detail::classify_interpreter_message(message);
                auto shape = kind == finding_kind::data_race ? detail::interpreter_race_shape(message)
                                                             : detail::strip_volatile_tokens(message);
                open_finding(kind, message, std::move(shape));
                continue;
            }
            if (auto leak = trimmed.find(detail::markers::leak_header); leak != std::string_view::npos) {
                auto message = utils::trim_view(trimmed.substr(leak + 6U));
                open_finding(finding_kind::memory_leak, message, "memory leaked");
                continue;
            }
            if (auto report = detail::match_program_report(trimmed)) {
                // "error: deadlock: the evaluated program deadlocked" -> "deadlock: the evaluated program deadlocked"
                auto message = utils::trim_view(trimmed.substr(report->offset + 6U));
                open_finding(report->kind, message, detail::strip_volatile_tokens(message));
                continue;
            }
            if (trimmed.starts_with(detail::markers::test_summary)) {
                close_open();
                log.summary_seen = true;
                continue;
            }
            if (trimmed.starts_with(detail::markers::aborting)) {
                close_open();
                continue;
            }
            if (!open) {
                continue;
            }
            if (trimmed.starts_with(detail::markers::span_arrow)) {
                candidates.push_back(utils::trim_view(trimmed.substr(detail::markers::span_arrow.size())));
            }
            else if (trimmed.starts_with(detail::markers::inside_note)) {
                if (auto loc = detail::last_location_token(trimmed)) {
                    candidates.push_back(*loc);
                }
            }
        }
        close_open();

        detail::detect_crash(log, text, detail::markers::interpreter_crashes);
        detail::append_test_failures(log, analysis_mode::interpreted);
        return log;
    }

    parsed_tool_log parse_race_detector_log(std::string_view text, const fs::path& corpus_root) {
        parsed_tool_log log{};
        std::optional<std::string> current_test{};
        std::optional<std::string> pending_test{};
        std::optional<finding> open{};
        std::vector<std::string_view> candidates{};
        std::string current_access{};
        std::string previous_access{};
        bool in_first_stack = false;

        auto close_open = [&]() {
            if (!open) {
                return;
            }
            open->signature.location = detail::pick_location(candidates, corpus_root);
            if (open->signature.kind == finding_kind::data_race && !current_access.empty()) {
                open->signature.shape = previous_access.empty() ? current_access
                                                                : "{}/{}"_format(current_access, previous_access);
            }
            else if (!current_access.empty() && open->signature.kind == finding_kind::use_after_free) {
                open->signature.shape = current_access;
            }
            log.findings.push_back(std::move(*open));
            open.reset();
            candidates.clear();
            current_access.clear();
            previous_access.clear();
            in_first_stack = false;
        };

        for (auto line : utils::split_lines(text)) {
            auto trimmed = detail::track_test_case(log, current_test, pending_test, line);

            if (auto header = trimmed.find(detail::markers::tsan_header); header != std::string_view::npos) {
                close_open();
                auto kind_text = trimmed.substr(header + detail::markers::tsan_header.size());
                if (auto pid = kind_text.find(" (pid="); pid != std::string_view::npos) {
                    kind_text = kind_text.substr(0U, pid);
                }
                finding f{};
                f.signature.kind = detail::classify_race_detector_kind(kind_text);
                f.signature.shape = detail::strip_volatile_tokens(kind_text);
                f.mode = analysis_mode::instrumented;
                f.hint = reproducibility::schedule_dependent;
                f.test_case = current_test;
                f.summary = std::string{kind_text};
                open = std::move(f);
                in_first_stack = false;
                continue;
            }
            if (trimmed.starts_with(detail::markers::test_summary)) {
                close_open();
                log.summary_seen = true;
                continue;
            }
            if (!open) {
                continue;
            }
            if (trimmed.starts_with(detail::markers::tsan_summary)) {
                if (auto loc = detail::last_location_token(trimmed)) {
                    // lowest priority: appended after the stack frames
                    candidates.push_back(*loc);
                }
                open->summary = std::string{trimmed.substr(detail::markers::tsan_summary.size())};
                close_open();
                continue;
            }
            if (trimmed.starts_with(detail::markers::tsan_fence)) {
                close_open();
                continue;
            }
            if (trimmed.starts_with(detail::markers::previous_access)) {
                in_first_stack = false;
                if (previous_access.empty()) {
                    previous_access = detail::access_word(trimmed.substr(0U, trimmed.find(" of size")));
                }
                continue;
            }
            if (current_access.empty() && trimmed.find(" of size ") != std::string_view::npos) {
                current_access = detail::access_word(trimmed.substr(0U, trimmed.find(" of size")));
                in_first_stack = true;
                continue;
            }
            if (trimmed.starts_with('#')) {
                // frames of the first stack (or of any stack when the report has no access lines)
                if (in_first_stack || current_access.empty()) {
                    if (auto loc = detail::last_location_token(trimmed)) {
                        candidates.push_back(*loc);
                    }
                }
                continue;
            }
            if (trimmed.empty()) {
                in_first_stack = false;
            }
        }
        close_open();

        detail::detect_crash(log, text, detail::markers::race_detector_crashes);
        detail::append_test_failures(log, analysis_mode::instrumented);
        return log;
    }

}  // namespace tandem
