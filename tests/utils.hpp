#pragma once

#include "tandem.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

extern "C" {
#include <signal.h>
#include <stdlib.h>
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <ranges>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tandem::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    // Sets an environment variable for the lifetime of the guard.
    struct scoped_env {
        std::string name{};

        scoped_env(std::string key, const std::string& value) : name{std::move(key)} {
            ::setenv(name.c_str(), value.c_str(), 1);
        }
        ~scoped_env() { ::unsetenv(name.c_str()); }
    };

    inline void write_text_file(const fs::path& path, std::string_view text) {
        auto parent = path.parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
        std::ofstream out{path};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    inline void make_executable_file(const fs::path& path, std::string_view content) {
        write_text_file(path, content);
        fs::permissions(
                path,
                fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec | fs::perms::group_read |
                        fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                fs::perm_options::replace);
    }

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path};
        REQUIRE(in.good());
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline std::vector<std::string> read_lines(const fs::path& path) {
        std::ifstream in{path};
        REQUIRE(in.good());

        std::vector<std::string> lines{};
        std::string line{};
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    inline bool has_exact_arg(const std::vector<std::string>& args, std::string_view token) {
        return std::find(args.begin(), args.end(), token) != args.end();
    }

    inline bool has_prefixed_arg(const std::vector<std::string>& args, std::string_view prefix) {
        return std::ranges::any_of(args, [prefix](std::string_view arg) { return arg.starts_with(prefix); });
    }

    inline std::optional<std::string> env_value(const process_request& request, std::string_view key) {
        for (const auto& [k, v] : request.env) {
            if (k == key) {
                return v;
            }
        }
        return std::nullopt;
    }

    inline std::vector<char*> to_argv(std::vector<std::string>& args) {
        std::vector<char*> argv{};
        argv.reserve(args.size());
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return argv;
    }

    inline process_outcome exited(int code, std::string output = {}) {
        process_outcome outcome{};
        outcome.exit_code = code;
        outcome.output = std::move(output);
        return outcome;
    }

    inline process_outcome killed(int signal, std::string output = {}) {
        process_outcome outcome{};
        outcome.exit_code = 128 + signal;
        outcome.signaled = true;
        outcome.signal = signal;
        outcome.output = std::move(output);
        return outcome;
    }

    // Scripted stand-in for the external tools; records every request it receives.
    struct fake_tools {
        std::shared_ptr<std::vector<process_request>> calls{std::make_shared<std::vector<process_request>>()};
        std::function<process_outcome(const process_request&)> respond{};

        process_runner runner() const {
            return [calls = calls, respond = respond](const process_request& request) {
                calls->push_back(request);
                return respond ? respond(request) : exited(0);
            };
        }

        size_t count(std::function<bool(const process_request&)> pred) const {
            return static_cast<size_t>(std::ranges::count_if(*calls, pred));
        }
    };

    inline bool is_interpreted_test(const process_request& request) {
        return request.args.size() >= 4U && request.args[2] == "miri" && request.args[3] == "test";
    }

    inline bool is_instrumented_test(const process_request& request) {
        return has_exact_arg(request.args, "--test") && env_value(request, "TSAN_OPTIONS").has_value();
    }

    inline bool is_test_run(const process_request& request) {
        return is_interpreted_test(request) || is_instrumented_test(request);
    }

    inline bool is_rustup(const process_request& request) {
        return !request.args.empty() && request.args.front() == "rustup";
    }

    /*
     * Tool output fixtures
     *
     * Both analyses of the same racy read: the interpreter reports the unsynchronised read at
     * src/racy.rs:42 after the write at src/racy.rs:37, the race detector reports the same pair.
     */

    inline constexpr auto clean_interpreter_output =
            "running 2 tests\n"
            "test counter::increments ... ok\n"
            "test counter::wraps ... ok\n"
            "\n"
            "test result: ok. 2 passed; 0 failed; 0 ignored; 0 measured; 0 filtered out; finished in 1.02s\n"sv;

    inline constexpr auto racy_interpreter_output =
            "running 2 tests\n"
            "test counter::increments ... ok\n"
            "test racy::unsynchronized_flag ... error: Undefined Behavior: Data race detected between (1) "
            "non-atomic write on thread `unnamed-1` and (2) non-atomic read on thread `unnamed-2` at alloc1532. "
            "(2) just happened here\n"
            "  --> src/racy.rs:42:9\n"
            "   |\n"
            "42 |         unsafe { *FLAG.0.get() }\n"
            "   |                  ^^^^^^^^^^^^^ Data race detected between (1) non-atomic write on thread "
            "`unnamed-1` and (2) non-atomic read on thread `unnamed-2` at alloc1532. (2) just happened here\n"
            "   |\n"
            "help: and (1) occurred earlier here\n"
            "  --> src/racy.rs:37:9\n"
            "   = help: this indicates a bug in the program: it performed an invalid operation, and caused "
            "Undefined Behavior\n"
            "   = note: BACKTRACE (of the first span) on thread `unnamed-2`:\n"
            "   = note: inside `racy::read_flag` at src/racy.rs:42:9: 42:22\n"
            "note: inside closure\n"
            "  --> src/racy.rs:50:18\n"
            "\n"
            "error: aborting due to 1 previous error\n"
            "\n"
            "error: test failed, to rerun pass `--lib`\n"sv;

    inline constexpr auto unsupported_interpreter_output =
            "running 1 test\n"
            "test panics::rejects_zero ... error: unsupported operation: can't call foreign function "
            "`_Unwind_RaiseException` on OS `linux`\n"
            "  --> src/panics.rs:12:5\n"
            "\n"
            "error: aborting due to 1 previous error\n"sv;

    // The evaluated program deadlocks on two mutexes taken in opposite order.
    inline constexpr auto deadlocked_interpreter_output =
            "running 1 test\n"
            "test lock::lock_both ... error: deadlock: the evaluated program deadlocked\n"
            "   --> /rustc/9b00956e5/library/std/src/sys/sync/mutex/futex.rs:62:17\n"
            "    |\n"
            "62  |             futex_wait(&self.futex, LOCKED, None);\n"
            "    |                                                  ^ the evaluated program deadlocked\n"
            "    |\n"
            "    = note: BACKTRACE on thread `unnamed-2`:\n"
            "    = note: inside `std::sys::sync::mutex::futex::Mutex::lock_contended` at "
            "/rustc/9b00956e5/library/std/src/sys/sync/mutex/futex.rs:62:17: 62:54\n"
            "note: inside `lock::lock_both`\n"
            "  --> src/lock.rs:20:9\n"
            "\n"
            "error: aborting due to 1 previous error\n"sv;

    inline std::string race_detector_output(const fs::path& corpus_root, int sanitizer_exitcode = 66) {
        auto root = corpus_root.generic_string();
        std::string out{};
        out += "running 2 tests\n";
        out += "test unsynchronized_flag ... \n";
        out += "==================\n";
        out += "WARNING: ThreadSanitizer: data race (pid=4242)\n";
        out += "  Read of size 1 at 0x7b0400000010 by thread T2:\n";
        out += "    #0 core::ptr::read /rustc/9b00956e5/library/core/src/ptr/mod.rs:1200:5 (tsan-3f2a+0x1000)\n";
        out += std::format("    #1 corpus::racy::read_flag {}/src/racy.rs:42:9 (tsan-3f2a+0x1234)\n", root);
        out += std::format("    #2 tsan::unsynchronized_flag::closure0 {}/tests/tsan.rs:18:22 (tsan-3f2a+0x2234)\n", root);
        out += "\n";
        out += "  Previous write of size 1 at 0x7b0400000010 by thread T1:\n";
        out += std::format("    #0 corpus::racy::set_flag {}/src/racy.rs:37:9 (tsan-3f2a+0x3234)\n", root);
        out += "\n";
        out += "  Location is global 'corpus::racy::FLAG' of size 1 at 0x7b0400000010 (tsan-3f2a+0x9999)\n";
        out += "\n";
        out += std::format("SUMMARY: ThreadSanitizer: data race {}/src/racy.rs:42:9 in corpus::racy::read_flag\n", root);
        out += "==================\n";
        out += "ok\n";
        out += "test counter_increments ... ok\n";
        out += "\n";
        out += "test result: ok. 2 passed; 0 failed; 0 ignored; 0 measured; 0 filtered out; finished in 0.12s\n";
        out += "\n";
        out += "ThreadSanitizer: reported 1 warnings\n";
        out += "error: test failed, to rerun pass `--test tsan`\n";
        out += "\n";
        out += "Caused by:\n";
        out += std::format(
                "  process didn't exit successfully: `{}/target/debug/deps/tsan-3f2a` (exit status: {})\n",
                root,
                sanitizer_exitcode);
        return out;
    }

    inline constexpr auto clean_race_detector_output =
            "running 2 tests\n"
            "test unsynchronized_flag ... ok\n"
            "test counter_increments ... ok\n"
            "\n"
            "test result: ok. 2 passed; 0 failed; 0 ignored; 0 measured; 0 filtered out; finished in 0.10s\n"sv;

    inline std::string racy_flag_registry(std::string_view expires = "2999-12-31") {
        return std::format(
                R"({{
  "schema_version": 1,
  "rules": [
    {{
      "kind": "data_race",
      "location": "src/racy.rs:42",
      "shape": "read/write",
      "justification": "flag is a benign progress hint; readers tolerate stale values",
      "owner": "concurrency",
      "expires": "{}"
    }}
  ]
}})",
                expires);
    }

    inline toolchain_identity nightly(std::string_view tag) {
        auto parsed = version_tag::parse(tag);
        REQUIRE(parsed);
        return toolchain_identity{.tag = *parsed, .channel = "nightly", .interpreter_capable = true};
    }

    // Harness config pointed at a scratch corpus; tool paths stay bare names so fakes can match them.
    inline harness_config scratch_config(const temp_dir& temp) {
        harness_config cfg{};
        cfg.corpus_dir = temp.path / "corpus";
        cfg.work_dir = temp.path / "work";
        cfg.quiet = true;
        fs::create_directories(cfg.corpus_dir / "tests");
        return cfg;
    }

}  // namespace tandem::test::detail
