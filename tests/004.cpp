#include "utils.hpp"

namespace tandem::test {

    TEST_CASE("004: race detector report parsing", "[004][findings][race-detector]") {
        const std::filesystem::path root{"/work/corpus"};
        auto log = parse_race_detector_log(detail::race_detector_output(root), root);

        REQUIRE(log.findings.size() == 1U);
        const auto& race = log.findings.front();
        CHECK(race.signature.kind == finding_kind::data_race);
        // first corpus frame of the current access stack; the std frame above it is skipped
        CHECK(race.signature.location == "src/racy.rs:42");
        CHECK(race.signature.shape == "read/write");
        CHECK(race.mode == analysis_mode::instrumented);
        CHECK(race.hint == reproducibility::schedule_dependent);
        REQUIRE(race.test_case);
        CHECK(*race.test_case == "unsynchronized_flag");
        CHECK(race.summary.starts_with("data race"));

        CHECK(log.summary_seen);
        CHECK_FALSE(log.crash_marker);
        // the status landed on its own line after the merged report
        REQUIRE(log.test_cases.size() == 2U);
        CHECK(log.test_cases[0].name == "unsynchronized_flag");
        CHECK(log.test_cases[0].passed);
        CHECK(log.failed_test_count() == 0U);
    }

    TEST_CASE("004: both analyses agree on the signature of one race", "[004][findings]") {
        const std::filesystem::path root{"/work/corpus"};
        auto interpreted = parse_interpreter_log(detail::racy_interpreter_output, root);
        auto instrumented = parse_race_detector_log(detail::race_detector_output(root), root);

        REQUIRE(interpreted.findings.size() == 1U);
        REQUIRE(instrumented.findings.size() == 1U);
        CHECK(interpreted.findings[0].signature == instrumented.findings[0].signature);
        CHECK(interpreted.findings[0].signature.to_string() == "data_race@src/racy.rs:42[read/write]");
    }

    TEST_CASE("004: atomic access sides keep their atomicity", "[004][findings][race-detector]") {
        constexpr auto output =
                "==================\n"
                "WARNING: ThreadSanitizer: data race (pid=77)\n"
                "  Atomic write of size 8 at 0x7b0800000020 by thread T3:\n"
                "    #0 corpus::seqlock::publish /work/corpus/src/seqlock.rs:88:13 (tsan+0x10)\n"
                "\n"
                "  Previous read of size 8 at 0x7b0800000020 by thread T1:\n"
                "    #0 corpus::seqlock::peek /work/corpus/src/seqlock.rs:101:9 (tsan+0x20)\n"
                "\n"
                "SUMMARY: ThreadSanitizer: data race /work/corpus/src/seqlock.rs:88:13 in corpus::seqlock::publish\n"
                "==================\n"sv;

        auto log = parse_race_detector_log(output, "/work/corpus");
        REQUIRE(log.findings.size() == 1U);
        CHECK(log.findings[0].signature.shape == "atomic-write/read");
        CHECK(log.findings[0].signature.location == "src/seqlock.rs:88");
        CHECK_FALSE(log.findings[0].test_case);
    }

    TEST_CASE("004: non-race report kinds", "[004][findings][race-detector]") {
        constexpr auto output =
                "==================\n"
                "WARNING: ThreadSanitizer: lock-order-inversion (potential deadlock) (pid=9)\n"
                "  Cycle in lock order graph: M1 (0x7b0c00000010) => M2 (0x7b0c00000040) => M1\n"
                "\n"
                "  Mutex M2 acquired here while holding mutex M1 in thread T1:\n"
                "    #0 pthread_mutex_lock <null> (tsan+0x5)\n"
                "    #1 corpus::bank::transfer /work/corpus/src/bank.rs:31:22 (tsan+0x30)\n"
                "\n"
                "SUMMARY: ThreadSanitizer: lock-order-inversion (potential deadlock) "
                "/work/corpus/src/bank.rs:31:22 in corpus::bank::transfer\n"
                "==================\n"
                "==================\n"
                "WARNING: ThreadSanitizer: thread leak (pid=9)\n"
                "  Thread T4 (tid=12, finished) created by main thread at:\n"
                "    #0 pthread_create <null> (tsan+0x6)\n"
                "    #1 corpus::pool::spawn /work/corpus/src/pool.rs:14:5 (tsan+0x40)\n"
                "\n"
                "SUMMARY: ThreadSanitizer: thread leak /work/corpus/src/pool.rs:14:5 in corpus::pool::spawn\n"
                "==================\n"sv;

        auto log = parse_race_detector_log(output, "/work/corpus");
        REQUIRE(log.findings.size() == 2U);
        CHECK(log.findings[0].signature.kind == finding_kind::lock_order_inversion);
        CHECK(log.findings[0].signature.location == "src/bank.rs:31");
        CHECK(log.findings[0].signature.shape == "lock-order-inversion (potential deadlock)");
        CHECK(log.findings[1].signature.kind == finding_kind::thread_leak);
        CHECK(log.findings[1].signature.location == "src/pool.rs:14");
    }

    TEST_CASE("004: race detector runtime failures are crashes", "[004][findings][race-detector]") {
        auto log = parse_race_detector_log(
                "running 1 test\n"
                "FATAL: ThreadSanitizer: unexpected memory mapping 0x7f0000000000-0x7f0000100000\n",
                "/work/corpus");
        REQUIRE(log.crash_marker);
        CHECK(log.findings.empty());

        auto build = parse_race_detector_log("error: could not compile `corpus` (lib) due to 1 previous error\n", "/work/corpus");
        REQUIRE(build.crash_marker);
        CHECK(*build.crash_marker == "could not compile");
    }

}  // namespace tandem::test
