#pragma once

#include "config.hpp"
#include "process.hpp"
#include "result.hpp"
#include "suppression.hpp"
#include "toolchain.hpp"

#include <optional>

namespace tandem {

    // Everything an invoker needs, threaded explicitly instead of read from process-wide state.
    struct execution_context {
        harness_config config{};
        process_runner runner{};
        // resolved toolchain for the interpreted analysis; absent when only instrumented runs are selected
        std::optional<toolchain_identity> toolchain{};
        // consulted by the instrumented invoker only
        suppression_registry suppressions{};
    };

    process_request build_interpreted_request(const execution_context& ctx, const run_configuration& configuration);
    process_request build_instrumented_request(const execution_context& ctx, const run_configuration& configuration);

    // Runs the corpus once under the interpreter. Cached interpretation state is cleared before and
    // after the run.
    run_result execute_interpreted(const execution_context& ctx, const run_configuration& configuration);

    // Builds and runs the corpus with race instrumentation and classifies every report against the
    // suppression registry.
    run_result execute_instrumented(const execution_context& ctx, const run_configuration& configuration);

    run_result execute(const execution_context& ctx, const run_configuration& configuration);

}  // namespace tandem
