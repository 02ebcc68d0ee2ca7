#pragma once

#include "aggregator.hpp"
#include "config.hpp"
#include "invoker.hpp"
#include "matrix.hpp"

#include <string_view>
#include <vector>

namespace tandem {

    std::vector<run_configuration> plan_runs(const harness_config& cfg);

    // Loads the registry, resolves the toolchain, then executes every configuration sequentially.
    // Throws registry_load_error or resolution_error before any configuration runs. Tool crashes
    // inside a configuration are recorded as that configuration's resolution error and the
    // remaining configurations still run.
    harness_report run_harness(const harness_config& cfg, const process_runner& runner, std::string_view today);

}  // namespace tandem
