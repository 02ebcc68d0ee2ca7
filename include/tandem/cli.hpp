#pragma once

#include "config.hpp"
#include "process.hpp"

#include <optional>
#include <ostream>

namespace tandem::cli {

    // Resolves the harness config from defaults, the optional JSON config file, environment and
    // command line, in increasing precedence. Returns an exit status when the invocation is
    // complete after parsing (--help, --version, --print-config, usage errors).
    std::optional<int> parse_cli(int argc, char** argv, harness_config& cfg);

    // Runs the harness (or the one-shot --print-matrix / --check-suppressions actions) and returns
    // the process exit status.
    int run(const harness_config& cfg, const process_runner& runner, std::ostream& out);

}  // namespace tandem::cli
