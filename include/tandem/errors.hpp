#pragma once

#include <stdexcept>
#include <string>

namespace tandem {

    // No compatible toolchain (or the feed/installer failed); aborts before any test case executes.
    struct resolution_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // Malformed or unjustified suppression rule; aborts before the instrumented run.
    struct registry_load_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

}  // namespace tandem
