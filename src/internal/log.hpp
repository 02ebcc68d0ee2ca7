#pragma once

#include "tandem/config.hpp"

#include <iostream>
#include <string_view>

namespace tandem::internal::log {

    // Progress lines go to stderr so stdout stays a clean report.
    inline void info(const harness_config& cfg, std::string_view message) {
        if (!cfg.quiet) {
            std::cerr << "[tandem] " << message << '\n';
        }
    }

    inline void verbose(const harness_config& cfg, std::string_view message) {
        if (cfg.verbose) {
            std::cerr << "[tandem] " << message << '\n';
        }
    }

    inline void warn(std::string_view message) { std::cerr << "[tandem] warning: " << message << '\n'; }

}  // namespace tandem::internal::log
