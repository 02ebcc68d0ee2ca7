#pragma once

#include "config.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace tandem {

    struct run_configuration {
        static constexpr bool to_string_formattable = true;

        analysis_mode mode{analysis_mode::interpreted};
        // not meaningful under interpretation; recorded as debug
        build_profile profile{build_profile::debug};
        unsigned test_threads{1U};
        // 1-based index in the full matrix; a mode selection never renumbers an entry
        size_t position{0U};

        bool operator==(const run_configuration&) const = default;

        std::string to_string() const;
    };

    // Interpreted (#1) first, then instrumented debug (#2) and release (#3), filtered by selection.
    // Throws std::invalid_argument when `test_threads` is 0.
    std::vector<run_configuration> build_matrix(mode_selection selection, unsigned test_threads);

    std::vector<run_configuration> restrict_to_position(const std::vector<run_configuration>& matrix, size_t position);

}  // namespace tandem
