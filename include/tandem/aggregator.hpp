#pragma once

#include "result.hpp"
#include "suppression.hpp"
#include "toolchain.hpp"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace tandem {

    struct harness_verdict {
        run_outcome overall{run_outcome::fail};
        size_t passed{0U};
        size_t failed{0U};
        size_t resolution_errors{0U};
        std::vector<size_t> failing_positions{};
    };

    // Conjunction over independent configurations: pass iff every result passed. Any resolution
    // error dominates a plain failure. An empty list verified nothing and fails.
    harness_verdict aggregate(const std::vector<run_result>& results);

    int exit_status(const harness_verdict& verdict);

    struct harness_report {
        std::optional<toolchain_identity> toolchain{};
        std::vector<run_result> results{};
        harness_verdict verdict{};
        std::vector<suppression_rule> unused_suppressions{};
        std::vector<suppression_rule> expired_suppressions{};
    };

    void render_table(const harness_report& report, std::ostream& os);
    std::string render_json(const harness_report& report);

}  // namespace tandem
