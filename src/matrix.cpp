#include "tandem/matrix.hpp"

#include "tandem/format.hpp"

#include <stdexcept>

using namespace tandem::literals;

namespace tandem {

    std::string run_configuration::to_string() const {
        if (mode == analysis_mode::interpreted) {
            return "#{} {} threads={}"_format(position, mode, test_threads);
        }
        return "#{} {}/{} threads={}"_format(position, mode, profile, test_threads);
    }

    std::vector<run_configuration> build_matrix(mode_selection selection, unsigned test_threads) {
        if (test_threads == 0U) {
            throw std::invalid_argument("test thread count must be at least 1");
        }

        // positions are fixed by the full matrix so a selection never renumbers an entry
        std::vector<run_configuration> full{
                // the interpreter schedules its own pseudo-threads; the harness scheduler stays at one
                {.mode = analysis_mode::interpreted, .profile = build_profile::debug, .test_threads = 1U, .position = 1U},
                {.mode = analysis_mode::instrumented,
                 .profile = build_profile::debug,
                 .test_threads = test_threads,
                 .position = 2U},
                {.mode = analysis_mode::instrumented,
                 .profile = build_profile::release,
                 .test_threads = test_threads,
                 .position = 3U}};

        std::vector<run_configuration> matrix{};
        for (const auto& configuration : full) {
            if (selects(selection, configuration.mode)) {
                matrix.push_back(configuration);
            }
        }
        return matrix;
    }

    std::vector<run_configuration> restrict_to_position(const std::vector<run_configuration>& matrix, size_t position) {
        for (const auto& configuration : matrix) {
            if (configuration.position == position) {
                return {configuration};
            }
        }
        throw std::out_of_range("no selected run configuration at position {}"_format(position));
    }

}  // namespace tandem
