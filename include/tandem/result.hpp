#pragma once

#include "finding.hpp"
#include "matrix.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tandem {

    enum class run_outcome : uint8_t { pass, fail, resolution_error };

    inline constexpr std::string_view to_string(run_outcome outcome) {
        switch (outcome) {
            case run_outcome::pass:
                return "pass"sv;
            case run_outcome::fail:
                return "fail"sv;
            case run_outcome::resolution_error:
                return "resolution-error"sv;
        }
        return "fail"sv;
    }

    // Native tool payloads; kept opaque and never normalised into a shared format.
    struct interpreted_diagnostics {
        std::vector<std::string> command{};
        std::string toolchain{};
        int exit_code{-1};
        bool signaled{false};
        std::filesystem::path log_path{};
        std::string raw_output{};
    };

    struct instrumented_diagnostics {
        std::vector<std::string> command{};
        std::string sanitizer_options{};
        int exit_code{-1};
        bool signaled{false};
        std::filesystem::path log_path{};
        std::string raw_output{};
    };

    using tool_diagnostics = std::variant<interpreted_diagnostics, instrumented_diagnostics>;

    struct run_result {
        run_configuration configuration{};
        run_outcome outcome{run_outcome::fail};
        std::vector<finding> findings{};
        tool_diagnostics diagnostics{};
        // harness-side context: crash reasons, cleanup warnings
        std::vector<std::string> notes{};

        size_t count(finding_severity severity) const;
    };

    const std::vector<std::string>& command_of(const tool_diagnostics& diagnostics);
    const std::filesystem::path& log_path_of(const tool_diagnostics& diagnostics);
    int exit_code_of(const tool_diagnostics& diagnostics);

}  // namespace tandem

namespace std {
    template <>
    struct formatter<tandem::run_outcome, char> : formatter<std::string_view> {
        template <typename FormatContext>
        auto format(const tandem::run_outcome& val, FormatContext& ctx) const {
            return formatter<std::string_view>::format(tandem::to_string(val), ctx);
        }
    };
}  // namespace std
