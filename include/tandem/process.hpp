#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tandem {

    struct process_request {
        std::vector<std::string> args{};
        std::vector<std::pair<std::string, std::string>> env{};
        std::optional<std::filesystem::path> working_dir{};
        // stdout and stderr are both written here, interleaved in emission order
        std::filesystem::path log_path{};
    };

    struct process_outcome {
        int exit_code{-1};
        bool signaled{false};
        int signal{0};
        std::string output{};

        bool success() const { return !signaled && exit_code == 0; }
    };

    // Seam between the invokers and the operating system; tests substitute scripted runners.
    using process_runner = std::function<process_outcome(const process_request&)>;

    process_outcome run_process(const process_request& request);

    process_runner make_system_runner();

    std::string render_command(const std::vector<std::string>& args);

}  // namespace tandem
