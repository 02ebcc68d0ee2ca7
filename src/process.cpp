#include "tandem/process.hpp"

#include "tandem/format.hpp"

extern "C" {
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;
using namespace tandem::literals;

namespace tandem {

    namespace detail {

        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                return {};
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            return ss.str();
        }

        static void ensure_parent_dir(const fs::path& path) {
            auto parent = path.parent_path();
            if (parent.empty()) {
                return;
            }
            std::error_code ec{};
            fs::create_directories(parent, ec);
            if (ec) {
                throw std::runtime_error("failed to create directory: {}"_format(parent.string()));
            }
        }

        static int open_write_file(const fs::path& path) {
            auto fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
            if (fd < 0) {
                throw std::runtime_error("failed to open file for write: {}"_format(path.string()));
            }
            return fd;
        }

        static bool needs_quoting(const std::string& arg) {
            return arg.empty() || arg.find_first_of(" \t\"'$\\") != std::string::npos;
        }

    }  // namespace detail

    std::string render_command(const std::vector<std::string>& args) {
        std::string out{};
        for (const auto& arg : args) {
            if (!out.empty()) {
                out += ' ';
            }
            if (detail::needs_quoting(arg)) {
                out += '\'';
                out += arg;
                out += '\'';
            }
            else {
                out += arg;
            }
        }
        return out;
    }

    process_outcome run_process(const process_request& request) {
        if (request.args.empty()) {
            throw std::runtime_error("run_process requires a command");
        }
        if (request.log_path.empty()) {
            throw std::runtime_error("run_process requires a log path: {}"_format(render_command(request.args)));
        }

        detail::ensure_parent_dir(request.log_path);
        auto log_fd = detail::open_write_file(request.log_path);

        auto pid = ::fork();
        if (pid < 0) {
            ::close(log_fd);
            throw std::runtime_error("fork failed");
        }

        if (pid == 0) {
            if (::dup2(log_fd, STDOUT_FILENO) < 0) {
                _exit(127);
            }
            if (::dup2(log_fd, STDERR_FILENO) < 0) {
                _exit(127);
            }
            ::close(log_fd);

            if (request.working_dir && ::chdir(request.working_dir->c_str()) != 0) {
                _exit(127);
            }
            for (const auto& [key, value] : request.env) {
                if (::setenv(key.c_str(), value.c_str(), 1) != 0) {
                    _exit(127);
                }
            }

            std::vector<char*> argv{};
            argv.reserve(request.args.size() + 1U);
            for (const auto& arg : request.args) {
                argv.push_back(const_cast<char*>(arg.c_str()));
            }
            argv.push_back(nullptr);

            ::execvp(argv[0], argv.data());
            _exit(127);
        }

        ::close(log_fd);

        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                throw std::runtime_error("waitpid failed for: {}"_format(render_command(request.args)));
            }
        }

        process_outcome outcome{};
        if (WIFEXITED(status)) {
            outcome.exit_code = WEXITSTATUS(status);
        }
        else if (WIFSIGNALED(status)) {
            outcome.signaled = true;
            outcome.signal = WTERMSIG(status);
            outcome.exit_code = 128 + outcome.signal;
        }
        else {
            outcome.exit_code = 1;
        }
        outcome.output = detail::read_text_file(request.log_path);

        debug_log("ran '", render_command(request.args), "' -> ", outcome.exit_code);
        return outcome;
    }

    process_runner make_system_runner() {
        return [](const process_request& request) { return run_process(request); };
    }

}  // namespace tandem
