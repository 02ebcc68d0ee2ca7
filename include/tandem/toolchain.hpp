#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "process.hpp"

#include <compare>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tandem {

    // Opaque, totally ordered toolchain version tag.
    // Tags are split on '-', '.' and '_'; segments compare numerically when both are all digits and
    // lexicographically otherwise, so date stamps ("2024-05-01") order chronologically.
    class version_tag {
      public:
        static constexpr bool to_string_formattable = true;

        version_tag() = default;

        static std::optional<version_tag> parse(std::string_view text);

        const std::string& to_string() const { return text_; }

        std::strong_ordering operator<=>(const version_tag& other) const;
        bool operator==(const version_tag& other) const { return (*this <=> other) == 0; }

      private:
        explicit version_tag(std::string text) : text_{std::move(text)} {}

        std::string text_{};
    };

    struct toolchain_identity {
        version_tag tag{};
        std::string channel{"nightly"};
        bool interpreter_capable{false};

        // rustup toolchain name, e.g. "nightly-2024-05-01"
        std::string name() const;
    };

    struct feed_entry {
        version_tag tag{};
        std::vector<std::string> components{};

        bool carries(std::string_view capability) const;
    };

    std::string fetch_feed(const harness_config& cfg, const process_runner& runner);

    // Parses either the JSON listing or the plain per-component listing. Throws resolution_error on
    // malformed input.
    std::vector<feed_entry> parse_feed(std::string_view text, std::string_view capability);

    // Newest entry carrying the capability; throws resolution_error when there is none.
    toolchain_identity select_newest_capable(
            const std::vector<feed_entry>& entries, std::string_view capability, std::string_view channel);

    void install_toolchain(const harness_config& cfg, const process_runner& runner, const toolchain_identity& identity);

    toolchain_identity resolve_toolchain(const harness_config& cfg, const process_runner& runner);

    // Switches the host-wide default toolchain and restores the prior default on destruction.
    // The default is global to the host; two harness invocations must not hold one concurrently.
    class scoped_default_toolchain {
      public:
        scoped_default_toolchain(const harness_config& cfg, process_runner runner, const toolchain_identity& identity);
        ~scoped_default_toolchain();

        scoped_default_toolchain(const scoped_default_toolchain&) = delete;
        scoped_default_toolchain& operator=(const scoped_default_toolchain&) = delete;

        const std::optional<std::string>& previous() const { return previous_; }

      private:
        std::filesystem::path rustup_path_;
        std::filesystem::path log_path_;
        process_runner runner_;
        std::optional<std::string> previous_{};
    };

    // Extracts the toolchain name from `rustup default` output ("nightly-x86_64-unknown-linux-gnu (default)").
    std::optional<std::string> parse_rustup_default(std::string_view output);

}  // namespace tandem
