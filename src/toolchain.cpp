#include "tandem/toolchain.hpp"

#include "tandem/format.hpp"

#include "internal/log.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace tandem::literals;

namespace tandem::detail {

    struct feed_version_record {
        std::string tag{};
        std::vector<std::string> components{};
    };

    struct feed_document {
        std::vector<feed_version_record> versions{};
    };

}  // namespace tandem::detail

namespace glz {

    template <>
    struct meta<tandem::detail::feed_version_record> {
        using T = tandem::detail::feed_version_record;
        static constexpr auto value = object("tag", &T::tag, "components", &T::components);
    };

    template <>
    struct meta<tandem::detail::feed_document> {
        using T = tandem::detail::feed_document;
        static constexpr auto value = object("versions", &T::versions);
    };

}  // namespace glz

namespace tandem {

    namespace detail {

        static constexpr bool is_tag_char(char c) {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '-' ||
                   c == '.' || c == '_';
        }

        static constexpr bool is_separator(char c) { return c == '-' || c == '.' || c == '_'; }

        static std::vector<std::string_view> split_segments(std::string_view text) {
            std::vector<std::string_view> segments{};
            size_t start = 0U;
            for (size_t i = 0U; i <= text.size(); ++i) {
                if (i == text.size() || is_separator(text[i])) {
                    segments.push_back(text.substr(start, i - start));
                    start = i + 1U;
                }
            }
            return segments;
        }

        static bool all_digits(std::string_view text) {
            return !text.empty() && std::ranges::all_of(text, [](char c) { return c >= '0' && c <= '9'; });
        }

        static std::strong_ordering compare_segment(std::string_view lhs, std::string_view rhs) {
            if (all_digits(lhs) && all_digits(rhs)) {
                while (lhs.size() > 1U && lhs.front() == '0') {
                    lhs.remove_prefix(1U);
                }
                while (rhs.size() > 1U && rhs.front() == '0') {
                    rhs.remove_prefix(1U);
                }
                if (lhs.size() != rhs.size()) {
                    return lhs.size() <=> rhs.size();
                }
            }
            return lhs.compare(rhs) <=> 0;
        }

        static fs::path log_path(const harness_config& cfg, std::string_view name) {
            return cfg.work_dir / "logs" / std::string{name};
        }

        static std::string read_feed_file(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                throw resolution_error("toolchain feed file not readable: {}"_format(path.string()));
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            return ss.str();
        }

        static version_tag require_tag(std::string_view text) {
            auto tag = version_tag::parse(text);
            if (!tag) {
                throw resolution_error("invalid version tag in toolchain feed: '{}'"_format(text));
            }
            return *tag;
        }

        static void run_or_throw(const process_runner& runner, process_request request, std::string_view what) {
            auto command = render_command(request.args);
            auto outcome = runner(request);
            if (!outcome.success()) {
                throw resolution_error(
                        "{} failed (exit {}): {}\n{}"_format(what, outcome.exit_code, command, outcome.output));
            }
        }

    }  // namespace detail

    std::optional<version_tag> version_tag::parse(std::string_view text) {
        text = utils::trim_view(text);
        if (text.empty() || detail::is_separator(text.front()) || detail::is_separator(text.back())) {
            return std::nullopt;
        }
        if (!std::ranges::all_of(text, detail::is_tag_char)) {
            return std::nullopt;
        }
        return version_tag{std::string{text}};
    }

    std::strong_ordering version_tag::operator<=>(const version_tag& other) const {
        auto lhs = detail::split_segments(text_);
        auto rhs = detail::split_segments(other.text_);
        auto n = std::min(lhs.size(), rhs.size());
        for (size_t i = 0U; i < n; ++i) {
            if (auto cmp = detail::compare_segment(lhs[i], rhs[i]); cmp != 0) {
                return cmp;
            }
        }
        if (lhs.size() != rhs.size()) {
            return lhs.size() <=> rhs.size();
        }
        // equal segment-wise ("01" vs "1"); fall back to the spelling to keep the order total
        return text_.compare(other.text_) <=> 0;
    }

    std::string toolchain_identity::name() const {
        return "{}-{}"_format(channel, tag);
    }

    bool feed_entry::carries(std::string_view capability) const {
        return std::ranges::find(components, capability) != components.end();
    }

    std::string fetch_feed(const harness_config& cfg, const process_runner& runner) {
        if (cfg.feed_file) {
            internal::log::verbose(cfg, "reading toolchain feed from {}"_format(cfg.feed_file->string()));
            return detail::read_feed_file(*cfg.feed_file);
        }

        auto url = "{}/{}"_format(cfg.feed_url, cfg.capability);
        process_request request{};
        request.args = {cfg.curl_path.string(), "-sSfL", url};
        request.log_path = detail::log_path(cfg, "feed.log");

        internal::log::verbose(cfg, "querying toolchain feed: {}"_format(url));
        auto outcome = runner(request);
        if (!outcome.success()) {
            throw resolution_error(
                    "toolchain feed unreachable (exit {}): {}\n{}"_format(outcome.exit_code, url, outcome.output));
        }
        return outcome.output;
    }

    std::vector<feed_entry> parse_feed(std::string_view text, std::string_view capability) {
        std::vector<feed_entry> entries{};
        auto body = utils::trim_view(text);

        if (body.starts_with('{')) {
            detail::feed_document document{};
            std::string buffer{body};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(document, buffer);
            if (ec) {
                throw resolution_error("malformed toolchain feed: {}"_format(glz::format_error(ec, buffer)));
            }
            entries.reserve(document.versions.size());
            for (auto& record : document.versions) {
                entries.push_back(feed_entry{detail::require_tag(record.tag), std::move(record.components)});
            }
            return entries;
        }

        // plain listing for a single component: every tag carries the queried capability
        for (auto line : utils::split_lines(body)) {
            line = utils::trim_view(line);
            if (line.empty() || line.starts_with('#')) {
                continue;
            }
            std::istringstream tokens{std::string{line}};
            std::string token{};
            while (tokens >> token) {
                entries.push_back(feed_entry{detail::require_tag(token), {std::string{capability}}});
            }
        }
        return entries;
    }

    toolchain_identity select_newest_capable(
            const std::vector<feed_entry>& entries, std::string_view capability, std::string_view channel) {
        const feed_entry* newest = nullptr;
        for (const auto& entry : entries) {
            if (!entry.carries(capability)) {
                continue;
            }
            if (newest == nullptr || newest->tag < entry.tag) {
                newest = &entry;
            }
        }
        if (newest == nullptr) {
            throw resolution_error(
                    "no {}-capable toolchain in feed ({} versions listed)"_format(capability, entries.size()));
        }
        return toolchain_identity{.tag = newest->tag, .channel = std::string{channel}, .interpreter_capable = true};
    }

    void install_toolchain(const harness_config& cfg, const process_runner& runner, const toolchain_identity& identity) {
        if (!identity.interpreter_capable) {
            throw resolution_error("toolchain {} lacks the {} component"_format(identity.name(), cfg.capability));
        }

        auto name = identity.name();
        internal::log::info(cfg, "installing toolchain {} with {}"_format(name, cfg.capability));

        process_request install{};
        install.args = {cfg.rustup_path.string(),
                        "toolchain",
                        "install",
                        name,
                        "--profile",
                        "minimal",
                        "--component",
                        cfg.capability};
        install.log_path = detail::log_path(cfg, "toolchain-install.log");
        detail::run_or_throw(runner, std::move(install), "toolchain install");

        process_request setup{};
        setup.args = {cfg.cargo_path.string(), "+" + name, cfg.capability, "setup"};
        setup.working_dir = cfg.corpus_dir;
        setup.log_path = detail::log_path(cfg, "toolchain-setup.log");
        detail::run_or_throw(runner, std::move(setup), "{} setup"_format(cfg.capability));
    }

    toolchain_identity resolve_toolchain(const harness_config& cfg, const process_runner& runner) {
        auto entries = parse_feed(fetch_feed(cfg, runner), cfg.capability);
        auto identity = select_newest_capable(entries, cfg.capability, cfg.channel);
        internal::log::info(cfg, "resolved toolchain {}"_format(identity.name()));
        install_toolchain(cfg, runner, identity);
        return identity;
    }

    std::optional<std::string> parse_rustup_default(std::string_view output) {
        for (auto line : utils::split_lines(output)) {
            line = utils::trim_view(line);
            if (line.empty() || line.starts_with("error"sv) || line.starts_with("info"sv)) {
                continue;
            }
            auto end = line.find_first_of(" \t");
            return std::string{line.substr(0U, end)};
        }
        return std::nullopt;
    }

    scoped_default_toolchain::scoped_default_toolchain(
            const harness_config& cfg, process_runner runner, const toolchain_identity& identity)
            : rustup_path_{cfg.rustup_path},
              log_path_{detail::log_path(cfg, "rustup-default.log")},
              runner_{std::move(runner)} {
        process_request query{};
        query.args = {rustup_path_.string(), "default"};
        query.log_path = log_path_;
        auto current = runner_(query);
        if (current.success()) {
            previous_ = parse_rustup_default(current.output);
        }

        process_request select{};
        select.args = {rustup_path_.string(), "default", identity.name()};
        select.log_path = log_path_;
        detail::run_or_throw(runner_, std::move(select), "selecting default toolchain");
        internal::log::verbose(
                cfg,
                "default toolchain {} (was {})"_format(identity.name(), previous_ ? *previous_ : "<none>"sv));
    }

    scoped_default_toolchain::~scoped_default_toolchain() {
        if (!previous_) {
            internal::log::warn("no prior default toolchain recorded; leaving the resolved toolchain as default");
            return;
        }
        try {
            process_request restore{};
            restore.args = {rustup_path_.string(), "default", *previous_};
            restore.log_path = log_path_;
            auto outcome = runner_(restore);
            if (!outcome.success()) {
                internal::log::warn("failed to restore default toolchain {}: {}"_format(*previous_, outcome.output));
            }
        } catch (const std::exception& e) {
            internal::log::warn("failed to restore default toolchain {}: {}"_format(*previous_, e.what()));
        }
    }

}  // namespace tandem
