#include "tandem/suppression.hpp"

#include "tandem/format.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;
using namespace tandem::literals;

namespace tandem::detail {

    struct suppression_record {
        std::string kind{};
        std::string location{};
        std::string shape{};
        std::string justification{};
        std::optional<std::string> owner{};
        std::optional<std::string> expires{};
    };

    struct suppression_document {
        int schema_version{1};
        std::vector<suppression_record> rules{};
    };

}  // namespace tandem::detail

namespace glz {

    template <>
    struct meta<tandem::detail::suppression_record> {
        using T = tandem::detail::suppression_record;
        static constexpr auto value =
                object("kind",
                       &T::kind,
                       "location",
                       &T::location,
                       "shape",
                       &T::shape,
                       "justification",
                       &T::justification,
                       "owner",
                       &T::owner,
                       "expires",
                       &T::expires);
    };

    template <>
    struct meta<tandem::detail::suppression_document> {
        using T = tandem::detail::suppression_document;
        static constexpr auto value = object("schema_version", &T::schema_version, "rules", &T::rules);
    };

}  // namespace glz

namespace tandem {

    namespace detail {

        static constexpr int supported_schema_version = 1;

        static std::string read_registry_file(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                throw registry_load_error("failed to open suppression registry {}"_format(path.string()));
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (!in.good() && !in.eof()) {
                throw registry_load_error("failed to read suppression registry {}"_format(path.string()));
            }
            return ss.str();
        }

        static suppression_rule to_rule(suppression_record&& record, size_t index, std::string_view origin) {
            auto fail = [&](std::string_view why) {
                return registry_load_error("{}: rule #{}: {}"_format(origin, index + 1U, why));
            };

            suppression_rule rule{};
            if (!try_parse_finding_kind(record.kind, rule.signature.kind)) {
                throw fail("unknown kind '{}'"_format(record.kind));
            }
            if (rule.signature.kind == finding_kind::test_failure) {
                throw fail("test failures cannot be suppressed");
            }
            if (utils::trim_view(record.location).empty()) {
                throw fail("missing location");
            }
            if (utils::trim_view(record.shape).empty()) {
                throw fail("missing shape");
            }
            if (utils::trim_view(record.justification).empty()) {
                throw fail("missing justification");
            }
            if (record.expires && !utils::is_iso_date(*record.expires)) {
                throw fail("expires must be YYYY-MM-DD, got '{}'"_format(*record.expires));
            }
            if (record.owner && utils::trim_view(*record.owner).empty()) {
                throw fail("owner, when present, must be non-empty");
            }

            rule.signature.location = std::move(record.location);
            rule.signature.shape = std::move(record.shape);
            rule.justification = std::move(record.justification);
            rule.owner = std::move(record.owner);
            rule.expires = std::move(record.expires);
            return rule;
        }

    }  // namespace detail

    bool suppression_rule::expired_on(std::string_view today) const {
        // ISO dates order lexicographically
        return expires && std::string_view{*expires} < today;
    }

    suppression_registry suppression_registry::from_rules(std::vector<suppression_rule> rules, std::string_view today) {
        suppression_registry registry{};
        for (size_t i = 0U; i < rules.size(); ++i) {
            auto& rule = rules[i];
            if (utils::trim_view(rule.justification).empty()) {
                throw registry_load_error("rule #{} ({}): missing justification"_format(i + 1U, rule.signature));
            }
            auto duplicate = std::ranges::any_of(
                    rules.begin(), rules.begin() + static_cast<std::ptrdiff_t>(i), [&](const suppression_rule& other) {
                        return other.signature == rule.signature;
                    });
            if (duplicate) {
                throw registry_load_error("rule #{} ({}): duplicate signature"_format(i + 1U, rule.signature));
            }
        }
        for (auto& rule : rules) {
            if (rule.expired_on(today)) {
                registry.expired_.push_back(std::move(rule));
            }
            else {
                registry.active_.push_back(std::move(rule));
            }
        }
        return registry;
    }

    const suppression_rule* suppression_registry::match(const finding_signature& signature) const {
        auto it = std::ranges::find_if(active_, [&](const suppression_rule& rule) { return rule.signature == signature; });
        return it == active_.end() ? nullptr : &*it;
    }

    classification suppression_registry::classify(const finding_signature& signature) const {
        return match(signature) != nullptr ? classification::suppressed : classification::unsuppressed;
    }

    std::vector<suppression_rule> parse_suppressions(std::string_view json, std::string_view origin) {
        detail::suppression_document document{};
        std::string buffer{json};
        auto ec = glz::read_json(document, buffer);
        if (ec) {
            throw registry_load_error("{}: malformed suppression registry: {}"_format(origin, glz::format_error(ec, buffer)));
        }
        if (document.schema_version > detail::supported_schema_version) {
            throw registry_load_error(
                    "{}: unsupported schema_version {} > {}"_format(
                            origin, document.schema_version, detail::supported_schema_version));
        }

        std::vector<suppression_rule> rules{};
        rules.reserve(document.rules.size());
        for (size_t i = 0U; i < document.rules.size(); ++i) {
            rules.push_back(detail::to_rule(std::move(document.rules[i]), i, origin));
        }
        return rules;
    }

    suppression_registry load_suppressions(const fs::path& path, std::string_view today, bool required) {
        std::error_code ec{};
        if (!fs::exists(path, ec)) {
            if (required) {
                throw registry_load_error("suppression registry not found: {}"_format(path.string()));
            }
            suppression_registry registry{};
            registry.source_ = path;
            return registry;
        }

        auto text = detail::read_registry_file(path);
        auto origin = path.string();
        auto registry = suppression_registry::from_rules(parse_suppressions(text, origin), today);
        registry.source_ = path;
        debug_log("loaded ", registry.active().size(), " active suppressions from ", origin);
        return registry;
    }

    std::vector<suppression_rule> unused_rules(const suppression_registry& registry, const std::vector<finding>& findings) {
        std::vector<suppression_rule> unused{};
        for (const auto& rule : registry.active()) {
            auto used = std::ranges::any_of(findings, [&](const finding& f) {
                return f.severity == finding_severity::suppressed_informational && f.signature == rule.signature;
            });
            if (!used) {
                unused.push_back(rule);
            }
        }
        return unused;
    }

    std::string today_iso_date() {
        auto today = std::chrono::year_month_day{std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now())};
        return "{}"_format(today);
    }

}  // namespace tandem
