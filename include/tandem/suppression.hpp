#pragma once

#include "errors.hpp"
#include "finding.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tandem {

    struct suppression_rule {
        finding_signature signature{};
        std::string justification{};
        std::optional<std::string> owner{};
        // YYYY-MM-DD; the rule stops applying after this day
        std::optional<std::string> expires{};

        bool expired_on(std::string_view today) const;
    };

    enum class classification : uint8_t { suppressed, unsuppressed };

    inline constexpr std::string_view to_string(classification c) {
        switch (c) {
            case classification::suppressed:
                return "suppressed"sv;
            case classification::unsuppressed:
                return "unsuppressed"sv;
        }
        return "unsuppressed"sv;
    }

    // Justified, exact-signature exceptions for race-detector findings.
    // Loaded once per invocation and read-only afterwards. The harness never writes rules.
    class suppression_registry {
      public:
        suppression_registry() = default;

        // Validates every rule; the first invalid rule fails the whole load. Rules whose expiry is
        // before `today` are kept for reporting but never match.
        static suppression_registry from_rules(std::vector<suppression_rule> rules, std::string_view today);

        classification classify(const finding_signature& signature) const;

        const suppression_rule* match(const finding_signature& signature) const;

        const std::vector<suppression_rule>& active() const { return active_; }
        const std::vector<suppression_rule>& expired() const { return expired_; }
        const std::filesystem::path& source() const { return source_; }
        bool empty() const { return active_.empty() && expired_.empty(); }

      private:
        friend suppression_registry load_suppressions(
                const std::filesystem::path& path, std::string_view today, bool required);

        std::vector<suppression_rule> active_{};
        std::vector<suppression_rule> expired_{};
        std::filesystem::path source_{};
    };

    // Parses the JSON registry text; `origin` names the source in error messages.
    std::vector<suppression_rule> parse_suppressions(std::string_view json, std::string_view origin);

    // Loads and validates the registry file. A missing file yields an empty registry unless `required`.
    suppression_registry load_suppressions(const std::filesystem::path& path, std::string_view today, bool required);

    // Rules from the active set that matched none of `findings`.
    std::vector<suppression_rule> unused_rules(
            const suppression_registry& registry, const std::vector<finding>& findings);

    // Current UTC date as YYYY-MM-DD.
    std::string today_iso_date();

}  // namespace tandem

namespace std {
    template <>
    struct formatter<tandem::classification, char> : formatter<std::string_view> {
        template <typename FormatContext>
        auto format(const tandem::classification& val, FormatContext& ctx) const {
            return formatter<std::string_view>::format(tandem::to_string(val), ctx);
        }
    };
}  // namespace std
