#pragma once

#include <string_view>

namespace tandem::internal::platform {
    using namespace std::string_view_literals;

    namespace tool {
        inline constexpr auto cargo = "cargo"sv;
        inline constexpr auto rustup = "rustup"sv;
        inline constexpr auto curl = "curl"sv;
        // absolute paths found at configure time; empty when the tool was not on PATH
        inline constexpr auto cargo_path = std::string_view{TANDEM_CARGO_EXECUTABLE_PATH};
        inline constexpr auto rustup_path = std::string_view{TANDEM_RUSTUP_EXECUTABLE_PATH};
        inline constexpr auto curl_path = std::string_view{TANDEM_CURL_EXECUTABLE_PATH};

        constexpr std::string_view resolved(std::string_view configured, std::string_view fallback) {
            return configured.empty() ? fallback : configured;
        }
    }  // namespace tool

}  // namespace tandem::internal::platform
