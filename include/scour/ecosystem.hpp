#pragma once

#include "config.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <string_view>
#include <vector>

namespace scour {

    enum class ecosystem : uint8_t {
        javascript_typescript,
        python,
        rust,
    };

    // fixed block order; never depends on detection order
    inline constexpr std::array<ecosystem, 3> ecosystem_order{
            ecosystem::javascript_typescript, ecosystem::python, ecosystem::rust};

    inline constexpr std::string_view to_string(ecosystem eco) {
        switch (eco) {
            case ecosystem::javascript_typescript:
                return "javascript/typescript"sv;
            case ecosystem::python:
                return "python"sv;
            case ecosystem::rust:
                return "rust"sv;
        }
        return "javascript/typescript"sv;
    }

    inline constexpr std::string_view display_name(ecosystem eco) {
        switch (eco) {
            case ecosystem::javascript_typescript:
                return "JavaScript/TypeScript"sv;
            case ecosystem::python:
                return "Python"sv;
            case ecosystem::rust:
                return "Rust"sv;
        }
        return "JavaScript/TypeScript"sv;
    }

    namespace markers {
        inline constexpr auto package_json = "package.json"sv;
        inline constexpr auto tsconfig_json = "tsconfig.json"sv;
        inline constexpr auto eslintrc_json = ".eslintrc.json"sv;
        inline constexpr auto eslintrc_js = ".eslintrc.js"sv;
        inline constexpr auto eslint_config_js = "eslint.config.js"sv;
        inline constexpr auto requirements_txt = "requirements.txt"sv;
        inline constexpr auto pyproject_toml = "pyproject.toml"sv;
        inline constexpr auto cargo_toml = "Cargo.toml"sv;
    }  // namespace markers

    enum class marker : uint8_t {
        package_json,
        tsconfig,
        eslint_config,
        requirements,
        pyproject,
        cargo_toml,
    };

    inline constexpr std::string_view to_string(marker m) {
        switch (m) {
            case marker::package_json:
                return markers::package_json;
            case marker::tsconfig:
                return markers::tsconfig_json;
            case marker::eslint_config:
                return "eslint config"sv;
            case marker::requirements:
                return markers::requirements_txt;
            case marker::pyproject:
                return markers::pyproject_toml;
            case marker::cargo_toml:
                return markers::cargo_toml;
        }
        return "marker"sv;
    }

    struct ecosystem_signal {
        bool package_json{false};
        bool tsconfig{false};
        bool eslint_config{false};
        bool requirements{false};
        bool pyproject{false};
        bool cargo_toml{false};

        constexpr bool has(marker m) const {
            switch (m) {
                case marker::package_json:
                    return package_json;
                case marker::tsconfig:
                    return tsconfig;
                case marker::eslint_config:
                    return eslint_config;
                case marker::requirements:
                    return requirements;
                case marker::pyproject:
                    return pyproject;
                case marker::cargo_toml:
                    return cargo_toml;
            }
            return false;
        }

        constexpr bool active(ecosystem eco) const {
            switch (eco) {
                case ecosystem::javascript_typescript:
                    return package_json;
                case ecosystem::python:
                    return requirements || pyproject;
                case ecosystem::rust:
                    return cargo_toml;
            }
            return false;
        }

        constexpr bool empty() const {
            return !(package_json || tsconfig || eslint_config || requirements || pyproject || cargo_toml);
        }
    };

    // Presence-only check of the marker files in the top level of `target_dir`.
    // A missing or unreadable directory yields an empty signal.
    ecosystem_signal detect_ecosystems(const std::filesystem::path& target_dir);

    // Active ecosystems in block order; each appears at most once.
    std::vector<ecosystem> active_ecosystems(const ecosystem_signal& signal);

}  // namespace scour
