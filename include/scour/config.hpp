#pragma once

#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace scour {

    using namespace std::string_view_literals;

    /*
     * Scour Session Config Options
     *
     * Paths
     * - target_dir: Directory under review; markers are looked up in its top level only.
     * - output_dir: Directory receiving one captured file per tool that ran, plus REVIEW.md.
     * - analyzers_dir: Location of the custom analyzers and the report generator.
     *
     * Toolchain
     * - python: Interpreter used to run the custom analyzers and the report generator.
     * - search_path: Executable search path the availability probe consults (PATH at startup).
     * - tool_timeout_ms: Wall-clock budget per external tool; 0 disables the limit.
     *
     * Console
     * - color: ANSI color behavior for the transcript.
     * - output: Final session summary shape ("table" or "json").
     * - summary_lines: Number of REVIEW.md lines echoed after the report is generated.
     * - quiet/verbose: Coarse transcript verbosity knobs.
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print resolved session config and exit.
     */

    inline constexpr auto default_output_dir = ".code-review-output"sv;
    inline constexpr auto default_python = "python3"sv;
    inline constexpr int default_tool_timeout_ms{600'000};
    inline constexpr size_t default_summary_lines{20U};

    enum class output_mode { table, json };
    enum class color_mode { automatic, always, never };

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::table:
                return "table"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "table"sv;
    }

    inline constexpr std::string_view to_string(color_mode mode) {
        switch (mode) {
            case color_mode::automatic:
                return "auto"sv;
            case color_mode::always:
                return "always"sv;
            case color_mode::never:
                return "never"sv;
        }
        return "auto"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "table"sv)) {
            out = output_mode::table;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    inline constexpr bool try_parse_color_mode(std::string_view text, color_mode& out) {
        if (utils::str_case_eq(text, "auto"sv)) {
            out = color_mode::automatic;
            return true;
        }
        if (utils::str_case_eq(text, "always"sv)) {
            out = color_mode::always;
            return true;
        }
        if (utils::str_case_eq(text, "never"sv)) {
            out = color_mode::never;
            return true;
        }
        return false;
    }

    struct session_config {
        std::filesystem::path target_dir{"."};
        std::filesystem::path output_dir{default_output_dir};
        std::filesystem::path analyzers_dir{"."};

        std::string python{default_python};
        std::string search_path{};
        int tool_timeout_ms{default_tool_timeout_ms};

        color_mode color{color_mode::automatic};
        output_mode output{output_mode::table};
        size_t summary_lines{default_summary_lines};
        bool quiet{false};
        bool verbose{false};

        bool print_config{false};
    };

    // Directory of the running executable; the custom analyzers ship next to it.
    std::filesystem::path default_analyzers_dir();

    // Absolutizes target/output/analyzer directories so child working directories cannot skew them.
    // Missing directories are allowed: detection treats them as empty.
    session_config resolve_paths(session_config cfg);

}  // namespace scour
