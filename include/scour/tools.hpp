#pragma once

#include "config.hpp"
#include "ecosystem.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scour {

    enum class working_dir_kind : uint8_t { target, analyzers };

    enum class stderr_policy : uint8_t { discard, merge };

    enum class summary_kind : uint8_t {
        eslint_json,
        tsc_text,
        pylint_json,
        flake8_json,
        mypy_text,
        clippy_json_lines,
        complexity_json,
        code_smells_json,
    };

    inline constexpr std::string_view to_string(summary_kind kind) {
        switch (kind) {
            case summary_kind::eslint_json:
                return "eslint_json"sv;
            case summary_kind::tsc_text:
                return "tsc_text"sv;
            case summary_kind::pylint_json:
                return "pylint_json"sv;
            case summary_kind::flake8_json:
                return "flake8_json"sv;
            case summary_kind::mypy_text:
                return "mypy_text"sv;
            case summary_kind::clippy_json_lines:
                return "clippy_json_lines"sv;
            case summary_kind::complexity_json:
                return "complexity_json"sv;
            case summary_kind::code_smells_json:
                return "code_smells_json"sv;
        }
        return "tsc_text"sv;
    }

    namespace tool_names {
        inline constexpr auto eslint = "ESLint"sv;
        inline constexpr auto tsc = "TypeScript compiler"sv;
        inline constexpr auto pylint = "Pylint"sv;
        inline constexpr auto flake8 = "Flake8"sv;
        inline constexpr auto mypy = "MyPy"sv;
        inline constexpr auto clippy = "Clippy"sv;
        inline constexpr auto complexity = "Complexity analysis"sv;
        inline constexpr auto code_smells = "Code smell detection"sv;
        inline constexpr auto report = "Review report"sv;
    }  // namespace tool_names

    namespace output_files {
        inline constexpr auto eslint = "eslint-report.json"sv;
        inline constexpr auto tsc = "tsc-errors.txt"sv;
        inline constexpr auto pylint = "pylint-report.json"sv;
        inline constexpr auto flake8 = "flake8-report.json"sv;
        inline constexpr auto mypy = "mypy-report.txt"sv;
        inline constexpr auto clippy = "clippy-report.json"sv;
        inline constexpr auto complexity = "complexity-report.json"sv;
        inline constexpr auto code_smells = "code-smells-report.json"sv;
        inline constexpr auto review = "REVIEW.md"sv;
    }  // namespace output_files

    namespace analyzer_scripts {
        inline constexpr auto complexity = "analyze_complexity.py"sv;
        inline constexpr auto code_smells = "detect_code_smells.py"sv;
        inline constexpr auto report = "generate_review_report.py"sv;
    }  // namespace analyzer_scripts

    struct tool_spec {
        std::string name{};
        std::optional<ecosystem> eco{};
        // executable handed to the availability probe; argv[0] is replaced by the resolved path
        std::string executable{};
        std::vector<std::string> args{};
        working_dir_kind working_dir{working_dir_kind::target};
        std::string output_file{};
        stderr_policy stderr_mode{stderr_policy::discard};
        // tool runs only if at least one of these is present (empty = no extra gate)
        std::vector<marker> required_markers{};
        // file that must exist besides the executable (custom analyzer scripts)
        std::optional<std::filesystem::path> required_file{};
        // pylint: the *.py files under the target are appended to args
        bool append_python_sources{false};
        summary_kind summary{summary_kind::tsc_text};
    };

    // Fixed, ordered tool list of one ecosystem block.
    std::vector<tool_spec> ecosystem_tools(ecosystem eco);

    // Complexity analysis, then code smell detection; both run `cfg.python <script> <target_dir>`.
    std::vector<tool_spec> custom_analyzer_tools(const session_config& cfg);

    // Recursive *.py listing relative to `root`, skipping venv, .venv and node_modules, sorted.
    std::vector<std::string> collect_python_sources(const std::filesystem::path& root);

    // Above this many bytes of file arguments Pylint walks the target itself instead (execv E2BIG).
    inline constexpr size_t max_source_args_bytes{128U * 1024U};

    // `sources` unchanged while they fit in `limit` bytes, otherwise a recursive `.` scan with the
    // same directory exclusions. Empty stays empty.
    std::vector<std::string> python_source_args(
            std::vector<std::string> sources, size_t limit = max_source_args_bytes);

}  // namespace scour
