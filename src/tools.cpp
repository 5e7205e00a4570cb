#include "scour/tools.hpp"

#include <algorithm>
#include <array>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace scour {

    namespace detail {

        static constexpr std::array<std::string_view, 3> excluded_source_dirs{"venv"sv, ".venv"sv, "node_modules"sv};

        static bool is_excluded_dir(const fs::path& dir) {
            auto name = dir.filename().string();
            return std::ranges::find(excluded_source_dirs, std::string_view{name}) != excluded_source_dirs.end();
        }

        static tool_spec make_eslint() {
            return tool_spec{
                    .name = std::string{tool_names::eslint},
                    .eco = ecosystem::javascript_typescript,
                    .executable = "npx",
                    .args = {"npx", "eslint", ".", "--format", "json"},
                    .working_dir = working_dir_kind::target,
                    .output_file = std::string{output_files::eslint},
                    .stderr_mode = stderr_policy::discard,
                    .required_markers = {marker::eslint_config},
                    .summary = summary_kind::eslint_json};
        }

        static tool_spec make_tsc() {
            return tool_spec{
                    .name = std::string{tool_names::tsc},
                    .eco = ecosystem::javascript_typescript,
                    .executable = "npx",
                    .args = {"npx", "tsc", "--noEmit"},
                    .working_dir = working_dir_kind::target,
                    .output_file = std::string{output_files::tsc},
                    .stderr_mode = stderr_policy::merge,
                    .required_markers = {marker::tsconfig},
                    .summary = summary_kind::tsc_text};
        }

        static tool_spec make_pylint() {
            return tool_spec{
                    .name = std::string{tool_names::pylint},
                    .eco = ecosystem::python,
                    .executable = "pylint",
                    .args = {"pylint", "--output-format=json"},
                    .working_dir = working_dir_kind::target,
                    .output_file = std::string{output_files::pylint},
                    .stderr_mode = stderr_policy::discard,
                    .append_python_sources = true,
                    .summary = summary_kind::pylint_json};
        }

        static tool_spec make_flake8() {
            return tool_spec{
                    .name = std::string{tool_names::flake8},
                    .eco = ecosystem::python,
                    .executable = "flake8",
                    .args = {"flake8", ".", "--exclude=venv,.venv,node_modules", "--format=json"},
                    .working_dir = working_dir_kind::target,
                    .output_file = std::string{output_files::flake8},
                    .stderr_mode = stderr_policy::discard,
                    .summary = summary_kind::flake8_json};
        }

        static tool_spec make_mypy() {
            return tool_spec{
                    .name = std::string{tool_names::mypy},
                    .eco = ecosystem::python,
                    .executable = "mypy",
                    .args = {"mypy", ".", "--ignore-missing-imports"},
                    .working_dir = working_dir_kind::target,
                    .output_file = std::string{output_files::mypy},
                    .stderr_mode = stderr_policy::merge,
                    .summary = summary_kind::mypy_text};
        }

        static tool_spec make_clippy() {
            return tool_spec{
                    .name = std::string{tool_names::clippy},
                    .eco = ecosystem::rust,
                    .executable = "cargo",
                    .args = {"cargo", "clippy", "--message-format=json"},
                    .working_dir = working_dir_kind::target,
                    .output_file = std::string{output_files::clippy},
                    .stderr_mode = stderr_policy::merge,
                    .summary = summary_kind::clippy_json_lines};
        }

        static tool_spec make_custom_analyzer(
                const session_config& cfg,
                std::string_view name,
                std::string_view script,
                std::string_view output_file,
                summary_kind summary) {
            auto script_path = cfg.analyzers_dir / script;
            return tool_spec{
                    .name = std::string{name},
                    .eco = std::nullopt,
                    .executable = cfg.python,
                    .args = {cfg.python, script_path.string(), cfg.target_dir.string()},
                    .working_dir = working_dir_kind::analyzers,
                    .output_file = std::string{output_file},
                    .stderr_mode = stderr_policy::discard,
                    .required_file = script_path,
                    .summary = summary};
        }

    }  // namespace detail

    std::vector<tool_spec> ecosystem_tools(ecosystem eco) {
        switch (eco) {
            case ecosystem::javascript_typescript:
                return {detail::make_eslint(), detail::make_tsc()};
            case ecosystem::python:
                return {detail::make_pylint(), detail::make_flake8(), detail::make_mypy()};
            case ecosystem::rust:
                return {detail::make_clippy()};
        }
        return {};
    }

    std::vector<tool_spec> custom_analyzer_tools(const session_config& cfg) {
        return {detail::make_custom_analyzer(
                        cfg,
                        tool_names::complexity,
                        analyzer_scripts::complexity,
                        output_files::complexity,
                        summary_kind::complexity_json),
                detail::make_custom_analyzer(
                        cfg,
                        tool_names::code_smells,
                        analyzer_scripts::code_smells,
                        output_files::code_smells,
                        summary_kind::code_smells_json)};
    }

    std::vector<std::string> collect_python_sources(const fs::path& root) {
        std::vector<std::string> sources{};

        std::error_code ec{};
        auto it = fs::recursive_directory_iterator{root, fs::directory_options::skip_permission_denied, ec};
        if (ec) {
            return sources;
        }

        for (auto end = fs::recursive_directory_iterator{}; it != end; it.increment(ec)) {
            if (ec) {
                break;
            }
            const auto& entry = *it;
            std::error_code type_ec{};
            if (entry.is_directory(type_ec)) {
                if (detail::is_excluded_dir(entry.path())) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (entry.is_regular_file(type_ec) && entry.path().extension() == ".py") {
                sources.push_back("./" + entry.path().lexically_relative(root).generic_string());
            }
        }

        std::ranges::sort(sources);
        return sources;
    }

    std::vector<std::string> python_source_args(std::vector<std::string> sources, size_t limit) {
        size_t total = 0;
        for (const auto& source : sources) {
            // each argument also costs its terminator
            total += source.size() + 1U;
        }
        if (total <= limit) {
            return sources;
        }

        std::string ignore{"--ignore="};
        for (auto dir : detail::excluded_source_dirs) {
            if (ignore.back() != '=') {
                ignore += ',';
            }
            ignore += dir;
        }
        return {"--recursive=y", std::move(ignore), "."};
    }

}  // namespace scour
