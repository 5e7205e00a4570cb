#include "scour/invocation.hpp"

#include "scour/format.hpp"

#include "internal/platform.hpp"
#include "internal/process.hpp"

#include <exception>
#include <system_error>

using namespace scour::literals;
namespace fs = std::filesystem;

namespace scour {

    namespace detail {

        static bool any_marker_present(const std::vector<marker>& required, const ecosystem_signal& signal) {
            if (required.empty()) {
                return true;
            }
            for (auto m : required) {
                if (signal.has(m)) {
                    return true;
                }
            }
            return false;
        }

        static std::string describe_markers(const std::vector<marker>& required) {
            std::vector<std::string> names{};
            names.reserve(required.size());
            for (auto m : required) {
                names.emplace_back(to_string(m));
            }
            return utils::join_with_separator(names, " or "sv);
        }

        static bool file_is_empty(const fs::path& path) {
            std::error_code ec{};
            auto size = fs::file_size(path, ec);
            return !ec && size == 0U;
        }

        static void remove_quietly(const fs::path& path) {
            std::error_code ec{};
            fs::remove(path, ec);
        }

        static tool_invocation skip(tool_invocation invocation, skip_reason reason, std::string detail) {
            invocation.outcome = skipped{.reason = reason, .detail = std::move(detail)};
            return invocation;
        }

        static tool_invocation spawn_error(tool_invocation invocation, std::string message) {
            remove_quietly(invocation.output_path);
            invocation.outcome = failed{
                    .kind = failure_kind::spawn_error,
                    .exit_code = -1,
                    .output = {},
                    .message = std::move(message)};
            return invocation;
        }

    }  // namespace detail

    fs::path working_dir_for(const tool_spec& spec, const session_config& cfg) {
        switch (spec.working_dir) {
            case working_dir_kind::target:
                return cfg.target_dir;
            case working_dir_kind::analyzers:
                return cfg.analyzers_dir;
        }
        return cfg.target_dir;
    }

    std::vector<std::string> build_command(
            const tool_spec& spec, const fs::path& resolved, const session_config& cfg) {
        std::vector<std::string> command{spec.args};
        if (command.empty()) {
            command.push_back(resolved.string());
        }
        else {
            command.front() = resolved.string();
        }

        if (spec.append_python_sources) {
            auto sources = python_source_args(collect_python_sources(working_dir_for(spec, cfg)));
            command.insert(command.end(), sources.begin(), sources.end());
        }
        return command;
    }

    prepared_invocation prepare_invocation(
            const tool_spec& spec,
            const ecosystem_signal& signal,
            const session_config& cfg,
            const execution_environment& env) {
        tool_invocation invocation{.tool = spec.name, .output_path = cfg.output_dir / spec.output_file};

        if (!detail::any_marker_present(spec.required_markers, signal)) {
            return {.invocation = detail::skip(
                            std::move(invocation),
                            skip_reason::marker_missing,
                            "no {} in target"_format(detail::describe_markers(spec.required_markers)))};
        }

        if (spec.required_file) {
            std::error_code ec{};
            if (!fs::is_regular_file(*spec.required_file, ec)) {
                return {.invocation = detail::skip(
                                std::move(invocation),
                                skip_reason::tool_missing,
                                "{} not found"_format(spec.required_file->string()))};
            }
        }

        auto resolved = find_executable(spec.executable, env);
        if (!resolved) {
            return {.invocation = detail::skip(
                            std::move(invocation),
                            skip_reason::tool_missing,
                            "{} not found in PATH"_format(spec.executable))};
        }

        try {
            invocation.command = build_command(spec, *resolved, cfg);
        } catch (const std::exception& e) {
            return {.invocation = detail::spawn_error(std::move(invocation), e.what())};
        }

        if (spec.append_python_sources && invocation.command.size() <= spec.args.size()) {
            return {.invocation = detail::skip(
                            std::move(invocation), skip_reason::no_sources, "no *.py files in target")};
        }

        return {.invocation = std::move(invocation), .runnable = true};
    }

    void execute_invocation(const tool_spec& spec, tool_invocation& invocation, const session_config& cfg) {
        internal::process::process_result result{};
        try {
            result = internal::process::run_process(
                    {.args = invocation.command,
                     .working_dir = working_dir_for(spec, cfg),
                     .stdout_path = invocation.output_path,
                     .merge_stderr = spec.stderr_mode == stderr_policy::merge,
                     .timeout_ms = cfg.tool_timeout_ms});
        } catch (const std::exception& e) {
            invocation = detail::spawn_error(std::move(invocation), e.what());
            return;
        }

        if (result.timed_out) {
            invocation.outcome = failed{
                    .kind = failure_kind::timed_out,
                    .exit_code = result.exit_code,
                    .output = invocation.output_path,
                    .message = "killed after {}ms"_format(cfg.tool_timeout_ms)};
            return;
        }

        if (result.exit_code == internal::platform::exec_failure_status &&
            detail::file_is_empty(invocation.output_path)) {
            auto message = "failed to execute {}"_format(invocation.command.front());
            invocation = detail::spawn_error(std::move(invocation), std::move(message));
            return;
        }

        if (result.exit_code != 0) {
            invocation.outcome = failed{
                    .kind = failure_kind::nonzero_exit,
                    .exit_code = result.exit_code,
                    .output = invocation.output_path,
                    .message = "exited with status {}"_format(result.exit_code)};
            return;
        }

        invocation.outcome = succeeded{.output = invocation.output_path};
    }

    tool_invocation invoke_tool(
            const tool_spec& spec,
            const ecosystem_signal& signal,
            const session_config& cfg,
            const execution_environment& env) {
        auto prepared = prepare_invocation(spec, signal, cfg, env);
        if (prepared.runnable) {
            execute_invocation(spec, prepared.invocation, cfg);
        }
        return std::move(prepared.invocation);
    }

}  // namespace scour
