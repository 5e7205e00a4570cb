#pragma once

#include "config.hpp"
#include "probe.hpp"
#include "tools.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace scour {

    enum class skip_reason : uint8_t {
        tool_missing,
        marker_missing,
        no_sources,
    };

    inline constexpr std::string_view to_string(skip_reason reason) {
        switch (reason) {
            case skip_reason::tool_missing:
                return "tool_missing"sv;
            case skip_reason::marker_missing:
                return "marker_missing"sv;
            case skip_reason::no_sources:
                return "no_sources"sv;
        }
        return "tool_missing"sv;
    }

    enum class failure_kind : uint8_t {
        nonzero_exit,
        timed_out,
        spawn_error,
    };

    inline constexpr std::string_view to_string(failure_kind kind) {
        switch (kind) {
            case failure_kind::nonzero_exit:
                return "nonzero_exit"sv;
            case failure_kind::timed_out:
                return "timed_out"sv;
            case failure_kind::spawn_error:
                return "spawn_error"sv;
        }
        return "nonzero_exit"sv;
    }

    struct skipped {
        skip_reason reason{skip_reason::tool_missing};
        std::string detail{};
    };

    struct failed {
        failure_kind kind{failure_kind::nonzero_exit};
        int exit_code{-1};
        std::filesystem::path output{};
        std::string message{};
    };

    struct succeeded {
        std::filesystem::path output{};
    };

    using invocation_outcome = std::variant<skipped, failed, succeeded>;

    struct tool_invocation {
        std::string tool{};
        std::filesystem::path output_path{};
        std::vector<std::string> command{};
        invocation_outcome outcome{skipped{}};

        bool ran() const {
            if (std::holds_alternative<succeeded>(outcome)) {
                return true;
            }
            if (auto* f = std::get_if<failed>(&outcome)) {
                return f->kind != failure_kind::spawn_error;
            }
            return false;
        }

        bool was_skipped() const { return std::holds_alternative<skipped>(outcome); }
    };

    std::filesystem::path working_dir_for(const tool_spec& spec, const session_config& cfg);

    // Builds the argv that would be executed for `spec`, with argv[0] already resolved.
    std::vector<std::string> build_command(
            const tool_spec& spec, const std::filesystem::path& resolved, const session_config& cfg);

    struct prepared_invocation {
        tool_invocation invocation{};
        // false when a gate already decided the outcome (skip or spawn error)
        bool runnable{false};
    };

    // Applies the marker, required-file, availability and source gates and resolves the command line.
    prepared_invocation prepare_invocation(
            const tool_spec& spec,
            const ecosystem_signal& signal,
            const session_config& cfg,
            const execution_environment& env);

    // Starts the prepared command and records its outcome in `invocation`.
    void execute_invocation(const tool_spec& spec, tool_invocation& invocation, const session_config& cfg);

    // prepare_invocation followed by execute_invocation. Never throws: spawn problems, nonzero exits and timeouts all come
    // back as `failed`; a missing executable or marker comes back as `skipped`.
    tool_invocation invoke_tool(
            const tool_spec& spec,
            const ecosystem_signal& signal,
            const session_config& cfg,
            const execution_environment& env);

}  // namespace scour
