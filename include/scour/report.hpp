#pragma once

#include "config.hpp"
#include "invocation.hpp"
#include "probe.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace scour {

    struct report_outcome {
        // false when the interpreter or generator script is absent
        bool generator_found{false};
        tool_invocation invocation{};
        std::filesystem::path report_path{};
        std::vector<std::string> excerpt{};

        bool generated() const { return generator_found && invocation.ran(); }
    };

    std::filesystem::path report_generator_path(const session_config& cfg);

    // First `max_lines` lines of `path`; empty when unreadable.
    std::vector<std::string> read_head(const std::filesystem::path& path, size_t max_lines);

    // Runs `<python> generate_review_report.py <output_dir>` into REVIEW.md. Never throws.
    report_outcome dispatch_report(const session_config& cfg, const execution_environment& env);

}  // namespace scour
