#include "scour/report.hpp"

#include "scour/tools.hpp"

#include <fstream>

namespace fs = std::filesystem;

namespace scour {

    fs::path report_generator_path(const session_config& cfg) {
        return cfg.analyzers_dir / analyzer_scripts::report;
    }

    std::vector<std::string> read_head(const fs::path& path, size_t max_lines) {
        std::vector<std::string> lines{};
        std::ifstream in{path};
        if (!in) {
            return lines;
        }
        std::string line{};
        while (lines.size() < max_lines && std::getline(in, line)) {
            lines.push_back(std::move(line));
        }
        return lines;
    }

    report_outcome dispatch_report(const session_config& cfg, const execution_environment& env) {
        auto script = report_generator_path(cfg);
        tool_spec spec{
                .name = std::string{tool_names::report},
                .eco = std::nullopt,
                .executable = cfg.python,
                .args = {cfg.python, script.string(), cfg.output_dir.string()},
                .working_dir = working_dir_kind::analyzers,
                .output_file = std::string{output_files::review},
                .stderr_mode = stderr_policy::discard,
                .required_file = script};

        report_outcome outcome{};
        outcome.report_path = cfg.output_dir / output_files::review;
        outcome.invocation = invoke_tool(spec, ecosystem_signal{}, cfg, env);

        auto* skip = std::get_if<skipped>(&outcome.invocation.outcome);
        outcome.generator_found = skip == nullptr;
        if (outcome.invocation.ran()) {
            outcome.excerpt = read_head(outcome.report_path, cfg.summary_lines);
        }
        return outcome;
    }

}  // namespace scour
