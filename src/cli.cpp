#include "scour/cli.hpp"

#include "scour.hpp"

#include "internal/payloads.hpp"

#include <glaze/glaze.hpp>

#include <CLI/CLI.hpp>

#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

using namespace scour::literals;

namespace scour::cli {

    namespace detail {

        namespace fs = std::filesystem;

        static constexpr int usage_error = 2;
        static constexpr int ms_per_second = 1'000;

        static internal::invocation_record make_invocation_record(const tool_invocation& invocation) {
            internal::invocation_record record{.tool = invocation.tool};
            std::visit(
                    [&](const auto& outcome) {
                        using T = std::decay_t<decltype(outcome)>;
                        if constexpr (std::is_same_v<T, skipped>) {
                            record.outcome = "skipped";
                            record.reason = std::string{to_string(outcome.reason)};
                        }
                        else if constexpr (std::is_same_v<T, failed>) {
                            record.outcome = "failed";
                            record.reason = std::string{to_string(outcome.kind)};
                            if (outcome.kind != failure_kind::spawn_error) {
                                record.exit_code = outcome.exit_code;
                                record.output = outcome.output.string();
                            }
                        }
                        else {
                            record.outcome = "succeeded";
                            record.output = outcome.output.string();
                        }
                    },
                    invocation.outcome);
            return record;
        }

        static internal::session_payload make_session_payload(const review_session& session) {
            internal::session_payload payload{};
            payload.target_dir = session.config().target_dir.string();
            payload.output_dir = session.config().output_dir.string();
            payload.state = std::string{to_string(session.state())};
            for (auto eco : session.ecosystems()) {
                payload.ecosystems.emplace_back(to_string(eco));
            }
            for (const auto& invocation : session.invocations()) {
                payload.invocations.push_back(make_invocation_record(invocation));
            }
            for (const auto& summary : session.summaries()) {
                payload.findings.push_back(
                        {.tool = summary.tool,
                         .count = summary.count,
                         .label = summary.label,
                         .status = std::string{to_string(summary.status)}});
            }
            if (const auto& report = session.report(); report && report->generated()) {
                payload.report.generated = true;
                payload.report.path = report->report_path.string();
            }
            payload.has_unparsable = session.has_unparsable();
            return payload;
        }

        static std::string describe_outcome(const tool_invocation& invocation) {
            return std::visit(
                    [](const auto& outcome) -> std::string {
                        using T = std::decay_t<decltype(outcome)>;
                        if constexpr (std::is_same_v<T, skipped>) {
                            return "skipped ({})"_format(outcome.reason);
                        }
                        else if constexpr (std::is_same_v<T, failed>) {
                            if (outcome.kind == failure_kind::nonzero_exit) {
                                return "exit {}"_format(outcome.exit_code);
                            }
                            return "failed ({})"_format(outcome.kind);
                        }
                        else {
                            return "ok";
                        }
                    },
                    invocation.outcome);
        }

        static void render_table(const review_session& session, std::ostream& os) {
            constexpr int tool_width = 22;
            constexpr int outcome_width = 24;

            os << "\n=============== Session ===============\n";
            os << std::left << std::setw(tool_width) << "tool" << std::setw(outcome_width) << "outcome"
               << "findings\n";
            for (const auto& invocation : session.invocations()) {
                os << std::left << std::setw(tool_width) << invocation.tool << std::setw(outcome_width)
                   << describe_outcome(invocation);
                if (const auto* summary = session.find_summary(invocation.tool)) {
                    if (summary->unparsable()) {
                        os << "? (" << to_string(summary->status) << ')';
                    }
                    else {
                        os << summary->count << ' ' << summary->label;
                    }
                }
                else {
                    os << '-';
                }
                os << '\n';
            }

            const auto& report = session.report();
            os << "report: "
               << (report && report->generated() ? report->report_path.string() : std::string{"not generated"})
               << '\n';
            if (session.has_unparsable()) {
                os << "warning: some tool output could not be parsed; a zero count there is not a clean result\n";
            }
        }

        static void render_json(const review_session& session, std::ostream& os) {
            std::string json{};
            auto ec = glz::write_json(make_session_payload(session), json);
            if (ec) {
                throw std::runtime_error("failed to serialize session summary");
            }
            os << json << '\n';
        }

    }  // namespace detail

    void print_config(const session_config& cfg, std::ostream& os) {
        os << "target_dir=" << cfg.target_dir.string() << '\n';
        os << "output_dir=" << cfg.output_dir.string() << '\n';
        os << "analyzers_dir=" << cfg.analyzers_dir.string() << '\n';
        os << "python=" << cfg.python << '\n';
        os << "timeout_ms=" << cfg.tool_timeout_ms << '\n';
        os << "summary_lines=" << cfg.summary_lines << '\n';
        os << "output=" << to_string(cfg.output) << '\n';
        os << "color=" << to_string(cfg.color) << '\n';
    }

    void render_session_summary(const review_session& session, std::ostream& os) {
        switch (session.config().output) {
            case output_mode::table:
                detail::render_table(session, os);
                return;
            case output_mode::json:
                detail::render_json(session, os);
                return;
        }
    }

    std::optional<int> parse_cli(int argc, char** argv, session_config& cfg) {
        CLI::App app{"scour: run the linters and analyzers that apply to a project and collect their reports"};

        bool show_version = false;
        std::string target_arg{cfg.target_dir.string()};
        std::string output_dir_arg{cfg.output_dir.string()};
        std::string analyzers_arg{};
        std::string output_arg{std::string{to_string(cfg.output)}};
        std::string color_arg{std::string{to_string(cfg.color)}};
        int timeout_seconds = cfg.tool_timeout_ms / detail::ms_per_second;

        app.add_option("target_dir", target_arg, "Directory to review (default: .)");
        app.add_option("output_dir", output_dir_arg, "Directory for tool reports (default: .code-review-output)");
        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--analyzers-dir", analyzers_arg, "Directory holding the custom analyzers and report generator");
        app.add_option("--python", cfg.python, "Interpreter for the custom analyzers");
        app.add_option("--timeout", timeout_seconds, "Per-tool time limit in seconds, 0 disables")
                ->check(CLI::Range(0, std::numeric_limits<int>::max() / detail::ms_per_second));
        app.add_option("--summary-lines", cfg.summary_lines, "REVIEW.md lines echoed after generation");
        app.add_option("--output", output_arg, "Summary mode: table|json");
        app.add_option("--color", color_arg, "Color mode: auto|always|never");
        app.add_flag("--no-color", "Force color mode to never");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress progress output");
        app.add_flag("--verbose", cfg.verbose, "Show executed commands and tool exit statuses");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            auto rc = app.exit(e);
            return std::optional<int>{rc == 0 ? 0 : detail::usage_error};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{detail::usage_error};
        }
        if (!try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected table|json)\n";
            return std::optional<int>{detail::usage_error};
        }
        if (!try_parse_color_mode(color_arg, cfg.color)) {
            std::cerr << "invalid --color value: " << color_arg << " (expected auto|always|never)\n";
            return std::optional<int>{detail::usage_error};
        }
        if (cfg.python.empty()) {
            std::cerr << "--python must be non-empty\n";
            return std::optional<int>{detail::usage_error};
        }

        if (app.get_option("--no-color")->count() > 0U) {
            cfg.color = color_mode::never;
        }

        cfg.target_dir = target_arg;
        cfg.output_dir = output_dir_arg;
        cfg.analyzers_dir = analyzers_arg.empty() ? default_analyzers_dir() : detail::fs::path{analyzers_arg};
        cfg.tool_timeout_ms = timeout_seconds * detail::ms_per_second;
        cfg = resolve_paths(std::move(cfg));

        if (show_version) {
            std::cout << "scour " << version << '\n';
            return std::optional<int>{0};
        }

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

    int run(const session_config& cfg, std::ostream& out, std::ostream& progress) {
        auto session = run_review(cfg, progress);
        if (!cfg.quiet || cfg.output == output_mode::json) {
            render_session_summary(session, out);
        }
        // tool findings and failures never change the exit status
        return 0;
    }

    int run(const session_config& cfg) {
        // json output owns stdout; the transcript goes to stderr
        return run(cfg, std::cout, cfg.output == output_mode::json ? std::cerr : std::cout);
    }

}  // namespace scour::cli
