#include "scour/session.hpp"

#include "scour/format.hpp"

#include "internal/style.hpp"

#include <exception>
#include <system_error>
#include <type_traits>
#include <variant>

using namespace scour::literals;
namespace fs = std::filesystem;

namespace scour {

    namespace detail {

        namespace style = internal::style;

        struct transcript {
            std::ostream& os;
            bool color{false};
            bool quiet{false};

            void line(std::string_view text) const {
                if (!quiet) {
                    os << text << '\n';
                }
            }

            void line(std::string_view tint, std::string_view text) const {
                if (!quiet) {
                    os << style::paint(color, tint, text) << '\n';
                }
            }

            // shown even in quiet mode
            void notice(std::string_view tint, std::string_view text) const {
                os << style::paint(color, tint, text) << '\n';
            }

            void blank() const {
                if (!quiet) {
                    os << '\n';
                }
            }
        };

        static execution_environment environment_for(const session_config& cfg) {
            if (cfg.search_path.empty()) {
                return execution_environment::from_process();
            }
            return execution_environment{.search_path = cfg.search_path};
        }

        static void report_outcome_line(
                const transcript& out, const tool_invocation& invocation, bool verbose) {
            std::visit(
                    [&](const auto& outcome) {
                        using T = std::decay_t<decltype(outcome)>;
                        if constexpr (std::is_same_v<T, skipped>) {
                            out.line("  Skipping {}: {}"_format(invocation.tool, outcome.detail));
                        }
                        else if constexpr (std::is_same_v<T, failed>) {
                            switch (outcome.kind) {
                                case failure_kind::nonzero_exit:
                                    if (verbose) {
                                        out.line("  {} {}"_format(invocation.tool, outcome.message));
                                    }
                                    break;
                                case failure_kind::timed_out:
                                    out.line(style::red,
                                             "  {} timed out ({})"_format(invocation.tool, outcome.message));
                                    break;
                                case failure_kind::spawn_error:
                                    out.line(style::red,
                                             "  {} could not run: {}"_format(invocation.tool, outcome.message));
                                    break;
                            }
                        }
                    },
                    invocation.outcome);
        }

        static void report_summary_line(const transcript& out, const finding_summary& summary) {
            switch (summary.status) {
                case summary_status::counted:
                    if (summary.count == 0U) {
                        out.line(style::green, "  No {}"_format(summary.label));
                    }
                    else {
                        out.line(style::yellow, "  Found {} {}"_format(summary.count, summary.label));
                    }
                    break;
                case summary_status::unparsable:
                    out.line(style::yellow, "  Could not parse {} output; finding count unknown"_format(summary.tool));
                    break;
                case summary_status::missing:
                    out.line(style::yellow, "  {} produced no output file"_format(summary.tool));
                    break;
            }
        }

    }  // namespace detail

    review_session::review_session(session_config cfg)
            : cfg_{resolve_paths(std::move(cfg))},
              env_{detail::environment_for(cfg_)},
              color_{internal::style::use_color(cfg_.color)} {
        history_.push_back({.state = state_, .eco = std::nullopt});
    }

    void review_session::transition(session_state next, std::optional<ecosystem> eco) {
        debug_log("session ", to_string(state_), " -> ", to_string(next));
        state_ = next;
        current_ecosystem_ = eco;
        history_.push_back({.state = next, .eco = eco});
    }

    void review_session::prepare_output_dir(std::ostream& os) {
        std::error_code ec{};
        fs::create_directories(cfg_.output_dir, ec);
        if (ec) {
            output_dir_error_ =
                    "failed to create output directory {}: {}"_format(cfg_.output_dir.string(), ec.message());
            detail::transcript{os, color_, false}.notice(internal::style::red, *output_dir_error_);
        }
    }

    void review_session::detect(std::ostream&) {
        signal_ = detect_ecosystems(cfg_.target_dir);
        ecosystems_ = active_ecosystems(signal_);
    }

    void review_session::run_tool(const tool_spec& spec, std::ostream& os) {
        detail::transcript out{os, color_, cfg_.quiet};
        try {
            auto [invocation, runnable] = prepare_invocation(spec, signal_, cfg_, env_);
            if (runnable) {
                out.line("Running {}..."_format(spec.name));
                if (cfg_.verbose) {
                    out.line("  $ {}"_format(utils::join_with_separator(invocation.command, " "sv)));
                }
                os.flush();
                execute_invocation(spec, invocation, cfg_);
            }
            detail::report_outcome_line(out, invocation, cfg_.verbose);

            if (invocation.ran()) {
                auto summary = summarize(spec, invocation);
                detail::report_summary_line(out, summary);
                summaries_.push_back(std::move(summary));
            }
            invocations_.push_back(std::move(invocation));
        } catch (const std::exception& e) {
            out.line(internal::style::red, "  {} aborted: {}"_format(spec.name, e.what()));
            tool_invocation aborted{.tool = spec.name, .output_path = cfg_.output_dir / spec.output_file};
            aborted.outcome = failed{.kind = failure_kind::spawn_error, .exit_code = -1, .message = e.what()};
            invocations_.push_back(std::move(aborted));
        }
    }

    void review_session::run_ecosystem_block(ecosystem eco, std::ostream& os) {
        detail::transcript out{os, color_, cfg_.quiet};
        out.line(internal::style::green, "{} Project Detected"_format(display_name(eco)));
        for (const auto& spec : ecosystem_tools(eco)) {
            run_tool(spec, os);
        }
        out.blank();
    }

    void review_session::run_custom_analyzers(std::ostream& os) {
        detail::transcript out{os, color_, cfg_.quiet};
        out.line(internal::style::blue, "Running Custom Analysis");
        for (const auto& spec : custom_analyzer_tools(cfg_)) {
            run_tool(spec, os);
        }
        out.blank();
    }

    void review_session::dispatch(std::ostream& os) {
        namespace style = internal::style;
        detail::transcript out{os, color_, cfg_.quiet};
        out.line(style::blue, "Generating Review Report");

        try {
            report_ = dispatch_report(cfg_, env_);
        } catch (const std::exception& e) {
            out.notice(style::red, "Report generation aborted: {}"_format(e.what()));
            return;
        }

        if (!report_->generator_found) {
            out.notice(style::yellow, "Report generator not found, raw results in {}"_format(cfg_.output_dir.string()));
            return;
        }

        if (auto* f = std::get_if<failed>(&report_->invocation.outcome)) {
            out.notice(style::yellow, "Report generator failed: {}"_format(f->message));
            if (f->kind == failure_kind::spawn_error) {
                return;
            }
        }

        out.line(style::green, "Review complete!");
        out.blank();
        out.line("Results saved to: {}"_format(report_->report_path.string()));
        out.blank();

        if (!report_->excerpt.empty()) {
            out.line(style::blue, "Summary:");
            for (const auto& line : report_->excerpt) {
                out.line(line);
            }
        }
    }

    void review_session::run(std::ostream& os) {
        detail::transcript out{os, color_, cfg_.quiet};
        out.line(internal::style::blue, "Code Review Starting");
        out.line("Target: {}"_format(cfg_.target_dir.string()));
        out.line("Output: {}"_format(cfg_.output_dir.string()));
        out.blank();

        prepare_output_dir(os);

        transition(session_state::detecting_ecosystems);
        detect(os);

        for (auto eco : ecosystems_) {
            transition(session_state::running_tools, eco);
            run_ecosystem_block(eco, os);
        }

        transition(session_state::running_custom_analyzers);
        run_custom_analyzers(os);

        transition(session_state::dispatching);
        dispatch(os);

        out.blank();
        out.line(internal::style::green,
                 "Review complete! Check {} for detailed results."_format(cfg_.output_dir.string()));
        transition(session_state::completed);
    }

    const tool_invocation* review_session::find_invocation(std::string_view tool) const {
        for (const auto& invocation : invocations_) {
            if (invocation.tool == tool) {
                return &invocation;
            }
        }
        return nullptr;
    }

    const finding_summary* review_session::find_summary(std::string_view tool) const {
        for (const auto& summary : summaries_) {
            if (summary.tool == tool) {
                return &summary;
            }
        }
        return nullptr;
    }

    bool review_session::has_unparsable() const {
        for (const auto& summary : summaries_) {
            if (summary.unparsable()) {
                return true;
            }
        }
        return false;
    }

    review_session run_review(const session_config& cfg, std::ostream& os) {
        review_session session{cfg};
        session.run(os);
        return session;
    }

}  // namespace scour
