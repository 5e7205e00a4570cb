#pragma once

#include "config.hpp"
#include "ecosystem.hpp"
#include "invocation.hpp"
#include "probe.hpp"
#include "report.hpp"
#include "summary.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace scour {

    enum class session_state : uint8_t {
        initialized,
        detecting_ecosystems,
        running_tools,
        running_custom_analyzers,
        dispatching,
        completed,
    };

    inline constexpr std::string_view to_string(session_state state) {
        switch (state) {
            case session_state::initialized:
                return "initialized"sv;
            case session_state::detecting_ecosystems:
                return "detecting_ecosystems"sv;
            case session_state::running_tools:
                return "running_tools"sv;
            case session_state::running_custom_analyzers:
                return "running_custom_analyzers"sv;
            case session_state::dispatching:
                return "dispatching"sv;
            case session_state::completed:
                return "completed"sv;
        }
        return "initialized"sv;
    }

    struct state_transition {
        session_state state{session_state::initialized};
        std::optional<ecosystem> eco{};
    };

    class review_session {
      public:
        // An empty cfg.search_path falls back to the process PATH.
        explicit review_session(session_config cfg);

        // Runs every stage in order and always ends in `completed`; progress goes to `os`.
        void run(std::ostream& os);

        const session_config& config() const { return cfg_; }
        const execution_environment& environment() const { return env_; }
        session_state state() const { return state_; }
        std::optional<ecosystem> current_ecosystem() const { return current_ecosystem_; }
        const std::vector<state_transition>& history() const { return history_; }

        const ecosystem_signal& signal() const { return signal_; }
        const std::vector<ecosystem>& ecosystems() const { return ecosystems_; }
        const std::vector<tool_invocation>& invocations() const { return invocations_; }
        const std::vector<finding_summary>& summaries() const { return summaries_; }
        const std::optional<report_outcome>& report() const { return report_; }
        const std::optional<std::string>& output_dir_error() const { return output_dir_error_; }

        const tool_invocation* find_invocation(std::string_view tool) const;
        const finding_summary* find_summary(std::string_view tool) const;
        bool has_unparsable() const;

      private:
        void transition(session_state next, std::optional<ecosystem> eco = std::nullopt);
        void prepare_output_dir(std::ostream& os);
        void detect(std::ostream& os);
        void run_ecosystem_block(ecosystem eco, std::ostream& os);
        void run_custom_analyzers(std::ostream& os);
        void run_tool(const tool_spec& spec, std::ostream& os);
        void dispatch(std::ostream& os);

        session_config cfg_;
        execution_environment env_;
        bool color_{false};

        session_state state_{session_state::initialized};
        std::optional<ecosystem> current_ecosystem_{};
        std::vector<state_transition> history_{};

        ecosystem_signal signal_{};
        std::vector<ecosystem> ecosystems_{};
        std::vector<tool_invocation> invocations_{};
        std::vector<finding_summary> summaries_{};
        std::optional<report_outcome> report_{};
        std::optional<std::string> output_dir_error_{};
    };

    // Convenience wrapper: constructs, runs and returns the completed session.
    review_session run_review(const session_config& cfg, std::ostream& os);

}  // namespace scour
