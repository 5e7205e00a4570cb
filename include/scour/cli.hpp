#pragma once

#include "config.hpp"
#include "session.hpp"

#include <optional>
#include <ostream>

namespace scour::cli {

    // Returns an exit code when startup should stop (help, version, print-config, invalid input).
    std::optional<int> parse_cli(int argc, char** argv, session_config& cfg);

    void print_config(const session_config& cfg, std::ostream& os);

    void render_session_summary(const review_session& session, std::ostream& os);

    // Runs a full review, writing the transcript to `progress` and the summary to `out`.
    // The return value is the process exit code.
    int run(const session_config& cfg, std::ostream& out, std::ostream& progress);

    // As above on the standard streams; with json output the transcript moves to stderr.
    int run(const session_config& cfg);

}  // namespace scour::cli
