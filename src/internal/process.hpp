#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace scour::internal::process {

    struct process_request {
        std::vector<std::string> args{};
        std::filesystem::path working_dir{};
        std::filesystem::path stdout_path{};
        bool merge_stderr{false};
        // 0 waits indefinitely
        int timeout_ms{0};
    };

    struct process_result {
        int exit_code{-1};
        bool timed_out{false};
    };

    // Runs `request.args` with stdin from /dev/null, stdout truncated into `stdout_path` and stderr
    // either discarded or appended to the same file. The child gets its own process group so a
    // timeout kills the whole tree; SIGINT, SIGTERM and SIGHUP delivered to the caller while the
    // child runs are forwarded to that group before the caller terminates. Throws std::runtime_error
    // when the child cannot be started.
    process_result run_process(const process_request& request);

}  // namespace scour::internal::process
