#include "process.hpp"

#include "platform.hpp"

#include "scour/format.hpp"
#include "scour/utils.hpp"

extern "C" {
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace scour::literals;
namespace fs = std::filesystem;

namespace scour::internal::process {

    namespace detail {

        static constexpr auto poll_interval = std::chrono::milliseconds{10};

        // signals that end the session from outside; the child's group gets them too
        static constexpr std::array<int, 3> forwarded_signals{SIGINT, SIGTERM, SIGHUP};

        static std::atomic<pid_t> active_child_group{0};

        static void forward_and_reraise(int sig) {
            if (auto group = active_child_group.load(); group > 0) {
                ::kill(-group, sig);
            }
            struct sigaction dfl{};
            dfl.sa_handler = SIG_DFL;
            ::sigemptyset(&dfl.sa_mask);
            ::sigaction(sig, &dfl, nullptr);
            ::raise(sig);
        }

        // Installs the forwarding handlers for the lifetime of one child and restores the previous
        // dispositions afterwards. Signals the caller ignores stay ignored.
        class signal_forwarder {
          public:
            signal_forwarder() {
                struct sigaction action{};
                action.sa_handler = forward_and_reraise;
                ::sigemptyset(&action.sa_mask);
                for (size_t i = 0; i < forwarded_signals.size(); ++i) {
                    ::sigaction(forwarded_signals[i], nullptr, &previous_[i]);
                    installed_[i] = previous_[i].sa_handler != SIG_IGN &&
                                    ::sigaction(forwarded_signals[i], &action, nullptr) == 0;
                }
            }

            ~signal_forwarder() {
                active_child_group.store(0);
                for (size_t i = 0; i < forwarded_signals.size(); ++i) {
                    if (installed_[i]) {
                        ::sigaction(forwarded_signals[i], &previous_[i], nullptr);
                    }
                }
            }

            void track(pid_t group) { active_child_group.store(group); }

            signal_forwarder(const signal_forwarder&) = delete;
            signal_forwarder& operator=(const signal_forwarder&) = delete;

          private:
            std::array<struct sigaction, 3> previous_{};
            std::array<bool, 3> installed_{};
        };

        static int open_write_file(const fs::path& path) {
            auto fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
            if (fd < 0) {
                throw std::runtime_error("failed to open file for write: {}"_format(path.string()));
            }
            return fd;
        }

        static int open_null_device(int flags) {
            auto fd = ::open(platform::null_device.data(), flags | O_CLOEXEC);
            if (fd < 0) {
                throw std::runtime_error("failed to open {}"_format(platform::null_device));
            }
            return fd;
        }

        static int decode_status(int status) {
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return platform::signal_status_base + WTERMSIG(status);
            }
            return 1;
        }

        [[noreturn]] static void exec_child(
                const process_request& request, int stdin_fd, int stdout_fd, int stderr_fd) {
            // own group, so a timeout can take down grandchildren (npx -> node, cargo -> clippy-driver)
            ::setpgid(0, 0);

            if (::dup2(stdin_fd, STDIN_FILENO) < 0 || ::dup2(stdout_fd, STDOUT_FILENO) < 0) {
                _exit(platform::exec_failure_status);
            }
            if (::dup2(stderr_fd, STDERR_FILENO) < 0) {
                _exit(platform::exec_failure_status);
            }

            if (!request.working_dir.empty() && ::chdir(request.working_dir.c_str()) != 0) {
                _exit(platform::exec_failure_status);
            }

            std::vector<char*> argv{};
            argv.reserve(request.args.size() + 1U);
            for (const auto& arg : request.args) {
                argv.push_back(const_cast<char*>(arg.c_str()));
            }
            argv.push_back(nullptr);

            ::execv(argv[0], argv.data());
            _exit(platform::exec_failure_status);
        }

        static int wait_blocking(pid_t pid) {
            int status = 0;
            for (;;) {
                if (::waitpid(pid, &status, 0) >= 0) {
                    return status;
                }
                if (errno != EINTR) {
                    throw std::runtime_error("waitpid failed");
                }
            }
        }

    }  // namespace detail

    process_result run_process(const process_request& request) {
        if (request.args.empty()) {
            throw std::runtime_error("empty command");
        }

        auto stdin_fd = detail::open_null_device(O_RDONLY);
        int stdout_fd = -1;
        int stderr_fd = -1;
        try {
            stdout_fd = detail::open_write_file(request.stdout_path);
            stderr_fd = request.merge_stderr ? ::dup(stdout_fd) : detail::open_null_device(O_WRONLY);
            if (stderr_fd < 0) {
                throw std::runtime_error("failed to duplicate stdout descriptor");
            }
        } catch (...) {
            ::close(stdin_fd);
            if (stdout_fd >= 0) {
                ::close(stdout_fd);
            }
            throw;
        }

        auto close_all = [&] {
            ::close(stdin_fd);
            ::close(stdout_fd);
            ::close(stderr_fd);
        };

        debug_log("spawning ", request.args.front(), " in ", request.working_dir.string());

        detail::signal_forwarder forwarder{};
        auto pid = ::fork();
        if (pid < 0) {
            close_all();
            throw std::runtime_error("fork failed");
        }

        if (pid == 0) {
            detail::exec_child(request, stdin_fd, stdout_fd, stderr_fd);
        }

        // mirrors the child's own call; whichever runs first wins
        ::setpgid(pid, pid);
        forwarder.track(pid);
        close_all();

        if (request.timeout_ms <= 0) {
            return {.exit_code = detail::decode_status(detail::wait_blocking(pid)), .timed_out = false};
        }

        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(request.timeout_ms);
        int status = 0;
        for (;;) {
            auto rc = ::waitpid(pid, &status, WNOHANG);
            if (rc == pid) {
                return {.exit_code = detail::decode_status(status), .timed_out = false};
            }
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw std::runtime_error("waitpid failed");
            }

            if (std::chrono::steady_clock::now() >= deadline) {
                debug_log("timeout after ", request.timeout_ms, "ms, killing ", request.args.front());
                ::kill(-pid, SIGKILL);
                ::kill(pid, SIGKILL);
                status = detail::wait_blocking(pid);
                return {.exit_code = detail::decode_status(status), .timed_out = true};
            }

            std::this_thread::sleep_for(detail::poll_interval);
        }
    }

}  // namespace scour::internal::process
