#include "utils.hpp"

namespace scour::test {
    using namespace std::string_view_literals;

    namespace detail {
        static tool_spec scripted_tool(std::string name, std::string executable, stderr_policy stderr_mode) {
            return tool_spec{
                    .name = std::move(name),
                    .eco = std::nullopt,
                    .executable = executable,
                    .args = {executable},
                    .working_dir = working_dir_kind::target,
                    .output_file = "tool-output.txt",
                    .stderr_mode = stderr_mode,
                    .summary = summary_kind::tsc_text};
        }

        static session_config prepared_config(const review_fixture& fx) {
            auto cfg = resolve_paths(fx.config());
            fs::create_directories(cfg.output_dir);
            return cfg;
        }

        static execution_environment fixture_env(const review_fixture& fx) {
            return execution_environment{.search_path = fx.bin.string()};
        }
    }  // namespace detail

    TEST_CASE("006: run_process captures stdout and honors the stderr policy", "[006][process]") {
        detail::temp_dir dir{"scour_process_streams"};
        auto script = dir.path / "both.sh";
        detail::make_executable_file(script, "#!/bin/sh\necho out\necho err >&2\n");

        SECTION("discard") {
            auto result = internal::process::run_process(
                    {.args = {script.string()}, .working_dir = dir.path, .stdout_path = dir.path / "discard.txt"});
            CHECK(result.exit_code == 0);
            CHECK_FALSE(result.timed_out);
            CHECK(detail::read_text_file(dir.path / "discard.txt") == "out\n");
        }

        SECTION("merge") {
            auto result = internal::process::run_process(
                    {.args = {script.string()},
                     .working_dir = dir.path,
                     .stdout_path = dir.path / "merge.txt",
                     .merge_stderr = true});
            CHECK(result.exit_code == 0);
            auto text = detail::read_text_file(dir.path / "merge.txt");
            CHECK(detail::contains(text, "out\n"));
            CHECK(detail::contains(text, "err\n"));
        }
    }

    TEST_CASE("006: run_process truncates, pins the working directory and closes stdin", "[006][process]") {
        detail::temp_dir dir{"scour_process_cwd"};
        auto work = dir.path / "work";
        fs::create_directories(work);
        auto script = dir.path / "where.sh";
        detail::make_executable_file(script, "#!/bin/sh\npwd -P\ncat\necho done\n");

        auto out = dir.path / "where.txt";
        detail::write_text_file(out, "stale content that is longer than the new output\n");

        auto result = internal::process::run_process(
                {.args = {script.string()}, .working_dir = work, .stdout_path = out, .timeout_ms = 10'000});
        CHECK(result.exit_code == 0);
        CHECK(detail::read_text_file(out) == fs::canonical(work).string() + "\ndone\n");
    }

    TEST_CASE("006: run_process reports exit codes and timeouts", "[006][process]") {
        detail::temp_dir dir{"scour_process_exit"};

        SECTION("nonzero exit") {
            auto script = dir.path / "fail.sh";
            detail::make_executable_file(script, "#!/bin/sh\nexit 3\n");
            auto result = internal::process::run_process(
                    {.args = {script.string()}, .working_dir = dir.path, .stdout_path = dir.path / "fail.txt"});
            CHECK(result.exit_code == 3);
            CHECK_FALSE(result.timed_out);
        }

        SECTION("timeout kills the process group") {
            auto script = dir.path / "slow.sh";
            detail::make_executable_file(script, "#!/bin/sh\necho started\nsleep 30\necho finished\n");

            auto start = std::chrono::steady_clock::now();
            auto result = internal::process::run_process(
                    {.args = {script.string()},
                     .working_dir = dir.path,
                     .stdout_path = dir.path / "slow.txt",
                     .timeout_ms = 200});
            auto elapsed = std::chrono::steady_clock::now() - start;

            CHECK(result.timed_out);
            CHECK(elapsed < std::chrono::seconds{10});
            CHECK(detail::read_text_file(dir.path / "slow.txt") == "started\n");
        }

        SECTION("unopenable output file throws") {
            auto script = dir.path / "ok.sh";
            detail::make_executable_file(script, "#!/bin/sh\nexit 0\n");
            CHECK_THROWS_AS(
                    internal::process::run_process(
                            {.args = {script.string()},
                             .working_dir = dir.path,
                             .stdout_path = dir.path / "no-such-dir" / "out.txt"}),
                    std::runtime_error);
        }
    }

    TEST_CASE("006: terminating the caller takes the child's process group with it", "[006][process]") {
        detail::temp_dir dir{"scour_process_forward"};
        auto script = dir.path / "worker.sh";
        detail::make_executable_file(script, "#!/bin/sh\necho up > started\nsleep 2\necho alive > finished\n");

        auto pid = ::fork();
        REQUIRE(pid >= 0);
        if (pid == 0) {
            ::setpgid(0, 0);
            try {
                internal::process::run_process(
                        {.args = {script.string()}, .working_dir = dir.path, .stdout_path = dir.path / "out.txt"});
            } catch (const std::exception&) {
                ::_exit(1);
            }
            ::_exit(0);
        }
        ::setpgid(pid, pid);

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
        while (!fs::exists(dir.path / "started") && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds{20});
        }
        REQUIRE(fs::exists(dir.path / "started"));

        ::kill(-pid, SIGTERM);
        int status = 0;
        REQUIRE(::waitpid(pid, &status, 0) == pid);
        CHECK(WIFSIGNALED(status));
        CHECK(WTERMSIG(status) == SIGTERM);

        std::this_thread::sleep_for(std::chrono::seconds{3});
        CHECK_FALSE(fs::exists(dir.path / "finished"));
    }

    TEST_CASE("006: prepare_invocation resolves the command without starting it", "[006][invocation]") {
        detail::review_fixture fx{"scour_invoke_prepare"};
        fx.add_tool("linter", "#!/bin/sh\necho ran > \"$0.ran\"\n");
        auto cfg = detail::prepared_config(fx);
        auto env = detail::fixture_env(fx);
        auto spec = detail::scripted_tool("linter", "linter", stderr_policy::discard);

        auto prepared = prepare_invocation(spec, ecosystem_signal{}, cfg, env);
        CHECK(prepared.runnable);
        CHECK(prepared.invocation.command == std::vector<std::string>{(fx.bin / "linter").string()});
        CHECK_FALSE(fs::exists(prepared.invocation.output_path));
        CHECK_FALSE(fs::exists(fx.bin / "linter.ran"));

        execute_invocation(spec, prepared.invocation, cfg);
        CHECK(std::holds_alternative<succeeded>(prepared.invocation.outcome));
        CHECK(fs::exists(fx.bin / "linter.ran"));

        auto missing = prepare_invocation(
                detail::scripted_tool("ghost", "ghost-linter", stderr_policy::discard), ecosystem_signal{}, cfg, env);
        CHECK_FALSE(missing.runnable);
        CHECK(std::holds_alternative<skipped>(missing.invocation.outcome));
    }

    TEST_CASE("006: invoke_tool success and nonzero exits", "[006][invocation]") {
        detail::review_fixture fx{"scour_invoke_exit"};
        fx.add_tool("linter-ok", "#!/bin/sh\necho clean\n");
        fx.add_tool("linter-findings", "#!/bin/sh\necho 'x.ts(1,1): error TS1005'\nexit 2\n");
        auto cfg = detail::prepared_config(fx);
        auto env = detail::fixture_env(fx);

        auto ok = invoke_tool(
                detail::scripted_tool("ok", "linter-ok", stderr_policy::discard), ecosystem_signal{}, cfg, env);
        REQUIRE(std::holds_alternative<succeeded>(ok.outcome));
        CHECK(ok.ran());
        CHECK(ok.command == std::vector<std::string>{(fx.bin / "linter-ok").string()});
        CHECK(detail::read_text_file(ok.output_path) == "clean\n");

        auto findings = invoke_tool(
                detail::scripted_tool("findings", "linter-findings", stderr_policy::merge), ecosystem_signal{}, cfg, env);
        auto* f = std::get_if<failed>(&findings.outcome);
        REQUIRE(f != nullptr);
        CHECK(f->kind == failure_kind::nonzero_exit);
        CHECK(f->exit_code == 2);
        CHECK(findings.ran());
        CHECK(detail::contains(detail::read_text_file(findings.output_path), "error TS1005"));
    }

    TEST_CASE("006: invoke_tool skips without creating output", "[006][invocation]") {
        detail::review_fixture fx{"scour_invoke_skip"};
        auto cfg = detail::prepared_config(fx);
        auto env = detail::fixture_env(fx);

        SECTION("executable missing from the search path") {
            auto result = invoke_tool(
                    detail::scripted_tool("ghost", "ghost-linter", stderr_policy::discard), ecosystem_signal{}, cfg, env);
            auto* s = std::get_if<skipped>(&result.outcome);
            REQUIRE(s != nullptr);
            CHECK(s->reason == skip_reason::tool_missing);
            CHECK(detail::contains(s->detail, "ghost-linter"));
            CHECK_FALSE(result.ran());
            CHECK_FALSE(fs::exists(result.output_path));
        }

        SECTION("required marker absent") {
            fx.add_tool("npx", "#!/bin/sh\necho should-not-run\n");
            auto tsc = ecosystem_tools(ecosystem::javascript_typescript)[1];
            ecosystem_signal signal{.package_json = true};

            auto result = invoke_tool(tsc, signal, cfg, env);
            auto* s = std::get_if<skipped>(&result.outcome);
            REQUIRE(s != nullptr);
            CHECK(s->reason == skip_reason::marker_missing);
            CHECK(detail::contains(s->detail, "tsconfig.json"));
            CHECK_FALSE(fs::exists(cfg.output_dir / "tsc-errors.txt"));
        }

        SECTION("pylint without python sources") {
            fx.add_tool("pylint", "#!/bin/sh\necho '[]'\n");
            auto pylint = ecosystem_tools(ecosystem::python)[0];

            auto result = invoke_tool(pylint, ecosystem_signal{.requirements = true}, cfg, env);
            auto* s = std::get_if<skipped>(&result.outcome);
            REQUIRE(s != nullptr);
            CHECK(s->reason == skip_reason::no_sources);
            CHECK_FALSE(fs::exists(cfg.output_dir / "pylint-report.json"));
        }

        SECTION("custom analyzer script absent") {
            fx.add_fake_python();
            auto complexity = custom_analyzer_tools(cfg)[0];

            auto result = invoke_tool(complexity, ecosystem_signal{}, cfg, env);
            auto* s = std::get_if<skipped>(&result.outcome);
            REQUIRE(s != nullptr);
            CHECK(s->reason == skip_reason::tool_missing);
            CHECK(detail::contains(s->detail, "analyze_complexity.py"));
        }
    }

    TEST_CASE("006: invoke_tool failures", "[006][invocation]") {
        detail::review_fixture fx{"scour_invoke_fail"};
        auto env = detail::fixture_env(fx);

        SECTION("exec failure becomes spawn_error and removes the empty capture") {
            fx.add_tool("broken", "#!/nonexistent/interpreter\n");
            auto cfg = detail::prepared_config(fx);

            auto result = invoke_tool(
                    detail::scripted_tool("broken", "broken", stderr_policy::discard), ecosystem_signal{}, cfg, env);
            auto* f = std::get_if<failed>(&result.outcome);
            REQUIRE(f != nullptr);
            CHECK(f->kind == failure_kind::spawn_error);
            CHECK_FALSE(result.ran());
            CHECK_FALSE(fs::exists(result.output_path));
        }

        SECTION("missing output directory becomes spawn_error") {
            fx.add_tool("linter", "#!/bin/sh\necho hi\n");
            auto cfg = resolve_paths(fx.config());

            auto result = invoke_tool(
                    detail::scripted_tool("linter", "linter", stderr_policy::discard), ecosystem_signal{}, cfg, env);
            auto* f = std::get_if<failed>(&result.outcome);
            REQUIRE(f != nullptr);
            CHECK(f->kind == failure_kind::spawn_error);
            CHECK(detail::contains(f->message, "failed to open"));
        }

        SECTION("timeout keeps partial output") {
            fx.add_tool("hang", "#!/bin/sh\necho partial\nsleep 30\n");
            auto cfg = detail::prepared_config(fx);
            cfg.tool_timeout_ms = 200;

            auto result = invoke_tool(
                    detail::scripted_tool("hang", "hang", stderr_policy::discard), ecosystem_signal{}, cfg, env);
            auto* f = std::get_if<failed>(&result.outcome);
            REQUIRE(f != nullptr);
            CHECK(f->kind == failure_kind::timed_out);
            CHECK(result.ran());
            CHECK(detail::read_text_file(result.output_path) == "partial\n");
        }
    }

    TEST_CASE("006: custom analyzers run from the analyzer directory", "[006][invocation]") {
        detail::review_fixture fx{"scour_invoke_analyzer"};
        fx.add_fake_python();
        fx.add_analyzer("analyze_complexity.py", "pwd -P\necho \"$1\"\n");
        auto cfg = detail::prepared_config(fx);

        auto result = invoke_tool(custom_analyzer_tools(cfg)[0], ecosystem_signal{}, cfg, detail::fixture_env(fx));
        REQUIRE(std::holds_alternative<succeeded>(result.outcome));
        CHECK(result.output_path == cfg.output_dir / "complexity-report.json");
        CHECK(detail::read_text_file(result.output_path) ==
              fs::canonical(fx.analyzers).string() + "\n" + cfg.target_dir.string() + "\n");
    }
}  // namespace scour::test
