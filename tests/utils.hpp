#pragma once

#include "scour.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include "../src/internal/payloads.hpp"
#include "../src/internal/process.hpp"
#include "../src/internal/style.hpp"

extern "C" {
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace scour::test {
    namespace fs = std::filesystem;
}  // namespace scour::test

namespace scour::test::detail {

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;
    };

    inline void write_text_file(const fs::path& path, std::string_view text) {
        auto parent = path.parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
        std::ofstream out{path};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    inline void make_executable_file(const fs::path& path, std::string_view content) {
        write_text_file(path, content);
        fs::permissions(
                path,
                fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec | fs::perms::group_read |
                        fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                fs::perm_options::replace);
    }

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path};
        REQUIRE(in.good());
        return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    }

    inline std::vector<char*> to_argv(std::vector<std::string>& args) {
        std::vector<char*> argv{};
        argv.reserve(args.size());
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return argv;
    }

    inline bool contains(std::string_view haystack, std::string_view needle) {
        return haystack.find(needle) != std::string_view::npos;
    }

    inline size_t count_occurrences(std::string_view haystack, std::string_view needle) {
        size_t count{};
        for (auto pos = haystack.find(needle); pos != std::string_view::npos;
             pos = haystack.find(needle, pos + needle.size())) {
            ++count;
        }
        return count;
    }

    // Target, output, analyzer and bin directories under one temp root; `bin` is the only
    // search path entry, so nothing from the host toolchain leaks into a test.
    struct review_fixture {
        temp_dir root;
        fs::path target{};
        fs::path output{};
        fs::path analyzers{};
        fs::path bin{};

        explicit review_fixture(std::string_view prefix) : root{prefix} {
            target = root.path / "project";
            output = root.path / "out";
            analyzers = root.path / "analyzers";
            bin = root.path / "bin";
            fs::create_directories(target);
            fs::create_directories(analyzers);
            fs::create_directories(bin);
        }

        session_config config() const {
            session_config cfg{};
            cfg.target_dir = target;
            cfg.output_dir = output;
            cfg.analyzers_dir = analyzers;
            cfg.search_path = bin.string();
            cfg.color = color_mode::never;
            cfg.tool_timeout_ms = 10'000;
            return cfg;
        }

        void add_marker(std::string_view name, std::string_view content = "{}\n") const {
            write_text_file(target / name, content);
        }

        void add_tool(std::string_view name, std::string_view script) const {
            make_executable_file(bin / name, script);
        }

        // python3 that runs the analyzer "scripts" as shell, so tests do not need an interpreter
        void add_fake_python() const { add_tool("python3", "#!/bin/sh\nexec /bin/sh \"$@\"\n"); }

        void add_analyzer(std::string_view script_name, std::string_view body) const {
            write_text_file(analyzers / script_name, body);
        }

        fs::path output_file(std::string_view name) const { return output / name; }
    };

}  // namespace scour::test::detail
