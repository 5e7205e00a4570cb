#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace scour {

    struct execution_environment {
        std::string search_path{};

        // snapshot of PATH taken once at session start
        static execution_environment from_process();
    };

    // Resolves `name` the way execvp would: names containing '/' are checked as-is, anything else
    // is looked up in each search_path entry (an empty entry is the current directory).
    std::optional<std::filesystem::path> find_executable(std::string_view name, const execution_environment& env);

    inline bool tool_available(std::string_view name, const execution_environment& env) {
        return find_executable(name, env).has_value();
    }

    bool is_executable_file(const std::filesystem::path& path);

}  // namespace scour
