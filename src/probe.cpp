#include "scour/probe.hpp"

#include "internal/platform.hpp"

extern "C" {
#include <unistd.h>
}

#include <cstdlib>
#include <system_error>

namespace fs = std::filesystem;

namespace scour {

    namespace detail {

        // children chdir before exec, so a relative hit must not stay relative
        static fs::path absolute_or_self(const fs::path& path) {
            std::error_code ec{};
            auto abs = fs::absolute(path, ec);
            return ec ? path : abs;
        }

    }  // namespace detail

    execution_environment execution_environment::from_process() {
        execution_environment env{};
        if (const char* path_env = std::getenv("PATH"); path_env != nullptr) {
            env.search_path = path_env;
        }
        return env;
    }

    bool is_executable_file(const fs::path& path) {
        std::error_code ec{};
        if (!fs::is_regular_file(path, ec) || ec) {
            return false;
        }
        return ::access(path.c_str(), X_OK) == 0;
    }

    std::optional<fs::path> find_executable(std::string_view name, const execution_environment& env) {
        if (name.empty()) {
            return std::nullopt;
        }

        if (name.find('/') != std::string_view::npos) {
            fs::path candidate{name};
            if (is_executable_file(candidate)) {
                return detail::absolute_or_self(candidate);
            }
            return std::nullopt;
        }

        if (env.search_path.empty()) {
            return std::nullopt;
        }

        std::string_view remaining{env.search_path};
        while (true) {
            auto sep = remaining.find(internal::platform::path_list_separator);
            auto entry = remaining.substr(0, sep);

            auto candidate = entry.empty() ? fs::path{"."} / name : fs::path{entry} / name;
            if (is_executable_file(candidate)) {
                return detail::absolute_or_self(candidate);
            }

            if (sep == std::string_view::npos) {
                break;
            }
            remaining.remove_prefix(sep + 1U);
        }
        return std::nullopt;
    }

}  // namespace scour
