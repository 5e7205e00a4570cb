#include "scour/ecosystem.hpp"

#include <filesystem>
#include <initializer_list>
#include <system_error>

namespace fs = std::filesystem;

namespace scour {

    namespace detail {

        static bool has_marker(const fs::path& dir, std::string_view name) {
            std::error_code ec{};
            return fs::is_regular_file(dir / name, ec) && !ec;
        }

        static bool has_any_marker(const fs::path& dir, std::initializer_list<std::string_view> names) {
            for (auto name : names) {
                if (has_marker(dir, name)) {
                    return true;
                }
            }
            return false;
        }

    }  // namespace detail

    ecosystem_signal detect_ecosystems(const fs::path& target_dir) {
        ecosystem_signal signal{};
        signal.package_json = detail::has_marker(target_dir, markers::package_json);
        signal.tsconfig = detail::has_marker(target_dir, markers::tsconfig_json);
        signal.eslint_config = detail::has_any_marker(
                target_dir, {markers::eslintrc_json, markers::eslintrc_js, markers::eslint_config_js});
        signal.requirements = detail::has_marker(target_dir, markers::requirements_txt);
        signal.pyproject = detail::has_marker(target_dir, markers::pyproject_toml);
        signal.cargo_toml = detail::has_marker(target_dir, markers::cargo_toml);
        return signal;
    }

    std::vector<ecosystem> active_ecosystems(const ecosystem_signal& signal) {
        std::vector<ecosystem> active{};
        for (auto eco : ecosystem_order) {
            if (signal.active(eco)) {
                active.push_back(eco);
            }
        }
        return active;
    }

}  // namespace scour
