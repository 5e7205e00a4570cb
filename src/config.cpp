#include "scour/config.hpp"

#include "internal/platform.hpp"

#if SCOUR_PLATFORM_MACOS
#include <mach-o/dyld.h>

#include <climits>
#endif

#include <cstdint>
#include <system_error>

namespace fs = std::filesystem;

namespace scour {

    namespace detail {

        static fs::path resolve_self_exe() {
            if constexpr (internal::platform::is_linux) {
                std::error_code ec{};
                auto path = fs::read_symlink("/proc/self/exe", ec);
                if (!ec) {
                    return path;
                }
            }
#if SCOUR_PLATFORM_MACOS
            if constexpr (internal::platform::is_macos) {
                char buf[PATH_MAX]{};
                uint32_t size = sizeof(buf);
                if (_NSGetExecutablePath(buf, &size) == 0) {
                    return fs::canonical(buf);
                }
            }
#endif
            return {};
        }

        static fs::path absolute_or_self(const fs::path& path) {
            std::error_code ec{};
            auto abs = fs::absolute(path, ec);
            if (ec) {
                return path;
            }
            // "/a/b/." normalizes to "/a/b/"; keep the directory name as the last element
            auto normal = abs.lexically_normal();
            if (!normal.has_filename() && normal.has_relative_path()) {
                normal = normal.parent_path();
            }
            return normal;
        }

    }  // namespace detail

    fs::path default_analyzers_dir() {
        auto self = detail::resolve_self_exe();
        if (self.empty()) {
            return fs::current_path();
        }
        return self.parent_path();
    }

    session_config resolve_paths(session_config cfg) {
        cfg.target_dir = detail::absolute_or_self(cfg.target_dir);
        cfg.output_dir = detail::absolute_or_self(cfg.output_dir);
        cfg.analyzers_dir = detail::absolute_or_self(cfg.analyzers_dir);
        return cfg;
    }

}  // namespace scour
