#pragma once

#include <string_view>

namespace scour::internal::platform {
    using namespace std::string_view_literals;

    inline constexpr bool is_linux = SCOUR_PLATFORM_LINUX != 0;
    inline constexpr bool is_macos = SCOUR_PLATFORM_MACOS != 0;

    inline constexpr char path_list_separator = ':';
    inline constexpr auto null_device = "/dev/null"sv;

    // exit status execvp failures report from the child
    inline constexpr int exec_failure_status = 127;
    inline constexpr int signal_status_base = 128;

}  // namespace scour::internal::platform
