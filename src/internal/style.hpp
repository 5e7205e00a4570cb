#pragma once

#include "scour/config.hpp"

extern "C" {
#include <unistd.h>
}

#include <string>
#include <string_view>

namespace scour::internal::style {
    using namespace std::string_view_literals;

    inline constexpr auto green = "\x1b[0;32m"sv;
    inline constexpr auto yellow = "\x1b[1;33m"sv;
    inline constexpr auto red = "\x1b[0;31m"sv;
    inline constexpr auto blue = "\x1b[0;34m"sv;
    inline constexpr auto reset = "\x1b[0m"sv;

    inline bool use_color(color_mode mode) {
        switch (mode) {
            case color_mode::always:
                return true;
            case color_mode::never:
                return false;
            case color_mode::automatic:
                return ::isatty(STDOUT_FILENO) == 1;
        }
        return false;
    }

    inline std::string paint(bool enabled, std::string_view color, std::string_view text) {
        if (!enabled) {
            return std::string{text};
        }
        std::string out{};
        out.reserve(color.size() + text.size() + reset.size());
        out.append(color);
        out.append(text);
        out.append(reset);
        return out;
    }

}  // namespace scour::internal::style
