#pragma once

#include "invocation.hpp"
#include "tools.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace scour {

    enum class summary_status : uint8_t {
        counted,
        unparsable,
        missing,
    };

    inline constexpr std::string_view to_string(summary_status status) {
        switch (status) {
            case summary_status::counted:
                return "counted"sv;
            case summary_status::unparsable:
                return "unparsable"sv;
            case summary_status::missing:
                return "missing"sv;
        }
        return "missing"sv;
    }

    struct finding_summary {
        std::string tool{};
        size_t count{};
        std::string label{};
        summary_status status{summary_status::missing};

        // a zero count is only meaningful when this is false
        bool unparsable() const { return status != summary_status::counted; }
    };

    // What the count of `kind` measures, e.g. "files with errors".
    std::string_view count_label(summary_kind kind);

    // Count findings in raw captured output; nullopt when the text cannot be interpreted.
    std::optional<size_t> count_findings(summary_kind kind, std::string_view text);

    finding_summary summarize_file(summary_kind kind, std::string_view tool, const std::filesystem::path& path);

    finding_summary summarize(const tool_spec& spec, const tool_invocation& invocation);

}  // namespace scour
