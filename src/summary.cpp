#include "scour/summary.hpp"

#include "scour/format.hpp"

#include "internal/payloads.hpp"

#include <glaze/glaze.hpp>

#include <exception>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

using namespace scour::literals;
namespace fs = std::filesystem;

namespace scour {

    namespace detail {

        static constexpr auto tsc_error_marker = "error TS"sv;
        static constexpr auto mypy_error_marker = ": error:"sv;
        static constexpr auto clippy_warning_marker = R"("level":"warning")"sv;

        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                throw std::runtime_error("failed to open {}"_format(path.string()));
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (!in.good() && !in.eof()) {
                throw std::runtime_error("failed to read {}"_format(path.string()));
            }
            return ss.str();
        }

        template <typename T>
        static std::optional<T> read_json_lenient(std::string_view text) {
            if (utils::trim_view(text).empty()) {
                return std::nullopt;
            }
            T value{};
            std::string buffer{text};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(value, buffer);
            if (ec) {
                return std::nullopt;
            }
            return value;
        }

        static std::optional<size_t> count_eslint(std::string_view text) {
            auto files = read_json_lenient<std::vector<internal::eslint_file_result>>(text);
            if (!files) {
                return std::nullopt;
            }
            size_t with_errors{};
            for (const auto& file : *files) {
                if (file.errorCount > 0U) {
                    ++with_errors;
                }
            }
            return with_errors;
        }

        static std::optional<size_t> count_pylint(std::string_view text) {
            auto messages = read_json_lenient<std::vector<internal::pylint_message>>(text);
            if (!messages) {
                return std::nullopt;
            }
            return messages->size();
        }

        static std::optional<size_t> count_flake8(std::string_view text) {
            auto report = read_json_lenient<internal::flake8_report>(text);
            if (!report) {
                return std::nullopt;
            }
            size_t total{};
            for (const auto& [file, violations] : *report) {
                total += violations.size();
            }
            return total;
        }

        static std::optional<size_t> count_complexity(std::string_view text) {
            auto report = read_json_lenient<internal::complexity_report>(text);
            if (!report) {
                return std::nullopt;
            }
            return report->problematic_functions.size();
        }

        static std::optional<size_t> count_code_smells(std::string_view text) {
            auto report = read_json_lenient<internal::code_smells_report>(text);
            if (!report) {
                return std::nullopt;
            }
            return report->total_issues;
        }

    }  // namespace detail

    std::string_view count_label(summary_kind kind) {
        switch (kind) {
            case summary_kind::eslint_json:
                return "files with errors"sv;
            case summary_kind::tsc_text:
                return "TypeScript errors"sv;
            case summary_kind::pylint_json:
                return "messages"sv;
            case summary_kind::flake8_json:
                return "violations"sv;
            case summary_kind::mypy_text:
                return "type errors"sv;
            case summary_kind::clippy_json_lines:
                return "Clippy warnings"sv;
            case summary_kind::complexity_json:
                return "problematic functions"sv;
            case summary_kind::code_smells_json:
                return "code smells"sv;
        }
        return "findings"sv;
    }

    std::optional<size_t> count_findings(summary_kind kind, std::string_view text) {
        switch (kind) {
            case summary_kind::eslint_json:
                return detail::count_eslint(text);
            case summary_kind::tsc_text:
                return utils::count_lines_containing(text, detail::tsc_error_marker);
            case summary_kind::pylint_json:
                return detail::count_pylint(text);
            case summary_kind::flake8_json:
                return detail::count_flake8(text);
            case summary_kind::mypy_text:
                return utils::count_lines_containing(text, detail::mypy_error_marker);
            case summary_kind::clippy_json_lines:
                return utils::count_lines_containing(text, detail::clippy_warning_marker);
            case summary_kind::complexity_json:
                return detail::count_complexity(text);
            case summary_kind::code_smells_json:
                return detail::count_code_smells(text);
        }
        return std::nullopt;
    }

    finding_summary summarize_file(summary_kind kind, std::string_view tool, const fs::path& path) {
        finding_summary summary{.tool = std::string{tool}, .count = 0U, .label = std::string{count_label(kind)}};

        std::error_code ec{};
        if (!fs::is_regular_file(path, ec)) {
            summary.status = summary_status::missing;
            return summary;
        }

        try {
            auto text = detail::read_text_file(path);
            if (auto count = count_findings(kind, text)) {
                summary.count = *count;
                summary.status = summary_status::counted;
            }
            else {
                summary.status = summary_status::unparsable;
            }
        } catch (const std::exception& e) {
            debug_log("summary scan of ", path.string(), " failed: ", e.what());
            summary.status = summary_status::unparsable;
        }
        return summary;
    }

    finding_summary summarize(const tool_spec& spec, const tool_invocation& invocation) {
        if (!invocation.ran()) {
            return finding_summary{
                    .tool = spec.name,
                    .count = 0U,
                    .label = std::string{count_label(spec.summary)},
                    .status = summary_status::missing};
        }
        return summarize_file(spec.summary, spec.name, invocation.output_path);
    }

}  // namespace scour
