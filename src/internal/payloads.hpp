#pragma once

#include <glaze/glaze.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace scour::internal {

    // ── captured tool output (read side) ───────────────────────────────

    // `eslint --format json`: one entry per linted file
    struct eslint_file_result {
        std::string filePath{};
        size_t errorCount{};
        size_t warningCount{};
    };

    // `pylint --output-format=json`: one entry per message
    struct pylint_message {
        std::string type{};
        std::string path{};
        std::string symbol{};
        std::string message{};
    };

    // `flake8 --format=json`: filename -> violations
    struct flake8_violation {
        std::string code{};
        std::string filename{};
        std::string text{};
    };

    using flake8_report = std::map<std::string, std::vector<flake8_violation>>;

    struct problematic_function {
        std::string name{};
        std::string file{};
    };

    struct complexity_report {
        std::vector<problematic_function> problematic_functions{};
    };

    struct code_smells_report {
        size_t total_issues{};
    };

    // ── session summary (write side, --output json) ─────────────────────

    struct invocation_record {
        std::string tool{};
        std::string outcome{};
        std::optional<std::string> reason{};
        std::optional<int> exit_code{};
        std::optional<std::string> output{};
    };

    struct finding_record {
        std::string tool{};
        size_t count{};
        std::string label{};
        std::string status{};
    };

    struct report_record {
        bool generated{false};
        std::optional<std::string> path{};
    };

    struct session_payload {
        int schema_version{1};
        std::string target_dir{};
        std::string output_dir{};
        std::string state{};
        std::vector<std::string> ecosystems{};
        std::vector<invocation_record> invocations{};
        std::vector<finding_record> findings{};
        report_record report{};
        bool has_unparsable{false};
    };

}  // namespace scour::internal

namespace glz {

    template <>
    struct meta<scour::internal::eslint_file_result> {
        using T = scour::internal::eslint_file_result;
        static constexpr auto value =
                object("filePath", &T::filePath, "errorCount", &T::errorCount, "warningCount", &T::warningCount);
    };

    template <>
    struct meta<scour::internal::pylint_message> {
        using T = scour::internal::pylint_message;
        static constexpr auto value =
                object("type", &T::type, "path", &T::path, "symbol", &T::symbol, "message", &T::message);
    };

    template <>
    struct meta<scour::internal::flake8_violation> {
        using T = scour::internal::flake8_violation;
        static constexpr auto value = object("code", &T::code, "filename", &T::filename, "text", &T::text);
    };

    template <>
    struct meta<scour::internal::problematic_function> {
        using T = scour::internal::problematic_function;
        static constexpr auto value = object("name", &T::name, "file", &T::file);
    };

    template <>
    struct meta<scour::internal::complexity_report> {
        using T = scour::internal::complexity_report;
        static constexpr auto value = object("problematic_functions", &T::problematic_functions);
    };

    template <>
    struct meta<scour::internal::code_smells_report> {
        using T = scour::internal::code_smells_report;
        static constexpr auto value = object("total_issues", &T::total_issues);
    };

    template <>
    struct meta<scour::internal::invocation_record> {
        using T = scour::internal::invocation_record;
        static constexpr auto value =
                object("tool",
                       &T::tool,
                       "outcome",
                       &T::outcome,
                       "reason",
                       &T::reason,
                       "exit_code",
                       &T::exit_code,
                       "output",
                       &T::output);
    };

    template <>
    struct meta<scour::internal::finding_record> {
        using T = scour::internal::finding_record;
        static constexpr auto value =
                object("tool", &T::tool, "count", &T::count, "label", &T::label, "status", &T::status);
    };

    template <>
    struct meta<scour::internal::report_record> {
        using T = scour::internal::report_record;
        static constexpr auto value = object("generated", &T::generated, "path", &T::path);
    };

    template <>
    struct meta<scour::internal::session_payload> {
        using T = scour::internal::session_payload;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "target_dir",
                       &T::target_dir,
                       "output_dir",
                       &T::output_dir,
                       "state",
                       &T::state,
                       "ecosystems",
                       &T::ecosystems,
                       "invocations",
                       &T::invocations,
                       "findings",
                       &T::findings,
                       "report",
                       &T::report,
                       "has_unparsable",
                       &T::has_unparsable);
    };

}  // namespace glz
