#pragma once

#include "ddlsort/parser/grammar.hpp"

#include <string>
#include <vector>

namespace ddlsort::ddl {

struct DiagnosticSummary final {
    parser::ParserSeverity severity = parser::ParserSeverity::Info;
    std::string message{};
    std::vector<std::string> remediation_hints{};
    std::size_t warnings = 0U;
    std::size_t errors = 0U;
};

[[nodiscard]] std::string_view severity_to_string(parser::ParserSeverity severity) noexcept;

parser::ParserSeverity highest_severity(const std::vector<parser::ParserDiagnostic>& diagnostics) noexcept;

// Single line: "<severity>: <message> (line L, column C)".
std::string format_parser_diagnostic(const parser::ParserDiagnostic& diagnostic);

DiagnosticSummary summarize_diagnostics(const std::vector<parser::ParserDiagnostic>& diagnostics);

}  // namespace ddlsort::ddl
