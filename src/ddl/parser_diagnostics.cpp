#include "ddlsort/ddl/parser_diagnostics.hpp"

#include <string>
#include <vector>

namespace ddlsort::ddl {

namespace {

int severity_rank(parser::ParserSeverity severity) noexcept
{
    switch (severity) {
    case parser::ParserSeverity::Info:
        return 0;
    case parser::ParserSeverity::Warning:
        return 1;
    default:
        return 2;
    }
}

std::string format_location(const parser::ParserDiagnostic& diagnostic)
{
    if (diagnostic.line == 0U && diagnostic.column == 0U) {
        return {};
    }

    std::string location = " (";
    bool written = false;
    if (diagnostic.line > 0U) {
        location.append("line ");
        location.append(std::to_string(diagnostic.line));
        written = true;
    }
    if (diagnostic.column > 0U) {
        if (written) {
            location.append(", ");
        }
        location.append("column ");
        location.append(std::to_string(diagnostic.column));
    }
    location.push_back(')');
    return location;
}

}  // namespace

std::string_view severity_to_string(parser::ParserSeverity severity) noexcept
{
    switch (severity) {
    case parser::ParserSeverity::Info:
        return "info";
    case parser::ParserSeverity::Warning:
        return "warning";
    default:
        return "error";
    }
}

parser::ParserSeverity highest_severity(const std::vector<parser::ParserDiagnostic>& diagnostics) noexcept
{
    auto highest = parser::ParserSeverity::Info;
    for (const auto& diagnostic : diagnostics) {
        if (severity_rank(diagnostic.severity) > severity_rank(highest)) {
            highest = diagnostic.severity;
        }
    }
    return highest;
}

std::string format_parser_diagnostic(const parser::ParserDiagnostic& diagnostic)
{
    std::string line{severity_to_string(diagnostic.severity)};
    line.append(": ");
    line.append(diagnostic.message);
    line.append(format_location(diagnostic));
    return line;
}

DiagnosticSummary summarize_diagnostics(const std::vector<parser::ParserDiagnostic>& diagnostics)
{
    DiagnosticSummary summary{};
    if (diagnostics.empty()) {
        return summary;
    }

    summary.severity = highest_severity(diagnostics);

    std::string message;
    message.reserve(diagnostics.size() * 32U);
    for (std::size_t index = 0; index < diagnostics.size(); ++index) {
        const auto& diagnostic = diagnostics[index];
        if (diagnostic.severity == parser::ParserSeverity::Warning) {
            ++summary.warnings;
        } else if (diagnostic.severity == parser::ParserSeverity::Error) {
            ++summary.errors;
        }
        if (index > 0U) {
            message.append("; ");
        }
        message.append(diagnostic.message);
        message.append(format_location(diagnostic));
    }
    summary.message = std::move(message);

    for (const auto& diagnostic : diagnostics) {
        for (const auto& hint : diagnostic.remediation_hints) {
            if (!hint.empty()) {
                summary.remediation_hints.push_back(hint);
            }
        }
    }

    return summary;
}

}  // namespace ddlsort::ddl
