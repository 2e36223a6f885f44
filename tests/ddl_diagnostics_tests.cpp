#include "ddlsort/ddl/ddl_errors.hpp"
#include "ddlsort/ddl/parser_diagnostics.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <system_error>
#include <vector>

using namespace ddlsort::ddl;
using ddlsort::parser::ParserDiagnostic;
using ddlsort::parser::ParserSeverity;

TEST_CASE("DdlErrc codes use the ddlsort category")
{
    const std::error_code code = DdlErrc::DependencyCycle;
    CHECK(code.category().name() == std::string{"ddlsort.ddl"});
    CHECK(code.message() == "circular foreign key dependency");
    CHECK(code == make_error_code(DdlErrc::DependencyCycle));
    CHECK_FALSE(make_error_code(DdlErrc::Success));
    CHECK(make_error_code(DdlErrc::UnknownWorkload).message() == "unknown workload type");
}

TEST_CASE("format_parser_diagnostic includes severity and location")
{
    ParserDiagnostic diagnostic{};
    diagnostic.severity = ParserSeverity::Warning;
    diagnostic.message = "CREATE TABLE header not recognized";
    diagnostic.line = 3U;
    diagnostic.column = 7U;
    CHECK(format_parser_diagnostic(diagnostic) == "warning: CREATE TABLE header not recognized (line 3, column 7)");

    diagnostic.line = 0U;
    diagnostic.column = 0U;
    diagnostic.severity = ParserSeverity::Info;
    CHECK(format_parser_diagnostic(diagnostic) == "info: CREATE TABLE header not recognized");
}

TEST_CASE("summarize_diagnostics reports the highest severity and collects hints")
{
    ParserDiagnostic info{};
    info.severity = ParserSeverity::Info;
    info.message = "Statement is not a CREATE TABLE statement";

    ParserDiagnostic warning{};
    warning.severity = ParserSeverity::Warning;
    warning.message = "Duplicate CREATE TABLE for 'a'";
    warning.line = 2U;
    warning.remediation_hints = {"Remove or rename the duplicate table definition.", ""};

    const auto summary = summarize_diagnostics({info, warning});
    CHECK(summary.severity == ParserSeverity::Warning);
    CHECK(summary.warnings == 1U);
    CHECK(summary.errors == 0U);
    CHECK(summary.message ==
          "Statement is not a CREATE TABLE statement; Duplicate CREATE TABLE for 'a' (line 2)");
    CHECK(summary.remediation_hints == std::vector<std::string>{"Remove or rename the duplicate table definition."});

    const auto empty = summarize_diagnostics({});
    CHECK(empty.severity == ParserSeverity::Info);
    CHECK(empty.message.empty());
    CHECK(highest_severity({}) == ParserSeverity::Info);
}
