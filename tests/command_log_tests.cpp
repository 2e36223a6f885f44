#include "ddlsort/tools/command_log_formatter.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

using ddlsort::parser::ParserDiagnostic;
using ddlsort::parser::ParserSeverity;
using ddlsort::shell::CommandMetrics;
using ddlsort::tools::format_command_log_json;

TEST_CASE("format_command_log_json writes every field")
{
    CommandMetrics metrics{};
    metrics.correlation_id = "cmd-7";
    metrics.command_category = "sql";
    metrics.command_text = "CREATE TABLE \"a\" (id INT);\n";
    metrics.summary = "Ordered 1 table";
    metrics.success = true;
    metrics.outcome = ddlsort::ddl::ResolveOutcome::Ordered;
    metrics.duration_ms = 1.5;
    metrics.detail_lines = {"1. a"};

    ParserDiagnostic diagnostic{};
    diagnostic.severity = ParserSeverity::Info;
    diagnostic.message = "m\tx";
    diagnostic.line = 2U;
    diagnostic.column = 3U;
    diagnostic.statement = "s";
    diagnostic.remediation_hints = {"h"};
    metrics.diagnostics.push_back(diagnostic);

    const std::string expected =
        R"json({"correlation_id":"cmd-7","category":"sql","input":"CREATE TABLE \"a\" (id INT);\n",)json"
        R"json("summary":"Ordered 1 table","success":true,"outcome":"ordered","duration_ms":1.500000,)json"
        R"json("started_at":null,"finished_at":null,"detail_lines":["1. a"],)json"
        R"json("diagnostics":[{"severity":"info","message":"m\tx","line":2,"column":3,"statement":"s",)json"
        R"json("remediation_hints":["h"]}]})json";
    CHECK(format_command_log_json(metrics) == expected);
}

TEST_CASE("format_command_log_json writes null outcome and ISO timestamps")
{
    CommandMetrics metrics{};
    metrics.correlation_id = "cmd-1";
    metrics.command_category = "meta";
    metrics.command_text = "\\stats";
    metrics.started_at = std::chrono::system_clock::from_time_t(86'400) + std::chrono::microseconds{250'000};
    metrics.finished_at = std::chrono::system_clock::from_time_t(86'401);

    const auto json = format_command_log_json(metrics);
    CHECK(json.find(R"("input":"\\stats")") != std::string::npos);
    CHECK(json.find(R"("success":false)") != std::string::npos);
    CHECK(json.find(R"("outcome":null)") != std::string::npos);
    CHECK(json.find(R"("started_at":"1970-01-02T00:00:00.250000Z")") != std::string::npos);
    CHECK(json.find(R"("finished_at":"1970-01-02T00:00:01.000000Z")") != std::string::npos);
    CHECK(json.find(R"("detail_lines":[])") != std::string::npos);
    CHECK(json.find(R"("diagnostics":[])") != std::string::npos);
}

TEST_CASE("format_command_log_json escapes control characters")
{
    CommandMetrics metrics{};
    metrics.summary = std::string{"bell\x01"};
    const auto json = format_command_log_json(metrics);
    CHECK(json.find(R"("summary":"bell\u0001")") != std::string::npos);
}
