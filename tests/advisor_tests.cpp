#include "ddlsort/advisor/ddl_annotator.hpp"
#include "ddlsort/advisor/performance_estimator.hpp"
#include "ddlsort/advisor/result_simulator.hpp"
#include "ddlsort/advisor/schema_validator.hpp"
#include "ddlsort/advisor/workload.hpp"
#include "ddlsort/ddl/ddl_errors.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace ddlsort::advisor;

namespace {

bool contains(const std::string& text, const std::string& needle)
{
    return text.find(needle) != std::string::npos;
}

}  // namespace

TEST_CASE("parse_workload accepts every label case-insensitively")
{
    for (const auto type : all_workloads()) {
        const auto name = std::string{workload_name(type)};
        CHECK(parse_workload(name) == type);
    }
    CHECK(parse_workload(" olap ") == WorkloadType::Olap);
    CHECK(parse_workload("Stream") == WorkloadType::Stream);
    CHECK_FALSE(parse_workload("OLTPX").has_value());
    CHECK_FALSE(parse_workload("").has_value());
}

TEST_CASE("annotate_ddl appends the note for the workload")
{
    CHECK(annotate_ddl("CREATE TABLE a (id INT);", "olap") ==
          "CREATE TABLE a (id INT);\n-- OPTIMIZATION FOR OLAP:\n-- Optimized for read speed and aggregation "
          "(suggesting Columnar Indexes, partitioning by time, or denormalization).\n");

    const auto batch = annotate_ddl("CREATE TABLE a (id INT);", "BATCH");
    CHECK(contains(batch, "-- OPTIMIZATION FOR BATCH:\n-- Optimized for high-throughput scheduled processing"));
}

TEST_CASE("annotate_ddl falls back to the general note")
{
    CHECK(annotate_ddl("X", "mainframe") ==
          "X\n-- OPTIMIZATION FOR MAINFRAME:\n-- General optimization applied. No specific processing type detected.\n");
}

TEST_CASE("estimate_performance scales the static profiles")
{
    const auto estimate = estimate_performance("CREATE TABLE a (id INT);", 1'000'000, "olap");
    REQUIRE(estimate.success());
    CHECK(estimate.proposed == WorkloadType::Olap);
    CHECK(estimate.scale_factor == 10.0);
    REQUIRE(estimate.timings.size() == kWorkloadCount);
    CHECK(estimate.timings[0].type == WorkloadType::Oltp);
    CHECK(estimate.timings[5].type == WorkloadType::Batch);
    CHECK(estimate.best_transaction == WorkloadType::Ollp);
    CHECK(estimate.best_analysis == WorkloadType::Batch);

    const auto* olap = estimate.timing_for(WorkloadType::Olap);
    REQUIRE(olap != nullptr);
    CHECK(olap->transaction_ms == 10'000.0);
    CHECK(olap->simple_query_ms == 5'000.0);
    CHECK(olap->complex_analysis_ms == 20'000.0);
}

TEST_CASE("estimate_performance never scales below one")
{
    const auto estimate = estimate_performance("", 50, "OLTP");
    REQUIRE(estimate.success());
    CHECK(estimate.scale_factor == 1.0);
    CHECK(estimate.timing_for(WorkloadType::Batch)->transaction_ms == 5'000.0);
}

TEST_CASE("format_performance_report renders the comparison")
{
    const auto report = format_performance_report(estimate_performance("", 1'000'000, "OLAP"));

    CHECK(report.rfind("## Performance Simulation Report (1000000 Rows)\n", 0U) == 0U);
    CHECK(contains(report, "| Processing Type | Simple Transaction (Latency) | Complex Analysis (Throughput) |\n"
                           "| :--- | :--- | :--- |\n"
                           "| OLTP | 100.000 ms | 8.33 min |\n"
                           "| **OLAP** | 10000.000 ms | 0.33 min |\n"
                           "| HTAP | 500.000 ms | 0.67 min |\n"
                           "| STREAM | 10.000 ms | 16.67 min |\n"
                           "| OLLP | 1.000 ms | 33.33 min |\n"
                           "| BATCH | 50000.000 ms | 0.08 min |\n"));
    CHECK(contains(report, "### Estimation Details for Proposed Type (OLAP):\n"
                           "- **Simple Transaction (1 row):** 10000.000 ms\n"
                           "- **Complex Analysis (1000000 rows):** 0.33 min\n"));
    CHECK(contains(report, "From this simulation, the best type for **Transaction Speed** is: **OLLP**."));
    CHECK(contains(report, "The best type for **High Volume Analysis** is: **BATCH**."));
}

TEST_CASE("estimate_performance rejects unknown workloads and negative rows")
{
    const auto unknown = estimate_performance("", 10, "mainframe");
    CHECK(unknown.error == ddlsort::ddl::make_error_code(ddlsort::ddl::DdlErrc::UnknownWorkload));
    CHECK(format_performance_report(unknown) == "ERROR: Proposed usage type is invalid for performance estimation.");

    const auto negative = estimate_performance("", -1, "OLTP");
    CHECK(negative.error == ddlsort::ddl::make_error_code(ddlsort::ddl::DdlErrc::InvalidRowCount));
    CHECK(contains(format_performance_report(negative), "ERROR:"));
}

TEST_CASE("validate_schema always succeeds and echoes the DDL")
{
    const auto validation = validate_schema("CREATE TABLE a (id INT);", "{\"a\": [{\"id\": 1}]}");
    CHECK(validation.success);
    CHECK(validation.text == std::string{kValidationHeader} + "CREATE TABLE a (id INT);");
}

TEST_CASE("guess_select_columns prefers aliases and strips table prefixes")
{
    CHECK(guess_select_columns("SELECT m.first_name, v.value AS kpi_value, COUNT(*) AS total FROM member m") ==
          std::vector<std::string>{"FIRST_NAME", "KPI_VALUE", "TOTAL"});
    CHECK(guess_select_columns("select id, name from t") == std::vector<std::string>{"ID", "NAME"});
    CHECK(guess_select_columns("SELECT * FROM t") == std::vector<std::string>{"col_1", "col_2", "col_3"});
}

TEST_CASE("simulate_select_result picks canned rows by keyword")
{
    const auto kpi = simulate_select_result(
        "SELECT m.first_name, m.last_name, k.kpi_name, v.value AS kpi_value, v.recorded_at "
        "FROM member m JOIN kpi_value v ON v.member_id = m.id JOIN kpi k ON k.id = v.kpi_id");
    CHECK(kpi.columns == std::vector<std::string>{"FIRST_NAME", "LAST_NAME", "KPI_NAME", "KPI_VALUE", "RECORDED_AT"});
    REQUIRE(kpi.rows.size() == 2U);
    CHECK(kpi.rows[0] == std::vector<std::string>{"Budi", "Santoso", "Sales Revenue", "95000.00", "2023-10-26"});

    const auto team = simulate_select_result("SELECT id, name, team_name FROM team_member");
    CHECK(team.columns == std::vector<std::string>{"ID", "NAME", "TEAM_NAME"});
    CHECK(team.rows[1] == std::vector<std::string>{"102", "Siti Aminah", "Sales Team A"});

    const auto generic = simulate_select_result("SELECT a, b, c FROM t");
    CHECK(generic.columns == std::vector<std::string>{"Column_1", "Column_2"});
    CHECK(generic.rows[0] == std::vector<std::string>{"Sample_Value_A", "123"});
}

TEST_CASE("simulate_select_output renders a Markdown table")
{
    const auto output = simulate_select_output("  SELECT id, name, team_name FROM team_member  ", "Team roster");
    CHECK(output ==
          "### Simulated Query Output: (Team roster)\n\n"
          "**Query:**\n"
          "```sql\n"
          "SELECT id, name, team_name FROM team_member\n"
          "```\n\n"
          "| ID | NAME | TEAM_NAME |\n"
          "| --- | --- | --- |\n"
          "| 101 | Budi Santoso | Sales Team A |\n"
          "| 102 | Siti Aminah | Sales Team A |");
}
