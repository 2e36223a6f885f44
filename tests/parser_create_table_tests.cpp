#include "ddlsort/parser/grammar.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>
#include <vector>

using namespace ddlsort::parser;

namespace {

bool has_diagnostic(const std::vector<ParserDiagnostic>& diagnostics, ParserSeverity severity, const std::string& needle)
{
    return std::any_of(diagnostics.begin(), diagnostics.end(), [&](const ParserDiagnostic& diagnostic) {
        return diagnostic.severity == severity && diagnostic.message.find(needle) != std::string::npos;
    });
}

}  // namespace

TEST_CASE("split_statements trims fragments and drops empty ones")
{
    const auto fragments = split_statements("a; ;b;\n\n");
    REQUIRE(fragments.size() == 2U);
    CHECK(fragments[0].text == "a");
    CHECK(fragments[0].index == 0U);
    CHECK(fragments[0].offset == 0U);
    CHECK(fragments[1].text == "b");
    CHECK(fragments[1].index == 1U);
    CHECK(fragments[1].offset == 4U);

    CHECK(split_statements("").empty());
    CHECK(split_statements(" ;;\n; ").empty());
}

TEST_CASE("split_statements keeps a trailing fragment without terminator")
{
    const auto fragments = split_statements("CREATE TABLE a (id INT); CREATE TABLE b (id INT)");
    REQUIRE(fragments.size() == 2U);
    CHECK(fragments[1].text == "CREATE TABLE b (id INT)");
}

TEST_CASE("parse_create_table extracts inline references")
{
    const auto result = parse_create_table("CREATE TABLE b (id INT, a_id INT REFERENCES a(id));");
    REQUIRE(result.success());

    const auto& statement = *result.ast;
    CHECK(statement.name.value == "b");
    CHECK_FALSE(statement.name.quoted);
    CHECK(statement.text == "CREATE TABLE b (id INT, a_id INT REFERENCES a(id));");
    CHECK(statement.dependencies == std::vector<std::string>{"a"});

    REQUIRE(statement.references.size() == 1U);
    const auto& reference = statement.references.front();
    CHECK(reference.table.value == "a");
    CHECK(reference.inline_constraint);
    REQUIRE(reference.local_columns.size() == 1U);
    CHECK(reference.local_columns[0].value == "a_id");
    REQUIRE(reference.referenced_columns.size() == 1U);
    CHECK(reference.referenced_columns[0].value == "id");
}

TEST_CASE("parse_create_table extracts table-level constraints")
{
    const auto result = parse_create_table(
        "CREATE TABLE orders (\n"
        "    id INT PRIMARY KEY,\n"
        "    customer_id INT NOT NULL,\n"
        "    CONSTRAINT fk_customer FOREIGN KEY (customer_id) REFERENCES customers (id) ON DELETE CASCADE\n"
        ")");
    REQUIRE(result.success());

    const auto& statement = *result.ast;
    CHECK(statement.name.value == "orders");
    CHECK(statement.dependencies == std::vector<std::string>{"customers"});
    REQUIRE(statement.references.size() == 1U);
    const auto& reference = statement.references.front();
    CHECK_FALSE(reference.inline_constraint);
    REQUIRE(reference.local_columns.size() == 1U);
    CHECK(reference.local_columns[0].value == "customer_id");
    REQUIRE(reference.referenced_columns.size() == 1U);
    CHECK(reference.referenced_columns[0].value == "id");
}

TEST_CASE("parse_create_table handles multi-column foreign keys")
{
    const auto result = parse_create_table(
        "CREATE TABLE line_item (order_id INT, line_no INT, product_id INT, "
        "FOREIGN KEY (order_id, line_no) REFERENCES order_line (order_id, line_no), "
        "FOREIGN KEY (product_id) REFERENCES product (id))");
    REQUIRE(result.success());

    const auto& statement = *result.ast;
    CHECK(statement.dependencies == std::vector<std::string>{"order_line", "product"});
    REQUIRE(statement.references.size() == 2U);

    const auto& composite = statement.references[0];
    REQUIRE(composite.local_columns.size() == 2U);
    CHECK(composite.local_columns[0].value == "order_id");
    CHECK(composite.local_columns[1].value == "line_no");
    REQUIRE(composite.referenced_columns.size() == 2U);
    CHECK(composite.referenced_columns[1].value == "line_no");

    const auto& single = statement.references[1];
    REQUIRE(single.local_columns.size() == 1U);
    CHECK(single.local_columns[0].value == "product_id");
}

TEST_CASE("parse_create_table accepts quoted identifiers")
{
    const auto result =
        parse_create_table("CREATE TABLE \"child\" (id INT, parent_id INT REFERENCES `parent` (id))");
    REQUIRE(result.success());
    CHECK(result.ast->name.value == "child");
    CHECK(result.ast->name.quoted);
    CHECK(result.ast->dependencies == std::vector<std::string>{"parent"});
    CHECK(result.ast->references[0].table.quoted);
}

TEST_CASE("parse_create_table is case-insensitive for keywords and tolerates comments")
{
    const auto result = parse_create_table("create /* t */ table\n  widgets\n(\n  -- owner\n  owner_id int references Users(id)\n)");
    REQUIRE(result.success());
    CHECK(result.ast->name.value == "widgets");
    CHECK(result.ast->dependencies == std::vector<std::string>{"Users"});
}

TEST_CASE("parse_create_table collapses repeated references and keeps self references")
{
    const auto result = parse_create_table(
        "CREATE TABLE employee (id INT, manager_id INT REFERENCES employee(id), "
        "dept_id INT REFERENCES dept(id), backup_dept_id INT REFERENCES dept(id))");
    REQUIRE(result.success());
    CHECK(result.ast->dependencies == std::vector<std::string>{"employee", "dept"});
    CHECK(result.ast->references.size() == 3U);
    CHECK(result.ast->references_itself());
}

TEST_CASE("parse_create_table ignores qualified references")
{
    const auto result = parse_create_table("CREATE TABLE audit (id INT, user_id INT REFERENCES auth.users(id))");
    REQUIRE(result.success());
    CHECK(result.ast->dependencies.empty());
    CHECK(has_diagnostic(result.diagnostics, ParserSeverity::Info, "auth.users"));
}

TEST_CASE("parse_create_table rejects headers it cannot recognise")
{
    SECTION("IF NOT EXISTS")
    {
        const auto result = parse_create_table("CREATE TABLE IF NOT EXISTS t (id INT)");
        CHECK_FALSE(result.success());
        CHECK(has_diagnostic(result.diagnostics, ParserSeverity::Warning, "header not recognized"));
    }

    SECTION("schema-qualified name")
    {
        const auto result = parse_create_table("CREATE TABLE sales.t (id INT)");
        CHECK_FALSE(result.success());
    }

    SECTION("quoted name with spaces")
    {
        const auto result = parse_create_table("CREATE TABLE \"order items\" (id INT)");
        CHECK_FALSE(result.success());
    }

    SECTION("not a CREATE TABLE statement")
    {
        const auto result = parse_create_table("CREATE INDEX idx ON t (id)");
        CHECK_FALSE(result.success());
        CHECK(has_diagnostic(result.diagnostics, ParserSeverity::Info, "not a CREATE TABLE"));
    }
}

TEST_CASE("parse_ddl_batch separates tables from unrecognised fragments")
{
    const auto batch = parse_ddl_batch(
        "CREATE TABLE a (id INT);\n"
        "CREATE INDEX idx_a ON a (id);\n"
        "CREATE TABLE b (id INT, a_id INT REFERENCES a(id));");

    CHECK(batch.fragments.size() == 3U);
    REQUIRE(batch.tables.size() == 2U);
    CHECK(batch.tables[0].name.value == "a");
    CHECK(batch.tables[0].fragment_index == 0U);
    CHECK(batch.tables[1].name.value == "b");
    CHECK(batch.tables[1].fragment_index == 2U);
    REQUIRE(batch.unrecognized.size() == 1U);
    CHECK(batch.unrecognized[0].text == "CREATE INDEX idx_a ON a (id)");
}

TEST_CASE("parse_ddl_batch keeps the first position for duplicate tables")
{
    const auto batch = parse_ddl_batch(
        "CREATE TABLE a (id INT); CREATE TABLE b (id INT); CREATE TABLE a (id INT, b_id INT REFERENCES b(id));");

    REQUIRE(batch.tables.size() == 2U);
    CHECK(batch.tables[0].name.value == "a");
    CHECK(batch.tables[0].text == "CREATE TABLE a (id INT, b_id INT REFERENCES b(id));");
    CHECK(batch.tables[0].dependencies == std::vector<std::string>{"b"});
    CHECK(has_diagnostic(batch.diagnostics, ParserSeverity::Warning, "Duplicate CREATE TABLE for 'a'"));
}

TEST_CASE("parse_ddl_batch strips a leading ordering banner")
{
    const std::string ordered = std::string{kOrderedBanner} + "\n\nCREATE TABLE a (id INT);\n\nCREATE TABLE b (id INT);";
    const auto batch = parse_ddl_batch(ordered);
    REQUIRE(batch.tables.size() == 2U);
    CHECK(batch.tables[0].text == "CREATE TABLE a (id INT);");
    CHECK(batch.unrecognized.empty());
}
