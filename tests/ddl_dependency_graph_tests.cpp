#include "ddlsort/ddl/ddl_dependency_graph.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace ddlsort::ddl;

TEST_CASE("DdlDependencyGraph registers tables once")
{
    DdlDependencyGraph graph;
    CHECK(graph.add_table("a") == 0U);
    CHECK(graph.add_table("b") == 1U);
    CHECK(graph.add_table("a") == 0U);
    CHECK(graph.table_count() == 2U);
    CHECK(graph.find("b") == std::optional<TableIndex>{1U});
    CHECK_FALSE(graph.find("B").has_value());
}

TEST_CASE("DdlDependencyGraph records edges and external references")
{
    DdlDependencyGraph graph;
    const auto orders = graph.add_table("orders");
    const auto customers = graph.add_table("customers");

    CHECK(graph.add_dependency(orders, "customers"));
    CHECK(graph.add_dependency(orders, "customers"));
    CHECK_FALSE(graph.add_dependency(orders, "products"));
    CHECK_FALSE(graph.add_dependency(orders, "products"));

    CHECK(graph.edge_count() == 1U);
    CHECK(graph.dependencies_of(orders) == std::vector<TableIndex>{customers});
    CHECK(graph.dependents_of(customers) == std::vector<TableIndex>{orders});
    CHECK(graph.external_references_of(orders) == std::vector<std::string>{"products"});
    CHECK_FALSE(graph.node(orders).self_referencing);
}

TEST_CASE("DdlDependencyGraph orders a chain and ignores external references")
{
    DdlDependencyGraph graph;
    const auto c = graph.add_table("c");
    const auto b = graph.add_table("b");
    const auto a = graph.add_table("a");
    (void)graph.add_dependency(c, "b");
    (void)graph.add_dependency(b, "a");
    (void)graph.add_dependency(a, "elsewhere");

    const auto order = graph.topological_order();
    REQUIRE(order.complete());
    CHECK_FALSE(order.error);
    CHECK(graph.names(order.order) == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("DdlDependencyGraph breaks ties by insertion order")
{
    DdlDependencyGraph graph;
    const auto child_two = graph.add_table("child_two");
    const auto child_one = graph.add_table("child_one");
    (void)graph.add_table("parent");
    (void)graph.add_table("standalone");
    (void)graph.add_dependency(child_two, "parent");
    (void)graph.add_dependency(child_one, "parent");

    const auto order = graph.topological_order();
    REQUIRE(order.complete());
    CHECK(graph.names(order.order) == std::vector<std::string>{"parent", "standalone", "child_two", "child_one"});
}

TEST_CASE("DdlDependencyGraph reports mutual references as a cycle")
{
    DdlDependencyGraph graph;
    const auto x = graph.add_table("x");
    const auto y = graph.add_table("y");
    (void)graph.add_table("free");
    (void)graph.add_dependency(x, "y");
    (void)graph.add_dependency(y, "x");

    const auto order = graph.topological_order();
    CHECK_FALSE(order.complete());
    CHECK(order.error == make_error_code(DdlErrc::DependencyCycle));
    CHECK(graph.names(order.order) == std::vector<std::string>{"free"});
    CHECK(graph.names(order.unresolved) == std::vector<std::string>{"x", "y"});
    REQUIRE(order.cycles.size() == 1U);
    CHECK(graph.names(order.cycles[0]) == std::vector<std::string>{"x", "y"});
}

TEST_CASE("DdlDependencyGraph separates cycles from tables blocked behind them")
{
    DdlDependencyGraph graph;
    const auto blocked = graph.add_table("blocked");
    const auto a = graph.add_table("a");
    const auto b = graph.add_table("b");
    const auto c = graph.add_table("c");
    (void)graph.add_dependency(blocked, "b");
    (void)graph.add_dependency(a, "b");
    (void)graph.add_dependency(b, "c");
    (void)graph.add_dependency(c, "a");

    const auto order = graph.topological_order();
    CHECK(order.order.empty());
    CHECK(graph.names(order.unresolved) == std::vector<std::string>{"blocked", "a", "b", "c"});
    REQUIRE(order.cycles.size() == 1U);
    CHECK(graph.names(order.cycles[0]) == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("DdlDependencyGraph treats self references as cycles")
{
    DdlDependencyGraph graph;
    const auto employee = graph.add_table("employee");
    CHECK(graph.add_dependency(employee, "employee"));
    CHECK(graph.node(employee).self_referencing);

    const auto order = graph.topological_order();
    CHECK_FALSE(order.complete());
    REQUIRE(order.cycles.size() == 1U);
    CHECK(order.cycles[0] == std::vector<TableIndex>{employee});
}

TEST_CASE("DdlDependencyGraph handles long chains without recursion")
{
    DdlDependencyGraph graph;
    constexpr std::size_t kTables = 5000U;
    for (std::size_t index = 0U; index < kTables; ++index) {
        (void)graph.add_table("t" + std::to_string(index));
    }
    for (std::size_t index = 0U; index + 1U < kTables; ++index) {
        (void)graph.add_dependency(index, "t" + std::to_string(index + 1U));
    }

    const auto order = graph.topological_order();
    REQUIRE(order.complete());
    CHECK(order.order.front() == kTables - 1U);
    CHECK(order.order.back() == 0U);

    (void)graph.add_dependency(kTables - 1U, "t0");
    const auto cyclic = graph.topological_order();
    CHECK(cyclic.unresolved.size() == kTables);
    REQUIRE(cyclic.cycles.size() == 1U);
    CHECK(cyclic.cycles[0].size() == kTables);
    CHECK(cyclic.cycles[0].front() == 0U);
}
