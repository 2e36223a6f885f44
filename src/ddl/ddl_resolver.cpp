#include "ddlsort/ddl/ddl_resolver.hpp"

#include <chrono>
#include <utility>

namespace ddlsort::ddl {

namespace {

using parser::ParserDiagnostic;
using parser::ParserSeverity;

[[nodiscard]] std::uint64_t to_uint64(std::chrono::nanoseconds duration) noexcept
{
    const auto count = duration.count();
    return static_cast<std::uint64_t>(count < 0 ? 0 : count);
}

std::string join(const std::vector<std::string>& parts, std::string_view separator)
{
    std::string joined;
    for (std::size_t index = 0U; index < parts.size(); ++index) {
        if (index > 0U) {
            joined.append(separator);
        }
        joined.append(parts[index]);
    }
    return joined;
}

std::string format_cycle_warning(const std::vector<std::string>& unresolved)
{
    std::string warning{kCycleWarningPrefix};
    warning.append(" (possible circular dependencies: ");
    warning.append(join(unresolved, ", "));
    warning.append("). Using original order.\n");
    return warning;
}

std::string format_cycle_path(const std::vector<std::string>& cycle)
{
    auto path = join(cycle, " -> ");
    if (!cycle.empty()) {
        path.append(" -> ");
        path.append(cycle.front());
    }
    return path;
}

void append_graph_diagnostics(const DdlDependencyGraph& graph,
                              const std::vector<parser::CreateTableStatement>& tables,
                              bool ignore_self_references,
                              std::vector<ParserDiagnostic>& diagnostics)
{
    for (TableIndex index = 0U; index < graph.table_count(); ++index) {
        const auto& node = graph.node(index);
        for (const auto& external : node.external_references) {
            ParserDiagnostic diagnostic{};
            diagnostic.severity = ParserSeverity::Info;
            diagnostic.message = "Table '" + node.name + "' references '" + external
                                 + "', which is not part of this batch and is assumed to exist";
            diagnostic.statement = tables[index].text;
            diagnostics.push_back(std::move(diagnostic));
        }

        if (ignore_self_references && tables[index].references_itself()) {
            ParserDiagnostic diagnostic{};
            diagnostic.severity = ParserSeverity::Info;
            diagnostic.message = "Self reference on '" + node.name + "' ignored for ordering";
            diagnostic.statement = tables[index].text;
            diagnostics.push_back(std::move(diagnostic));
        }
    }
}

}  // namespace

DdlDependencyGraph build_dependency_graph(const std::vector<parser::CreateTableStatement>& tables,
                                          bool ignore_self_references)
{
    DdlDependencyGraph graph{};
    for (const auto& table : tables) {
        (void)graph.add_table(table.name.value);
    }

    for (TableIndex index = 0U; index < tables.size(); ++index) {
        const auto& table = tables[index];
        for (const auto& dependency : table.dependencies) {
            if (ignore_self_references && dependency == table.name.value) {
                continue;
            }
            (void)graph.add_dependency(index, dependency);
        }
    }

    return graph;
}

DdlResolver::DdlResolver() = default;

DdlResolver::DdlResolver(Config config)
    : config_{std::move(config)}
{
    if (config_.telemetry_registry != nullptr && !config_.telemetry_identifier.empty()) {
        config_.telemetry_registry->register_sampler(config_.telemetry_identifier,
                                                     [this] { return telemetry_.snapshot(); });
        registered_ = true;
    }
}

DdlResolver::~DdlResolver()
{
    if (registered_) {
        config_.telemetry_registry->unregister_sampler(config_.telemetry_identifier);
    }
}

ResolveResult DdlResolver::resolve_detailed(std::string_view sql)
{
    telemetry_.record_attempt();
    const auto start = std::chrono::steady_clock::now();
    ResolveResult result{};

    auto finish = [&]() -> ResolveResult {
        const auto duration = to_uint64(std::chrono::steady_clock::now() - start);
        telemetry_.record_result(result.outcome,
                                 duration,
                                 result.statement_count,
                                 result.ordered_tables.size(),
                                 result.dropped_fragments.size());
        return std::move(result);
    };

    if (!parser::contains_ci(sql, "CREATE TABLE")) {
        result.outcome = ResolveOutcome::PassThrough;
        result.text = std::string{sql};
        return finish();
    }

    auto batch = parser::parse_ddl_batch(sql);
    result.statement_count = batch.fragments.size();
    result.diagnostics = std::move(batch.diagnostics);

    if (batch.tables.empty()) {
        ParserDiagnostic diagnostic{};
        diagnostic.severity = ParserSeverity::Warning;
        diagnostic.message = "No CREATE TABLE statement could be recognized in the batch";
        diagnostic.remediation_hints = {"Write each table as CREATE TABLE <name> ( ... ); terminated by a semicolon."};
        result.diagnostics.push_back(std::move(diagnostic));
        result.error = make_error_code(DdlErrc::NoRecognizedTables);
    }

    const auto graph = build_dependency_graph(batch.tables, config_.ignore_self_references);
    append_graph_diagnostics(graph, batch.tables, config_.ignore_self_references, result.diagnostics);
    const auto order = graph.topological_order();

    if (!order.complete()) {
        result.outcome = ResolveOutcome::CycleDetected;
        result.error = order.error;
        result.unresolved_tables = graph.names(order.unresolved);
        for (const auto& cycle : order.cycles) {
            auto names = graph.names(cycle);
            ParserDiagnostic diagnostic{};
            diagnostic.severity = ParserSeverity::Warning;
            diagnostic.message = "Circular foreign key dependency: " + format_cycle_path(names);
            diagnostic.remediation_hints = {"Create one of the tables without its FOREIGN KEY and add it later with ALTER TABLE."};
            result.diagnostics.push_back(std::move(diagnostic));
            result.cycles.push_back(std::move(names));
        }
        result.text = format_cycle_warning(result.unresolved_tables);
        result.text.append(sql);
        return finish();
    }

    result.outcome = ResolveOutcome::Ordered;
    result.ordered_tables = graph.names(order.order);

    std::vector<std::string> parts;
    parts.reserve(order.order.size() + batch.unrecognized.size() + 1U);
    parts.emplace_back(kOrderedBanner);
    for (const auto index : order.order) {
        parts.push_back(batch.tables[index].text);
    }
    for (const auto& fragment : batch.unrecognized) {
        if (config_.unrecognized_policy == UnrecognizedStatementPolicy::AppendAfterOrdered) {
            parts.push_back(fragment.text + ";");
        } else {
            result.dropped_fragments.push_back(fragment.text);
        }
    }
    result.text = join(parts, "\n\n");
    return finish();
}

std::string DdlResolver::resolve(std::string_view sql)
{
    return resolve_detailed(sql).text;
}

std::string resolve_ddl_order(std::string_view sql)
{
    DdlResolver resolver{};
    return resolver.resolve(sql);
}

std::string_view outcome_to_string(ResolveOutcome outcome) noexcept
{
    switch (outcome) {
    case ResolveOutcome::PassThrough:
        return "pass_through";
    case ResolveOutcome::Ordered:
        return "ordered";
    case ResolveOutcome::CycleDetected:
    default:
        return "cycle_detected";
    }
}

}  // namespace ddlsort::ddl
