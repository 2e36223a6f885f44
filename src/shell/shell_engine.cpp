#include "ddlsort/shell/shell_engine.hpp"

#include "ddlsort/advisor/ddl_annotator.hpp"
#include "ddlsort/advisor/performance_estimator.hpp"
#include "ddlsort/advisor/result_simulator.hpp"
#include "ddlsort/advisor/schema_validator.hpp"
#include "ddlsort/shell/markdown_blocks.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

using ddlsort::parser::ParserDiagnostic;
using ddlsort::parser::ParserSeverity;

namespace ddlsort::shell {

namespace {

[[nodiscard]] std::vector<std::string> split_tokens(std::string_view text)
{
    std::vector<std::string> tokens;
    std::size_t index = 0U;
    while (index < text.size()) {
        while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) != 0) {
            ++index;
        }
        if (index >= text.size()) {
            break;
        }
        const std::size_t begin = index;
        while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) == 0) {
            ++index;
        }
        tokens.emplace_back(text.substr(begin, index - begin));
    }
    return tokens;
}

// Everything after the meta command word, trimmed.
[[nodiscard]] std::string command_argument(std::string_view command)
{
    std::size_t index = 0U;
    while (index < command.size() && std::isspace(static_cast<unsigned char>(command[index])) == 0) {
        ++index;
    }
    return parser::trim_copy(command.substr(index));
}

[[nodiscard]] std::string join(const std::vector<std::string>& values, std::string_view separator)
{
    if (values.empty()) {
        return "-";
    }
    std::string joined;
    for (std::size_t index = 0U; index < values.size(); ++index) {
        if (index > 0U) {
            joined.append(separator);
        }
        joined.append(values[index]);
    }
    return joined;
}

[[nodiscard]] std::vector<std::string> format_table(const std::vector<std::string>& headers,
                                                    const std::vector<std::vector<std::string>>& rows)
{
    const std::size_t column_count = headers.size();
    std::vector<std::size_t> widths(column_count, 0U);
    for (std::size_t i = 0U; i < column_count; ++i) {
        widths[i] = headers[i].size();
    }
    for (const auto& row : rows) {
        for (std::size_t i = 0U; i < column_count && i < row.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    auto make_line = [&](const std::vector<std::string>& fields) {
        std::string line;
        for (std::size_t i = 0U; i < column_count; ++i) {
            if (i > 0U) {
                line.append(" | ");
            }
            const std::string& field = (i < fields.size()) ? fields[i] : std::string{};
            line.append(field);
            if (i + 1U < column_count && field.size() < widths[i]) {
                line.append(widths[i] - field.size(), ' ');
            }
        }
        return line;
    };

    std::vector<std::string> lines;
    lines.reserve(rows.size() + 3U);
    lines.push_back(make_line(headers));

    std::string separator;
    for (std::size_t i = 0U; i < column_count; ++i) {
        if (i > 0U) {
            separator.append("-+-");
        }
        separator.append(widths[i], '-');
    }
    lines.push_back(std::move(separator));

    if (rows.empty()) {
        lines.push_back("(no rows)");
        return lines;
    }

    for (const auto& row : rows) {
        lines.push_back(make_line(row));
    }

    return lines;
}

[[nodiscard]] ParserDiagnostic make_error(const std::string& statement, std::string message, std::string hint)
{
    ParserDiagnostic diagnostic{};
    diagnostic.severity = ParserSeverity::Error;
    diagnostic.statement = statement;
    diagnostic.message = std::move(message);
    diagnostic.remediation_hints = {std::move(hint)};
    return diagnostic;
}

[[nodiscard]] std::string plural(std::size_t count, std::string_view noun)
{
    std::ostringstream stream;
    stream << count << ' ' << noun << (count == 1U ? "" : "s");
    return stream.str();
}

const std::vector<std::string>& help_lines()
{
    static const std::vector<std::string> lines{
        "<CREATE TABLE ...; ...>     reorder the batch by FOREIGN KEY dependency",
        "\\annotate [WORKLOAD]        append optimization notes to the last batch",
        "\\estimate WORKLOAD ROWS     simulated performance comparison across workloads",
        "\\validate [JSON]            validate the last batch against sample data",
        "\\simulate <SELECT ...>      render a simulated result table for a query",
        "\\graph                      show the dependency graph of the last batch",
        "\\stats                      show resolver counters",
        "\\help                       show this list",
        "Workloads: OLTP, OLAP, HTAP, STREAM, OLLP, BATCH"};
    return lines;
}

}  // namespace

ShellEngine::ShellEngine()
    : ShellEngine(Config{})
{}

ShellEngine::ShellEngine(Config config)
    : config_{std::move(config)}
    , resolver_{config_.resolver}
{}

CommandMetrics ShellEngine::execute(const std::string& input)
{
    const auto started_at = std::chrono::system_clock::now();
    const auto start = std::chrono::steady_clock::now();

    const auto trimmed = trim(input);
    const auto kind = classify(trimmed);
    // SQL goes to the resolver untouched so pass-through output matches the input byte for byte.
    auto metrics = dispatch(kind == CommandKind::Sql ? input : trimmed, kind);
    finish(metrics, command_kind_to_string(kind), trimmed, start, started_at);
    return metrics;
}

CommandMetrics ShellEngine::execute_markdown(const std::string& markdown)
{
    const auto started_at = std::chrono::system_clock::now();
    const auto start = std::chrono::steady_clock::now();

    auto rewrite = order_sql_code_blocks(markdown, resolver_);

    CommandMetrics metrics{};
    metrics.success = true;
    metrics.output = std::move(rewrite.text);
    for (auto& result : rewrite.results) {
        if (result.outcome == ddl::ResolveOutcome::CycleDetected) {
            metrics.success = false;
        }
        metrics.diagnostics.insert(metrics.diagnostics.end(), result.diagnostics.begin(), result.diagnostics.end());
    }
    metrics.summary = "Processed " + plural(rewrite.sql_blocks, "sql block") + " (" +
                      std::to_string(rewrite.blocks_reordered) + " reordered)";

    finish(metrics, "markdown", markdown, start, started_at);
    return metrics;
}

std::string ShellEngine::trim(std::string_view text)
{
    return parser::trim_copy(text);
}

ShellEngine::CommandKind ShellEngine::classify(std::string_view text)
{
    if (text.empty()) {
        return CommandKind::Empty;
    }
    if (text.front() == '\\') {
        return CommandKind::Meta;
    }
    return CommandKind::Sql;
}

std::string_view ShellEngine::command_kind_to_string(CommandKind kind) noexcept
{
    switch (kind) {
    case CommandKind::Empty:
        return "empty";
    case CommandKind::Sql:
        return "sql";
    case CommandKind::Meta:
    default:
        return "meta";
    }
}

CommandMetrics ShellEngine::dispatch(const std::string& input, CommandKind kind)
{
    switch (kind) {
    case CommandKind::Empty: {
        CommandMetrics metrics{};
        metrics.success = true;
        metrics.summary = "Empty command.";
        return metrics;
    }
    case CommandKind::Meta:
        return execute_meta(input);
    case CommandKind::Sql:
    default:
        return execute_sql(input);
    }
}

CommandMetrics ShellEngine::execute_sql(const std::string& sql)
{
    auto result = resolver_.resolve_detailed(sql);

    CommandMetrics metrics{};
    metrics.outcome = result.outcome;
    metrics.diagnostics = std::move(result.diagnostics);

    std::ostringstream summary;
    switch (result.outcome) {
    case ddl::ResolveOutcome::PassThrough:
        metrics.success = true;
        summary << "No CREATE TABLE found; input passed through unchanged.";
        break;
    case ddl::ResolveOutcome::Ordered:
        metrics.success = true;
        summary << "Ordered " << plural(result.ordered_tables.size(), "table");
        if (!result.dropped_fragments.empty()) {
            summary << "; left out " << plural(result.dropped_fragments.size(), "unrecognized statement");
        }
        for (std::size_t index = 0U; index < result.ordered_tables.size(); ++index) {
            metrics.detail_lines.push_back(std::to_string(index + 1U) + ". " + result.ordered_tables[index]);
        }
        break;
    case ddl::ResolveOutcome::CycleDetected:
    default:
        metrics.success = false;
        summary << "Circular dependency among " << plural(result.unresolved_tables.size(), "table") << ": "
                << join(result.unresolved_tables, ", ");
        for (const auto& cycle : result.cycles) {
            auto path = join(cycle, " -> ");
            path.append(" -> ");
            path.append(cycle.front());
            metrics.detail_lines.push_back("cycle: " + path);
        }
        break;
    }
    metrics.summary = summary.str();

    if (result.outcome != ddl::ResolveOutcome::PassThrough) {
        last_input_ = sql;
        last_ddl_ = result.outcome == ddl::ResolveOutcome::Ordered ? result.text : sql;
    }
    metrics.output = std::move(result.text);
    return metrics;
}

CommandMetrics ShellEngine::execute_meta(const std::string& command)
{
    const auto tokens = split_tokens(command);
    const auto argument = command_argument(command);
    const auto& name = tokens.front();

    if (name == "\\help" || name == "\\?") {
        CommandMetrics metrics{};
        metrics.success = true;
        metrics.summary = "Available commands";
        metrics.detail_lines = help_lines();
        return metrics;
    }
    if (name == "\\annotate") {
        return execute_annotate(command, argument);
    }
    if (name == "\\estimate") {
        return execute_estimate(command, tokens);
    }
    if (name == "\\validate") {
        return execute_validate(command, argument);
    }
    if (name == "\\simulate") {
        return execute_simulate(command, argument);
    }
    if (name == "\\graph") {
        return execute_graph(command);
    }
    if (name == "\\stats") {
        return execute_stats();
    }

    CommandMetrics metrics{};
    metrics.success = false;
    metrics.summary = "Unsupported meta command.";
    metrics.diagnostics.push_back(
        make_error(command, "Shell command is not recognised.", "Use \\help to list supported commands."));
    return metrics;
}

CommandMetrics ShellEngine::execute_annotate(const std::string& command, const std::string& argument)
{
    if (last_ddl_.empty()) {
        return missing_ddl(command);
    }

    const std::string usage = argument.empty() ? std::string{advisor::workload_name(config_.default_workload)}
                                               : argument;

    CommandMetrics metrics{};
    metrics.success = true;
    metrics.output = advisor::annotate_ddl(last_ddl_, usage);
    metrics.summary = "Annotated last batch for " + parser::uppercase_copy(usage);
    if (!advisor::parse_workload(usage)) {
        ParserDiagnostic diagnostic{};
        diagnostic.severity = ParserSeverity::Warning;
        diagnostic.statement = command;
        diagnostic.message = "Unknown workload '" + usage + "'; general note applied.";
        metrics.diagnostics.push_back(std::move(diagnostic));
    }
    return metrics;
}

CommandMetrics ShellEngine::execute_estimate(const std::string& command, const std::vector<std::string>& tokens)
{
    CommandMetrics metrics{};
    if (tokens.size() != 3U) {
        metrics.success = false;
        metrics.summary = "Usage: \\estimate WORKLOAD ROWS";
        metrics.diagnostics.push_back(
            make_error(command, "Expected a workload and a row count.", "Example: \\estimate OLAP 1000000"));
        return metrics;
    }

    std::int64_t rows = 0;
    const auto& text = tokens[2];
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), rows);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        metrics.success = false;
        metrics.summary = "Invalid row count '" + text + "'.";
        metrics.diagnostics.push_back(make_error(command,
                                                 ddl::make_error_code(ddl::DdlErrc::InvalidRowCount).message(),
                                                 "Pass the row count as a whole number."));
        return metrics;
    }

    const auto estimate = advisor::estimate_performance(last_ddl_, rows, tokens[1]);
    metrics.output = advisor::format_performance_report(estimate);
    metrics.success = estimate.success();
    if (!estimate.success()) {
        metrics.summary = "Performance estimation failed: " + estimate.error.message();
        metrics.diagnostics.push_back(
            make_error(command, estimate.error.message(), "Workloads: OLTP, OLAP, HTAP, STREAM, OLLP, BATCH."));
        return metrics;
    }

    metrics.summary = "Estimated " + std::string{advisor::workload_name(*estimate.proposed)} + " for " +
                      plural(static_cast<std::size_t>(rows), "row");
    return metrics;
}

CommandMetrics ShellEngine::execute_validate(const std::string& command, const std::string& argument)
{
    if (last_ddl_.empty()) {
        return missing_ddl(command);
    }

    const auto validation = advisor::validate_schema(last_ddl_, argument);
    CommandMetrics metrics{};
    metrics.success = validation.success;
    metrics.output = validation.text;
    metrics.summary = "Schema validated";
    return metrics;
}

CommandMetrics ShellEngine::execute_simulate(const std::string& command, const std::string& argument)
{
    CommandMetrics metrics{};
    if (argument.empty()) {
        metrics.success = false;
        metrics.summary = "Usage: \\simulate <SELECT ...>";
        metrics.diagnostics.push_back(
            make_error(command, "No query given.", "Example: \\simulate SELECT name FROM team_member"));
        return metrics;
    }

    const auto simulated = advisor::simulate_select_result(argument);
    metrics.success = true;
    metrics.output = advisor::simulate_select_output(argument, "Simulated result");
    metrics.summary = "Simulated " + plural(simulated.rows.size(), "row") + " across " +
                      plural(simulated.columns.size(), "column");
    return metrics;
}

CommandMetrics ShellEngine::execute_graph(const std::string& command)
{
    if (last_input_.empty()) {
        return missing_ddl(command);
    }

    const auto batch = parser::parse_ddl_batch(last_input_);
    const auto graph = ddl::build_dependency_graph(batch.tables, config_.resolver.ignore_self_references);

    std::vector<std::vector<std::string>> rows;
    rows.reserve(graph.table_count());
    for (ddl::TableIndex index = 0U; index < graph.table_count(); ++index) {
        rows.push_back({graph.name(index),
                        join(graph.names(graph.dependencies_of(index)), ", "),
                        join(graph.names(graph.dependents_of(index)), ", "),
                        join(graph.external_references_of(index), ", ")});
    }

    CommandMetrics metrics{};
    metrics.success = true;
    metrics.detail_lines = format_table({"table", "depends_on", "referenced_by", "external"}, rows);
    metrics.summary = "Listed " + plural(graph.table_count(), "table") + " (" + std::to_string(graph.edge_count()) +
                      (graph.edge_count() == 1U ? " dependency)" : " dependencies)");
    return metrics;
}

CommandMetrics ShellEngine::execute_stats()
{
    const auto snapshot = resolver_.telemetry().snapshot();
    const std::vector<std::vector<std::string>> rows{
        {"resolutions_attempted", std::to_string(snapshot.resolutions_attempted)},
        {"pass_through", std::to_string(snapshot.pass_through)},
        {"ordered", std::to_string(snapshot.ordered)},
        {"cycles_detected", std::to_string(snapshot.cycles_detected)},
        {"statements_seen", std::to_string(snapshot.statements_seen)},
        {"tables_ordered", std::to_string(snapshot.tables_ordered)},
        {"fragments_dropped", std::to_string(snapshot.fragments_dropped)},
        {"total_duration_ns", std::to_string(snapshot.total_duration_ns)},
        {"last_duration_ns", std::to_string(snapshot.last_duration_ns)}};

    CommandMetrics metrics{};
    metrics.success = true;
    metrics.detail_lines = format_table({"counter", "value"}, rows);
    metrics.summary = "Resolver counters";
    return metrics;
}

CommandMetrics ShellEngine::missing_ddl(const std::string& command) const
{
    CommandMetrics metrics{};
    metrics.success = false;
    metrics.summary = "No DDL batch has been entered yet.";
    metrics.diagnostics.push_back(
        make_error(command, "Command needs a previous CREATE TABLE batch.", "Enter a CREATE TABLE batch first."));
    return metrics;
}

void ShellEngine::finish(CommandMetrics& metrics, std::string_view category, const std::string& input,
                         std::chrono::steady_clock::time_point start,
                         std::chrono::system_clock::time_point started_at)
{
    const auto end = std::chrono::steady_clock::now();
    const auto duration_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
    metrics.duration_ms = static_cast<double>(duration_ns.count()) / 1'000'000.0;
    metrics.started_at = started_at;
    metrics.finished_at = std::chrono::system_clock::now();
    metrics.command_text = input;
    metrics.command_category = std::string{category};
    metrics.correlation_id = "cmd-" + std::to_string(correlation_counter_.fetch_add(1U, std::memory_order_relaxed));

    if (config_.command_logger) {
        config_.command_logger(metrics);
    }
}

}  // namespace ddlsort::shell
