#include "ddlsort/ddl/ddl_resolver.hpp"

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace
{

using Clock = std::chrono::steady_clock;

struct Scenario final {
    std::string name;
    std::string script;
};

std::string table_name(std::size_t index)
{
    return "t" + std::to_string(index);
}

// t0 <- t1 <- ... <- tN, written dependents first so every table has to move.
// With `closed` set, t0 references the last table and the chain becomes a ring.
std::string chain_script(std::size_t tables, bool closed = false)
{
    std::string script;
    for (std::size_t index = tables; index-- > 0U;) {
        script.append("CREATE TABLE ");
        script.append(table_name(index));
        script.append(" (id BIGINT PRIMARY KEY");
        if (index > 0U || closed) {
            script.append(", parent_id BIGINT REFERENCES ");
            script.append(table_name(index > 0U ? index - 1U : tables - 1U));
            script.append("(id)");
        }
        script.append(");\n");
    }
    return script;
}

// One fact table referencing every dimension, declared before them.
std::string fan_in_script(std::size_t dimensions)
{
    std::string script = "CREATE TABLE fact (\n    id BIGINT PRIMARY KEY";
    for (std::size_t index = 0U; index < dimensions; ++index) {
        script.append(",\n    ");
        script.append(table_name(index));
        script.append("_id BIGINT,\n    FOREIGN KEY (");
        script.append(table_name(index));
        script.append("_id) REFERENCES ");
        script.append(table_name(index));
        script.append("(id)");
    }
    script.append("\n);\n");
    for (std::size_t index = 0U; index < dimensions; ++index) {
        script.append("CREATE TABLE ");
        script.append(table_name(index));
        script.append(" (id BIGINT PRIMARY KEY, label VARCHAR(64));\n");
    }
    return script;
}

std::vector<Scenario> make_scenarios()
{
    return {
        Scenario{"chain-64", chain_script(64U)},
        Scenario{"fan-in-128", fan_in_script(128U)},
        Scenario{"cycle-64", chain_script(64U, true)},
        Scenario{"pass-through", "INSERT INTO t0 VALUES (1);\nUPDATE t0 SET id = 2 WHERE id = 1;\n"},
    };
}

std::size_t parse_iterations_from_args(int argc, char** argv, std::size_t default_iterations)
{
    for (int index = 1; index < argc; ++index) {
        std::string_view arg{argv[index]};
        if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: ddlsort_benchmarks [--iterations N]\n";
            std::exit(EXIT_SUCCESS);
        }
        if ((arg == "--iterations" || arg == "-n") && index + 1 < argc) {
            const auto value = std::strtoull(argv[index + 1], nullptr, 10);
            if (value > 0U) {
                return static_cast<std::size_t>(value);
            }
        }
    }

    return default_iterations;
}

struct BenchmarkSummary final {
    std::size_t iterations = 0U;
    std::size_t tables = 0U;
    std::size_t diagnostics = 0U;
    std::size_t cycles = 0U;
    Clock::duration elapsed{};
};

BenchmarkSummary run_scenario(const Scenario& scenario, std::size_t iterations)
{
    ddlsort::ddl::DdlResolver resolver;
    BenchmarkSummary summary{};
    summary.iterations = iterations;

    const auto start = Clock::now();
    for (std::size_t iteration = 0; iteration < iterations; ++iteration) {
        auto result = resolver.resolve_detailed(scenario.script);
        summary.tables += result.ordered_tables.size();
        summary.diagnostics += result.diagnostics.size();
        if (result.outcome == ddlsort::ddl::ResolveOutcome::CycleDetected) {
            ++summary.cycles;
        }
    }
    const auto stop = Clock::now();
    summary.elapsed = stop - start;

    return summary;
}

void report_summary(const Scenario& scenario, const BenchmarkSummary& summary)
{
    const auto seconds = std::chrono::duration<double>(summary.elapsed).count();
    const auto batches_per_second = seconds > 0.0 ? static_cast<double>(summary.iterations) / seconds : 0.0;
    const auto tables_per_second = seconds > 0.0 ? static_cast<double>(summary.tables) / seconds : 0.0;

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Scenario: " << scenario.name << "\n";
    std::cout << "  Batches: " << summary.iterations << "\n";
    std::cout << "  Input bytes: " << scenario.script.size() << "\n";
    std::cout << "  Ordered tables/batch: "
              << (summary.iterations > 0U ? static_cast<double>(summary.tables) / summary.iterations : 0.0) << "\n";
    std::cout << "  Diagnostics/batch: "
              << (summary.iterations > 0U ? static_cast<double>(summary.diagnostics) / summary.iterations : 0.0)
              << "\n";
    std::cout << "  Elapsed: " << seconds << " s\n";
    std::cout << "  Batches/s: " << batches_per_second << "\n";
    std::cout << "  Tables/s: " << tables_per_second << "\n";
    if (summary.cycles > 0U) {
        std::cout << "  Cycle reports: " << summary.cycles << "\n";
    }
    std::cout << std::defaultfloat;
}

}  // namespace

int main(int argc, char** argv)
{
    constexpr std::size_t default_iterations = 1000U;
    const auto iterations = parse_iterations_from_args(argc, argv, default_iterations);

    for (const auto& scenario : make_scenarios()) {
        auto summary = run_scenario(scenario, iterations);
        report_summary(scenario, summary);
    }

    return 0;
}
