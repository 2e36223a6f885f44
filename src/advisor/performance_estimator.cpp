#include "ddlsort/advisor/performance_estimator.hpp"

#include "ddlsort/ddl/ddl_errors.hpp"
#include "ddlsort/parser/grammar.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace ddlsort::advisor {

namespace {

constexpr std::array<WorkloadProfile, kWorkloadCount> kProfiles{
    WorkloadProfile{WorkloadType::Oltp, 0.1, 100.0, 500.0},
    WorkloadProfile{WorkloadType::Olap, 10.0, 5.0, 20.0},
    WorkloadProfile{WorkloadType::Htap, 0.5, 8.0, 40.0},
    WorkloadProfile{WorkloadType::Stream, 0.01, 200.0, 1000.0},
    WorkloadProfile{WorkloadType::Ollp, 0.001, 500.0, 2000.0},
    WorkloadProfile{WorkloadType::Batch, 50.0, 1.0, 5.0}};

std::string format_ms(double value)
{
    std::ostringstream stream;
    stream << std::fixed << std::setprecision(3) << value << " ms";
    return stream.str();
}

std::string format_minutes(double value_ms)
{
    std::ostringstream stream;
    stream << std::fixed << std::setprecision(2) << value_ms / 1000.0 / 60.0 << " min";
    return stream.str();
}

}  // namespace

const std::array<WorkloadProfile, kWorkloadCount>& workload_profiles() noexcept
{
    return kProfiles;
}

const WorkloadTiming* PerformanceEstimate::timing_for(WorkloadType type) const noexcept
{
    for (const auto& timing : timings) {
        if (timing.type == type) {
            return &timing;
        }
    }
    return nullptr;
}

PerformanceEstimate estimate_performance(std::string_view, std::int64_t row_count, std::string_view usage_type)
{
    PerformanceEstimate estimate{};
    estimate.proposed_label = parser::uppercase_copy(parser::trim_copy(usage_type));
    estimate.row_count = row_count;

    estimate.proposed = parse_workload(estimate.proposed_label);
    if (!estimate.proposed) {
        estimate.error = ddl::make_error_code(ddl::DdlErrc::UnknownWorkload);
        return estimate;
    }
    if (row_count < 0) {
        estimate.error = ddl::make_error_code(ddl::DdlErrc::InvalidRowCount);
        return estimate;
    }

    estimate.scale_factor = std::max(1.0, static_cast<double>(row_count) / kRowsPerScaleUnit);
    const double unit_ms = kBaseFactorMs * estimate.scale_factor;

    double best_transaction_ms = 0.0;
    double best_analysis_ms = 0.0;
    estimate.timings.reserve(kProfiles.size());
    for (const auto& profile : kProfiles) {
        WorkloadTiming timing{};
        timing.type = profile.type;
        timing.transaction_ms = unit_ms * profile.transaction;
        timing.simple_query_ms = unit_ms * profile.simple_query;
        timing.complex_analysis_ms = unit_ms * profile.complex_analysis;

        // Strict comparison: the earlier profile wins a tie.
        if (estimate.timings.empty() || timing.transaction_ms < best_transaction_ms) {
            best_transaction_ms = timing.transaction_ms;
            estimate.best_transaction = timing.type;
        }
        if (estimate.timings.empty() || timing.complex_analysis_ms < best_analysis_ms) {
            best_analysis_ms = timing.complex_analysis_ms;
            estimate.best_analysis = timing.type;
        }
        estimate.timings.push_back(timing);
    }

    return estimate;
}

std::string format_performance_report(const PerformanceEstimate& estimate)
{
    if (estimate.error == ddl::DdlErrc::InvalidRowCount) {
        return "ERROR: Row count must not be negative for performance estimation.";
    }
    if (!estimate.success() || !estimate.proposed) {
        return "ERROR: Proposed usage type is invalid for performance estimation.";
    }

    const auto proposed_name = workload_name(*estimate.proposed);

    std::ostringstream report;
    report << "## Performance Simulation Report (" << estimate.row_count << " Rows)\n";
    report << "The time estimates below are simulated (rule-based) for relative comparison:\n";
    report << '\n';
    report << "### Comparison Table for All Processing Types:\n";
    report << "| Processing Type | Simple Transaction (Latency) | Complex Analysis (Throughput) |\n";
    report << "| :--- | :--- | :--- |\n";
    for (const auto& timing : estimate.timings) {
        const auto name = workload_name(timing.type);
        report << "| ";
        if (timing.type == *estimate.proposed) {
            report << "**" << name << "**";
        } else {
            report << name;
        }
        report << " | " << format_ms(timing.transaction_ms) << " | " << format_minutes(timing.complex_analysis_ms)
               << " |\n";
    }
    report << '\n';

    const auto* proposed = estimate.timing_for(*estimate.proposed);
    report << "### Estimation Details for Proposed Type (" << proposed_name << "):\n";
    report << "- **Simple Transaction (1 row):** " << format_ms(proposed != nullptr ? proposed->transaction_ms : 0.0)
           << '\n';
    report << "- **Complex Analysis (" << estimate.row_count << " rows):** "
           << format_minutes(proposed != nullptr ? proposed->complex_analysis_ms : 0.0) << '\n';
    report << '\n';

    report << "## Performance Conclusion\n";
    report << "From this simulation, the best type for **Transaction Speed** is: **"
           << workload_name(estimate.best_transaction) << "**.\n";
    report << "The best type for **High Volume Analysis** is: **" << workload_name(estimate.best_analysis) << "**.";
    return report.str();
}

}  // namespace ddlsort::advisor
