#pragma once

#include "ddlsort/advisor/workload.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace ddlsort::advisor {

inline constexpr double kBaseFactorMs = 100.0;
inline constexpr double kRowsPerScaleUnit = 100000.0;

// Static multipliers per workload: single-row transaction, simple query, complex analysis.
struct WorkloadProfile final {
    WorkloadType type = WorkloadType::Oltp;
    double transaction = 0.0;
    double simple_query = 0.0;
    double complex_analysis = 0.0;
};

[[nodiscard]] const std::array<WorkloadProfile, kWorkloadCount>& workload_profiles() noexcept;

struct WorkloadTiming final {
    WorkloadType type = WorkloadType::Oltp;
    double transaction_ms = 0.0;
    double simple_query_ms = 0.0;
    double complex_analysis_ms = 0.0;
};

struct PerformanceEstimate final {
    std::string proposed_label{};
    std::optional<WorkloadType> proposed{};
    std::int64_t row_count = 0;
    double scale_factor = 1.0;
    std::vector<WorkloadTiming> timings{};
    WorkloadType best_transaction = WorkloadType::Oltp;
    WorkloadType best_analysis = WorkloadType::Oltp;
    std::error_code error{};

    [[nodiscard]] bool success() const noexcept { return !error; }
    [[nodiscard]] const WorkloadTiming* timing_for(WorkloadType type) const noexcept;
};

// Rule-based simulation; the DDL text does not influence the numbers.
PerformanceEstimate estimate_performance(std::string_view ddl, std::int64_t row_count, std::string_view usage_type);

std::string format_performance_report(const PerformanceEstimate& estimate);

}  // namespace ddlsort::advisor
