#include "ddlsort/advisor/workload.hpp"

#include "ddlsort/parser/grammar.hpp"

namespace ddlsort::advisor {

namespace {

constexpr std::array<WorkloadType, kWorkloadCount> kWorkloads{
    WorkloadType::Oltp,
    WorkloadType::Olap,
    WorkloadType::Htap,
    WorkloadType::Stream,
    WorkloadType::Ollp,
    WorkloadType::Batch};

}  // namespace

std::optional<WorkloadType> parse_workload(std::string_view text)
{
    const auto trimmed = parser::trim_copy(text);
    for (const auto type : kWorkloads) {
        if (parser::iequals(trimmed, workload_name(type))) {
            return type;
        }
    }
    return std::nullopt;
}

std::string_view workload_name(WorkloadType type) noexcept
{
    switch (type) {
    case WorkloadType::Oltp:
        return "OLTP";
    case WorkloadType::Olap:
        return "OLAP";
    case WorkloadType::Htap:
        return "HTAP";
    case WorkloadType::Stream:
        return "STREAM";
    case WorkloadType::Ollp:
        return "OLLP";
    case WorkloadType::Batch:
    default:
        return "BATCH";
    }
}

const std::array<WorkloadType, kWorkloadCount>& all_workloads() noexcept
{
    return kWorkloads;
}

}  // namespace ddlsort::advisor
