#include "ddlsort/advisor/ddl_annotator.hpp"

#include "ddlsort/parser/grammar.hpp"

namespace ddlsort::advisor {

std::string_view optimization_note(std::optional<WorkloadType> type) noexcept
{
    if (!type) {
        return "General optimization applied. No specific processing type detected.";
    }

    switch (*type) {
    case WorkloadType::Oltp:
        return "Optimized for high-volume write speed and data integrity (suggesting indexes on FK/PK and proper "
               "normalization).";
    case WorkloadType::Olap:
        return "Optimized for read speed and aggregation (suggesting Columnar Indexes, partitioning by time, or "
               "denormalization).";
    case WorkloadType::Htap:
        return "Optimized for low latency on real-time data analytics (suggesting In-Memory tables or hybrid "
               "indexing).";
    case WorkloadType::Ollp:
        return "Optimized for sub-millisecond decisions (ensuring minimal structure, focusing on data locality and low "
               "network overhead).";
    case WorkloadType::Batch:
        return "Optimized for high-throughput scheduled processing (suggesting large block sizes, table partitioning "
               "for parallel loading, and minimal indexing during load).";
    case WorkloadType::Stream:
    default:
        return "Optimized for continuous ingestion and real-time event detection (suggesting Time-Series "
               "partitioning, Kafka integration points, and high-speed primary key lookups).";
    }
}

std::string annotate_ddl(std::string_view ddl, std::string_view usage_type)
{
    const auto label = parser::uppercase_copy(parser::trim_copy(usage_type));

    std::string annotated{ddl};
    annotated.append("\n-- OPTIMIZATION FOR ");
    annotated.append(label);
    annotated.append(":\n-- ");
    annotated.append(optimization_note(parse_workload(label)));
    annotated.push_back('\n');
    return annotated;
}

}  // namespace ddlsort::advisor
