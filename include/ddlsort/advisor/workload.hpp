#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ddlsort::advisor {

enum class WorkloadType : std::uint8_t {
    Oltp = 0,
    Olap,
    Htap,
    Stream,
    Ollp,
    Batch
};

inline constexpr std::size_t kWorkloadCount = 6U;

// Case-insensitive; surrounding whitespace is ignored.
std::optional<WorkloadType> parse_workload(std::string_view text);

[[nodiscard]] std::string_view workload_name(WorkloadType type) noexcept;

// Report order: OLTP, OLAP, HTAP, STREAM, OLLP, BATCH.
[[nodiscard]] const std::array<WorkloadType, kWorkloadCount>& all_workloads() noexcept;

}  // namespace ddlsort::advisor
