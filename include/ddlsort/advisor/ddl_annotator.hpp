#pragma once

#include "ddlsort/advisor/workload.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace ddlsort::advisor {

[[nodiscard]] std::string_view optimization_note(std::optional<WorkloadType> type) noexcept;

// Appends "\n-- OPTIMIZATION FOR <USAGE>:\n-- <note>\n" to the DDL. Unknown usage
// labels keep their (uppercased) text in the heading and get the general note.
std::string annotate_ddl(std::string_view ddl, std::string_view usage_type);

}  // namespace ddlsort::advisor
