#pragma once

#include "ddlsort/shell/shell_engine.hpp"

#include <string>

namespace ddlsort::tools {

// One JSON object per command, suitable for JSON Lines output.
[[nodiscard]] std::string format_command_log_json(const ddlsort::shell::CommandMetrics& metrics);

}  // namespace ddlsort::tools
