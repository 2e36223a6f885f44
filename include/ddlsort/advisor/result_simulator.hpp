#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ddlsort::advisor {

struct SimulatedResult final {
    std::vector<std::string> columns{};
    std::vector<std::vector<std::string>> rows{};
};

// Output column names guessed from the SELECT list: the alias when one is given,
// otherwise the last dotted segment of the expression head. Names are uppercased.
std::vector<std::string> guess_select_columns(std::string_view query);

// Canned rows chosen by keywords in the query; headers fall back to Column_N when
// the guessed columns do not match the row width.
SimulatedResult simulate_select_result(std::string_view query);

std::string render_markdown_table(const SimulatedResult& result);

std::string simulate_select_output(std::string_view query, std::string_view description);

}  // namespace ddlsort::advisor
