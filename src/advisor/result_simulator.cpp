#include "ddlsort/advisor/result_simulator.hpp"

#include "ddlsort/parser/grammar.hpp"

#include <cctype>

namespace ddlsort::advisor {

namespace {

bool is_word_char(char ch) noexcept
{
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

std::string_view select_list(std::string_view upper_query)
{
    auto list = upper_query;
    if (const auto from = list.find("FROM"); from != std::string_view::npos) {
        list = list.substr(0, from);
    }
    if (const auto select = list.find("SELECT"); select != std::string_view::npos) {
        list = list.substr(select + 6U);
    }
    return list;
}

std::vector<std::string_view> split_top_level(std::string_view list)
{
    std::vector<std::string_view> items;
    std::size_t depth = 0U;
    std::size_t start = 0U;
    for (std::size_t index = 0U; index < list.size(); ++index) {
        const char ch = list[index];
        if (ch == '(') {
            ++depth;
        } else if (ch == ')' && depth > 0U) {
            --depth;
        } else if (ch == ',' && depth == 0U) {
            items.push_back(list.substr(start, index - start));
            start = index + 1U;
        }
    }
    items.push_back(list.substr(start));
    return items;
}

std::vector<std::string> words_of(std::string_view item)
{
    std::vector<std::string> words;
    std::string current;
    for (const char ch : item) {
        if (is_word_char(ch) || ch == '.') {
            current.push_back(ch);
            continue;
        }
        if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
        if (ch == '(') {
            // Function call: keep only the name, drop the argument list.
            break;
        }
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

std::string column_name(std::string_view item)
{
    if (const auto as = item.rfind(" AS "); as != std::string_view::npos) {
        const auto alias = parser::trim_copy(item.substr(as + 4U));
        std::string name;
        for (const char ch : alias) {
            if (!is_word_char(ch)) {
                break;
            }
            name.push_back(ch);
        }
        if (!name.empty()) {
            return name;
        }
    }

    const auto words = words_of(item);
    if (words.empty()) {
        return {};
    }
    const auto& head = words.front();
    const auto dot = head.rfind('.');
    return dot == std::string::npos ? head : head.substr(dot + 1U);
}

}  // namespace

std::vector<std::string> guess_select_columns(std::string_view query)
{
    const auto upper = parser::uppercase_copy(query);
    std::vector<std::string> columns;
    for (const auto item : split_top_level(select_list(upper))) {
        auto name = column_name(item);
        if (!name.empty()) {
            columns.push_back(std::move(name));
        }
    }

    if (columns.empty()) {
        columns = {"col_1", "col_2", "col_3"};
    }
    return columns;
}

SimulatedResult simulate_select_result(std::string_view query)
{
    SimulatedResult result{};
    result.columns = guess_select_columns(query);

    const bool member = parser::contains_ci(query, "MEMBER");
    if (member && (parser::contains_ci(query, "KPI") || parser::contains_ci(query, "VALUE"))) {
        result.rows = {{"Budi", "Santoso", "Sales Revenue", "95000.00", "2023-10-26"},
                       {"Siti", "Aminah", "Sales Revenue", "88000.00", "2023-10-26"}};
    } else if (member && parser::contains_ci(query, "TEAM")) {
        result.rows = {{"101", "Budi Santoso", "Sales Team A"}, {"102", "Siti Aminah", "Sales Team A"}};
    } else {
        result.rows = {{"Sample_Value_A", "123"}, {"Sample_Value_B", "456"}};
    }

    const auto width = result.rows.front().size();
    if (result.columns.size() != width) {
        result.columns.clear();
        for (std::size_t index = 0U; index < width; ++index) {
            result.columns.push_back("Column_" + std::to_string(index + 1U));
        }
    }
    return result;
}

std::string render_markdown_table(const SimulatedResult& result)
{
    auto render_row = [](const std::vector<std::string>& cells) {
        std::string line = "|";
        for (const auto& cell : cells) {
            line.append(" ");
            line.append(cell);
            line.append(" |");
        }
        return line;
    };

    std::string table = render_row(result.columns);
    table.append("\n|");
    for (std::size_t index = 0U; index < result.columns.size(); ++index) {
        table.append(" --- |");
    }
    for (const auto& row : result.rows) {
        table.push_back('\n');
        table.append(render_row(row));
    }
    return table;
}

std::string simulate_select_output(std::string_view query, std::string_view description)
{
    std::string output = "### Simulated Query Output: (";
    output.append(description);
    output.append(")\n\n**Query:**\n```sql\n");
    output.append(parser::trim_copy(query));
    output.append("\n```\n\n");
    output.append(render_markdown_table(simulate_select_result(query)));
    return output;
}

}  // namespace ddlsort::advisor
