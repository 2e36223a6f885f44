#pragma once

#include "ddlsort/parser/ast.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ddlsort::parser {

enum class ParserSeverity : std::uint8_t {
    Info = 0,
    Warning,
    Error
};

struct ParserDiagnostic final {
    ParserSeverity severity = ParserSeverity::Error;
    std::string message{};
    std::size_t line = 0U;
    std::size_t column = 0U;
    std::string statement{};
    std::vector<std::string> remediation_hints{};
};

template <typename T>
struct ParseResult final {
    std::optional<T> ast{};
    std::vector<ParserDiagnostic> diagnostics{};

    [[nodiscard]] bool success() const noexcept { return ast.has_value(); }
};

struct LexResult final {
    std::vector<Token> tokens{};
    std::vector<ParserDiagnostic> diagnostics{};
};

struct BatchParseResult final {
    std::vector<StatementFragment> fragments{};
    std::vector<CreateTableStatement> tables{};
    std::vector<StatementFragment> unrecognized{};
    std::vector<ParserDiagnostic> diagnostics{};
};

LexResult tokenize(std::string_view input);

std::vector<StatementFragment> split_statements(std::string_view batch);

ParseResult<CreateTableStatement> parse_create_table(const StatementFragment& fragment);
ParseResult<CreateTableStatement> parse_create_table(std::string_view input);

BatchParseResult parse_ddl_batch(std::string_view batch);

// Leading line written above ordered output; stripped again when that output is parsed.
inline constexpr std::string_view kOrderedBanner = "-- DDL commands sorted by FOREIGN KEY dependency:";

[[nodiscard]] bool is_keyword(const Token& token, std::string_view keyword) noexcept;
[[nodiscard]] bool is_symbol(const Token& token, char symbol) noexcept;
[[nodiscard]] bool is_single_word_identifier(const Token& token) noexcept;

std::string trim_copy(std::string_view text);
bool iequals(std::string_view lhs, std::string_view rhs) noexcept;
std::string uppercase_copy(std::string_view text);
bool contains_ci(std::string_view text, std::string_view needle);

}  // namespace ddlsort::parser
