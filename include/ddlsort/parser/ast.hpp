#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ddlsort::parser {

struct Identifier final {
    std::string value{};
    bool quoted = false;
};

enum class TokenKind : std::uint8_t {
    Word = 0,
    QuotedIdentifier,
    StringLiteral,
    Symbol
};

struct Token final {
    TokenKind kind = TokenKind::Symbol;
    std::string text{};
    std::size_t offset = 0U;
};

struct StatementFragment final {
    std::string text{};
    std::size_t index = 0U;
    std::size_t offset = 0U;
};

struct ForeignKeyReference final {
    Identifier table{};
    std::vector<Identifier> referenced_columns{};
    std::vector<Identifier> local_columns{};
    bool inline_constraint = false;
};

struct CreateTableStatement final {
    Identifier name{};
    std::string text{};
    std::vector<ForeignKeyReference> references{};
    std::vector<std::string> dependencies{};
    std::size_t fragment_index = 0U;

    [[nodiscard]] bool references_itself() const noexcept
    {
        for (const auto& dependency : dependencies) {
            if (dependency == name.value) {
                return true;
            }
        }
        return false;
    }
};

}  // namespace ddlsort::parser
