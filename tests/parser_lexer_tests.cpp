#include "ddlsort/parser/grammar.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace ddlsort::parser;

namespace {

std::vector<std::string> token_texts(const LexResult& result)
{
    std::vector<std::string> texts;
    texts.reserve(result.tokens.size());
    for (const auto& token : result.tokens) {
        texts.push_back(token.text);
    }
    return texts;
}

}  // namespace

TEST_CASE("tokenize splits words, quoted identifiers and symbols")
{
    const auto result = tokenize("CREATE TABLE \"Order\" (id INT);");
    CHECK(result.diagnostics.empty());
    REQUIRE(result.tokens.size() == 8U);

    CHECK(result.tokens[0].kind == TokenKind::Word);
    CHECK(result.tokens[0].text == "CREATE");
    CHECK(result.tokens[2].kind == TokenKind::QuotedIdentifier);
    CHECK(result.tokens[2].text == "Order");
    CHECK(result.tokens[2].offset == 13U);
    CHECK(result.tokens[3].kind == TokenKind::Symbol);
    CHECK(result.tokens[3].text == "(");
    CHECK(result.tokens[7].text == ";");
}

TEST_CASE("tokenize skips whitespace and comments")
{
    const auto result = tokenize("-- leading note\nCREATE /* inline */ TABLE\n\tt");
    CHECK(token_texts(result) == std::vector<std::string>{"CREATE", "TABLE", "t"});
}

TEST_CASE("tokenize unescapes doubled delimiters")
{
    const auto result = tokenize("'it''s' `a``b` \"x\"\"y\"");
    REQUIRE(result.tokens.size() == 3U);
    CHECK(result.tokens[0].kind == TokenKind::StringLiteral);
    CHECK(result.tokens[0].text == "it's");
    CHECK(result.tokens[1].kind == TokenKind::QuotedIdentifier);
    CHECK(result.tokens[1].text == "a`b");
    CHECK(result.tokens[2].text == "x\"y");
}

TEST_CASE("tokenize degrades unterminated quotes and comments to symbols")
{
    const auto quote = tokenize("'abc");
    CHECK(quote.diagnostics.empty());
    REQUIRE(quote.tokens.size() == 2U);
    CHECK(quote.tokens[0].kind == TokenKind::Symbol);
    CHECK(quote.tokens[0].text == "'");
    CHECK(quote.tokens[1].text == "abc");

    const auto comment = tokenize("/* open");
    CHECK(token_texts(comment) == std::vector<std::string>{"/", "*", "open"});
}

TEST_CASE("tokenize keeps non-ASCII bytes inside words")
{
    const auto result = tokenize("CREATE TABLE caf\xC3\xA9 (id INT)");
    REQUIRE(result.tokens.size() >= 3U);
    CHECK(result.tokens[2].kind == TokenKind::Word);
    CHECK(result.tokens[2].text == "caf\xC3\xA9");
}

TEST_CASE("keyword and identifier helpers")
{
    const Token word{TokenKind::Word, "references", 0U};
    const Token quoted{TokenKind::QuotedIdentifier, "two words", 0U};
    const Token paren{TokenKind::Symbol, "(", 0U};

    CHECK(is_keyword(word, "REFERENCES"));
    CHECK_FALSE(is_keyword(quoted, "two words"));
    CHECK(is_symbol(paren, '('));
    CHECK_FALSE(is_symbol(word, '('));
    CHECK(is_single_word_identifier(word));
    CHECK_FALSE(is_single_word_identifier(quoted));

    CHECK(trim_copy("  \n x y \t") == "x y");
    CHECK(iequals("Create", "CREATE"));
    CHECK_FALSE(iequals("Create", "CREATED"));
    CHECK(uppercase_copy("abc_1") == "ABC_1");
    CHECK(contains_ci("select 1; create table t (x int)", "CREATE TABLE"));
    CHECK_FALSE(contains_ci("CREATE  TABLE t", "CREATE TABLE"));
}
