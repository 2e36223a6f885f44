#include "ddlsort/parser/grammar.hpp"
#include "ddlsort/parser/lexical_primitives.hpp"

#include <tao/pegtl.hpp>

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <utility>

namespace ddlsort::parser {

namespace {

namespace pegtl = tao::pegtl;

constexpr std::string_view kWhitespace = " \t\r\n\v\f";

struct token_grammar
    : pegtl::seq<pegtl::star<pegtl::sor<lex::whitespace,
                                        lex::line_comment,
                                        lex::block_comment,
                                        lex::string_literal,
                                        lex::double_quoted_identifier,
                                        lex::backtick_identifier,
                                        lex::word,
                                        lex::symbol>>,
                 pegtl::eof> {
};

std::string unquote(std::string_view text)
{
    if (text.size() < 2U) {
        return std::string{text};
    }

    const char delimiter = text.front();
    const auto body = text.substr(1U, text.size() - 2U);
    std::string out;
    out.reserve(body.size());
    for (std::size_t index = 0U; index < body.size(); ++index) {
        out.push_back(body[index]);
        if (body[index] == delimiter && index + 1U < body.size() && body[index + 1U] == delimiter) {
            ++index;
        }
    }
    return out;
}

template <typename Input>
std::size_t byte_offset(const Input& in)
{
    return static_cast<std::size_t>(in.position().byte);
}

template <typename Rule>
struct token_action {
    template <typename Input>
    static void apply(const Input&, std::vector<Token>&)
    {
        // No-op by default
    }
};

template <>
struct token_action<lex::word> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        tokens.push_back(Token{TokenKind::Word, in.string(), byte_offset(in)});
    }
};

template <>
struct token_action<lex::double_quoted_identifier> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        tokens.push_back(Token{TokenKind::QuotedIdentifier, unquote(in.string()), byte_offset(in)});
    }
};

template <>
struct token_action<lex::backtick_identifier> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        tokens.push_back(Token{TokenKind::QuotedIdentifier, unquote(in.string()), byte_offset(in)});
    }
};

template <>
struct token_action<lex::string_literal> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        tokens.push_back(Token{TokenKind::StringLiteral, unquote(in.string()), byte_offset(in)});
    }
};

template <>
struct token_action<lex::symbol> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        tokens.push_back(Token{TokenKind::Symbol, in.string(), byte_offset(in)});
    }
};

void set_location(ParserDiagnostic& diagnostic, std::string_view source, std::size_t offset)
{
    offset = std::min(offset, source.size());
    diagnostic.line = 1U;
    diagnostic.column = 1U;
    for (std::size_t index = 0U; index < offset; ++index) {
        if (source[index] == '\n') {
            ++diagnostic.line;
            diagnostic.column = 1U;
        } else {
            ++diagnostic.column;
        }
    }
}

ParserDiagnostic make_parse_error(const pegtl::parse_error& error, std::string_view source)
{
    ParserDiagnostic diagnostic{};
    diagnostic.severity = ParserSeverity::Warning;
    diagnostic.message = std::string{error.message()};
    diagnostic.statement = trim_copy(source);
    diagnostic.remediation_hints = {"Review the SQL syntax near the reported token."};

    if (!error.positions().empty()) {
        const auto& position = error.positions().front();
        diagnostic.line = static_cast<std::size_t>(position.line);
        diagnostic.column = static_cast<std::size_t>(position.column);
    }

    return diagnostic;
}

struct HeaderMatch final {
    std::size_t name_index = 0U;
    std::size_t body_index = 0U;
};

bool is_identifier_token(const Token& token) noexcept
{
    return token.kind == TokenKind::Word || token.kind == TokenKind::QuotedIdentifier;
}

Identifier make_identifier(const Token& token)
{
    Identifier identifier{};
    identifier.value = token.text;
    identifier.quoted = token.kind == TokenKind::QuotedIdentifier;
    return identifier;
}

bool has_create_table_keywords(const std::vector<Token>& tokens) noexcept
{
    for (std::size_t index = 0U; index + 1U < tokens.size(); ++index) {
        if (is_keyword(tokens[index], "CREATE") && is_keyword(tokens[index + 1U], "TABLE")) {
            return true;
        }
    }
    return false;
}

std::optional<HeaderMatch> find_create_table_header(const std::vector<Token>& tokens) noexcept
{
    for (std::size_t index = 0U; index + 3U < tokens.size(); ++index) {
        if (is_keyword(tokens[index], "CREATE") && is_keyword(tokens[index + 1U], "TABLE")
            && is_single_word_identifier(tokens[index + 2U]) && is_symbol(tokens[index + 3U], '(')) {
            return HeaderMatch{index + 2U, index + 3U};
        }
    }
    return std::nullopt;
}

// Reads "( a, b, ... )" starting at the opening parenthesis; close_index lands on ')' or tokens.size().
std::vector<Identifier> read_identifier_list(const std::vector<Token>& tokens,
                                             std::size_t open_index,
                                             std::size_t& close_index)
{
    std::vector<Identifier> identifiers;
    close_index = open_index + 1U;
    while (close_index < tokens.size() && !is_symbol(tokens[close_index], ')')) {
        if (is_identifier_token(tokens[close_index])) {
            identifiers.push_back(make_identifier(tokens[close_index]));
        }
        ++close_index;
    }
    return identifiers;
}

void resolve_local_columns(const std::vector<Token>& tokens,
                           std::size_t element_start,
                           std::size_t references_index,
                           ForeignKeyReference& reference)
{
    for (std::size_t index = element_start; index + 2U < references_index; ++index) {
        if (is_keyword(tokens[index], "FOREIGN") && is_keyword(tokens[index + 1U], "KEY")
            && is_symbol(tokens[index + 2U], '(')) {
            std::size_t close_index = 0U;
            reference.local_columns = read_identifier_list(tokens, index + 2U, close_index);
            reference.inline_constraint = false;
            return;
        }
    }

    if (element_start < references_index && is_identifier_token(tokens[element_start])
        && !is_keyword(tokens[element_start], "CONSTRAINT")) {
        reference.local_columns.push_back(make_identifier(tokens[element_start]));
        reference.inline_constraint = true;
    }
}

void collect_references(const std::vector<Token>& tokens,
                        std::size_t body_index,
                        std::string_view source,
                        CreateTableStatement& statement,
                        std::vector<ParserDiagnostic>& diagnostics)
{
    std::int32_t depth = 0;
    std::optional<std::size_t> element_start{};

    for (std::size_t index = 0U; index < tokens.size(); ++index) {
        const auto& token = tokens[index];

        if (index >= body_index && is_symbol(token, '(')) {
            ++depth;
            if (depth == 1) {
                element_start = index + 1U;
            }
            continue;
        }
        if (index >= body_index && is_symbol(token, ')')) {
            if (depth == 1) {
                element_start.reset();
            }
            depth = std::max(0, depth - 1);
            continue;
        }
        if (depth == 1 && is_symbol(token, ',')) {
            element_start = index + 1U;
            continue;
        }

        if (!is_keyword(token, "REFERENCES")) {
            continue;
        }
        if (index + 1U >= tokens.size() || !is_single_word_identifier(tokens[index + 1U])) {
            ParserDiagnostic diagnostic{};
            diagnostic.severity = ParserSeverity::Info;
            diagnostic.message = "REFERENCES is not followed by a table name";
            diagnostic.statement = trim_copy(source);
            set_location(diagnostic, source, token.offset);
            diagnostics.push_back(std::move(diagnostic));
            continue;
        }
        if (index + 2U < tokens.size() && is_symbol(tokens[index + 2U], '.')) {
            ParserDiagnostic diagnostic{};
            diagnostic.severity = ParserSeverity::Info;
            diagnostic.message = "Qualified reference '" + tokens[index + 1U].text + ".";
            if (index + 3U < tokens.size()) {
                diagnostic.message += tokens[index + 3U].text;
            }
            diagnostic.message += "' is not tracked as a dependency";
            diagnostic.statement = trim_copy(source);
            diagnostic.remediation_hints = {"Reference tables by their unqualified name to order them within the batch."};
            set_location(diagnostic, source, tokens[index + 1U].offset);
            diagnostics.push_back(std::move(diagnostic));
            continue;
        }

        const auto references_index = index;
        ForeignKeyReference reference{};
        reference.table = make_identifier(tokens[index + 1U]);
        if (element_start) {
            resolve_local_columns(tokens, *element_start, references_index, reference);
        }
        if (index + 2U < tokens.size() && is_symbol(tokens[index + 2U], '(')) {
            std::size_t close_index = 0U;
            reference.referenced_columns = read_identifier_list(tokens, index + 2U, close_index);
            // The referenced column list never opens a table element.
            index = std::min(close_index, tokens.size() - 1U);
        } else {
            ++index;
        }

        const auto& table_name = reference.table.value;
        if (std::find(statement.dependencies.begin(), statement.dependencies.end(), table_name)
            == statement.dependencies.end()) {
            statement.dependencies.push_back(table_name);
        }
        statement.references.push_back(std::move(reference));
    }
}

std::string strip_ordered_banner(std::string_view text)
{
    if (text.substr(0U, kOrderedBanner.size()) != kOrderedBanner) {
        return std::string{text};
    }
    return trim_copy(text.substr(kOrderedBanner.size()));
}

}  // namespace

std::string trim_copy(std::string_view text)
{
    const auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(kWhitespace);
    return std::string{text.substr(first, last - first + 1U)};
}

bool iequals(std::string_view lhs, std::string_view rhs) noexcept
{
    if (lhs.size() != rhs.size()) {
        return false;
    }

    for (std::size_t index = 0; index < lhs.size(); ++index) {
        const auto left = static_cast<unsigned char>(lhs[index]);
        const auto right = static_cast<unsigned char>(rhs[index]);
        if (std::toupper(left) != std::toupper(right)) {
            return false;
        }
    }

    return true;
}

std::string uppercase_copy(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    for (const unsigned char ch : text) {
        result.push_back(static_cast<char>(std::toupper(ch)));
    }
    return result;
}

bool contains_ci(std::string_view text, std::string_view needle)
{
    return uppercase_copy(text).find(uppercase_copy(needle)) != std::string::npos;
}

bool is_keyword(const Token& token, std::string_view keyword) noexcept
{
    return token.kind == TokenKind::Word && iequals(token.text, keyword);
}

bool is_symbol(const Token& token, char symbol) noexcept
{
    return token.kind == TokenKind::Symbol && token.text.size() == 1U && token.text.front() == symbol;
}

bool is_single_word_identifier(const Token& token) noexcept
{
    if (token.kind == TokenKind::Word) {
        return true;
    }
    if (token.kind != TokenKind::QuotedIdentifier || token.text.empty()) {
        return false;
    }
    return std::all_of(token.text.begin(), token.text.end(), [](char ch) {
        const auto unsigned_ch = static_cast<unsigned char>(ch);
        return std::isalnum(unsigned_ch) != 0 || ch == '_' || unsigned_ch >= 0x80U;
    });
}

LexResult tokenize(std::string_view input)
{
    LexResult result{};
    pegtl::memory_input in(input.data(), input.size(), "sql_tokens");

    try {
        const auto parsed = pegtl::parse<token_grammar, token_action>(in, result.tokens);
        if (!parsed) {
            ParserDiagnostic diagnostic{};
            diagnostic.severity = ParserSeverity::Warning;
            diagnostic.message = "input did not match SQL token grammar";
            diagnostic.line = 1U;
            diagnostic.column = 1U;
            diagnostic.statement = trim_copy(input);
            diagnostic.remediation_hints = {"Review the SQL syntax near the reported token."};
            result.diagnostics.push_back(std::move(diagnostic));
        }
    } catch (const pegtl::parse_error& error) {
        result.diagnostics.push_back(make_parse_error(error, input));
    }

    return result;
}

std::vector<StatementFragment> split_statements(std::string_view batch)
{
    std::vector<StatementFragment> fragments;
    std::size_t offset = 0U;

    while (offset <= batch.size()) {
        const auto terminator = batch.find(';', offset);
        const auto end = terminator == std::string_view::npos ? batch.size() : terminator;
        const auto raw = batch.substr(offset, end - offset);
        auto text = trim_copy(raw);
        if (!text.empty()) {
            StatementFragment fragment{};
            fragment.offset = offset + raw.find_first_not_of(kWhitespace);
            fragment.index = fragments.size();
            fragment.text = std::move(text);
            fragments.push_back(std::move(fragment));
        }

        if (terminator == std::string_view::npos) {
            break;
        }
        offset = terminator + 1U;
    }

    return fragments;
}

ParseResult<CreateTableStatement> parse_create_table(const StatementFragment& fragment)
{
    ParseResult<CreateTableStatement> result{};
    auto lexed = tokenize(fragment.text);
    result.diagnostics = std::move(lexed.diagnostics);
    const auto& tokens = lexed.tokens;

    const auto header = find_create_table_header(tokens);
    if (!header) {
        ParserDiagnostic diagnostic{};
        diagnostic.statement = fragment.text;
        if (has_create_table_keywords(tokens)) {
            diagnostic.severity = ParserSeverity::Warning;
            diagnostic.message = "CREATE TABLE header not recognized; statement is left out of the ordering";
            diagnostic.remediation_hints = {
                "Write the header as CREATE TABLE <name> ( ... ) with a single-word, optionally quoted, table name.",
                "IF NOT EXISTS clauses and schema-qualified names are not recognized."};
        } else {
            diagnostic.severity = ParserSeverity::Info;
            diagnostic.message = "Statement is not a CREATE TABLE statement";
        }
        result.diagnostics.push_back(std::move(diagnostic));
        return result;
    }

    CreateTableStatement statement{};
    statement.name = make_identifier(tokens[header->name_index]);
    statement.text = fragment.text + ";";
    statement.fragment_index = fragment.index;
    collect_references(tokens, header->body_index, fragment.text, statement, result.diagnostics);

    result.ast = std::move(statement);
    return result;
}

ParseResult<CreateTableStatement> parse_create_table(std::string_view input)
{
    StatementFragment fragment{};
    fragment.text = trim_copy(input);
    while (!fragment.text.empty() && fragment.text.back() == ';') {
        fragment.text.pop_back();
        fragment.text = trim_copy(fragment.text);
    }
    return parse_create_table(fragment);
}

BatchParseResult parse_ddl_batch(std::string_view batch)
{
    BatchParseResult result{};
    result.fragments = split_statements(batch);

    std::unordered_map<std::string, std::size_t> positions{};
    for (const auto& fragment : result.fragments) {
        auto candidate = fragment;
        if (candidate.index == 0U) {
            candidate.text = strip_ordered_banner(candidate.text);
            if (candidate.text.empty()) {
                continue;
            }
        }

        auto parsed = parse_create_table(candidate);
        result.diagnostics.insert(result.diagnostics.end(), parsed.diagnostics.begin(), parsed.diagnostics.end());
        if (!parsed.ast) {
            result.unrecognized.push_back(std::move(candidate));
            continue;
        }

        auto [it, inserted] = positions.emplace(parsed.ast->name.value, result.tables.size());
        if (!inserted) {
            ParserDiagnostic diagnostic{};
            diagnostic.severity = ParserSeverity::Warning;
            diagnostic.message = "Duplicate CREATE TABLE for '" + parsed.ast->name.value
                                 + "'; the later definition replaces the earlier one";
            diagnostic.statement = candidate.text;
            diagnostic.remediation_hints = {"Remove or rename the duplicate table definition."};
            result.diagnostics.push_back(std::move(diagnostic));
            result.tables[it->second] = std::move(*parsed.ast);
            continue;
        }

        result.tables.push_back(std::move(*parsed.ast));
    }

    return result;
}

}  // namespace ddlsort::parser
