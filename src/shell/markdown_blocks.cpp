#include "ddlsort/shell/markdown_blocks.hpp"

#include "ddlsort/parser/grammar.hpp"

#include <array>

namespace ddlsort::shell {

namespace {

constexpr std::string_view kFence = "```";
constexpr std::array<std::string_view, 3U> kLanguages{"sql", "json", "markdown"};

// Returns the language tag when a recognised fence opens at `position`.
std::string_view match_opening(std::string_view markdown, std::size_t position)
{
    const auto after_fence = position + kFence.size();
    for (const auto language : kLanguages) {
        if (markdown.compare(after_fence, language.size(), language) != 0) {
            continue;
        }
        const auto newline = after_fence + language.size();
        if (newline < markdown.size() && markdown[newline] == '\n') {
            return language;
        }
    }
    return {};
}

}  // namespace

std::vector<CodeBlock> extract_code_blocks(std::string_view markdown)
{
    std::vector<CodeBlock> blocks;
    std::size_t cursor = 0U;
    while (cursor < markdown.size()) {
        const auto open = markdown.find(kFence, cursor);
        if (open == std::string_view::npos) {
            break;
        }

        const auto language = match_opening(markdown, open);
        if (language.empty()) {
            cursor = open + 1U;
            continue;
        }

        const auto content_begin = open + kFence.size() + language.size() + 1U;
        const auto close = markdown.find(kFence, content_begin);
        if (close == std::string_view::npos) {
            break;
        }

        CodeBlock block{};
        block.language = std::string{language};
        block.content = std::string{markdown.substr(content_begin, close - content_begin)};
        block.begin = open;
        block.end = close + kFence.size();
        cursor = block.end;
        blocks.push_back(std::move(block));
    }
    return blocks;
}

MarkdownRewrite order_sql_code_blocks(std::string_view markdown, ddl::DdlResolver& resolver)
{
    MarkdownRewrite rewrite{};
    rewrite.text.reserve(markdown.size() + 128U);

    std::size_t copied = 0U;
    for (const auto& block : extract_code_blocks(markdown)) {
        if (block.language != "sql") {
            continue;
        }
        ++rewrite.sql_blocks;

        const auto content = parser::trim_copy(block.content);
        if (content.empty()) {
            continue;
        }

        auto result = resolver.resolve_detailed(content);
        if (result.outcome == ddl::ResolveOutcome::Ordered) {
            ++rewrite.blocks_reordered;
        }

        rewrite.text.append(markdown.substr(copied, block.begin - copied));
        rewrite.text.append("```sql\n");
        rewrite.text.append(result.text);
        rewrite.text.append("\n```");
        copied = block.end;
        rewrite.results.push_back(std::move(result));
    }
    rewrite.text.append(markdown.substr(copied));
    return rewrite;
}

}  // namespace ddlsort::shell
