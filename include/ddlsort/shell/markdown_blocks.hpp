#pragma once

#include "ddlsort/ddl/ddl_resolver.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ddlsort::shell {

// A fenced block opened by ```sql, ```json or ```markdown followed by a newline.
// begin/end delimit the whole fence, backticks included, within the document.
struct CodeBlock final {
    std::string language{};
    std::string content{};
    std::size_t begin = 0U;
    std::size_t end = 0U;
};

std::vector<CodeBlock> extract_code_blocks(std::string_view markdown);

struct MarkdownRewrite final {
    std::string text{};
    std::size_t sql_blocks = 0U;
    std::size_t blocks_reordered = 0U;
    std::vector<ddl::ResolveResult> results{};
};

// Runs every non-empty sql block through the resolver; prose and other blocks are copied unchanged.
MarkdownRewrite order_sql_code_blocks(std::string_view markdown, ddl::DdlResolver& resolver);

}  // namespace ddlsort::shell
