#pragma once

#include <tao/pegtl.hpp>

namespace ddlsort::parser::lex {

namespace pegtl = tao::pegtl;

struct whitespace : pegtl::plus<pegtl::space> {
};

struct line_comment : pegtl::seq<pegtl::two<'-'>, pegtl::until<pegtl::eolf>> {
};

struct block_comment : pegtl::seq<pegtl::string<'/', '*'>, pegtl::until<pegtl::string<'*', '/'>>> {
};

// A doubled delimiter inside the text stands for one literal delimiter.
template <char Delimiter>
struct delimited_char : pegtl::sor<pegtl::two<Delimiter>, pegtl::not_one<Delimiter>> {
};

template <char Delimiter>
struct delimited_text : pegtl::seq<pegtl::one<Delimiter>, pegtl::star<delimited_char<Delimiter>>, pegtl::one<Delimiter>> {
};

struct string_literal : delimited_text<'\''> {
};

struct double_quoted_identifier : delimited_text<'"'> {
};

struct backtick_identifier : delimited_text<'`'> {
};

struct word_char : pegtl::sor<pegtl::alnum, pegtl::one<'_'>, pegtl::range<'\x80', '\xff'>> {
};

struct word : pegtl::plus<word_char> {
};

struct symbol : pegtl::any {
};

}  // namespace ddlsort::parser::lex
