#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "htmx_lsp/syntax/languages.hpp"
#include "htmx_lsp/syntax/queries.hpp"
#include "htmx_lsp/syntax/ts_ll.hpp"

using htmx_lsp::tree_sitter_html;
using htmx_lsp::ts_ll::Parser;
using htmx_lsp::ts_ll::Query;

namespace
{

/// Texts captured as `capture` by all matches of `query_src` over `text`
std::vector<std::string> captured(
  const std::string & query_src, const std::string & text, const char * capture)
{
  std::string error;
  const auto query = Query::compile(tree_sitter_html(), query_src, &error);
  EXPECT_TRUE(query.has_value()) << error;
  if (!query) {
    return {};
  }

  Parser parser(tree_sitter_html());
  const auto tree = parser.parse_string(text);
  const auto index = query->capture_index(capture);
  EXPECT_TRUE(index.has_value());

  std::vector<std::string> out;
  for (const auto & m : query->matches(tree.root_node(), text)) {
    if (const auto node = m.node_for(*index)) {
      out.emplace_back(node->text(text));
    }
  }
  return out;
}

}  // namespace

TEST(SyntaxTsQuery, EqPredicateFiltersByText)
{
  const auto names = captured(
    "((attribute_name) @name (#eq? @name \"hx-get\"))",
    "<div hx-get=\"/a\" hx-post=\"/b\" class=\"c\"></div>", "name");
  EXPECT_EQ(names, std::vector<std::string>{"hx-get"});
}

TEST(SyntaxTsQuery, NotEqPredicate)
{
  const auto names = captured(
    "((attribute_name) @name (#not-eq? @name \"class\"))",
    "<div hx-get=\"/a\" class=\"c\"></div>", "name");
  EXPECT_EQ(names, std::vector<std::string>{"hx-get"});
}

TEST(SyntaxTsQuery, MatchPredicateSearchesUnanchored)
{
  const auto names = captured(
    "((attribute_name) @name (#match? @name \"hx-.*\"))",
    "<div data-hx-get=\"/a\" hx-post=\"/b\" id=\"x\"></div>", "name");
  EXPECT_EQ(names, (std::vector<std::string>{"data-hx-get", "hx-post"}));
}

TEST(SyntaxTsQuery, NotMatchPredicate)
{
  const auto names = captured(
    "((attribute_name) @name (#not-match? @name \"^hx-\"))",
    "<div hx-get=\"/a\" id=\"x\"></div>", "name");
  EXPECT_EQ(names, std::vector<std::string>{"id"});
}

TEST(SyntaxTsQuery, EqBetweenTwoCaptures)
{
  // A valueless attribute has the same text as its name.
  const auto names = captured(
    "((attribute (attribute_name) @name) @attr (#eq? @name @attr))",
    "<input disabled hx-get=\"/a\">", "name");
  EXPECT_EQ(names, std::vector<std::string>{"disabled"});
}

TEST(SyntaxTsQuery, InvalidQueryReportsError)
{
  std::string error;
  const auto query = Query::compile(tree_sitter_html(), "((no_such_node) @x", &error);
  EXPECT_FALSE(query.has_value());
  EXPECT_FALSE(error.empty());
}

TEST(SyntaxTsQuery, InvalidRegexReportsError)
{
  std::string error;
  const auto query =
    Query::compile(tree_sitter_html(), "((attribute_name) @n (#match? @n \"[\"))", &error);
  EXPECT_FALSE(query.has_value());
  EXPECT_NE(error.find("regular expression"), std::string::npos);
}

TEST(SyntaxTsQuery, BuiltinQueriesCompile)
{
  EXPECT_NE(htmx_lsp::syntax::hx_name_query(), nullptr);
  EXPECT_NE(htmx_lsp::syntax::hx_value_query(), nullptr);
  EXPECT_NE(htmx_lsp::syntax::hx_lsp_query(), nullptr);

  using htmx_lsp::BackendLang;
  using htmx_lsp::LangType;
  EXPECT_NE(htmx_lsp::syntax::comment_query(LangType::JavaScript, BackendLang::Python), nullptr);
  EXPECT_NE(htmx_lsp::syntax::comment_query(LangType::Backend, BackendLang::Python), nullptr);
  EXPECT_NE(htmx_lsp::syntax::comment_query(LangType::Backend, BackendLang::Rust), nullptr);
  EXPECT_NE(htmx_lsp::syntax::comment_query(LangType::Backend, BackendLang::Go), nullptr);
}

TEST(SyntaxTsQuery, NodePointsFollowSource)
{
  const std::string text = "<div>\n  <p hx-get=\"/a\"></p>\n</div>";
  Parser parser(tree_sitter_html());
  const auto tree = parser.parse_string(text);

  const auto node = tree.root_node().descendant_for_point({1, 6});
  ASSERT_FALSE(node.is_null());
  EXPECT_EQ(node.kind(), "attribute_name");
  EXPECT_EQ(node.text(text), "hx-get");
  EXPECT_EQ(node.start_point(), (htmx_lsp::TextPoint{1, 5}));
  EXPECT_EQ(node.end_point(), (htmx_lsp::TextPoint{1, 11}));
}
