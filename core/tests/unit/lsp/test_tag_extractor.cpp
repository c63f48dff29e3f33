#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "htmx_lsp/lsp/tag_extractor.hpp"
#include "htmx_lsp/syntax/languages.hpp"
#include "htmx_lsp/syntax/queries.hpp"
#include "htmx_lsp/syntax/ts_ll.hpp"

using htmx_lsp::BackendLang;
using htmx_lsp::LangType;
using htmx_lsp::Tag;
using htmx_lsp::tree_sitter_python;
using htmx_lsp::lsp::extract_tags;
using htmx_lsp::lsp::first_tag_in_line;
using htmx_lsp::lsp::tags_in_value;

namespace
{

std::vector<Tag> extract(LangType type, BackendLang backend, const std::string & text)
{
  htmx_lsp::ts_ll::Parser parser(htmx_lsp::syntax::grammar_for(type, backend));
  const auto tree = parser.parse_string(text);
  const auto * query = htmx_lsp::syntax::comment_query(type, backend);
  EXPECT_NE(query, nullptr);
  if (query == nullptr) {
    return {};
  }
  return extract_tags(tree.root_node(), text, *query);
}

}  // namespace

// ============================================================================
// Tokenizer
// ============================================================================

TEST(LspTagExtractor, TokenNeedsCharactersAfterPrefix)
{
  EXPECT_TRUE(htmx_lsp::lsp::is_tag_token("hx@users"));
  EXPECT_FALSE(htmx_lsp::lsp::is_tag_token("hx@"));
  EXPECT_FALSE(htmx_lsp::lsp::is_tag_token("xhx@users"));
  EXPECT_FALSE(htmx_lsp::lsp::is_tag_token("hx@a b"));
}

TEST(LspTagExtractor, FirstTagInLineOnly)
{
  const auto t = first_tag_in_line("# hx@one hx@two", 4);
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->name, "hx@one");
  EXPECT_EQ(t->start, 2U);
  EXPECT_EQ(t->end, 8U);
  EXPECT_EQ(t->line, 4U);
}

TEST(LspTagExtractor, ColumnBaseShiftsColumns)
{
  const auto t = first_tag_in_line("// hx@x", 0, 10);
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->start, 13U);
  EXPECT_EQ(t->end, 17U);
}

TEST(LspTagExtractor, BarePrefixIsSkipped)
{
  const auto t = first_tag_in_line("# hx@ then hx@real", 0);
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->name, "hx@real");
}

TEST(LspTagExtractor, ValueWithSeveralTags)
{
  const auto tags = tags_in_value("hx@a other hx@b", 20, 3);
  ASSERT_TRUE(tags.has_value());
  ASSERT_EQ(tags->size(), 2U);
  EXPECT_EQ((*tags)[0].name, "hx@a");
  EXPECT_EQ((*tags)[0].start, 20U);
  EXPECT_EQ((*tags)[0].end, 24U);
  EXPECT_EQ((*tags)[1].name, "hx@b");
  EXPECT_EQ((*tags)[1].start, 31U);
  EXPECT_EQ((*tags)[1].line, 3U);
}

TEST(LspTagExtractor, MalformedValuesAreRejected)
{
  EXPECT_FALSE(tags_in_value(" hx@a", 0, 0).has_value());
  EXPECT_FALSE(tags_in_value("hx@a  hx@b", 0, 0).has_value());

  const auto empty = tags_in_value("", 0, 0);
  ASSERT_TRUE(empty.has_value());
  EXPECT_TRUE(empty->empty());
}

TEST(LspTagExtractor, HitTestIncludesBothEnds)
{
  const auto tags = tags_in_value("hx@a hx@b", 0, 0);
  ASSERT_TRUE(tags.has_value());

  EXPECT_EQ(htmx_lsp::lsp::tag_at_column(*tags, 0)->name, "hx@a");
  EXPECT_EQ(htmx_lsp::lsp::tag_at_column(*tags, 4)->name, "hx@a");
  EXPECT_EQ(htmx_lsp::lsp::tag_at_column(*tags, 5)->name, "hx@b");
  EXPECT_FALSE(htmx_lsp::lsp::tag_at_column(*tags, 10).has_value());
}

// ============================================================================
// Comments
// ============================================================================

TEST(LspTagExtractor, PythonComments)
{
  const std::string text =
    "# hx@users\n"
    "def users():\n"
    "    x = 1  # hx@inline\n"
    "    # plain comment\n";
  const auto tags = extract(LangType::Backend, BackendLang::Python, text);

  ASSERT_EQ(tags.size(), 2U);
  EXPECT_EQ(tags[0].name, "hx@users");
  EXPECT_EQ(tags[0].line, 0U);
  EXPECT_EQ(tags[0].start, 2U);
  EXPECT_EQ(tags[1].name, "hx@inline");
  EXPECT_EQ(tags[1].line, 2U);
  EXPECT_EQ(tags[1].start, 13U);
}

TEST(LspTagExtractor, RustLineComment)
{
  const std::string text =
    "fn main() {\n"
    "    // hx@something\n"
    "    let msg = \"hello\";\n"
    "}\n";
  const auto tags = extract(LangType::Backend, BackendLang::Rust, text);

  ASSERT_EQ(tags.size(), 1U);
  EXPECT_EQ(tags[0].name, "hx@something");
  EXPECT_EQ(tags[0].line, 1U);
  EXPECT_EQ(tags[0].start, 7U);
  EXPECT_EQ(tags[0].end, 19U);
}

TEST(LspTagExtractor, BlockCommentLinesStartAtColumnZero)
{
  const std::string text =
    "const a = 1; /* hx@first\n"
    "  hx@second */\n";
  const auto tags = extract(LangType::JavaScript, BackendLang::Python, text);

  ASSERT_EQ(tags.size(), 2U);
  EXPECT_EQ(tags[0].name, "hx@first");
  EXPECT_EQ(tags[0].line, 0U);
  EXPECT_EQ(tags[0].start, 16U);
  EXPECT_EQ(tags[1].name, "hx@second");
  EXPECT_EQ(tags[1].line, 1U);
  EXPECT_EQ(tags[1].start, 2U);
}

TEST(LspTagExtractor, GoComment)
{
  const std::string text =
    "package main\n"
    "\n"
    "// hx@handler\n"
    "func handler() {}\n";
  const auto tags = extract(LangType::Backend, BackendLang::Go, text);

  ASSERT_EQ(tags.size(), 1U);
  EXPECT_EQ(tags[0].name, "hx@handler");
  EXPECT_EQ(tags[0].line, 2U);
}

TEST(LspTagExtractor, TagInCommentAtPoint)
{
  const std::string text = "# hx@users\nx = 1\n";
  htmx_lsp::ts_ll::Parser parser(tree_sitter_python());
  const auto tree = parser.parse_string(text);
  const auto * query = htmx_lsp::syntax::comment_query(LangType::Backend, BackendLang::Python);
  ASSERT_NE(query, nullptr);

  const auto hit = htmx_lsp::lsp::tag_in_comment_at(tree.root_node(), text, *query, {0, 5});
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(hit->name, "hx@users");

  EXPECT_FALSE(htmx_lsp::lsp::tag_in_comment_at(tree.root_node(), text, *query, {1, 0}).has_value());
}

TEST(LspTagExtractor, TemplatesHaveNoCommentQuery)
{
  EXPECT_EQ(htmx_lsp::syntax::comment_query(LangType::Template, BackendLang::Python), nullptr);
}
