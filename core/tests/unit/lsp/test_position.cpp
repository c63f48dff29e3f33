#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "htmx_lsp/lsp/position.hpp"
#include "htmx_lsp/syntax/languages.hpp"
#include "htmx_lsp/syntax/ts_ll.hpp"

using htmx_lsp::TextPoint;
using htmx_lsp::tree_sitter_html;
using htmx_lsp::lsp::AttributeName;
using htmx_lsp::lsp::AttributeValue;
using htmx_lsp::lsp::Position;
using htmx_lsp::lsp::QueryMode;

namespace
{

std::optional<Position> resolve(const std::string & text, TextPoint point, QueryMode mode)
{
  htmx_lsp::ts_ll::Parser parser(tree_sitter_html());
  const auto tree = parser.parse_string(text);
  return htmx_lsp::lsp::resolve_position(tree.root_node(), text, point, mode);
}

Position name(std::string_view n) { return AttributeName{std::string(n)}; }

Position value(const char * n, const char * v) { return AttributeValue{n, v}; }

}  // namespace

// ============================================================================
// Completion
// ============================================================================

TEST(LspPosition, SuggestsNamesWhenStartingAttribute)
{
  const auto p = resolve("<div hx- ></div>", {0, 8}, QueryMode::Completion);
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(*p, name("hx-"));
}

TEST(LspPosition, NothingWhenQuoteNotOpened)
{
  const auto p = resolve("<div hx-swap= ></div>", {0, 13}, QueryMode::Completion);
  EXPECT_FALSE(p.has_value());
}

TEST(LspPosition, NothingBetweenNameEndAndUnquotedValue)
{
  // "hx-swap" ends at column 12, where the `=` starts
  const std::string text = "<div hx-swap= ></div>";
  for (uint32_t col = 12; col <= 13; ++col) {
    EXPECT_FALSE(resolve(text, {0, col}, QueryMode::Completion).has_value()) << "column " << col;
  }
}

TEST(LspPosition, ValueWhenQuoteJustOpened)
{
  const auto p = resolve("<div hx-swap=\" ></div>", {0, 14}, QueryMode::Completion);
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(*p, value("hx-swap", ""));
}

TEST(LspPosition, ValueBetweenEmptyQuotes)
{
  const auto p = resolve("<div hx-swap=\"\"></div>", {0, 13}, QueryMode::Completion);
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(*p, value("hx-swap", ""));
}

TEST(LspPosition, ValueWhenQuoteOpenedBetweenElements)
{
  const std::string text =
    "<div id=\"fa\" hx-swap=\"hx-swap\" hx-swap=\"hx-swap\">\n"
    "      <span hx-target=\"\n"
    "      <button>Click me</button>\n"
    "    </div>\n"
    "    ";
  const auto p = resolve(text, {1, 23}, QueryMode::Completion);
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(*p, value("hx-target", ""));
}

TEST(LspPosition, NameForIncompleteAttributeBetweenElements)
{
  const std::string text =
    "<div id=\"fa\" hx-target=\"this\" hx-swap=\"hx-swap\">\n"
    "      <span hx-\n"
    "      <button>Click me</button>\n"
    "    </div>\n"
    "    ";
  const auto p = resolve(text, {1, 14}, QueryMode::Completion);
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(*p, name("hx-"));
}

TEST(LspPosition, NameAfterSeveralAttributes)
{
  const auto p =
    resolve("<div hx-get=\"/foo\" hx-target=\"this\" hx- ></div>", {0, 39}, QueryMode::Completion);
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(*p, name("hx-"));
}

TEST(LspPosition, EmptyValueBetweenAttributes)
{
  const auto p = resolve(
    "<div hx-get=\"/foo\" hx-target=\"\" hx-swap=\"#swap\"></div>\n    ", {0, 30},
    QueryMode::Completion);
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(*p, value("hx-target", ""));
}

TEST(LspPosition, UnclosedValueBetweenAttributes)
{
  const auto p = resolve(
    "<div hx-get=\"/foo\" hx-target=\" hx-swap=\"#swap\"></div>", {0, 30}, QueryMode::Completion);
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(*p, value("hx-target", ""));
}

TEST(LspPosition, NameBetweenAttributes)
{
  const std::string text =
    "<div hx-get=\"/foo\" hx- hx-swap=\"#swap\"></div>\n"
    "        <span class=\"foo\" />";
  const auto p = resolve(text, {0, 22}, QueryMode::Completion);
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(*p, name("hx-"));
}

TEST(LspPosition, HalfTypedName)
{
  const std::string text =
    "<div hx-get=\"/foo\" hx-t hx-swap=\"#swap\"></div>\n"
    "        <span class=\"foo\" />";
  const auto p = resolve(text, {0, 23}, QueryMode::Completion);
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(*p, name("hx-t"));
}

// The cursor sits on a blank line after an element whose last attribute has
// no value: a fresh attribute name is offered.
TEST(LspPosition, FreshAttributeAfterValuelessAttribute)
{
  const std::string text =
    "<a hx-swap class=\"text-2xl\">\n"
    "       \n"
    "</a>\n"
    "                \n"
    "            ";
  const auto p = resolve(text, {1, 5}, QueryMode::Completion);
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(*p, name(htmx_lsp::lsp::k_fresh_attribute_name));
}

// ============================================================================
// Hover
// ============================================================================

TEST(LspPosition, HoverReportsFilledValue)
{
  const auto p = resolve(
    "<div hx-get=\"/foo\" hx-target=\"find \" hx-swap=\"#swap\"></div>", {0, 35}, QueryMode::Hover);
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(*p, value("hx-target", "find "));
}

TEST(LspPosition, HoverReportsValueAtEveryInteriorColumn)
{
  // `find ` spans columns 30..34; the closing quote is at 35
  const std::string text =
    "<div hx-get=\"/foo\" hx-target=\"find \" hx-swap=\"#swap\"></div>";
  for (uint32_t col = 30; col <= 35; ++col) {
    const auto p = resolve(text, {0, col}, QueryMode::Hover);
    ASSERT_TRUE(p.has_value()) << "column " << col;
    EXPECT_EQ(*p, value("hx-target", "find ")) << "column " << col;
  }

  // `#swap` spans columns 46..50; the closing quote is at 51
  for (uint32_t col = 46; col <= 51; ++col) {
    const auto p = resolve(text, {0, col}, QueryMode::Hover);
    ASSERT_TRUE(p.has_value()) << "column " << col;
    EXPECT_EQ(*p, value("hx-swap", "#swap")) << "column " << col;
  }
}

TEST(LspPosition, PrefixFilterIgnoresEmbeddedHx)
{
  const std::string text = "<div data-hx-get=\"/a\" foo-hx-x></div>";
  EXPECT_FALSE(resolve(text, {0, 8}, QueryMode::Hover).has_value());
  EXPECT_FALSE(resolve(text, {0, 18}, QueryMode::Hover).has_value());
  EXPECT_FALSE(resolve(text, {0, 18}, QueryMode::Completion).has_value());
  EXPECT_FALSE(resolve(text, {0, 26}, QueryMode::Hover).has_value());
}

TEST(LspPosition, HoverOutsideHtmxAttribute)
{
  const auto p = resolve("<div hx-get=\"/foo\"  class=\"p-4\" ></div>", {0, 24}, QueryMode::Hover);
  EXPECT_FALSE(p.has_value());
}

TEST(LspPosition, HoverAttributeNames)
{
  struct Case
  {
    const char * text;
    TextPoint point;
    const char * expected;
  };
  const Case cases[] = {
    {"<div hx-get=\"/foo\" class=\"p-4\" hx-target=\"closest\" ></div>", {0, 37}, "hx-target"},
    {"<div hx-get=\"\" class=\"p-4\" hx-target=\"\" ></div>", {0, 9}, "hx-get"},
    {"<div hx-get=\"/foo\" hx-target=\"closest\" hx-swap=\"outerHTML\" hx-swap=\"swap\"></div>",
     {0, 9},
     "hx-get"},
    {"<a hx-swap=\"\" hx-patch=\"/route\" hx-validate", {0, 40}, "hx-validate"},
  };

  for (const auto & c : cases) {
    const auto p = resolve(c.text, c.point, QueryMode::Hover);
    ASSERT_TRUE(p.has_value()) << c.text;
    EXPECT_EQ(*p, name(c.expected)) << c.text;
  }
}

// ============================================================================
// Tag references
// ============================================================================

TEST(LspPosition, FindsTagReferenceInHxLspValue)
{
  const std::string text = "<div hx-lsp=\"hx@users hx@posts\"></div>";
  htmx_lsp::ts_ll::Parser parser(tree_sitter_html());
  const auto tree = parser.parse_string(text);

  // value starts at column 13: "hx@users" [13, 21), "hx@posts" [22, 30)
  const auto first = htmx_lsp::lsp::find_tag_reference(tree.root_node(), text, {0, 15});
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->name, "hx@users");
  EXPECT_EQ(first->start, 13U);
  EXPECT_EQ(first->end, 21U);

  const auto second = htmx_lsp::lsp::find_tag_reference(tree.root_node(), text, {0, 30});
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->name, "hx@posts");
}

TEST(LspPosition, NoTagReferenceOutsideHxLsp)
{
  const std::string text = "<div hx-get=\"hx@users\"></div>";
  htmx_lsp::ts_ll::Parser parser(tree_sitter_html());
  const auto tree = parser.parse_string(text);
  EXPECT_FALSE(htmx_lsp::lsp::find_tag_reference(tree.root_node(), text, {0, 15}).has_value());
}

TEST(LspPosition, MalformedHxLspValueHasNoReference)
{
  const std::string text = "<div hx-lsp=\"hx@users  hx@posts\"></div>";
  htmx_lsp::ts_ll::Parser parser(tree_sitter_html());
  const auto tree = parser.parse_string(text);
  EXPECT_FALSE(htmx_lsp::lsp::find_tag_reference(tree.root_node(), text, {0, 15}).has_value());
}
