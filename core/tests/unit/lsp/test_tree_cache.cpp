#include <gtest/gtest.h>

#include <optional>
#include <string>

#include "htmx_lsp/lsp/tree_cache.hpp"

using htmx_lsp::BackendLang;
using htmx_lsp::FileId;
using htmx_lsp::LangType;
using htmx_lsp::lsp::TreeCache;

TEST(LspTreeCache, NewEntryNeedsAClassification)
{
  TreeCache cache;
  EXPECT_EQ(cache.upsert(FileId{0}, std::nullopt, "<div></div>"), nullptr);
  EXPECT_EQ(cache.size(), 0U);
}

TEST(LspTreeCache, StoresTreeTogetherWithText)
{
  TreeCache cache;
  const auto entry = cache.upsert(FileId{0}, LangType::Template, "<div hx-get=\"/a\"></div>");
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(entry->lang, LangType::Template);
  EXPECT_EQ(entry->text, "<div hx-get=\"/a\"></div>");
  EXPECT_FALSE(entry->tree.is_null());
  EXPECT_EQ(cache.get(FileId{0}), entry);
}

TEST(LspTreeCache, ReparseKeepsClassification)
{
  TreeCache cache;
  ASSERT_NE(cache.upsert(FileId{3}, LangType::JavaScript, "// hx@a\n"), nullptr);

  const auto again = cache.upsert(FileId{3}, LangType::Template, "// hx@b\n");
  ASSERT_NE(again, nullptr);
  EXPECT_EQ(again->lang, LangType::JavaScript);
  EXPECT_EQ(again->text, "// hx@b\n");
}

TEST(LspTreeCache, ReadersKeepReplacedEntries)
{
  TreeCache cache;
  const auto old_entry = cache.upsert(FileId{1}, LangType::Backend, "# hx@a\n");
  ASSERT_NE(old_entry, nullptr);
  ASSERT_NE(cache.upsert(FileId{1}, std::nullopt, "# hx@b\n"), nullptr);

  EXPECT_EQ(old_entry->text, "# hx@a\n");
  EXPECT_EQ(old_entry->tree.root_node().kind(), "module");
}

TEST(LspTreeCache, BackendGrammarFollowsSelection)
{
  TreeCache cache;
  ASSERT_TRUE(cache.set_backend(BackendLang::Rust));
  EXPECT_EQ(cache.backend(), BackendLang::Rust);

  const auto entry = cache.upsert(FileId{0}, LangType::Backend, "fn main() {}\n");
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(entry->tree.root_node().kind(), "source_file");
}

TEST(LspTreeCache, EraseAndReset)
{
  TreeCache cache;
  ASSERT_NE(cache.upsert(FileId{0}, LangType::Template, "<p></p>"), nullptr);
  ASSERT_NE(cache.upsert(FileId{1}, LangType::Template, "<p></p>"), nullptr);

  cache.erase(FileId{0});
  EXPECT_EQ(cache.get(FileId{0}), nullptr);
  EXPECT_EQ(cache.size(), 1U);

  cache.reset();
  EXPECT_EQ(cache.size(), 0U);
}

TEST(LspTreeCache, DetachedParseIsNotCached)
{
  TreeCache cache;
  const auto tree = cache.parse_detached(LangType::Template, "<div></div>");
  EXPECT_FALSE(tree.is_null());
  EXPECT_EQ(cache.size(), 0U);
}
