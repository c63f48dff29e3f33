#include <gtest/gtest.h>

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "htmx_lsp/lsp/knowledge_base.hpp"

using htmx_lsp::lsp::KnowledgeBase;
using htmx_lsp::lsp::KnowledgeEntry;

TEST(LspKnowledgeBase, BuiltinCoversCoreAttributes)
{
  const auto & kb = KnowledgeBase::builtin();
  for (const char * name : {"hx-get", "hx-post", "hx-swap", "hx-target", "hx-trigger", "hx-lsp"}) {
    EXPECT_NE(kb.find_attribute(name), nullptr) << name;
  }
  EXPECT_EQ(kb.find_attribute("class"), nullptr);
}

TEST(LspKnowledgeBase, AttributeNamesAreUnique)
{
  const auto & kb = KnowledgeBase::builtin();
  for (const auto & e : kb.attributes()) {
    EXPECT_EQ(kb.find_attribute(e.name), &e) << e.name;
    EXPECT_FALSE(e.description.empty()) << e.name;
  }
}

TEST(LspKnowledgeBase, SelectorValuesKeepTrailingSpace)
{
  const auto & kb = KnowledgeBase::builtin();
  EXPECT_NE(kb.find_value("hx-target", "find "), nullptr);
  EXPECT_NE(kb.find_value("hx-target", "closest "), nullptr);
  EXPECT_EQ(kb.find_value("hx-target", "find"), nullptr);
}

TEST(LspKnowledgeBase, ValuesPerAttribute)
{
  const auto & kb = KnowledgeBase::builtin();
  EXPECT_FALSE(kb.values_for("hx-swap").empty());
  EXPECT_NE(kb.find_value("hx-swap", "innerHTML"), nullptr);
  EXPECT_TRUE(kb.values_for("hx-get").empty());
  EXPECT_EQ(kb.find_value("hx-get", "innerHTML"), nullptr);
}

TEST(LspKnowledgeBase, CustomTable)
{
  std::vector<KnowledgeEntry> attributes;
  attributes.push_back(KnowledgeEntry{"hx-x", "x"});
  std::unordered_map<std::string, std::vector<KnowledgeEntry>> values;
  values["hx-x"].push_back(KnowledgeEntry{"a", "letter a"});

  const KnowledgeBase kb(std::move(attributes), std::move(values));
  ASSERT_EQ(kb.attributes().size(), 1U);
  ASSERT_NE(kb.find_value("hx-x", "a"), nullptr);
  EXPECT_EQ(kb.find_value("hx-x", "a")->description, "letter a");
}
