#include <gtest/gtest.h>

#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "htmx_lsp/index/document_index.hpp"

using htmx_lsp::DocumentIndex;
using htmx_lsp::FileId;

TEST(IndexDocumentIndex, AddThenReverseLookup)
{
  DocumentIndex index;
  const std::string uri = "file:///project/templates/index.html";

  const auto id = index.add(uri);
  ASSERT_TRUE(id.has_value());
  EXPECT_EQ(index.find(uri), id);
  EXPECT_EQ(index.uri_of(*id), uri);
}

TEST(IndexDocumentIndex, SecondAddIsANoOp)
{
  DocumentIndex index;
  const std::string uri = "file:///project/src/api.py";

  const auto first = index.add(uri);
  ASSERT_TRUE(first.has_value());
  EXPECT_FALSE(index.add(uri).has_value());
  EXPECT_EQ(index.find(uri), first);
  EXPECT_EQ(index.size(), 1U);
}

TEST(IndexDocumentIndex, UnknownLookupsMiss)
{
  DocumentIndex index;
  EXPECT_FALSE(index.find("file:///nope").has_value());
  EXPECT_FALSE(index.uri_of(FileId{42}).has_value());
}

TEST(IndexDocumentIndex, IdsAreNotReusedAfterReset)
{
  DocumentIndex index;
  const auto before = index.add("file:///a.html");
  ASSERT_TRUE(before.has_value());

  index.reset();
  EXPECT_EQ(index.size(), 0U);
  EXPECT_FALSE(index.uri_of(*before).has_value());

  const auto after = index.add("file:///b.html");
  ASSERT_TRUE(after.has_value());
  EXPECT_NE(*before, *after);
}

TEST(IndexDocumentIndex, ConcurrentAddsYieldOneId)
{
  DocumentIndex index;
  const std::string uri = "file:///project/src/race.py";
  std::atomic<int> winners{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&]() {
      if (index.add(uri)) {
        ++winners;
      }
    });
  }
  for (auto & t : threads) {
    t.join();
  }

  EXPECT_EQ(winners.load(), 1);
  EXPECT_EQ(index.size(), 1U);
}
