#include "stackquery/query-string-split.hpp"

#include <gtest/gtest.h>

#include <iterator>
#include <optional>
#include <string_view>
#include <type_traits>
#include <vector>

namespace stackquery::url {

namespace {
std::vector<std::string_view> Pairs(std::string_view query) {
  std::vector<std::string_view> ret;
  for (std::string_view rawPair : QueryPairRange(query)) {
    ret.push_back(rawPair);
  }
  return ret;
}

using Views = std::vector<std::string_view>;
}  // namespace

static_assert(std::forward_iterator<QueryPairRange::iterator>);
static_assert(std::is_void_v<std::iterator_traits<QueryPairRange::iterator>::pointer>);

TEST(FindQueryString, FullUrl) {
  EXPECT_EQ(FindQueryString("https://example.com/path?name=John&age=25"), "name=John&age=25");
}

TEST(FindQueryString, BareQuery) { EXPECT_EQ(FindQueryString("?flag"), "flag"); }

TEST(FindQueryString, NoQuestionMark) {
  EXPECT_EQ(FindQueryString("https://example.com/path"), std::nullopt);
  EXPECT_EQ(FindQueryString("a=1&b=2"), std::nullopt);
  EXPECT_EQ(FindQueryString(""), std::nullopt);
}

TEST(FindQueryString, EmptyQuery) {
  auto query = FindQueryString("/path?");
  ASSERT_TRUE(query.has_value());
  EXPECT_TRUE(query->empty());
}

TEST(FindQueryString, FirstQuestionMarkWins) { EXPECT_EQ(FindQueryString("/p?a=?b&c"), "a=?b&c"); }

TEST(FindQueryString, FragmentIsKept) { EXPECT_EQ(FindQueryString("/p?a=1#frag"), "a=1#frag"); }

TEST(SplitQueryPair, KeyValue) {
  auto [key, value] = SplitQueryPair("a=1");
  EXPECT_EQ(key, "a");
  EXPECT_EQ(value, "1");
}

TEST(SplitQueryPair, FirstEqualWins) {
  auto [key, value] = SplitQueryPair("a=1=2");
  EXPECT_EQ(key, "a");
  EXPECT_EQ(value, "1=2");
}

TEST(SplitQueryPair, EmptyKey) {
  auto [key, value] = SplitQueryPair("=v");
  EXPECT_TRUE(key.empty());
  EXPECT_EQ(value, "v");
}

TEST(SplitQueryPair, EmptyValue) {
  auto [key, value] = SplitQueryPair("k=");
  EXPECT_EQ(key, "k");
  EXPECT_TRUE(value.empty());
}

TEST(SplitQueryPair, KeyOnly) {
  auto [key, value] = SplitQueryPair("flag");
  EXPECT_EQ(key, "flag");
  EXPECT_TRUE(value.empty());
}

TEST(QueryPairRange, Empty) {
  EXPECT_TRUE(Pairs("").empty());
  EXPECT_TRUE(Pairs("&").empty());
  EXPECT_TRUE(Pairs("&&&").empty());
  QueryPairRange defaultRange;
  EXPECT_TRUE(defaultRange.begin() == defaultRange.end());
}

TEST(QueryPairRange, SplitsInOrder) { EXPECT_EQ(Pairs("a=1&b=2&c=3"), (Views{"a=1", "b=2", "c=3"})); }

TEST(QueryPairRange, SkipsEmptyPairs) {
  EXPECT_EQ(Pairs("&a=1&&b&"), (Views{"a=1", "b"}));
  EXPECT_EQ(Pairs("a&&&&b"), (Views{"a", "b"}));
}

TEST(QueryPairRange, KeepsDuplicates) { EXPECT_EQ(Pairs("x=1&x=2&x"), (Views{"x=1", "x=2", "x"})); }

TEST(QueryPairRange, KeepsPairsWithEmptyKey) { EXPECT_EQ(Pairs("=1&="), (Views{"=1", "="})); }

TEST(QueryPairRange, Restartable) {
  QueryPairRange range("a=1&b=2");
  EXPECT_EQ(std::distance(range.begin(), range.end()), 2);
  EXPECT_EQ(std::distance(range.begin(), range.end()), 2);
}

TEST(QueryPairRange, RemainingFrom) {
  QueryPairRange range("a=1&&b=2&c");
  auto it = range.begin();
  EXPECT_EQ(range.remainingFrom(it), "a=1&&b=2&c");
  ++it;
  EXPECT_EQ(*it, "b=2");
  EXPECT_EQ(range.remainingFrom(it), "b=2&c");
  it++;
  EXPECT_EQ(range.remainingFrom(it), "c");
  ++it;
  EXPECT_TRUE(it == range.end());
  EXPECT_TRUE(range.remainingFrom(it).empty());
}

}  // namespace stackquery::url
