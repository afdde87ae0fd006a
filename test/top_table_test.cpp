#include <algorithm>
#include <functional>
#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <vector>

#include "dev/utils.hpp"
#include "seqflow/detail/top_table.hpp"

using namespace seqflow::detail;

class TopTableTest : public ::testing::Test {
protected:
  using table = top_table<int>;
  using result = table::offer_result;

  static seqflow::less_fn<int> less() { return std::less<int>{}; }
};

TEST_F(TopTableTest, KeepsLargestKeysDecreasing) {
  table t(3, less(), false);
  for (int v : {4, 1, 7, 3, 9, 2}) {
    t.offer(v);
  }
  EXPECT_EQ(t.size(), 3);
  EXPECT_EQ(t.retained_keys(), (std::vector<int>{9, 7, 4}));
}

TEST_F(TopTableTest, OfferResults) {
  table t(2, less(), false);
  EXPECT_EQ(t.offer(5), result::inserted);
  EXPECT_EQ(t.offer(5), result::tied);
  EXPECT_EQ(t.offer(3), result::inserted);
  EXPECT_EQ(t.offer(1), result::rejected);
  EXPECT_EQ(t.offer(3), result::tied);
  EXPECT_EQ(t.offer(8), result::inserted);
  EXPECT_EQ(t.retained_keys(), (std::vector<int>{8, 5}));
}

TEST_F(TopTableTest, Rank) {
  table t(4, less(), false);
  for (int v : {10, 20, 30}) {
    t.offer(v);
  }
  EXPECT_EQ(t.rank(40), 0);
  EXPECT_EQ(t.rank(30), 0);
  EXPECT_EQ(t.rank(25), 1);
  EXPECT_EQ(t.rank(5), 3);
}

TEST_F(TopTableTest, TiesFollowTheirKey) {
  table t(2, less(), true);
  for (int v : {3, 5, 3, 5, 5, 1, 7}) {
    t.offer(v);
  }
  // 3 and its ties were evicted by 7
  EXPECT_EQ(t.retained_keys(), (std::vector<int>{7, 5}));
  EXPECT_EQ(t.ties_of(0), (std::vector<int>{7}));
  EXPECT_EQ(t.ties_of(1), (std::vector<int>{5, 5, 5}));
  EXPECT_EQ(t.release_all(), (std::vector<int>{7, 5, 5, 5}));
  EXPECT_TRUE(t.empty());
}

TEST_F(TopTableTest, TiesKeepEncounterOrder) {
  using entry = std::pair<int, std::string>;
  top_table<entry> t(
      2, [](entry const &a, entry const &b) { return a.first < b.first; }, true);
  t.offer({1, "a"});
  t.offer({2, "b"});
  t.offer({1, "c"});
  t.offer({2, "d"});
  EXPECT_EQ(t.release_all(), (std::vector<entry>{{2, "b"}, {2, "d"}, {1, "a"}, {1, "c"}}));
}

TEST_F(TopTableTest, FirstSeenRepresentative) {
  using entry = std::pair<int, std::string>;
  top_table<entry> t(
      2, [](entry const &a, entry const &b) { return a.first < b.first; }, false);
  t.offer({1, "a"});
  t.offer({1, "b"});
  EXPECT_EQ(t.release_all(), (std::vector<entry>{{1, "a"}}));
}

// Linear scan and binary search agree
TEST_F(TopTableTest, LargeTableMatchesSort) {
  auto data = utils::make_unif_vector<int>(2000, 0, 500, 123);
  top_table<int, 8> t(100, less(), false);
  for (int v : data) {
    t.offer(v);
  }

  std::sort(data.begin(), data.end(), std::greater<int>{});
  data.erase(std::unique(data.begin(), data.end()), data.end());
  data.resize(100);
  EXPECT_EQ(t.retained_keys(), data);
}
