#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "seqflow/seqflow.hpp"

using namespace seqflow;

namespace {
// Claims an exact size near the top of size_t
class huge_seq : public seq_base<int> {
public:
  bool try_advance(sink_type sink) override {
    sink(0);
    return true;
  }

  size_t estimate_size() const noexcept override { return unbounded / 2; }
  seq_props props() const noexcept override { return ordered_sized; }
};
} // namespace

class TraverseTest : public ::testing::Test {};

TEST_F(TraverseTest, BundlesOneFromEachSource) {
  auto t = traverse(of({1, 2, 3}), of({10, 20, 30}), of({100, 200, 300}));
  EXPECT_EQ(t.estimate_size(), 3u);
  EXPECT_EQ(to_vectors(t), (std::vector<std::vector<int>>{{1, 10, 100}, {2, 20, 200}, {3, 30, 300}}));
}

TEST_F(TraverseTest, StopsAtShortestSource) {
  auto t = traverse(of({1, 2, 3}), of({4, 5}));
  EXPECT_EQ(t.estimate_size(), 2u);
  EXPECT_EQ(to_vectors(t), (std::vector<std::vector<int>>{{1, 4}, {2, 5}}));
}

TEST_F(TraverseTest, EmptySourceOnFirstRoundGivesOneEmptyBundle) {
  auto t = traverse(of({1, 2}), empty<int>());
  EXPECT_EQ(t.estimate_size(), 1u);
  EXPECT_EQ(to_vectors(t), (std::vector<std::vector<int>>{{}}));
  EXPECT_EQ(t.estimate_size(), 0u);
}

TEST_F(TraverseTest, VectorOverload) {
  std::vector<seq<std::string>> srcs;
  srcs.push_back(of<std::string>({"a", "b"}));
  srcs.push_back(of<std::string>({"c", "d"}));
  auto t = traverse(std::move(srcs));
  EXPECT_EQ(to_vectors(t), (std::vector<std::vector<std::string>>{{"a", "c"}, {"b", "d"}}));
}

TEST_F(TraverseTest, PropsAreIntersectedAndStructural) {
  auto t = traverse(from_vector(std::vector<int>{1, 2}, {.ordered = true, .sorted = true}), of({3, 4}));
  auto p = t.props();
  EXPECT_TRUE(p.ordered);
  EXPECT_TRUE(p.sized);
  EXPECT_FALSE(p.sorted);
  EXPECT_FALSE(t.try_split());
}

TEST_F(TraverseTest, NeverSplitsEvenBeforeStart) {
  auto t = traverse(of({1, 2, 3, 4}), of({5, 6, 7, 8}));
  EXPECT_FALSE(t.try_split());
  EXPECT_EQ(count(t), 4u);
}

TEST_F(TraverseTest, InvalidArguments) {
  std::vector<seq<int>> one;
  one.push_back(of({1}));
  EXPECT_THROW(traverse(std::move(one)), std::invalid_argument);
  EXPECT_THROW(traverse(of({1}), from_vector(std::vector<int>{1}, seq_props{})), std::invalid_argument);
  EXPECT_THROW(traverse(of({1}), seq<int>{}), std::invalid_argument);
}

class WeaveTest : public ::testing::Test {};

TEST_F(WeaveTest, Interleaves) {
  auto w = weave(of<std::string>({"1", "2", "3", "4"}), of<std::string>({"11", "12", "13", "14"}));
  EXPECT_EQ(w.estimate_size(), 8u);
  EXPECT_EQ(to_vector(w), (std::vector<std::string>{"1", "11", "2", "12", "3", "13", "4", "14"}));
}

TEST_F(WeaveTest, PartialRoundDiscarded) {
  auto w = weave(of({1, 2, 3}), of({4, 5}));
  EXPECT_EQ(to_vector(w), (std::vector<int>{1, 4, 2, 5}));
}

TEST_F(WeaveTest, ThreeSources) {
  auto w = weave(of({1, 2}), of({3, 4}), of({5, 6}));
  EXPECT_EQ(to_vector(w), (std::vector<int>{1, 3, 5, 2, 4, 6}));
}

TEST_F(WeaveTest, EstimateTracksBufferedRound) {
  auto w = weave(of({1, 2}), of({3, 4}));
  w.try_advance([](int &&) {});
  EXPECT_EQ(w.estimate_size(), 3u);
}

TEST_F(WeaveTest, DropsSorted) {
  auto sorted = [] { return from_vector(std::vector<int>{1, 2}, {.ordered = true, .sorted = true}); };
  auto w = weave(sorted(), sorted());
  EXPECT_FALSE(w.props().sorted);
  EXPECT_TRUE(w.props().ordered);
}

TEST_F(WeaveTest, NeverSplits) {
  auto w = weave(of({1, 2, 3, 4}), of({5, 6, 7, 8}));
  EXPECT_FALSE(w.try_split());
  EXPECT_EQ(count(w), 8u);
}

class ZipTest : public ::testing::Test {};

TEST_F(ZipTest, CombinesPairwise) {
  auto z = zip(of({1, 2, 3}), of<std::string>({"a", "b"}),
               [](int n, std::string const &s) { return std::to_string(n) + s; });
  EXPECT_EQ(z.estimate_size(), 2u);
  EXPECT_EQ(to_vector(z), (std::vector<std::string>{"1a", "2b"}));
}

TEST_F(ZipTest, EmptyOptionalIsContractError) {
  auto z = zip(of({1, 2}), of({1, 0}), [](int a, int b) -> std::optional<int> {
    if (b == 0) {
      return std::nullopt;
    }
    return a / b;
  });
  EXPECT_TRUE(z.try_advance([](std::optional<int> &&v) { EXPECT_EQ(*v, 1); }));
  EXPECT_THROW(z.try_advance([](std::optional<int> &&) {}), contract_error);
}

TEST_F(ZipTest, NullPointerIsContractError) {
  static int const value = 3;
  auto z = zip(of({1}), of({2}), [](int, int) -> int const * { return nullptr; });
  EXPECT_THROW(to_vector(z), contract_error);

  auto ok = zip(of({1}), of({2}), [](int, int) { return std::make_shared<int>(value); });
  auto got = to_vector(ok);
  ASSERT_EQ(got.size(), 1u);
  EXPECT_EQ(*got[0], 3);
}

TEST_F(ZipTest, InvalidArguments) {
  EXPECT_THROW(zip(of({1}), seq<int>{}, [](int a, int b) { return a + b; }), std::invalid_argument);
  EXPECT_THROW(zip(from_vector(std::vector<int>{1}, seq_props{}), of({1}), [](int a, int b) { return a + b; }),
               std::invalid_argument);
}

TEST_F(ZipTest, NeverSplits) {
  auto z = zip(of({1, 2, 3, 4}), of({5, 6, 7, 8}), [](int a, int b) { return a * b; });
  EXPECT_FALSE(z.try_split());
  EXPECT_EQ(to_vector(z), (std::vector<int>{5, 12, 21, 32}));
}

class CycleTest : public ::testing::Test {};

TEST_F(CycleTest, LimitedCycleRepeatsPattern) {
  auto c = limit_at_most(cycle(of({1, 2})), 9);
  EXPECT_EQ(to_vector(c), (std::vector<int>{1, 2, 1, 2, 1, 2, 1, 2, 1}));
}

TEST_F(CycleTest, IsInfinite) {
  auto c = cycle(of({1, 2, 3}));
  EXPECT_EQ(c.estimate_size(), unbounded);
  EXPECT_FALSE(c.props().sized);
  EXPECT_TRUE(c.props().ordered);
}

TEST_F(CycleTest, EmptySourceGivesEmptySequence) {
  auto c = cycle(empty<int>());
  EXPECT_EQ(c.estimate_size(), 0u);
  EXPECT_EQ(count(c), 0u);
}

TEST_F(CycleTest, RejectsUnboundedSource) {
  EXPECT_THROW(cycle(iota(0)), std::invalid_argument);
}

TEST_F(CycleTest, SplitSharesStorage) {
  auto c = cycle(of({1, 2, 3}));
  c.try_advance([](int &&) {});
  auto other = c.try_split();
  ASSERT_TRUE(other);
  EXPECT_EQ(to_vector(limit_at_most(std::move(other), 4)), (std::vector<int>{2, 3, 1, 2}));
  EXPECT_EQ(to_vector(limit_at_most(std::move(c), 4)), (std::vector<int>{2, 3, 1, 2}));
}

class RepeatTest : public ::testing::Test {};

TEST_F(RepeatTest, EachElementRepeated) {
  auto r = repeat(of<std::string>({"a", "b"}), 3);
  EXPECT_EQ(r.estimate_size(), 6u);
  EXPECT_EQ(to_vector(r), (std::vector<std::string>{"a", "a", "a", "b", "b", "b"}));
}

TEST_F(RepeatTest, EstimateDuringRun) {
  auto r = repeat(of({1, 2}), 2);
  r.try_advance([](int &&) {});
  EXPECT_EQ(r.estimate_size(), 3u);
}

TEST_F(RepeatTest, KeepsSortedDropsDistinct) {
  auto r = repeat(from_vector(std::vector<int>{1, 2}, {.ordered = true, .sorted = true, .distinct = true}), 2);
  EXPECT_TRUE(r.props().sorted);
  EXPECT_TRUE(r.props().sized);
  EXPECT_FALSE(r.props().distinct);
}

TEST_F(RepeatTest, SaturatedSizeIsNotExact) {
  auto r = repeat(make_seq<huge_seq>(), 3);
  EXPECT_EQ(r.estimate_size(), unbounded);
  EXPECT_FALSE(r.props().sized);
  EXPECT_TRUE(r.props().ordered);

  auto small = repeat(make_seq<huge_seq>(), 2);
  EXPECT_EQ(small.estimate_size(), unbounded / 2 * 2);
  EXPECT_TRUE(small.props().sized);
}

TEST_F(RepeatTest, SplitDelegates) {
  auto r = repeat(of({1, 2, 3, 4}), 2);
  auto prefix = r.try_split();
  ASSERT_TRUE(prefix);
  EXPECT_EQ(to_vector(prefix), (std::vector<int>{1, 1, 2, 2}));
  EXPECT_EQ(to_vector(r), (std::vector<int>{3, 3, 4, 4}));
}

TEST_F(RepeatTest, InvalidArguments) {
  EXPECT_THROW(repeat(of({1}), 1), std::invalid_argument);
  EXPECT_THROW(repeat(iota(0), 2), std::invalid_argument);
  EXPECT_THROW(repeat(seq<int>{}, 2), std::invalid_argument);
}
