#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "seqflow/detail/window_buffer.hpp"

using namespace seqflow::detail;

class WindowBufferTest : public ::testing::Test {
protected:
  void SetUp() override {}
  void TearDown() override {}
};

TEST_F(WindowBufferTest, Construction) {
  window_buffer<int> buf(4);
  EXPECT_TRUE(buf.empty());
  EXPECT_EQ(buf.size(), 0);
  EXPECT_EQ(buf.capacity(), 4);
  EXPECT_EQ(buf.write_cursor(), 0);
  EXPECT_EQ(buf.read_cursor(), 0);
}

TEST_F(WindowBufferTest, PushAndAccess) {
  window_buffer<int> buf(4);
  for (int i = 1; i <= 3; ++i) {
    buf.push(i * 10);
  }
  EXPECT_EQ(buf.size(), 3);
  EXPECT_EQ(buf[0], 10);
  EXPECT_EQ(buf[1], 20);
  EXPECT_EQ(buf[2], 30);
}

TEST_F(WindowBufferTest, PopAdvancesReadCursor) {
  window_buffer<int> buf(4);
  for (int i = 1; i <= 4; ++i) {
    buf.push(i);
  }
  buf.pop(1);
  EXPECT_EQ(buf.size(), 3);
  EXPECT_EQ(buf[0], 2);
  EXPECT_EQ(buf.read_cursor(), 1);

  buf.pop(3);
  EXPECT_TRUE(buf.empty());
  EXPECT_EQ(buf.read_cursor(), 4);
  EXPECT_EQ(buf.write_cursor(), 4);
}

// Cursors keep growing while slots are reused
TEST_F(WindowBufferTest, WrapAround) {
  window_buffer<int> buf(3);
  std::vector<std::vector<int>> windows;
  for (int i = 1; i <= 7; ++i) {
    buf.push(i);
    if (buf.size() == 2) {
      windows.push_back(buf.copy_front(2));
      buf.pop(1);
    }
  }
  EXPECT_EQ(windows, (std::vector<std::vector<int>>{{1, 2}, {2, 3}, {3, 4}, {4, 5}, {5, 6}, {6, 7}}));
  EXPECT_EQ(buf.write_cursor(), 7);
  EXPECT_EQ(buf.read_cursor(), 6);
}

TEST_F(WindowBufferTest, CopyFrontLeavesContents) {
  window_buffer<std::string> buf(3);
  buf.push(std::string("a"));
  buf.push(std::string("b"));
  auto front = buf.copy_front(2);
  EXPECT_EQ(front, (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(buf.size(), 2);
  EXPECT_EQ(buf[1], "b");
}

TEST_F(WindowBufferTest, NonDefaultConstructibleElements) {
  struct no_default {
    explicit no_default(int v) : v(v) {}
    int v;
  };
  window_buffer<no_default> buf(2);
  buf.push(no_default(5));
  EXPECT_EQ(buf[0].v, 5);
  buf.pop(1);
  EXPECT_TRUE(buf.empty());
}
