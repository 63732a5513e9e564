#include "zipline/raw-chars.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string_view>
#include <utility>

namespace zipline {

TEST(RawCharsTest, DefaultConstructor) {
  RawChars buf;
  EXPECT_EQ(buf.size(), 0);
  EXPECT_TRUE(buf.empty());
  EXPECT_EQ(buf.data(), nullptr);
  EXPECT_EQ(buf.availableCapacity(), 0);
}

TEST(RawCharsTest, CapacityConstructor) {
  RawChars buf(16);
  EXPECT_TRUE(buf.empty());
  EXPECT_EQ(buf.capacity(), 16U);
  EXPECT_EQ(buf.availableCapacity(), 16U);
}

TEST(RawCharsTest, AppendAndView) {
  RawChars buf;
  buf.append("hello");
  buf.append(" ");
  buf.append("world");
  EXPECT_EQ(std::string_view(buf), "hello world");
  EXPECT_GE(buf.capacity(), buf.size());
}

TEST(RawCharsTest, EnsureAvailableCapacityThenCommit) {
  RawChars buf("ab");
  buf.ensureAvailableCapacity(3);
  ASSERT_GE(buf.availableCapacity(), 3U);
  buf.data()[2] = 'c';
  buf.data()[3] = 'd';
  buf.addSize(2);
  EXPECT_EQ(std::string_view(buf), "abcd");
}

TEST(RawCharsTest, ExponentialGrowth) {
  RawChars buf(8);
  buf.append("12345678");
  buf.ensureAvailableCapacityExponential(1);
  EXPECT_GE(buf.capacity(), 16U);
}

TEST(RawCharsTest, SetSizeBeyondCapacityThrows) {
  RawChars buf(4);
  EXPECT_THROW(buf.setSize(5), std::out_of_range);
  EXPECT_NO_THROW(buf.setSize(4));
}

TEST(RawCharsTest, CopyAndMove) {
  RawChars buf("payload");
  RawChars copy(buf);
  EXPECT_EQ(copy, buf);

  RawChars moved(std::move(copy));
  EXPECT_EQ(std::string_view(moved), "payload");
  EXPECT_TRUE(copy.empty());  // NOLINT(bugprone-use-after-move)

  RawChars assigned;
  assigned = buf;
  EXPECT_EQ(assigned, buf);

  RawChars moveAssigned;
  moveAssigned = std::move(assigned);
  EXPECT_EQ(std::string_view(moveAssigned), "payload");
}

TEST(RawCharsTest, ClearKeepsCapacity) {
  RawChars buf("some data");
  const auto capacity = buf.capacity();
  buf.clear();
  EXPECT_TRUE(buf.empty());
  EXPECT_EQ(buf.capacity(), capacity);
}

}  // namespace zipline
