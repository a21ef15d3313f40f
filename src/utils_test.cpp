
#include <gtest/gtest.h>
#include "utils.h"

namespace semichart {
namespace utils {

TEST(UtilsTest, ArgMaxTakesFirstMaximum) {
  float values[] = {1.0, 3.0, 2.0, 3.0};
  EXPECT_EQ(1, ArgMax(values, values + 4));
  EXPECT_EQ(0, ArgMax(values, values + 1));
  EXPECT_EQ(-1, ArgMax(values, values));

  float negative[] = {-5.0, -1.0, -1.0};
  EXPECT_EQ(1, ArgMax(negative, negative + 3));
}

TEST(UtilsTest, Trim) {
  EXPECT_EQ("a b", trim("  a b\t\n"));
  EXPECT_EQ("", trim(" \r\n"));
}

}  // namespace utils
}  // namespace semichart
