
#include <sstream>
#include <gtest/gtest.h>
#include "potentials.h"
#include "sentences.h"
#include "errors.h"

namespace semichart {

namespace {

// every split of every cell numbered by (level, pos, idx), offset by `base`
SplitPotentials Numbered(unsigned length, float base) {
  SplitPotentials res(length, 1);
  for (unsigned level = 1; level < length; level++)
    for (unsigned pos = 0; pos < length - level; pos++)
      for (unsigned idx = 0; idx < level; idx++)
        res.Set(level, pos, idx, 0, base + 100 * level + 10 * pos + idx);
  return res;
}

}  // namespace

TEST(SplitPotentialsTest, CellsAreIndependent) {
  SplitPotentials p = Numbered(4, 0.0);
  EXPECT_EQ(4u, p.Length());
  EXPECT_EQ(1u, p.BatchSize());
  EXPECT_EQ(3u, p.NumSplits(3));
  EXPECT_FLOAT_EQ(100.0, p.Get(1, 0, 0, 0));
  EXPECT_FLOAT_EQ(211.0, p.Get(2, 1, 1, 0));
  EXPECT_FLOAT_EQ(302.0, p.Get(3, 0, 2, 0));
}

TEST(SplitPotentialsTest, BatchVectors) {
  SplitPotentials p(3, 4, 0.5);
  float* values = p(2, 0, 1);
  values[3] = 2.0;
  EXPECT_FLOAT_EQ(2.0, p.Get(2, 0, 1, 3));
  EXPECT_FLOAT_EQ(0.5, p.Get(2, 0, 1, 2));
  EXPECT_FLOAT_EQ(0.5, p.Get(2, 0, 0, 3));
}

TEST(SplitPotentialsTest, StackAndSelect) {
  SplitPotentials stacked = SplitPotentials::Stack(
      {Numbered(3, 0.0), Numbered(3, 1000.0), Numbered(3, 2000.0)});
  EXPECT_EQ(3u, stacked.BatchSize());
  EXPECT_FLOAT_EQ(201.0, stacked.Get(2, 0, 1, 0));
  EXPECT_FLOAT_EQ(1201.0, stacked.Get(2, 0, 1, 1));
  EXPECT_FLOAT_EQ(2110.0, stacked.Get(1, 1, 0, 2));

  SplitPotentials selected = stacked.Select({2, 0});
  EXPECT_EQ(2u, selected.BatchSize());
  EXPECT_FLOAT_EQ(2201.0, selected.Get(2, 0, 1, 0));
  EXPECT_FLOAT_EQ(201.0, selected.Get(2, 0, 1, 1));

  EXPECT_THROW(stacked.Select({3}), DimensionMismatch);
  EXPECT_THROW(SplitPotentials::Stack({Numbered(3, 0.0), Numbered(4, 0.0)}),
               DimensionMismatch);
}

TEST(SplitPotentialsTest, Shape) {
  SplitPotentials p(5, 2);
  EXPECT_NO_THROW(p.CheckShape(5, 2));
  EXPECT_THROW(p.CheckShape(4, 2), DimensionMismatch);
  EXPECT_THROW(p.CheckShape(5, 3), DimensionMismatch);
  EXPECT_THROW(SplitPotentials(0, 2), DimensionMismatch);
  EXPECT_THROW(SplitPotentials(3, 0), DimensionMismatch);
}

TEST(SplitPotentialsTest, PrintsEverySplit) {
  SplitPotentials p(3, 2);
  p.Set(2, 0, 1, 1, 1.5);
  std::stringstream out;
  out << p;
  EXPECT_EQ("(0, 2): [0, 0]\n"
            "(1, 2): [0, 0]\n"
            "(0, 3): [0, 0] [0, 1.5]\n", out.str());
}

TEST(SentencesTest, RowsOfEqualLength) {
  Sentences sentences({{1, 2, 3}, {4, 5, 6}});
  EXPECT_EQ(2u, sentences.BatchSize());
  EXPECT_EQ(3u, sentences.Length());

  Sentences selected = sentences.Select({1});
  EXPECT_EQ(1u, selected.BatchSize());
  EXPECT_EQ(std::vector<int>({4, 5, 6}), selected.Row(0));

  EXPECT_THROW(Sentences({{1, 2}, {3}}), DimensionMismatch);
  EXPECT_THROW(Sentences(std::vector<std::vector<int>>()), DimensionMismatch);
  EXPECT_THROW(sentences.Select({2}), DimensionMismatch);
}

}  // namespace semichart
