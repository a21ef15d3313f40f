
#include <gtest/gtest.h>
#include "loss.h"
#include "errors.h"

namespace semichart {

class LossTest : public ::testing::Test {
 protected:
  LossTest()
      : sentences_({{3, 1, 4, 1}}), potentials_(4, 1) {
    config_.num_threads = 1;
    potentials_.Set(1, 0, 0, 0, -1.0);  // (0, 2)
    potentials_.Set(3, 0, 0, 0, 2.0);   // root split after the first token
  }

  BatchSpans MaxSpans(const ChartEngine& engine) {
    return {engine.Fill(potentials_).GetChosenSpans(0)};
  }

  ChartConfig config_;
  Sentences sentences_;
  SplitPotentials potentials_;
};

TEST_F(LossTest, MaximalTree) {
  ChartEngine engine(config_);
  EXPECT_FLOAT_EQ(6.0, engine.BestScore(sentences_, potentials_)[0]);
  EXPECT_EQ(SpanList({Span(2, 2), Span(1, 3), Span(0, 4)}), MaxSpans(engine)[0]);
}

TEST_F(LossTest, TreeMargin) {
  ChartEngine engine(config_);
  SemiSupervisedLoss loss(engine, 1.0, RightBranching);
  TreeMarginResult res = loss.TreeMargin(
      sentences_, potentials_, {{Span(0, 3)}}, MaxSpans(engine));
  // the gold chain (1, 2), (0, 3) forces the left child of the root
  EXPECT_FLOAT_EQ(6.0, res.max_scores[0]);
  EXPECT_FLOAT_EQ(4.0, res.gold_scores[0]);
  EXPECT_FLOAT_EQ(3.0, res.loss);
}

TEST_F(LossTest, TreeMarginWithLeftChains) {
  ChartEngine engine(config_);
  SemiSupervisedLoss loss(engine, 0.5, LeftBranching);
  TreeMarginResult res = loss.TreeMargin(
      sentences_, potentials_, {{Span(0, 3)}}, MaxSpans(engine));
  // (0, 2), (0, 3) pays for the penalized first pair
  EXPECT_FLOAT_EQ(3.0, res.gold_scores[0]);
  EXPECT_FLOAT_EQ(3.5, res.loss);
}

TEST_F(LossTest, SpanMargin) {
  ChartEngine engine(config_);
  SemiSupervisedLoss loss(engine);
  SpanMarginResult res = loss.SpanMargin(
      sentences_, potentials_, {{Span(0, 2)}}, MaxSpans(engine));

  ASSERT_EQ(1u, res.terms.size());
  ASSERT_EQ(1u, res.terms[0].size());
  const SpanMarginTerm& term = res.terms[0][0];
  EXPECT_EQ(Span(0, 2), term.target);
  EXPECT_EQ(Span(0, 4), term.root);
  EXPECT_FALSE(term.Skipped());
  EXPECT_FLOAT_EQ(1.0, term.gold_score);
  EXPECT_FLOAT_EQ(6.0, term.max_score);
  EXPECT_FLOAT_EQ(6.0, res.loss);
}

TEST_F(LossTest, PredictedSpansAddNothing) {
  ChartEngine engine(config_);
  SemiSupervisedLoss loss(engine);
  SpanMarginResult res = loss.SpanMargin(
      sentences_, potentials_, {{Span(2, 2)}}, MaxSpans(engine));
  ASSERT_EQ(1u, res.terms[0].size());
  EXPECT_TRUE(res.terms[0][0].Skipped());
  EXPECT_FLOAT_EQ(0.0, res.loss);
}

TEST_F(LossTest, RejectsMismatchedBatches) {
  ChartEngine engine(config_);
  SemiSupervisedLoss loss(engine);
  EXPECT_THROW(loss.SpanMargin(sentences_, potentials_, {{Span(0, 2)}, {}},
                               MaxSpans(engine)),
               DimensionMismatch);
  EXPECT_THROW(loss.SpanMargin(sentences_, potentials_, {{Span(3, 2)}},
                               MaxSpans(engine)),
               DimensionMismatch);
  EXPECT_THROW(loss.TreeMargin(sentences_, potentials_, {{Span(3, 2)}},
                               MaxSpans(engine)),
               DimensionMismatch);
  EXPECT_THROW(loss.TreeMargin(sentences_, potentials_, {{}, {}},
                               MaxSpans(engine)),
               DimensionMismatch);
}

TEST(SelectAnnotatedTest, KeepsAnnotatedIndices) {
  BatchSpans spans = {{Span(0, 2)}, {}, {Span(1, 2), Span(0, 3)}, {}};
  EXPECT_EQ(std::vector<unsigned>({0, 2}), SelectAnnotated(spans));
  EXPECT_TRUE(SelectAnnotated({{}, {}}).empty());
}

}  // namespace semichart
