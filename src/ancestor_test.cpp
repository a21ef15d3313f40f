
#include <gtest/gtest.h>
#include "ancestor.h"
#include "errors.h"

namespace semichart {

class AncestorTest : public ::testing::Test {
 protected:
  // ( ( a b ) ( c d ) )
  SpanList tree_spans_ = {Span(0, 2), Span(2, 2), Span(0, 4)};
};

TEST_F(AncestorTest, ExactMatchIsItsOwnParent) {
  Ancestor parent = FindParent(tree_spans_, Span(0, 2));
  EXPECT_EQ(Span(0, 2), parent.root);
  EXPECT_EQ(SpanList({Span(0, 2)}), parent.children);
}

TEST_F(AncestorTest, SmallestCoveringSpan) {
  Ancestor parent = FindParent(tree_spans_, Span(1, 2));
  EXPECT_EQ(Span(0, 4), parent.root);
  EXPECT_EQ(tree_spans_, parent.children);

  parent = FindParent(tree_spans_, Span(1, 1));
  EXPECT_EQ(Span(0, 2), parent.root);
  EXPECT_EQ(SpanList({Span(0, 2)}), parent.children);

  parent = FindParent(tree_spans_, Span(2, 1));
  EXPECT_EQ(Span(2, 2), parent.root);
  EXPECT_EQ(SpanList({Span(2, 2)}), parent.children);
}

TEST_F(AncestorTest, NothingEncloses) {
  EXPECT_THROW(FindParent(tree_spans_, Span(3, 2)), NoEnclosingConstituent);
  EXPECT_THROW(FindParent(SpanList(), Span(0, 2)), NoEnclosingConstituent);
}

TEST_F(AncestorTest, DuplicatesAreIgnored) {
  SpanList spans = tree_spans_;
  spans.push_back(Span(0, 2));
  Ancestor parent = FindParent(spans, Span(1, 2));
  EXPECT_EQ(Span(0, 4), parent.root);
  EXPECT_EQ(3u, parent.children.size());
}

TEST_F(AncestorTest, ClosestParentPerBatch) {
  BatchSpans predicted = {tree_spans_, {Span(1, 2), Span(0, 3)}};
  BatchSpans targets = {{Span(0, 2), Span(1, 2)}, {Span(0, 2)}};
  ClosestParents parents = FindClosestParent(predicted, targets);

  ASSERT_EQ(2u, parents.roots.size());
  EXPECT_EQ(SpanList({Span(0, 2), Span(0, 4)}), parents.roots[0]);
  EXPECT_EQ(SpanList({Span(0, 3)}), parents.roots[1]);
  EXPECT_EQ(4u, parents.children[0].size());
  EXPECT_EQ(SpanList({Span(1, 2), Span(0, 3)}), parents.children[1]);

  EXPECT_THROW(FindClosestParent(predicted, {{Span(0, 2)}}), DimensionMismatch);
}

}  // namespace semichart
