
#include <gtest/gtest.h>
#include "tree.h"
#include "errors.h"

namespace semichart {

TEST(TreeTest, JoinAndWrite) {
  Tree tree = Tree::Join(Tree::Join(Tree::Leaf("a"), Tree::Leaf("b")),
                         Tree::Leaf("c"));
  EXPECT_EQ("( ( a b ) c )", tree.ToStr());
  EXPECT_EQ(3u, tree.NumLeaves());
  EXPECT_EQ(std::vector<std::string>({"a", "b", "c"}), tree.GetLeaves());
  EXPECT_FALSE(tree.IsLeaf());
  EXPECT_TRUE(Tree::Leaf("a").IsLeaf());
}

TEST(TreeTest, TextToTreeRoundTrip) {
  const std::string text = "( ( a b ) ( c ( d e ) ) )";
  Tree tree = TextToTree(text);
  EXPECT_EQ(text, tree.ToStr());
  EXPECT_EQ(5u, tree.NumLeaves());
}

TEST(TreeTest, TextToTreeAllowsWideNodes) {
  Tree tree = TextToTree("( a b c )");
  EXPECT_EQ(3u, tree.GetChildren(tree.Root()).size());
  SpanList spans = TreeToSpans(tree);
  ASSERT_EQ(1u, spans.size());
  EXPECT_EQ(Span(0, 3), spans[0]);
}

TEST(TreeTest, TextToTreeSingleLeaf) {
  Tree tree = TextToTree("a");
  EXPECT_TRUE(tree.IsLeaf());
  EXPECT_TRUE(TreeToSpans(tree).empty());
}

TEST(TreeTest, TextToTreeRejectsMalformedInput) {
  EXPECT_THROW(TextToTree("( a b"), MalformedTree);
  EXPECT_THROW(TextToTree("a b )"), MalformedTree);
  EXPECT_THROW(TextToTree("( )"), MalformedTree);
  EXPECT_THROW(TextToTree("   "), MalformedTree);
  EXPECT_THROW(TextToTree("( a b ) c"), MalformedTree);
}

TEST(TreeTest, TreeToSpansIsPostOrder) {
  Tree tree = TextToTree("( ( a b ) ( c d ) )");
  SpanList spans = TreeToSpans(tree);
  ASSERT_EQ(3u, spans.size());
  EXPECT_EQ(Span(0, 2), spans[0]);
  EXPECT_EQ(Span(2, 2), spans[1]);
  EXPECT_EQ(Span(0, 4), spans[2]);
}

TEST(TreeTest, TreeToSpansWithOffset) {
  SpanList spans = TreeToSpans(TextToTree("( a ( b c ) )"), 3);
  ASSERT_EQ(2u, spans.size());
  EXPECT_EQ(Span(4, 2), spans[0]);
  EXPECT_EQ(Span(3, 3), spans[1]);
}

TEST(TreeTest, ReplaceLeaves) {
  Tree tree = TextToTree("( ( 0 1 ) 2 )");
  Tree replaced = ReplaceLeaves(tree, {"the", "big", "dog"});
  EXPECT_EQ("( ( the big ) dog )", replaced.ToStr());
  EXPECT_EQ(TreeToSpans(tree), TreeToSpans(replaced));
  EXPECT_THROW(ReplaceLeaves(tree, {"the", "dog"}), DimensionMismatch);
}

}  // namespace semichart
