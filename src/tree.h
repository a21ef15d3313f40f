
#ifndef INCLUDE_TREE_H_
#define INCLUDE_TREE_H_

#include <string>
#include <vector>
#include <iostream>
#include "span.h"

namespace semichart {

// An ordered tree stored as an arena of nodes. Internal nodes hold indices
// of their children in `nodes_`; leaves hold an opaque token. Trees coming
// out of the chart are binary, bracket text may give wider nodes.
class Tree
{
public:
    Tree(): root_(0) {}

    static Tree Leaf(const std::string& word);
    static Tree Join(const Tree& left, const Tree& right);
    static Tree Join(const std::vector<Tree>& children);

    bool IsEmpty() const { return nodes_.empty(); }
    unsigned Root() const { return root_; }
    bool IsLeaf(unsigned node) const { return nodes_[node].leaf; }
    bool IsLeaf() const { return IsLeaf(root_); }
    const std::string& GetWord(unsigned node) const { return nodes_[node].word; }
    const std::vector<unsigned>& GetChildren(unsigned node) const {
        return nodes_[node].children;
    }

    unsigned NumLeaves() const;
    std::vector<std::string> GetLeaves() const;

    // bracket notation, "( ( a b ) c )"
    const std::string ToStr() const;

    friend std::ostream& operator<<(std::ostream& ost, const Tree& tree) {
        ost << tree.ToStr();
        return ost;
    }

private:
    struct TreeNode
    {
        TreeNode(const std::string& word)
        : leaf(true), word(word) {}
        TreeNode(const std::vector<unsigned>& children)
        : leaf(false), children(children) {}

        bool leaf;
        std::string word;
        std::vector<unsigned> children;
    };

    // copies the nodes of `other` into this arena, returning its new root
    unsigned Append(const Tree& other);

    void Write(unsigned node, std::ostream& out) const;
    void CollectLeaves(unsigned node, std::vector<std::string>& out) const;

    std::vector<TreeNode> nodes_;
    unsigned root_;
};

// post-order spans of every internal node, offset by `start`
SpanList TreeToSpans(const Tree& tree, unsigned start=0);

// parses space separated bracket notation; throws MalformedTree
Tree TextToTree(const std::string& text);

Tree ReplaceLeaves(const Tree& tree, const std::vector<std::string>& words);

} // namespace semichart

#endif
