
#include <sstream>
#include "tree.h"
#include "errors.h"

namespace semichart {

Tree Tree::Leaf(const std::string& word) {
    Tree res;
    res.nodes_.emplace_back(word);
    res.root_ = 0;
    return res;
}

Tree Tree::Join(const Tree& left, const Tree& right) {
    return Join(std::vector<Tree>({left, right}));
}

Tree Tree::Join(const std::vector<Tree>& children) {
    Tree res;
    std::vector<unsigned> indices;
    for (auto&& child: children)
        indices.push_back(res.Append(child));
    res.nodes_.emplace_back(indices);
    res.root_ = res.nodes_.size() - 1;
    return res;
}

unsigned Tree::Append(const Tree& other) {
    if (other.IsEmpty())
        throw MalformedTree("cannot attach an empty tree");
    unsigned offset = nodes_.size();
    for (auto&& node: other.nodes_) {
        nodes_.push_back(node);
        for (auto&& child: nodes_.back().children)
            child += offset;
    }
    return other.root_ + offset;
}

unsigned Tree::NumLeaves() const {
    unsigned res = 0;
    for (auto&& node: nodes_)
        if (node.leaf) res++;
    return res;
}

void Tree::CollectLeaves(unsigned node, std::vector<std::string>& out) const {
    if (IsLeaf(node)) {
        out.push_back(GetWord(node));
        return;
    }
    for (unsigned child: GetChildren(node))
        CollectLeaves(child, out);
}

std::vector<std::string> Tree::GetLeaves() const {
    std::vector<std::string> res;
    if (! IsEmpty())
        CollectLeaves(root_, res);
    return res;
}

void Tree::Write(unsigned node, std::ostream& out) const {
    if (IsLeaf(node)) {
        out << GetWord(node);
        return;
    }
    out << "(";
    for (unsigned child: GetChildren(node)) {
        out << " ";
        Write(child, out);
    }
    out << " )";
}

const std::string Tree::ToStr() const {
    std::stringstream res;
    if (! IsEmpty())
        Write(root_, res);
    return res.str();
}

namespace {

unsigned CollectSpans(const Tree& tree, unsigned node, unsigned pos, SpanList& out) {
    if (tree.IsLeaf(node))
        return 1;
    unsigned size = 0;
    for (unsigned child: tree.GetChildren(node))
        size += CollectSpans(tree, child, pos + size, out);
    out.emplace_back(pos, size);
    return size;
}

struct StackItem
{
    StackItem(): open(true) {}
    StackItem(const Tree& tree): open(false), tree(tree) {}

    bool open;
    Tree tree;
};

} // namespace

SpanList TreeToSpans(const Tree& tree, unsigned start) {
    SpanList res;
    if (! tree.IsEmpty())
        CollectSpans(tree, tree.Root(), start, res);
    return res;
}

Tree TextToTree(const std::string& text) {
    std::istringstream in(text);
    std::vector<StackItem> stack;
    std::string token;
    while (in >> token) {
        if (token == "(") {
            stack.emplace_back();
        } else if (token == ")") {
            std::vector<Tree> inside;
            while (! stack.empty() && ! stack.back().open) {
                inside.insert(inside.begin(), stack.back().tree);
                stack.pop_back();
            }
            if (stack.empty())
                throw MalformedTree("unmatched ')' in: " + text);
            if (inside.empty())
                throw MalformedTree("empty constituent in: " + text);
            stack.pop_back();
            stack.emplace_back(Tree::Join(inside));
        } else {
            stack.emplace_back(Tree::Leaf(token));
        }
    }
    if (stack.empty())
        throw MalformedTree("no tree in: \"" + text + "\"");
    for (auto&& item: stack)
        if (item.open)
            throw MalformedTree("unclosed '(' in: " + text);
    if (stack.size() > 1)
        throw MalformedTree("more than one tree in: " + text);
    return stack.back().tree;
}

namespace {

Tree Replace(const Tree& tree, unsigned node,
        const std::vector<std::string>& words, unsigned& pos) {
    if (tree.IsLeaf(node))
        return Tree::Leaf(words[pos++]);
    std::vector<Tree> children;
    for (unsigned child: tree.GetChildren(node))
        children.push_back(Replace(tree, child, words, pos));
    return Tree::Join(children);
}

} // namespace

Tree ReplaceLeaves(const Tree& tree, const std::vector<std::string>& words) {
    if (tree.NumLeaves() != words.size()) {
        std::stringstream msg;
        msg << "tree has " << tree.NumLeaves()
            << " leaves but " << words.size() << " words were given";
        throw DimensionMismatch(msg.str());
    }
    if (tree.IsEmpty())
        return tree;
    unsigned pos = 0;
    return Replace(tree, tree.Root(), words, pos);
}

} // namespace semichart
