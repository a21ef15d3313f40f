
#include <stdexcept>
#include "canonical.h"

namespace semichart {

Branching ParseBranching(const std::string& name) {
    if (name == "left")
        return LeftBranching;
    if (name == "right")
        return RightBranching;
    throw std::runtime_error("unknown branching: " + name);
}

SpanList MakeLeftChain(const Span& span) {
    SpanList res;
    for (unsigned size = 2; size <= span.length; size++)
        res.emplace_back(span.start, size);
    return res;
}

SpanList MakeRightChain(const Span& span) {
    SpanList res;
    unsigned end = span.Last();
    for (unsigned i = 1; i < span.length; i++)
        res.emplace_back(end - i, i + 1);
    return res;
}

SpanList MakeChain(const Span& span, Branching branching) {
    return branching == LeftBranching ?
        MakeLeftChain(span) : MakeRightChain(span);
}

BatchSpans MakeTree(const BatchSpans& spans, Branching branching) {
    BatchSpans res;
    for (auto&& spans_in_sent: spans) {
        SpanList tmp;
        for (auto&& span: spans_in_sent) {
            SpanList chain = MakeChain(span, branching);
            tmp.insert(tmp.end(), chain.begin(), chain.end());
        }
        res.push_back(tmp);
    }
    return res;
}

BatchSpans MakeLeftTree(const BatchSpans& spans) {
    return MakeTree(spans, LeftBranching);
}

BatchSpans MakeRightTree(const BatchSpans& spans) {
    return MakeTree(spans, RightBranching);
}

Tree MakeLeftTree(unsigned length, const std::string& leaf) {
    if (length == 0)
        throw std::runtime_error("MakeLeftTree: empty span");
    Tree res = Tree::Leaf(leaf);
    for (unsigned i = 1; i < length; i++)
        res = Tree::Join(res, Tree::Leaf(leaf));
    return res;
}

Tree MakeRightTree(unsigned length, const std::string& leaf) {
    if (length == 0)
        throw std::runtime_error("MakeRightTree: empty span");
    Tree res = Tree::Leaf(leaf);
    for (unsigned i = 1; i < length; i++)
        res = Tree::Join(Tree::Leaf(leaf), res);
    return res;
}

} // namespace semichart
