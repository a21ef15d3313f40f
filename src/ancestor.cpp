
#include <sstream>
#include "ancestor.h"
#include "errors.h"

namespace semichart {

Ancestor FindParent(const SpanList& tree_spans, const Span& target) {
    SpanList spans = Unique(tree_spans);
    for (auto&& span: spans)
        if (span == target)
            return Ancestor(target, SpanList({target}));

    const Span* root = nullptr;
    for (auto&& span: spans) {
        if (! span.Covers(target))
            continue;
        if (root == nullptr ||
                span.length < root->length ||
                (span.length == root->length && span.start < root->start))
            root = &span;
    }
    if (root == nullptr) {
        std::stringstream msg;
        msg << "no enclosing constituent found for " << target
            << " in " << spans;
        throw NoEnclosingConstituent(msg.str());
    }

    SpanList children;
    for (auto&& span: spans)
        if (span.start >= root->start && span.End() <= root->End())
            children.push_back(span);
    return Ancestor(*root, children);
}

ClosestParents FindClosestParent(const BatchSpans& predicted,
                                 const BatchSpans& targets) {
    if (predicted.size() != targets.size()) {
        std::stringstream msg;
        msg << "FindClosestParent: " << predicted.size()
            << " predicted span lists for " << targets.size() << " targets";
        throw DimensionMismatch(msg.str());
    }
    ClosestParents res;
    for (unsigned i = 0; i < targets.size(); i++) {
        SpanList roots, children;
        for (auto&& target: targets[i]) {
            Ancestor parent = FindParent(predicted[i], target);
            roots.push_back(parent.root);
            children.insert(children.end(),
                    parent.children.begin(), parent.children.end());
        }
        res.roots.push_back(roots);
        res.children.push_back(children);
    }
    return res;
}

} // namespace semichart
