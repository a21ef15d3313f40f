
#ifndef INCLUDE_ANCESTOR_H_
#define INCLUDE_ANCESTOR_H_

#include <utility>
#include "span.h"

namespace semichart {

struct Ancestor
{
    Ancestor(const Span& root, const SpanList& children)
    : root(root), children(children) {}

    Span root;
    SpanList children;  // predicted constituents inside `root`, root included
};

// Smallest constituent of `tree_spans` covering `target`. When `target` is
// itself a constituent, returns it with itself as the only child. Among
// covers of equal length the one with the smallest start wins.
// Throws NoEnclosingConstituent when nothing covers `target`.
Ancestor FindParent(const SpanList& tree_spans, const Span& target);

struct ClosestParents
{
    BatchSpans roots;
    BatchSpans children;
};

ClosestParents FindClosestParent(const BatchSpans& predicted,
                                 const BatchSpans& targets);

} // namespace semichart

#endif
