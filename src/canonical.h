
#ifndef INCLUDE_CANONICAL_H_
#define INCLUDE_CANONICAL_H_

#include <string>
#include "span.h"
#include "tree.h"

namespace semichart {

enum Branching { LeftBranching, RightBranching };

Branching ParseBranching(const std::string& name);

// (start, 2), (start, 3), ..., (start, length)
SpanList MakeLeftChain(const Span& span);

// (end - 1, 2), (end - 2, 3), ..., (start, length)
SpanList MakeRightChain(const Span& span);

SpanList MakeChain(const Span& span, Branching branching);

// chains of every annotated span, concatenated per batch element.
// the result is used directly as the constraint sets of the chart.
BatchSpans MakeLeftTree(const BatchSpans& spans);
BatchSpans MakeRightTree(const BatchSpans& spans);
BatchSpans MakeTree(const BatchSpans& spans, Branching branching);

// the tree over `length` placeholder leaves whose spans form the chain
Tree MakeLeftTree(unsigned length, const std::string& leaf="x");
Tree MakeRightTree(unsigned length, const std::string& leaf="x");

} // namespace semichart

#endif
