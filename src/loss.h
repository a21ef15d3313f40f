
#ifndef INCLUDE_LOSS_H_
#define INCLUDE_LOSS_H_

#include <vector>
#include "span.h"
#include "chart.h"
#include "canonical.h"
#include "sentences.h"
#include "potentials.h"

namespace semichart {

struct TreeMarginResult
{
    float loss;
    std::vector<float> gold_scores;
    std::vector<float> max_scores;
};

// one annotated span compared against its closest predicted ancestor
struct SpanMarginTerm
{
    SpanMarginTerm(const Span& target, const Span& root)
    : target(target), root(root), gold_score(0.0), max_score(0.0) {}

    // the annotated span already is a predicted constituent
    bool Skipped() const { return target == root; }

    Span target;
    Span root;
    float gold_score;
    float max_score;
};

struct SpanMarginResult
{
    float loss;
    std::vector<std::vector<SpanMarginTerm>> terms;
};

// Margin between the predicted maximal tree and trees built from span
// annotations, computed on the chart of one batch.
class SemiSupervisedLoss
{
public:
    SemiSupervisedLoss(const ChartEngine& engine, float margin=1.0,
                       Branching branching=RightBranching)
    : engine_(engine), margin_(margin), branching_(branching) {}

    // whole trees: sum_b(max_b - gold_b + margin) / batch_size, where the gold
    // tree is the canonical chains of `gold_spans` and the max tree is
    // `max_spans`, both scored with overriding constraints.
    TreeMarginResult TreeMargin(const Sentences& sentences,
                                const SplitPotentials& potentials,
                                const BatchSpans& gold_spans,
                                const BatchSpans& max_spans) const;

    // per annotated span: the gold chain scored at the span against the
    // predicted subtree scored at its closest predicted ancestor, both with
    // forced constraints. Spans that are predicted constituents add nothing.
    SpanMarginResult SpanMargin(const Sentences& sentences,
                                const SplitPotentials& potentials,
                                const BatchSpans& gold_spans,
                                const BatchSpans& max_spans) const;

private:
    const ChartEngine& engine_;
    float margin_;
    Branching branching_;
};

// batch elements carrying at least one annotated span
std::vector<unsigned> SelectAnnotated(const BatchSpans& spans);

} // namespace semichart

#endif
