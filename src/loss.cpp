
#include <sstream>
#include "loss.h"
#include "ancestor.h"
#include "errors.h"

namespace semichart {

TreeMarginResult SemiSupervisedLoss::TreeMargin(const Sentences& sentences,
        const SplitPotentials& potentials, const BatchSpans& gold_spans,
        const BatchSpans& max_spans) const {
    TreeMarginResult res;
    res.gold_scores = engine_.ScoreForSpans(
            sentences, potentials, MakeTree(gold_spans, branching_));
    res.max_scores = engine_.ScoreForSpans(sentences, potentials, max_spans);

    float total = 0.0;
    for (unsigned b = 0; b < sentences.BatchSize(); b++)
        total += res.max_scores[b] - res.gold_scores[b] + margin_;
    res.loss = total / sentences.BatchSize();
    return res;
}

SpanMarginResult SemiSupervisedLoss::SpanMargin(const Sentences& sentences,
        const SplitPotentials& potentials, const BatchSpans& gold_spans,
        const BatchSpans& max_spans) const {
    unsigned batch_size = sentences.BatchSize();
    if (gold_spans.size() != batch_size) {
        std::stringstream msg;
        msg << gold_spans.size() << " annotated span lists for a batch of " << batch_size;
        throw DimensionMismatch(msg.str());
    }
    CheckSpans(gold_spans, batch_size, sentences.Length(), "annotated span");
    CheckSpans(max_spans, batch_size, sentences.Length(), "maximal span");
    ClosestParents parents = FindClosestParent(max_spans, gold_spans);

    SpanMarginResult res;
    res.terms.resize(batch_size);
    BatchSpans gold_roots(batch_size), max_roots(batch_size);
    for (unsigned b = 0; b < batch_size; b++) {
        for (unsigned i = 0; i < gold_spans[b].size(); i++) {
            SpanMarginTerm term(gold_spans[b][i], parents.roots[b][i]);
            if (! term.Skipped()) {
                gold_roots[b].push_back(term.target);
                max_roots[b].push_back(term.root);
            }
            res.terms[b].push_back(term);
        }
    }

    auto gold_scores = engine_.ScoreForRoots(sentences, potentials,
            MakeTree(gold_spans, branching_), gold_roots, Forced);
    auto max_scores = engine_.ScoreForRoots(sentences, potentials,
            parents.children, max_roots, Forced);

    float total = 0.0;
    for (unsigned b = 0; b < batch_size; b++) {
        unsigned k = 0;
        for (auto&& term: res.terms[b]) {
            if (term.Skipped())
                continue;
            term.gold_score = gold_scores[b][k];
            term.max_score = max_scores[b][k];
            total += term.max_score - term.gold_score + margin_;
            k++;
        }
    }
    res.loss = total / batch_size;
    return res;
}

std::vector<unsigned> SelectAnnotated(const BatchSpans& spans) {
    std::vector<unsigned> res;
    for (unsigned i = 0; i < spans.size(); i++)
        if (! spans[i].empty())
            res.push_back(i);
    return res;
}

} // namespace semichart
