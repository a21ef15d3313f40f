
#ifndef INCLUDE_CHART_H_
#define INCLUDE_CHART_H_

#include <vector>
#include <iostream>
#include "span.h"
#include "tree.h"
#include "potentials.h"
#include "sentences.h"
#include "logger.h"

namespace semichart {

// Override: a split satisfying the constraints wins, otherwise the best split.
// Forced: only constraint-satisfying splits count; cells without one fall
//         back to split 0 and are left unresolved.
enum ChartMode { Override, Forced };

extern const float kLeafScore;

struct ChartConfig
{
    ChartConfig(): num_threads(0), strict_roots(true) {}

    int num_threads;    // <= 0: OpenMP default
    bool strict_roots;  // reading an unresolved cell throws UnresolvedRoot
};

// Triangular chart of one scoring call. Cell (level, pos) is the span
// (pos, level + 1) and holds a score, the chosen split and a resolved flag
// for every batch element.
class Chart
{
public:
    Chart(unsigned length, unsigned batch_size);

    unsigned Length() const { return length_; }
    unsigned BatchSize() const { return batch_size_; }

    // batch_size scores of the cell
    const float* operator() (unsigned level, unsigned pos) const {
        return &scores_[Index(level, pos)];
    }

    float GetScore(unsigned level, unsigned pos, unsigned batch) const {
        return scores_[Index(level, pos) + batch];
    }
    int GetSplit(unsigned level, unsigned pos, unsigned batch) const {
        return splits_[Index(level, pos) + batch];
    }
    bool IsResolved(unsigned level, unsigned pos, unsigned batch) const {
        return resolved_[Index(level, pos) + batch] != 0;
    }

    // score of the whole sentence for every batch element
    std::vector<float> RootScore(bool strict=false) const;

    // chart[size - 1][pos] of every requested root, per batch element
    std::vector<std::vector<float>> Scores(const BatchSpans& roots, bool strict=true) const;

    // post-order spans of the tree chosen under `root`
    SpanList GetChosenSpans(unsigned batch, const Span& root) const;
    SpanList GetChosenSpans(unsigned batch) const;

    // the chosen tree of the whole sentence, leaves named by token position
    Tree GetChosenTree(unsigned batch) const;

    friend std::ostream& operator<<(std::ostream& out, const Chart& chart);

private:
    friend class ChartEngine;

    size_t Index(unsigned level, unsigned pos) const {
        return (level * length_ + pos) * batch_size_;
    }

    void Set(unsigned level, unsigned pos, unsigned batch,
            float score, int split, bool resolved) {
        size_t i = Index(level, pos) + batch;
        scores_[i] = score;
        splits_[i] = split;
        resolved_[i] = resolved ? 1 : 0;
    }

    void CheckRoot(unsigned batch, const Span& root, bool strict) const;
    void CollectChosenSpans(unsigned batch, unsigned level, unsigned pos, SpanList& out) const;
    Tree BuildChosenTree(unsigned batch, unsigned level, unsigned pos) const;

    unsigned length_;
    unsigned batch_size_;
    std::vector<float> scores_;
    std::vector<int> splits_;
    std::vector<char> resolved_;
};


// throws DimensionMismatch unless there is one list per batch element and
// every span lies inside a sentence of `length`
void CheckSpans(const BatchSpans& spans, unsigned batch_size,
                unsigned length, const char* what);

class ChartEngine
{
public:
    ChartEngine(const ChartConfig& config=ChartConfig(), LogLevel loglevel=Info)
    : config_(config), loglevel_(loglevel) {}

    // `constraints` holds one span set per batch element, or nothing
    Chart Fill(const SplitPotentials& potentials,
               const BatchSpans& constraints,
               ChartMode mode=Override) const;

    Chart Fill(const SplitPotentials& potentials) const {
        return Fill(potentials, BatchSpans(), Override);
    }

    // score of the best tree, no constraints
    std::vector<float> BestScore(const Sentences& sentences,
                                 const SplitPotentials& potentials) const;

    // root score with `spans` overriding the best split wherever they apply
    std::vector<float> ScoreForSpans(const Sentences& sentences,
                                     const SplitPotentials& potentials,
                                     const BatchSpans& spans) const;

    // scores at several roots per batch element
    std::vector<std::vector<float>> ScoreForRoots(const Sentences& sentences,
                                                  const SplitPotentials& potentials,
                                                  const BatchSpans& spans,
                                                  const BatchSpans& roots,
                                                  ChartMode mode=Forced) const;

private:
    void FillOne(Chart& chart, const SplitPotentials& potentials,
                 const SpanSet& constraints, ChartMode mode, unsigned batch) const;

    ChartConfig config_;
    LogLevel loglevel_;
};

} // namespace semichart

#endif
