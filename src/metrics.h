
#ifndef INCLUDE_METRICS_H_
#define INCLUDE_METRICS_H_

#include <iostream>
#include "span.h"

namespace semichart {

struct SpanCounts
{
    SpanCounts(unsigned matched_in_predicted, unsigned matched_in_gold, unsigned gold_count)
    : matched_in_predicted(matched_in_predicted),
      matched_in_gold(matched_in_gold), gold_count(gold_count) {}

    unsigned matched_in_predicted;
    unsigned matched_in_gold;
    unsigned gold_count;
};

// unlabeled span matches; both lists are treated as sets
SpanCounts PrecisionAndRecall(const SpanList& gold, const SpanList& predicted);

// accumulates span matches over a corpus
class SpanEvaluator
{
public:
    SpanEvaluator()
    : matched_in_predicted_(0), matched_in_gold_(0),
      gold_count_(0), predicted_count_(0), num_examples_(0) {}

    SpanCounts Add(const SpanList& gold, const SpanList& predicted);

    unsigned NumExamples() const { return num_examples_; }
    unsigned GoldCount() const { return gold_count_; }
    unsigned PredictedCount() const { return predicted_count_; }

    double Precision() const;
    double Recall() const;
    double F1() const;

    friend std::ostream& operator<<(std::ostream& out, const SpanEvaluator& eval);

private:
    unsigned matched_in_predicted_;
    unsigned matched_in_gold_;
    unsigned gold_count_;
    unsigned predicted_count_;
    unsigned num_examples_;
};

} // namespace semichart

#endif
