
#include "metrics.h"

namespace semichart {

SpanCounts PrecisionAndRecall(const SpanList& gold, const SpanList& predicted) {
    SpanSet gold_spans = ToSpanSet(gold);
    SpanSet predicted_spans = ToSpanSet(predicted);
    unsigned prec = 0, recall = 0;
    for (auto&& span: predicted_spans)
        if (gold_spans.count(span) > 0)
            prec++;
    for (auto&& span: gold_spans)
        if (predicted_spans.count(span) > 0)
            recall++;
    return SpanCounts(prec, recall, gold_spans.size());
}

SpanCounts SpanEvaluator::Add(const SpanList& gold, const SpanList& predicted) {
    SpanCounts res = PrecisionAndRecall(gold, predicted);
    matched_in_predicted_ += res.matched_in_predicted;
    matched_in_gold_ += res.matched_in_gold;
    gold_count_ += res.gold_count;
    predicted_count_ += ToSpanSet(predicted).size();
    num_examples_++;
    return res;
}

double SpanEvaluator::Precision() const {
    if (predicted_count_ == 0) return 0.0;
    return static_cast<double>(matched_in_predicted_) / predicted_count_;
}

double SpanEvaluator::Recall() const {
    if (gold_count_ == 0) return 0.0;
    return static_cast<double>(matched_in_gold_) / gold_count_;
}

double SpanEvaluator::F1() const {
    double p = Precision(), r = Recall();
    if (p + r == 0.0) return 0.0;
    return 2 * p * r / (p + r);
}

std::ostream& operator<<(std::ostream& out, const SpanEvaluator& eval) {
    out << "examples: " << eval.num_examples_ << std::endl
        << "matched: " << eval.matched_in_predicted_ << " / " << eval.predicted_count_
        << " predicted, " << eval.matched_in_gold_ << " / " << eval.gold_count_
        << " gold" << std::endl
        << "precision: " << eval.Precision() << std::endl
        << "recall: " << eval.Recall() << std::endl
        << "f1: " << eval.F1() << std::endl;
    return out;
}

} // namespace semichart
