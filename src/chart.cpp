
#include <sstream>
#include <string>
#include <exception>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "chart.h"
#include "configure.h"
#include "errors.h"
#include "utils.h"

namespace semichart {

const float kLeafScore = 1.0;

Chart::Chart(unsigned length, unsigned batch_size)
    : length_(length), batch_size_(batch_size),
      scores_(length * length * batch_size, 0.0),
      splits_(length * length * batch_size, -1),
      resolved_(length * length * batch_size, 0) {
    for (unsigned pos = 0; pos < length; pos++)
        for (unsigned b = 0; b < batch_size; b++)
            Set(0, pos, b, kLeafScore, -1, true);
}

void Chart::CheckRoot(unsigned batch, const Span& root, bool strict) const {
    if (root.length == 0 || root.End() > length_) {
        std::stringstream msg;
        msg << "root " << root << " of batch element " << batch
            << " is outside a sentence of length " << length_;
        throw DimensionMismatch(msg.str());
    }
    if (strict && ! IsResolved(root.length - 1, root.start, batch)) {
        std::stringstream msg;
        msg << "no forced split decides root " << root
            << " of batch element " << batch;
        throw UnresolvedRoot(msg.str());
    }
}

std::vector<float> Chart::RootScore(bool strict) const {
    for (unsigned b = 0; b < batch_size_; b++)
        CheckRoot(b, Span(0, length_), strict);
    const float* root = (*this)(length_ - 1, 0);
    return std::vector<float>(root, root + batch_size_);
}

std::vector<std::vector<float>> Chart::Scores(const BatchSpans& roots, bool strict) const {
    if (roots.size() != batch_size_) {
        std::stringstream msg;
        msg << roots.size() << " root lists for a batch of " << batch_size_;
        throw DimensionMismatch(msg.str());
    }
    std::vector<std::vector<float>> res(batch_size_);
    for (unsigned b = 0; b < batch_size_; b++) {
        for (auto&& root: roots[b]) {
            CheckRoot(b, root, strict);
            res[b].push_back(GetScore(root.length - 1, root.start, b));
        }
    }
    return res;
}

void Chart::CollectChosenSpans(unsigned batch, unsigned level,
        unsigned pos, SpanList& out) const {
    if (level == 0)
        return;
    int idx = GetSplit(level, pos, batch);
    CollectChosenSpans(batch, idx, pos, out);
    CollectChosenSpans(batch, level - idx - 1, pos + idx + 1, out);
    out.emplace_back(pos, level + 1);
}

SpanList Chart::GetChosenSpans(unsigned batch, const Span& root) const {
    CheckRoot(batch, root, false);
    SpanList res;
    CollectChosenSpans(batch, root.length - 1, root.start, res);
    return res;
}

SpanList Chart::GetChosenSpans(unsigned batch) const {
    return GetChosenSpans(batch, Span(0, length_));
}

Tree Chart::BuildChosenTree(unsigned batch, unsigned level, unsigned pos) const {
    if (level == 0)
        return Tree::Leaf(std::to_string(pos));
    int idx = GetSplit(level, pos, batch);
    return Tree::Join(BuildChosenTree(batch, idx, pos),
                      BuildChosenTree(batch, level - idx - 1, pos + idx + 1));
}

Tree Chart::GetChosenTree(unsigned batch) const {
    return BuildChosenTree(batch, length_ - 1, 0);
}

std::ostream& operator<<(std::ostream& out, const Chart& chart) {
    for (unsigned b = 0; b < chart.batch_size_; b++) {
        out << "batch " << b << std::endl;
        for (unsigned level = chart.length_; level-- > 0;) {
            for (unsigned pos = 0; pos < chart.length_ - level; pos++) {
                out << (pos ? " " : "") << chart.GetScore(level, pos, b);
                if (level > 0)
                    out << "/" << chart.GetSplit(level, pos, b)
                        << (chart.IsResolved(level, pos, b) ? "" : "?");
            }
            out << std::endl;
        }
    }
    return out;
}

void CheckSpans(const BatchSpans& spans, unsigned batch_size,
        unsigned length, const char* what) {
    if (spans.size() != batch_size) {
        std::stringstream msg;
        msg << spans.size() << " " << what << " lists for a batch of " << batch_size;
        throw DimensionMismatch(msg.str());
    }
    for (auto&& spans_in_sent: spans) {
        for (auto&& span: spans_in_sent) {
            if (span.length == 0 || span.End() > length) {
                std::stringstream msg;
                msg << what << " " << span
                    << " is outside a sentence of length " << length;
                throw DimensionMismatch(msg.str());
            }
        }
    }
}


void ChartEngine::FillOne(Chart& chart, const SplitPotentials& potentials,
        const SpanSet& constraints, ChartMode mode, unsigned batch) const {
    unsigned length = chart.Length();
    std::vector<float> combined(length);

    for (unsigned level = 1; level < length; level++) {
        for (unsigned pos = 0; pos < length - level; pos++) {
            int forced = -1;
            for (unsigned idx = 0; idx < level; idx++) {
                unsigned l_level = idx;
                unsigned l_pos = pos;
                unsigned r_level = level - idx - 1;
                unsigned r_pos = pos + idx + 1;

                combined[idx] = chart.GetScore(l_level, l_pos, batch) +
                                chart.GetScore(r_level, r_pos, batch) +
                                potentials.Get(level, pos, idx, batch);

                bool left_in_set = l_level == 0 ||
                    constraints.count(Span(l_pos, l_level + 1)) > 0;
                bool right_in_set = r_level == 0 ||
                    constraints.count(Span(r_pos, r_level + 1)) > 0;
                if (left_in_set && right_in_set) {
                    if (forced >= 0) {
                        std::stringstream msg;
                        msg << "ambiguous constraints at cell (level " << level
                            << ", pos " << pos << ") of batch element " << batch
                            << ": splits " << forced << " and " << idx
                            << " are both forced";
                        throw AmbiguousConstraint(msg.str());
                    }
                    forced = idx;
                }
            }

            int chosen;
            bool resolved;
            if (forced >= 0) {
                chosen = forced;
                resolved = true;
            } else if (mode == Override) {
                chosen = utils::ArgMax(&combined[0], &combined[0] + level);
                resolved = true;
            } else {
                chosen = 0;
                resolved = false;
            }
            if (mode == Forced)
                resolved = resolved &&
                    chart.IsResolved(chosen, pos, batch) &&
                    chart.IsResolved(level - chosen - 1, pos + chosen + 1, batch);

            chart.Set(level, pos, batch, combined[chosen], chosen, resolved);
        }
    }
}

Chart ChartEngine::Fill(const SplitPotentials& potentials,
        const BatchSpans& constraints, ChartMode mode) const {
    unsigned length = potentials.Length();
    unsigned batch_size = potentials.BatchSize();
    if (! constraints.empty())
        CheckSpans(constraints, batch_size, length, "constraint");

    std::vector<SpanSet> span_sets(batch_size);
    for (unsigned b = 0; b < constraints.size(); b++)
        span_sets[b] = ToSpanSet(constraints[b]);

    Chart chart(length, batch_size);
    std::vector<std::exception_ptr> errors(batch_size);

#ifdef _OPENMP
    int num_threads = config_.num_threads > 0 ?
        config_.num_threads : omp_get_max_threads();
    #pragma omp parallel for schedule(PARALLEL_SCHEDULE) num_threads(num_threads)
#endif
    for (int b = 0; b < static_cast<int>(batch_size); b++) {
        try {
            FillOne(chart, potentials, span_sets[b], mode, b);
        } catch (...) {
            errors[b] = std::current_exception();
        }
    }

    for (auto&& error: errors)
        if (error)
            std::rethrow_exception(error);

    if (loglevel_ == Debug) {
        Logger logger(loglevel_);
        logger.RecordChart(mode == Override ? "override chart" : "forced chart", chart);
    }
    return chart;
}

std::vector<float> ChartEngine::BestScore(const Sentences& sentences,
        const SplitPotentials& potentials) const {
    potentials.CheckShape(sentences.Length(), sentences.BatchSize());
    return Fill(potentials).RootScore();
}

std::vector<float> ChartEngine::ScoreForSpans(const Sentences& sentences,
        const SplitPotentials& potentials, const BatchSpans& spans) const {
    potentials.CheckShape(sentences.Length(), sentences.BatchSize());
    return Fill(potentials, spans, Override).RootScore();
}

std::vector<std::vector<float>> ChartEngine::ScoreForRoots(const Sentences& sentences,
        const SplitPotentials& potentials, const BatchSpans& spans,
        const BatchSpans& roots, ChartMode mode) const {
    potentials.CheckShape(sentences.Length(), sentences.BatchSize());
    CheckSpans(roots, sentences.BatchSize(), sentences.Length(), "root");
    Chart chart = Fill(potentials, spans, mode);
    return chart.Scores(roots, config_.strict_roots && mode == Forced);
}

} // namespace semichart
