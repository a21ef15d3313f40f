
#ifndef INCLUDE_POTENTIALS_H_
#define INCLUDE_POTENTIALS_H_

#include <vector>
#include <iostream>

namespace semichart {

// Split potentials of a batch of equal-length sentences. For the
// constituent (level, pos), i.e. the span (pos, level + 1), there is one
// scalar per split point idx in [0, level), each a vector over the batch.
// Level 0 (single tokens) has no split points.
class SplitPotentials
{
public:
    SplitPotentials(unsigned length, unsigned batch_size, float init=0.0);

    // concatenates batches of one length along the batch dimension
    static SplitPotentials Stack(const std::vector<SplitPotentials>& parts);

    // keeps the batch elements at `indices`, in that order
    SplitPotentials Select(const std::vector<unsigned>& indices) const;

    unsigned Length() const { return length_; }
    unsigned BatchSize() const { return batch_size_; }
    unsigned NumSplits(unsigned level) const { return level; }

    // batch_size values for split `idx` of cell (level, pos)
    const float* operator() (unsigned level, unsigned pos, unsigned idx) const {
        return &data_[Offset(level, pos, idx)];
    }
    float* operator() (unsigned level, unsigned pos, unsigned idx) {
        return &data_[Offset(level, pos, idx)];
    }

    float Get(unsigned level, unsigned pos, unsigned idx, unsigned batch) const {
        return data_[Offset(level, pos, idx) + batch];
    }
    void Set(unsigned level, unsigned pos, unsigned idx, unsigned batch, float value) {
        data_[Offset(level, pos, idx) + batch] = value;
    }

    // throws DimensionMismatch unless shaped for (length, batch_size)
    void CheckShape(unsigned length, unsigned batch_size) const;

    friend std::ostream& operator<<(std::ostream& out, const SplitPotentials& p);

private:
    size_t Offset(unsigned level, unsigned pos, unsigned idx) const {
        return cells_[level][pos] + idx * batch_size_;
    }

    unsigned length_;
    unsigned batch_size_;
    std::vector<std::vector<size_t>> cells_;
    std::vector<float> data_;
};

} // namespace semichart

#endif
