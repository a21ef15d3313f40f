
#include <sstream>
#include <algorithm>
#include "potentials.h"
#include "errors.h"

namespace semichart {

SplitPotentials::SplitPotentials(unsigned length, unsigned batch_size, float init)
    : length_(length), batch_size_(batch_size), cells_(length) {
    if (length == 0 || batch_size == 0)
        throw DimensionMismatch("SplitPotentials: empty length or batch");
    size_t size = 0;
    for (unsigned level = 0; level < length; level++) {
        for (unsigned pos = 0; pos < length - level; pos++) {
            cells_[level].push_back(size);
            size += level * batch_size;
        }
    }
    data_.assign(size, init);
}

SplitPotentials SplitPotentials::Stack(const std::vector<SplitPotentials>& parts) {
    if (parts.empty())
        throw DimensionMismatch("SplitPotentials::Stack: nothing to stack");
    unsigned length = parts[0].Length();
    unsigned batch_size = 0;
    for (auto&& part: parts) {
        if (part.Length() != length) {
            std::stringstream msg;
            msg << "SplitPotentials::Stack: length " << part.Length()
                << " differs from " << length;
            throw DimensionMismatch(msg.str());
        }
        batch_size += part.BatchSize();
    }
    SplitPotentials res(length, batch_size);
    for (unsigned level = 1; level < length; level++) {
        for (unsigned pos = 0; pos < length - level; pos++) {
            for (unsigned idx = 0; idx < level; idx++) {
                float* dst = res(level, pos, idx);
                for (auto&& part: parts) {
                    const float* src = part(level, pos, idx);
                    dst = std::copy(src, src + part.BatchSize(), dst);
                }
            }
        }
    }
    return res;
}

SplitPotentials SplitPotentials::Select(const std::vector<unsigned>& indices) const {
    for (unsigned i: indices) {
        if (i >= batch_size_) {
            std::stringstream msg;
            msg << "SplitPotentials::Select: index " << i
                << " out of a batch of " << batch_size_;
            throw DimensionMismatch(msg.str());
        }
    }
    SplitPotentials res(length_, indices.size());
    for (unsigned level = 1; level < length_; level++)
        for (unsigned pos = 0; pos < length_ - level; pos++)
            for (unsigned idx = 0; idx < level; idx++)
                for (unsigned b = 0; b < indices.size(); b++)
                    res.Set(level, pos, idx, b, Get(level, pos, idx, indices[b]));
    return res;
}

void SplitPotentials::CheckShape(unsigned length, unsigned batch_size) const {
    if (length_ != length || batch_size_ != batch_size) {
        std::stringstream msg;
        msg << "potentials shaped for length " << length_
            << " and batch size " << batch_size_
            << ", but the sentences have length " << length
            << " and batch size " << batch_size;
        throw DimensionMismatch(msg.str());
    }
}

std::ostream& operator<<(std::ostream& out, const SplitPotentials& p) {
    for (unsigned level = 1; level < p.length_; level++) {
        for (unsigned pos = 0; pos < p.length_ - level; pos++) {
            out << "(" << pos << ", " << level + 1 << "):";
            for (unsigned idx = 0; idx < level; idx++) {
                out << " [";
                for (unsigned b = 0; b < p.batch_size_; b++)
                    out << (b ? ", " : "") << p.Get(level, pos, idx, b);
                out << "]";
            }
            out << std::endl;
        }
    }
    return out;
}

} // namespace semichart
