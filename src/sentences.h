
#ifndef INCLUDE_SENTENCES_H_
#define INCLUDE_SENTENCES_H_

#include <vector>

namespace semichart {

// a batch of token index rows of equal length
class Sentences
{
public:
    Sentences(const std::vector<std::vector<int>>& rows);

    unsigned BatchSize() const { return rows_.size(); }
    unsigned Length() const { return length_; }
    const std::vector<int>& Row(unsigned i) const { return rows_[i]; }

    // keeps the rows at `indices`, in that order
    Sentences Select(const std::vector<unsigned>& indices) const;

private:
    std::vector<std::vector<int>> rows_;
    unsigned length_;
};

} // namespace semichart

#endif
