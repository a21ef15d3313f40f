
#include <sstream>
#include "sentences.h"
#include "errors.h"

namespace semichart {

Sentences::Sentences(const std::vector<std::vector<int>>& rows)
    : rows_(rows), length_(rows.empty() ? 0 : rows[0].size()) {
    if (rows_.empty())
        throw DimensionMismatch("Sentences: empty batch");
    for (unsigned i = 0; i < rows_.size(); i++) {
        if (rows_[i].size() != length_ || length_ == 0) {
            std::stringstream msg;
            msg << "Sentences: row " << i << " has length " << rows_[i].size()
                << ", expected " << length_;
            throw DimensionMismatch(msg.str());
        }
    }
}

Sentences Sentences::Select(const std::vector<unsigned>& indices) const {
    std::vector<std::vector<int>> res;
    for (unsigned i: indices) {
        if (i >= rows_.size()) {
            std::stringstream msg;
            msg << "Sentences::Select: index " << i
                << " out of a batch of " << rows_.size();
            throw DimensionMismatch(msg.str());
        }
        res.push_back(rows_[i]);
    }
    return Sentences(res);
}

} // namespace semichart
