
#include <sstream>
#include "span.h"

namespace semichart {

const std::string Span::ToStr() const {
    std::stringstream res;
    res << "(" << start << ", " << length << ")";
    return res.str();
}

SpanSet ToSpanSet(const SpanList& spans) {
    return SpanSet(spans.begin(), spans.end());
}

SpanList Unique(const SpanList& spans) {
    SpanList res;
    SpanSet seen;
    for (auto&& span: spans) {
        if (seen.insert(span).second)
            res.push_back(span);
    }
    return res;
}

const std::string ToStr(const SpanList& spans) {
    std::stringstream res;
    res << "[";
    for (unsigned i = 0; i < spans.size(); i++)
        res << (i ? ", " : "") << spans[i];
    res << "]";
    return res.str();
}

std::ostream& operator<<(std::ostream& ost, const SpanList& spans) {
    ost << ToStr(spans);
    return ost;
}

} // namespace semichart
