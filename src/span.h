
#ifndef INCLUDE_SPAN_H_
#define INCLUDE_SPAN_H_

#include <iostream>
#include <string>
#include <vector>
#include <unordered_set>
#include <functional>

namespace semichart {

// a constituent over tokens [start, start + length)
struct Span
{
    Span(): start(0), length(1) {}
    Span(unsigned start, unsigned length)
    : start(start), length(length) {}

    unsigned End() const { return start + length; }
    unsigned Last() const { return start + length - 1; }

    // `other` lies inside this span
    bool Covers(const Span& other) const {
        return start <= other.start && Last() >= other.Last();
    }

    bool operator==(const Span& other) const {
        return start == other.start && length == other.length;
    }
    bool operator!=(const Span& other) const { return ! (*this == other); }
    bool operator<(const Span& other) const {
        return start < other.start ||
            (start == other.start && length < other.length);
    }

    const std::string ToStr() const;

    friend std::ostream& operator<<(std::ostream& ost, const Span& span) {
        ost << span.ToStr();
        return ost;
    }

    unsigned start;
    unsigned length;
};

typedef std::vector<Span> SpanList;
typedef std::vector<SpanList> BatchSpans;

} // namespace semichart


namespace std {

template<>
struct hash<semichart::Span>
{
    inline size_t operator () (const semichart::Span& s) const {
        return static_cast<size_t>(s.start) * 0x9e3779b1u ^ s.length;
    }
};

} // namespace std


namespace semichart {

typedef std::unordered_set<Span> SpanSet;

SpanSet ToSpanSet(const SpanList& spans);

// drops repeated spans, keeping the first occurrence of each
SpanList Unique(const SpanList& spans);

const std::string ToStr(const SpanList& spans);

std::ostream& operator<<(std::ostream& ost, const SpanList& spans);

} // namespace semichart

#endif
