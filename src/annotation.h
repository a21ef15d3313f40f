
#ifndef INCLUDE_ANNOTATION_H_
#define INCLUDE_ANNOTATION_H_

#include <string>
#include <vector>
#include <boost/property_tree/ptree.hpp>
#include "span.h"
#include "tree.h"
#include "potentials.h"

namespace semichart {

// {"example_id": ..., "spans": [[start, length], ...], "tree": ...}
struct Annotation
{
    Annotation(): has_tree(false) {}

    std::string example_id;
    SpanList spans;
    bool has_tree;
    Tree tree;
};

// {"example_id": ..., "length": n, "potentials": [level][pos][idx],
//  "tokens": [...], "words": [...], "spans": [[start, length], ...], "predicted": tree}
struct PotentialRecord
{
    PotentialRecord(const std::string& example_id, const SplitPotentials& potentials)
    : example_id(example_id), potentials(potentials), has_predicted(false) {}

    unsigned Length() const { return potentials.Length(); }

    std::string example_id;
    SplitPotentials potentials;
    std::vector<int> tokens;
    std::vector<std::string> words;
    SpanList spans;
    bool has_predicted;
    Tree predicted;
};

// a bracket string or nested arrays of tokens
Tree ReadTree(const boost::property_tree::ptree& node);

SpanList ReadSpans(const boost::property_tree::ptree& node);

Annotation ReadAnnotation(const std::string& line);

PotentialRecord ReadPotentialRecord(const std::string& line);

std::vector<Annotation> LoadAnnotations(const std::string& filename);

std::vector<PotentialRecord> LoadPotentialRecords(const std::string& filename);

// {"example_id": ..., "tree": "( ... )"} on one line
std::string WritePrediction(const std::string& example_id, const Tree& tree);

} // namespace semichart

#endif
