
#include <sstream>
#include <fstream>
#include <boost/property_tree/json_parser.hpp>
#include "annotation.h"
#include "errors.h"
#include "utils.h"

namespace semichart {

namespace pt = boost::property_tree;

namespace {

pt::ptree ParseLine(const std::string& line) {
    pt::ptree res;
    std::istringstream in(line);
    pt::read_json(in, res);
    return res;
}

std::vector<std::string> ReadLines(const std::string& filename) {
    std::ifstream in(filename);
    if (!in)
        throw std::runtime_error("failed to open: " + filename);
    std::vector<std::string> res;
    std::string line;
    while (getline(in, line)) {
        line = utils::trim(line);
        if (line.size() == 0) continue;
        res.push_back(line);
    }
    return res;
}

} // namespace

Tree ReadTree(const pt::ptree& node) {
    if (node.empty()) {
        const std::string& data = node.data();
        if (data.empty())
            throw MalformedTree("empty tree in json");
        if (data.find('(') != std::string::npos || data.find(')') != std::string::npos)
            return TextToTree(data);
        return Tree::Leaf(data);
    }
    std::vector<Tree> children;
    for (auto&& child: node)
        children.push_back(ReadTree(child.second));
    return Tree::Join(children);
}

SpanList ReadSpans(const pt::ptree& node) {
    SpanList res;
    for (auto&& item: node) {
        std::vector<int> values;
        for (auto&& value: item.second)
            values.push_back(value.second.get_value<int>());
        if (values.size() != 2 || values[0] < 0 || values[1] < 1) {
            std::stringstream msg;
            msg << "a span must be [start, length], got "
                << values.size() << " values";
            throw std::runtime_error(msg.str());
        }
        res.emplace_back(values[0], values[1]);
    }
    return res;
}

Annotation ReadAnnotation(const std::string& line) {
    pt::ptree json = ParseLine(line);
    Annotation res;
    res.example_id = json.get<std::string>("example_id");
    if (auto spans = json.get_child_optional("spans"))
        res.spans = ReadSpans(*spans);
    if (auto tree = json.get_child_optional("tree")) {
        res.tree = ReadTree(*tree);
        res.has_tree = true;
    }
    return res;
}

PotentialRecord ReadPotentialRecord(const std::string& line) {
    pt::ptree json = ParseLine(line);
    std::string example_id = json.get<std::string>("example_id");
    unsigned length = json.get<unsigned>("length");
    SplitPotentials potentials(length, 1);

    const pt::ptree& levels = json.get_child("potentials");
    if (levels.size() != length) {
        std::stringstream msg;
        msg << example_id << ": " << levels.size()
            << " levels of potentials for length " << length;
        throw DimensionMismatch(msg.str());
    }
    unsigned level = 0;
    for (auto&& cells: levels) {
        if (level > 0) {
            if (cells.second.size() != length - level) {
                std::stringstream msg;
                msg << example_id << ": level " << level << " has "
                    << cells.second.size() << " cells, expected " << length - level;
                throw DimensionMismatch(msg.str());
            }
            unsigned pos = 0;
            for (auto&& splits: cells.second) {
                if (splits.second.size() != level) {
                    std::stringstream msg;
                    msg << example_id << ": cell (level " << level << ", pos " << pos
                        << ") has " << splits.second.size() << " splits, expected " << level;
                    throw DimensionMismatch(msg.str());
                }
                unsigned idx = 0;
                for (auto&& value: splits.second)
                    potentials.Set(level, pos, idx++, 0, value.second.get_value<float>());
                pos++;
            }
        }
        level++;
    }

    PotentialRecord res(example_id, potentials);
    if (auto tokens = json.get_child_optional("tokens")) {
        for (auto&& token: *tokens)
            res.tokens.push_back(token.second.get_value<int>());
        if (res.tokens.size() != length) {
            std::stringstream msg;
            msg << example_id << ": " << res.tokens.size()
                << " tokens for length " << length;
            throw DimensionMismatch(msg.str());
        }
    } else {
        res.tokens.assign(length, 0);
    }
    if (auto words = json.get_child_optional("words")) {
        for (auto&& word: *words)
            res.words.push_back(word.second.data());
        if (res.words.size() != length) {
            std::stringstream msg;
            msg << example_id << ": " << res.words.size()
                << " words for length " << length;
            throw DimensionMismatch(msg.str());
        }
    } else {
        for (int token: res.tokens)
            res.words.push_back(std::to_string(token));
    }
    if (auto spans = json.get_child_optional("spans"))
        res.spans = ReadSpans(*spans);
    if (auto predicted = json.get_child_optional("predicted")) {
        res.predicted = ReadTree(*predicted);
        res.has_predicted = true;
    }
    return res;
}

std::vector<Annotation> LoadAnnotations(const std::string& filename) {
    std::vector<Annotation> res;
    for (auto&& line: ReadLines(filename))
        res.push_back(ReadAnnotation(line));
    return res;
}

std::vector<PotentialRecord> LoadPotentialRecords(const std::string& filename) {
    std::vector<PotentialRecord> res;
    for (auto&& line: ReadLines(filename))
        res.push_back(ReadPotentialRecord(line));
    return res;
}

std::string WritePrediction(const std::string& example_id, const Tree& tree) {
    pt::ptree json;
    json.put("example_id", example_id);
    json.put("tree", tree.ToStr());
    std::stringstream out;
    pt::write_json(out, json, false);
    return utils::trim(out.str());
}

} // namespace semichart
