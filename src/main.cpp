
#include <iostream>
#include <stdexcept>
#include <unordered_map>
#include "cmdline.h"
#include "configure.h"
#include "annotation.h"
#include "canonical.h"
#include "chart.h"
#include "errors.h"
#include "logger.h"
#include "loss.h"
#include "metrics.h"
#include "sentences.h"
#include "tree.h"

#ifdef _OPENMP
#include <omp.h>
#endif

using namespace semichart;

ChartConfig config;
float margin;
Branching branching;
unsigned batch_size;
LogLevel loglevel;

// consecutive records of one length, at most batch_size each
std::vector<std::vector<unsigned>> MakeBatches(const std::vector<PotentialRecord>& records) {
    std::vector<std::vector<unsigned>> res;
    for (unsigned i = 0; i < records.size(); i++) {
        if (res.empty() || res.back().size() >= batch_size
                || records[res.back().front()].Length() != records[i].Length())
            res.emplace_back();
        res.back().push_back(i);
    }
    return res;
}

SpanList SpansOf(const Annotation& annotation) {
    return annotation.has_tree ? TreeToSpans(annotation.tree) : annotation.spans;
}

void Eval(const std::string& gold_file, const std::string& pred_file, Logger& logger) {
    auto golds = LoadAnnotations(gold_file);
    auto preds = LoadAnnotations(pred_file);
    std::unordered_map<std::string, const Annotation*> index;
    for (auto&& pred: preds)
        index[pred.example_id] = &pred;

    SpanEvaluator eval;
    for (auto&& gold: golds) {
        auto found = index.find(gold.example_id);
        if (found == index.end()) {
            logger(Warn) << Red("no prediction for " + gold.example_id);
            continue;
        }
        SpanCounts counts = eval.Add(SpansOf(gold), SpansOf(*found->second));
        logger(Debug) << gold.example_id + ": matched "
                         + std::to_string(counts.matched_in_gold) + " of "
                         + std::to_string(counts.gold_count) + " gold spans";
        logger.CompleteOne();
    }
    std::cout << eval << std::endl;
}

void Score(const std::string& input, Logger& logger) {
    auto records = LoadPotentialRecords(input);
    ChartEngine engine(config, loglevel);
    SemiSupervisedLoss loss(engine, margin, branching);

    float total_tree = 0.0, total_span = 0.0;
    unsigned nbatch = 0;
    for (auto&& batch: MakeBatches(records)) {
        std::vector<std::vector<int>> rows;
        std::vector<SplitPotentials> parts;
        BatchSpans gold, max;
        for (unsigned i: batch) {
            rows.push_back(records[i].tokens);
            parts.push_back(records[i].potentials);
            gold.push_back(records[i].spans);
        }
        Sentences sentences(rows);
        SplitPotentials potentials = SplitPotentials::Stack(parts);
        logger.RecordPotentials("split potentials", potentials);

        Chart chart = engine.Fill(potentials);
        std::vector<float> best = chart.RootScore();
        for (unsigned b = 0; b < batch.size(); b++) {
            const PotentialRecord& record = records[batch[b]];
            if (record.has_predicted) {
                if (record.predicted.NumLeaves() != record.Length())
                    throw DimensionMismatch(record.example_id
                            + ": predicted tree does not cover the sentence");
                max.push_back(TreeToSpans(record.predicted));
            } else {
                max.push_back(chart.GetChosenSpans(b));
            }
            std::cout << "ID=" << record.example_id << "\tbest=" << best[b] << std::endl;
        }
        logger.RecordSpans("maximal spans", max);

        auto annotated = SelectAnnotated(gold);
        if (! annotated.empty()) {
            BatchSpans sub_gold, sub_max;
            for (unsigned b: annotated) {
                sub_gold.push_back(gold[b]);
                sub_max.push_back(max[b]);
            }
            Sentences sub_sentences = sentences.Select(annotated);
            SplitPotentials sub_potentials = potentials.Select(annotated);

            TreeMarginResult tree = loss.TreeMargin(
                    sub_sentences, sub_potentials, sub_gold, sub_max);
            SpanMarginResult span = loss.SpanMargin(
                    sub_sentences, sub_potentials, sub_gold, sub_max);

            for (unsigned k = 0; k < annotated.size(); k++) {
                const std::string& id = records[batch[annotated[k]]].example_id;
                std::cout << "ID=" << id << "\tgold=" << tree.gold_scores[k]
                          << "\tmax=" << tree.max_scores[k] << std::endl;
                for (auto&& term: span.terms[k]) {
                    std::cout << "  " << term.target << " <- " << term.root;
                    if (term.Skipped())
                        std::cout << "\tskipped";
                    else
                        std::cout << "\tgold=" << term.gold_score
                                  << "\tmax=" << term.max_score;
                    std::cout << std::endl;
                }
            }
            std::cout << "batch " << nbatch << "\ttree_loss=" << tree.loss
                      << "\tspan_loss=" << span.loss << std::endl;
            total_tree += tree.loss;
            total_span += span.loss;
        }
        logger.CompleteBatch(batch.size(), sentences.Length());
        nbatch++;
    }
    std::cout << "total\ttree_loss=" << total_tree
              << "\tspan_loss=" << total_span << std::endl;
}

void Parse(const std::string& input, Logger& logger) {
    auto records = LoadPotentialRecords(input);
    ChartEngine engine(config, loglevel);
    for (auto&& batch: MakeBatches(records)) {
        std::vector<SplitPotentials> parts;
        for (unsigned i: batch)
            parts.push_back(records[i].potentials);
        Chart chart = engine.Fill(SplitPotentials::Stack(parts));
        for (unsigned b = 0; b < batch.size(); b++) {
            const PotentialRecord& record = records[batch[b]];
            Tree tree = ReplaceLeaves(chart.GetChosenTree(b), record.words);
            std::cout << WritePrediction(record.example_id, tree) << std::endl;
        }
        logger.CompleteBatch(batch.size(), chart.Length());
    }
}

void Chains(const std::string& input, Logger& logger) {
    for (auto&& annotation: LoadAnnotations(input)) {
        std::cout << "ID=" << annotation.example_id << std::endl;
        for (auto&& span: SpansOf(annotation))
            std::cout << span << "\t" << MakeChain(span, branching) << std::endl;
        logger.CompleteOne();
    }
}

int main(int argc, char const* argv[])
{
    cmdline::parser p;
    p.add<std::string>("mode", 'm', "mode [eval,score,parse,chains]", true, "",
            cmdline::oneof<std::string>("eval", "score", "parse", "chains"));
    p.add<std::string>("input", 'i', "input file (potentials or annotations)", false, "");
    p.add<std::string>("gold", 'g', "gold annotations for eval", false, "");
    p.add<std::string>("pred", '\0', "predicted annotations for eval", false, "");
    p.add<float>("margin", '\0', "margin of the losses", false, 1.0);
    p.add<std::string>("branching", 'b', "canonical chains [left,right]", false, "right",
            cmdline::oneof<std::string>("left", "right"));
    p.add<int>("batch-size", '\0', "maximum sentences per batch", false, 32,
            cmdline::range(1, 65536));
    p.add<int>("threads", 't', "threads per batch, 0 for the OpenMP default", false, 0);
    p.add("no-strict", '\0', "allow reading unresolved roots");
    p.add("debug", '\0', "debugging");
    p.add("help", 'h', "print help");

    if ( !p.parse(argc, argv) || p.exist("help") ) {
        std::cerr << p.error_full() << p.usage();
        return 0;
    }

    std::string mode = p.get<std::string>("mode");
    margin = p.get<float>("margin");
    branching = ParseBranching(p.get<std::string>("branching"));
    batch_size = p.get<int>("batch-size");
    config.num_threads = p.get<int>("threads");
    config.strict_roots = ! p.exist("no-strict");
    loglevel = p.exist("debug") ? Debug : Info;

    std::cerr << "semichart " << SEMICHART_VERSION << std::endl;
#ifdef _OPENMP
    std::cerr << "OpenMP : On, threads = " << omp_get_max_threads() << std::endl;
    if ( p.exist("debug") )
        config.num_threads = 1;
#endif

    Logger logger(loglevel);
    logger.RecordTimeStartRunning();
    try {
        if (mode == "eval") {
            if (p.get<std::string>("gold").empty() || p.get<std::string>("pred").empty())
                throw std::runtime_error("eval needs both --gold and --pred");
            Eval(p.get<std::string>("gold"), p.get<std::string>("pred"), logger);
        } else {
            if (p.get<std::string>("input").empty())
                throw std::runtime_error(mode + " needs --input");
            if (mode == "score")
                Score(p.get<std::string>("input"), logger);
            else if (mode == "parse")
                Parse(p.get<std::string>("input"), logger);
            else
                Chains(p.get<std::string>("input"), logger);
        }
    } catch (std::exception& e) {
        logger(Error) << Red(e.what());
        return 1;
    }
    logger.RecordTimeEndOfScoring();
    logger.Report();
    return 0;
}
