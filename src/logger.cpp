
#include "logger.h"
#include "chart.h"
#include "potentials.h"

#define BORDER "####################################"

namespace semichart {

Logger::Logger(LogLevel level)
    : level_(level), cur_level_(Info), nprocessed_(0),
      nbatches_(0), max_length_(0) {}

void Logger::RecordTime(const std::string& name) {
    auto now = std::chrono::system_clock::now();
    times_[name] = now;
}

void Logger::RecordTimeStartRunning() {
    (*this)(Info) << "scoring ...";
    RecordTime("time_start_running");
}

void Logger::RecordTimeEndOfScoring() {
    if (nprocessed_ >= 10 && level_ <= Info)
        std::cerr << std::endl;
    (*this)(Info) << "finished";
    RecordTime("time_end_of_scoring");
}

void Logger::RecordChart(const char* message, const Chart& chart) {
    if (level_ == Debug)
        std::cerr << Red(message) << std::endl
                  << chart
                  << Cyan(BORDER) << std::endl;
}

void Logger::RecordSpans(const char* message, const BatchSpans& spans) {
    if (level_ != Debug)
        return;
    std::cerr << Blue(message) << std::endl;
    for (unsigned i = 0; i < spans.size(); i++)
        std::cerr << i << ": " << spans[i] << std::endl;
    std::cerr << Cyan(BORDER) << std::endl;
}

void Logger::RecordPotentials(const char* message, const SplitPotentials& potentials) {
    if (level_ == Debug)
        std::cerr << Blue(message) << std::endl
                  << potentials
                  << Cyan(BORDER) << std::endl;
}

void Logger::CompleteOne() {
    if (++nprocessed_ % 10 == 0 && level_ <= Info) {
        std::cerr << ".";
        if (nprocessed_ % 500 == 0)
            std::cerr << nprocessed_ << std::endl;
    }
}

void Logger::CompleteBatch(unsigned batch_size, unsigned length) {
    nbatches_++;
    if (length > max_length_)
        max_length_ = length;
    for (unsigned i = 0; i < batch_size; i++)
        CompleteOne();
}

void Logger::Report() {
    if (Info < level_) return;
    double elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            times_["time_end_of_scoring"] - times_["time_start_running"]).count();

    std::cerr << "examples: " << nprocessed_ << std::endl
              << "batches: " << nbatches_ << std::endl
              << "longest sentence: " << max_length_ << std::endl
              << "elapsed time: " << elapsed / 1000.0 << " seconds" << std::endl;
}

} // namespace semichart
