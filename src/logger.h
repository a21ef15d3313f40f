
#ifndef INCLUDE_LOGGER_H_
#define INCLUDE_LOGGER_H_

#include <chrono>
#include <string>
#include <iostream>
#include <unordered_map>
#include "span.h"

#define GREENCOLOR "\033[32m"
#define REDCOLOR "\033[31m"
#define BLUECOLOR "\033[34m"
#define CYANCOLOR "\033[36m"

namespace semichart {

class Chart;
class SplitPotentials;

template<typename T>
struct Color
{
    Color(const T& ob, const char* color)
        :ob_(ob), color_(color) {}

    T ob_;
    const char* color_;
};

template<typename T> Color<T> Blue(T ob) { return Color<T>(ob, BLUECOLOR); }
template<typename T> Color<T> Red(T ob) { return Color<T>(ob, REDCOLOR); }
template<typename T> Color<T> Green(T ob) { return Color<T>(ob, GREENCOLOR); }
template<typename T> Color<T> Cyan(T ob) { return Color<T>(ob, CYANCOLOR); }

template<typename T>
std::ostream& operator<<(std::ostream& out, const Color<T>& color) {
    return out << color.color_ << color.ob_ << "\033[0m";
}

enum LogLevel { Debug, Info, Warn, Error };

class Logger
{
public:
    Logger(LogLevel level);

    Logger& operator()(LogLevel level) {
        cur_level_ = level;
        return *this;
    }

    void RecordTime(const std::string& name);
    void RecordTimeStartRunning();
    void RecordTimeEndOfScoring();

    void RecordChart(const char* message, const Chart& chart);
    void RecordSpans(const char* message, const BatchSpans& spans);
    void RecordPotentials(const char* message, const SplitPotentials& potentials);

    void CompleteOne();
    void CompleteBatch(unsigned batch_size, unsigned length);

    void Report();

    template<typename T> Logger& operator<<(const T& message) {
        if (cur_level_ >= level_)
            std::cerr << "[LOG] " << message << std::endl;
        return *this;
    }

    template<typename T>
    Logger& operator<<(const Color<T>& color) {
        if (cur_level_ >= level_)
            std::cerr << "[LOG] " << color.color_ << color.ob_ << "\033[0m" << std::endl;
        return *this;
    }

private:
    LogLevel level_;
    LogLevel cur_level_;
    int nprocessed_;
    int nbatches_;
    unsigned max_length_;
    std::unordered_map<std::string,
        std::chrono::system_clock::time_point> times_;
};

} // namespace semichart

#endif
