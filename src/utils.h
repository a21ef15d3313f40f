
#ifndef INCLUDE_UTILS_H_
#define INCLUDE_UTILS_H_

#include <string>
#include <limits>

namespace semichart {
namespace utils {

std::string
trim(const std::string& string, const char* trimCharacterList=" \t\v\r\n");

// index of the first maximum in [from, to), -1 when empty
template<typename T> int ArgMax(const T* from, const T* to) {
    T max_val = std::numeric_limits<T>::lowest();
    int max_idx = -1, i = 0;
    while (from != to) {
        if (max_idx < 0 || max_val < *from) {
            max_idx = i;
            max_val = *from;
        }
        i++; from++;
    }
    return max_idx;
}

} // namespace utils
} // namespace semichart

#endif
