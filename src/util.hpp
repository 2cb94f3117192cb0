#pragma once

#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string_view>

#include "config.hpp"

namespace wordsim::util {

inline void showProgressBar(size_t current, size_t total, size_t barWidth = 50) {
    double progress = total == 0 ? 1.0 : static_cast<double>(current) / total;
    size_t pos = static_cast<size_t>(barWidth * progress);

    std::cout << "\r[";
    for (size_t i = 0; i < barWidth; ++i) {
        if (i < pos) std::cout << "=";
        else if (i == pos) std::cout << ">";
        else std::cout << " ";
    }
    std::cout << "] "
              << std::fixed << std::setprecision(2)
              << std::setw(6) << (progress * 100.0) << "%   "
              << std::flush;
}

constexpr inline bool isValidLetter(char c) noexcept {
    return 'a' <= c && c <= 'z';
}

// Checks size and letters
constexpr inline bool isValidWord(std::string_view word) noexcept {
    if (word.size() != config::WORD_LENGTH) return false;
    return std::all_of(word.begin(), word.end(), isValidLetter);
}

}
