#pragma once

#include <cstddef>

namespace wordsim::config {

    constexpr inline auto DICTIONARY_FILE = "dictionary.txt";
    constexpr inline auto ANSWERS_FILE = "answers.txt";
    constexpr inline size_t WORD_LENGTH = 5;
    constexpr inline size_t CANONICAL_MAX_TURNS = 6;   // Real game only allows 6 guesses
    constexpr inline size_t DEFAULT_MAX_TURNS = 32;    // Allow more so the turn distribution is not chopped off
    constexpr inline size_t HARDWARE_CONCURRENCY = 8ul;
}
