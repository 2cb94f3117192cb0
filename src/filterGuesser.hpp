#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "dictionary.hpp"
#include "guesser.hpp"

namespace wordsim {

/*
Keeps every dictionary word that agrees with the feedback seen so far and guesses the most
frequent one. Ties go to the word loaded first.
*/
class FilterGuesser {
    struct Candidate {
        std::string_view word;
        Dictionary::Frequency frequency;
    };

    std::shared_ptr<const Dictionary> dict;
    std::vector<Candidate> candidates;
    size_t applied = 0;  // Number of history records already used for filtering

    void filter(const Guess& record);

public:
    explicit FilterGuesser(std::shared_ptr<const Dictionary> dictionary);

    // Restores every dictionary word as a candidate
    void reset();

    std::string guess(History history);

    size_t remaining() const noexcept {
        return candidates.size();
    }
};

}  // namespace wordsim
