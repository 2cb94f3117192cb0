#pragma once

#include <concepts>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "correctness.hpp"

namespace wordsim {

// One turn of a game: the word that was guessed and the feedback it received
struct Guess {
    std::string word;
    Mask mask;

    // Returns true if candidate could still be the answer given this turn's feedback
    bool matches(std::string_view candidate) const {
        return correctness::compute(candidate, word) == mask;
    }
};

using History = std::span<const Guess>;

namespace concepts {
    template <typename G>
    concept Guesser = requires(G& guesser, History history) {
        { guesser.guess(history) } -> std::convertible_to<std::string>;
    };
}

// Adapts any callable taking the history into a Guesser
class FunctionGuesser {
    std::function<std::string(History)> func;

public:
    explicit FunctionGuesser(std::function<std::string(History)> _func) : func{std::move(_func)} {}

    std::string guess(History history) {
        return func(history);
    }
};

}  // namespace wordsim
