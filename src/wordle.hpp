#pragma once

#include <algorithm>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "config.hpp"
#include "correctness.hpp"
#include "dictionary.hpp"
#include "guard.hpp"
#include "guesser.hpp"

namespace wordsim {

enum class State : char {
    PLAYING,
    WON,
    EXHAUSTED
};

/*
Referee for single games. Holds the dictionary of valid guesses and the turn limit; play() runs
one game to completion against a guesser. play() is const and keeps its history on the stack, so a
single Wordle can serve several threads at once.
*/
class Wordle {
    std::shared_ptr<const Dictionary> dict;
    size_t turnLimit;

public:
    explicit Wordle(std::shared_ptr<const Dictionary> dictionary, size_t maxTurns = config::DEFAULT_MAX_TURNS)
    : dict{std::move(dictionary)},
      turnLimit{maxTurns} {
        guard::hybridGuard<std::invalid_argument>(dict != nullptr, "Wordle requires a dictionary");
        guard::hybridGuard<std::invalid_argument>(turnLimit > 0, "Wordle requires at least one turn");
    }

    size_t maxTurns() const noexcept {
        return turnLimit;
    }

    const Dictionary& dictionary() const noexcept {
        return *dict;
    }

    /*
    Returns the turn on which guesser found answer, or std::nullopt if it did not within maxTurns().
    Throws guard::ContractViolation if answer is not in the dictionary, or if the guesser returns a
    word that is neither the answer nor in the dictionary.
    */
    template <concepts::Guesser G>
    std::optional<size_t> play(std::string_view answer, G&& guesser) const {
        guard::runtimeGuard<guard::ContractViolation>(dict->contains(answer), "answer '{}' is not in the dictionary", answer);

        std::vector<Guess> history;
        history.reserve(std::min(turnLimit, config::DEFAULT_MAX_TURNS));
        State state = State::PLAYING;
        size_t turn = 0;

        while (state == State::PLAYING) {
            if (turn == turnLimit) {
                state = State::EXHAUSTED;
                break;
            }
            ++turn;

            std::string guess = guesser.guess(History{history});
            if (guess == answer) {
                state = State::WON;
                break;
            }

            guard::runtimeGuard<guard::ContractViolation>(dict->contains(guess),
                "guess '{}' on turn {} is not in the dictionary", guess, turn);

            Mask mask = correctness::compute(answer, guess);
            history.push_back(Guess{std::move(guess), mask});
        }

        if (state == State::EXHAUSTED) return std::nullopt;
        return turn;
    }
};

}  // namespace wordsim
