#include "correctness.hpp"

#include <stdexcept>

#include "guard.hpp"

namespace wordsim::correctness {

Mask compute(std::string_view answer, std::string_view guess) {
    guard::runtimeGuard<guard::ContractViolation>(answer.size() == config::WORD_LENGTH, "answer '{}' must have {} letters", answer, config::WORD_LENGTH);
    guard::runtimeGuard<guard::ContractViolation>(guess.size() == config::WORD_LENGTH, "guess '{}' must have {} letters", guess, config::WORD_LENGTH);

    Mask mask;
    mask.fill(Correctness::Absent);
    std::array<bool, config::WORD_LENGTH> used{};

    // Step 1: Mark exact matches and claim their answer position
    for (size_t i = 0; i < config::WORD_LENGTH; ++i) {
        if (guess[i] == answer[i]) {
            mask[i] = Correctness::Correct;
            used[i] = true;
        }
    }

    // Step 2: Remaining letters claim the leftmost unclaimed occurrence in the answer
    for (size_t i = 0; i < config::WORD_LENGTH; ++i) {
        if (mask[i] == Correctness::Correct) continue;

        for (size_t j = 0; j < config::WORD_LENGTH; ++j) {
            if (used[j] || answer[j] != guess[i]) continue;
            mask[i] = Correctness::Misplaced;
            used[j] = true;
            break;
        }
    }
    return mask;
}

std::string toString(const Mask& mask) {
    std::string out(config::WORD_LENGTH, symbol::ABSENT);
    for (size_t i = 0; i < config::WORD_LENGTH; ++i) {
        out[i] = toSymbol(mask[i]);
    }
    return out;
}

Mask parseMask(std::string_view maskString) {
    guard::runtimeGuard<std::invalid_argument>(maskString.size() == config::WORD_LENGTH,
        "mask '{}' must have {} symbols", maskString, config::WORD_LENGTH);

    Mask mask;
    for (size_t i = 0; i < config::WORD_LENGTH; ++i) {
        switch (maskString[i]) {
            case symbol::CORRECT: mask[i] = Correctness::Correct; break;
            case symbol::MISPLACED: mask[i] = Correctness::Misplaced; break;
            case symbol::ABSENT: mask[i] = Correctness::Absent; break;
            default: guard::formatError<std::invalid_argument>("invalid symbol '{}' in mask '{}'", maskString[i], maskString);
        }
    }
    return mask;
}

}  // namespace wordsim::correctness
