#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "config.hpp"

namespace wordsim {

// Feedback for a single letter of a guess
enum class Correctness : uint8_t {
    Correct,    // Letter is in the answer at this position
    Misplaced,  // Letter is in the answer, but at another (unclaimed) position
    Absent      // Letter does not account for any remaining answer letter
};

using Mask = std::array<Correctness, config::WORD_LENGTH>;

}  // namespace wordsim

namespace wordsim::correctness {

    namespace symbol {
        constexpr inline char CORRECT = 'X';
        constexpr inline char MISPLACED = 'O';
        constexpr inline char ABSENT = '_';
    }  // namespace symbol

    /*
    Scores guess against answer. Both words must be WORD_LENGTH long (throws ContractViolation otherwise).
    Exact matches are claimed first, then every other guess letter claims the leftmost unclaimed
    occurrence of itself in the answer, so a repeated guess letter is credited at most as often as
    it occurs in the answer.
    */
    [[nodiscard]] Mask compute(std::string_view answer, std::string_view guess);

    [[nodiscard]] constexpr inline char toSymbol(Correctness c) noexcept {
        switch (c) {
            case Correctness::Correct: return symbol::CORRECT;
            case Correctness::Misplaced: return symbol::MISPLACED;
            case Correctness::Absent: return symbol::ABSENT;
        }
        return symbol::ABSENT;
    }

    // "XO__X" form of a mask
    [[nodiscard]] std::string toString(const Mask& mask);

    // Inverse of toString(). Throws std::invalid_argument on bad length or symbols
    [[nodiscard]] Mask parseMask(std::string_view maskString);

}  // namespace wordsim::correctness
