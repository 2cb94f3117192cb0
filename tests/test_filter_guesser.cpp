#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../src/correctness.hpp"
#include "../src/filterGuesser.hpp"
#include "../src/wordle.hpp"

using namespace wordsim;

namespace {

std::shared_ptr<const Dictionary> testDictionary() {
    return std::make_shared<Dictionary>(Dictionary::fromString(
        "apple 5\n"
        "right 100\n"
        "wrong 50\n"
        "might 80\n"
        "sight 20\n"
    ));
}

}  // namespace

TEST_CASE("FilterGuesser: opens with the most frequent word", "[filterGuesser]") {
    FilterGuesser guesser{testDictionary()};
    REQUIRE(guesser.remaining() == 5);
    REQUIRE(guesser.guess(History{}) == "right");
}

TEST_CASE("FilterGuesser: ties go to the first loaded word", "[filterGuesser]") {
    FilterGuesser guesser{std::make_shared<Dictionary>(Dictionary::fromString("wrong 7\nright 7\n"))};
    REQUIRE(guesser.guess(History{}) == "wrong");
}

TEST_CASE("FilterGuesser: Guess::matches", "[filterGuesser]") {
    const Guess record{"right", correctness::compute("sight", "right")};
    REQUIRE(correctness::toString(record.mask) == "_XXXX");
    REQUIRE(record.matches("sight"));
    REQUIRE(record.matches("might"));
    REQUIRE_FALSE(record.matches("right"));
    REQUIRE_FALSE(record.matches("apple"));
}

TEST_CASE("FilterGuesser: filters candidates with feedback", "[filterGuesser]") {
    FilterGuesser guesser{testDictionary()};
    std::vector<Guess> history{Guess{"right", correctness::parseMask("_XXXX")}};

    REQUIRE(guesser.guess(History{history}) == "might");
    REQUIRE(guesser.remaining() == 2);

    history.push_back(Guess{"might", correctness::parseMask("_XXXX")});
    REQUIRE(guesser.guess(History{history}) == "sight");
    REQUIRE(guesser.remaining() == 1);
}

TEST_CASE("FilterGuesser: new game resets candidates", "[filterGuesser]") {
    FilterGuesser guesser{testDictionary()};
    std::vector<Guess> history{Guess{"right", correctness::parseMask("_____")}};

    REQUIRE(guesser.guess(History{history}) == "apple");
    REQUIRE(guesser.remaining() == 1);

    REQUIRE(guesser.guess(History{}) == "right");
    REQUIRE(guesser.remaining() == 5);

    guesser.guess(History{history});
    guesser.reset();
    REQUIRE(guesser.remaining() == 5);
}

TEST_CASE("FilterGuesser: inconsistent feedback", "[filterGuesser][error]") {
    FilterGuesser guesser{testDictionary()};
    const std::vector<Guess> history{Guess{"right", correctness::parseMask("XXXXO")}};
    REQUIRE_THROWS_AS(guesser.guess(History{history}), std::runtime_error);
}

TEST_CASE("FilterGuesser: solves every word", "[filterGuesser][wordle]") {
    const auto dictionary = testDictionary();
    const Wordle wordle{dictionary, config::CANONICAL_MAX_TURNS};

    for (const std::string& answer : dictionary->words()) {
        FilterGuesser guesser{dictionary};
        const auto turns = wordle.play(answer, guesser);
        REQUIRE(turns.has_value());
        REQUIRE(*turns <= 3);
    }

    FilterGuesser guesser{dictionary};
    REQUIRE(wordle.play("sight", guesser) == std::optional<size_t>{3});
}
