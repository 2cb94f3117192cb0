#include <benchmark/benchmark.h>

#include <memory>
#include <string>

#include "../src/dictionary.hpp"
#include "../src/filterGuesser.hpp"
#include "../src/stats.hpp"
#include "../src/wordle.hpp"

namespace {

// Every word over a 4 letter alphabet with its index as frequency
std::string syntheticDictionary() {
    std::string text;
    std::string word(wordsim::config::WORD_LENGTH, 'a');
    for (size_t n = 0; n < 1024; ++n) {
        size_t val = n;
        for (size_t i = 0; i < wordsim::config::WORD_LENGTH; ++i) {
            word[i] = static_cast<char>('a' + val % 4);
            val /= 4;
        }
        text += word + " " + std::to_string(n) + "\n";
    }
    return text;
}

const std::string dictionaryText = syntheticDictionary();

}  // namespace

static void BM_parseDictionary(benchmark::State& state) {
    for (auto _ : state) {
        auto dictionary = wordsim::Dictionary::fromString(dictionaryText);
        benchmark::DoNotOptimize(dictionary);
    }
}
BENCHMARK(BM_parseDictionary);

static void BM_playFilterGuesser(benchmark::State& state) {
    std::shared_ptr<const wordsim::Dictionary> dictionary = std::make_shared<wordsim::Dictionary>(wordsim::Dictionary::fromString(dictionaryText));
    const wordsim::Wordle wordle{dictionary};
    wordsim::FilterGuesser guesser{dictionary};
    size_t answerIndex = 0;

    for (auto _ : state) {
        guesser.reset();
        auto turns = wordle.play(dictionary->words()[answerIndex], guesser);
        benchmark::DoNotOptimize(turns);
        answerIndex = (answerIndex + 1) % dictionary->size();
    }
}
BENCHMARK(BM_playFilterGuesser);

static void BM_simulateAll(benchmark::State& state) {
    size_t numThreads = state.range(0);
    std::shared_ptr<const wordsim::Dictionary> dictionary = std::make_shared<wordsim::Dictionary>(wordsim::Dictionary::fromString(dictionaryText));
    const wordsim::Wordle wordle{dictionary};
    auto makeGuesser = [&dictionary]() { return wordsim::FilterGuesser{dictionary}; };

    for (auto _ : state) {
        auto results = wordsim::stats::simulateAll(wordle, dictionary->words(), makeGuesser, numThreads);
        benchmark::DoNotOptimize(results);
    }
}

BENCHMARK(BM_simulateAll)
    ->Arg(1ul)
    ->Arg(2ul)
    ->Arg(4ul)
    ->Arg(8ul);

BENCHMARK_MAIN();
