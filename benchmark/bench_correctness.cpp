#include <benchmark/benchmark.h>

#include <string>
#include <vector>

#include "../src/correctness.hpp"

static const std::vector<std::string> words{"aabbb", "ccaac", "azzaz", "aaabb", "abcde", "cdbea", "right", "wrong"};

static void BM_compute(benchmark::State& state) {
    for (auto _ : state) {
        for (const auto& answer : words) {
            for (const auto& guess : words) {
                auto mask = wordsim::correctness::compute(answer, guess);
                benchmark::DoNotOptimize(mask);
            }
        }
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(words.size() * words.size()));
}
BENCHMARK(BM_compute);
