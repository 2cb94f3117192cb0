#pragma once

#include <cstddef>
#include <exception>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

#include "config.hpp"
#include "guesser.hpp"
#include "parallelTaskQueue.hpp"
#include "wordle.hpp"

namespace wordsim::stats {

using Result = std::optional<size_t>;

namespace concepts {
    // Callable producing a fresh guesser for every game
    template <typename F>
    concept GuesserFactory = std::is_invocable_v<const F&> && wordsim::concepts::Guesser<std::invoke_result_t<const F&>>;
}

struct Summary {
    size_t games = 0;
    size_t solved = 0;
    size_t unsolved = 0;
    size_t wonWithinLimit = 0;   // Solved in at most canonicalTurns
    double meanTurns = 0.0;      // Over solved games only
    double winRate = 0.0;        // wonWithinLimit / games
    std::map<size_t, size_t> turnCounts;  // turns -> number of games solved in that many turns
};

/*
Plays every answer, each with a new guesser from makeGuesser. Answers are split into contiguous
chunks, one thread per chunk. Results are in answer order. The first exception thrown by any
game is rethrown after every thread has finished.
*/
template <concepts::GuesserFactory Factory>
std::vector<Result> simulateAll(const Wordle& wordle, std::span<const std::string> answers,
                                const Factory& makeGuesser,
                                size_t numThreads = config::HARDWARE_CONCURRENCY) {
    std::vector<Result> results(answers.size());
    std::exception_ptr failure;
    std::mutex failureMtx;

    {
        parallel::TaskQueue queue{numThreads};
        parallel::pushChunks(queue, answers.size(), numThreads,
            [&](size_t start, size_t stop) {
                try {
                    for (size_t i = start; i < stop; ++i) {
                        auto guesser = makeGuesser();
                        results[i] = wordle.play(answers[i], guesser);
                    }
                } catch (...) {
                    std::lock_guard<std::mutex> lock(failureMtx);
                    if (!failure) failure = std::current_exception();
                }
            }
        );
        queue.wait();
    }

    if (failure) std::rethrow_exception(failure);
    return results;
}

Summary summarize(std::span<const Result> results, size_t canonicalTurns = config::CANONICAL_MAX_TURNS);

}  // namespace wordsim::stats
