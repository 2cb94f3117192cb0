#include "stats.hpp"

namespace wordsim::stats {

Summary summarize(std::span<const Result> results, size_t canonicalTurns) {
    Summary summary{};
    summary.games = results.size();

    size_t totalTurns = 0;
    for (const Result& result : results) {
        if (!result) {
            ++summary.unsolved;
            continue;
        }
        ++summary.solved;
        totalTurns += *result;
        ++summary.turnCounts[*result];
        if (*result <= canonicalTurns) ++summary.wonWithinLimit;
    }

    if (summary.solved > 0) {
        summary.meanTurns = static_cast<double>(totalTurns) / static_cast<double>(summary.solved);
    }
    if (summary.games > 0) {
        summary.winRate = static_cast<double>(summary.wonWithinLimit) / static_cast<double>(summary.games);
    }
    return summary;
}

}  // namespace wordsim::stats
