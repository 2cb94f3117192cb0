#include "filterGuesser.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "guard.hpp"

namespace wordsim {

FilterGuesser::FilterGuesser(std::shared_ptr<const Dictionary> dictionary) : dict{std::move(dictionary)} {
    guard::hybridGuard<std::invalid_argument>(dict != nullptr, "FilterGuesser requires a dictionary");
    reset();
}

void FilterGuesser::reset() {
    candidates.clear();
    candidates.reserve(dict->size());
    for (const std::string& word : dict->words()) {
        candidates.push_back(Candidate{word, dict->frequency(word)});
    }
    applied = 0;
}

void FilterGuesser::filter(const Guess& record) {
    candidates.erase(
        std::remove_if(candidates.begin(), candidates.end(),
            [&record](const Candidate& c) { return !record.matches(c.word); }),
        candidates.end()
    );
}

std::string FilterGuesser::guess(History history) {
    // Shorter history than what was applied means a new game started
    if (history.size() < applied) reset();

    for (; applied < history.size(); ++applied) {
        filter(history[applied]);
    }

    guard::runtimeGuard(!candidates.empty(), "no candidate agrees with {} guesses of feedback", history.size());

    auto best = std::max_element(candidates.begin(), candidates.end(),
        [](const Candidate& left, const Candidate& right) noexcept { return left.frequency < right.frequency; });
    return std::string{best->word};
}

}  // namespace wordsim
