#include <algorithm>
#include <charconv>
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "src/config.hpp"
#include "src/correctness.hpp"
#include "src/dictionary.hpp"
#include "src/filterGuesser.hpp"
#include "src/guesser.hpp"
#include "src/stats.hpp"
#include "src/util.hpp"
#include "src/wordle.hpp"

namespace {

constexpr size_t PROGRESS_BATCH = 256;

bool parseTurns(std::string_view text, size_t& turns) {
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), turns);
    return ec == std::errc{} && end == text.data() + text.size() && turns > 0;
}

void stats(const std::string& dictionaryPath, const std::string& answersPath, size_t maxTurns) {
    std::shared_ptr<const wordsim::Dictionary> dictionary = std::make_shared<wordsim::Dictionary>(wordsim::Dictionary::fromFile(dictionaryPath));
    const auto answers = wordsim::vocab::loadAnswersFile(answersPath);
    const wordsim::Wordle wordle{dictionary, maxTurns};

    std::cout << "Loaded " << dictionary->size() << " dictionary words and " << answers.size() << " answers\n";

    auto makeGuesser = [&dictionary]() { return wordsim::FilterGuesser{dictionary}; };
    std::vector<wordsim::stats::Result> results;
    results.reserve(answers.size());

    // Simulate in batches so progress can be reported
    auto start = std::chrono::steady_clock::now();
    const std::span<const std::string> all{answers};
    for (size_t offset = 0; offset < all.size(); offset += PROGRESS_BATCH) {
        wordsim::util::showProgressBar(offset, all.size());
        const size_t count = std::min(PROGRESS_BATCH, all.size() - offset);
        auto batch = wordsim::stats::simulateAll(wordle, all.subspan(offset, count), makeGuesser);
        results.insert(results.end(), batch.begin(), batch.end());
    }
    wordsim::util::showProgressBar(all.size(), all.size());
    std::cout << "\n";

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    const auto summary = wordsim::stats::summarize(results);

    std::cout << "Simulation Time: " << duration << " ms\n";
    std::cout << "Mean guesses: " << summary.meanTurns << "\n";
    std::cout << "Win Percentage: " << summary.winRate * 100.0 << "% (within " << wordsim::config::CANONICAL_MAX_TURNS << " guesses)\n";
    std::cout << "Games unsolved after " << maxTurns << " guesses: " << summary.unsolved << "\n";
    for (const auto& [turns, games] : summary.turnCounts) {
        std::cout << "  " << turns << ": " << games << "\n";
    }
}

void play(const std::string& dictionaryPath, std::string answer) {
    std::shared_ptr<const wordsim::Dictionary> dictionary = std::make_shared<wordsim::Dictionary>(wordsim::Dictionary::fromFile(dictionaryPath));
    const wordsim::Wordle wordle{dictionary};
    wordsim::FilterGuesser bot{dictionary};

    // Echo each turn's feedback before asking the bot for the next guess
    wordsim::FunctionGuesser verbose{[&bot](wordsim::History history) {
        if (!history.empty()) {
            const auto& last = history.back();
            std::cout << history.size() << ": " << last.word << " " << wordsim::correctness::toString(last.mask) << "\n";
        }
        return bot.guess(history);
    }};

    const auto turns = wordle.play(answer, verbose);
    if (turns) {
        std::cout << *turns << ": " << answer << " " << std::string(wordsim::config::WORD_LENGTH, wordsim::correctness::symbol::CORRECT) << "\n";
        std::cout << "Found word in " << *turns << " guesses!\n";
    } else {
        std::cout << "Unable to find word in " << wordle.maxTurns() << " guesses...\n";
    }
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Argument error: expected \"stats [<dictionary> <answers> [maxTurns]]\" or \"play [<dictionary>] <answer>\"\n";
        return 1;
    }

    std::string_view command{argv[1]};
    try {
        if (command == "stats" && argc == 2) {
            stats(wordsim::config::DICTIONARY_FILE, wordsim::config::ANSWERS_FILE, wordsim::config::DEFAULT_MAX_TURNS);
            return 0;
        }

        if (command == "stats" && (argc == 4 || argc == 5)) {
            size_t maxTurns = wordsim::config::DEFAULT_MAX_TURNS;
            if (argc == 5 && !parseTurns(argv[4], maxTurns)) {
                std::cerr << "Argument error: maxTurns must be a positive integer, got: " << argv[4] << "\n";
                return 1;
            }
            stats(argv[2], argv[3], maxTurns);
            return 0;
        }

        if (command == "play" && argc == 3) {
            play(wordsim::config::DICTIONARY_FILE, argv[2]);
            return 0;
        }

        if (command == "play" && argc == 4) {
            play(argv[2], argv[3]);
            return 0;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Argument error: invalid command \"" << command << "\"\n";
    return 1;
}
