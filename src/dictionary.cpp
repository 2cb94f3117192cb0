#include "dictionary.hpp"

#include <charconv>
#include <fstream>
#include <istream>
#include <sstream>

#include <boost/algorithm/string.hpp>

#include "guard.hpp"
#include "util.hpp"

namespace wordsim {

Dictionary Dictionary::parse(std::istream& input, std::string_view sourceName) {
    Dictionary dictionary;
    std::string buff;
    size_t lineNumber = 0;

    while (std::getline(input, buff)) {
        ++lineNumber;
        boost::algorithm::trim(buff);
        if (buff.empty()) continue;
        boost::algorithm::to_lower(buff);

        // Split "word frequency" at the first space
        const auto separator = buff.find(' ');
        guard::runtimeGuard<guard::DictionaryError>(separator != std::string::npos,
            "{}:{}: expected 'word frequency', got '{}'", sourceName, lineNumber, buff);

        std::string word = buff.substr(0, separator);
        std::string_view count = std::string_view{buff}.substr(separator + 1);
        guard::runtimeGuard<guard::DictionaryError>(util::isValidWord(word),
            "{}:{}: '{}' is not a {} letter word", sourceName, lineNumber, word, config::WORD_LENGTH);

        Frequency weight = 0;
        const auto [end, ec] = std::from_chars(count.data(), count.data() + count.size(), weight);
        guard::runtimeGuard<guard::DictionaryError>(ec == std::errc{} && end == count.data() + count.size() && !count.empty(),
            "{}:{}: frequency '{}' of '{}' is not a number", sourceName, lineNumber, count, word);

        const bool inserted = dictionary.frequencies.emplace(word, weight).second;
        guard::runtimeGuard<guard::DictionaryError>(inserted,
            "{}:{}: duplicate word '{}'", sourceName, lineNumber, word);
        dictionary.wordList.push_back(std::move(word));
    }

    guard::runtimeGuard<guard::DictionaryError>(!input.bad(), "failed reading {}", sourceName);
    return dictionary;
}

Dictionary Dictionary::fromString(std::string_view text) {
    std::istringstream input{std::string{text}};
    return parse(input, "<string>");
}

Dictionary Dictionary::fromFile(const std::string& path) {
    std::ifstream file{path};
    if (!file) guard::formatError<guard::DictionaryError>("failed to open {}", path);
    return parse(file, path);
}

bool Dictionary::contains(std::string_view word) const {
    return frequencies.find(word) != frequencies.end();
}

Dictionary::Frequency Dictionary::frequency(std::string_view word) const {
    auto it = frequencies.find(word);
    return it == frequencies.end() ? 0 : it->second;
}

std::vector<std::string> vocab::loadAnswers(std::istream& input, std::string_view sourceName) {
    std::vector<std::string> answers;
    std::string word;
    while (input >> word) {
        boost::algorithm::to_lower(word);
        guard::runtimeGuard<guard::DictionaryError>(util::isValidWord(word),
            "{}: answer '{}' is not a {} letter word", sourceName, word, config::WORD_LENGTH);
        answers.push_back(std::move(word));
    }
    guard::runtimeGuard<guard::DictionaryError>(!input.bad(), "failed reading {}", sourceName);
    return answers;
}

std::vector<std::string> vocab::loadAnswersFile(const std::string& path) {
    std::ifstream file{path};
    if (!file) guard::formatError<guard::DictionaryError>("failed to open {}", path);
    return loadAnswers(file, path);
}

}  // namespace wordsim
