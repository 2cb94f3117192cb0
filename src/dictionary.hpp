#pragma once

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace wordsim {

/*
Immutable set of words accepted as guesses, together with each word's frequency weight.
Source format is one "word frequency" pair per line. Built once, then only read, so a single
instance may be shared (const) between simulators running on different threads.
*/
class Dictionary {
    // Lets string_view keys be looked up without building a std::string
    struct WordHash {
        using is_transparent = void;
        size_t operator()(std::string_view word) const noexcept {
            return std::hash<std::string_view>{}(word);
        }
    };

    std::vector<std::string> wordList;                        // Load order
    std::unordered_map<std::string, std::uint64_t, WordHash, std::equal_to<>> frequencies;

    Dictionary() = default;

public:
    using Frequency = std::uint64_t;

    // Parses every line of input. Throws guard::DictionaryError naming sourceName and the line on malformed data
    static Dictionary parse(std::istream& input, std::string_view sourceName = "<input>");
    static Dictionary fromString(std::string_view text);
    static Dictionary fromFile(const std::string& path);

    bool contains(std::string_view word) const;

    // Returns 0 for words not in the dictionary
    Frequency frequency(std::string_view word) const;

    const std::vector<std::string>& words() const noexcept {
        return wordList;
    }

    size_t size() const noexcept {
        return wordList.size();
    }

    bool empty() const noexcept {
        return wordList.empty();
    }
};

namespace vocab {
    // Whitespace separated answer words, lower-cased and validated
    std::vector<std::string> loadAnswers(std::istream& input, std::string_view sourceName = "<input>");
    std::vector<std::string> loadAnswersFile(const std::string& path);
}

}  // namespace wordsim
