/**
 * Seedhound Wordlist
 *
 * Mnemonic vocabulary (BIP39 English or any other list with one word per
 * line). Word order matters: a word's index is its 11-bit BIP39 value.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace seedhound {

class Wordlist {
public:
    /**
     * Load one word per line. Blank lines and lines starting with '#' are
     * skipped; surrounding whitespace is trimmed.
     *
     * @throws ConfigurationError if the file cannot be read, is empty or
     *         contains a duplicate word
     */
    static std::shared_ptr<const Wordlist> load(const std::string& path);

    static std::shared_ptr<const Wordlist> from_words(std::vector<std::string> words,
                                                      std::string name = "inline");

    size_t size() const { return words_.size(); }
    const std::string& word(size_t index) const { return words_[index]; }
    const std::string& name() const { return name_; }

    /** Index of `word`, or -1 when it is not in the list. */
    int32_t index_of(std::string_view word) const;

    bool contains(std::string_view word) const { return index_of(word) >= 0; }

    /** XXH3-64 over the word sequence; identifies the list in fingerprints. */
    const std::string& digest() const { return digest_; }

    /**
     * Indices of all other words within `max_distance` Damerau-Levenshtein
     * edits of word `index`, ascending.
     */
    std::vector<uint32_t> close_words(uint32_t index, uint32_t max_distance) const;

private:
    Wordlist(std::vector<std::string> words, std::string name);

    std::vector<std::string> words_;
    std::unordered_map<std::string, uint32_t> index_;
    std::string name_;
    std::string digest_;
};

/**
 * Optimal string alignment distance (Damerau-Levenshtein restricted to
 * non-overlapping transpositions).
 */
uint32_t edit_distance(std::string_view a, std::string_view b);

}  // namespace seedhound
