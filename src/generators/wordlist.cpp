/**
 * Wordlist loading and word distance.
 */

#include "wordlist.hpp"
#include "../core/errors.hpp"
#include "../core/hashing.hpp"

#include <algorithm>
#include <fstream>

namespace seedhound {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

}  // namespace

Wordlist::Wordlist(std::vector<std::string> words, std::string name)
    : words_(std::move(words)), name_(std::move(name)) {
    if (words_.empty()) {
        throw ConfigurationError("wordlist " + name_ + " is empty");
    }

    std::string serialized;
    index_.reserve(words_.size());
    for (size_t i = 0; i < words_.size(); i++) {
        auto [it, inserted] = index_.emplace(words_[i], static_cast<uint32_t>(i));
        if (!inserted) {
            throw ConfigurationError("wordlist " + name_ + ": duplicate word '" + words_[i] +
                                     "' at lines " + std::to_string(it->second + 1) +
                                     " and " + std::to_string(i + 1));
        }
        append_field(serialized, words_[i]);
    }
    digest_ = xxh3_64_hex(serialized);
}

std::shared_ptr<const Wordlist> Wordlist::load(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigurationError("cannot open wordlist: " + path);
    }

    std::vector<std::string> words;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        words.push_back(line);
    }

    return std::shared_ptr<const Wordlist>(new Wordlist(std::move(words), path));
}

std::shared_ptr<const Wordlist> Wordlist::from_words(std::vector<std::string> words,
                                                     std::string name) {
    return std::shared_ptr<const Wordlist>(new Wordlist(std::move(words), std::move(name)));
}

int32_t Wordlist::index_of(std::string_view word) const {
    auto it = index_.find(std::string(word));
    return it == index_.end() ? -1 : static_cast<int32_t>(it->second);
}

std::vector<uint32_t> Wordlist::close_words(uint32_t index, uint32_t max_distance) const {
    std::vector<uint32_t> result;
    const std::string& base = words_[index];
    for (uint32_t i = 0; i < words_.size(); i++) {
        if (i == index) continue;
        // Length difference is a lower bound on the distance
        size_t len_diff = base.size() > words_[i].size() ? base.size() - words_[i].size()
                                                         : words_[i].size() - base.size();
        if (len_diff > max_distance) continue;
        if (edit_distance(base, words_[i]) <= max_distance) {
            result.push_back(i);
        }
    }
    return result;
}

uint32_t edit_distance(std::string_view a, std::string_view b) {
    const size_t n = a.size();
    const size_t m = b.size();
    std::vector<std::vector<uint32_t>> d(n + 1, std::vector<uint32_t>(m + 1, 0));

    for (size_t i = 0; i <= n; i++) d[i][0] = static_cast<uint32_t>(i);
    for (size_t j = 0; j <= m; j++) d[0][j] = static_cast<uint32_t>(j);

    for (size_t i = 1; i <= n; i++) {
        for (size_t j = 1; j <= m; j++) {
            uint32_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            d[i][j] = std::min({d[i - 1][j] + 1, d[i][j - 1] + 1, d[i - 1][j - 1] + cost});
            if (i > 1 && j > 1 && a[i - 1] == b[j - 2] && a[i - 2] == b[j - 1]) {
                d[i][j] = std::min(d[i][j], d[i - 2][j - 2] + 1);
            }
        }
    }
    return d[n][m];
}

}  // namespace seedhound
