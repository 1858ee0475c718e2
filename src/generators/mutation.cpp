/**
 * Mutation tables: typos, substitutions, word replacement and swaps.
 */

#include "mutation.hpp"
#include "../core/errors.hpp"
#include "../core/hashing.hpp"

#include <cctype>
#include <fstream>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace seedhound {

namespace {

const Ordinal ZERO = 0;

char toggle_case(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    if (std::islower(u)) return static_cast<char>(std::toupper(u));
    if (std::isupper(u)) return static_cast<char>(std::tolower(u));
    return c;
}

uint32_t char_value(char c) {
    return static_cast<unsigned char>(c);
}

}  // namespace

// -----------------------------------------------------------------------------
// TypoOptions
// -----------------------------------------------------------------------------

std::string TypoOptions::canonical() const {
    std::string out;
    out += case_toggle ? "case;" : "-;";
    out += repeat ? "repeat;" : "-;";
    out += delete_char ? "delete;" : "-;";
    out += transpose ? "transpose;" : "-;";
    append_field(out, replace_set);
    append_field(out, insert_set);
    for (const auto& [c, entries] : typos_map) {
        append_field(out, std::string(1, c));
        append_field(out, entries);
    }
    out += "close=" + std::to_string(close_distance) + ";";
    return out;
}

std::map<char, std::string> load_typos_map(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigurationError("cannot open typos map: " + path);
    }

    std::map<char, std::string> map;
    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        line_no++;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        size_t first = line.find_first_not_of(" \t");
        if (first == std::string::npos || line[first] == '#') continue;

        std::istringstream fields(line);
        std::string from, to, extra;
        fields >> from >> to;
        if (to.empty() || (fields >> extra)) {
            throw ConfigurationError(path + ":" + std::to_string(line_no) +
                                     ": expected '<characters> <replacements>'");
        }

        for (char c : from) {
            std::string& entries = map[c];
            for (char r : to) {
                if (r != c && entries.find(r) == std::string::npos) entries += r;
            }
        }
    }

    for (auto it = map.begin(); it != map.end();) {
        if (it->second.empty()) {
            it = map.erase(it);
        } else {
            ++it;
        }
    }
    return map;
}

// -----------------------------------------------------------------------------
// Swaps
// -----------------------------------------------------------------------------

Ordinal swap_count(uint32_t length, uint32_t swaps) {
    if (2ULL * swaps > length) return 0;

    Ordinal numerator, remaining, swaps_fact;
    mpz_fac_ui(numerator.get_mpz_t(), length);
    mpz_fac_ui(remaining.get_mpz_t(), length - 2 * swaps);
    mpz_fac_ui(swaps_fact.get_mpz_t(), swaps);

    Ordinal denominator = remaining * swaps_fact;
    mpz_mul_2exp(denominator.get_mpz_t(), denominator.get_mpz_t(), swaps);
    return numerator / denominator;
}

SwapTable::SwapTable(uint32_t length, uint32_t max_swaps)
    : length_(length), max_swaps_(max_swaps),
      table_(static_cast<size_t>(length + 1) * (max_swaps + 1), Ordinal(0)) {
    auto cell = [this](uint32_t n, uint32_t k) -> Ordinal& {
        return table_[static_cast<size_t>(n) * (max_swaps_ + 1) + k];
    };

    for (uint32_t n = 0; n <= length_; n++) {
        cell(n, 0) = 1;
        for (uint32_t k = 1; k <= max_swaps_; k++) {
            if (n < 2) continue;
            cell(n, k) = cell(n - 1, k) + (n - 1) * cell(n - 2, k - 1);
        }
    }
}

const Ordinal& SwapTable::count(uint32_t n, uint32_t k) const {
    if (n > length_ || k > max_swaps_) return ZERO;
    return table_[static_cast<size_t>(n) * (max_swaps_ + 1) + k];
}

std::vector<SwapPair> SwapTable::unrank(uint32_t swaps, Ordinal rank) const {
    std::vector<uint32_t> free(length_);
    std::iota(free.begin(), free.end(), 0u);

    std::vector<SwapPair> pairs;
    uint32_t k = swaps;
    while (k > 0) {
        uint32_t n = static_cast<uint32_t>(free.size());
        if (n < 2) {
            throw std::out_of_range("swap rank out of range");
        }

        const Ordinal& unpaired = count(n - 1, k);
        if (rank < unpaired) {
            free.erase(free.begin());
            continue;
        }
        rank -= unpaired;

        const Ordinal& block = count(n - 2, k - 1);
        Ordinal which;
        mpz_fdiv_qr(which.get_mpz_t(), rank.get_mpz_t(), rank.get_mpz_t(), block.get_mpz_t());
        size_t partner = 1 + which.get_ui();
        if (partner >= free.size()) {
            throw std::out_of_range("swap rank out of range");
        }

        pairs.emplace_back(free[0], free[partner]);
        free.erase(free.begin() + static_cast<std::ptrdiff_t>(partner));
        free.erase(free.begin());
        k--;
    }
    return pairs;
}

Ordinal SwapTable::rank(const std::vector<SwapPair>& pairs) const {
    if (pairs.size() > max_swaps_) {
        throw std::invalid_argument("too many swaps: " + std::to_string(pairs.size()));
    }

    std::vector<int64_t> partner(length_, -1);
    for (const auto& [a, b] : pairs) {
        if (a >= b || b >= length_ || partner[a] >= 0 || partner[b] >= 0) {
            throw std::invalid_argument("invalid swap pair (" + std::to_string(a) + ", " +
                                        std::to_string(b) + ")");
        }
        partner[a] = b;
        partner[b] = a;
    }

    std::vector<uint32_t> free(length_);
    std::iota(free.begin(), free.end(), 0u);

    Ordinal rank = 0;
    uint32_t k = static_cast<uint32_t>(pairs.size());
    while (k > 0) {
        uint32_t n = static_cast<uint32_t>(free.size());
        uint32_t first = free.front();
        if (partner[first] < 0) {
            free.erase(free.begin());
            continue;
        }

        size_t p = 1;
        while (free[p] != static_cast<uint32_t>(partner[first])) p++;

        rank += count(n - 1, k);
        rank += static_cast<unsigned long>(p - 1) * count(n - 2, k - 1);

        free.erase(free.begin() + static_cast<std::ptrdiff_t>(p));
        free.erase(free.begin());
        k--;
    }
    return rank;
}

void apply_swaps(std::vector<std::string>& pieces, const std::vector<SwapPair>& swaps) {
    for (const auto& [a, b] : swaps) {
        std::swap(pieces[a], pieces[b]);
    }
}

// -----------------------------------------------------------------------------
// TokenTypos
// -----------------------------------------------------------------------------

TokenTypos::TokenTypos(const std::string& token, const TypoOptions& options,
                       uint32_t max_typos, uint32_t max_substitutions)
    : token_(token), insert_(options.insert_set), repeat_(options.repeat),
      delete_(options.delete_char), max_t_(max_typos), max_w_(max_substitutions) {
    const size_t n = token_.size();
    ops_.resize(n);

    for (size_t j = 0; j < n; j++) {
        const char c = token_[j];
        CharOps& ops = ops_[j];
        ops.can_case = options.case_toggle && std::isalpha(static_cast<unsigned char>(c));
        for (char r : options.replace_set) {
            if (r != c) ops.replace += r;
        }
        auto it = options.typos_map.find(c);
        if (it != options.typos_map.end()) ops.map = it->second;
        ops.can_transpose = options.transpose && j + 1 < n && token_[j + 1] != c;
        ops.same_as_prev = j > 0 && token_[j - 1] == c;
        ops.single = (ops.can_case ? 1 : 0) + (repeat_ ? 1 : 0) + (delete_ ? 1 : 0) +
                     static_cast<uint32_t>(ops.replace.size() + insert_.size());
    }

    table_.assign((n + 1) * 2 * (max_t_ + 1) * (max_w_ + 1), Ordinal(0));

    // Past the last character only an insertion at the end is possible
    for (bool r : {false, true}) {
        at(n, r, 0, 0) = 1;
        if (max_t_ >= 1) at(n, r, 1, 0) = static_cast<unsigned long>(insert_.size());
    }

    for (size_t j = n; j-- > 0;) {
        const CharOps& ops = ops_[j];
        const bool next = follows_unchanged(j);
        for (bool r : {false, true}) {
            const uint32_t single = single_count(j, r);
            for (uint32_t t = 0; t <= max_t_; t++) {
                for (uint32_t w = 0; w <= max_w_; w++) {
                    Ordinal v = at(j + 1, next, t, w);
                    if (t >= 1) {
                        v += single * at(j + 1, false, t - 1, w);
                        if (ops.can_transpose) v += at(j + 2, false, t - 1, w);
                    }
                    if (w >= 1 && !ops.map.empty()) {
                        v += static_cast<unsigned long>(ops.map.size()) * at(j + 1, false, t, w - 1);
                    }
                    at(j, r, t, w) = v;
                }
            }
        }
    }
}

uint32_t TokenTypos::single_count(size_t j, bool r) const {
    uint32_t single = ops_[j].single;
    if (skips_repeat_delete(j, r)) single -= (repeat_ ? 1 : 0) + (delete_ ? 1 : 0);
    return single;
}

TokenEdit TokenTypos::single_edit(size_t j, bool r, uint32_t op) const {
    const CharOps& ops = ops_[j];
    const uint32_t offset = static_cast<uint32_t>(j);
    const bool skip = skips_repeat_delete(j, r);

    if (ops.can_case) {
        if (op == 0) return TokenEdit{offset, EditKind::CASE, 0};
        op--;
    }
    if (repeat_ && !skip) {
        if (op == 0) return TokenEdit{offset, EditKind::REPEAT, 0};
        op--;
    }
    if (delete_ && !skip) {
        if (op == 0) return TokenEdit{offset, EditKind::DELETE, 0};
        op--;
    }
    if (op < ops.replace.size()) {
        return TokenEdit{offset, EditKind::REPLACE, char_value(ops.replace[op])};
    }
    op -= static_cast<uint32_t>(ops.replace.size());
    return TokenEdit{offset, EditKind::INSERT, char_value(insert_[op])};
}

uint32_t TokenTypos::single_index(size_t j, bool r, const TokenEdit& edit) const {
    const CharOps& ops = ops_[j];
    const bool skip = skips_repeat_delete(j, r);
    uint32_t base = 0;

    auto bad = [&edit]() {
        return std::invalid_argument("edit not available at offset " + std::to_string(edit.offset));
    };

    if (edit.kind == EditKind::CASE) {
        if (!ops.can_case) throw bad();
        return 0;
    }
    base += ops.can_case ? 1 : 0;

    if (edit.kind == EditKind::REPEAT) {
        if (!repeat_ || skip) throw bad();
        return base;
    }
    base += (repeat_ && !skip) ? 1 : 0;

    if (edit.kind == EditKind::DELETE) {
        if (!delete_ || skip) throw bad();
        return base;
    }
    base += (delete_ && !skip) ? 1 : 0;

    if (edit.kind == EditKind::REPLACE) {
        for (size_t i = 0; i < ops.replace.size(); i++) {
            if (char_value(ops.replace[i]) == edit.value) return base + static_cast<uint32_t>(i);
        }
        throw bad();
    }
    base += static_cast<uint32_t>(ops.replace.size());

    if (edit.kind == EditKind::INSERT) {
        for (size_t i = 0; i < insert_.size(); i++) {
            if (char_value(insert_[i]) == edit.value) return base + static_cast<uint32_t>(i);
        }
    }
    throw bad();
}

std::vector<TokenEdit> TokenTypos::decode(uint32_t typos, uint32_t substitutions,
                                          Ordinal rank) const {
    std::vector<TokenEdit> edits;
    const size_t n = token_.size();
    uint32_t t = typos;
    uint32_t w = substitutions;
    size_t j = 0;
    bool r = false;
    Ordinal which;

    while (j < n) {
        const CharOps& ops = ops_[j];

        const Ordinal& unchanged = at(j + 1, follows_unchanged(j), t, w);
        if (rank < unchanged) {
            r = follows_unchanged(j);
            j++;
            continue;
        }
        rank -= unchanged;

        const uint32_t single = single_count(j, r);
        if (t >= 1 && single > 0) {
            const Ordinal& block = at(j + 1, false, t - 1, w);
            Ordinal total = single * block;
            if (rank < total) {
                mpz_fdiv_qr(which.get_mpz_t(), rank.get_mpz_t(), rank.get_mpz_t(),
                            block.get_mpz_t());
                edits.push_back(single_edit(j, r, static_cast<uint32_t>(which.get_ui())));
                t--;
                j++;
                r = false;
                continue;
            }
            rank -= total;
        }

        if (t >= 1 && ops.can_transpose) {
            const Ordinal& block = at(j + 2, false, t - 1, w);
            if (rank < block) {
                edits.push_back(TokenEdit{static_cast<uint32_t>(j), EditKind::TRANSPOSE, 0});
                t--;
                j += 2;
                r = false;
                continue;
            }
            rank -= block;
        }

        if (w >= 1 && !ops.map.empty()) {
            const Ordinal& block = at(j + 1, false, t, w - 1);
            Ordinal total = static_cast<unsigned long>(ops.map.size()) * block;
            if (rank < total) {
                mpz_fdiv_qr(which.get_mpz_t(), rank.get_mpz_t(), rank.get_mpz_t(),
                            block.get_mpz_t());
                edits.push_back(TokenEdit{static_cast<uint32_t>(j), EditKind::MAP,
                                          char_value(ops.map[which.get_ui()])});
                w--;
                j++;
                r = false;
                continue;
            }
        }

        throw std::out_of_range("typo rank out of range for token '" + token_ + "'");
    }

    if (t == 1 && w == 0 && j == n) {
        if (rank >= static_cast<unsigned long>(insert_.size())) {
            throw std::out_of_range("typo rank out of range for token '" + token_ + "'");
        }
        edits.push_back(TokenEdit{static_cast<uint32_t>(n), EditKind::INSERT,
                                  char_value(insert_[rank.get_ui()])});
    } else if (t != 0 || w != 0 || rank != 0) {
        throw std::out_of_range("typo rank out of range for token '" + token_ + "'");
    }
    return edits;
}

Ordinal TokenTypos::encode(const std::vector<TokenEdit>& edits) const {
    const size_t n = token_.size();
    uint32_t t = 0;
    uint32_t w = 0;
    for (size_t k = 0; k < edits.size(); k++) {
        if (k > 0 && edits[k].offset <= edits[k - 1].offset) {
            throw std::invalid_argument("edits must be sorted by strictly increasing offset");
        }
        if (edits[k].kind == EditKind::MAP) {
            w++;
        } else {
            t++;
        }
    }
    if (t > max_t_ || w > max_w_) {
        throw std::invalid_argument("edit count exceeds the typo table of '" + token_ + "'");
    }

    Ordinal rank = 0;
    size_t k = 0;
    size_t j = 0;
    bool r = false;
    while (j < n) {
        if (k >= edits.size() || edits[k].offset != j) {
            r = follows_unchanged(j);
            j++;
            continue;
        }

        const TokenEdit& edit = edits[k++];
        const CharOps& ops = ops_[j];
        const bool restricted = r;
        const uint32_t single = single_count(j, restricted);
        rank += at(j + 1, follows_unchanged(j), t, w);
        r = false;

        switch (edit.kind) {
            case EditKind::TRANSPOSE:
                if (!ops.can_transpose) {
                    throw std::invalid_argument("transpose not available at offset " +
                                                std::to_string(j));
                }
                rank += single * at(j + 1, false, t - 1, w);
                t--;
                j += 2;
                break;

            case EditKind::MAP: {
                size_t idx = ops.map.find(static_cast<char>(edit.value));
                if (ops.map.empty() || idx == std::string::npos) {
                    throw std::invalid_argument("substitution not available at offset " +
                                                std::to_string(j));
                }
                if (t >= 1) {
                    rank += single * at(j + 1, false, t - 1, w);
                    if (ops.can_transpose) rank += at(j + 2, false, t - 1, w);
                }
                rank += static_cast<unsigned long>(idx) * at(j + 1, false, t, w - 1);
                w--;
                j++;
                break;
            }

            case EditKind::WORD:
                throw std::invalid_argument("word replacement applied to a password token");

            default: {
                uint32_t op = single_index(j, restricted, edit);
                rank += op * at(j + 1, false, t - 1, w);
                t--;
                j++;
                break;
            }
        }
    }

    if (k < edits.size()) {
        const TokenEdit& edit = edits[k++];
        size_t idx = insert_.find(static_cast<char>(edit.value));
        if (k != edits.size() || edit.offset != n || edit.kind != EditKind::INSERT ||
            idx == std::string::npos || t != 1 || w != 0) {
            throw std::invalid_argument("edit at offset " + std::to_string(edit.offset) +
                                        " is not valid for token '" + token_ + "'");
        }
        rank += static_cast<unsigned long>(idx);
        t--;
    }

    if (t != 0 || w != 0) {
        throw std::invalid_argument("edits do not form a valid script for '" + token_ + "'");
    }
    return rank;
}

std::string apply_edits(const std::string& token, const std::vector<TokenEdit>& edits) {
    const size_t n = token.size();
    std::string out;
    out.reserve(n + 2);

    size_t k = 0;
    for (size_t j = 0; j <= n; j++) {
        if (k < edits.size() && edits[k].offset == j) {
            const TokenEdit& e = edits[k++];
            switch (e.kind) {
                case EditKind::CASE:
                    out += toggle_case(token[j]);
                    break;
                case EditKind::REPEAT:
                    out += token[j];
                    out += token[j];
                    break;
                case EditKind::DELETE:
                    break;
                case EditKind::REPLACE:
                case EditKind::MAP:
                    out += static_cast<char>(e.value);
                    break;
                case EditKind::INSERT:
                    out += static_cast<char>(e.value);
                    if (j < n) out += token[j];
                    break;
                case EditKind::TRANSPOSE:
                    out += token[j + 1];
                    out += token[j];
                    j++;
                    break;
                case EditKind::WORD:
                    break;
            }
            continue;
        }
        if (j < n) out += token[j];
    }
    return out;
}

// -----------------------------------------------------------------------------
// PositionVariants
// -----------------------------------------------------------------------------

PositionVariants::PositionVariants(const PositionSpec& pos, RecoveryMode mode,
                                   const TypoOptions& options,
                                   std::shared_ptr<const Wordlist> wordlist,
                                   uint32_t max_typos, uint32_t max_substitutions)
    : alternatives_(pos.alternatives), mode_(mode), wordlist_(std::move(wordlist)),
      close_only_(mode == RecoveryMode::SEED && options.close_distance > 0),
      max_t_(0), max_w_(0), unit_(true) {
    if (pos.allow_mutation) {
        if (mode_ == RecoveryMode::SEED) {
            // One replacement per word; typos-map does not apply to words
            max_t_ = std::min<uint32_t>(max_typos, 1);
        } else {
            max_t_ = options.any_typo() ? max_typos : 0;
            max_w_ = options.typos_map.empty() ? 0 : max_substitutions;
        }
    }
    if (mode_ == RecoveryMode::SEED && max_t_ > 0 && !wordlist_) {
        throw ConfigurationError("seed word replacement requires a wordlist");
    }

    variants_.resize(alternatives_.size());
    for (size_t a = 0; a < alternatives_.size(); a++) {
        const Alternative& alt = alternatives_[a];
        if (alt.is_wildcard()) {
            unit_ = false;
            continue;
        }
        if (alt.text.empty() || (max_t_ == 0 && max_w_ == 0)) continue;

        AltVariants& av = variants_[a];
        if (mode_ == RecoveryMode::PASSWORD) {
            av.typos = std::make_unique<TokenTypos>(alt.text, options, max_t_, max_w_);
        } else {
            av.word = wordlist_->index_of(alt.text);
            if (av.word < 0) {
                throw ConfigurationError("word '" + alt.text + "' is not in wordlist " +
                                         wordlist_->name());
            }
            if (close_only_) {
                av.close = wordlist_->close_words(static_cast<uint32_t>(av.word),
                                                  options.close_distance);
            }
        }
    }

    prefix_.resize(static_cast<size_t>(max_t_ + 1) * (max_w_ + 1));
    for (uint32_t t = 0; t <= max_t_; t++) {
        for (uint32_t w = 0; w <= max_w_; w++) {
            auto& prefix = prefix_[class_index(t, w)];
            prefix.assign(alternatives_.size() + 1, Ordinal(0));
            for (size_t a = 0; a < alternatives_.size(); a++) {
                prefix[a + 1] = prefix[a] + alt_count(a, t, w);
            }
        }
    }
}

Ordinal PositionVariants::word_replacements(const AltVariants& av) const {
    if (close_only_) return static_cast<unsigned long>(av.close.size());
    return static_cast<unsigned long>(wordlist_->size() - 1);
}

Ordinal PositionVariants::alt_count(size_t a, uint32_t t, uint32_t w) const {
    const Alternative& alt = alternatives_[a];
    const AltVariants& av = variants_[a];

    if (t == 0 && w == 0) return alt.count();
    if (alt.is_wildcard()) return 0;
    if (av.typos) return av.typos->count(t, w);
    if (av.word >= 0 && t == 1 && w == 0) return word_replacements(av);
    return 0;
}

const Ordinal& PositionVariants::count(uint32_t typos, uint32_t substitutions) const {
    if (typos > max_t_ || substitutions > max_w_) return ZERO;
    return prefix_[class_index(typos, substitutions)].back();
}

SlotChoice PositionVariants::decode(uint32_t typos, uint32_t substitutions,
                                    const Ordinal& rank) const {
    if (rank >= count(typos, substitutions) || rank < 0) {
        throw std::out_of_range("slot rank out of range");
    }

    const auto& prefix = prefix_[class_index(typos, substitutions)];
    SlotChoice choice;

    size_t a;
    if (unit_ && typos == 0 && substitutions == 0) {
        a = rank.get_ui();
    } else {
        auto it = std::upper_bound(prefix.begin() + 1, prefix.end(), rank);
        a = static_cast<size_t>(it - (prefix.begin() + 1));
    }
    choice.alternative = static_cast<uint32_t>(a);

    Ordinal local = rank - prefix[a];
    const Alternative& alt = alternatives_[a];
    const AltVariants& av = variants_[a];

    if (alt.is_wildcard()) {
        choice.expansion = local;
    } else if (typos == 0 && substitutions == 0) {
        // unchanged literal
    } else if (av.typos) {
        choice.edits = av.typos->decode(typos, substitutions, local);
    } else {
        uint32_t r = static_cast<uint32_t>(local.get_ui());
        uint32_t word;
        if (close_only_) {
            word = av.close[r];
        } else {
            word = r < static_cast<uint32_t>(av.word) ? r : r + 1;
        }
        choice.edits.push_back(TokenEdit{0, EditKind::WORD, word});
    }
    return choice;
}

Ordinal PositionVariants::encode(const SlotChoice& choice) const {
    if (choice.anchor >= 0 || choice.alternative >= alternatives_.size()) {
        throw std::invalid_argument("alternative " + std::to_string(choice.alternative) +
                                    " does not exist in this slot");
    }

    uint32_t t, w;
    edit_counts(choice, t, w);
    if (t > max_t_ || w > max_w_) {
        throw std::invalid_argument("too many edits for this slot");
    }

    const size_t a = choice.alternative;
    const Alternative& alt = alternatives_[a];
    const AltVariants& av = variants_[a];
    Ordinal base = prefix_[class_index(t, w)][a];

    if (alt.is_wildcard()) {
        if (!choice.edits.empty() || choice.expansion < 0 || choice.expansion >= alt.count()) {
            throw std::invalid_argument("invalid wildcard expansion for '" + alt.text + "'");
        }
        return base + choice.expansion;
    }

    if (choice.expansion != 0) {
        throw std::invalid_argument("literal token '" + alt.text + "' has no expansions");
    }
    if (choice.edits.empty()) return base;

    if (av.typos) return base + av.typos->encode(choice.edits);

    const TokenEdit& edit = choice.edits.front();
    if (av.word < 0 || choice.edits.size() != 1 || edit.kind != EditKind::WORD ||
        edit.offset != 0 || edit.value >= wordlist_->size() ||
        edit.value == static_cast<uint32_t>(av.word)) {
        throw std::invalid_argument("invalid word replacement for '" + alt.text + "'");
    }

    if (close_only_) {
        auto it = std::lower_bound(av.close.begin(), av.close.end(), edit.value);
        if (it == av.close.end() || *it != edit.value) {
            throw std::invalid_argument("word replacement is not a close word of '" +
                                        alt.text + "'");
        }
        return base + static_cast<unsigned long>(it - av.close.begin());
    }
    uint32_t r = edit.value < static_cast<uint32_t>(av.word) ? edit.value : edit.value - 1;
    return base + r;
}

std::string PositionVariants::render(const SlotChoice& choice) const {
    const Alternative& alt = alternatives_[choice.alternative];
    if (alt.is_wildcard()) return alt.wildcard->expand(choice.expansion);
    if (choice.edits.empty()) return alt.text;
    if (choice.edits.front().kind == EditKind::WORD) {
        return wordlist_->word(choice.edits.front().value);
    }
    return apply_edits(alt.text, choice.edits);
}

void PositionVariants::edit_counts(const SlotChoice& choice, uint32_t& typos,
                                   uint32_t& substitutions) {
    typos = 0;
    substitutions = 0;
    for (const auto& e : choice.edits) {
        if (e.kind == EditKind::MAP) {
            substitutions++;
        } else {
            typos++;
        }
    }
}

}  // namespace seedhound
