/**
 * Seedhound Mutation Expander
 *
 * Counts and decodes the variants of a single slot (typos, typos-map
 * substitutions, seed word replacements) and the word-swap permutations of a
 * whole candidate. Nothing is materialized: every family is a table of exact
 * counts plus a rank -> variant decoder and its inverse.
 *
 * Edit model: at most one edit per character of a token. A transpose swaps a
 * character with the next one and consumes both. Per character, single-typo
 * edits are ordered case, repeat, delete, replace (charset order), insert
 * (charset order); then transpose; then typos-map substitutions. Repeat and
 * delete are not offered on a character whose left neighbour is the same
 * character and left unchanged: the edit on the neighbour renders the same
 * text.
 */

#pragma once

#include "../core/types.hpp"
#include "token_model.hpp"
#include "wordlist.hpp"

#include <algorithm>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace seedhound {

// -----------------------------------------------------------------------------
// Options and budget
// -----------------------------------------------------------------------------

struct TypoOptions {
    bool case_toggle = false;
    bool repeat = false;
    bool delete_char = false;
    bool transpose = false;
    std::string replace_set;               // empty: replace disabled
    std::string insert_set;                // empty: insert disabled
    std::map<char, std::string> typos_map; // character -> replacement characters
    uint32_t close_distance = 0;           // seed mode: 0 = any other word

    bool any_typo() const {
        return case_toggle || repeat || delete_char || transpose ||
               !replace_set.empty() || !insert_set.empty();
    }

    /** Stable text form, part of the search space fingerprint. */
    std::string canonical() const;
};

/**
 * Load a typos map. Each line holds the characters to replace and, after
 * whitespace, the characters that may replace them:
 *
 *   aA  @4
 *   oO  0
 *
 * @throws ConfigurationError on unreadable files or malformed lines
 */
std::map<char, std::string> load_typos_map(const std::string& path);

struct MutationBudget {
    uint32_t max_typos = 0;
    uint32_t max_swaps = 0;
    uint32_t max_substitutions = 0;
    uint32_t max_combined = 0;   // cap on swaps + substitutions + typos, 0 = none

    bool allows(uint32_t swaps, uint32_t substitutions, uint32_t typos) const {
        if (swaps > max_swaps || substitutions > max_substitutions || typos > max_typos) {
            return false;
        }
        return max_combined == 0 || swaps + substitutions + typos <= max_combined;
    }

    bool is_zero() const {
        return max_typos == 0 && max_swaps == 0 && max_substitutions == 0;
    }

    uint32_t typo_limit() const {
        return max_combined ? std::min(max_typos, max_combined) : max_typos;
    }
    uint32_t substitution_limit() const {
        return max_combined ? std::min(max_substitutions, max_combined) : max_substitutions;
    }
    uint32_t swap_limit() const {
        return max_combined ? std::min(max_swaps, max_combined) : max_swaps;
    }
};

// -----------------------------------------------------------------------------
// Swaps
// -----------------------------------------------------------------------------

/**
 * Number of ways to pick `swaps` disjoint pairs out of `length` slots:
 * length! / (swaps! * 2^swaps * (length - 2*swaps)!).
 */
Ordinal swap_count(uint32_t length, uint32_t swaps);

/**
 * Ranking of disjoint pair sets using M(n,k) = M(n-1,k) + (n-1) M(n-2,k-1):
 * the first free slot is either left alone (lower ranks) or paired with one
 * of the later free slots, nearest first.
 */
class SwapTable {
public:
    SwapTable(uint32_t length, uint32_t max_swaps);

    uint32_t length() const { return length_; }

    /** M(n, k); zero when k exceeds the table. */
    const Ordinal& count(uint32_t n, uint32_t k) const;

    std::vector<SwapPair> unrank(uint32_t swaps, Ordinal rank) const;

    /** @throws std::invalid_argument for overlapping or out-of-range pairs */
    Ordinal rank(const std::vector<SwapPair>& pairs) const;

private:
    uint32_t length_;
    uint32_t max_swaps_;
    std::vector<Ordinal> table_;   // (length+1) x (max_swaps+1)
};

/** Apply disjoint slot swaps to rendered slot texts. */
void apply_swaps(std::vector<std::string>& pieces, const std::vector<SwapPair>& swaps);

// -----------------------------------------------------------------------------
// Per-token typos
// -----------------------------------------------------------------------------

/**
 * E[j][r][t][w]: number of edit scripts over characters j..end of one token
 * with exactly t typos and w typos-map substitutions. r is set when
 * character j follows an unchanged copy of itself.
 */
class TokenTypos {
public:
    TokenTypos(const std::string& token, const TypoOptions& options,
               uint32_t max_typos, uint32_t max_substitutions);

    const Ordinal& count(uint32_t typos, uint32_t substitutions) const {
        return at(0, false, typos, substitutions);
    }

    std::vector<TokenEdit> decode(uint32_t typos, uint32_t substitutions, Ordinal rank) const;

    /** Rank of `edits` inside its (typos, substitutions) class. */
    Ordinal encode(const std::vector<TokenEdit>& edits) const;

private:
    struct CharOps {
        bool can_case = false;
        std::string replace;    // replace set minus this character
        std::string map;        // typos-map entries for this character
        bool can_transpose = false;
        bool same_as_prev = false;
        uint32_t single = 0;    // case + repeat + delete + |replace| + |insert|
    };

    size_t cell(size_t j, bool r, uint32_t t, uint32_t w) const {
        return ((j * 2 + (r ? 1 : 0)) * (max_t_ + 1) + t) * (max_w_ + 1) + w;
    }
    const Ordinal& at(size_t j, bool r, uint32_t t, uint32_t w) const { return table_[cell(j, r, t, w)]; }
    Ordinal& at(size_t j, bool r, uint32_t t, uint32_t w) { return table_[cell(j, r, t, w)]; }

    // State of character j + 1 when character j is left unchanged
    bool follows_unchanged(size_t j) const {
        return j + 1 < ops_.size() && ops_[j + 1].same_as_prev;
    }
    bool skips_repeat_delete(size_t j, bool r) const { return r && ops_[j].same_as_prev; }
    uint32_t single_count(size_t j, bool r) const;

    TokenEdit single_edit(size_t j, bool r, uint32_t op) const;
    uint32_t single_index(size_t j, bool r, const TokenEdit& edit) const;

    std::string token_;
    std::string insert_;
    bool repeat_;
    bool delete_;
    uint32_t max_t_;
    uint32_t max_w_;
    std::vector<CharOps> ops_;
    std::vector<Ordinal> table_;   // (n+1) x 2 x (max_t+1) x (max_w+1)
};

/** Render a token with its edits applied. Edits must be sorted by offset. */
std::string apply_edits(const std::string& token, const std::vector<TokenEdit>& edits);

// -----------------------------------------------------------------------------
// Per-slot variants
// -----------------------------------------------------------------------------

/**
 * V(t, w) for one slot: the sum over its alternatives of their variant
 * counts, with per-(t, w) prefix sums so the alternative holding a rank is
 * found by binary search.
 */
class PositionVariants {
public:
    PositionVariants(const PositionSpec& pos, RecoveryMode mode, const TypoOptions& options,
                     std::shared_ptr<const Wordlist> wordlist,
                     uint32_t max_typos, uint32_t max_substitutions);

    const Ordinal& count(uint32_t typos, uint32_t substitutions) const;

    uint32_t max_typos() const { return max_t_; }
    uint32_t max_substitutions() const { return max_w_; }

    SlotChoice decode(uint32_t typos, uint32_t substitutions, const Ordinal& rank) const;

    /**
     * Rank of an ordinary (non-anchor) choice inside its class.
     * @throws std::invalid_argument if the choice is not a variant of this slot
     */
    Ordinal encode(const SlotChoice& choice) const;

    std::string render(const SlotChoice& choice) const;

    static void edit_counts(const SlotChoice& choice, uint32_t& typos, uint32_t& substitutions);

private:
    struct AltVariants {
        std::unique_ptr<TokenTypos> typos;   // password literals
        int32_t word = -1;                   // seed literals: wordlist index
        std::vector<uint32_t> close;         // seed: replacement words when limited
    };

    size_t class_index(uint32_t t, uint32_t w) const { return t * (max_w_ + 1) + w; }
    Ordinal word_replacements(const AltVariants& av) const;
    Ordinal alt_count(size_t alt, uint32_t t, uint32_t w) const;

    std::vector<Alternative> alternatives_;
    RecoveryMode mode_;
    std::shared_ptr<const Wordlist> wordlist_;
    bool close_only_;
    uint32_t max_t_;
    uint32_t max_w_;
    bool unit_;                                  // all alternatives count 1 at (0,0)
    std::vector<AltVariants> variants_;
    std::vector<std::vector<Ordinal>> prefix_;   // per class: alternatives + 1 entries
};

}  // namespace seedhound
