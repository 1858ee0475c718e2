/**
 * Seedhound Token Model
 *
 * Parses a password token list or a mnemonic description into an ordered
 * list of slots (PositionSpec) plus range anchors.
 *
 * Token list syntax, one slot per line:
 *
 *   Hello hello HELLO        three alternatives for this slot
 *   ? 123 1234               optional slot (empty alternative added last)
 *   + World                  required slot (the default, '+' is accepted)
 *   %2,4d                    wildcard alternative
 *   ^3^fixed                 exact anchor: slot 3 is "fixed"
 *   ^2,4^word                range anchor: "word" in exactly one of slots 2..4
 *   ^first                   exact anchor on slot 1
 *   last$                    exact anchor on the last slot
 *   # comment
 *
 * Escapes: \# \  \\ \+ \? \^ \$ \% (a literal percent sign).
 */

#pragma once

#include "../core/types.hpp"
#include "wildcard.hpp"
#include "wordlist.hpp"

#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace seedhound {

/** Maximum number of range anchors (the slot DP is exponential in them). */
constexpr size_t MAX_RANGE_ANCHORS = 12;

struct Alternative {
    std::string text;                          // literal token, or wildcard source
    std::shared_ptr<const Wildcard> wildcard;  // set for wildcard patterns

    bool is_wildcard() const { return wildcard != nullptr; }

    Ordinal count() const { return wildcard ? wildcard->count() : Ordinal(1); }
};

struct PositionSpec {
    std::vector<Alternative> alternatives;
    bool required = true;
    bool allow_mutation = true;   // false for unknown seed words and anchored slots
    bool anchored = false;        // pinned by an exact anchor
    size_t source_line = 0;

    Ordinal cardinality() const {
        Ordinal n = 0;
        for (const auto& alt : alternatives) n += alt.count();
        return n;
    }
};

/**
 * A token that must occupy exactly one slot of [first, last] (1-based).
 * `slots` lists the eligible 0-based slots (the range minus exactly anchored
 * slots).
 */
struct Anchor {
    std::string token;
    uint32_t first = 1;
    uint32_t last = 1;
    size_t source_line = 0;
    std::vector<uint32_t> slots;

    bool exact() const { return first == last; }

    bool covers(uint32_t slot) const {
        for (uint32_t s : slots)
            if (s == slot) return true;
        return false;
    }
};

struct TokenModel {
    RecoveryMode mode = RecoveryMode::PASSWORD;
    std::vector<PositionSpec> positions;
    std::vector<Anchor> anchors;                  // range anchors only
    std::string separator;                        // "" for passwords, " " for seeds
    std::shared_ptr<const Wordlist> wordlist;     // seed mode vocabulary

    size_t slot_count() const { return positions.size(); }
};

class TokenListParser {
public:
    explicit TokenListParser(NamedLists lists = {}) : lists_(std::move(lists)) {}

    /**
     * @throws ConfigurationError naming the offending line, slot or anchor
     */
    TokenModel parse(std::istream& in, const std::string& source_name) const;
    TokenModel parse_file(const std::string& path) const;
    TokenModel parse_string(const std::string& text) const;

private:
    NamedLists lists_;
};

/**
 * Build a seed-mode model from a mnemonic description such as
 * "abandon ? ability able". '?' marks an unknown word (any vocabulary word,
 * never mutated); every other word must be in the wordlist.
 *
 * @throws ConfigurationError naming the unknown word and its position
 */
TokenModel parse_mnemonic(const std::string& description,
                          std::shared_ptr<const Wordlist> wordlist);

}  // namespace seedhound
