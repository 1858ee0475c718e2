/**
 * Seedhound Core Types
 *
 * Common type definitions shared by the enumerator, the dispatcher and the
 * verification oracles.
 */

#pragma once

#include <gmpxx.h>

#include <array>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace seedhound {

/**
 * Arbitrary precision ordinal / cardinality. Candidate counts for 24-word
 * seeds with typos and swaps do not fit in 64 bits.
 */
using Ordinal = mpz_class;

enum class RecoveryMode : uint8_t {
    PASSWORD = 0,   // token list, characters concatenated
    SEED = 1,       // mnemonic words joined by a single space
};

inline const char* mode_name(RecoveryMode mode) {
    return mode == RecoveryMode::SEED ? "seed" : "password";
}

// -----------------------------------------------------------------------------
// Candidate Types
// -----------------------------------------------------------------------------

/**
 * One edit applied to a token. Offsets refer to the unedited token.
 */
enum class EditKind : uint8_t {
    CASE = 0,       // toggle case of the character
    REPEAT = 1,     // character typed twice
    DELETE = 2,     // character dropped
    REPLACE = 3,    // character replaced by `value`
    INSERT = 4,     // `value` inserted before the character (offset == size: at end)
    TRANSPOSE = 5,  // character swapped with the next one
    MAP = 6,        // character replaced by entry `value` of the typos map
    WORD = 7,       // whole word replaced by vocabulary entry `value` (seed mode)
};

struct TokenEdit {
    uint32_t offset = 0;
    EditKind kind = EditKind::CASE;
    uint32_t value = 0;

    bool operator==(const TokenEdit& other) const {
        return offset == other.offset && kind == other.kind && value == other.value;
    }
};

/**
 * What a single slot holds in a candidate.
 */
struct SlotChoice {
    int32_t anchor = -1;            // >= 0: slot holds anchored token #anchor
    uint32_t alternative = 0;       // index into PositionSpec::alternatives
    Ordinal expansion = 0;          // wildcard expansion index (0 for literals)
    std::vector<TokenEdit> edits;   // sorted by offset

    bool operator==(const SlotChoice& other) const {
        return anchor == other.anchor && alternative == other.alternative &&
               expansion == other.expansion && edits == other.edits;
    }
};

using SwapPair = std::pair<uint32_t, uint32_t>;

/**
 * A concrete password or mnemonic together with its structural description.
 * The description (slots + swaps) is what the ordinal encodes; two different
 * descriptions may render the same text.
 */
struct Candidate {
    Ordinal ordinal = 0;
    std::string text;
    std::vector<SlotChoice> slots;   // slot order, before swaps are applied
    std::vector<SwapPair> swaps;     // disjoint pairs, first < second, ascending

    uint32_t typo_count() const {
        uint32_t n = 0;
        for (const auto& s : slots)
            for (const auto& e : s.edits)
                if (e.kind != EditKind::MAP) n++;
        return n;
    }

    uint32_t substitution_count() const {
        uint32_t n = 0;
        for (const auto& s : slots)
            for (const auto& e : s.edits)
                if (e.kind == EditKind::MAP) n++;
        return n;
    }
};

// -----------------------------------------------------------------------------
// Crypto Types
// -----------------------------------------------------------------------------

/**
 * RIPEMD160(SHA256(x)) - the identifier behind P2PKH / P2WPKH addresses.
 */
struct Hash160 {
    std::array<uint8_t, 20> data{};

    bool operator==(const Hash160& other) const { return data == other.data; }
    bool operator!=(const Hash160& other) const { return data != other.data; }
    bool operator<(const Hash160& other) const { return data < other.data; }

    static Hash160 from_hex(const std::string& hex) {
        if (hex.size() != 40) {
            throw std::invalid_argument("hash160 hex must be 40 characters: " + hex);
        }
        Hash160 result;
        for (size_t i = 0; i < 20; i++) {
            int hi = hex_value(hex[i * 2]);
            int lo = hex_value(hex[i * 2 + 1]);
            if (hi < 0 || lo < 0) {
                throw std::invalid_argument("invalid hex in hash160: " + hex);
            }
            result.data[i] = static_cast<uint8_t>((hi << 4) | lo);
        }
        return result;
    }

    std::string to_hex() const {
        char hex[41];
        for (size_t i = 0; i < 20; i++) {
            std::snprintf(hex + i * 2, 3, "%02x", data[i]);
        }
        hex[40] = '\0';
        return std::string(hex);
    }

private:
    static int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
};

struct Hash160Hasher {
    size_t operator()(const Hash160& h) const {
        // Already a hash: the first 8 bytes are as good as any mix
        uint64_t v;
        std::memcpy(&v, h.data.data(), sizeof(v));
        return static_cast<size_t>(v);
    }
};

}  // namespace seedhound
