/**
 * Seedhound Candidate Space
 *
 * The ordered, countable set of candidates described by a token model, a
 * typo configuration and a mutation budget. Every candidate has exactly one
 * ordinal in [0, cardinality()); candidate_at() and ordinal_of() are exact
 * inverses on structural descriptions.
 *
 * Ordinal layout:
 *   1. budget class (swaps, substitutions, typos), ordered by total edits,
 *      then swaps, then substitutions
 *   2. swap set (most significant inside a class)
 *   3. slots left to right; the rightmost slot varies fastest
 *   4. inside a slot: ordinary choices (alternatives in declared order, fewer
 *      edits first), then placements of range anchors
 *
 * The object is immutable after construction and safe to share between
 * threads.
 */

#pragma once

#include "../core/types.hpp"
#include "mutation.hpp"
#include "token_model.hpp"

#include <memory>
#include <string>
#include <vector>

namespace seedhound {

struct BudgetClass {
    uint32_t swaps = 0;
    uint32_t substitutions = 0;
    uint32_t typos = 0;
    Ordinal inner;    // slot arrangements for one swap set
    Ordinal count;    // swap_count * inner
    Ordinal offset;   // first ordinal of the class
};

class CandidateSpace {
public:
    /**
     * @throws ConfigurationError when swaps are combined with anchors or no
     *         candidate satisfies the constraints
     */
    explicit CandidateSpace(TokenModel model, MutationBudget budget = {},
                            TypoOptions typos = {});

    CandidateSpace(const CandidateSpace&) = delete;
    CandidateSpace& operator=(const CandidateSpace&) = delete;

    const Ordinal& cardinality() const { return cardinality_; }

    /** @throws std::out_of_range unless 0 <= ordinal < cardinality() */
    Candidate candidate_at(const Ordinal& ordinal) const;

    std::string text_at(const Ordinal& ordinal) const { return candidate_at(ordinal).text; }

    /**
     * Inverse of candidate_at() on the structural description; `text` and
     * `ordinal` of the argument are ignored.
     * @throws std::invalid_argument if the description is not in this space
     */
    Ordinal ordinal_of(const Candidate& candidate) const;

    /** 32 hex characters identifying this exact space and its ordering. */
    const std::string& fingerprint() const { return fingerprint_; }

    const TokenModel& model() const { return model_; }
    const MutationBudget& budget() const { return budget_; }
    const TypoOptions& typos() const { return typos_; }
    const std::vector<BudgetClass>& classes() const { return classes_; }
    size_t slot_count() const { return model_.positions.size(); }

private:
    const Ordinal& ways(size_t slot, uint32_t mask, uint32_t t, uint32_t w) const {
        return ways_[((slot * mask_count_ + mask) * (max_t_ + 1) + t) * (max_w_ + 1) + w];
    }
    Ordinal& ways(size_t slot, uint32_t mask, uint32_t t, uint32_t w) {
        return ways_[((slot * mask_count_ + mask) * (max_t_ + 1) + t) * (max_w_ + 1) + w];
    }

    void build_ways();
    void build_classes();
    std::string canonical() const;
    std::string render(const std::vector<SlotChoice>& slots,
                       const std::vector<SwapPair>& swaps) const;

    TokenModel model_;
    MutationBudget budget_;
    TypoOptions typos_;

    std::vector<PositionVariants> variants_;
    std::unique_ptr<SwapTable> swap_table_;
    bool plain_;                 // no budget, no range anchors: pure mixed radix
    uint32_t max_t_;
    uint32_t max_w_;
    uint32_t mask_count_;
    uint32_t full_mask_;
    std::vector<Ordinal> ways_;  // W(slot, mask, t, w)

    std::vector<BudgetClass> classes_;
    Ordinal cardinality_;
    std::string fingerprint_;
};

}  // namespace seedhound
