/**
 * Candidate space counting, decoding and encoding.
 */

#include "candidate_space.hpp"
#include "../core/errors.hpp"
#include "../core/hashing.hpp"

#include <algorithm>
#include <stdexcept>

namespace seedhound {

CandidateSpace::CandidateSpace(TokenModel model, MutationBudget budget, TypoOptions typos)
    : model_(std::move(model)), budget_(budget), typos_(std::move(typos)),
      plain_(false), max_t_(0), max_w_(0), mask_count_(1), full_mask_(0) {
    const size_t length = model_.positions.size();
    if (length == 0) {
        throw ConfigurationError("search space has no slots");
    }
    if (model_.anchors.size() > MAX_RANGE_ANCHORS) {
        throw ConfigurationError("at most " + std::to_string(MAX_RANGE_ANCHORS) +
                                 " range anchors are supported");
    }

    bool has_anchors = !model_.anchors.empty();
    for (const auto& pos : model_.positions) {
        if (pos.anchored) has_anchors = true;
    }
    if (budget_.max_swaps > 0 && has_anchors) {
        throw ConfigurationError("word swaps cannot be combined with anchors: a swap would "
                                 "move an anchored token out of its slot");
    }

    max_t_ = budget_.typo_limit();
    max_w_ = model_.mode == RecoveryMode::SEED ? 0 : budget_.substitution_limit();
    plain_ = budget_.is_zero() && model_.anchors.empty();

    variants_.reserve(length);
    for (const auto& pos : model_.positions) {
        variants_.emplace_back(pos, model_.mode, typos_, model_.wordlist, max_t_, max_w_);
    }

    const uint32_t swaps = std::min<uint32_t>(budget_.swap_limit(),
                                              static_cast<uint32_t>(length / 2));
    swap_table_ = std::make_unique<SwapTable>(static_cast<uint32_t>(length), swaps);

    if (!plain_) build_ways();
    build_classes();

    if (cardinality_ == 0) {
        throw ConfigurationError("over-constrained search space: no candidate satisfies "
                                 "the anchors, alternatives and budget");
    }

    fingerprint_ = xxh3_128_hex(canonical());
}

void CandidateSpace::build_ways() {
    const size_t length = model_.positions.size();
    const size_t anchors = model_.anchors.size();
    mask_count_ = 1u << anchors;
    full_mask_ = mask_count_ - 1;

    ways_.assign((length + 1) * mask_count_ * (max_t_ + 1) * (max_w_ + 1), Ordinal(0));
    ways(length, full_mask_, 0, 0) = 1;

    for (size_t i = length; i-- > 0;) {
        const PositionVariants& v = variants_[i];
        for (uint32_t mask = 0; mask < mask_count_; mask++) {
            for (uint32_t t = 0; t <= max_t_; t++) {
                for (uint32_t w = 0; w <= max_w_; w++) {
                    Ordinal total = 0;
                    for (uint32_t dt = 0; dt <= std::min(t, v.max_typos()); dt++) {
                        for (uint32_t dw = 0; dw <= std::min(w, v.max_substitutions()); dw++) {
                            const Ordinal& here = v.count(dt, dw);
                            if (here == 0) continue;
                            total += here * ways(i + 1, mask, t - dt, w - dw);
                        }
                    }
                    for (size_t a = 0; a < anchors; a++) {
                        const uint32_t bit = 1u << a;
                        if ((mask & bit) || !model_.anchors[a].covers(static_cast<uint32_t>(i))) {
                            continue;
                        }
                        total += ways(i + 1, mask | bit, t, w);
                    }
                    ways(i, mask, t, w) = total;
                }
            }
        }
    }
}

void CandidateSpace::build_classes() {
    const uint32_t length = static_cast<uint32_t>(model_.positions.size());

    Ordinal plain_inner = 1;
    if (plain_) {
        for (const auto& v : variants_) plain_inner *= v.count(0, 0);
    }

    for (uint32_t s = 0; s <= budget_.swap_limit(); s++) {
        for (uint32_t w = 0; w <= max_w_; w++) {
            for (uint32_t t = 0; t <= max_t_; t++) {
                if (!budget_.allows(s, w, t)) continue;

                BudgetClass cls;
                cls.swaps = s;
                cls.substitutions = w;
                cls.typos = t;
                cls.inner = plain_ ? plain_inner : ways(0, 0, t, w);
                cls.count = swap_count(length, s) * cls.inner;
                if (cls.count == 0) continue;
                classes_.push_back(std::move(cls));
            }
        }
    }

    std::stable_sort(classes_.begin(), classes_.end(),
                     [](const BudgetClass& a, const BudgetClass& b) {
                         uint32_t ta = a.swaps + a.substitutions + a.typos;
                         uint32_t tb = b.swaps + b.substitutions + b.typos;
                         if (ta != tb) return ta < tb;
                         if (a.swaps != b.swaps) return a.swaps < b.swaps;
                         return a.substitutions < b.substitutions;
                     });

    cardinality_ = 0;
    for (auto& cls : classes_) {
        cls.offset = cardinality_;
        cardinality_ += cls.count;
    }
}

Candidate CandidateSpace::candidate_at(const Ordinal& ordinal) const {
    if (ordinal < 0 || ordinal >= cardinality_) {
        throw std::out_of_range("ordinal " + ordinal.get_str() + " outside [0, " +
                                cardinality_.get_str() + ")");
    }

    auto it = std::upper_bound(classes_.begin(), classes_.end(), ordinal,
                               [](const Ordinal& o, const BudgetClass& cls) {
                                   return o < cls.offset;
                               });
    const BudgetClass& cls = *(it - 1);

    Candidate cand;
    cand.ordinal = ordinal;
    cand.slots.resize(variants_.size());

    Ordinal rest = ordinal - cls.offset;

    if (plain_) {
        Ordinal digit;
        for (size_t i = variants_.size(); i-- > 0;) {
            const Ordinal& radix = variants_[i].count(0, 0);
            mpz_fdiv_qr(rest.get_mpz_t(), digit.get_mpz_t(), rest.get_mpz_t(),
                        radix.get_mpz_t());
            cand.slots[i] = variants_[i].decode(0, 0, digit);
        }
        cand.text = render(cand.slots, cand.swaps);
        return cand;
    }

    Ordinal swap_rank;
    mpz_fdiv_qr(swap_rank.get_mpz_t(), rest.get_mpz_t(), rest.get_mpz_t(),
                cls.inner.get_mpz_t());
    if (cls.swaps > 0) {
        cand.swaps = swap_table_->unrank(cls.swaps, swap_rank);
    }

    uint32_t mask = 0;
    uint32_t t = cls.typos;
    uint32_t w = cls.substitutions;
    Ordinal local;

    for (size_t i = 0; i < variants_.size(); i++) {
        const PositionVariants& v = variants_[i];
        bool placed = false;

        for (uint32_t dt = 0; dt <= std::min(t, v.max_typos()) && !placed; dt++) {
            for (uint32_t dw = 0; dw <= std::min(w, v.max_substitutions()); dw++) {
                const Ordinal& here = v.count(dt, dw);
                if (here == 0) continue;
                const Ordinal& after = ways(i + 1, mask, t - dt, w - dw);
                if (after == 0) continue;

                Ordinal block = here * after;
                if (rest < block) {
                    mpz_fdiv_qr(local.get_mpz_t(), rest.get_mpz_t(), rest.get_mpz_t(),
                                after.get_mpz_t());
                    cand.slots[i] = v.decode(dt, dw, local);
                    t -= dt;
                    w -= dw;
                    placed = true;
                    break;
                }
                rest -= block;
            }
        }

        for (size_t a = 0; a < model_.anchors.size() && !placed; a++) {
            const uint32_t bit = 1u << a;
            if ((mask & bit) || !model_.anchors[a].covers(static_cast<uint32_t>(i))) continue;

            const Ordinal& after = ways(i + 1, mask | bit, t, w);
            if (rest < after) {
                cand.slots[i].anchor = static_cast<int32_t>(a);
                mask |= bit;
                placed = true;
                break;
            }
            rest -= after;
        }

        if (!placed) {
            throw std::logic_error("candidate decoding overran slot " + std::to_string(i + 1));
        }
    }

    cand.text = render(cand.slots, cand.swaps);
    return cand;
}

Ordinal CandidateSpace::ordinal_of(const Candidate& candidate) const {
    if (candidate.slots.size() != variants_.size()) {
        throw std::invalid_argument("candidate has " + std::to_string(candidate.slots.size()) +
                                    " slots, space has " + std::to_string(variants_.size()));
    }

    uint32_t typos = 0;
    uint32_t substitutions = 0;
    for (const auto& slot : candidate.slots) {
        uint32_t t, w;
        PositionVariants::edit_counts(slot, t, w);
        typos += t;
        substitutions += w;
    }
    const uint32_t swaps = static_cast<uint32_t>(candidate.swaps.size());

    auto it = std::find_if(classes_.begin(), classes_.end(), [&](const BudgetClass& cls) {
        return cls.swaps == swaps && cls.substitutions == substitutions && cls.typos == typos;
    });
    if (it == classes_.end()) {
        throw std::invalid_argument("candidate is outside the mutation budget");
    }
    const BudgetClass& cls = *it;

    if (plain_) {
        Ordinal rank = 0;
        for (size_t i = 0; i < variants_.size(); i++) {
            rank *= variants_[i].count(0, 0);
            rank += variants_[i].encode(candidate.slots[i]);
        }
        return cls.offset + rank;
    }

    Ordinal swap_rank = 0;
    if (swaps > 0) swap_rank = swap_table_->rank(candidate.swaps);

    Ordinal rank = 0;
    uint32_t mask = 0;
    uint32_t t = typos;
    uint32_t w = substitutions;

    for (size_t i = 0; i < variants_.size(); i++) {
        const PositionVariants& v = variants_[i];
        const SlotChoice& slot = candidate.slots[i];

        if (slot.anchor < 0) {
            uint32_t st, sw;
            PositionVariants::edit_counts(slot, st, sw);
            if (st > std::min(t, v.max_typos()) || sw > std::min(w, v.max_substitutions())) {
                throw std::invalid_argument("slot " + std::to_string(i + 1) +
                                            " carries more edits than allowed");
            }

            // Blocks of (dt, dw) classes that precede this slot's class
            for (uint32_t dt = 0; dt <= st; dt++) {
                for (uint32_t dw = 0; dw <= std::min(w, v.max_substitutions()); dw++) {
                    if (dt == st && dw == sw) break;
                    rank += v.count(dt, dw) * ways(i + 1, mask, t - dt, w - dw);
                }
            }

            rank += v.encode(slot) * ways(i + 1, mask, t - st, w - sw);
            t -= st;
            w -= sw;
            continue;
        }

        const size_t a = static_cast<size_t>(slot.anchor);
        const uint32_t bit = 1u << a;
        if (a >= model_.anchors.size() || (mask & bit) ||
            !model_.anchors[a].covers(static_cast<uint32_t>(i))) {
            throw std::invalid_argument("anchor " + std::to_string(a) +
                                        " cannot occupy slot " + std::to_string(i + 1));
        }
        if (slot.alternative != 0 || slot.expansion != 0 || !slot.edits.empty()) {
            throw std::invalid_argument("anchored slot " + std::to_string(i + 1) +
                                        " cannot carry a choice or edits");
        }

        for (uint32_t dt = 0; dt <= std::min(t, v.max_typos()); dt++) {
            for (uint32_t dw = 0; dw <= std::min(w, v.max_substitutions()); dw++) {
                rank += v.count(dt, dw) * ways(i + 1, mask, t - dt, w - dw);
            }
        }
        for (size_t b = 0; b < a; b++) {
            const uint32_t other = 1u << b;
            if ((mask & other) || !model_.anchors[b].covers(static_cast<uint32_t>(i))) continue;
            rank += ways(i + 1, mask | other, t, w);
        }
        mask |= bit;
    }

    if (mask != full_mask_ || t != 0 || w != 0) {
        throw std::invalid_argument("candidate does not place every anchor exactly once");
    }

    return cls.offset + swap_rank * cls.inner + rank;
}

std::string CandidateSpace::render(const std::vector<SlotChoice>& slots,
                                   const std::vector<SwapPair>& swaps) const {
    std::vector<std::string> pieces(slots.size());
    for (size_t i = 0; i < slots.size(); i++) {
        if (slots[i].anchor >= 0) {
            pieces[i] = model_.anchors[static_cast<size_t>(slots[i].anchor)].token;
        } else {
            pieces[i] = variants_[i].render(slots[i]);
        }
    }
    apply_swaps(pieces, swaps);

    std::string text;
    for (const auto& piece : pieces) {
        if (piece.empty()) continue;
        if (!text.empty()) text += model_.separator;
        text += piece;
    }
    return text;
}

std::string CandidateSpace::canonical() const {
    std::string out = "seedhound-space-1;";
    out += mode_name(model_.mode);
    out += ';';
    append_field(out, model_.separator);
    out += "budget=" + std::to_string(budget_.max_typos) + "," +
           std::to_string(budget_.max_swaps) + "," +
           std::to_string(budget_.max_substitutions) + "," +
           std::to_string(budget_.max_combined) + ";";
    out += typos_.canonical();
    append_field(out, model_.wordlist ? model_.wordlist->digest() : std::string("-"));

    for (const auto& pos : model_.positions) {
        out += "slot:";
        out += pos.required ? 'R' : 'O';
        out += pos.allow_mutation ? 'M' : 'F';
        out += pos.anchored ? 'A' : '-';
        out += std::to_string(pos.alternatives.size()) + ";";
        for (const auto& alt : pos.alternatives) {
            if (alt.is_wildcard()) {
                out += 'W';
                append_field(out, alt.wildcard->canonical());
            } else {
                out += 'L';
                append_field(out, alt.text);
            }
        }
    }

    for (const auto& anchor : model_.anchors) {
        out += "anchor:" + std::to_string(anchor.first) + "," + std::to_string(anchor.last) + ";";
        append_field(out, anchor.token);
    }
    return out;
}

}  // namespace seedhound
