/**
 * Candidate Space Tests
 *
 * Enumeration order, cardinality, anchors, swaps and the ordinal bijection.
 */

#include "../src/generators/candidate_space.hpp"
#include "../src/core/errors.hpp"
#include <cassert>
#include <cctype>
#include <iostream>
#include <map>

using namespace seedhound;

static TokenModel tokens(const std::string& text) {
    return TokenListParser().parse_string(text);
}

static std::vector<std::string> all_texts(const CandidateSpace& space) {
    std::vector<std::string> out;
    for (Ordinal i = 0; i < space.cardinality(); ++i) out.push_back(space.text_at(i));
    return out;
}

static void check_bijection(const CandidateSpace& space) {
    for (Ordinal i = 0; i < space.cardinality(); ++i) {
        Candidate c = space.candidate_at(i);
        assert(c.ordinal == i);
        assert(space.ordinal_of(c) == i);
    }
}

// Edit scripts of one literal token with exactly t typos and w
// substitutions, counted straight from the edit rules.
static unsigned long count_scripts(const std::string& tok, const TypoOptions& opt, size_t j,
                                   bool after_same, uint32_t t, uint32_t w) {
    const size_t n = tok.size();
    if (j == n) {
        if (t == 0 && w == 0) return 1;
        return (t == 1 && w == 0) ? opt.insert_set.size() : 0;
    }

    const char c = tok[j];
    unsigned long total = count_scripts(tok, opt, j + 1, j + 1 < n && tok[j + 1] == c, t, w);
    if (t >= 1) {
        unsigned long singles = opt.insert_set.size();
        if (opt.case_toggle && std::isalpha(static_cast<unsigned char>(c))) singles++;
        if (opt.repeat && !after_same) singles++;
        if (opt.delete_char && !after_same) singles++;
        for (char r : opt.replace_set) {
            if (r != c) singles++;
        }
        total += singles * count_scripts(tok, opt, j + 1, false, t - 1, w);
        if (opt.transpose && j + 1 < n && tok[j + 1] != c) {
            total += count_scripts(tok, opt, j + 2, false, t - 1, w);
        }
    }
    if (w >= 1) {
        auto it = opt.typos_map.find(c);
        if (it != opt.typos_map.end()) {
            total += it->second.size() * count_scripts(tok, opt, j + 1, false, t, w - 1);
        }
    }
    return total;
}

// Disjoint pair sets of size k over `length` slots, by trying every subset
// of pairs.
static unsigned long count_swap_sets(uint32_t length, uint32_t k) {
    std::vector<std::pair<uint32_t, uint32_t>> pairs;
    for (uint32_t a = 0; a < length; a++) {
        for (uint32_t b = a + 1; b < length; b++) pairs.emplace_back(a, b);
    }

    unsigned long found = 0;
    for (unsigned long subset = 0; subset < (1UL << pairs.size()); subset++) {
        uint32_t used = 0;
        uint32_t picked = 0;
        bool disjoint = true;
        for (size_t i = 0; i < pairs.size() && disjoint; i++) {
            if (!(subset & (1UL << i))) continue;
            uint32_t bits = (1u << pairs[i].first) | (1u << pairs[i].second);
            if (used & bits) disjoint = false;
            used |= bits;
            picked++;
        }
        if (disjoint && picked == k) found++;
    }
    return found;
}

using SlotCounts = std::map<std::pair<uint32_t, uint32_t>, unsigned long>;

// Variants of every slot by (typos, substitutions), summed over all slot
// combinations and swap sets the budget admits.
static unsigned long brute_force_cardinality(const TokenModel& model, const TypoOptions& opt,
                                             const MutationBudget& budget) {
    const std::map<std::string, unsigned long> wildcard_sizes = {{"%d", 10}, {"%[xy]", 2}};

    std::vector<SlotCounts> slots;
    for (const auto& pos : model.positions) {
        SlotCounts counts;
        for (const auto& alt : pos.alternatives) {
            if (alt.is_wildcard()) {
                counts[{0, 0}] += wildcard_sizes.at(alt.text);
                continue;
            }
            if (alt.text.empty()) {
                counts[{0, 0}] += 1;
                continue;
            }
            for (uint32_t t = 0; t <= budget.max_typos; t++) {
                for (uint32_t w = 0; w <= budget.max_substitutions; w++) {
                    unsigned long n = count_scripts(alt.text, opt, 0, false, t, w);
                    if (n > 0) counts[{t, w}] += n;
                }
            }
        }
        slots.push_back(counts);
    }

    const uint32_t length = static_cast<uint32_t>(slots.size());
    unsigned long total = 0;
    std::vector<SlotCounts::const_iterator> pick(slots.size());
    for (size_t i = 0; i < slots.size(); i++) pick[i] = slots[i].begin();

    while (true) {
        uint32_t typos = 0, substitutions = 0;
        unsigned long product = 1;
        for (const auto& it : pick) {
            typos += it->first.first;
            substitutions += it->first.second;
            product *= it->second;
        }
        for (uint32_t s = 0; s <= budget.max_swaps; s++) {
            if (budget.allows(s, substitutions, typos)) {
                total += count_swap_sets(length, s) * product;
            }
        }

        size_t i = slots.size();
        while (i > 0) {
            i--;
            if (++pick[i] != slots[i].end()) break;
            pick[i] = slots[i].begin();
            if (i == 0) return total;
        }
        if (slots.empty()) return total;
    }
}

void test_cardinality_matches_brute_force() {
    TypoOptions opt;
    opt.case_toggle = true;
    opt.repeat = true;
    opt.delete_char = true;
    opt.transpose = true;
    opt.replace_set = "x";
    opt.insert_set = "z";
    opt.typos_map['a'] = "@4";

    const std::vector<std::string> lists = {
        "ab c\n? %d\nxa\n",
        "aab\n? Pz\n%[xy] q\n",
        "a\nb\nc\nd\n",
    };

    size_t checked = 0;
    for (const auto& text : lists) {
        TokenModel model = tokens(text);
        for (uint32_t t = 0; t <= 2; t++) {
            for (uint32_t s = 0; s <= 2; s++) {
                for (uint32_t w = 0; w <= 1; w++) {
                    for (uint32_t c = 0; c <= 2; c++) {
                        MutationBudget budget;
                        budget.max_typos = t;
                        budget.max_swaps = s;
                        budget.max_substitutions = w;
                        budget.max_combined = c;

                        CandidateSpace space(model, budget, opt);
                        assert(space.cardinality() == brute_force_cardinality(model, opt, budget));
                        checked++;
                    }
                }
            }
        }
    }
    assert(checked == 3 * 54);

    std::cout << "[PASS] Cardinality matches brute force\n";
}

void test_mixed_radix() {
    CandidateSpace space(tokens("a b\nx y\n"));
    assert(space.cardinality() == 4);
    assert((all_texts(space) == std::vector<std::string>{"ax", "ay", "bx", "by"}));
    check_bijection(space);

    std::cout << "[PASS] Mixed radix order\n";
}

void test_optional_and_wildcard() {
    CandidateSpace space(tokens("pin\n? %d\n"));
    assert(space.cardinality() == 11);
    assert(space.text_at(0) == "pin0");
    assert(space.text_at(9) == "pin9");
    assert(space.text_at(10) == "pin");
    check_bijection(space);

    std::cout << "[PASS] Optional slots and wildcards\n";
}

void test_swaps() {
    MutationBudget budget;
    budget.max_swaps = 1;
    CandidateSpace space(tokens("a\nb\nc\nd\n"), budget);

    assert(space.cardinality() == 7);
    assert((all_texts(space) == std::vector<std::string>{
        "abcd", "abdc", "acbd", "adcb", "bacd", "cbad", "dbca"}));
    check_bijection(space);

    budget.max_swaps = 2;
    CandidateSpace two(tokens("a\nb\nc\nd\n"), budget);
    assert(two.cardinality() == 1 + 6 + 3);

    std::cout << "[PASS] Word swaps\n";
}

void test_range_anchor() {
    CandidateSpace space(tokens("a b\nc\n^1,2^X\n"));
    assert(space.cardinality() == 3);
    assert((all_texts(space) == std::vector<std::string>{"aX", "bX", "Xc"}));
    check_bijection(space);

    CandidateSpace exact(tokens("a b\nc\n^2^Z\n"));
    assert((all_texts(exact) == std::vector<std::string>{"aZ", "bZ"}));

    std::cout << "[PASS] Anchors\n";
}

void test_typos() {
    TypoOptions opt;
    opt.case_toggle = true;
    MutationBudget budget;
    budget.max_typos = 1;

    CandidateSpace space(tokens("ab\n"), budget, opt);
    assert(space.cardinality() == 3);
    assert((all_texts(space) == std::vector<std::string>{"ab", "aB", "Ab"}));

    Candidate c = space.candidate_at(2);
    assert(c.typo_count() == 1);
    assert(c.substitution_count() == 0);

    std::cout << "[PASS] Typo classes\n";
}

void test_budget_classes_ordered() {
    TypoOptions opt;
    opt.case_toggle = true;
    opt.delete_char = true;
    opt.typos_map['a'] = "@";
    MutationBudget budget;
    budget.max_typos = 2;
    budget.max_swaps = 1;
    budget.max_substitutions = 1;
    budget.max_combined = 2;

    CandidateSpace space(tokens("a B\n? %d\ncd\n"), budget, opt);

    uint32_t last_total = 0;
    for (const auto& cls : space.classes()) {
        uint32_t total = cls.swaps + cls.substitutions + cls.typos;
        assert(total >= last_total);
        assert(total <= 2);
        last_total = total;
    }
    assert(space.classes().front().typos == 0 && space.classes().front().swaps == 0);

    check_bijection(space);

    // Edit counts of every candidate match the class it was decoded from
    for (const auto& cls : space.classes()) {
        Candidate c = space.candidate_at(cls.offset);
        assert(c.typo_count() == cls.typos);
        assert(c.substitution_count() == cls.substitutions);
        assert(c.swaps.size() == cls.swaps);
    }

    std::cout << "[PASS] Budget classes ordered and bijective\n";
}

void test_anchors_with_typos() {
    TypoOptions opt;
    opt.case_toggle = true;
    MutationBudget budget;
    budget.max_typos = 1;

    CandidateSpace space(tokens("a b\nc\nd\n^1,3^X\n"), budget, opt);
    check_bijection(space);

    // The anchored token itself is never mutated
    for (Ordinal i = 0; i < space.cardinality(); ++i) {
        assert(space.text_at(i).find('x') == std::string::npos);
    }

    std::cout << "[PASS] Anchors combined with typos\n";
}

void test_seed_mode() {
    auto words = Wordlist::from_words({"w0", "w1", "w2", "w3", "w4", "w5", "w6", "w7"});

    CandidateSpace plain(parse_mnemonic("w0 ? w2", words));
    assert(plain.cardinality() == 8);
    assert(plain.text_at(0) == "w0 w0 w2");
    assert(plain.text_at(7) == "w0 w7 w2");

    MutationBudget budget;
    budget.max_typos = 1;
    CandidateSpace typos(parse_mnemonic("w0 ? w2", words), budget);
    assert(typos.cardinality() == 8 + 112);
    // Rightmost slot varies fastest: the last word is replaced first
    assert(typos.text_at(8) == "w0 w0 w0");
    assert(typos.text_at(8 + 56) == "w1 w0 w2");
    check_bijection(typos);

    std::cout << "[PASS] Seed mode\n";
}

void test_fingerprint() {
    CandidateSpace a(tokens("a b\nx y\n"));
    CandidateSpace b(tokens("a b\nx y\n"));
    CandidateSpace c(tokens("a b\ny x\n"));
    MutationBudget budget;
    budget.max_swaps = 1;
    CandidateSpace d(tokens("a b\nx y\n"), budget);

    assert(a.fingerprint().size() == 32);
    assert(a.fingerprint() == b.fingerprint());
    assert(a.fingerprint() != c.fingerprint());
    assert(a.fingerprint() != d.fingerprint());

    std::cout << "[PASS] Fingerprint\n";
}

void test_errors() {
    bool threw = false;
    try {
        CandidateSpace space(tokens("a\nb\nc\n^1,2^X\n^1,2^Y\n^1,2^Z\n"));
    } catch (const ConfigurationError& e) {
        threw = std::string(e.what()).find("over-constrained") != std::string::npos;
    }
    assert(threw);

    threw = false;
    try {
        MutationBudget budget;
        budget.max_swaps = 1;
        CandidateSpace space(tokens("a\nb\n^1,2^X\n"), budget);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);

    CandidateSpace space(tokens("a b\n"));
    threw = false;
    try {
        space.candidate_at(2);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    Candidate foreign;
    foreign.slots.resize(3);
    threw = false;
    try {
        space.ordinal_of(foreign);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] Errors\n";
}

int main() {
    std::cout << "=== Candidate Space Tests ===\n\n";

    test_mixed_radix();
    test_optional_and_wildcard();
    test_swaps();
    test_range_anchor();
    test_typos();
    test_budget_classes_ordered();
    test_anchors_with_typos();
    test_seed_mode();
    test_fingerprint();
    test_errors();
    test_cardinality_matches_brute_force();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
