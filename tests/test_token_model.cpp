/**
 * Token Model Tests
 *
 * Token list syntax, anchors, mnemonic descriptions and configuration errors.
 */

#include "../src/generators/token_model.hpp"
#include "../src/core/errors.hpp"
#include <cassert>
#include <iostream>

using namespace seedhound;

static bool throws_config(const std::string& text, const std::string& fragment = "") {
    try {
        TokenListParser().parse_string(text);
    } catch (const ConfigurationError& e) {
        if (!fragment.empty() && std::string(e.what()).find(fragment) == std::string::npos) {
            std::cerr << "unexpected message: " << e.what() << "\n";
            return false;
        }
        return true;
    }
    return false;
}

void test_basic_slots() {
    TokenModel m = TokenListParser().parse_string(
        "# comment\n"
        "Hello hello\n"
        "\n"
        "? 123 1234\n"
        "+ World\n");

    assert(m.mode == RecoveryMode::PASSWORD);
    assert(m.separator.empty());
    assert(m.positions.size() == 3);

    assert(m.positions[0].required);
    assert(m.positions[0].alternatives.size() == 2);
    assert(m.positions[0].alternatives[1].text == "hello");

    // Optional slot gains the empty alternative last
    assert(!m.positions[1].required);
    assert(m.positions[1].alternatives.size() == 3);
    assert(m.positions[1].alternatives[2].text.empty());
    assert(m.positions[1].cardinality() == 3);

    assert(m.positions[2].required);
    assert(m.positions[2].alternatives.size() == 1);
    assert(m.positions[2].source_line == 5);

    std::cout << "[PASS] Basic slots\n";
}

void test_escapes_and_wildcards() {
    TokenModel m = TokenListParser().parse_string(
        "a\\ b \\#x \\? 50\\%\n"
        "pin%2d\n");

    const auto& alts = m.positions[0].alternatives;
    assert(alts.size() == 4);
    assert(alts[0].text == "a b");
    assert(alts[1].text == "#x");
    assert(alts[2].text == "?");
    assert(alts[3].text == "50%");
    assert(!alts[3].is_wildcard());

    const auto& w = m.positions[1].alternatives[0];
    assert(w.is_wildcard());
    assert(w.count() == 100);

    std::cout << "[PASS] Escapes and wildcards\n";
}

void test_duplicate_tokens_dropped() {
    TokenModel m = TokenListParser().parse_string("x y x\n");
    assert(m.positions[0].alternatives.size() == 2);

    std::cout << "[PASS] Duplicate tokens dropped\n";
}

void test_exact_anchors() {
    TokenModel m = TokenListParser().parse_string(
        "a b\n"
        "c d\n"
        "e f\n"
        "^2^MID\n"
        "^FIRST\n"
        "LAST$\n");

    assert(m.anchors.empty());
    assert(m.positions[0].anchored && m.positions[0].alternatives[0].text == "FIRST");
    assert(m.positions[1].anchored && m.positions[1].alternatives[0].text == "MID");
    assert(m.positions[2].anchored && m.positions[2].alternatives[0].text == "LAST");
    for (const auto& pos : m.positions) {
        assert(pos.alternatives.size() == 1);
        assert(!pos.allow_mutation);
    }

    std::cout << "[PASS] Exact anchors\n";
}

void test_range_anchors() {
    TokenModel m = TokenListParser().parse_string(
        "a X\n"
        "b\n"
        "c\n"
        "^3^c3\n"
        "^1,3^X\n");

    assert(m.anchors.size() == 1);
    const Anchor& a = m.anchors[0];
    assert(a.token == "X");
    assert(a.first == 1 && a.last == 3);
    assert(!a.exact());
    // Slot 3 is pinned by the exact anchor, so only 1 and 2 are eligible
    assert(a.slots.size() == 2);
    assert(a.covers(0) && a.covers(1) && !a.covers(2));
    // X only appears through the anchor
    assert(m.positions[0].alternatives.size() == 1);
    assert(m.positions[0].alternatives[0].text == "a");

    std::cout << "[PASS] Range anchors\n";
}

void test_configuration_errors() {
    assert(throws_config("", "no slots"));
    assert(throws_config("a\n^3^x\n", "beyond the configured length"));
    assert(throws_config("a\nb\n^1^x\n^1^y\n", "two exact anchors"));
    assert(throws_config("a\nb\n^2,1^x\n", "reversed"));
    assert(throws_config("a\n^x^y\n", "unparsable anchor slot"));
    assert(throws_config("a\n^0^y\n", "1-based"));
    assert(throws_config("a\n^1^\n", "empty anchor"));
    assert(throws_config("a\n^1^%d\n", "wildcards"));
    assert(throws_config("a \\z\n", "bad escape"));
    assert(throws_config("a\n^1^x y\n", "single token"));
    assert(throws_config("a\nb\n^1^p\n^1,1^q\n", "two exact anchors"));
    assert(throws_config("a\nb\n^1^p\n^2^q\n^1,2^r\n", "no free slot"));
    assert(throws_config("?\n", "no alternatives"));

    std::string many = "a\nb\nc\n";
    for (int i = 0; i < 13; i++) many += "^1,3^t" + std::to_string(i) + "\n";
    assert(throws_config(many, "range anchors"));

    std::cout << "[PASS] Configuration errors\n";
}

void test_mnemonic() {
    auto words = Wordlist::from_words({"apple", "banana", "cherry", "date"}, "fruit");
    TokenModel m = parse_mnemonic("banana ? date", words);

    assert(m.mode == RecoveryMode::SEED);
    assert(m.separator == " ");
    assert(m.positions.size() == 3);
    assert(m.positions[0].alternatives.size() == 1);
    assert(m.positions[0].allow_mutation);
    assert(m.positions[1].alternatives.size() == 4);
    assert(!m.positions[1].allow_mutation);
    assert(m.wordlist == words);

    bool threw = false;
    try {
        parse_mnemonic("banana kiwi", words);
    } catch (const ConfigurationError& e) {
        threw = std::string(e.what()).find("kiwi") != std::string::npos &&
                std::string(e.what()).find("position 2") != std::string::npos;
    }
    assert(threw);

    std::cout << "[PASS] Mnemonic descriptions\n";
}

int main() {
    std::cout << "=== Token Model Tests ===\n\n";

    test_basic_slots();
    test_escapes_and_wildcards();
    test_duplicate_tokens_dropped();
    test_exact_anchors();
    test_range_anchors();
    test_configuration_errors();
    test_mnemonic();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
