/**
 * Token list and mnemonic description parsing.
 */

#include "token_model.hpp"
#include "../core/errors.hpp"
#include "../core/logger.hpp"

#include <fstream>
#include <sstream>

namespace seedhound {

namespace {

struct RawToken {
    std::string text;               // unescaped; \% is kept as %%
    std::vector<size_t> carets;     // offsets of unescaped '^' in text
    bool dollar_end = false;        // last character is an unescaped '$'
    bool plain = true;              // no escape sequences used
};

struct PendingAnchor {
    std::string token;
    uint32_t first = 0;
    uint32_t last = 0;
    bool at_end = false;            // "token$": resolved to the last slot
    size_t line = 0;
};

std::vector<RawToken> tokenize(const std::string& line, const std::string& where) {
    std::vector<RawToken> tokens;
    RawToken cur;
    bool in_token = false;

    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];

        if (c == '\\') {
            if (i + 1 >= line.size()) {
                throw ConfigurationError(where + ": trailing backslash");
            }
            char e = line[++i];
            switch (e) {
                case '#': case ' ': case '\t': case '\\':
                case '+': case '?': case '^': case '$':
                    cur.text += e;
                    break;
                case '%':
                    cur.text += "%%";
                    break;
                default:
                    throw ConfigurationError(where + ": bad escape '\\" + std::string(1, e) + "'");
            }
            cur.dollar_end = false;
            cur.plain = false;
            in_token = true;
            continue;
        }

        if (c == ' ' || c == '\t') {
            if (in_token) {
                tokens.push_back(std::move(cur));
                cur = RawToken{};
                in_token = false;
            }
            continue;
        }

        if (c == '^') cur.carets.push_back(cur.text.size());
        cur.text += c;
        cur.dollar_end = (c == '$');
        in_token = true;
    }

    if (in_token) tokens.push_back(std::move(cur));
    return tokens;
}

uint32_t parse_slot_number(const std::string& s, const std::string& range, const std::string& where) {
    if (s.empty() || s.size() > 6 || s.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigurationError(where + ": unparsable anchor slot '" + range + "'");
    }
    uint32_t n = static_cast<uint32_t>(std::stoul(s));
    if (n == 0) {
        throw ConfigurationError(where + ": anchor slots are 1-based, got '" + range + "'");
    }
    return n;
}

PendingAnchor parse_anchor(const RawToken& tok, size_t line_no, const std::string& where) {
    PendingAnchor anchor;
    anchor.line = line_no;

    if (tok.carets.size() >= 2) {
        std::string range = tok.text.substr(1, tok.carets[1] - 1);
        anchor.token = tok.text.substr(tok.carets[1] + 1);
        size_t comma = range.find(',');
        if (comma == std::string::npos) {
            anchor.first = anchor.last = parse_slot_number(range, range, where);
        } else {
            anchor.first = parse_slot_number(range.substr(0, comma), range, where);
            anchor.last = parse_slot_number(range.substr(comma + 1), range, where);
        }
    } else {
        anchor.token = tok.text.substr(1);
        anchor.first = anchor.last = 1;
    }

    if (anchor.token.empty()) {
        throw ConfigurationError(where + ": empty anchor token");
    }
    if (Wildcard::is_pattern(anchor.token)) {
        throw ConfigurationError(where + ": anchored token '" + anchor.token +
                                 "' may not contain wildcards");
    }
    anchor.token = Wildcard::unescape_literal(anchor.token);
    return anchor;
}

}  // namespace

TokenModel TokenListParser::parse(std::istream& in, const std::string& source_name) const {
    TokenModel model;
    model.mode = RecoveryMode::PASSWORD;
    model.separator = "";

    std::vector<PendingAnchor> pending;
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        line_no++;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        size_t first = line.find_first_not_of(" \t");
        if (first == std::string::npos || line[first] == '#') continue;

        const std::string where = source_name + ":" + std::to_string(line_no);
        std::vector<RawToken> tokens = tokenize(line, where);
        if (tokens.empty()) continue;

        // Anchor lines declare a constraint, not a slot
        const RawToken& head = tokens.front();
        bool caret_anchor = !head.carets.empty() && head.carets.front() == 0;
        bool end_anchor = tokens.size() == 1 && head.dollar_end && head.text.size() > 1;
        if (caret_anchor || end_anchor) {
            if (tokens.size() != 1) {
                throw ConfigurationError(where + ": an anchor line must hold a single token");
            }
            if (caret_anchor) {
                pending.push_back(parse_anchor(head, line_no, where));
            } else {
                PendingAnchor anchor;
                anchor.token = head.text.substr(0, head.text.size() - 1);
                if (Wildcard::is_pattern(anchor.token)) {
                    throw ConfigurationError(where + ": anchored token '" + anchor.token +
                                             "' may not contain wildcards");
                }
                anchor.token = Wildcard::unescape_literal(anchor.token);
                anchor.at_end = true;
                anchor.line = line_no;
                pending.push_back(std::move(anchor));
            }
            continue;
        }

        PositionSpec pos;
        pos.source_line = line_no;
        size_t start = 0;
        if (head.plain && (head.text == "?" || head.text == "+")) {
            pos.required = head.text == "+";
            start = 1;
        }

        for (size_t t = start; t < tokens.size(); t++) {
            const std::string& text = tokens[t].text;
            Alternative alt;
            if (Wildcard::is_pattern(text)) {
                alt.text = text;
                alt.wildcard = std::make_shared<const Wildcard>(Wildcard::compile(text, lists_));
            } else {
                alt.text = Wildcard::unescape_literal(text);
                bool duplicate = false;
                for (const auto& existing : pos.alternatives) {
                    if (!existing.is_wildcard() && existing.text == alt.text) duplicate = true;
                }
                if (duplicate) {
                    LOG_WARN(where + ": duplicate token '" + alt.text + "' ignored");
                    continue;
                }
            }
            pos.alternatives.push_back(std::move(alt));
        }

        if (pos.alternatives.empty()) {
            throw ConfigurationError(where + ": slot " + std::to_string(model.positions.size() + 1) +
                                     " has no alternatives");
        }
        if (!pos.required) {
            pos.alternatives.push_back(Alternative{});
        }
        model.positions.push_back(std::move(pos));
    }

    const uint32_t length = static_cast<uint32_t>(model.positions.size());
    if (length == 0) {
        throw ConfigurationError(source_name + ": token list defines no slots");
    }

    std::vector<size_t> exact_line(length, 0);
    std::vector<PendingAnchor> ranges;

    for (auto& anchor : pending) {
        const std::string where = source_name + ":" + std::to_string(anchor.line);
        if (anchor.at_end) anchor.first = anchor.last = length;

        if (anchor.first > anchor.last) {
            throw ConfigurationError(where + ": anchor range " + std::to_string(anchor.first) +
                                     "," + std::to_string(anchor.last) + " is reversed");
        }
        if (anchor.last > length) {
            throw ConfigurationError(where + ": anchor slot " + std::to_string(anchor.last) +
                                     " is beyond the configured length " + std::to_string(length));
        }

        if (anchor.first != anchor.last) {
            ranges.push_back(anchor);
            continue;
        }

        uint32_t slot = anchor.first - 1;
        if (exact_line[slot] != 0) {
            throw ConfigurationError(where + ": two exact anchors on slot " +
                                     std::to_string(anchor.first) + " (lines " +
                                     std::to_string(exact_line[slot]) + " and " +
                                     std::to_string(anchor.line) + ")");
        }
        exact_line[slot] = anchor.line;

        PositionSpec& pos = model.positions[slot];
        pos.alternatives.clear();
        pos.alternatives.push_back(Alternative{anchor.token, nullptr});
        pos.required = true;
        pos.allow_mutation = false;
        pos.anchored = true;
    }

    if (ranges.size() > MAX_RANGE_ANCHORS) {
        throw ConfigurationError(source_name + ": " + std::to_string(ranges.size()) +
                                 " range anchors given, at most " +
                                 std::to_string(MAX_RANGE_ANCHORS) + " are supported");
    }

    for (const auto& pa : ranges) {
        const std::string where = source_name + ":" + std::to_string(pa.line);
        Anchor anchor;
        anchor.token = pa.token;
        anchor.first = pa.first;
        anchor.last = pa.last;
        anchor.source_line = pa.line;
        for (uint32_t s = pa.first - 1; s < pa.last; s++) {
            if (!model.positions[s].anchored) anchor.slots.push_back(s);
        }
        if (anchor.slots.empty()) {
            throw ConfigurationError(where + ": anchor '" + pa.token + "' over slots " +
                                     std::to_string(pa.first) + "," + std::to_string(pa.last) +
                                     " has no free slot");
        }

        // The anchored token may only appear through the anchor
        for (uint32_t s : anchor.slots) {
            auto& alts = model.positions[s].alternatives;
            for (auto it = alts.begin(); it != alts.end();) {
                if (!it->is_wildcard() && it->text == anchor.token) {
                    it = alts.erase(it);
                } else {
                    ++it;
                }
            }
        }
        model.anchors.push_back(std::move(anchor));
    }

    return model;
}

TokenModel TokenListParser::parse_file(const std::string& path) const {
    std::ifstream file(path);
    if (!file) {
        throw ConfigurationError("cannot open token list: " + path);
    }
    return parse(file, path);
}

TokenModel TokenListParser::parse_string(const std::string& text) const {
    std::istringstream in(text);
    return parse(in, "<tokens>");
}

TokenModel parse_mnemonic(const std::string& description,
                          std::shared_ptr<const Wordlist> wordlist) {
    if (!wordlist) {
        throw ConfigurationError("seed recovery requires a wordlist");
    }

    TokenModel model;
    model.mode = RecoveryMode::SEED;
    model.separator = " ";

    std::istringstream in(description);
    std::string word;
    size_t position = 0;
    while (in >> word) {
        position++;
        PositionSpec pos;
        pos.source_line = position;

        if (word == "?") {
            pos.allow_mutation = false;
            pos.alternatives.reserve(wordlist->size());
            for (size_t i = 0; i < wordlist->size(); i++) {
                pos.alternatives.push_back(Alternative{wordlist->word(i), nullptr});
            }
        } else {
            if (!wordlist->contains(word)) {
                throw ConfigurationError("word '" + word + "' at position " +
                                         std::to_string(position) + " is not in wordlist " +
                                         wordlist->name());
            }
            pos.alternatives.push_back(Alternative{word, nullptr});
        }
        model.positions.push_back(std::move(pos));
    }

    if (model.positions.empty()) {
        throw ConfigurationError("mnemonic description is empty");
    }

    model.wordlist = std::move(wordlist);
    return model;
}

}  // namespace seedhound
