/**
 * Wildcard compilation and decoding.
 */

#include "wildcard.hpp"
#include "../core/errors.hpp"
#include "../core/hashing.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>

namespace seedhound {

namespace {

constexpr const char* DIGITS = "0123456789";
constexpr const char* LOWER = "abcdefghijklmnopqrstuvwxyz";
constexpr const char* UPPER = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
constexpr const char* SYMBOLS = "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~";

std::string printable_ascii() {
    std::string s;
    for (char c = 0x20; c < 0x7f; c++) s += c;
    return s;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Expand a bracket body like "a-f09_" into its characters, keeping first
// occurrence order and dropping duplicates.
std::string parse_custom_set(const std::string& body, const std::string& pattern) {
    std::string chars;
    auto add = [&chars](char c) {
        if (chars.find(c) == std::string::npos) chars += c;
    };

    for (size_t i = 0; i < body.size(); i++) {
        char c = body[i];
        if (c == '\\' && i + 1 < body.size()) {
            add(body[++i]);
        } else if (i + 2 < body.size() && body[i + 1] == '-') {
            char last = body[i + 2];
            if (last < c) {
                throw ConfigurationError("wildcard '" + pattern + "': reversed range " +
                                         std::string(1, c) + "-" + std::string(1, last));
            }
            for (int x = c; x <= last; x++) add(static_cast<char>(x));
            i += 2;
        } else {
            add(c);
        }
    }
    return chars;
}

}  // namespace

NamedLists load_wildcard_definitions(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigurationError("cannot open wildcard definition file: " + path);
    }

    std::filesystem::path base = std::filesystem::path(path).parent_path();
    NamedLists lists;
    std::string line;
    size_t line_no = 0;

    while (std::getline(file, line)) {
        line_no++;
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;

        size_t eq = trimmed.find('=');
        if (eq == std::string::npos) {
            throw ConfigurationError(path + ":" + std::to_string(line_no) +
                                     ": expected 'name = path'");
        }
        std::string name = trim(trimmed.substr(0, eq));
        std::string list_path = trim(trimmed.substr(eq + 1));
        if (name.empty() || list_path.empty()) {
            throw ConfigurationError(path + ":" + std::to_string(line_no) +
                                     ": expected 'name = path'");
        }

        std::filesystem::path resolved(list_path);
        if (resolved.is_relative()) resolved = base / resolved;

        std::ifstream list_file(resolved);
        if (!list_file) {
            throw ConfigurationError(path + ":" + std::to_string(line_no) +
                                     ": cannot open list '" + resolved.string() + "'");
        }

        auto entries = std::make_shared<NamedList>();
        std::string entry;
        while (std::getline(list_file, entry)) {
            if (!entry.empty() && entry.back() == '\r') entry.pop_back();
            if (entry.empty()) continue;
            entries->push_back(entry);
        }
        if (entries->empty()) {
            throw ConfigurationError("wildcard list '" + name + "' (" + resolved.string() +
                                     ") is empty");
        }
        lists[name] = std::move(entries);
    }

    return lists;
}

bool Wildcard::is_pattern(std::string_view pattern) {
    for (size_t i = 0; i < pattern.size(); i++) {
        if (pattern[i] != '%') continue;
        if (i + 1 < pattern.size() && pattern[i + 1] == '%') {
            i++;
            continue;
        }
        return true;
    }
    return false;
}

std::string Wildcard::unescape_literal(std::string_view pattern) {
    std::string out;
    out.reserve(pattern.size());
    for (size_t i = 0; i < pattern.size(); i++) {
        out += pattern[i];
        if (pattern[i] == '%' && i + 1 < pattern.size() && pattern[i + 1] == '%') i++;
    }
    return out;
}

Wildcard Wildcard::compile(const std::string& pattern, const NamedLists& lists) {
    Wildcard wc;
    wc.source_ = pattern;

    auto error = [&pattern](const std::string& what) {
        return ConfigurationError("wildcard '" + pattern + "': " + what);
    };

    std::string literal;
    auto flush_literal = [&]() {
        if (literal.empty()) return;
        Segment seg;
        seg.kind = SegmentKind::LITERAL;
        seg.text = literal;
        wc.segments_.push_back(std::move(seg));
        literal.clear();
    };

    size_t i = 0;
    while (i < pattern.size()) {
        char c = pattern[i];
        if (c != '%') {
            literal += c;
            i++;
            continue;
        }

        i++;
        if (i >= pattern.size()) throw error("dangling '%'");
        if (pattern[i] == '%') {
            literal += '%';
            i++;
            continue;
        }

        Segment seg;
        bool has_length = false;
        if (std::isdigit(static_cast<unsigned char>(pattern[i]))) {
            has_length = true;
            uint32_t first = 0;
            while (i < pattern.size() && std::isdigit(static_cast<unsigned char>(pattern[i]))) {
                first = first * 10 + static_cast<uint32_t>(pattern[i] - '0');
                if (first > 1000) throw error("length too large");
                i++;
            }
            uint32_t second = first;
            if (i < pattern.size() && pattern[i] == ',') {
                i++;
                if (i >= pattern.size() || !std::isdigit(static_cast<unsigned char>(pattern[i]))) {
                    throw error("expected maximum length after ','");
                }
                second = 0;
                while (i < pattern.size() && std::isdigit(static_cast<unsigned char>(pattern[i]))) {
                    second = second * 10 + static_cast<uint32_t>(pattern[i] - '0');
                    if (second > 1000) throw error("length too large");
                    i++;
                }
            }
            if (first > second) {
                throw error("minimum length " + std::to_string(first) +
                            " exceeds maximum " + std::to_string(second));
            }
            seg.min_len = first;
            seg.max_len = second;
        }

        if (i >= pattern.size()) throw error("missing wildcard type");

        char type = pattern[i++];
        seg.kind = SegmentKind::CHARSET;
        switch (type) {
            case 'd': seg.text = DIGITS; break;
            case 'a': seg.text = LOWER; break;
            case 'A': seg.text = UPPER; break;
            case 'n': seg.text = std::string(LOWER) + DIGITS; break;
            case 'N': seg.text = std::string(UPPER) + DIGITS; break;
            case 's': seg.text = SYMBOLS; break;
            case 'y': seg.text = printable_ascii(); break;
            case '[': {
                size_t close = i;
                while (close < pattern.size() && pattern[close] != ']') {
                    if (pattern[close] == '\\') close++;
                    close++;
                }
                if (close >= pattern.size()) throw error("unterminated '%['");
                seg.text = parse_custom_set(pattern.substr(i, close - i), pattern);
                i = close + 1;
                break;
            }
            case '{': {
                size_t close = pattern.find('}', i);
                if (close == std::string::npos) throw error("unterminated '%{'");
                std::string name = pattern.substr(i, close - i);
                i = close + 1;
                if (has_length) throw error("length prefix not allowed on list %{" + name + "}");
                auto it = lists.find(name);
                if (it == lists.end()) throw error("unknown wildcard list '" + name + "'");
                seg.kind = SegmentKind::LIST;
                seg.list = it->second;
                seg.list_name = name;
                break;
            }
            default:
                throw error(std::string("unknown wildcard type '") + type + "'");
        }

        if (seg.kind == SegmentKind::CHARSET && seg.text.empty()) {
            throw error("empty character set");
        }

        flush_literal();
        compute_count(seg);
        wc.segments_.push_back(std::move(seg));
    }
    flush_literal();

    wc.total_ = 1;
    for (const auto& seg : wc.segments_) {
        wc.total_ *= seg.count;
    }
    return wc;
}

void Wildcard::compute_count(Segment& seg) {
    switch (seg.kind) {
        case SegmentKind::LITERAL:
            seg.count = 1;
            break;
        case SegmentKind::LIST:
            seg.count = static_cast<unsigned long>(seg.list->size());
            break;
        case SegmentKind::CHARSET: {
            seg.count = 0;
            Ordinal block;
            for (uint32_t len = seg.min_len; len <= seg.max_len; len++) {
                mpz_ui_pow_ui(block.get_mpz_t(), seg.text.size(), len);
                seg.count += block;
            }
            break;
        }
    }
}

void Wildcard::expand_segment(const Segment& seg, Ordinal index, std::string& out) {
    switch (seg.kind) {
        case SegmentKind::LITERAL:
            out += seg.text;
            return;
        case SegmentKind::LIST:
            out += (*seg.list)[index.get_ui()];
            return;
        case SegmentKind::CHARSET: {
            const unsigned long base = seg.text.size();
            Ordinal block;
            for (uint32_t len = seg.min_len; len <= seg.max_len; len++) {
                mpz_ui_pow_ui(block.get_mpz_t(), base, len);
                if (index >= block) {
                    index -= block;
                    continue;
                }
                std::string digits(len, '\0');
                for (uint32_t k = len; k > 0; k--) {
                    unsigned long d = mpz_fdiv_q_ui(index.get_mpz_t(), index.get_mpz_t(), base);
                    digits[k - 1] = seg.text[d];
                }
                out += digits;
                return;
            }
            return;
        }
    }
}

std::string Wildcard::expand(const Ordinal& index) const {
    std::vector<Ordinal> digits(segments_.size());
    Ordinal rest = index;
    for (size_t s = segments_.size(); s > 0; s--) {
        const Segment& seg = segments_[s - 1];
        mpz_fdiv_qr(rest.get_mpz_t(), digits[s - 1].get_mpz_t(),
                    rest.get_mpz_t(), seg.count.get_mpz_t());
    }

    std::string out;
    for (size_t s = 0; s < segments_.size(); s++) {
        expand_segment(segments_[s], digits[s], out);
    }
    return out;
}

std::string Wildcard::canonical() const {
    std::string out;
    append_field(out, source_);
    for (const auto& seg : segments_) {
        if (seg.kind != SegmentKind::LIST) continue;
        std::string entries;
        for (const auto& e : *seg.list) append_field(entries, e);
        append_field(out, seg.list_name);
        append_field(out, xxh3_64_hex(entries));
    }
    return out;
}

}  // namespace seedhound
