/**
 * Seedhound Wildcard Expander
 *
 * Compiles %-wildcards inside a token into a countable, virtual expansion set.
 * Expansions are never materialized: the k-th expansion is decoded directly.
 *
 *   %d  digit              %n  lowercase + digit
 *   %a  lowercase          %N  uppercase + digit
 *   %A  uppercase          %s  symbol
 *   %y  printable ASCII    %[chars]  custom set (a-z ranges allowed)
 *   %{name}  entry of a named list loaded from a wildcard definition file
 *   %%  literal percent sign
 *
 * A length prefix repeats a set: %3d is exactly three digits, %1,3d is one to
 * three digits (shorter lengths first). The rightmost position varies fastest.
 */

#pragma once

#include "../core/types.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace seedhound {

using NamedList = std::vector<std::string>;
using NamedLists = std::map<std::string, std::shared_ptr<const NamedList>>;

/**
 * Load a wildcard definition file. Each non-comment line is `name = path`;
 * the referenced file holds one list entry per line. Relative paths are
 * resolved against the definition file's directory.
 *
 * @throws ConfigurationError on syntax errors, unreadable or empty lists
 */
NamedLists load_wildcard_definitions(const std::string& path);

class Wildcard {
public:
    /** True if `pattern` contains a wildcard other than the literal %%. */
    static bool is_pattern(std::string_view pattern);

    /** Replace %% with % in a pattern that has no other wildcard. */
    static std::string unescape_literal(std::string_view pattern);

    /**
     * @throws ConfigurationError naming the pattern on malformed syntax, an
     *         empty set, a reversed length range or an unknown list name
     */
    static Wildcard compile(const std::string& pattern, const NamedLists& lists = {});

    const std::string& source() const { return source_; }
    const Ordinal& count() const { return total_; }

    /** Decode expansion `index` (0 <= index < count()). */
    std::string expand(const Ordinal& index) const;

    /** Source text plus the digests of referenced lists. */
    std::string canonical() const;

private:
    enum class SegmentKind { LITERAL, CHARSET, LIST };

    struct Segment {
        SegmentKind kind = SegmentKind::LITERAL;
        std::string text;                        // literal text or charset
        std::shared_ptr<const NamedList> list;
        std::string list_name;
        uint32_t min_len = 1;
        uint32_t max_len = 1;
        Ordinal count = 1;
    };

    static void compute_count(Segment& seg);
    static void expand_segment(const Segment& seg, Ordinal index, std::string& out);

    std::string source_;
    std::vector<Segment> segments_;
    Ordinal total_ = 1;
};

}  // namespace seedhound
