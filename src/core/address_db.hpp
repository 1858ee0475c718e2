/**
 * Seedhound Address Database
 *
 * A sorted set of hash160 values (the identifiers behind P2PKH, P2SH and
 * P2WPKH addresses) used by oracles to recognise a derived address.
 *
 * File format (little-endian):
 *   "SHDB"  magic
 *   u32     version (1)
 *   u64     entry count
 *   u64     XXH3-64 of the entry bytes
 *   20*n    entries, strictly ascending
 */

#pragma once

#include "types.hpp"

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace seedhound {

class AddressDatabase {
public:
    static constexpr uint32_t FORMAT_VERSION = 1;

    struct ImportStats {
        size_t lines = 0;
        size_t added = 0;
        size_t skipped = 0;
    };

    AddressDatabase() = default;

    void add(const Hash160& hash) {
        entries_.push_back(hash);
        sorted_ = false;
    }

    /**
     * Import addresses, one per line. The address is the first
     * comma/whitespace separated field, so "address,balance" dumps work.
     * Unparsable lines (headers, unsupported types) are counted and skipped.
     */
    ImportStats import(std::istream& in);

    /** Sort and deduplicate; required before contains() and save(). */
    void finalize();

    bool contains(const Hash160& hash) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    /** @throws Error on I/O failure */
    void save(const std::string& path) const;

    /** @throws ConfigurationError if the file is missing, truncated or corrupt */
    static AddressDatabase load(const std::string& path);

private:
    std::vector<Hash160> entries_;
    bool sorted_ = true;
};

}  // namespace seedhound
