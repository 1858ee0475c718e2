/**
 * Address database import, lookup and persistence.
 */

#include "address_db.hpp"
#include "address.hpp"
#include "errors.hpp"
#include "hashing.hpp"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace seedhound {

namespace {

constexpr char MAGIC[4] = {'S', 'H', 'D', 'B'};

uint64_t entries_digest(const std::vector<Hash160>& entries) {
    if (entries.empty()) return XXH3_64bits(nullptr, 0);
    return XXH3_64bits(entries.data(), entries.size() * sizeof(Hash160));
}

}  // namespace

AddressDatabase::ImportStats AddressDatabase::import(std::istream& in) {
    ImportStats stats;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        size_t start = line.find_first_not_of(" \t");
        if (start == std::string::npos || line[start] == '#') continue;
        stats.lines++;

        size_t end = line.find_first_of(" \t,;", start);
        std::string address = line.substr(start, end == std::string::npos ? std::string::npos
                                                                           : end - start);
        try {
            add(decode_address(address).hash);
            stats.added++;
        } catch (const std::invalid_argument&) {
            stats.skipped++;
        }
    }
    return stats;
}

void AddressDatabase::finalize() {
    if (sorted_) return;
    std::sort(entries_.begin(), entries_.end());
    entries_.erase(std::unique(entries_.begin(), entries_.end()), entries_.end());
    sorted_ = true;
}

bool AddressDatabase::contains(const Hash160& hash) const {
    return std::binary_search(entries_.begin(), entries_.end(), hash);
}

void AddressDatabase::save(const std::string& path) const {
    if (!sorted_) {
        throw Error("address database must be finalized before saving");
    }

    const std::string temp_path = path + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw Error("cannot create address database: " + temp_path);
        }

        uint32_t version = FORMAT_VERSION;
        uint64_t count = entries_.size();
        uint64_t digest = entries_digest(entries_);

        file.write(MAGIC, sizeof(MAGIC));
        file.write(reinterpret_cast<const char*>(&version), sizeof(version));
        file.write(reinterpret_cast<const char*>(&count), sizeof(count));
        file.write(reinterpret_cast<const char*>(&digest), sizeof(digest));
        if (count) {
            file.write(reinterpret_cast<const char*>(entries_.data()),
                       static_cast<std::streamsize>(count * sizeof(Hash160)));
        }
        file.flush();
        if (!file) {
            throw Error("write failed: " + temp_path);
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        throw Error("cannot move address database into place: " + path);
    }
}

AddressDatabase AddressDatabase::load(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw ConfigurationError("cannot open address database: " + path);
    }

    char magic[4];
    uint32_t version = 0;
    uint64_t count = 0;
    uint64_t digest = 0;
    file.read(magic, sizeof(magic));
    file.read(reinterpret_cast<char*>(&version), sizeof(version));
    file.read(reinterpret_cast<char*>(&count), sizeof(count));
    file.read(reinterpret_cast<char*>(&digest), sizeof(digest));
    if (!file || std::memcmp(magic, MAGIC, sizeof(MAGIC)) != 0) {
        throw ConfigurationError(path + " is not a seedhound address database");
    }
    if (version != FORMAT_VERSION) {
        throw ConfigurationError(path + ": unsupported address database version " +
                                 std::to_string(version));
    }

    std::error_code ec;
    uintmax_t file_size = std::filesystem::file_size(path, ec);
    const uint64_t header = sizeof(magic) + sizeof(version) + sizeof(count) + sizeof(digest);
    if (ec || count > (file_size - header) / sizeof(Hash160)) {
        throw ConfigurationError(path + ": address database is truncated");
    }

    AddressDatabase db;
    db.entries_.resize(count);
    if (count) {
        file.read(reinterpret_cast<char*>(db.entries_.data()),
                  static_cast<std::streamsize>(count * sizeof(Hash160)));
        if (!file) {
            throw ConfigurationError(path + ": address database is truncated");
        }
    }

    if (entries_digest(db.entries_) != digest) {
        throw ConfigurationError(path + ": address database checksum mismatch");
    }
    for (size_t i = 1; i < db.entries_.size(); i++) {
        if (!(db.entries_[i - 1] < db.entries_[i])) {
            throw ConfigurationError(path + ": address database entries are not sorted");
        }
    }
    db.sorted_ = true;
    return db;
}

}  // namespace seedhound
