// sha256_oracle.cpp - Raw SHA-256 digest oracle
// seedhound - wallet password and seed recovery

#include "sha256_oracle.hpp"
#include "../core/crypto.hpp"
#include "../core/errors.hpp"

#include <cstring>

namespace seedhound {

Sha256Oracle::Sha256Oracle(const std::vector<std::string>& target_digests,
                           std::shared_ptr<ThreadPool> pool)
    : CpuOracle(std::move(pool)) {
    for (const auto& hex : target_digests) {
        std::vector<uint8_t> bytes;
        try {
            bytes = crypto::from_hex(hex);
        } catch (const std::invalid_argument&) {
            throw ConfigurationError("target '" + hex + "' is not a hex SHA-256 digest");
        }
        if (bytes.size() != 32) {
            throw ConfigurationError("target '" + hex + "' is not 64 hex characters");
        }
        std::array<uint8_t, 32> digest;
        std::memcpy(digest.data(), bytes.data(), 32);
        targets_.insert(digest);
    }
}

std::optional<std::string> Sha256Oracle::check(const std::string& candidate) const {
    crypto::Hash256 digest = crypto::sha256(candidate);
    if (targets_.count(digest) == 0) return std::nullopt;
    return crypto::to_hex(digest.data(), digest.size());
}

}  // namespace seedhound
