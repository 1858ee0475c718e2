// sha256_oracle.hpp - Raw SHA-256 digest oracle
// seedhound - wallet password and seed recovery

#pragma once

#include "oracle.hpp"

#include <array>
#include <set>

namespace seedhound {

// Matches candidates whose SHA-256 digest equals one of the targets. Used for
// tests, benchmarks and wallets that store a bare password hash.
class Sha256Oracle : public CpuOracle {
public:
    // Targets are 64 hex characters; throws ConfigurationError otherwise
    Sha256Oracle(const std::vector<std::string>& target_digests, std::shared_ptr<ThreadPool> pool);

    double cost_hint() const override { return 1.0; }
    std::string name() const override { return ORACLE_TYPE_SHA256; }

protected:
    std::optional<std::string> check(const std::string& candidate) const override;

private:
    std::set<std::array<uint8_t, 32>> targets_;
};

}  // namespace seedhound
