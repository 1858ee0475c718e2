// brainwallet_oracle.hpp - SHA-256 brain wallet oracle
// seedhound - wallet password and seed recovery

#pragma once

#include "oracle.hpp"

namespace seedhound {

// private key = SHA256(passphrase); matches when the hash160 of either the
// uncompressed or the compressed public key is a target.
class BrainwalletOracle : public CpuOracle {
public:
    BrainwalletOracle(AddressTargets targets, std::shared_ptr<ThreadPool> pool)
        : CpuOracle(std::move(pool)), targets_(std::move(targets)) {}

    double cost_hint() const override { return 40.0; }
    std::string name() const override { return ORACLE_TYPE_BRAINWALLET; }

protected:
    std::optional<std::string> check(const std::string& candidate) const override;

private:
    AddressTargets targets_;
};

}  // namespace seedhound
