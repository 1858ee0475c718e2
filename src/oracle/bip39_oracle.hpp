// bip39_oracle.hpp - BIP39 mnemonic oracle
// seedhound - wallet password and seed recovery

#pragma once

#include "oracle.hpp"
#include "../core/address.hpp"
#include "../core/crypto.hpp"

namespace seedhound {

// Verifies mnemonic candidates: checksum prefilter, PBKDF2 seed, BIP32
// derivation along each account path, then address lookup for the first
// `address_limit` receive indices.
class Bip39Oracle : public CpuOracle {
public:
    struct Params {
        std::shared_ptr<const Wordlist> wordlist;    // must hold 2048 words
        std::string passphrase;
        std::vector<std::string> paths;              // empty = BIP44/49/84 defaults
        uint32_t address_limit = 1;
    };

    // Throws ConfigurationError on a missing or short wordlist, a bad path or
    // a zero address limit
    Bip39Oracle(Params params, AddressTargets targets, std::shared_ptr<ThreadPool> pool);

    double cost_hint() const override;
    std::string name() const override { return ORACLE_TYPE_BIP39; }

    // True when the words are in the list and the checksum bits agree
    bool checksum_valid(const std::string& mnemonic) const;

    const std::vector<std::string>& paths() const { return path_names_; }

    static const std::vector<std::string>& default_paths();

protected:
    std::optional<std::string> check(const std::string& candidate) const override;

private:
    struct Account {
        std::vector<uint32_t> indices;
        AddressType type;
    };

    Params params_;
    AddressTargets targets_;
    std::vector<std::string> path_names_;
    std::vector<Account> accounts_;
};

}  // namespace seedhound
