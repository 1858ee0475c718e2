// oracle.hpp - Verification oracle interface and factory
// seedhound - wallet password and seed recovery

#pragma once

#include "../core/address_db.hpp"
#include "../core/thread_pool.hpp"
#include "../core/types.hpp"
#include "../generators/wordlist.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace seedhound {

// A batch of rendered candidates with their ordinals
struct VerificationRequest {
    std::vector<std::string> candidates;
    std::vector<Ordinal> ordinals;       // same length as candidates

    size_t size() const { return candidates.size(); }
};

struct OracleMatch {
    size_t index = 0;                    // index into the request
    std::string identifier;              // what matched (address, digest, path)
};

struct VerificationResult {
    std::vector<OracleMatch> matches;    // ascending by index
};

// Oracle interface. verify() may be called concurrently from several driver
// threads; implementations hold only immutable parameters.
class VerificationOracle {
public:
    virtual ~VerificationOracle() = default;

    // Throws BatchFailure when the whole batch could not be processed and
    // OracleError when verification cannot continue at all.
    virtual VerificationResult verify(const VerificationRequest& request) = 0;

    // Relative cost of one candidate (a single SHA-256 is 1)
    virtual double cost_hint() const = 0;

    virtual std::string name() const = 0;
};

// CPU oracle base: fans a batch out over the shared thread pool and collects
// matches in index order. Subclasses implement check() for one candidate.
class CpuOracle : public VerificationOracle {
public:
    explicit CpuOracle(std::shared_ptr<ThreadPool> pool) : pool_(std::move(pool)) {}

    VerificationResult verify(const VerificationRequest& request) override;

protected:
    // Identifier of the match, or nullopt. Must be thread-safe.
    virtual std::optional<std::string> check(const std::string& candidate) const = 0;

private:
    std::shared_ptr<ThreadPool> pool_;
};

// Target set shared by the address based oracles
class AddressTargets {
public:
    AddressTargets() = default;

    // Addresses or raw hash160 hex; throws ConfigurationError on bad input
    void add_addresses(const std::vector<std::string>& addresses);
    void set_database(std::shared_ptr<const AddressDatabase> db) { db_ = std::move(db); }

    bool matches(const Hash160& hash) const {
        return hashes_.count(hash) != 0 || (db_ && db_->contains(hash));
    }

    bool empty() const { return hashes_.empty() && (!db_ || db_->empty()); }
    size_t size() const { return hashes_.size() + (db_ ? db_->size() : 0); }

private:
    std::unordered_set<Hash160, Hash160Hasher> hashes_;
    std::shared_ptr<const AddressDatabase> db_;
};

struct OracleConfig {
    std::string type = "sha256";
    std::vector<std::string> targets;                   // digests or addresses
    std::string address_db_path;
    std::vector<std::string> paths;                     // BIP32 account paths
    uint32_t address_limit = 1;
    std::string passphrase;                             // BIP39 extension
    std::shared_ptr<const Wordlist> wordlist;           // BIP39 vocabulary
    bool allow_empty_targets = false;                   // performance runs
};

// Factory function to create oracles
std::unique_ptr<VerificationOracle> create_oracle(const OracleConfig& config,
                                                  std::shared_ptr<ThreadPool> pool);

// Oracle types
constexpr const char* ORACLE_TYPE_SHA256 = "sha256";
constexpr const char* ORACLE_TYPE_BRAINWALLET = "brainwallet";
constexpr const char* ORACLE_TYPE_BIP39 = "bip39";

}  // namespace seedhound
