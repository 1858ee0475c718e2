// oracle.cpp - CPU fan-out, address targets and the oracle factory
// seedhound - wallet password and seed recovery

#include "oracle.hpp"
#include "bip39_oracle.hpp"
#include "brainwallet_oracle.hpp"
#include "sha256_oracle.hpp"
#include "../core/address.hpp"
#include "../core/errors.hpp"
#include "../core/logger.hpp"

#include <algorithm>
#include <cctype>

namespace seedhound {

VerificationResult CpuOracle::verify(const VerificationRequest& request) {
    const size_t count = request.size();
    std::vector<std::optional<std::string>> found(count);

    auto run = [this, &request, &found](size_t begin, size_t end) {
        for (size_t i = begin; i < end; i++) {
            found[i] = check(request.candidates[i]);
        }
    };

    if (pool_) {
        pool_->parallel_for(count, run);
    } else {
        run(0, count);
    }

    VerificationResult result;
    for (size_t i = 0; i < count; i++) {
        if (found[i]) result.matches.push_back(OracleMatch{i, std::move(*found[i])});
    }
    return result;
}

void AddressTargets::add_addresses(const std::vector<std::string>& addresses) {
    for (const auto& address : addresses) {
        try {
            hashes_.insert(decode_address(address).hash);
        } catch (const std::invalid_argument& e) {
            throw ConfigurationError("invalid target address '" + address + "': " + e.what());
        }
    }
}

namespace {

std::shared_ptr<const AddressDatabase> load_database(const OracleConfig& config) {
    if (config.address_db_path.empty()) return nullptr;
    auto db = std::make_shared<AddressDatabase>(AddressDatabase::load(config.address_db_path));
    LOG_INFO("Loaded address database " + config.address_db_path + " (" +
             std::to_string(db->size()) + " entries)");
    return db;
}

AddressTargets build_targets(const OracleConfig& config) {
    AddressTargets targets;
    targets.add_addresses(config.targets);
    targets.set_database(load_database(config));
    if (targets.empty() && !config.allow_empty_targets) {
        throw ConfigurationError("oracle '" + config.type +
                                 "' needs a target address or an address database");
    }
    return targets;
}

}  // namespace

std::unique_ptr<VerificationOracle> create_oracle(const OracleConfig& config,
                                                  std::shared_ptr<ThreadPool> pool) {
    std::string type = config.type;
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (type == ORACLE_TYPE_SHA256) {
        if (config.targets.empty() && !config.allow_empty_targets) {
            throw ConfigurationError("oracle 'sha256' needs at least one target digest");
        }
        return std::make_unique<Sha256Oracle>(config.targets, std::move(pool));
    }

    if (type == ORACLE_TYPE_BRAINWALLET) {
        return std::make_unique<BrainwalletOracle>(build_targets(config), std::move(pool));
    }

    if (type == ORACLE_TYPE_BIP39) {
        Bip39Oracle::Params params;
        params.wordlist = config.wordlist;
        params.passphrase = config.passphrase;
        params.paths = config.paths;
        params.address_limit = config.address_limit;
        return std::make_unique<Bip39Oracle>(std::move(params), build_targets(config),
                                             std::move(pool));
    }

    throw ConfigurationError("unknown oracle type '" + config.type +
                             "' (expected sha256, brainwallet or bip39)");
}

}  // namespace seedhound
