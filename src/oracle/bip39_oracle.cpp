// bip39_oracle.cpp - BIP39 mnemonic oracle
// seedhound - wallet password and seed recovery

#include "bip39_oracle.hpp"
#include "../core/address.hpp"
#include "../core/errors.hpp"

#include <sstream>

namespace seedhound {

namespace {

constexpr size_t BIP39_WORDS = 2048;
constexpr int BIP39_ITERATIONS = 2048;

AddressType type_for_purpose(const std::vector<uint32_t>& indices) {
    if (indices.empty()) return AddressType::P2PKH;
    switch (indices[0] & ~crypto::HARDENED) {
        case 49: return AddressType::P2SH;
        case 84: return AddressType::P2WPKH;
        default: return AddressType::P2PKH;
    }
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream in(text);
    std::string word;
    while (in >> word) words.push_back(word);
    return words;
}

}  // namespace

const std::vector<std::string>& Bip39Oracle::default_paths() {
    static const std::vector<std::string> paths = {
        "m/44'/0'/0'/0",
        "m/49'/0'/0'/0",
        "m/84'/0'/0'/0",
    };
    return paths;
}

Bip39Oracle::Bip39Oracle(Params params, AddressTargets targets, std::shared_ptr<ThreadPool> pool)
    : CpuOracle(std::move(pool)), params_(std::move(params)), targets_(std::move(targets)) {
    if (!params_.wordlist) {
        throw ConfigurationError("bip39 oracle needs a wordlist");
    }
    if (params_.wordlist->size() != BIP39_WORDS) {
        throw ConfigurationError("bip39 oracle needs a 2048-word list, '" +
                                 params_.wordlist->name() + "' has " +
                                 std::to_string(params_.wordlist->size()));
    }
    if (params_.address_limit == 0) {
        throw ConfigurationError("bip39 address limit must be at least 1");
    }

    path_names_ = params_.paths.empty() ? default_paths() : params_.paths;
    for (const auto& path : path_names_) {
        Account account;
        account.indices = crypto::parse_derivation_path(path);
        account.type = type_for_purpose(account.indices);
        accounts_.push_back(std::move(account));
    }
}

double Bip39Oracle::cost_hint() const {
    // PBKDF2 dominates: 2 HMAC-SHA512 per iteration
    return 4.0 * BIP39_ITERATIONS +
           50.0 * static_cast<double>(accounts_.size()) * params_.address_limit;
}

bool Bip39Oracle::checksum_valid(const std::string& mnemonic) const {
    std::vector<std::string> words = split_words(mnemonic);
    const size_t n = words.size();
    if (n < 12 || n > 24 || n % 3 != 0) return false;

    const size_t total_bits = n * 11;
    const size_t checksum_bits = n / 3;
    const size_t entropy_bytes = (total_bits - checksum_bits) / 8;

    std::vector<uint8_t> bits((total_bits + 7) / 8, 0);
    for (size_t w = 0; w < n; w++) {
        int32_t index = params_.wordlist->index_of(words[w]);
        if (index < 0) return false;
        for (size_t b = 0; b < 11; b++) {
            if (index & (1 << (10 - b))) {
                size_t pos = w * 11 + b;
                bits[pos / 8] |= static_cast<uint8_t>(0x80 >> (pos % 8));
            }
        }
    }

    crypto::Hash256 digest = crypto::sha256(bits.data(), entropy_bytes);
    for (size_t b = 0; b < checksum_bits; b++) {
        size_t pos = entropy_bytes * 8 + b;
        bool expected = (digest[b / 8] >> (7 - b % 8)) & 1;
        bool actual = (bits[pos / 8] >> (7 - pos % 8)) & 1;
        if (expected != actual) return false;
    }
    return true;
}

std::optional<std::string> Bip39Oracle::check(const std::string& candidate) const {
    if (!checksum_valid(candidate)) return std::nullopt;

    // Normalize whitespace before hashing
    std::vector<std::string> words = split_words(candidate);
    std::string mnemonic;
    for (size_t i = 0; i < words.size(); i++) {
        if (i) mnemonic += ' ';
        mnemonic += words[i];
    }

    crypto::Hash512 seed =
        crypto::pbkdf2_sha512(mnemonic, "mnemonic" + params_.passphrase, BIP39_ITERATIONS);
    crypto::ExtendedKey master = crypto::bip32_master(seed.data(), seed.size());
    const crypto::Secp256k1& secp = crypto::Secp256k1::thread_context();

    std::vector<uint8_t> pub;
    for (size_t a = 0; a < accounts_.size(); a++) {
        const Account& account = accounts_[a];

        std::optional<crypto::ExtendedKey> node = master;
        for (uint32_t index : account.indices) {
            node = crypto::bip32_child(secp, *node, index);
            if (!node) break;
        }
        if (!node) continue;

        for (uint32_t i = 0; i < params_.address_limit; i++) {
            std::optional<crypto::ExtendedKey> child = crypto::bip32_child(secp, *node, i);
            if (!child || !secp.public_key(child->key, true, pub)) continue;

            Hash160 h = crypto::hash160(pub.data(), pub.size());
            if (account.type == AddressType::P2SH) {
                // BIP49 redeem script: OP_0 PUSH20 <hash160>
                uint8_t script[22] = {0x00, 0x14};
                std::copy(h.data.begin(), h.data.end(), script + 2);
                h = crypto::hash160(script, sizeof(script));
            }

            if (targets_.matches(h)) {
                return encode_address(account.type, h) + " at " + path_names_[a] + "/" +
                       std::to_string(i);
            }
        }
    }
    return std::nullopt;
}

}  // namespace seedhound
