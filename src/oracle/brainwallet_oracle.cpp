// brainwallet_oracle.cpp - SHA-256 brain wallet oracle
// seedhound - wallet password and seed recovery

#include "brainwallet_oracle.hpp"
#include "../core/address.hpp"
#include "../core/crypto.hpp"

namespace seedhound {

std::optional<std::string> BrainwalletOracle::check(const std::string& candidate) const {
    const crypto::Hash256 key = crypto::sha256(candidate);
    crypto::Secp256k1& secp = crypto::Secp256k1::thread_context();

    std::vector<uint8_t> pub;
    for (bool compressed : {false, true}) {
        if (!secp.public_key(key, compressed, pub)) return std::nullopt;
        Hash160 h = crypto::hash160(pub.data(), pub.size());
        if (targets_.matches(h)) {
            return encode_address(AddressType::P2PKH, h) +
                   (compressed ? " (compressed)" : " (uncompressed)");
        }
    }
    return std::nullopt;
}

}  // namespace seedhound
