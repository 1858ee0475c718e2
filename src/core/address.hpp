/**
 * Bitcoin Address Codec
 *
 * Base58Check (P2PKH "1...", P2SH "3...") and Bech32 segwit v0
 * (P2WPKH "bc1q...") encoding and decoding, with checksum verification.
 */

#pragma once

#include "types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace seedhound {

enum class AddressType : uint8_t {
    P2PKH = 0,        // 1...   hash160(pubkey)
    P2SH = 1,         // 3...   hash160(script); BIP49 wraps P2WPKH in P2SH
    P2WPKH = 2,       // bc1q.. hash160(compressed pubkey)
};

const char* address_type_name(AddressType type);

struct DecodedAddress {
    AddressType type = AddressType::P2PKH;
    Hash160 hash;
};

std::string base58_encode(const std::vector<uint8_t>& data);

/** @throws std::invalid_argument on characters outside the alphabet */
std::vector<uint8_t> base58_decode(const std::string& text);

std::string base58check_encode(uint8_t version, const uint8_t* payload, size_t len);

/**
 * Returns version byte followed by the payload.
 * @throws std::invalid_argument on a bad checksum or malformed input
 */
std::vector<uint8_t> base58check_decode(const std::string& text);

std::string bech32_encode_segwit(const std::string& hrp, int witness_version,
                                 const uint8_t* program, size_t len);

/**
 * @throws std::invalid_argument on a bad checksum, mixed case, wrong hrp or
 *         invalid witness program
 */
std::vector<uint8_t> bech32_decode_segwit(const std::string& hrp, const std::string& address,
                                          int& witness_version);

std::string encode_address(AddressType type, const Hash160& hash);

/**
 * Decode a mainnet address, or 40 hex characters of raw hash160.
 * @throws std::invalid_argument for anything else
 */
DecodedAddress decode_address(const std::string& address);

}  // namespace seedhound
