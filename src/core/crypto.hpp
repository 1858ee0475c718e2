/**
 * Seedhound Crypto Primitives
 *
 * Thin wrappers over OpenSSL for the verification oracles: SHA-256,
 * HASH160, HMAC-SHA512, PBKDF2, secp256k1 public keys and BIP32 derivation.
 */

#pragma once

#include "types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

typedef struct ec_group_st EC_GROUP;
typedef struct ec_point_st EC_POINT;
typedef struct bignum_st BIGNUM;
typedef struct bignum_ctx BN_CTX;

namespace seedhound {
namespace crypto {

using Hash256 = std::array<uint8_t, 32>;
using Hash512 = std::array<uint8_t, 64>;

Hash256 sha256(const uint8_t* data, size_t len);
Hash256 sha256(std::string_view data);
Hash256 double_sha256(const uint8_t* data, size_t len);

/** RIPEMD160(SHA256(data)) */
Hash160 hash160(const uint8_t* data, size_t len);

Hash512 hmac_sha512(const uint8_t* key, size_t key_len, const uint8_t* data, size_t len);

Hash512 pbkdf2_sha512(std::string_view password, std::string_view salt, int iterations);

std::string to_hex(const uint8_t* data, size_t len);

/** @throws std::invalid_argument on odd length or non-hex characters */
std::vector<uint8_t> from_hex(const std::string& hex);

/**
 * secp256k1 context. Holds OpenSSL scratch state, so each thread uses its
 * own instance (see thread_context()).
 */
class Secp256k1 {
public:
    Secp256k1();
    ~Secp256k1();

    Secp256k1(const Secp256k1&) = delete;
    Secp256k1& operator=(const Secp256k1&) = delete;

    /** 0 < key < n */
    bool valid_private_key(const Hash256& key) const;

    /**
     * Serialized public key (33 bytes compressed, 65 uncompressed).
     * Returns false for an invalid private key.
     */
    bool public_key(const Hash256& key, bool compressed, std::vector<uint8_t>& out) const;

    /**
     * out = (key + tweak) mod n. Returns false if tweak >= n or the result is
     * zero (BIP32 says: skip this child index).
     */
    bool tweak_add(const Hash256& key, const uint8_t* tweak, Hash256& out) const;

    /** Per-thread instance. */
    static Secp256k1& thread_context();

private:
    EC_GROUP* group_;
    BN_CTX* ctx_;
    const BIGNUM* order_;
};

// -----------------------------------------------------------------------------
// BIP32
// -----------------------------------------------------------------------------

constexpr uint32_t HARDENED = 0x80000000u;

struct ExtendedKey {
    Hash256 key{};
    Hash256 chain_code{};
};

ExtendedKey bip32_master(const uint8_t* seed, size_t len);

/** Private child derivation; nullopt for the (astronomically rare) invalid index. */
std::optional<ExtendedKey> bip32_child(const Secp256k1& secp, const ExtendedKey& parent,
                                       uint32_t index);

/**
 * Parse "m/44'/0'/0'/0" (h or H also mark hardened indices).
 * @throws ConfigurationError on malformed paths
 */
std::vector<uint32_t> parse_derivation_path(const std::string& path);

}  // namespace crypto
}  // namespace seedhound
