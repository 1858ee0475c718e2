/**
 * OpenSSL-backed crypto primitives.
 */

#include "crypto.hpp"
#include "errors.hpp"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/obj_mac.h>
#include <openssl/sha.h>

#include <cstring>
#include <stdexcept>

namespace seedhound {
namespace crypto {

Hash256 sha256(const uint8_t* data, size_t len) {
    Hash256 out;
    SHA256(data, len, out.data());
    return out;
}

Hash256 sha256(std::string_view data) {
    return sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Hash256 double_sha256(const uint8_t* data, size_t len) {
    Hash256 first = sha256(data, len);
    return sha256(first.data(), first.size());
}

Hash160 hash160(const uint8_t* data, size_t len) {
    Hash256 first = sha256(data, len);
    Hash160 out;
    unsigned int out_len = 0;
    if (EVP_Digest(first.data(), first.size(), out.data.data(), &out_len,
                   EVP_ripemd160(), nullptr) != 1 || out_len != 20) {
        throw OracleError("RIPEMD160 is not available from the OpenSSL provider");
    }
    return out;
}

Hash512 hmac_sha512(const uint8_t* key, size_t key_len, const uint8_t* data, size_t len) {
    Hash512 out;
    unsigned int out_len = 0;
    if (!HMAC(EVP_sha512(), key, static_cast<int>(key_len), data, len, out.data(), &out_len) ||
        out_len != out.size()) {
        throw OracleError("HMAC-SHA512 failed");
    }
    return out;
}

Hash512 pbkdf2_sha512(std::string_view password, std::string_view salt, int iterations) {
    Hash512 out;
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          reinterpret_cast<const unsigned char*>(salt.data()),
                          static_cast<int>(salt.size()), iterations, EVP_sha512(),
                          static_cast<int>(out.size()), out.data()) != 1) {
        throw OracleError("PBKDF2-HMAC-SHA512 failed");
    }
    return out;
}

std::string to_hex(const uint8_t* data, size_t len) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0f];
    }
    return out;
}

std::vector<uint8_t> from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex string has odd length: " + hex);
    }
    auto nibble = [&hex](char c) -> uint8_t {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
        throw std::invalid_argument("invalid hex: " + hex);
    };
    std::vector<uint8_t> out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); i++) {
        out[i] = static_cast<uint8_t>((nibble(hex[2 * i]) << 4) | nibble(hex[2 * i + 1]));
    }
    return out;
}

// -----------------------------------------------------------------------------
// Secp256k1
// -----------------------------------------------------------------------------

namespace {

struct BnHolder {
    BIGNUM* bn;
    BnHolder() : bn(BN_new()) {}
    ~BnHolder() { BN_clear_free(bn); }
    BnHolder(const BnHolder&) = delete;
    BnHolder& operator=(const BnHolder&) = delete;
};

struct PointHolder {
    EC_POINT* point;
    explicit PointHolder(const EC_GROUP* group) : point(EC_POINT_new(group)) {}
    ~PointHolder() { EC_POINT_free(point); }
    PointHolder(const PointHolder&) = delete;
    PointHolder& operator=(const PointHolder&) = delete;
};

}  // namespace

Secp256k1::Secp256k1()
    : group_(EC_GROUP_new_by_curve_name(NID_secp256k1)), ctx_(BN_CTX_new()), order_(nullptr) {
    if (!group_ || !ctx_) {
        EC_GROUP_free(group_);
        BN_CTX_free(ctx_);
        throw OracleError("cannot initialize secp256k1 context");
    }
    order_ = EC_GROUP_get0_order(group_);
}

Secp256k1::~Secp256k1() {
    BN_CTX_free(ctx_);
    EC_GROUP_free(group_);
}

Secp256k1& Secp256k1::thread_context() {
    thread_local Secp256k1 context;
    return context;
}

bool Secp256k1::valid_private_key(const Hash256& key) const {
    BnHolder k;
    if (!k.bn || !BN_bin2bn(key.data(), static_cast<int>(key.size()), k.bn)) return false;
    return !BN_is_zero(k.bn) && BN_cmp(k.bn, order_) < 0;
}

bool Secp256k1::public_key(const Hash256& key, bool compressed, std::vector<uint8_t>& out) const {
    BnHolder k;
    if (!k.bn || !BN_bin2bn(key.data(), static_cast<int>(key.size()), k.bn)) return false;
    if (BN_is_zero(k.bn) || BN_cmp(k.bn, order_) >= 0) return false;

    PointHolder pub(group_);
    if (!pub.point || EC_POINT_mul(group_, pub.point, k.bn, nullptr, nullptr, ctx_) != 1) {
        throw OracleError("secp256k1 point multiplication failed");
    }

    const point_conversion_form_t form =
        compressed ? POINT_CONVERSION_COMPRESSED : POINT_CONVERSION_UNCOMPRESSED;
    out.resize(compressed ? 33 : 65);
    size_t written = EC_POINT_point2oct(group_, pub.point, form, out.data(), out.size(), ctx_);
    if (written != out.size()) {
        throw OracleError("secp256k1 point serialization failed");
    }
    return true;
}

bool Secp256k1::tweak_add(const Hash256& key, const uint8_t* tweak, Hash256& out) const {
    BnHolder k, t, sum;
    if (!k.bn || !t.bn || !sum.bn) throw OracleError("BN allocation failed");

    BN_bin2bn(key.data(), 32, k.bn);
    BN_bin2bn(tweak, 32, t.bn);
    if (BN_cmp(t.bn, order_) >= 0) return false;

    if (BN_mod_add(sum.bn, k.bn, t.bn, order_, ctx_) != 1) {
        throw OracleError("BN_mod_add failed");
    }
    if (BN_is_zero(sum.bn)) return false;

    if (BN_bn2binpad(sum.bn, out.data(), 32) != 32) {
        throw OracleError("BN_bn2binpad failed");
    }
    return true;
}

// -----------------------------------------------------------------------------
// BIP32
// -----------------------------------------------------------------------------

ExtendedKey bip32_master(const uint8_t* seed, size_t len) {
    static const char* KEY = "Bitcoin seed";
    Hash512 i = hmac_sha512(reinterpret_cast<const uint8_t*>(KEY), std::strlen(KEY), seed, len);

    ExtendedKey master;
    std::memcpy(master.key.data(), i.data(), 32);
    std::memcpy(master.chain_code.data(), i.data() + 32, 32);
    return master;
}

std::optional<ExtendedKey> bip32_child(const Secp256k1& secp, const ExtendedKey& parent,
                                       uint32_t index) {
    uint8_t data[37];
    if (index & HARDENED) {
        data[0] = 0x00;
        std::memcpy(data + 1, parent.key.data(), 32);
    } else {
        std::vector<uint8_t> pub;
        if (!secp.public_key(parent.key, true, pub)) return std::nullopt;
        std::memcpy(data, pub.data(), 33);
    }
    data[33] = static_cast<uint8_t>(index >> 24);
    data[34] = static_cast<uint8_t>(index >> 16);
    data[35] = static_cast<uint8_t>(index >> 8);
    data[36] = static_cast<uint8_t>(index);

    Hash512 i = hmac_sha512(parent.chain_code.data(), 32, data, sizeof(data));

    ExtendedKey child;
    if (!secp.tweak_add(parent.key, i.data(), child.key)) return std::nullopt;
    std::memcpy(child.chain_code.data(), i.data() + 32, 32);
    return child;
}

std::vector<uint32_t> parse_derivation_path(const std::string& path) {
    if (path.empty() || path[0] != 'm') {
        throw ConfigurationError("derivation path must start with 'm': " + path);
    }

    std::vector<uint32_t> indices;
    size_t pos = 1;
    while (pos < path.size()) {
        if (path[pos] != '/') {
            throw ConfigurationError("malformed derivation path: " + path);
        }
        pos++;

        size_t start = pos;
        while (pos < path.size() && path[pos] >= '0' && path[pos] <= '9') pos++;
        if (pos == start || pos - start > 10) {
            throw ConfigurationError("malformed derivation path: " + path);
        }
        unsigned long value = std::stoul(path.substr(start, pos - start));
        if (value >= HARDENED) {
            throw ConfigurationError("derivation index too large in: " + path);
        }

        uint32_t index = static_cast<uint32_t>(value);
        if (pos < path.size() && (path[pos] == '\'' || path[pos] == 'h' || path[pos] == 'H')) {
            index |= HARDENED;
            pos++;
        }
        indices.push_back(index);
    }
    return indices;
}

}  // namespace crypto
}  // namespace seedhound
