/**
 * Address encoding and decoding.
 */

#include "address.hpp"
#include "crypto.hpp"

#include <cctype>
#include <cstring>
#include <stdexcept>

namespace seedhound {

namespace {

// Base58 alphabet for Bitcoin addresses
constexpr const char* BASE58_ALPHABET =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

constexpr const char* BECH32_ALPHABET = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

constexpr uint8_t VERSION_P2PKH = 0x00;
constexpr uint8_t VERSION_P2SH = 0x05;

uint32_t bech32_polymod(const std::vector<uint8_t>& values) {
    static const uint32_t GEN[5] = {0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3};
    uint32_t chk = 1;
    for (uint8_t v : values) {
        uint8_t top = static_cast<uint8_t>(chk >> 25);
        chk = ((chk & 0x1ffffff) << 5) ^ v;
        for (int i = 0; i < 5; i++) {
            if ((top >> i) & 1) chk ^= GEN[i];
        }
    }
    return chk;
}

std::vector<uint8_t> hrp_expand(const std::string& hrp) {
    std::vector<uint8_t> out;
    for (char c : hrp) out.push_back(static_cast<uint8_t>(c) >> 5);
    out.push_back(0);
    for (char c : hrp) out.push_back(static_cast<uint8_t>(c) & 31);
    return out;
}

bool convert_bits(const std::vector<uint8_t>& in, int from, int to, bool pad,
                  std::vector<uint8_t>& out) {
    uint32_t acc = 0;
    int bits = 0;
    const uint32_t maxv = (1u << to) - 1;
    for (uint8_t value : in) {
        if (value >> from) return false;
        acc = (acc << from) | value;
        bits += from;
        while (bits >= to) {
            bits -= to;
            out.push_back(static_cast<uint8_t>((acc >> bits) & maxv));
        }
    }
    if (pad) {
        if (bits) out.push_back(static_cast<uint8_t>((acc << (to - bits)) & maxv));
    } else if (bits >= from || ((acc << (to - bits)) & maxv)) {
        return false;
    }
    return true;
}

}  // namespace

const char* address_type_name(AddressType type) {
    switch (type) {
        case AddressType::P2PKH:  return "p2pkh";
        case AddressType::P2SH:   return "p2sh";
        case AddressType::P2WPKH: return "p2wpkh";
    }
    return "unknown";
}

std::string base58_encode(const std::vector<uint8_t>& data) {
    size_t zeros = 0;
    while (zeros < data.size() && data[zeros] == 0) zeros++;

    // Little-endian base58 digits
    std::vector<uint8_t> digits;
    for (size_t i = zeros; i < data.size(); i++) {
        int carry = data[i];
        for (auto& d : digits) {
            int val = d * 256 + carry;
            d = static_cast<uint8_t>(val % 58);
            carry = val / 58;
        }
        while (carry) {
            digits.push_back(static_cast<uint8_t>(carry % 58));
            carry /= 58;
        }
    }

    std::string out(zeros, '1');
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        out += BASE58_ALPHABET[*it];
    }
    return out;
}

std::vector<uint8_t> base58_decode(const std::string& text) {
    std::vector<uint8_t> num;  // little-endian bytes
    for (char c : text) {
        const char* pos = c ? std::strchr(BASE58_ALPHABET, c) : nullptr;
        if (!pos) {
            throw std::invalid_argument("Invalid base58 character in '" + text + "'");
        }

        int carry = static_cast<int>(pos - BASE58_ALPHABET);
        for (auto& byte : num) {
            int val = byte * 58 + carry;
            byte = static_cast<uint8_t>(val & 0xff);
            carry = val >> 8;
        }
        while (carry) {
            num.push_back(static_cast<uint8_t>(carry & 0xff));
            carry >>= 8;
        }
    }

    size_t zeros = 0;
    for (char c : text) {
        if (c != '1') break;
        zeros++;
    }

    std::vector<uint8_t> decoded(zeros, 0);
    for (auto it = num.rbegin(); it != num.rend(); ++it) {
        decoded.push_back(*it);
    }
    return decoded;
}

std::string base58check_encode(uint8_t version, const uint8_t* payload, size_t len) {
    std::vector<uint8_t> data;
    data.reserve(len + 5);
    data.push_back(version);
    data.insert(data.end(), payload, payload + len);
    crypto::Hash256 check = crypto::double_sha256(data.data(), data.size());
    data.insert(data.end(), check.begin(), check.begin() + 4);
    return base58_encode(data);
}

std::vector<uint8_t> base58check_decode(const std::string& text) {
    std::vector<uint8_t> data = base58_decode(text);
    if (data.size() < 5) {
        throw std::invalid_argument("Base58Check string too short: " + text);
    }
    crypto::Hash256 check = crypto::double_sha256(data.data(), data.size() - 4);
    if (std::memcmp(check.data(), data.data() + data.size() - 4, 4) != 0) {
        throw std::invalid_argument("Base58Check checksum mismatch: " + text);
    }
    data.resize(data.size() - 4);
    return data;
}

std::string bech32_encode_segwit(const std::string& hrp, int witness_version,
                                 const uint8_t* program, size_t len) {
    std::vector<uint8_t> data;
    data.push_back(static_cast<uint8_t>(witness_version));
    convert_bits(std::vector<uint8_t>(program, program + len), 8, 5, true, data);

    std::vector<uint8_t> values = hrp_expand(hrp);
    values.insert(values.end(), data.begin(), data.end());
    values.insert(values.end(), 6, 0);
    uint32_t mod = bech32_polymod(values) ^ 1;  // bech32 (not bech32m) constant

    std::string out = hrp + "1";
    for (uint8_t d : data) out += BECH32_ALPHABET[d];
    for (int i = 0; i < 6; i++) out += BECH32_ALPHABET[(mod >> (5 * (5 - i))) & 31];
    return out;
}

std::vector<uint8_t> bech32_decode_segwit(const std::string& hrp, const std::string& address,
                                          int& witness_version) {
    bool lower = false, upper = false;
    for (char c : address) {
        if (std::islower(static_cast<unsigned char>(c))) lower = true;
        if (std::isupper(static_cast<unsigned char>(c))) upper = true;
    }
    if (lower && upper) {
        throw std::invalid_argument("Mixed-case bech32 address: " + address);
    }

    std::string addr;
    for (char c : address) addr += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    size_t sep = addr.rfind('1');
    if (sep == std::string::npos || addr.substr(0, sep) != hrp || sep + 7 > addr.size()) {
        throw std::invalid_argument("Invalid bech32 address: " + address);
    }

    std::vector<uint8_t> data;
    for (size_t i = sep + 1; i < addr.size(); i++) {
        const char* pos = std::strchr(BECH32_ALPHABET, addr[i]);
        if (!pos || !addr[i]) {
            throw std::invalid_argument("Invalid bech32 character in " + address);
        }
        data.push_back(static_cast<uint8_t>(pos - BECH32_ALPHABET));
    }

    std::vector<uint8_t> values = hrp_expand(hrp);
    values.insert(values.end(), data.begin(), data.end());
    if (bech32_polymod(values) != 1) {
        throw std::invalid_argument("Bech32 checksum mismatch: " + address);
    }

    data.resize(data.size() - 6);
    if (data.empty()) {
        throw std::invalid_argument("Empty bech32 data: " + address);
    }

    witness_version = data[0];
    std::vector<uint8_t> program;
    if (!convert_bits(std::vector<uint8_t>(data.begin() + 1, data.end()), 5, 8, false, program)) {
        throw std::invalid_argument("Invalid witness program padding: " + address);
    }
    if (witness_version == 0 && program.size() != 20 && program.size() != 32) {
        throw std::invalid_argument("Invalid witness program length: " + address);
    }
    return program;
}

std::string encode_address(AddressType type, const Hash160& hash) {
    switch (type) {
        case AddressType::P2PKH:
            return base58check_encode(VERSION_P2PKH, hash.data.data(), hash.data.size());
        case AddressType::P2SH:
            return base58check_encode(VERSION_P2SH, hash.data.data(), hash.data.size());
        case AddressType::P2WPKH:
            return bech32_encode_segwit("bc", 0, hash.data.data(), hash.data.size());
    }
    throw std::invalid_argument("unknown address type");
}

DecodedAddress decode_address(const std::string& address) {
    if (address.empty()) {
        throw std::invalid_argument("Empty address");
    }

    DecodedAddress result;

    // Raw H160 hex
    if (address.size() == 40 && address.find_first_not_of("0123456789abcdefABCDEF") == std::string::npos) {
        result.type = AddressType::P2PKH;
        result.hash = Hash160::from_hex(address);
        return result;
    }

    if (address.size() > 3 && (address.compare(0, 3, "bc1") == 0 || address.compare(0, 3, "BC1") == 0)) {
        int version = -1;
        std::vector<uint8_t> program = bech32_decode_segwit("bc", address, version);
        if (version != 0 || program.size() != 20) {
            throw std::invalid_argument("Only P2WPKH segwit addresses are supported: " + address);
        }
        result.type = AddressType::P2WPKH;
        std::memcpy(result.hash.data.data(), program.data(), 20);
        return result;
    }

    std::vector<uint8_t> payload = base58check_decode(address);
    if (payload.size() != 21) {
        throw std::invalid_argument("Invalid address length: " + address);
    }
    if (payload[0] == VERSION_P2PKH) {
        result.type = AddressType::P2PKH;
    } else if (payload[0] == VERSION_P2SH) {
        result.type = AddressType::P2SH;
    } else {
        throw std::invalid_argument("Unsupported address version: " + address);
    }
    std::memcpy(result.hash.data.data(), payload.data() + 1, 20);
    return result;
}

}  // namespace seedhound
