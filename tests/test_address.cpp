/**
 * Address Codec Tests
 *
 * Base58Check and Bech32 encoding against known mainnet addresses.
 */

#include "../src/core/address.hpp"
#include <cassert>
#include <cstring>
#include <iostream>

using namespace seedhound;

static bool decode_rejected(const std::string& address) {
    try {
        decode_address(address);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

void test_base58() {
    assert(base58_encode({0x00, 0x00, 0x01}) == "112");
    const std::string hello = "hello world";
    std::vector<uint8_t> bytes(hello.begin(), hello.end());
    assert(base58_encode(bytes) == "StV1DL6CwTryKyV");
    assert(base58_decode("StV1DL6CwTryKyV") == bytes);

    bool threw = false;
    try {
        base58_decode("0OIl");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] Base58\n";
}

void test_p2pkh() {
    Hash160 compressed = Hash160::from_hex("751e76e8199196d454941c45d1b3a323f1433bd6");
    Hash160 uncompressed = Hash160::from_hex("91b24bf9f5288532960ac687abb035127b1d28a5");

    assert(encode_address(AddressType::P2PKH, compressed) == "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH");
    assert(encode_address(AddressType::P2PKH, uncompressed) == "1EHNa6Q4Jz2uvNExL497mE43ikXhwF6kZm");

    DecodedAddress d = decode_address("1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH");
    assert(d.type == AddressType::P2PKH);
    assert(d.hash == compressed);

    assert(decode_rejected("1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMJ"));

    std::cout << "[PASS] P2PKH\n";
}

void test_p2sh() {
    Hash160 h = Hash160::from_hex("89abcdefabbaabbaabbaabbaabbaabbaabbaabba");
    std::string address = encode_address(AddressType::P2SH, h);
    assert(address[0] == '3');

    DecodedAddress d = decode_address(address);
    assert(d.type == AddressType::P2SH);
    assert(d.hash == h);

    std::cout << "[PASS] P2SH\n";
}

void test_bech32() {
    Hash160 h = Hash160::from_hex("751e76e8199196d454941c45d1b3a323f1433bd6");
    assert(encode_address(AddressType::P2WPKH, h) == "bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4");

    DecodedAddress lower = decode_address("bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4");
    assert(lower.type == AddressType::P2WPKH);
    assert(lower.hash == h);

    DecodedAddress upper = decode_address("BC1QW508D6QEJXTDG4Y5R3ZARVARY0C5XW7KV8F3T4");
    assert(upper.hash == h);

    assert(decode_rejected("bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t5"));
    assert(decode_rejected("bc1qw508d6qejxtdg4y5r3zarvarY0c5xw7kv8f3t4"));
    // P2WSH (32-byte program) is not an address type we derive
    assert(decode_rejected("bc1qrp33g0q5c5txsp9arysrx4k6zdkfs4nce4xj0gdcccefvpysxf3qccfmv3"));

    std::cout << "[PASS] Bech32\n";
}

void test_raw_hash_and_garbage() {
    DecodedAddress raw = decode_address("751E76E8199196D454941C45D1B3A323F1433BD6");
    assert(raw.hash.to_hex() == "751e76e8199196d454941c45d1b3a323f1433bd6");

    assert(decode_rejected(""));
    assert(decode_rejected("address"));
    assert(decode_rejected("not-an-address"));

    std::cout << "[PASS] Raw hash160 and garbage input\n";
}

int main() {
    std::cout << "=== Address Tests ===\n\n";

    test_base58();
    test_p2pkh();
    test_p2sh();
    test_bech32();
    test_raw_hash_and_garbage();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
