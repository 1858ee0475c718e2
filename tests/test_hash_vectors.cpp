/**
 * Crypto Test Vectors
 *
 * Verifies the OpenSSL wrappers against NIST, BIP32 and BIP39 vectors and
 * known Bitcoin values.
 */

#include "../src/core/crypto.hpp"
#include "../src/core/errors.hpp"
#include <cassert>
#include <cstring>
#include <iostream>

using namespace seedhound;
using namespace seedhound::crypto;

static std::string hex(const uint8_t* data, size_t len) { return to_hex(data, len); }

template <size_t N>
static std::string hex(const std::array<uint8_t, N>& a) { return to_hex(a.data(), a.size()); }

static Hash256 key_from_int(uint8_t value) {
    Hash256 key{};
    key[31] = value;
    return key;
}

void test_sha256_vectors() {
    assert(hex(sha256("")) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    assert(hex(sha256("abc")) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(hex(sha256("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq")) ==
           "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");

    std::cout << "[PASS] SHA-256 vectors\n";
}

void test_hex_helpers() {
    std::vector<uint8_t> bytes = from_hex("00ff10Ab");
    assert(bytes.size() == 4);
    assert(bytes[0] == 0x00 && bytes[1] == 0xff && bytes[2] == 0x10 && bytes[3] == 0xab);
    assert(hex(bytes.data(), bytes.size()) == "00ff10ab");

    bool threw = false;
    try {
        from_hex("abc");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] Hex helpers\n";
}

void test_public_keys() {
    Secp256k1& secp = Secp256k1::thread_context();
    std::vector<uint8_t> pub;

    assert(secp.public_key(key_from_int(1), true, pub));
    assert(hex(pub.data(), pub.size()) ==
           "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798");
    assert(hash160(pub.data(), pub.size()).to_hex() == "751e76e8199196d454941c45d1b3a323f1433bd6");

    assert(secp.public_key(key_from_int(1), false, pub));
    assert(pub.size() == 65 && pub[0] == 0x04);
    assert(hash160(pub.data(), pub.size()).to_hex() == "91b24bf9f5288532960ac687abb035127b1d28a5");

    assert(!secp.public_key(key_from_int(0), true, pub));
    assert(!secp.valid_private_key(key_from_int(0)));

    Hash256 max_key;
    max_key.fill(0xff);
    assert(!secp.valid_private_key(max_key));

    std::cout << "[PASS] secp256k1 public keys\n";
}

void test_bip39_seed() {
    const std::string mnemonic =
        "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon "
        "abandon about";

    assert(hex(pbkdf2_sha512(mnemonic, "mnemonic", 2048)) ==
           "5eb00bbddcf069084889a8ab9155568165f5c453ccb85e70811aaed6f6da5fc1"
           "9a5ac40b389cd370d086206dec8aa6c43daea6690f20ad3d8d48b2d2ce9e38e4");
    assert(hex(pbkdf2_sha512(mnemonic, "mnemonicTREZOR", 2048)) ==
           "c55257c360c07c72029aebc1b53c05ed0362ada38ead3e3e9efa3708e5349553"
           "1f09a6987599d18264c1e1c92f2cf141630c7a3c4ab7c81b2f001698e7463b04");

    std::cout << "[PASS] BIP39 seed derivation\n";
}

void test_bip32_vector() {
    std::vector<uint8_t> seed = from_hex("000102030405060708090a0b0c0d0e0f");
    ExtendedKey master = bip32_master(seed.data(), seed.size());
    assert(hex(master.key) == "e8f32e723decf4051aefac8e2c93c9c5b214313817cdb01a1494b917c8436b35");
    assert(hex(master.chain_code) ==
           "873dff81c02f525623fd1fe5167eac3a55a049de3d314bb42ee227ffed37d508");

    auto child = bip32_child(Secp256k1::thread_context(), master, HARDENED);
    assert(child.has_value());
    assert(hex(child->key) == "edb2e14f9ee77d26dd93b4ecede8d16ed408ce149b6cd80b0715a2d911a0afea");
    assert(hex(child->chain_code) ==
           "47fdacbd0f1097043b78c63c20c34ef4ed9a111d980047ad16282c7ae6236141");

    std::cout << "[PASS] BIP32 vector 1\n";
}

void test_derivation_paths() {
    auto p = parse_derivation_path("m/44'/0'/0'/0");
    assert((p == std::vector<uint32_t>{44 | HARDENED, HARDENED, HARDENED, 0}));

    auto h = parse_derivation_path("m/84h/0H/1'/1");
    assert((h == std::vector<uint32_t>{84 | HARDENED, HARDENED, 1 | HARDENED, 1}));

    assert(parse_derivation_path("m").empty());

    for (const char* bad : {"44'/0'", "m/x", "m//1", "m/1''", "m/4294967296"}) {
        bool threw = false;
        try {
            parse_derivation_path(bad);
        } catch (const ConfigurationError&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[PASS] Derivation paths\n";
}

int main() {
    std::cout << "=== Crypto Vector Tests ===\n\n";

    test_sha256_vectors();
    test_hex_helpers();
    test_public_keys();
    test_bip39_seed();
    test_bip32_vector();
    test_derivation_paths();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
