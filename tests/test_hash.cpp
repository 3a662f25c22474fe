// Digests, Base58Check and Bech32 against published vectors.
#include "base58.h"
#include "bech32.h"
#include "hash.h"
#include "hex.h"
#include "test_util.h"
#include <cstdio>

using namespace qcb;

int main(){
    const Bytes abc{'a', 'b', 'c'};

    TEST_CHECK(to_hex(sha256(abc)) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
               "SHA256('abc')");
    TEST_CHECK(to_hex(ripemd160(abc)) == "8eb208f7e05d987a9b044a8e98c6b087f15a0bfc", "RIPEMD160('abc')");
    TEST_CHECK(to_hex(dsha256(Bytes())) == "5df6e0e2761359d30a8275058e299fcc0381534545f55cf43e41983f5d4c9456",
               "SHA256d('')");
    TEST_CHECK(hash160(abc) == ripemd160(sha256(abc)), "HASH160 composition");
    {
        Bytes a(32, 0x01), b(32, 0x02), cat = a;
        cat.insert(cat.end(), b.begin(), b.end());
        TEST_CHECK(hash_pair(a, b) == dsha256(cat), "hash_pair = SHA256d(a||b)");
    }
    std::printf("  [PASS] digests\n");

    {
        const std::string hw = "hello world";
        TEST_CHECK(base58_encode(Bytes(hw.begin(), hw.end())) == "StV1DL6CwTryKyV", "base58 'hello world'");
        TEST_CHECK(base58_encode(Bytes{0, 0, 1}) == "112", "leading zeros become '1'");
        Bytes out;
        TEST_CHECK(base58_decode("112", out) && out == (Bytes{0, 0, 1}), "base58 decode leading zeros");
        TEST_CHECK(!base58_decode("0OIl", out), "characters outside the alphabet");

        Bytes h;
        from_hex("62e907b15cbf27d5425399ebf6f0fb50ebb88f18", h);
        TEST_CHECK(base58check_encode(0x00, h) == "1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa", "base58check genesis address");
        uint8_t ver = 0xff;
        Bytes payload;
        TEST_CHECK(base58check_decode("1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa", ver, payload), "base58check decode");
        TEST_CHECK(ver == 0x00 && payload == h, "base58check version and payload");
        TEST_CHECK(!base58check_decode("1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNb", ver, payload), "bad checksum");
        std::printf("  [PASS] base58\n");
    }

    {
        std::string hrp;
        uint8_t ver = 0xff;
        Bytes prog;
        TEST_CHECK(decode_segwit_address("bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4", hrp, ver, prog),
                   "BIP173 P2WPKH decodes");
        TEST_CHECK(hrp == "bc" && ver == 0 && to_hex(prog) == "751e76e8199196d454941c45d1b3a323f1433bd6",
                   "BIP173 P2WPKH program");
        TEST_CHECK(decode_segwit_address("BC1QW508D6QEJXTDG4Y5R3ZARVARY0C5XW7KV8F3T4", hrp, ver, prog),
                   "upper case is valid");
        TEST_CHECK(!decode_segwit_address("bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t5", hrp, ver, prog),
                   "bad bech32 checksum");
        TEST_CHECK(!decode_segwit_address("bc1qW508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4", hrp, ver, prog),
                   "mixed case rejected");
        TEST_CHECK(encode_segwit_address("bc", 0, prog) == "bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4",
                   "segwit encode");
        TEST_CHECK(decode_segwit_address("tb1qrp33g0q5c5txsp9arysrx4k6zdkfs4nce4xj0gdcccefvpysxf3q0sl5k7",
                                         hrp, ver, prog), "BIP173 P2WSH decodes");
        TEST_CHECK(hrp == "tb" && prog.size() == 32, "P2WSH program length");
        std::printf("  [PASS] bech32\n");
    }

    std::printf("All hash tests passed\n");
    return 0;
}
