#pragma once
// Digest helpers over OpenSSL EVP. All functions are pure and reentrant.
#include <cstdint>
#include <cstddef>
#include <vector>

namespace qcb {

std::vector<uint8_t> sha256(const uint8_t* data, size_t len);
std::vector<uint8_t> sha256(const std::vector<uint8_t>& data);

// SHA256(SHA256(x)); Bitcoin's txid / block hash / merkle node hash.
std::vector<uint8_t> dsha256(const uint8_t* data, size_t len);
std::vector<uint8_t> dsha256(const std::vector<uint8_t>& data);

std::vector<uint8_t> ripemd160(const std::vector<uint8_t>& data);

// RIPEMD160(SHA256(x)); P2PKH / P2SH / P2WPKH program.
std::vector<uint8_t> hash160(const std::vector<uint8_t>& data);

// dsha256(a || b) for two 32-byte nodes.
std::vector<uint8_t> hash_pair(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b);

}  // namespace qcb
