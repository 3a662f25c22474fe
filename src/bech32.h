#pragma once
// Bech32 (BIP-173) and segwit v0 address coding. Bech32m / taproot
// programs are not accepted.
#include <cstdint>
#include <string>
#include <vector>

namespace qcb {

constexpr char BECH32_CHARSET[] = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

std::string bech32_encode(const std::string& hrp, const std::vector<uint8_t>& data5);
// Rejects mixed case, bad checksum, characters outside the charset and
// strings longer than 90. hrp is returned lower-cased.
bool bech32_decode(const std::string& s, std::string& hrp, std::vector<uint8_t>& data5);

// Regroup bits; pad=false fails on leftover non-zero bits.
bool convert_bits(const std::vector<uint8_t>& in, int from, int to, bool pad,
                  std::vector<uint8_t>& out);

std::string encode_segwit_address(const std::string& hrp, uint8_t version,
                                  const std::vector<uint8_t>& program);
// Only version 0 with a 20- or 32-byte program decodes.
bool decode_segwit_address(const std::string& addr, std::string& hrp, uint8_t& version,
                           std::vector<uint8_t>& program);

}  // namespace qcb
