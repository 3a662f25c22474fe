#pragma once
// =============================================================================
// 80-byte Bitcoin block header:
//   u32 version | 32 prev hash | 32 merkle root | u32 time | u32 bits | u32 nonce
// Hashes are kept in internal (little-endian) byte order.
// =============================================================================
#include <cstdint>
#include <vector>
#include "serialize.h"

namespace qcb {

constexpr size_t BTC_HEADER_SIZE = 80;

struct BtcHeader {
    uint32_t version{1};
    Bytes    prev_hash;      // 32 bytes
    Bytes    merkle_root;    // 32 bytes
    uint32_t time{0};
    uint32_t bits{0};
    uint32_t nonce{0};

    Bytes serialize() const;
    Bytes hash() const;      // dsha256 of serialize()
};

ParseError parse_btc_header(const uint8_t* p, size_t len, BtcHeader& out);

// Split a concatenation of headers. False if the length is zero or not a
// multiple of 80.
bool split_headers(const Bytes& raw, std::vector<BtcHeader>& out);

// hash <= target(bits), both read as 256-bit little-endian integers.
bool check_header_pow(const BtcHeader& h);

}  // namespace qcb
