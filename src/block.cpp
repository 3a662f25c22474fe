#include "block.h"
#include "difficulty.h"
#include "hash.h"
#include "bignum.h"

namespace qcb {

Bytes BtcHeader::serialize() const {
    Bytes h;
    h.reserve(BTC_HEADER_SIZE);
    put_u32_le(h, version);
    h.insert(h.end(), prev_hash.begin(), prev_hash.end());
    h.insert(h.end(), merkle_root.begin(), merkle_root.end());
    put_u32_le(h, time);
    put_u32_le(h, bits);
    put_u32_le(h, nonce);
    return h;
}

Bytes BtcHeader::hash() const {
    return dsha256(serialize());
}

ParseError parse_btc_header(const uint8_t* p, size_t len, BtcHeader& out) {
    if (len < BTC_HEADER_SIZE) return ParseError::TRUNCATED;
    ByteCursor cur(p, BTC_HEADER_SIZE);
    BtcHeader h;
    ParseError e;
    if ((e = cur.read_u32_le(h.version)) != ParseError::OK) return e;
    if ((e = cur.read_bytes(32, h.prev_hash)) != ParseError::OK) return e;
    if ((e = cur.read_bytes(32, h.merkle_root)) != ParseError::OK) return e;
    if ((e = cur.read_u32_le(h.time)) != ParseError::OK) return e;
    if ((e = cur.read_u32_le(h.bits)) != ParseError::OK) return e;
    if ((e = cur.read_u32_le(h.nonce)) != ParseError::OK) return e;
    out = std::move(h);
    return ParseError::OK;
}

bool split_headers(const Bytes& raw, std::vector<BtcHeader>& out) {
    if (raw.empty() || raw.size() % BTC_HEADER_SIZE != 0) return false;
    out.clear();
    out.reserve(raw.size() / BTC_HEADER_SIZE);
    for (size_t off = 0; off < raw.size(); off += BTC_HEADER_SIZE) {
        BtcHeader h;
        if (parse_btc_header(raw.data() + off, BTC_HEADER_SIZE, h) != ParseError::OK) return false;
        out.push_back(std::move(h));
    }
    return true;
}

bool check_header_pow(const BtcHeader& h) {
    BigNum target;
    if (!target_from_bits(h.bits, target) || target.is_zero()) return false;
    return BigNum::from_le_bytes(h.hash()) <= target;
}

}  // namespace qcb
