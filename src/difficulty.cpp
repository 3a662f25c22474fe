#include "difficulty.h"
#include "block.h"
#include "log.h"
#include <sstream>

namespace qcb {

bool target_from_bits(uint32_t bits, BigNum& out) {
    const uint32_t exp  = bits >> 24;
    const uint32_t mant = bits & 0x007fffff;

    if (mant != 0 && (bits & 0x00800000)) return false;   // negative
    if (mant == 0) {
        out = BigNum();
        return true;
    }

    BigNum t(mant);
    if (exp <= 3) {
        t = t >> int(8 * (3 - exp));
    } else {
        t = t << int(8 * (exp - 3));
    }
    if (t.num_bits() > 256) return false;                 // overflow
    out = std::move(t);
    return true;
}

uint32_t bits_from_target(const BigNum& target) {
    int size = (target.num_bits() + 7) / 8;
    uint64_t mant = 0;
    uint64_t v = 0;
    if (size <= 3) {
        if (!target.to_u64(v)) return 0;
        mant = v << (8 * (3 - size));
    } else {
        if (!(target >> (8 * (size - 3))).to_u64(v)) return 0;
        mant = v;
    }
    // Keep the sign bit clear.
    if (mant & 0x00800000) {
        mant >>= 8;
        ++size;
    }
    return (uint32_t(size) << 24) | uint32_t(mant & 0x007fffff);
}

BigNum work_from_bits(uint32_t bits) {
    BigNum t;
    if (!target_from_bits(bits, t) || t.is_zero()) return BigNum();
    return BigNum::pow2(256) / (t + BigNum(1));
}

void DifficultyOracle::advance_epoch(uint32_t new_bits) {
    previous_bits_ = current_bits_;
    current_bits_ = new_bits;
    std::ostringstream ss;
    ss << "difficulty: epoch advanced, current=0x" << std::hex << current_bits_
       << " previous=0x" << previous_bits_;
    log_info(LogCategory::SPV, ss.str());
}

bool DifficultyOracle::accepts_bits(uint32_t bits) const {
    if (bits == 0) return false;
    return bits == current_bits_ || bits == previous_bits_;
}

BigNum DifficultyOracle::target(uint32_t bits) const {
    BigNum t;
    if (!target_from_bits(bits, t)) return BigNum();
    return t;
}

BigNum DifficultyOracle::work_of(const std::vector<BtcHeader>& headers) const {
    BigNum total;
    for (const auto& h : headers) total += work_from_bits(h.bits);
    return total;
}

BigNum DifficultyOracle::required_work(uint32_t bits, uint64_t factor) const {
    return work_from_bits(bits) * BigNum(factor);
}

bool DifficultyOracle::meets_minimum_work(const std::vector<BtcHeader>& headers, uint64_t factor) const {
    if (headers.empty() || factor == 0) return false;
    if (!accepts_bits(headers.front().bits)) return false;
    const BigNum need = required_work(headers.front().bits, factor);
    if (need.is_zero()) return false;
    return work_of(headers) >= need;
}

}  // namespace qcb
