#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>
#include "bignum.h"

namespace qcb {

struct BtcHeader;

// Unpack compact bits (1-byte exponent, 3-byte mantissa) into a 256-bit
// target. False for a negative (sign bit set) or over-256-bit encoding.
bool target_from_bits(uint32_t bits, BigNum& out);

// Inverse of target_from_bits (loses precision below the top 3 bytes).
uint32_t bits_from_target(const BigNum& target);

// 2^256 / (target + 1); zero for an invalid encoding.
BigNum work_from_bits(uint32_t bits);

// Bitcoin's 2016-block retarget period.
#ifndef QCB_RETARGET_INTERVAL
#define QCB_RETARGET_INTERVAL 2016u
#endif

// Current and previous retarget-epoch difficulty, supplied by an external
// relay. Proofs must be built from headers of one of those two epochs.
class DifficultyOracle {
public:
    DifficultyOracle() = default;
    DifficultyOracle(uint32_t current_bits, uint32_t previous_bits)
        : current_bits_(current_bits), previous_bits_(previous_bits) {}

    uint32_t current_bits() const { return current_bits_; }
    uint32_t previous_bits() const { return previous_bits_; }

    // Shift current into previous; new_bits becomes current.
    void advance_epoch(uint32_t new_bits);

    // bits equals the current or the previous epoch's bits.
    bool accepts_bits(uint32_t bits) const;

    BigNum target(uint32_t bits) const;
    // Sum of per-header work.
    BigNum work_of(const std::vector<BtcHeader>& headers) const;

    // factor x work(first header's epoch bits).
    BigNum required_work(uint32_t bits, uint64_t factor) const;

    // The first header's bits must be an accepted epoch, and accumulated
    // work must reach factor average-difficulty confirmations of it.
    bool meets_minimum_work(const std::vector<BtcHeader>& headers, uint64_t factor) const;

private:
    uint32_t current_bits_{0};
    uint32_t previous_bits_{0};
};

}  // namespace qcb
