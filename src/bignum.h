#pragma once
// =============================================================================
// Unsigned arbitrary-precision integer over OpenSSL BIGNUM.
// Used for 256-bit targets and accumulated chain work; never overflows.
// =============================================================================
#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

struct bignum_st;

namespace qcb {

class BigNum {
public:
    BigNum();
    explicit BigNum(uint64_t v);
    BigNum(const BigNum& o);
    BigNum(BigNum&& o) noexcept = default;
    BigNum& operator=(const BigNum& o);
    BigNum& operator=(BigNum&& o) noexcept = default;
    ~BigNum() = default;

    static BigNum from_be_bytes(const uint8_t* p, size_t len);
    // Bitcoin hashes are little-endian integers.
    static BigNum from_le_bytes(const uint8_t* p, size_t len);
    static BigNum from_le_bytes(const std::vector<uint8_t>& v) { return from_le_bytes(v.data(), v.size()); }
    static BigNum pow2(int n);

    BigNum operator+(const BigNum& o) const;
    BigNum operator-(const BigNum& o) const;   // saturates at zero
    BigNum operator*(const BigNum& o) const;
    BigNum operator/(const BigNum& o) const;   // division by zero yields zero
    BigNum operator<<(int n) const;
    BigNum operator>>(int n) const;
    BigNum& operator+=(const BigNum& o) { return *this = *this + o; }

    int cmp(const BigNum& o) const;
    bool operator==(const BigNum& o) const { return cmp(o) == 0; }
    bool operator!=(const BigNum& o) const { return cmp(o) != 0; }
    bool operator<(const BigNum& o) const  { return cmp(o) < 0; }
    bool operator<=(const BigNum& o) const { return cmp(o) <= 0; }
    bool operator>(const BigNum& o) const  { return cmp(o) > 0; }
    bool operator>=(const BigNum& o) const { return cmp(o) >= 0; }

    bool is_zero() const;
    int num_bits() const;
    // Fails (returns false) when the value does not fit.
    bool to_u64(uint64_t& out) const;
    // Big-endian, left-padded to width bytes; false if it does not fit.
    bool to_be_bytes(size_t width, std::vector<uint8_t>& out) const;
    std::string to_hex() const;
    std::string to_dec() const;

private:
    struct Free { void operator()(bignum_st* b) const; };
    std::unique_ptr<bignum_st, Free> bn_;
};

}  // namespace qcb
