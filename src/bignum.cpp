#include "bignum.h"
#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <algorithm>
#include <new>

namespace qcb {

void BigNum::Free::operator()(bignum_st* b) const { BN_free(b); }

static BIGNUM* bn_or_throw(BIGNUM* b) {
    if (!b) throw std::bad_alloc();
    return b;
}

// RAII for the scratch context some BN operations need.
struct BnCtx {
    BN_CTX* c;
    BnCtx() : c(BN_CTX_new()) { if (!c) throw std::bad_alloc(); }
    ~BnCtx() { BN_CTX_free(c); }
    BnCtx(const BnCtx&) = delete;
    BnCtx& operator=(const BnCtx&) = delete;
};

BigNum::BigNum() : bn_(bn_or_throw(BN_new())) {}

BigNum::BigNum(uint64_t v) : bn_(bn_or_throw(BN_new())) {
    uint8_t be[8];
    for (int i = 0; i < 8; ++i) be[i] = uint8_t(v >> (56 - 8 * i));
    BN_bin2bn(be, 8, bn_.get());
}

BigNum::BigNum(const BigNum& o) : bn_(bn_or_throw(BN_dup(o.bn_.get()))) {}

BigNum& BigNum::operator=(const BigNum& o) {
    if (this != &o) {
        if (!bn_) bn_.reset(bn_or_throw(BN_dup(o.bn_.get())));
        else if (!BN_copy(bn_.get(), o.bn_.get())) throw std::bad_alloc();
    }
    return *this;
}

BigNum BigNum::from_be_bytes(const uint8_t* p, size_t len) {
    BigNum r;
    if (len) BN_bin2bn(p, static_cast<int>(len), r.bn_.get());
    return r;
}

BigNum BigNum::from_le_bytes(const uint8_t* p, size_t len) {
    std::vector<uint8_t> be(p, p + len);
    std::reverse(be.begin(), be.end());
    return from_be_bytes(be.data(), be.size());
}

BigNum BigNum::pow2(int n) {
    BigNum r;
    BN_set_bit(r.bn_.get(), n);
    return r;
}

BigNum BigNum::operator+(const BigNum& o) const {
    BigNum r;
    if (!BN_add(r.bn_.get(), bn_.get(), o.bn_.get())) throw std::bad_alloc();
    return r;
}

BigNum BigNum::operator-(const BigNum& o) const {
    BigNum r;
    if (cmp(o) <= 0) return r;
    if (!BN_sub(r.bn_.get(), bn_.get(), o.bn_.get())) throw std::bad_alloc();
    return r;
}

BigNum BigNum::operator*(const BigNum& o) const {
    BigNum r;
    BnCtx ctx;
    if (!BN_mul(r.bn_.get(), bn_.get(), o.bn_.get(), ctx.c)) throw std::bad_alloc();
    return r;
}

BigNum BigNum::operator/(const BigNum& o) const {
    BigNum r;
    if (o.is_zero()) return r;
    BnCtx ctx;
    if (!BN_div(r.bn_.get(), nullptr, bn_.get(), o.bn_.get(), ctx.c)) throw std::bad_alloc();
    return r;
}

BigNum BigNum::operator<<(int n) const {
    BigNum r;
    if (!BN_lshift(r.bn_.get(), bn_.get(), n)) throw std::bad_alloc();
    return r;
}

BigNum BigNum::operator>>(int n) const {
    BigNum r;
    if (!BN_rshift(r.bn_.get(), bn_.get(), n)) throw std::bad_alloc();
    return r;
}

int BigNum::cmp(const BigNum& o) const { return BN_cmp(bn_.get(), o.bn_.get()); }

bool BigNum::is_zero() const { return BN_is_zero(bn_.get()) == 1; }

int BigNum::num_bits() const { return BN_num_bits(bn_.get()); }

bool BigNum::to_u64(uint64_t& out) const {
    if (num_bits() > 64) return false;
    std::vector<uint8_t> be;
    if (!to_be_bytes(8, be)) return false;
    uint64_t v = 0;
    for (uint8_t b : be) v = (v << 8) | b;
    out = v;
    return true;
}

bool BigNum::to_be_bytes(size_t width, std::vector<uint8_t>& out) const {
    if (static_cast<size_t>(BN_num_bytes(bn_.get())) > width) return false;
    out.assign(width, 0);
    return BN_bn2binpad(bn_.get(), out.data(), static_cast<int>(width)) == static_cast<int>(width);
}

std::string BigNum::to_hex() const {
    char* s = BN_bn2hex(bn_.get());
    if (!s) throw std::bad_alloc();
    std::string r(s);
    OPENSSL_free(s);
    std::transform(r.begin(), r.end(), r.begin(), [](char c) {
        return (c >= 'A' && c <= 'F') ? char(c - 'A' + 'a') : c;
    });
    return r;
}

std::string BigNum::to_dec() const {
    char* s = BN_bn2dec(bn_.get());
    if (!s) throw std::bad_alloc();
    std::string r(s);
    OPENSSL_free(s);
    return r;
}

}  // namespace qcb
