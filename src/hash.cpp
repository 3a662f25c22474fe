#include "hash.h"
#include <openssl/evp.h>

namespace qcb {

static std::vector<uint8_t> evp_digest(const EVP_MD* md, const uint8_t* data, size_t len) {
    std::vector<uint8_t> out(static_cast<size_t>(EVP_MD_size(md)));
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    unsigned int l = 0;
    static const uint8_t empty = 0;
    bool ok = ctx != nullptr
           && EVP_DigestInit_ex(ctx, md, nullptr) == 1
           && EVP_DigestUpdate(ctx, data ? data : &empty, len) == 1
           && EVP_DigestFinal_ex(ctx, out.data(), &l) == 1;
    EVP_MD_CTX_free(ctx);
    // provider failure: zeros, never partially written output
    if (!ok || l != out.size()) out.assign(out.size(), 0);
    return out;
}

std::vector<uint8_t> sha256(const uint8_t* data, size_t len) {
    return evp_digest(EVP_sha256(), data, len);
}

std::vector<uint8_t> sha256(const std::vector<uint8_t>& d) {
    return sha256(d.data(), d.size());
}

std::vector<uint8_t> dsha256(const uint8_t* data, size_t len) {
    return sha256(sha256(data, len));
}

std::vector<uint8_t> dsha256(const std::vector<uint8_t>& d) {
    return dsha256(d.data(), d.size());
}

std::vector<uint8_t> ripemd160(const std::vector<uint8_t>& d) {
    return evp_digest(EVP_ripemd160(), d.data(), d.size());
}

std::vector<uint8_t> hash160(const std::vector<uint8_t>& in) {
    return ripemd160(sha256(in));
}

std::vector<uint8_t> hash_pair(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b) {
    std::vector<uint8_t> buf;
    buf.reserve(a.size() + b.size());
    buf.insert(buf.end(), a.begin(), a.end());
    buf.insert(buf.end(), b.begin(), b.end());
    return dsha256(buf);
}

}  // namespace qcb
