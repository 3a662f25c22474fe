#include "base58.h"
#include "hash.h"
#include <algorithm>
#include <cstring>

namespace qcb {

static const char* ALPH = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

static int alph_index(char c) {
    if (c == '\0') return -1;
    const char* p = std::strchr(ALPH, c);
    return p ? int(p - ALPH) : -1;
}

std::string base58_encode(const std::vector<uint8_t>& in) {
    size_t zeros = 0;
    while (zeros < in.size() && in[zeros] == 0) ++zeros;

    // Little-endian base-58 digits of the big-endian input number.
    std::vector<uint8_t> digits;
    digits.reserve(in.size() * 138 / 100 + 1);
    for (size_t i = zeros; i < in.size(); ++i) {
        uint32_t carry = in[i];
        for (auto& d : digits) {
            carry += uint32_t(d) << 8;
            d = uint8_t(carry % 58);
            carry /= 58;
        }
        while (carry) {
            digits.push_back(uint8_t(carry % 58));
            carry /= 58;
        }
    }

    std::string out(zeros, '1');
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) out.push_back(ALPH[*it]);
    return out;
}

bool base58_decode(const std::string& s, std::vector<uint8_t>& out) {
    if (s.empty()) return false;
    size_t zeros = 0;
    while (zeros < s.size() && s[zeros] == '1') ++zeros;

    // Little-endian base-256 bytes.
    std::vector<uint8_t> bytes;
    bytes.reserve(s.size() * 733 / 1000 + 1);
    for (size_t i = zeros; i < s.size(); ++i) {
        const int v = alph_index(s[i]);
        if (v < 0) return false;
        uint32_t carry = uint32_t(v);
        for (auto& b : bytes) {
            carry += uint32_t(b) * 58;
            b = uint8_t(carry & 0xff);
            carry >>= 8;
        }
        while (carry) {
            bytes.push_back(uint8_t(carry & 0xff));
            carry >>= 8;
        }
    }

    out.assign(zeros, 0);
    out.insert(out.end(), bytes.rbegin(), bytes.rend());
    return true;
}

std::string base58check_encode(uint8_t version, const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> b;
    b.reserve(payload.size() + 5);
    b.push_back(version);
    b.insert(b.end(), payload.begin(), payload.end());
    const auto c = dsha256(b);
    b.insert(b.end(), c.begin(), c.begin() + 4);
    return base58_encode(b);
}

bool base58check_decode(const std::string& s, uint8_t& version, std::vector<uint8_t>& payload) {
    std::vector<uint8_t> b;
    if (!base58_decode(s, b) || b.size() < 5) return false;
    std::vector<uint8_t> body(b.begin(), b.end() - 4);
    const auto c = dsha256(body);
    if (!std::equal(c.begin(), c.begin() + 4, b.end() - 4)) return false;
    version = b[0];
    payload.assign(b.begin() + 1, b.end() - 4);
    return true;
}

}  // namespace qcb
