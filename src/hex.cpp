#include "hex.h"
#include <algorithm>
#include <cctype>

namespace qcb {

static inline int unhex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    return -1;
}

bool from_hex(const std::string& h, std::vector<uint8_t>& out) {
    size_t start = 0;
    if (h.size() >= 2 && h[0] == '0' && (h[1] == 'x' || h[1] == 'X')) start = 2;
    const size_t n = h.size() - start;
    if (n % 2 != 0) return false;

    std::vector<uint8_t> tmp(n / 2);
    for (size_t i = 0; i < tmp.size(); ++i) {
        const int hi = unhex_nibble(h[start + 2 * i]);
        const int lo = unhex_nibble(h[start + 2 * i + 1]);
        if (hi < 0 || lo < 0) return false;
        tmp[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    out.swap(tmp);
    return true;
}

std::string to_hex(const std::vector<uint8_t>& v) {
    static constexpr char LUT[] = "0123456789abcdef";
    std::string out(v.size() * 2, '0');
    for (size_t i = 0; i < v.size(); ++i) {
        out[2 * i]     = LUT[v[i] >> 4];
        out[2 * i + 1] = LUT[v[i] & 0x0F];
    }
    return out;
}

std::string to_hex_rev(const std::vector<uint8_t>& v) {
    std::vector<uint8_t> r(v.rbegin(), v.rend());
    return to_hex(r);
}

bool from_hex_rev(const std::string& hex, std::vector<uint8_t>& out) {
    if (!from_hex(hex, out)) return false;
    std::reverse(out.begin(), out.end());
    return true;
}

}  // namespace qcb
