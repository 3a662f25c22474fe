#include "bech32.h"
#include <cctype>
#include <cstring>

namespace qcb {

static std::vector<uint8_t> expand_hrp(const std::string& hrp) {
    std::vector<uint8_t> r;
    r.reserve(hrp.size() * 2 + 1);
    for (char c : hrp) r.push_back(uint8_t(c) >> 5);
    r.push_back(0);
    for (char c : hrp) r.push_back(uint8_t(c) & 0x1f);
    return r;
}

static uint32_t polymod(const std::vector<uint8_t>& v) {
    static const uint32_t GEN[5] = {0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3};
    uint32_t chk = 1;
    for (uint8_t x : v) {
        const uint8_t top = uint8_t(chk >> 25);
        chk = ((chk & 0x1ffffff) << 5) ^ x;
        for (int i = 0; i < 5; ++i)
            if ((top >> i) & 1) chk ^= GEN[i];
    }
    return chk;
}

std::string bech32_encode(const std::string& hrp, const std::vector<uint8_t>& data5) {
    std::vector<uint8_t> v = expand_hrp(hrp);
    v.insert(v.end(), data5.begin(), data5.end());
    v.insert(v.end(), 6, 0);
    const uint32_t mod = polymod(v) ^ 1;

    std::string out = hrp + "1";
    for (uint8_t d : data5) out.push_back(BECH32_CHARSET[d & 31]);
    for (int i = 0; i < 6; ++i) out.push_back(BECH32_CHARSET[(mod >> (5 * (5 - i))) & 31]);
    return out;
}

bool bech32_decode(const std::string& s, std::string& hrp, std::vector<uint8_t>& data5) {
    if (s.size() < 8 || s.size() > 90) return false;
    bool lower = false, upper = false;
    for (char c : s) {
        if (c < 33 || c > 126) return false;
        if (c >= 'a' && c <= 'z') lower = true;
        if (c >= 'A' && c <= 'Z') upper = true;
    }
    if (lower && upper) return false;

    const size_t sep = s.rfind('1');
    if (sep == std::string::npos || sep == 0 || sep + 7 > s.size()) return false;

    std::string h;
    for (size_t i = 0; i < sep; ++i) h.push_back(char(std::tolower((unsigned char)s[i])));

    std::vector<uint8_t> d;
    for (size_t i = sep + 1; i < s.size(); ++i) {
        const char c = char(std::tolower((unsigned char)s[i]));
        const char* p = std::strchr(BECH32_CHARSET, c);
        if (!p || c == '\0') return false;
        d.push_back(uint8_t(p - BECH32_CHARSET));
    }

    std::vector<uint8_t> v = expand_hrp(h);
    v.insert(v.end(), d.begin(), d.end());
    if (polymod(v) != 1) return false;

    hrp = h;
    data5.assign(d.begin(), d.end() - 6);
    return true;
}

bool convert_bits(const std::vector<uint8_t>& in, int from, int to, bool pad,
                  std::vector<uint8_t>& out) {
    uint32_t acc = 0;
    int bits = 0;
    const uint32_t maxv = (1u << to) - 1;
    out.clear();
    for (uint8_t x : in) {
        if ((x >> from) != 0) return false;
        acc = (acc << from) | x;
        bits += from;
        while (bits >= to) {
            bits -= to;
            out.push_back(uint8_t((acc >> bits) & maxv));
        }
    }
    if (pad) {
        if (bits) out.push_back(uint8_t((acc << (to - bits)) & maxv));
    } else if (bits >= from || ((acc << (to - bits)) & maxv)) {
        return false;
    }
    return true;
}

std::string encode_segwit_address(const std::string& hrp, uint8_t version,
                                  const std::vector<uint8_t>& program) {
    std::vector<uint8_t> d5;
    if (!convert_bits(program, 8, 5, true, d5)) return {};
    d5.insert(d5.begin(), version);
    return bech32_encode(hrp, d5);
}

bool decode_segwit_address(const std::string& addr, std::string& hrp, uint8_t& version,
                           std::vector<uint8_t>& program) {
    std::vector<uint8_t> d5;
    if (!bech32_decode(addr, hrp, d5) || d5.empty()) return false;
    if (d5[0] != 0) return false;

    std::vector<uint8_t> prog;
    std::vector<uint8_t> rest(d5.begin() + 1, d5.end());
    if (!convert_bits(rest, 5, 8, false, prog)) return false;
    if (prog.size() != 20 && prog.size() != 32) return false;

    version = 0;
    program = std::move(prog);
    return true;
}

}  // namespace qcb
