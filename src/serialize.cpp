#include "serialize.h"
#include <cstring>

namespace qcb {

const char* parse_error_str(ParseError e) {
    switch (e) {
        case ParseError::OK:                     return "ok";
        case ParseError::TRUNCATED:              return "truncated";
        case ParseError::NON_CANONICAL_VARINT:   return "non_canonical_varint";
        case ParseError::SCRIPT_OVERRUN:         return "script_overrun";
        case ParseError::TOO_MANY_INPUTS:        return "too_many_inputs";
        case ParseError::TOO_MANY_OUTPUTS:       return "too_many_outputs";
        case ParseError::TOO_MANY_WITNESS_ITEMS: return "too_many_witness_items";
        case ParseError::NO_INPUTS:              return "no_inputs";
        case ParseError::NO_OUTPUTS:             return "no_outputs";
        case ParseError::BAD_WITNESS_FLAG:       return "bad_witness_flag";
        case ParseError::EMPTY_WITNESS:          return "empty_witness";
        case ParseError::TRAILING_BYTES:         return "trailing_bytes";
        case ParseError::BAD_HEX:                return "bad_hex";
        case ParseError::BAD_SCRIPT:             return "bad_script";
    }
    return "unknown";
}

void put_u16_le(Bytes& v, uint16_t x) {
    v.push_back(uint8_t(x & 0xff));
    v.push_back(uint8_t((x >> 8) & 0xff));
}

void put_u32_le(Bytes& v, uint32_t x) {
    for (int i = 0; i < 4; i++) v.push_back(uint8_t((x >> (i * 8)) & 0xff));
}

void put_u64_le(Bytes& v, uint64_t x) {
    for (int i = 0; i < 8; i++) v.push_back(uint8_t((x >> (i * 8)) & 0xff));
}

void put_varint(Bytes& v, uint64_t n) {
    if (n < 0xfd) {
        v.push_back(uint8_t(n));
    } else if (n <= 0xffff) {
        v.push_back(0xfd);
        put_u16_le(v, uint16_t(n));
    } else if (n <= 0xffffffffULL) {
        v.push_back(0xfe);
        put_u32_le(v, uint32_t(n));
    } else {
        v.push_back(0xff);
        put_u64_le(v, n);
    }
}

size_t varint_size(uint64_t n) {
    if (n < 0xfd) return 1;
    if (n <= 0xffff) return 3;
    if (n <= 0xffffffffULL) return 5;
    return 9;
}

void put_varbytes(Bytes& v, const Bytes& b) {
    put_varint(v, b.size());
    v.insert(v.end(), b.begin(), b.end());
}

void put_string(Bytes& v, const std::string& s) {
    put_varint(v, s.size());
    v.insert(v.end(), s.begin(), s.end());
}

bool ByteCursor::peek(size_t off, uint8_t& out) const {
    if (off >= remaining()) return false;
    out = p_[pos_ + off];
    return true;
}

ParseError ByteCursor::read_u8(uint8_t& out) {
    if (remaining() < 1) return ParseError::TRUNCATED;
    out = p_[pos_++];
    return ParseError::OK;
}

ParseError ByteCursor::read_u16_le(uint16_t& out) {
    if (remaining() < 2) return ParseError::TRUNCATED;
    out = uint16_t(p_[pos_] | (p_[pos_ + 1] << 8));
    pos_ += 2;
    return ParseError::OK;
}

ParseError ByteCursor::read_u32_le(uint32_t& out) {
    if (remaining() < 4) return ParseError::TRUNCATED;
    uint32_t x = 0;
    for (int k = 0; k < 4; k++) x |= uint32_t(p_[pos_ + k]) << (k * 8);
    out = x;
    pos_ += 4;
    return ParseError::OK;
}

ParseError ByteCursor::read_u64_le(uint64_t& out) {
    if (remaining() < 8) return ParseError::TRUNCATED;
    uint64_t x = 0;
    for (int k = 0; k < 8; k++) x |= uint64_t(p_[pos_ + k]) << (k * 8);
    out = x;
    pos_ += 8;
    return ParseError::OK;
}

ParseError ByteCursor::read_varint(uint64_t& out) {
    uint8_t tag = 0;
    ParseError e = read_u8(tag);
    if (e != ParseError::OK) return e;

    if (tag < 0xfd) {
        out = tag;
        return ParseError::OK;
    }
    if (tag == 0xfd) {
        uint16_t v = 0;
        if ((e = read_u16_le(v)) != ParseError::OK) return e;
        if (v < 0xfd) return ParseError::NON_CANONICAL_VARINT;
        out = v;
        return ParseError::OK;
    }
    if (tag == 0xfe) {
        uint32_t v = 0;
        if ((e = read_u32_le(v)) != ParseError::OK) return e;
        if (v <= 0xffff) return ParseError::NON_CANONICAL_VARINT;
        out = v;
        return ParseError::OK;
    }
    uint64_t v = 0;
    if ((e = read_u64_le(v)) != ParseError::OK) return e;
    if (v <= 0xffffffffULL) return ParseError::NON_CANONICAL_VARINT;
    out = v;
    return ParseError::OK;
}

ParseError ByteCursor::read_bytes(size_t len, Bytes& out) {
    if (remaining() < len) return ParseError::TRUNCATED;
    out.assign(p_ + pos_, p_ + pos_ + len);
    pos_ += len;
    return ParseError::OK;
}

ParseError ByteCursor::read_varbytes(Bytes& out) {
    uint64_t len = 0;
    ParseError e = read_varint(len);
    if (e != ParseError::OK) return e;
    if (len > remaining()) return ParseError::SCRIPT_OVERRUN;
    return read_bytes(static_cast<size_t>(len), out);
}

ParseError ByteCursor::read_string(std::string& out) {
    Bytes raw;
    ParseError e = read_varbytes(raw);
    if (e != ParseError::OK) return e;
    out.assign(raw.begin(), raw.end());
    return ParseError::OK;
}

ParseError ByteCursor::skip(size_t len) {
    if (remaining() < len) return ParseError::TRUNCATED;
    pos_ += len;
    return ParseError::OK;
}

}  // namespace qcb
