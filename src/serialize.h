#pragma once
// =============================================================================
// Bitcoin wire primitives: little-endian integers and CompactSize var-ints.
// Writers append to a byte vector; ByteCursor reads with bounds checks and
// never advances past the end of its buffer.
// =============================================================================
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace qcb {

using Bytes = std::vector<uint8_t>;

enum class ParseError {
    OK = 0,
    TRUNCATED,              // buffer ended inside a field
    NON_CANONICAL_VARINT,   // var-int encoded with more bytes than needed
    SCRIPT_OVERRUN,         // declared script/item length exceeds remaining bytes
    TOO_MANY_INPUTS,
    TOO_MANY_OUTPUTS,
    TOO_MANY_WITNESS_ITEMS,
    NO_INPUTS,
    NO_OUTPUTS,
    BAD_WITNESS_FLAG,
    EMPTY_WITNESS,          // segwit marker present but every stack is empty
    TRAILING_BYTES,
    BAD_HEX,
    BAD_SCRIPT
};

const char* parse_error_str(ParseError e);

// ---- writers ----
void put_u16_le(Bytes& v, uint16_t x);
void put_u32_le(Bytes& v, uint32_t x);
void put_u64_le(Bytes& v, uint64_t x);
void put_varint(Bytes& v, uint64_t n);
void put_varbytes(Bytes& v, const Bytes& b);   // varint length + bytes
void put_string(Bytes& v, const std::string& s);

// Number of bytes put_varint would write for n.
size_t varint_size(uint64_t n);

// ---- reader ----
class ByteCursor {
public:
    ByteCursor(const uint8_t* data, size_t len) : p_(data), n_(len), pos_(0) {}
    explicit ByteCursor(const Bytes& b) : p_(b.data()), n_(b.size()), pos_(0) {}

    size_t pos() const { return pos_; }
    size_t remaining() const { return n_ - pos_; }
    bool at_end() const { return pos_ == n_; }

    // Peek one byte at offset from the current position.
    bool peek(size_t off, uint8_t& out) const;

    ParseError read_u8(uint8_t& out);
    ParseError read_u16_le(uint16_t& out);
    ParseError read_u32_le(uint32_t& out);
    ParseError read_u64_le(uint64_t& out);
    // Canonical CompactSize. Rejects encodings longer than the minimal form.
    ParseError read_varint(uint64_t& out);
    ParseError read_bytes(size_t len, Bytes& out);
    // var-int length followed by that many bytes; the length must fit in
    // the remaining buffer (SCRIPT_OVERRUN otherwise).
    ParseError read_varbytes(Bytes& out);
    ParseError read_string(std::string& out);
    ParseError skip(size_t len);

private:
    const uint8_t* p_;
    size_t n_;
    size_t pos_;
};

}  // namespace qcb
