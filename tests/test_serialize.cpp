// CompactSize var-ints and the bounds-checked byte cursor.
#include "serialize.h"
#include "hex.h"
#include "test_util.h"
#include <cstdio>

using namespace qcb;

int main(){
    // Writers pick the minimal form.
    {
        struct { uint64_t v; const char* hex; } cases[] = {
            {0, "00"}, {0xfc, "fc"}, {0xfd, "fdfd00"}, {0xffff, "fdffff"},
            {0x10000, "fe00000100"}, {0xffffffffULL, "feffffffff"},
            {0x100000000ULL, "ff0000000001000000"},
        };
        for (const auto& c : cases) {
            Bytes b;
            put_varint(b, c.v);
            TEST_CHECK(to_hex(b) == c.hex, "put_varint encoding");
            TEST_CHECK(varint_size(c.v) == b.size(), "varint_size matches writer");
            ByteCursor cur(b);
            uint64_t got = 0;
            TEST_CHECK(cur.read_varint(got) == ParseError::OK && got == c.v, "read_varint value");
            TEST_CHECK(cur.at_end(), "read_varint consumes the encoding");
        }
        std::printf("  [PASS] varint encodings\n");
    }

    // Longer-than-needed encodings are rejected.
    {
        const char* bad[] = {"fd0100", "fdfc00", "feffff0000", "ff00000000ffffffff"};
        for (const char* h : bad) {
            Bytes b;
            TEST_CHECK(from_hex(h, b), "hex fixture");
            ByteCursor cur(b);
            uint64_t v = 0;
            TEST_CHECK(cur.read_varint(v) == ParseError::NON_CANONICAL_VARINT, "non-canonical varint rejected");
        }
        std::printf("  [PASS] non-canonical varints\n");
    }

    // Truncation never moves the cursor past the end.
    {
        Bytes b{0xfd, 0x01};
        ByteCursor cur(b);
        uint64_t v = 0;
        TEST_CHECK(cur.read_varint(v) == ParseError::TRUNCATED, "truncated varint");

        Bytes four{1, 2, 3, 4};
        ByteCursor c2(four);
        uint64_t x = 0;
        TEST_CHECK(c2.read_u64_le(x) == ParseError::TRUNCATED, "truncated u64");
        uint32_t y = 0;
        TEST_CHECK(c2.read_u32_le(y) == ParseError::OK && y == 0x04030201u, "u32 little endian");
        TEST_CHECK(c2.at_end() && c2.remaining() == 0, "cursor at end");
        uint8_t z = 0;
        TEST_CHECK(c2.read_u8(z) == ParseError::TRUNCATED, "read past end");
        std::printf("  [PASS] truncation\n");
    }

    // Declared lengths larger than the buffer are overruns.
    {
        Bytes b{0x05, 'a', 'b'};
        ByteCursor cur(b);
        Bytes out;
        TEST_CHECK(cur.read_varbytes(out) == ParseError::SCRIPT_OVERRUN, "varbytes overrun");

        Bytes s;
        put_string(s, "qcbridge");
        put_u16_le(s, 0xbeef);
        ByteCursor c2(s);
        std::string str;
        uint16_t w = 0;
        TEST_CHECK(c2.read_string(str) == ParseError::OK && str == "qcbridge", "read_string");
        TEST_CHECK(c2.read_u16_le(w) == ParseError::OK && w == 0xbeef, "read_u16_le");
        std::printf("  [PASS] length-prefixed fields\n");
    }

    // Hex helpers.
    {
        Bytes b;
        TEST_CHECK(from_hex("0x00ff10", b) && b.size() == 3 && b[1] == 0xff, "0x prefix accepted");
        TEST_CHECK(!from_hex("abc", b), "odd length rejected");
        TEST_CHECK(!from_hex("zz", b), "non-hex rejected");
        TEST_CHECK(to_hex_rev(Bytes{0x01, 0x02}) == "0201", "reversed hex");
        std::printf("  [PASS] hex\n");
    }

    std::printf("All serialize tests passed\n");
    return 0;
}
