// Compact targets, header work, header parsing and merkle helpers.
#include "block.h"
#include "difficulty.h"
#include "hash.h"
#include "hex.h"
#include "merkle.h"
#include "test_util.h"
#include <cstdio>

using namespace qcb;

static const char* GENESIS_HEADER =
    "0100000000000000000000000000000000000000000000000000000000000000000000003ba3edfd7a7b12b27ac72c3e"
    "67768f617fc81bc3888a51323a9fb8aa4b1e5e4a29ab5f49ffff001d1dac2b7c";

int main(){
    // Compact bits.
    {
        BigNum t;
        TEST_CHECK(target_from_bits(0x1d00ffff, t), "genesis bits decode");
        TEST_CHECK(t == (BigNum(0xffff) << 208), "genesis target");
        TEST_CHECK(bits_from_target(t) == 0x1d00ffff, "genesis bits re-encode");
        TEST_CHECK(target_from_bits(0x207fffff, t) && t.num_bits() == 255, "regtest target");
        TEST_CHECK(bits_from_target(t) == 0x207fffff, "regtest bits re-encode");
        TEST_CHECK(!target_from_bits(0x1d80ffff, t), "sign bit rejected");
        TEST_CHECK(!target_from_bits(0x2200ffff, t), "over 256 bits rejected");
        TEST_CHECK(target_from_bits(0x1d000000, t) && t.is_zero(), "zero mantissa");
        TEST_CHECK(target_from_bits(0x03123456, t) && t == BigNum(0x123456), "small exponent");
        std::printf("  [PASS] compact bits\n");
    }

    // Work = 2^256 / (target + 1).
    {
        uint64_t w = 0;
        TEST_CHECK(work_from_bits(0x1d00ffff).to_u64(w) && w == 0x100010001ULL, "genesis work");
        TEST_CHECK(work_from_bits(qcbtest::EASY_BITS).to_u64(w) && w == 2, "easy work");
        TEST_CHECK(work_from_bits(0x1d000000).is_zero(), "zero target has no work");
        TEST_CHECK(work_from_bits(0x1d80ffff).is_zero(), "invalid bits have no work");
        std::printf("  [PASS] work\n");
    }

    // Genesis header: hash, PoW and its single-transaction merkle root.
    {
        Bytes raw;
        TEST_CHECK(from_hex(GENESIS_HEADER, raw) && raw.size() == BTC_HEADER_SIZE, "header fixture");
        BtcHeader h;
        TEST_CHECK(parse_btc_header(raw.data(), raw.size(), h) == ParseError::OK, "header parses");
        TEST_CHECK(h.bits == 0x1d00ffff && h.nonce == 2083236893u && h.time == 1231006505u, "header fields");
        TEST_CHECK(to_hex_rev(h.hash()) == "000000000019d6689c085ae165831e934ff763ae46a2a6c172b3f1b60a8ce26f",
                   "genesis hash");
        TEST_CHECK(h.serialize() == raw, "header round trip");
        TEST_CHECK(check_header_pow(h), "genesis meets its target");
        BtcHeader bad = h;
        bad.nonce ^= 1;
        TEST_CHECK(!check_header_pow(bad), "changed nonce fails PoW");

        Bytes txid;
        from_hex_rev("4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b", txid);
        TEST_CHECK(merkle_root({txid}) == h.merkle_root, "one-tx block root is the txid");
        TEST_CHECK(parse_btc_header(raw.data(), 79, h) == ParseError::TRUNCATED, "short header");

        std::vector<BtcHeader> hs;
        Bytes two = raw;
        two.insert(two.end(), raw.begin(), raw.end());
        TEST_CHECK(split_headers(two, hs) && hs.size() == 2, "split two headers");
        two.pop_back();
        TEST_CHECK(!split_headers(two, hs), "partial header rejected");
        TEST_CHECK(!split_headers(Bytes(), hs), "empty rejected");
        std::printf("  [PASS] headers\n");
    }

    // Merkle branches recompute the root for every leaf, odd counts included.
    {
        std::vector<Bytes> txids;
        for (uint8_t i = 0; i < 5; ++i) txids.push_back(sha256(Bytes{i}));
        const Bytes root = merkle_root(txids);
        TEST_CHECK(root == hash_pair(hash_pair(hash_pair(txids[0], txids[1]), hash_pair(txids[2], txids[3])),
                                     hash_pair(hash_pair(txids[4], txids[4]), hash_pair(txids[4], txids[4]))),
                   "odd node paired with itself");
        for (uint64_t i = 0; i < txids.size(); ++i) {
            Bytes got;
            const Bytes branch = merkle_branch(txids, i);
            TEST_CHECK(branch.size() == 3 * 32, "depth 3 branch");
            TEST_CHECK(merkle_root_from_branch(txids[i], branch, i, got) && got == root, "branch folds to root");
        }
        Bytes got;
        TEST_CHECK(merkle_root_from_branch(txids[1], merkle_branch(txids, 1), 0, got) && got != root,
                   "wrong index gives another root");
        TEST_CHECK(!merkle_root_from_branch(txids[1], Bytes(33, 0), 1, got), "ragged branch rejected");
        TEST_CHECK(merkle_root(std::vector<Bytes>()) == Bytes(32, 0), "empty root");
        std::printf("  [PASS] merkle\n");
    }

    // Oracle epochs.
    {
        DifficultyOracle o(0x1d00ffff, 0x1c7fffff);
        TEST_CHECK(o.accepts_bits(0x1d00ffff) && o.accepts_bits(0x1c7fffff), "both epochs accepted");
        TEST_CHECK(!o.accepts_bits(0x1b0404cb), "other epoch rejected");
        o.advance_epoch(0x1b0404cb);
        TEST_CHECK(o.current_bits() == 0x1b0404cb && o.previous_bits() == 0x1d00ffff, "epoch shift");
        TEST_CHECK(!o.accepts_bits(0x1c7fffff), "oldest epoch dropped");
        TEST_CHECK(!DifficultyOracle().accepts_bits(0), "zero bits never accepted");
        std::printf("  [PASS] oracle epochs\n");
    }

    std::printf("All difficulty tests passed\n");
    return 0;
}
