// SPV verification over mined header chains.
#include "spv.h"
#include "hash.h"
#include "script.h"
#include "test_util.h"
#include <algorithm>
#include <cstdio>

using namespace qcb;

int main(){
    const Bytes pay_script = script_for_hash(ScriptType::P2WPKH, Bytes(20, 0x44));
    const Bytes raw = serialize_btc_tx(qcbtest::payment_tx(pay_script, 100000));
    const DifficultyOracle oracle(qcbtest::EASY_BITS, qcbtest::EASY_BITS);
    const SpvVerifier verifier(oracle, 6);

    // A correct proof with exactly the required work verifies.
    const SpvProof good = qcbtest::prove(raw, 6);
    {
        VerifiedTx vt;
        TEST_CHECK(verifier.verify(raw, good, vt) == SpvError::OK, "valid proof accepted");
        TEST_CHECK(vt.confirmations == 6, "confirmations = header count");
        TEST_CHECK(vt.txid == vt.tx.txid() && vt.tx.vout[0].value == 100000, "verified tx exposed");
        uint64_t w = 0;
        TEST_CHECK(vt.accumulated_work.to_u64(w) && w == 12, "accumulated work");
        VerifiedTx again;
        TEST_CHECK(verifier.verify(raw, good, again) == SpvError::OK && again.block_hash == vt.block_hash,
                   "verification is repeatable");
        std::printf("  [PASS] valid proof\n");
    }

    // Flipping any byte of the merkle proof breaks inclusion.
    {
        for (size_t i = 0; i < good.merkle_proof.size(); ++i) {
            SpvProof p = good;
            p.merkle_proof[i] ^= 0x01;
            VerifiedTx vt;
            TEST_CHECK(verifier.verify(raw, p, vt) == SpvError::MERKLE_MISMATCH, "flipped proof byte rejected");
        }
        for (uint64_t idx : {0ull, 2ull, 3ull}) {
            SpvProof p = good;
            p.tx_index_in_block = idx;
            VerifiedTx vt;
            TEST_CHECK(verifier.verify(raw, p, vt) == SpvError::MERKLE_MISMATCH, "wrong index rejected");
        }
        SpvProof p = good;
        p.tx_index_in_block = 4;
        VerifiedTx vt;
        TEST_CHECK(verifier.verify(raw, p, vt) == SpvError::BAD_TX_INDEX, "index beyond proof depth");
        Bytes other = raw;
        other[other.size() - 5] ^= 0x01;   // output script byte
        TEST_CHECK(verifier.verify(other, good, vt) == SpvError::MERKLE_MISMATCH, "different tx rejected");
        std::printf("  [PASS] merkle failures\n");
    }

    // Structural checks come first.
    {
        VerifiedTx vt;
        SpvProof p = good;
        p.bitcoin_headers.clear();
        TEST_CHECK(verifier.verify(raw, p, vt) == SpvError::EMPTY_HEADERS, "empty headers");
        p = good;
        p.merkle_proof.clear();
        TEST_CHECK(verifier.verify(raw, p, vt) == SpvError::EMPTY_PROOF, "empty proof");
        p = good;
        p.bitcoin_headers.pop_back();
        TEST_CHECK(verifier.verify(raw, p, vt) == SpvError::BAD_HEADERS_LENGTH, "ragged headers");
        p = good;
        p.merkle_proof.push_back(0);
        TEST_CHECK(verifier.verify(raw, p, vt) == SpvError::BAD_PROOF_LENGTH, "ragged proof");
        p = good;
        p.merkle_proof.assign(33 * 32, 0);
        TEST_CHECK(verifier.verify(raw, p, vt) == SpvError::PROOF_TOO_DEEP, "proof deeper than 32");
        p = good;
        p.coinbase_proof.clear();
        TEST_CHECK(verifier.verify(raw, p, vt) == SpvError::COINBASE_PROOF_MISMATCH, "missing coinbase proof");
        p = good;
        p.coinbase_proof.resize(32);
        TEST_CHECK(verifier.verify(raw, p, vt) == SpvError::COINBASE_PROOF_MISMATCH, "coinbase proof depth");
        p = good;
        p.coinbase_preimage.pop_back();
        TEST_CHECK(verifier.verify(raw, p, vt) == SpvError::BAD_COINBASE_PREIMAGE, "short coinbase preimage");
        p = good;
        p.coinbase_preimage[0] ^= 1;
        TEST_CHECK(verifier.verify(raw, p, vt) == SpvError::COINBASE_MERKLE_MISMATCH, "coinbase not in block");
        ParseError pe = ParseError::OK;
        TEST_CHECK(verifier.verify(Bytes{1, 0, 0, 0}, good, vt, &pe) == SpvError::MALFORMED_TX, "malformed tx");
        TEST_CHECK(pe == ParseError::TRUNCATED, "parse error reported");
        std::printf("  [PASS] structural failures\n");
    }

    // Without a required coinbase anchor both coinbase fields may be omitted.
    {
        SpvProof p = good;
        p.coinbase_preimage.clear();
        p.coinbase_proof.clear();
        VerifiedTx vt;
        TEST_CHECK(SpvVerifier(oracle, 6, false).verify(raw, p, vt) == SpvError::OK, "unanchored proof");
        TEST_CHECK(verifier.verify(raw, p, vt) == SpvError::COINBASE_PROOF_MISMATCH, "anchor required by default");
        std::printf("  [PASS] optional coinbase anchor\n");
    }

    // Header chain and work.
    {
        VerifiedTx vt;
        SpvProof p = good;
        p.bitcoin_headers[80 + 4] ^= 0x01;   // prev hash of header 1
        TEST_CHECK(verifier.verify(raw, p, vt) == SpvError::BROKEN_HEADER_CHAIN, "unlinked header");

        const SpvProof short_chain = qcbtest::prove(raw, 5);
        TEST_CHECK(verifier.verify(raw, short_chain, vt) == SpvError::INSUFFICIENT_WORK, "5 of 6 confirmations");
        TEST_CHECK(SpvVerifier(oracle, 5).verify(raw, short_chain, vt) == SpvError::OK, "enough for factor 5");
        for (uint64_t factor = 7; factor < 12; ++factor) {
            TEST_CHECK(SpvVerifier(oracle, factor).verify(raw, good, vt) == SpvError::INSUFFICIENT_WORK,
                       "below-threshold work always fails");
        }

        const DifficultyOracle other(0x1d00ffff, 0x1c7fffff);
        TEST_CHECK(SpvVerifier(other, 1).verify(raw, good, vt) == SpvError::UNSUPPORTED_EPOCH,
                   "header outside known epochs");
        std::printf("  [PASS] chain and work\n");
    }

    // A header whose hash misses its own target.
    {
        SpvProof p = good;
        std::vector<BtcHeader> hs;
        split_headers(p.bitcoin_headers, hs);
        BtcHeader last = hs.back();
        while (check_header_pow(last)) ++last.nonce;
        const Bytes s = last.serialize();
        std::copy(s.begin(), s.end(), p.bitcoin_headers.end() - BTC_HEADER_SIZE);
        VerifiedTx vt;
        TEST_CHECK(verifier.verify(raw, p, vt) == SpvError::BAD_HEADER_POW, "insufficient header PoW");
        std::printf("  [PASS] header PoW\n");
    }

    std::printf("All SPV tests passed\n");
    return 0;
}
