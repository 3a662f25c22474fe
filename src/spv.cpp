#include "spv.h"
#include "hash.h"
#include "hex.h"
#include "log.h"
#include "merkle.h"

namespace qcb {

const char* spv_error_str(SpvError e) {
    switch (e) {
        case SpvError::OK:                       return "ok";
        case SpvError::EMPTY_HEADERS:            return "empty_headers";
        case SpvError::EMPTY_PROOF:              return "empty_proof";
        case SpvError::BAD_HEADERS_LENGTH:       return "bad_headers_length";
        case SpvError::BAD_PROOF_LENGTH:         return "bad_proof_length";
        case SpvError::PROOF_TOO_DEEP:           return "proof_too_deep";
        case SpvError::BAD_TX_INDEX:             return "bad_tx_index";
        case SpvError::COINBASE_PROOF_MISMATCH:  return "coinbase_proof_mismatch";
        case SpvError::BAD_COINBASE_PREIMAGE:    return "bad_coinbase_preimage";
        case SpvError::MALFORMED_TX:             return "malformed_tx";
        case SpvError::MERKLE_MISMATCH:          return "merkle_mismatch";
        case SpvError::COINBASE_MERKLE_MISMATCH: return "coinbase_merkle_mismatch";
        case SpvError::BROKEN_HEADER_CHAIN:      return "broken_header_chain";
        case SpvError::BAD_HEADER_POW:           return "bad_header_pow";
        case SpvError::UNSUPPORTED_EPOCH:        return "unsupported_epoch";
        case SpvError::INSUFFICIENT_WORK:        return "insufficient_work";
    }
    return "unknown";
}

static SpvError fail(SpvError e) {
    QCB_LOG_DEBUG(LogCategory::SPV, std::string("spv: rejected: ") + spv_error_str(e));
    return e;
}

SpvError SpvVerifier::verify(const Bytes& raw_tx, const SpvProof& proof, VerifiedTx& out,
                             ParseError* parse_err) const {
    // 1. structure
    if (proof.bitcoin_headers.empty()) return fail(SpvError::EMPTY_HEADERS);
    if (proof.merkle_proof.empty()) return fail(SpvError::EMPTY_PROOF);
    if (proof.bitcoin_headers.size() % BTC_HEADER_SIZE != 0) return fail(SpvError::BAD_HEADERS_LENGTH);
    if (proof.merkle_proof.size() % 32 != 0) return fail(SpvError::BAD_PROOF_LENGTH);

    const size_t depth = proof.merkle_proof.size() / 32;
    if (depth > SPV_MAX_PROOF_DEPTH) return fail(SpvError::PROOF_TOO_DEEP);
    if (proof.tx_index_in_block >= (uint64_t(1) << depth)) return fail(SpvError::BAD_TX_INDEX);

    // 2. coinbase proof consistency
    const bool have_pre = !proof.coinbase_preimage.empty();
    const bool have_cb = !proof.coinbase_proof.empty();
    const bool anchored = have_pre || have_cb || require_coinbase_;
    if (anchored) {
        if (!have_pre || !have_cb) return fail(SpvError::COINBASE_PROOF_MISMATCH);
        if (proof.coinbase_proof.size() != proof.merkle_proof.size()) return fail(SpvError::COINBASE_PROOF_MISMATCH);
        if (proof.coinbase_preimage.size() != 32) return fail(SpvError::BAD_COINBASE_PREIMAGE);
    }

    // 3. transaction id
    VerifiedTx v;
    const ParseError pe = parse_btc_tx(raw_tx, v.tx);
    if (pe != ParseError::OK) {
        if (parse_err) *parse_err = pe;
        QCB_LOG_DEBUG(LogCategory::PARSE, std::string("spv: tx parse failed: ") + parse_error_str(pe));
        return fail(SpvError::MALFORMED_TX);
    }
    v.txid = v.tx.txid();

    std::vector<BtcHeader> headers;
    if (!split_headers(proof.bitcoin_headers, headers)) return fail(SpvError::BAD_HEADERS_LENGTH);

    // 4. inclusion in the first header's block
    Bytes root;
    if (!merkle_root_from_branch(v.txid, proof.merkle_proof, proof.tx_index_in_block, root)
        || root != headers.front().merkle_root) {
        return fail(SpvError::MERKLE_MISMATCH);
    }
    if (anchored) {
        Bytes cb_root;
        const Bytes cb_txid = sha256(proof.coinbase_preimage);
        if (!merkle_root_from_branch(cb_txid, proof.coinbase_proof, 0, cb_root)
            || cb_root != headers.front().merkle_root) {
            return fail(SpvError::COINBASE_MERKLE_MISMATCH);
        }
    }

    // 5. header chain and work
    for (size_t i = 0; i < headers.size(); ++i) {
        if (i > 0 && headers[i].prev_hash != headers[i - 1].hash()) return fail(SpvError::BROKEN_HEADER_CHAIN);
        if (!check_header_pow(headers[i])) return fail(SpvError::BAD_HEADER_POW);
    }
    if (!oracle_.accepts_bits(headers.front().bits)) return fail(SpvError::UNSUPPORTED_EPOCH);
    if (!oracle_.meets_minimum_work(headers, factor_)) return fail(SpvError::INSUFFICIENT_WORK);

    v.block_hash = headers.front().hash();
    v.confirmations = static_cast<uint32_t>(headers.size());
    v.accumulated_work = oracle_.work_of(headers);

    QCB_LOG_DEBUG(LogCategory::SPV, "spv: verified tx " + to_hex_rev(v.txid) + " in block "
                  + to_hex_rev(v.block_hash) + " confs=" + std::to_string(v.confirmations));
    out = std::move(v);
    return SpvError::OK;
}

}  // namespace qcb
