#pragma once
// =============================================================================
// SPV inclusion proof for a Bitcoin transaction.
//
// A proof carries the merkle path of the transaction inside the first
// header's block, a run of chained headers whose accumulated work stands in
// for confirmations, and a coinbase path of the same depth that anchors the
// tree height (a 64-byte transaction cannot pose as an inner node).
// =============================================================================
#include <cstdint>
#include <string>
#include <vector>
#include "bignum.h"
#include "block.h"
#include "difficulty.h"
#include "serialize.h"
#include "tx.h"

namespace qcb {

// Deepest merkle path accepted (2^32 transactions).
constexpr size_t SPV_MAX_PROOF_DEPTH = 32;

struct SpvProof {
    Bytes    merkle_proof;        // 32-byte siblings, leaf level first
    uint64_t tx_index_in_block{0};
    Bytes    bitcoin_headers;     // n x 80 bytes, oldest first
    Bytes    coinbase_preimage;   // SHA-256 of the coinbase; its SHA-256 is the coinbase txid
    Bytes    coinbase_proof;      // same depth as merkle_proof, index 0
};

enum class SpvError {
    OK = 0,
    EMPTY_HEADERS,
    EMPTY_PROOF,
    BAD_HEADERS_LENGTH,        // not a multiple of 80
    BAD_PROOF_LENGTH,          // not a multiple of 32
    PROOF_TOO_DEEP,
    BAD_TX_INDEX,              // index does not fit the proof depth
    COINBASE_PROOF_MISMATCH,   // coinbase preimage/proof absent or of another depth
    BAD_COINBASE_PREIMAGE,
    MALFORMED_TX,
    MERKLE_MISMATCH,
    COINBASE_MERKLE_MISMATCH,
    BROKEN_HEADER_CHAIN,
    BAD_HEADER_POW,
    UNSUPPORTED_EPOCH,
    INSUFFICIENT_WORK
};

const char* spv_error_str(SpvError e);

struct VerifiedTx {
    BtcTransaction tx;
    Bytes          txid;           // internal byte order
    Bytes          block_hash;     // first header
    uint32_t       confirmations{0};
    BigNum         accumulated_work;
};

class SpvVerifier {
public:
    // factor = required average-difficulty confirmations. When
    // require_coinbase is false a proof may omit both coinbase fields.
    SpvVerifier(const DifficultyOracle& oracle, uint64_t factor, bool require_coinbase = true)
        : oracle_(oracle), factor_(factor), require_coinbase_(require_coinbase) {}

    // Reads only its arguments and the oracle; safe to call concurrently.
    // On MALFORMED_TX, *parse_err (if given) carries the codec error.
    SpvError verify(const Bytes& raw_tx, const SpvProof& proof, VerifiedTx& out,
                    ParseError* parse_err = nullptr) const;

private:
    const DifficultyOracle& oracle_;
    uint64_t factor_;
    bool require_coinbase_;
};

}  // namespace qcb
