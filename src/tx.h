#pragma once
// =============================================================================
// Bitcoin transaction codec.
//
// Legacy layout:
//   u32 version | varint n_in | inputs | varint n_out | outputs | u32 locktime
//   input  = 32 prev hash | u32 prev index | varbytes scriptSig | u32 sequence
//   output = u64 value | varbytes scriptPubKey
// Segwit layout inserts "00 01" after the version and one witness stack per
// input before the locktime. The txid always covers the legacy layout.
// =============================================================================
#include <cstdint>
#include <string>
#include <vector>
#include "serialize.h"

namespace qcb {

#ifndef QCB_MAX_TX_INPUTS
#define QCB_MAX_TX_INPUTS 10000
#endif
#ifndef QCB_MAX_TX_OUTPUTS
#define QCB_MAX_TX_OUTPUTS 10000
#endif
#ifndef QCB_MAX_WITNESS_ITEMS
#define QCB_MAX_WITNESS_ITEMS 500
#endif

struct BtcOutPoint {
    Bytes    hash;          // 32 bytes, internal byte order
    uint32_t index{0};
};

struct BtcTxIn {
    BtcOutPoint        prevout;
    Bytes              script_sig;
    uint32_t           sequence{0xffffffff};
    std::vector<Bytes> witness;
};

struct BtcTxOut {
    uint64_t value{0};      // satoshis
    Bytes    script_pubkey;
};

struct BtcTransaction {
    uint32_t              version{1};
    std::vector<BtcTxIn>  vin;
    std::vector<BtcTxOut> vout;
    uint32_t              locktime{0};
    bool                  segwit{false};   // parsed from / serializes to segwit layout

    // dsha256 of the legacy serialization, internal byte order.
    Bytes txid() const;
    // dsha256 of the full serialization (== txid for non-segwit).
    Bytes wtxid() const;
};

ParseError parse_btc_tx(const Bytes& raw, BtcTransaction& out);
ParseError parse_btc_tx_hex(const std::string& hex, BtcTransaction& out);

// with_witness=false strips witness data (the txid preimage).
Bytes serialize_btc_tx(const BtcTransaction& tx, bool with_witness = true);

// Value and script of output `index`; false when out of range.
bool extract_output(const BtcTransaction& tx, size_t index, uint64_t& value, Bytes& script);

}  // namespace qcb
