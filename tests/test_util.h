#pragma once
// Fixtures shared by the tests: synthetic payments and mined regtest-style
// header chains with matching SPV proofs.
#include "block.h"
#include "hash.h"
#include "merkle.h"
#include "serialize.h"
#include "spv.h"
#include "tx.h"
#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>
#include <unistd.h>

#define TEST_CHECK(cond, msg) do { \
    if (!(cond)) { \
        std::fprintf(stderr, "FAIL: %s (%s:%d)\n", msg, __FILE__, __LINE__); \
        return 1; \
    } \
} while(0)

namespace qcbtest {

using qcb::Bytes;

// Fresh directory under /tmp; empty string on failure.
inline std::string make_temp_dir(const std::string& prefix) {
    std::string base = "/tmp/" + prefix + "_XXXXXX";
    std::vector<char> buf(base.begin(), base.end());
    buf.push_back('\0');
    char* result = mkdtemp(buf.data());
    return result ? std::string(result) : std::string();
}

// Easiest target that still fits the compact encoding; about every other
// nonce satisfies it and each header is worth 2 units of work.
constexpr uint32_t EASY_BITS = 0x207fffff;

// Compressed-looking public key; only its HASH160 matters to the code
// under test.
inline Bytes fake_pubkey(uint8_t seed) {
    Bytes pk(33, seed);
    pk[0] = 0x02;
    return pk;
}

inline Bytes op_return_script(const Bytes& data) {
    Bytes s{0x6a, static_cast<uint8_t>(data.size())};
    s.insert(s.end(), data.begin(), data.end());
    return s;
}

// One input, one payment output, optionally an OP_RETURN. A non-empty
// spend_pubkey makes the input a P2WPKH spend of that key.
inline qcb::BtcTransaction payment_tx(const Bytes& out_script, uint64_t value,
                                      const Bytes& spend_pubkey = Bytes(),
                                      const Bytes& op_return = Bytes()) {
    qcb::BtcTransaction tx;
    tx.version = 2;
    qcb::BtcTxIn in;
    in.prevout.hash = Bytes(32, 0x42);
    in.prevout.index = 1;
    if (!spend_pubkey.empty()) {
        in.witness.push_back(Bytes(71, 0x30));
        in.witness.push_back(spend_pubkey);
        tx.segwit = true;
    }
    tx.vin.push_back(in);
    qcb::BtcTxOut o;
    o.value = value;
    o.script_pubkey = out_script;
    tx.vout.push_back(o);
    if (!op_return.empty()) {
        qcb::BtcTxOut r;
        r.value = 0;
        r.script_pubkey = op_return_script(op_return);
        tx.vout.push_back(r);
    }
    return tx;
}

// `count` linked headers whose first one commits to merkle_root.
inline Bytes mine_headers(const Bytes& merkle_root, size_t count, uint32_t bits = EASY_BITS) {
    Bytes out;
    Bytes prev(32, 0x11);
    for (size_t i = 0; i < count; ++i) {
        qcb::BtcHeader h;
        h.version = 0x20000000;
        h.prev_hash = prev;
        h.merkle_root = i == 0 ? merkle_root : qcb::sha256(Bytes{uint8_t(i), 0x77});
        h.time = 1700000000u + static_cast<uint32_t>(i) * 600u;
        h.bits = bits;
        h.nonce = 0;
        while (!qcb::check_header_pow(h)) ++h.nonce;
        const Bytes s = h.serialize();
        out.insert(out.end(), s.begin(), s.end());
        prev = h.hash();
    }
    return out;
}

// Block of n_txs transactions: a coinbase at 0, raw_tx at `index`, filler
// elsewhere. Returns a complete proof with `headers` confirmations.
inline qcb::SpvProof prove(const Bytes& raw_tx, size_t headers, uint64_t index = 1, size_t n_txs = 4) {
    qcb::BtcTransaction tx;
    qcb::parse_btc_tx(raw_tx, tx);

    const Bytes cb_preimage = qcb::sha256(Bytes{'c', 'o', 'i', 'n', 'b', 'a', 's', 'e'});
    std::vector<Bytes> txids;
    for (size_t i = 0; i < n_txs; ++i) {
        if (i == 0) txids.push_back(qcb::sha256(cb_preimage));
        else if (i == index) txids.push_back(tx.txid());
        else txids.push_back(qcb::dsha256(Bytes{uint8_t(i), 0x55}));
    }
    qcb::SpvProof p;
    p.merkle_proof = qcb::merkle_branch(txids, index);
    p.tx_index_in_block = index;
    p.coinbase_preimage = cb_preimage;
    p.coinbase_proof = qcb::merkle_branch(txids, 0);
    p.bitcoin_headers = mine_headers(qcb::merkle_root(txids), headers);
    return p;
}

}  // namespace qcbtest
