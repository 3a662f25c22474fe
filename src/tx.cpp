#include "tx.h"
#include "hash.h"
#include "hex.h"

namespace qcb {

#define TRY_PARSE(expr) do { ParseError e_ = (expr); if (e_ != ParseError::OK) return e_; } while (0)

static ParseError read_input(ByteCursor& cur, BtcTxIn& in) {
    TRY_PARSE(cur.read_bytes(32, in.prevout.hash));
    TRY_PARSE(cur.read_u32_le(in.prevout.index));
    TRY_PARSE(cur.read_varbytes(in.script_sig));
    TRY_PARSE(cur.read_u32_le(in.sequence));
    return ParseError::OK;
}

static ParseError read_output(ByteCursor& cur, BtcTxOut& o) {
    TRY_PARSE(cur.read_u64_le(o.value));
    TRY_PARSE(cur.read_varbytes(o.script_pubkey));
    return ParseError::OK;
}

static ParseError read_witness(ByteCursor& cur, std::vector<Bytes>& stack) {
    uint64_t n = 0;
    TRY_PARSE(cur.read_varint(n));
    if (n > QCB_MAX_WITNESS_ITEMS) return ParseError::TOO_MANY_WITNESS_ITEMS;
    stack.clear();
    stack.reserve(static_cast<size_t>(n));
    for (uint64_t k = 0; k < n; ++k) {
        Bytes item;
        TRY_PARSE(cur.read_varbytes(item));
        stack.push_back(std::move(item));
    }
    return ParseError::OK;
}

ParseError parse_btc_tx(const Bytes& raw, BtcTransaction& out) {
    ByteCursor cur(raw);
    BtcTransaction tx;

    TRY_PARSE(cur.read_u32_le(tx.version));

    uint8_t marker = 0xff, flag = 0xff;
    if (cur.peek(0, marker) && marker == 0x00) {
        if (!cur.peek(1, flag)) return ParseError::TRUNCATED;
        if (flag == 0x00) return ParseError::NO_INPUTS;
        if (flag != 0x01) return ParseError::BAD_WITNESS_FLAG;
        tx.segwit = true;
        TRY_PARSE(cur.skip(2));
    }

    uint64_t n_in = 0;
    TRY_PARSE(cur.read_varint(n_in));
    if (n_in == 0) return ParseError::NO_INPUTS;
    if (n_in > QCB_MAX_TX_INPUTS) return ParseError::TOO_MANY_INPUTS;
    tx.vin.resize(static_cast<size_t>(n_in));
    for (auto& in : tx.vin) TRY_PARSE(read_input(cur, in));

    uint64_t n_out = 0;
    TRY_PARSE(cur.read_varint(n_out));
    if (n_out == 0) return ParseError::NO_OUTPUTS;
    if (n_out > QCB_MAX_TX_OUTPUTS) return ParseError::TOO_MANY_OUTPUTS;
    tx.vout.resize(static_cast<size_t>(n_out));
    for (auto& o : tx.vout) TRY_PARSE(read_output(cur, o));

    if (tx.segwit) {
        bool any = false;
        for (auto& in : tx.vin) {
            TRY_PARSE(read_witness(cur, in.witness));
            any = any || !in.witness.empty();
        }
        // BIP144: the marker is only valid when some witness is present.
        if (!any) return ParseError::EMPTY_WITNESS;
    }

    TRY_PARSE(cur.read_u32_le(tx.locktime));
    if (!cur.at_end()) return ParseError::TRAILING_BYTES;

    out = std::move(tx);
    return ParseError::OK;
}

ParseError parse_btc_tx_hex(const std::string& hex, BtcTransaction& out) {
    Bytes raw;
    if (!from_hex(hex, raw)) return ParseError::BAD_HEX;
    return parse_btc_tx(raw, out);
}

Bytes serialize_btc_tx(const BtcTransaction& tx, bool with_witness) {
    const bool seg = with_witness && tx.segwit;
    Bytes v;
    v.reserve(16 + tx.vin.size() * 160 + tx.vout.size() * 40);

    put_u32_le(v, tx.version);
    if (seg) {
        v.push_back(0x00);
        v.push_back(0x01);
    }

    put_varint(v, tx.vin.size());
    for (const auto& in : tx.vin) {
        v.insert(v.end(), in.prevout.hash.begin(), in.prevout.hash.end());
        put_u32_le(v, in.prevout.index);
        put_varbytes(v, in.script_sig);
        put_u32_le(v, in.sequence);
    }

    put_varint(v, tx.vout.size());
    for (const auto& o : tx.vout) {
        put_u64_le(v, o.value);
        put_varbytes(v, o.script_pubkey);
    }

    if (seg) {
        for (const auto& in : tx.vin) {
            put_varint(v, in.witness.size());
            for (const auto& item : in.witness) put_varbytes(v, item);
        }
    }

    put_u32_le(v, tx.locktime);
    return v;
}

Bytes BtcTransaction::txid() const {
    return dsha256(serialize_btc_tx(*this, false));
}

Bytes BtcTransaction::wtxid() const {
    return dsha256(serialize_btc_tx(*this, true));
}

bool extract_output(const BtcTransaction& tx, size_t index, uint64_t& value, Bytes& script) {
    if (index >= tx.vout.size()) return false;
    value = tx.vout[index].value;
    script = tx.vout[index].script_pubkey;
    return true;
}

#undef TRY_PARSE

}  // namespace qcb
