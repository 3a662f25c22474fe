// Transaction codec: legacy and segwit layouts, script templates and the
// parser's failure modes.
#include "tx.h"
#include "hash.h"
#include "hex.h"
#include "script.h"
#include "test_util.h"
#include <cstdio>

using namespace qcb;

static const char* GENESIS_COINBASE =
    "01000000010000000000000000000000000000000000000000000000000000000000000000ffffffff4d04ffff001d0104"
    "455468652054696d65732030332f4a616e2f32303039204368616e63656c6c6f72206f6e206272696e6b206f66207365"
    "636f6e64206261696c6f757420666f722062616e6b73ffffffff0100f2052a01000000434104678afdb0fe5548271967"
    "f1a67130b7105cd6a828e03909a67962e0ea1f61deb649f6bc3f4cef38c4f35504e51ec112de5c384df7ba0b8d578a4c"
    "702b6bf11d5fac00000000";

int main(){
    // Genesis coinbase: parse, txid and exact re-serialization.
    {
        Bytes raw;
        TEST_CHECK(from_hex(GENESIS_COINBASE, raw), "fixture hex");
        BtcTransaction tx;
        TEST_CHECK(parse_btc_tx(raw, tx) == ParseError::OK, "genesis coinbase parses");
        TEST_CHECK(tx.version == 1 && tx.vin.size() == 1 && tx.vout.size() == 1, "shape");
        TEST_CHECK(!tx.segwit, "legacy layout");
        TEST_CHECK(tx.vout[0].value == 5000000000ULL, "50 BTC output");
        TEST_CHECK(to_hex_rev(tx.txid()) == "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b",
                   "genesis txid");
        TEST_CHECK(tx.wtxid() == tx.txid(), "wtxid == txid without witness");
        TEST_CHECK(serialize_btc_tx(tx) == raw, "re-serialization is byte exact");
        TEST_CHECK(classify_script(tx.vout[0].script_pubkey) == ScriptType::UNKNOWN, "P2PK is not a template");

        uint64_t v = 0;
        Bytes script;
        TEST_CHECK(extract_output(tx, 0, v, script) && v == 5000000000ULL, "extract_output");
        TEST_CHECK(!extract_output(tx, 1, v, script), "extract_output out of range");
        std::printf("  [PASS] genesis coinbase\n");
    }

    // Segwit layout round trip; txid covers the stripped form.
    {
        const Bytes pk = qcbtest::fake_pubkey(0x21);
        BtcTransaction tx = qcbtest::payment_tx(script_for_hash(ScriptType::P2WPKH, hash160(pk)), 150000, pk,
                                                Bytes{'h', 'i'});
        const Bytes raw = serialize_btc_tx(tx);
        TEST_CHECK(raw[4] == 0x00 && raw[5] == 0x01, "marker and flag");
        BtcTransaction back;
        TEST_CHECK(parse_btc_tx(raw, back) == ParseError::OK, "segwit parses");
        TEST_CHECK(back.segwit && back.vin[0].witness.size() == 2, "witness kept");
        TEST_CHECK(serialize_btc_tx(back) == raw, "segwit round trip");
        TEST_CHECK(back.txid() == dsha256(serialize_btc_tx(back, false)), "txid over stripped layout");
        TEST_CHECK(back.txid() != back.wtxid(), "wtxid differs with witness");
        Bytes data;
        TEST_CHECK(op_return_data(back.vout[1].script_pubkey, data) && data == (Bytes{'h', 'i'}), "OP_RETURN");
        TEST_CHECK(input_spends_from(back.vin[0], ScriptType::P2WPKH, hash160(pk)), "witness pubkey spend");
        TEST_CHECK(!input_spends_from(back.vin[0], ScriptType::P2WPKH, hash160(qcbtest::fake_pubkey(0x22))),
                   "other key does not match");
        std::printf("  [PASS] segwit\n");
    }

    // Script templates.
    {
        Bytes h20(20, 0xab), h32(32, 0xcd), out;
        const Bytes p2pkh = script_for_hash(ScriptType::P2PKH, h20);
        TEST_CHECK(to_hex(p2pkh) == "76a914" + to_hex(h20) + "88ac", "P2PKH template");
        TEST_CHECK(classify_script(p2pkh) == ScriptType::P2PKH, "classify P2PKH");
        TEST_CHECK(classify_script(script_for_hash(ScriptType::P2SH, h20)) == ScriptType::P2SH, "classify P2SH");
        TEST_CHECK(classify_script(script_for_hash(ScriptType::P2WPKH, h20)) == ScriptType::P2WPKH, "classify P2WPKH");
        TEST_CHECK(classify_script(script_for_hash(ScriptType::P2WSH, h32)) == ScriptType::P2WSH, "classify P2WSH");
        TEST_CHECK(extract_pay_to_hash(script_for_hash(ScriptType::P2WSH, h32), out) && out == h32, "P2WSH hash");
        TEST_CHECK(script_for_hash(ScriptType::P2WSH, h20).empty(), "wrong hash length");
        Bytes near = p2pkh;
        near.back() = 0xad;
        TEST_CHECK(classify_script(near) == ScriptType::UNKNOWN, "near miss is unknown");
        TEST_CHECK(!extract_pay_to_hash(near, out), "no hash from unknown script");

        // P2PKH spend: scriptSig = <sig> <pubkey>
        const Bytes pk = qcbtest::fake_pubkey(0x31);
        BtcTxIn in;
        in.script_sig.push_back(71);
        in.script_sig.insert(in.script_sig.end(), 71, 0x30);
        in.script_sig.push_back(33);
        in.script_sig.insert(in.script_sig.end(), pk.begin(), pk.end());
        TEST_CHECK(input_spends_from(in, ScriptType::P2PKH, hash160(pk)), "scriptSig pubkey spend");
        std::printf("  [PASS] scripts\n");
    }

    // Every malformed input fails with a specific error.
    {
        Bytes raw;
        from_hex(GENESIS_COINBASE, raw);
        BtcTransaction tx;

        Bytes cut(raw.begin(), raw.end() - 1);
        TEST_CHECK(parse_btc_tx(cut, tx) == ParseError::TRUNCATED, "truncated locktime");

        Bytes extra = raw;
        extra.push_back(0x00);
        TEST_CHECK(parse_btc_tx(extra, tx) == ParseError::TRAILING_BYTES, "trailing bytes");

        Bytes overrun = raw;
        overrun[41] = 0xfc;   // scriptSig length of input 0
        TEST_CHECK(parse_btc_tx(overrun, tx) == ParseError::SCRIPT_OVERRUN, "script length past buffer");

        Bytes noncanon;
        from_hex("01000000" "fd0100", noncanon);
        TEST_CHECK(parse_btc_tx(noncanon, tx) == ParseError::NON_CANONICAL_VARINT, "non-canonical input count");

        Bytes badflag = raw;
        badflag.insert(badflag.begin() + 4, {0x00, 0x02});
        TEST_CHECK(parse_btc_tx(badflag, tx) == ParseError::BAD_WITNESS_FLAG, "bad segwit flag");

        TEST_CHECK(parse_btc_tx_hex("zz", tx) == ParseError::BAD_HEX, "bad hex");
        std::printf("  [PASS] parse errors\n");
    }

    std::printf("All tx tests passed\n");
    return 0;
}
