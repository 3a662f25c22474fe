#include "address.h"
#include "base58.h"
#include "bech32.h"

namespace qcb {

static const char* hrp_for(BtcNetwork net) {
    switch (net) {
        case BtcNetwork::MAINNET: return "bc";
        case BtcNetwork::TESTNET: return "tb";
        case BtcNetwork::REGTEST: return "bcrt";
    }
    return "bc";
}

static bool decode_base58_address(const std::string& addr, DecodedAddress& out) {
    uint8_t ver = 0;
    std::vector<uint8_t> payload;
    if (!base58check_decode(addr, ver, payload)) return false;
    if (payload.size() != 20) return false;
    switch (ver) {
        case VERSION_P2PKH_MAIN: out.type = ScriptType::P2PKH; out.network = BtcNetwork::MAINNET; break;
        case VERSION_P2SH_MAIN:  out.type = ScriptType::P2SH;  out.network = BtcNetwork::MAINNET; break;
        case VERSION_P2PKH_TEST: out.type = ScriptType::P2PKH; out.network = BtcNetwork::TESTNET; break;
        case VERSION_P2SH_TEST:  out.type = ScriptType::P2SH;  out.network = BtcNetwork::TESTNET; break;
        default: return false;
    }
    out.hash = std::move(payload);
    return true;
}

static bool decode_bech32_address(const std::string& addr, DecodedAddress& out) {
    std::string hrp;
    uint8_t version = 0;
    std::vector<uint8_t> program;
    if (!decode_segwit_address(addr, hrp, version, program)) return false;
    if (hrp == "bc") out.network = BtcNetwork::MAINNET;
    else if (hrp == "tb") out.network = BtcNetwork::TESTNET;
    else if (hrp == "bcrt") out.network = BtcNetwork::REGTEST;
    else return false;
    out.type = program.size() == 20 ? ScriptType::P2WPKH : ScriptType::P2WSH;
    out.hash = std::move(program);
    return true;
}

bool decode_btc_address(const std::string& addr, DecodedAddress& out) {
    if (addr.empty() || addr.size() > 90) return false;
    DecodedAddress d;
    if (decode_bech32_address(addr, d) || decode_base58_address(addr, d)) {
        out = std::move(d);
        return true;
    }
    return false;
}

std::string encode_btc_address(ScriptType type, const std::vector<uint8_t>& hash, BtcNetwork net) {
    const bool main = net == BtcNetwork::MAINNET;
    switch (type) {
        case ScriptType::P2PKH:
            if (hash.size() != 20) return {};
            return base58check_encode(main ? VERSION_P2PKH_MAIN : VERSION_P2PKH_TEST, hash);
        case ScriptType::P2SH:
            if (hash.size() != 20) return {};
            return base58check_encode(main ? VERSION_P2SH_MAIN : VERSION_P2SH_TEST, hash);
        case ScriptType::P2WPKH:
            if (hash.size() != 20) return {};
            return encode_segwit_address(hrp_for(net), 0, hash);
        case ScriptType::P2WSH:
            if (hash.size() != 32) return {};
            return encode_segwit_address(hrp_for(net), 0, hash);
        case ScriptType::UNKNOWN:
            break;
    }
    return {};
}

std::vector<uint8_t> address_to_script(const std::string& addr) {
    DecodedAddress d;
    if (!decode_btc_address(addr, d)) return {};
    return script_for_hash(d.type, d.hash);
}

}  // namespace qcb
