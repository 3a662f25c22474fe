#include "script.h"
#include "tx.h"
#include "hash.h"

namespace qcb {

static constexpr uint8_t OP_0           = 0x00;
static constexpr uint8_t OP_PUSHDATA1   = 0x4c;
static constexpr uint8_t OP_PUSHDATA2   = 0x4d;
static constexpr uint8_t OP_PUSHDATA4   = 0x4e;
static constexpr uint8_t OP_RETURN      = 0x6a;
static constexpr uint8_t OP_DUP         = 0x76;
static constexpr uint8_t OP_EQUAL       = 0x87;
static constexpr uint8_t OP_EQUALVERIFY = 0x88;
static constexpr uint8_t OP_HASH160     = 0xa9;
static constexpr uint8_t OP_CHECKSIG    = 0xac;

const char* script_type_str(ScriptType t) {
    switch (t) {
        case ScriptType::P2PKH:  return "p2pkh";
        case ScriptType::P2SH:   return "p2sh";
        case ScriptType::P2WPKH: return "p2wpkh";
        case ScriptType::P2WSH:  return "p2wsh";
        case ScriptType::UNKNOWN: break;
    }
    return "unknown";
}

ScriptType classify_script(const Bytes& s) {
    if (s.size() == 25 && s[0] == OP_DUP && s[1] == OP_HASH160 && s[2] == 0x14
        && s[23] == OP_EQUALVERIFY && s[24] == OP_CHECKSIG) {
        return ScriptType::P2PKH;
    }
    if (s.size() == 23 && s[0] == OP_HASH160 && s[1] == 0x14 && s[22] == OP_EQUAL) {
        return ScriptType::P2SH;
    }
    if (s.size() == 22 && s[0] == OP_0 && s[1] == 0x14) return ScriptType::P2WPKH;
    if (s.size() == 34 && s[0] == OP_0 && s[1] == 0x20) return ScriptType::P2WSH;
    return ScriptType::UNKNOWN;
}

bool extract_pay_to_hash(const Bytes& s, Bytes& out) {
    switch (classify_script(s)) {
        case ScriptType::P2PKH:  out.assign(s.begin() + 3, s.begin() + 23); return true;
        case ScriptType::P2SH:   out.assign(s.begin() + 2, s.begin() + 22); return true;
        case ScriptType::P2WPKH: out.assign(s.begin() + 2, s.end());        return true;
        case ScriptType::P2WSH:  out.assign(s.begin() + 2, s.end());        return true;
        case ScriptType::UNKNOWN: break;
    }
    return false;
}

Bytes script_for_hash(ScriptType t, const Bytes& h) {
    Bytes s;
    switch (t) {
        case ScriptType::P2PKH:
            if (h.size() != 20) return {};
            s = {OP_DUP, OP_HASH160, 0x14};
            s.insert(s.end(), h.begin(), h.end());
            s.push_back(OP_EQUALVERIFY);
            s.push_back(OP_CHECKSIG);
            return s;
        case ScriptType::P2SH:
            if (h.size() != 20) return {};
            s = {OP_HASH160, 0x14};
            s.insert(s.end(), h.begin(), h.end());
            s.push_back(OP_EQUAL);
            return s;
        case ScriptType::P2WPKH:
            if (h.size() != 20) return {};
            s = {OP_0, 0x14};
            s.insert(s.end(), h.begin(), h.end());
            return s;
        case ScriptType::P2WSH:
            if (h.size() != 32) return {};
            s = {OP_0, 0x20};
            s.insert(s.end(), h.begin(), h.end());
            return s;
        case ScriptType::UNKNOWN: break;
    }
    return {};
}

bool parse_pushes(const Bytes& script, std::vector<Bytes>& out) {
    out.clear();
    ByteCursor cur(script);
    while (!cur.at_end()) {
        uint8_t op = 0;
        if (cur.read_u8(op) != ParseError::OK) return false;

        size_t len = 0;
        if (op == OP_0) {
            out.emplace_back();
            continue;
        } else if (op < OP_PUSHDATA1) {
            len = op;
        } else if (op == OP_PUSHDATA1) {
            uint8_t l = 0;
            if (cur.read_u8(l) != ParseError::OK) return false;
            len = l;
        } else if (op == OP_PUSHDATA2) {
            uint16_t l = 0;
            if (cur.read_u16_le(l) != ParseError::OK) return false;
            len = l;
        } else if (op == OP_PUSHDATA4) {
            uint32_t l = 0;
            if (cur.read_u32_le(l) != ParseError::OK) return false;
            len = l;
        } else {
            return false;
        }

        Bytes item;
        if (cur.read_bytes(len, item) != ParseError::OK) return false;
        out.push_back(std::move(item));
    }
    return true;
}

bool op_return_data(const Bytes& script, Bytes& out) {
    if (script.empty() || script[0] != OP_RETURN) return false;
    Bytes rest(script.begin() + 1, script.end());
    std::vector<Bytes> pushes;
    if (!parse_pushes(rest, pushes)) return false;
    out.clear();
    for (const auto& p : pushes) out.insert(out.end(), p.begin(), p.end());
    return true;
}

static bool is_pubkey(const Bytes& b) {
    if (b.size() == 33) return b[0] == 0x02 || b[0] == 0x03;
    if (b.size() == 65) return b[0] == 0x04;
    return false;
}

bool input_spends_from(const BtcTxIn& in, ScriptType t, const Bytes& hash) {
    switch (t) {
        case ScriptType::P2PKH: {
            std::vector<Bytes> pushes;
            if (!parse_pushes(in.script_sig, pushes) || pushes.size() < 2) return false;
            const Bytes& pk = pushes.back();
            return is_pubkey(pk) && hash160(pk) == hash;
        }
        case ScriptType::P2SH: {
            std::vector<Bytes> pushes;
            if (!parse_pushes(in.script_sig, pushes) || pushes.empty()) return false;
            return hash160(pushes.back()) == hash;
        }
        case ScriptType::P2WPKH:
            if (!in.script_sig.empty() || in.witness.size() != 2) return false;
            return is_pubkey(in.witness[1]) && hash160(in.witness[1]) == hash;
        case ScriptType::P2WSH:
            if (!in.script_sig.empty() || in.witness.empty()) return false;
            return sha256(in.witness.back()) == hash;
        case ScriptType::UNKNOWN:
            break;
    }
    return false;
}

}  // namespace qcb
