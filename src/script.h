#pragma once
// =============================================================================
// Standard output-script templates and the small amount of script parsing
// needed to tie a payment or a spend to a Bitcoin address.
// =============================================================================
#include <cstdint>
#include <string>
#include <vector>
#include "serialize.h"

namespace qcb {

struct BtcTxIn;

// Numbering matches the address decoder's script type codes.
enum class ScriptType : int {
    P2PKH = 0,    // 76 a9 14 <20> 88 ac
    P2SH = 1,     // a9 14 <20> 87
    P2WPKH = 2,   // 00 14 <20>
    P2WSH = 3,    // 00 20 <32>
    UNKNOWN = 4
};

const char* script_type_str(ScriptType t);

// Exact-pattern match; anything else (including P2PK, multisig, taproot)
// is UNKNOWN.
ScriptType classify_script(const Bytes& script);

// Embedded 20- or 32-byte hash of a standard script. False when UNKNOWN.
bool extract_pay_to_hash(const Bytes& script, Bytes& out);

// Locking script for (type, hash); empty when the hash length does not fit
// the type.
Bytes script_for_hash(ScriptType t, const Bytes& hash);

// Decode a push-only script into its data items. False on a non-push
// opcode or a push that runs past the end of the script.
bool parse_pushes(const Bytes& script, std::vector<Bytes>& out);

// Payload of an OP_RETURN output (all pushes after 0x6a, concatenated).
bool op_return_data(const Bytes& script, Bytes& out);

// True when the input's scriptSig / witness reveals the key or script whose
// hash is `hash` for the given output type:
//   P2PKH  - last scriptSig push is a pubkey with HASH160 == hash
//   P2SH   - last scriptSig push is a redeem script with HASH160 == hash
//   P2WPKH - witness is [sig, pubkey] with HASH160(pubkey) == hash
//   P2WSH  - last witness item is a script with SHA256 == hash
bool input_spends_from(const BtcTxIn& in, ScriptType t, const Bytes& hash);

}  // namespace qcb
