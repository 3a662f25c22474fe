#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "script.h"

namespace qcb {

// Base58Check version bytes.
constexpr uint8_t VERSION_P2PKH_MAIN = 0x00;
constexpr uint8_t VERSION_P2SH_MAIN = 0x05;
constexpr uint8_t VERSION_P2PKH_TEST = 0x6f;
constexpr uint8_t VERSION_P2SH_TEST = 0xc4;

enum class BtcNetwork : int { MAINNET = 0, TESTNET = 1, REGTEST = 2 };

struct DecodedAddress {
    ScriptType type{ScriptType::UNKNOWN};
    std::vector<uint8_t> hash;     // 20 bytes, or 32 for P2WSH
    BtcNetwork network{BtcNetwork::MAINNET};
};

// Accepts Base58Check P2PKH/P2SH and bech32 v0 P2WPKH/P2WSH with hrp
// bc, tb or bcrt. Regtest base58 addresses share testnet versions and
// decode as TESTNET.
bool decode_btc_address(const std::string& addr, DecodedAddress& out);

// Empty string when (type, hash) cannot be encoded.
std::string encode_btc_address(ScriptType type, const std::vector<uint8_t>& hash,
                               BtcNetwork net = BtcNetwork::MAINNET);

// Locking script the address pays to; empty on a decode failure.
std::vector<uint8_t> address_to_script(const std::string& addr);

}  // namespace qcb
