// src/crypto/secp256k1_verifier.cpp
#include "crypto/secp256k1_verifier.h"
#include <mutex>
#include <secp256k1.h>

namespace qcb::crypto {

static secp256k1_context* g_ctx = nullptr;
static std::once_flag g_once;

static secp256k1_context* ctx() {
    std::call_once(g_once, [] {
        g_ctx = secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
    });
    return g_ctx;
}

static inline bool is_valid_priv(const std::vector<uint8_t>& sk) {
    return sk.size() == 32 && secp256k1_ec_seckey_verify(ctx(), sk.data()) == 1;
}

bool Secp256k1Verifier::verify(const std::vector<uint8_t>& msg32, const std::vector<uint8_t>& pubkey,
                               const std::array<uint8_t, 64>& sig64) const {
    if (msg32.size() != 32 || pubkey.empty()) return false;

    secp256k1_pubkey pk;
    if (secp256k1_ec_pubkey_parse(ctx(), &pk, pubkey.data(), pubkey.size()) != 1) return false;

    secp256k1_ecdsa_signature sig;
    if (secp256k1_ecdsa_signature_parse_compact(ctx(), &sig, sig64.data()) != 1) return false;

    // Reject high-S (normalize returns 1 when it had to change s).
    secp256k1_ecdsa_signature norm;
    if (secp256k1_ecdsa_signature_normalize(ctx(), &norm, &sig) == 1) return false;

    return secp256k1_ecdsa_verify(ctx(), &sig, msg32.data(), &pk) == 1;
}

bool secp_derive_pub(const std::vector<uint8_t>& priv, std::vector<uint8_t>& out33) {
    if (!is_valid_priv(priv)) return false;

    secp256k1_pubkey pk;
    if (secp256k1_ec_pubkey_create(ctx(), &pk, priv.data()) != 1) return false;

    size_t outlen = 33;
    out33.resize(33);
    if (secp256k1_ec_pubkey_serialize(ctx(), out33.data(), &outlen, &pk, SECP256K1_EC_COMPRESSED) != 1) return false;
    return outlen == 33;
}

bool secp_sign_compact(const std::vector<uint8_t>& msg32, const std::vector<uint8_t>& priv,
                       std::array<uint8_t, 64>& sig64) {
    if (msg32.size() != 32 || !is_valid_priv(priv)) return false;

    secp256k1_ecdsa_signature sig;
    if (secp256k1_ecdsa_sign(ctx(), &sig, msg32.data(), priv.data(), nullptr, nullptr) != 1) return false;

    // Low-S normalize
    secp256k1_ecdsa_signature sig_low;
    secp256k1_ecdsa_signature_normalize(ctx(), &sig_low, &sig);

    return secp256k1_ecdsa_signature_serialize_compact(ctx(), sig64.data(), &sig_low) == 1;
}

}  // namespace qcb::crypto
