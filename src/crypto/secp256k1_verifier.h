#pragma once
#include <array>
#include <cstdint>
#include <vector>
#include "crypto/message_verifier.h"

namespace qcb::crypto {

class Secp256k1Verifier : public MessageVerifier {
public:
    bool verify(const std::vector<uint8_t>& msg32, const std::vector<uint8_t>& pubkey,
                const std::array<uint8_t, 64>& sig64) const override;
    const char* backend() const override { return "libsecp256k1"; }
};

// Key and signing helpers for tooling and tests.
bool secp_derive_pub(const std::vector<uint8_t>& priv, std::vector<uint8_t>& out33);
bool secp_sign_compact(const std::vector<uint8_t>& msg32, const std::vector<uint8_t>& priv,
                       std::array<uint8_t, 64>& sig64);

}  // namespace qcb::crypto
