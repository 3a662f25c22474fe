#pragma once
// Signed-message wallet proofs. The curve backend is pluggable so the
// core library does not link a secp256k1 implementation.
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace qcb::crypto {

// dsha256("\x18Bitcoin Signed Message:\n" || varint(len) || message)
std::vector<uint8_t> bitcoin_message_hash(const std::string& message);

class MessageVerifier {
public:
    virtual ~MessageVerifier() = default;
    // pubkey: 33- or 65-byte SEC encoding. sig64: compact r||s.
    virtual bool verify(const std::vector<uint8_t>& msg32, const std::vector<uint8_t>& pubkey,
                        const std::array<uint8_t, 64>& sig64) const = 0;
    virtual const char* backend() const = 0;
};

}  // namespace qcb::crypto
