#include "crypto/message_verifier.h"
#include "hash.h"
#include "serialize.h"

namespace qcb::crypto {

static const char MAGIC[] = "Bitcoin Signed Message:\n";

std::vector<uint8_t> bitcoin_message_hash(const std::string& message) {
    std::vector<uint8_t> b;
    put_string(b, std::string(MAGIC, sizeof(MAGIC) - 1));
    put_string(b, message);
    return dsha256(b);
}

}  // namespace qcb::crypto
