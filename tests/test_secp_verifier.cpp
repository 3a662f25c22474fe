// Signed-message wallet proofs with libsecp256k1.
#include "crypto/secp256k1_verifier.h"
#include "custodian_registry.h"
#include "address.h"
#include "hash.h"
#include "hex.h"
#include "test_util.h"
#include <cstdio>

using namespace qcb;

int main(){
    crypto::Secp256k1Verifier v;
    TEST_CHECK(std::string(v.backend()) == "libsecp256k1", "backend name");

    const Bytes priv(32, 0x01);
    Bytes pub;
    TEST_CHECK(crypto::secp_derive_pub(priv, pub) && pub.size() == 33, "derive");
    TEST_CHECK(to_hex(pub) == "031b84c5567b126440995d3ed5aaba0565d71e1834604819ff9c17f5e9d5dd078f",
               "known public key");
    Bytes tmp;
    TEST_CHECK(!crypto::secp_derive_pub(Bytes(32, 0x00), tmp), "zero key rejected");

    // Raw verification.
    {
        const Bytes digest = crypto::bitcoin_message_hash("hello");
        std::array<uint8_t, 64> sig{};
        TEST_CHECK(crypto::secp_sign_compact(digest, priv, sig), "sign");
        TEST_CHECK(v.verify(digest, pub, sig), "verifies");
        Bytes other = digest;
        other[0] ^= 1;
        TEST_CHECK(!v.verify(other, pub, sig), "other message");
        std::array<uint8_t, 64> bad = sig;
        bad[10] ^= 1;
        TEST_CHECK(!v.verify(digest, pub, bad), "tampered signature");
        TEST_CHECK(!v.verify(digest, Bytes(33, 0x02), sig), "invalid public key");
        TEST_CHECK(!v.verify(Bytes(31, 0), pub, sig), "short digest");
        std::printf("  [PASS] verify\n");
    }

    // Binding a P2WPKH wallet by signing the hex challenge.
    {
        RoleTable roles;
        roles.grant("registrar", Role::REGISTRAR);
        roles.grant("finalizer", Role::BINDING_FINALIZER);
        const AuthorizationContext registrar("registrar", roles);
        const AuthorizationContext finalizer("finalizer", roles);
        SystemState sys;
        CustodianRegistry reg;
        EventLog ev;
        const uint64_t now = 1700000000;
        TEST_CHECK(reg.register_custodian(registrar, "qc1", 1000, sys, now, ev) == RegistryError::OK, "register");

        const std::string addr = encode_btc_address(ScriptType::P2WPKH, hash160(pub));
        const Bytes challenge{0xde, 0xad, 0xbe, 0xef};
        uint64_t id = 0;
        TEST_CHECK(reg.request_wallet_binding(registrar, "qc1", addr, challenge, sys, now, id, ev)
                   == RegistryError::OK, "request");

        std::array<uint8_t, 64> wrong{};
        TEST_CHECK(crypto::secp_sign_compact(crypto::bitcoin_message_hash("deadbeee"), priv, wrong), "sign");
        TEST_CHECK(reg.finalize_wallet_binding_signed(finalizer, id, pub, wrong, &v, sys, now, ev)
                   == RegistryError::BAD_SIGNATURE, "signature over another challenge");

        std::array<uint8_t, 64> sig{};
        TEST_CHECK(crypto::secp_sign_compact(crypto::bitcoin_message_hash("deadbeef"), priv, sig), "sign");
        TEST_CHECK(reg.finalize_wallet_binding_signed(finalizer, id, pub, sig, &v, sys, now, ev)
                   == RegistryError::OK, "bound");
        TEST_CHECK(reg.owner_of_wallet(addr) == "qc1", "owner");
        std::printf("  [PASS] signed binding\n");
    }

    std::printf("All secp256k1 tests passed\n");
    return 0;
}
