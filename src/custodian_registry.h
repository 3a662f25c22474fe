#pragma once
// =============================================================================
// Custodian lifecycle and Bitcoin wallet binding.
//
//   Unregistered -> Active <-> UnderReview
//                     |             |
//                     +--> Terminated <--+
//
// Terminated is final and reachable only through consensus. Wallets are
// bound in two steps by two different parties: a request that fixes the
// address and a challenge, then a finalization that proves control of the
// address (SPV-proved spend carrying the challenge, or a signed message).
// =============================================================================
#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "address.h"
#include "auth.h"
#include "events.h"
#include "params.h"
#include "spv.h"

namespace qcb {

namespace crypto { class MessageVerifier; }

enum class CustodianStatus : uint8_t {
    UNREGISTERED = 0,
    ACTIVE = 1,
    UNDER_REVIEW = 2,
    TERMINATED = 3
};

const char* custodian_status_str(CustodianStatus s);
bool custodian_status_from_u8(uint8_t v, CustodianStatus& out);

// Who is asking for a status change.
enum class StatusSource : uint8_t {
    AUTOMATIC,   // ledger / enforcement rules: UnderReview only
    ARBITER,     // UnderReview -> Active
    CONSENSUS    // anything, including Terminated
};

enum class RegistryError {
    OK = 0,
    UNAUTHORIZED,
    PAUSED,
    ALREADY_REGISTERED,
    NOT_REGISTERED,
    INVALID_CAP,
    INVALID_TRANSITION,
    CUSTODIAN_NOT_ACTIVE,
    INVALID_ADDRESS,
    INVALID_CHALLENGE,
    WALLET_ALREADY_BOUND,
    WALLET_NOT_FOUND,
    UNKNOWN_BINDING,
    BINDING_EXPIRED,
    BINDING_FINALIZED,
    SAME_PARTY,
    PROOF_INVALID,
    CHALLENGE_NOT_FOUND,
    SPEND_NOT_FOUND,
    UNSUPPORTED_PROOF,
    BAD_SIGNATURE
};

const char* registry_error_str(RegistryError e);

// Longest accepted binding challenge (standard OP_RETURN payload).
constexpr size_t MAX_BINDING_CHALLENGE = 80;

struct BoundWallet {
    std::string address;
    ScriptType  type{ScriptType::UNKNOWN};
    Bytes       hash;
    uint64_t    bound_at{0};
};

struct Custodian {
    std::string     id;
    CustodianStatus status{CustodianStatus::UNREGISTERED};
    uint64_t        max_minting_cap{0};
    uint64_t        minted_amount{0};
    uint64_t        escrowed_amount{0};    // burned tokens awaiting a BTC payment
    uint64_t        defaulted_amount{0};
    uint64_t        registered_at{0};
    std::string     status_reason;
    std::vector<BoundWallet> wallets;
};

struct WalletBinding {
    uint64_t       id{0};
    std::string    custodian_id;
    std::string    address;
    DecodedAddress decoded;
    Bytes          challenge;
    ActorId        requested_by;
    uint64_t       requested_at{0};
    uint64_t       expires_at{0};
    bool           finalized{false};
};

class CustodianRegistry {
public:
    RegistryError register_custodian(const AuthorizationContext& auth, const std::string& id,
                                     uint64_t max_cap, const SystemState& sys, uint64_t now,
                                     EventLog& ev);

    // Active <-> UnderReview is idempotent: re-entering the current status
    // is OK and emits nothing.
    RegistryError set_status(const std::string& id, CustodianStatus to, const std::string& reason,
                             StatusSource src, uint64_t now, EventLog& ev);

    // Requester is the custodian itself or a registrar.
    RegistryError request_wallet_binding(const AuthorizationContext& auth, const std::string& custodian_id,
                                         const std::string& btc_address, const Bytes& challenge,
                                         const SystemState& sys, uint64_t now, uint64_t& binding_id,
                                         EventLog& ev);

    // The transaction must be SPV-proved, carry the challenge in an
    // OP_RETURN output and spend from the bound address. On PROOF_INVALID,
    // *spv_err (if given) carries the verifier's reason.
    RegistryError finalize_wallet_binding(const AuthorizationContext& auth, uint64_t binding_id,
                                          const Bytes& raw_tx, const SpvProof& proof,
                                          const SpvVerifier& verifier, const SystemState& sys,
                                          uint64_t now, EventLog& ev, VerifiedTx* verified = nullptr,
                                          SpvError* spv_err = nullptr);

    // Signed-message alternative; P2PKH and P2WPKH addresses only. The
    // signed text is the lowercase hex of the challenge.
    RegistryError finalize_wallet_binding_signed(const AuthorizationContext& auth, uint64_t binding_id,
                                                 const Bytes& pubkey, const std::array<uint8_t, 64>& sig64,
                                                 const crypto::MessageVerifier* verifier,
                                                 const SystemState& sys, uint64_t now, EventLog& ev);

    RegistryError deregister_wallet(const std::string& custodian_id, const std::string& btc_address,
                                    uint64_t now, EventLog& ev);

    // Minted/escrow bookkeeping, used by minting and redemption.
    Custodian* find_mut(const std::string& id);

    const Custodian* find(const std::string& id) const;
    const WalletBinding* binding(uint64_t id) const;
    CustodianStatus status_of(const std::string& id) const;
    // Custodian that has `btc_address` bound, or empty.
    std::string owner_of_wallet(const std::string& btc_address) const;

private:
    RegistryError check_finalizer(const AuthorizationContext& auth, const WalletBinding& b,
                                  const SystemState& sys, uint64_t now) const;
    void bind(WalletBinding& b, uint64_t now, EventLog& ev);

    std::map<std::string, Custodian> custodians_;
    std::map<uint64_t, WalletBinding> bindings_;
    uint64_t next_binding_id_{1};
};

}  // namespace qcb
