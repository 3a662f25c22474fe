#pragma once
// =============================================================================
// Bridge: the single entry point for state-changing calls.
//
// Every operation runs against a staged copy of BridgeState together with
// its own EventLog. Only an OK result replaces the live state, after which
// the events are handed to subscribers and appended to the audit journal.
// A rejected call leaves nothing behind.
// =============================================================================
#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include "auth.h"
#include "clock.h"
#include "config.h"
#include "custodian_registry.h"
#include "difficulty.h"
#include "enforcement.h"
#include "events.h"
#include "minting.h"
#include "params.h"
#include "redemption.h"
#include "reserve_ledger.h"
#include "spv.h"
#include "watchdog_consensus.h"

namespace qcb {

class TokenBank;
namespace crypto { class MessageVerifier; }

struct BridgeState {
    SystemState        sys;
    RoleTable          roles;
    DifficultyOracle   oracle;
    CustodianRegistry  registry;
    ReserveLedger      ledger;
    RedemptionManager  redemptions;
    WatchdogConsensus  consensus;
};

class Bridge {
public:
    // cfg is expected to have passed validate_config. `admin` receives the
    // ADMIN role.
    Bridge(const BridgeConfig& cfg, const ActorId& admin, Clock& clock, TokenBank& bank);

    void set_message_verifier(const crypto::MessageVerifier* v) { verifier_ = v; }
    // Not owned; nullptr detaches.
    void attach_journal(EventSink* j) { journal_ = j; }
    void subscribe(EventListener l) { listeners_.push_back(std::move(l)); }

    // --- administration ---
    AdminError grant_role(const ActorId& caller, const ActorId& who, Role r);
    AdminError revoke_role(const ActorId& caller, const ActorId& who, Role r);
    AdminError pause(const ActorId& caller, PauseFlag f);
    AdminError unpause(const ActorId& caller, PauseFlag f);
    AdminError set_parameter(const ActorId& caller, ParamKey k, uint64_t value);
    AdminError advance_epoch(const ActorId& caller, uint32_t new_bits);
    ConsensusError add_voter(const ActorId& caller, const ActorId& voter);
    ConsensusError remove_voter(const ActorId& caller, const ActorId& voter);
    ConsensusError set_threshold(const ActorId& caller, ProposalType t, uint32_t m);

    // --- reserves and custodians ---
    LedgerError submit_attestation(const ActorId& caller, const std::string& custodian_id,
                                   uint64_t balance, uint64_t timestamp);
    RegistryError register_custodian(const ActorId& caller, const std::string& custodian_id, uint64_t max_cap);
    // Arbiter clears a review: UnderReview -> Active.
    RegistryError set_custodian_status(const ActorId& caller, const std::string& custodian_id,
                                       CustodianStatus to, const std::string& reason);
    RegistryError request_wallet_binding(const ActorId& caller, const std::string& custodian_id,
                                         const std::string& btc_address, const Bytes& challenge,
                                         uint64_t& binding_id);
    RegistryError finalize_wallet_binding(const ActorId& caller, uint64_t binding_id, const Bytes& raw_tx,
                                          const SpvProof& proof, SpvError* spv_err = nullptr);
    // UNSUPPORTED_PROOF when no message verifier is configured.
    RegistryError finalize_wallet_binding_signed(const ActorId& caller, uint64_t binding_id, const Bytes& pubkey,
                                                 const std::array<uint8_t, 64>& sig64);

    // --- mint / redeem ---
    MintError mint(const ActorId& caller, const std::string& custodian_id, const ActorId& recipient,
                   uint64_t amount);
    RedemptionError initiate_redemption(const ActorId& caller, const std::string& custodian_id, uint64_t amount,
                                        const std::string& destination, RedemptionId& id_out);
    RedemptionError record_redemption_fulfillment(const ActorId& caller, const RedemptionId& id,
                                                  const std::string& claimed_address, uint64_t claimed_amount,
                                                  const Bytes& raw_tx, const SpvProof& proof,
                                                  SpvError* spv_err = nullptr);
    RedemptionError expire_redemption(const RedemptionId& id);
    RedemptionError flag_default(const ActorId& caller, const RedemptionId& id, const std::string& reason);

    // --- watchdogs ---
    ConsensusError propose(const ActorId& caller, ProposalType type, const Bytes& payload,
                           const std::string& justification, uint64_t& id_out);
    ConsensusError vote(const ActorId& caller, uint64_t id, bool in_favor, bool& executed);
    size_t cleanup_expired(const std::vector<uint64_t>& ids);
    EnforcementError enforce_violation(const ActorId& reporter, const std::string& custodian_id,
                                       ViolationReason reason);

    // --- queries ---
    const BridgeState& state() const { return state_; }
    uint64_t now() const { return clock_.now(); }
    uint64_t available_capacity(const std::string& custodian_id) const;
    bool is_stale(const std::string& custodian_id) const;
    bool has_violation(const std::string& custodian_id, ViolationReason reason) const;
    // Pure verification with the live oracle and parameters.
    SpvError verify_proof(const Bytes& raw_tx, const SpvProof& proof, VerifiedTx& out) const;

private:
    template <typename Err, typename Fn>
    Err run(const char* op, Fn&& fn);

    void publish(const char* op, const EventLog& ev);

    BridgeState state_;
    Clock& clock_;
    TokenBank& bank_;
    const crypto::MessageVerifier* verifier_{nullptr};
    EventSink* journal_{nullptr};
    std::vector<EventListener> listeners_;
    bool require_coinbase_{true};
};

}  // namespace qcb
