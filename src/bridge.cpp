#include "bridge.h"
#include "crypto/message_verifier.h"
#include "hex.h"
#include "log.h"
#include "proposal_payload.h"
#include "token_bank.h"

#include <utility>

namespace qcb {

namespace {

const char* err_str(AdminError e)       { return admin_error_str(e); }
const char* err_str(LedgerError e)      { return ledger_error_str(e); }
const char* err_str(RegistryError e)    { return registry_error_str(e); }
const char* err_str(MintError e)        { return mint_error_str(e); }
const char* err_str(RedemptionError e)  { return redemption_error_str(e); }
const char* err_str(ConsensusError e)   { return consensus_error_str(e); }
const char* err_str(EnforcementError e) { return enforcement_error_str(e); }

SpvAuditRecord audit_record(const char* purpose, std::string subject, const VerifiedTx& vt, uint64_t now) {
    SpvAuditRecord r;
    r.purpose = purpose;
    r.subject = std::move(subject);
    r.txid = vt.txid;
    r.block_hash = vt.block_hash;
    r.confirmations = vt.confirmations;
    r.accumulated_work = vt.accumulated_work.to_hex();
    r.time = now;
    return r;
}

// Applies approved proposals to the staged state of the running call.
class StagedExecutor : public ProposalExecutor {
public:
    explicit StagedExecutor(BridgeState& s) : s_(s) {}

    bool validate(ProposalType type, const Bytes& payload, std::string* err) const override {
        bool ok = false;
        switch (type) {
            case ProposalType::STATUS_CHANGE: {
                StatusChangePayload p;
                ok = decode_payload(payload, p);
                break;
            }
            case ProposalType::REDEMPTION_DEFAULT: {
                RedemptionDefaultPayload p;
                ok = decode_payload(payload, p);
                break;
            }
            case ProposalType::FORCE_INTERVENTION: {
                ForceInterventionPayload p;
                ok = decode_payload(payload, p);
                break;
            }
            case ProposalType::PARAMETER_CHANGE: {
                ParameterChangePayload p;
                if (!decode_payload(payload, p)) break;
                SystemParams trial = s_.sys.params;
                return set_param(trial, p.key, p.value, err);
            }
            case ProposalType::WALLET_DEREGISTRATION: {
                WalletDeregistrationPayload p;
                ok = decode_payload(payload, p);
                break;
            }
        }
        if (!ok && err) *err = std::string("malformed ") + proposal_type_str(type) + " payload";
        return ok;
    }

    bool execute(const Proposal& prop, uint64_t now, EventLog& ev, std::string* err) override {
        switch (prop.type) {
            case ProposalType::STATUS_CHANGE: {
                StatusChangePayload p;
                if (!decode_payload(prop.payload, p)) return fail(err, "malformed payload");
                RegistryError r = s_.registry.set_status(p.custodian_id, p.status, p.reason,
                                                         StatusSource::CONSENSUS, now, ev);
                return r == RegistryError::OK || fail(err, registry_error_str(r));
            }
            case ProposalType::REDEMPTION_DEFAULT: {
                RedemptionDefaultPayload p;
                if (!decode_payload(prop.payload, p)) return fail(err, "malformed payload");
                RedemptionError r = s_.redemptions.force_default(p.redemption_id, p.reason, s_.registry, now, ev);
                return r == RedemptionError::OK || fail(err, redemption_error_str(r));
            }
            case ProposalType::FORCE_INTERVENTION: {
                ForceInterventionPayload p;
                if (!decode_payload(prop.payload, p)) return fail(err, "malformed payload");
                if (p.action == InterventionAction::FREEZE_CUSTODIAN) {
                    RegistryError r = s_.registry.set_status(p.custodian_id, CustodianStatus::UNDER_REVIEW,
                                                             "frozen_by_watchdogs", StatusSource::CONSENSUS, now, ev);
                    return r == RegistryError::OK || fail(err, registry_error_str(r));
                }
                const bool pausing = p.action == InterventionAction::PAUSE;
                AdminError r = pausing ? s_.sys.pause(p.flag) : s_.sys.unpause(p.flag);
                if (r != AdminError::OK) return fail(err, admin_error_str(r));
                ev.emit(EventType::PAUSE_CHANGED, now, pause_flag_str(p.flag),
                        std::string("paused=") + (pausing ? "1" : "0") + " by=consensus");
                return true;
            }
            case ProposalType::PARAMETER_CHANGE: {
                ParameterChangePayload p;
                if (!decode_payload(prop.payload, p)) return fail(err, "malformed payload");
                const uint64_t old = get_param(s_.sys.params, p.key);
                if (!set_param(s_.sys.params, p.key, p.value, err)) return false;
                ev.emit(EventType::PARAMETER_CHANGED, now, param_key_str(p.key),
                        "old=" + std::to_string(old) + " new=" + std::to_string(p.value) + " by=consensus");
                return true;
            }
            case ProposalType::WALLET_DEREGISTRATION: {
                WalletDeregistrationPayload p;
                if (!decode_payload(prop.payload, p)) return fail(err, "malformed payload");
                RegistryError r = s_.registry.deregister_wallet(p.custodian_id, p.btc_address, now, ev);
                return r == RegistryError::OK || fail(err, registry_error_str(r));
            }
        }
        return fail(err, "unknown proposal type");
    }

private:
    static bool fail(std::string* err, const char* why) {
        if (err) *err = why;
        return false;
    }

    BridgeState& s_;
};

}  // namespace

Bridge::Bridge(const BridgeConfig& cfg, const ActorId& admin, Clock& clock, TokenBank& bank)
    : clock_(clock), bank_(bank), require_coinbase_(cfg.require_coinbase_proof) {
    state_.sys.params = cfg.params;
    state_.oracle = DifficultyOracle(cfg.epoch_current_bits, cfg.epoch_previous_bits);
    for (size_t i = 0; i < PROPOSAL_TYPE_COUNT; ++i)
        state_.consensus.init_threshold(static_cast<ProposalType>(i), cfg.thresholds[i]);
    state_.roles.grant(admin, Role::ADMIN);
    log_info("bridge: initialized, admin=" + admin);
}

template <typename Err, typename Fn>
Err Bridge::run(const char* op, Fn&& fn) {
    BridgeState staged = state_;
    EventLog ev;
    const Err r = fn(staged, ev);
    if (r != Err::OK) {
        QCB_LOG_DEBUG(LogCategory::GENERAL, std::string("bridge: ") + op + " rejected: " + err_str(r));
        return r;
    }
    state_ = std::move(staged);
    publish(op, ev);
    return r;
}

void Bridge::publish(const char* op, const EventLog& ev) {
    QCB_LOG_DEBUG(LogCategory::GENERAL, std::string("bridge: ") + op + " committed, "
                  + std::to_string(ev.events().size()) + " events");
    for (const auto& e : ev.events())
        for (const auto& l : listeners_) l(e);
    if (journal_) {
        std::string err;
        if (!journal_->append(ev, &err))
            log_error(LogCategory::DB, std::string("bridge: journal append after ") + op + " failed: " + err);
    }
}

// ---------------------------------------------------------------------------
// administration

AdminError Bridge::grant_role(const ActorId& caller, const ActorId& who, Role r) {
    const uint64_t t = now();
    return run<AdminError>("grant_role", [&](BridgeState& s, EventLog& ev) {
        if (!AuthorizationContext(caller, s.roles).has(Role::ADMIN)) return AdminError::UNAUTHORIZED;
        if (who.empty() || s.roles.has(who, r)) return AdminError::INVALID_ROLE_CHANGE;
        s.roles.grant(who, r);
        ev.emit(EventType::ROLE_CHANGED, t, who, std::string("role=") + role_str(r) + " granted=1");
        return AdminError::OK;
    });
}

AdminError Bridge::revoke_role(const ActorId& caller, const ActorId& who, Role r) {
    const uint64_t t = now();
    return run<AdminError>("revoke_role", [&](BridgeState& s, EventLog& ev) {
        if (!AuthorizationContext(caller, s.roles).has(Role::ADMIN)) return AdminError::UNAUTHORIZED;
        // An admin cannot drop its own ADMIN role.
        if (r == Role::ADMIN && who == caller) return AdminError::INVALID_ROLE_CHANGE;
        if (!s.roles.revoke(who, r)) return AdminError::INVALID_ROLE_CHANGE;
        ev.emit(EventType::ROLE_CHANGED, t, who, std::string("role=") + role_str(r) + " granted=0");
        return AdminError::OK;
    });
}

AdminError Bridge::pause(const ActorId& caller, PauseFlag f) {
    const uint64_t t = now();
    return run<AdminError>("pause", [&](BridgeState& s, EventLog& ev) {
        if (!AuthorizationContext(caller, s.roles).has(Role::ADMIN)) return AdminError::UNAUTHORIZED;
        AdminError r = s.sys.pause(f);
        if (r != AdminError::OK) return r;
        ev.emit(EventType::PAUSE_CHANGED, t, pause_flag_str(f), "paused=1 by=" + caller);
        log_warn(std::string("bridge: ") + pause_flag_str(f) + " paused by " + caller);
        return r;
    });
}

AdminError Bridge::unpause(const ActorId& caller, PauseFlag f) {
    const uint64_t t = now();
    return run<AdminError>("unpause", [&](BridgeState& s, EventLog& ev) {
        if (!AuthorizationContext(caller, s.roles).has(Role::ADMIN)) return AdminError::UNAUTHORIZED;
        AdminError r = s.sys.unpause(f);
        if (r != AdminError::OK) return r;
        ev.emit(EventType::PAUSE_CHANGED, t, pause_flag_str(f), "paused=0 by=" + caller);
        log_info(std::string("bridge: ") + pause_flag_str(f) + " unpaused by " + caller);
        return r;
    });
}

AdminError Bridge::set_parameter(const ActorId& caller, ParamKey k, uint64_t value) {
    const uint64_t t = now();
    return run<AdminError>("set_parameter", [&](BridgeState& s, EventLog& ev) {
        if (!AuthorizationContext(caller, s.roles).has(Role::ADMIN)) return AdminError::UNAUTHORIZED;
        const uint64_t old = get_param(s.sys.params, k);
        std::string err;
        if (!set_param(s.sys.params, k, value, &err)) {
            QCB_LOG_DEBUG(LogCategory::GENERAL, std::string("bridge: ") + param_key_str(k) + ": " + err);
            return AdminError::INVALID_PARAMETER;
        }
        ev.emit(EventType::PARAMETER_CHANGED, t, param_key_str(k),
                "old=" + std::to_string(old) + " new=" + std::to_string(value) + " by=" + caller);
        log_info(std::string("bridge: ") + param_key_str(k) + " = " + std::to_string(value));
        return AdminError::OK;
    });
}

AdminError Bridge::advance_epoch(const ActorId& caller, uint32_t new_bits) {
    const uint64_t t = now();
    return run<AdminError>("advance_epoch", [&](BridgeState& s, EventLog& ev) {
        if (!AuthorizationContext(caller, s.roles).has(Role::ADMIN)) return AdminError::UNAUTHORIZED;
        BigNum target;
        if (!target_from_bits(new_bits, target) || target.is_zero()) return AdminError::INVALID_PARAMETER;
        s.oracle.advance_epoch(new_bits);
        ev.emit(EventType::EPOCH_ADVANCED, t, std::to_string(new_bits),
                "previous=" + std::to_string(s.oracle.previous_bits()));
        return AdminError::OK;
    });
}

ConsensusError Bridge::add_voter(const ActorId& caller, const ActorId& voter) {
    const uint64_t t = now();
    return run<ConsensusError>("add_voter", [&](BridgeState& s, EventLog& ev) {
        return s.consensus.add_voter(AuthorizationContext(caller, s.roles), voter, t, ev);
    });
}

ConsensusError Bridge::remove_voter(const ActorId& caller, const ActorId& voter) {
    const uint64_t t = now();
    return run<ConsensusError>("remove_voter", [&](BridgeState& s, EventLog& ev) {
        return s.consensus.remove_voter(AuthorizationContext(caller, s.roles), voter, t, ev);
    });
}

ConsensusError Bridge::set_threshold(const ActorId& caller, ProposalType type, uint32_t m) {
    const uint64_t t = now();
    return run<ConsensusError>("set_threshold", [&](BridgeState& s, EventLog& ev) {
        return s.consensus.set_threshold(AuthorizationContext(caller, s.roles), type, m, t, ev);
    });
}

// ---------------------------------------------------------------------------
// reserves and custodians

LedgerError Bridge::submit_attestation(const ActorId& caller, const std::string& custodian_id,
                                       uint64_t balance, uint64_t timestamp) {
    const uint64_t t = now();
    return run<LedgerError>("submit_attestation", [&](BridgeState& s, EventLog& ev) {
        return s.ledger.submit_attestation(AuthorizationContext(caller, s.roles), custodian_id, balance,
                                           timestamp, s.sys.params, s.registry, t, ev);
    });
}

RegistryError Bridge::register_custodian(const ActorId& caller, const std::string& custodian_id, uint64_t max_cap) {
    const uint64_t t = now();
    return run<RegistryError>("register_custodian", [&](BridgeState& s, EventLog& ev) {
        return s.registry.register_custodian(AuthorizationContext(caller, s.roles), custodian_id, max_cap,
                                             s.sys, t, ev);
    });
}

RegistryError Bridge::set_custodian_status(const ActorId& caller, const std::string& custodian_id,
                                           CustodianStatus to, const std::string& reason) {
    const uint64_t t = now();
    return run<RegistryError>("set_custodian_status", [&](BridgeState& s, EventLog& ev) {
        if (!AuthorizationContext(caller, s.roles).has(Role::ARBITER)) return RegistryError::UNAUTHORIZED;
        return s.registry.set_status(custodian_id, to, reason, StatusSource::ARBITER, t, ev);
    });
}

RegistryError Bridge::request_wallet_binding(const ActorId& caller, const std::string& custodian_id,
                                             const std::string& btc_address, const Bytes& challenge,
                                             uint64_t& binding_id) {
    const uint64_t t = now();
    uint64_t id = 0;
    RegistryError r = run<RegistryError>("request_wallet_binding", [&](BridgeState& s, EventLog& ev) {
        return s.registry.request_wallet_binding(AuthorizationContext(caller, s.roles), custodian_id,
                                                 btc_address, challenge, s.sys, t, id, ev);
    });
    if (r == RegistryError::OK) binding_id = id;
    return r;
}

RegistryError Bridge::finalize_wallet_binding(const ActorId& caller, uint64_t binding_id, const Bytes& raw_tx,
                                              const SpvProof& proof, SpvError* spv_err) {
    const uint64_t t = now();
    return run<RegistryError>("finalize_wallet_binding", [&](BridgeState& s, EventLog& ev) {
        SpvVerifier verifier(s.oracle, s.sys.params.proof_difficulty_factor, require_coinbase_);
        VerifiedTx vt;
        RegistryError r = s.registry.finalize_wallet_binding(AuthorizationContext(caller, s.roles), binding_id,
                                                             raw_tx, proof, verifier, s.sys, t, ev, &vt, spv_err);
        if (r == RegistryError::OK)
            ev.add_proof(audit_record("wallet_binding", std::to_string(binding_id), vt, t));
        return r;
    });
}

RegistryError Bridge::finalize_wallet_binding_signed(const ActorId& caller, uint64_t binding_id,
                                                     const Bytes& pubkey, const std::array<uint8_t, 64>& sig64) {
    const uint64_t t = now();
    return run<RegistryError>("finalize_wallet_binding_signed", [&](BridgeState& s, EventLog& ev) {
        return s.registry.finalize_wallet_binding_signed(AuthorizationContext(caller, s.roles), binding_id,
                                                         pubkey, sig64, verifier_, s.sys, t, ev);
    });
}

// ---------------------------------------------------------------------------
// mint / redeem

MintError Bridge::mint(const ActorId& caller, const std::string& custodian_id, const ActorId& recipient,
                       uint64_t amount) {
    const uint64_t t = now();
    return run<MintError>("mint", [&](BridgeState& s, EventLog& ev) {
        return qcb::mint(AuthorizationContext(caller, s.roles), custodian_id, recipient, amount, s.sys,
                         s.registry, s.ledger, bank_, t, ev);
    });
}

RedemptionError Bridge::initiate_redemption(const ActorId& caller, const std::string& custodian_id,
                                            uint64_t amount, const std::string& destination,
                                            RedemptionId& id_out) {
    const uint64_t t = now();
    RedemptionId id;
    RedemptionError r = run<RedemptionError>("initiate_redemption", [&](BridgeState& s, EventLog& ev) {
        return s.redemptions.initiate(AuthorizationContext(caller, s.roles), custodian_id, amount, destination,
                                      s.sys, s.registry, bank_, t, id, ev);
    });
    if (r == RedemptionError::OK) id_out = std::move(id);
    return r;
}

RedemptionError Bridge::record_redemption_fulfillment(const ActorId& caller, const RedemptionId& id,
                                                      const std::string& claimed_address, uint64_t claimed_amount,
                                                      const Bytes& raw_tx, const SpvProof& proof,
                                                      SpvError* spv_err) {
    const uint64_t t = now();
    return run<RedemptionError>("record_redemption_fulfillment", [&](BridgeState& s, EventLog& ev) {
        SpvVerifier verifier(s.oracle, s.sys.params.proof_difficulty_factor, require_coinbase_);
        VerifiedTx vt;
        RedemptionError r = s.redemptions.record_fulfillment(AuthorizationContext(caller, s.roles), id,
                                                             claimed_address, claimed_amount, raw_tx, proof,
                                                             verifier, s.sys, s.registry, t, ev, &vt, spv_err);
        if (r == RedemptionError::OK) ev.add_proof(audit_record("redemption", to_hex(id), vt, t));
        return r;
    });
}

RedemptionError Bridge::expire_redemption(const RedemptionId& id) {
    const uint64_t t = now();
    return run<RedemptionError>("expire_redemption", [&](BridgeState& s, EventLog& ev) {
        return s.redemptions.expire(id, t, ev);
    });
}

RedemptionError Bridge::flag_default(const ActorId& caller, const RedemptionId& id, const std::string& reason) {
    const uint64_t t = now();
    return run<RedemptionError>("flag_default", [&](BridgeState& s, EventLog& ev) {
        return s.redemptions.flag_default(AuthorizationContext(caller, s.roles), id, reason, s.registry, t, ev);
    });
}

// ---------------------------------------------------------------------------
// watchdogs

ConsensusError Bridge::propose(const ActorId& caller, ProposalType type, const Bytes& payload,
                               const std::string& justification, uint64_t& id_out) {
    const uint64_t t = now();
    uint64_t id = 0;
    ConsensusError r = run<ConsensusError>("propose", [&](BridgeState& s, EventLog& ev) {
        StagedExecutor exec(s);
        return s.consensus.propose(AuthorizationContext(caller, s.roles), type, payload, justification,
                                   s.sys.params.voting_period, exec, t, id, ev);
    });
    if (r == ConsensusError::OK) id_out = id;
    return r;
}

ConsensusError Bridge::vote(const ActorId& caller, uint64_t id, bool in_favor, bool& executed) {
    const uint64_t t = now();
    bool did_execute = false;
    ConsensusError r = run<ConsensusError>("vote", [&](BridgeState& s, EventLog& ev) {
        StagedExecutor exec(s);
        return s.consensus.vote(AuthorizationContext(caller, s.roles), id, in_favor, exec, t, did_execute, ev);
    });
    executed = r == ConsensusError::OK && did_execute;
    return r;
}

size_t Bridge::cleanup_expired(const std::vector<uint64_t>& ids) {
    const uint64_t t = now();
    size_t n = 0;
    run<ConsensusError>("cleanup_expired", [&](BridgeState& s, EventLog& ev) {
        n = s.consensus.cleanup_expired(ids, t, ev);
        return ConsensusError::OK;
    });
    return n;
}

EnforcementError Bridge::enforce_violation(const ActorId& reporter, const std::string& custodian_id,
                                           ViolationReason reason) {
    const uint64_t t = now();
    return run<EnforcementError>("enforce_violation", [&](BridgeState& s, EventLog& ev) {
        return enforce_objective_violation(reporter, custodian_id, reason, s.registry, s.ledger, s.sys.params, t, ev);
    });
}

// ---------------------------------------------------------------------------
// queries

uint64_t Bridge::available_capacity(const std::string& custodian_id) const {
    const Custodian* c = state_.registry.find(custodian_id);
    return c ? state_.ledger.available_capacity(*c) : 0;
}

bool Bridge::is_stale(const std::string& custodian_id) const {
    return state_.ledger.is_stale(custodian_id, now(), state_.sys.params);
}

bool Bridge::has_violation(const std::string& custodian_id, ViolationReason reason) const {
    return check_violation(custodian_id, reason, state_.registry, state_.ledger, state_.sys.params, now());
}

SpvError Bridge::verify_proof(const Bytes& raw_tx, const SpvProof& proof, VerifiedTx& out) const {
    SpvVerifier verifier(state_.oracle, state_.sys.params.proof_difficulty_factor, require_coinbase_);
    return verifier.verify(raw_tx, proof, out);
}

}  // namespace qcb
