#include "redemption.h"
#include "custodian_registry.h"
#include "hash.h"
#include "hex.h"
#include "log.h"
#include "script.h"
#include "token_bank.h"

namespace qcb {

const char* redemption_status_str(RedemptionStatus s) {
    switch (s) {
        case RedemptionStatus::PENDING:   return "pending";
        case RedemptionStatus::FULFILLED: return "fulfilled";
        case RedemptionStatus::DEFAULTED: return "defaulted";
        case RedemptionStatus::TIMED_OUT: return "timed_out";
    }
    return "unknown";
}

const char* redemption_error_str(RedemptionError e) {
    switch (e) {
        case RedemptionError::OK:                     return "ok";
        case RedemptionError::UNAUTHORIZED:           return "unauthorized";
        case RedemptionError::PAUSED:                 return "paused";
        case RedemptionError::UNKNOWN_CUSTODIAN:      return "unknown_custodian";
        case RedemptionError::CUSTODIAN_NOT_ACTIVE:   return "custodian_not_active";
        case RedemptionError::AMOUNT_OUT_OF_RANGE:    return "amount_out_of_range";
        case RedemptionError::INSUFFICIENT_MINTED:    return "insufficient_minted";
        case RedemptionError::INSUFFICIENT_BALANCE:   return "insufficient_balance";
        case RedemptionError::INVALID_ADDRESS:        return "invalid_address";
        case RedemptionError::UNKNOWN_REDEMPTION:     return "unknown_redemption";
        case RedemptionError::WRONG_STATUS:           return "wrong_status";
        case RedemptionError::DEADLINE_PASSED:        return "deadline_passed";
        case RedemptionError::NOT_TIMED_OUT:          return "not_timed_out";
        case RedemptionError::ADDRESS_MISMATCH:       return "address_mismatch";
        case RedemptionError::AMOUNT_BELOW_TOLERANCE: return "amount_below_tolerance";
        case RedemptionError::PROOF_INVALID:          return "proof_invalid";
        case RedemptionError::PAYMENT_MISMATCH:       return "payment_mismatch";
        case RedemptionError::PAYMENT_ALREADY_USED:   return "payment_already_used";
    }
    return "unknown";
}

static RedemptionError reject(const char* op, RedemptionError e) {
    QCB_LOG_DEBUG(LogCategory::REDEMPTION, std::string("redemption: ") + op + " rejected: " + redemption_error_str(e));
    return e;
}

RedemptionId redemption_id(const ActorId& requester, const std::string& custodian_id,
                           uint64_t amount, uint64_t nonce) {
    Bytes b;
    put_string(b, requester);
    put_string(b, custodian_id);
    put_u64_le(b, amount);
    put_u64_le(b, nonce);
    return sha256(b);
}

uint64_t min_acceptable_payment(uint64_t amount, uint64_t fee_tolerance_bps) {
    if (fee_tolerance_bps >= 10000) return 0;
    // amount * bps / 10000 without overflowing 64 bits
    const uint64_t tol = (amount / 10000) * fee_tolerance_bps + (amount % 10000) * fee_tolerance_bps / 10000;
    return amount - tol;
}

void RedemptionManager::set_status(Redemption& r, RedemptionStatus to, uint64_t now, EventLog& ev,
                                   const std::string& note) {
    const RedemptionStatus from = r.status;
    r.status = to;
    r.resolved_at = now;
    std::string detail = std::string("from=") + redemption_status_str(from) + " to=" + redemption_status_str(to);
    if (!note.empty()) detail += " " + note;
    ev.emit(EventType::REDEMPTION_STATE_CHANGED, now, to_hex(r.id), detail);
    log_info(LogCategory::REDEMPTION, "redemption: " + to_hex(r.id) + " " + redemption_status_str(from)
             + " -> " + redemption_status_str(to));
}

RedemptionError RedemptionManager::initiate(const AuthorizationContext& auth, const std::string& custodian_id,
                                            uint64_t amount, const std::string& destination,
                                            const SystemState& sys, CustodianRegistry& registry,
                                            TokenBank& bank, uint64_t now, RedemptionId& id_out,
                                            EventLog& ev) {
    if (!auth.has(Role::REDEEMER)) return reject("initiate", RedemptionError::UNAUTHORIZED);
    if (sys.pauses.redemption) return reject("initiate", RedemptionError::PAUSED);

    Custodian* c = registry.find_mut(custodian_id);
    if (!c) return reject("initiate", RedemptionError::UNKNOWN_CUSTODIAN);
    if (c->status != CustodianStatus::ACTIVE) return reject("initiate", RedemptionError::CUSTODIAN_NOT_ACTIVE);
    if (amount < sys.params.min_redemption_amount || amount > sys.params.max_redemption_amount)
        return reject("initiate", RedemptionError::AMOUNT_OUT_OF_RANGE);
    if (c->minted_amount < c->escrowed_amount || c->minted_amount - c->escrowed_amount < amount)
        return reject("initiate", RedemptionError::INSUFFICIENT_MINTED);

    DecodedAddress dest;
    if (!decode_btc_address(destination, dest)) return reject("initiate", RedemptionError::INVALID_ADDRESS);

    Redemption r;
    r.nonce = next_nonce_;
    r.id = redemption_id(auth.caller(), custodian_id, amount, r.nonce);
    r.requester = auth.caller();
    r.custodian_id = custodian_id;
    r.amount = amount;
    r.destination = destination;
    r.dest = std::move(dest);
    r.created_at = now;
    r.deadline = now + sys.params.redemption_timeout;

    std::string err;
    if (!bank.burn(auth.caller(), amount, &err)) {
        QCB_LOG_DEBUG(LogCategory::REDEMPTION, "redemption: burn failed for " + auth.caller() + ": " + err);
        return reject("initiate", RedemptionError::INSUFFICIENT_BALANCE);
    }

    ++next_nonce_;
    c->escrowed_amount += amount;
    id_out = r.id;

    ev.emit(EventType::REDEMPTION_INITIATED, now, to_hex(r.id),
            "custodian=" + custodian_id + " amount=" + std::to_string(amount) + " destination=" + destination
            + " deadline=" + std::to_string(r.deadline));
    log_info(LogCategory::REDEMPTION, "redemption: " + to_hex(r.id) + " initiated, " + std::to_string(amount)
             + " sat from " + custodian_id + " to " + destination);
    redemptions_.emplace(r.id, std::move(r));
    return RedemptionError::OK;
}

RedemptionError RedemptionManager::record_fulfillment(const AuthorizationContext& auth, const RedemptionId& id,
                                                      const std::string& claimed_address, uint64_t claimed_amount,
                                                      const Bytes& raw_tx, const SpvProof& proof,
                                                      const SpvVerifier& verifier, const SystemState& sys,
                                                      CustodianRegistry& registry, uint64_t now, EventLog& ev,
                                                      VerifiedTx* verified, SpvError* spv_err) {
    if (!auth.has(Role::ARBITER)) return reject("fulfill", RedemptionError::UNAUTHORIZED);
    auto it = redemptions_.find(id);
    if (it == redemptions_.end()) return reject("fulfill", RedemptionError::UNKNOWN_REDEMPTION);
    Redemption& r = it->second;

    if (r.status != RedemptionStatus::PENDING) return reject("fulfill", RedemptionError::WRONG_STATUS);
    if (now > r.deadline + sys.params.fulfillment_grace) return reject("fulfill", RedemptionError::DEADLINE_PASSED);

    DecodedAddress claimed;
    if (!decode_btc_address(claimed_address, claimed)) return reject("fulfill", RedemptionError::INVALID_ADDRESS);
    if (claimed.type != r.dest.type || claimed.hash != r.dest.hash)
        return reject("fulfill", RedemptionError::ADDRESS_MISMATCH);
    if (claimed_amount < min_acceptable_payment(r.amount, sys.params.fee_tolerance_bps))
        return reject("fulfill", RedemptionError::AMOUNT_BELOW_TOLERANCE);

    VerifiedTx v;
    const SpvError se = verifier.verify(raw_tx, proof, v);
    if (se != SpvError::OK) {
        if (spv_err) *spv_err = se;
        return reject("fulfill", RedemptionError::PROOF_INVALID);
    }

    if (used_payments_.count(v.txid)) return reject("fulfill", RedemptionError::PAYMENT_ALREADY_USED);

    bool paid = false;
    for (const auto& o : v.tx.vout) {
        Bytes h;
        if (classify_script(o.script_pubkey) != r.dest.type) continue;
        if (!extract_pay_to_hash(o.script_pubkey, h) || h != r.dest.hash) continue;
        if (o.value >= claimed_amount) {
            paid = true;
            break;
        }
    }
    if (!paid) return reject("fulfill", RedemptionError::PAYMENT_MISMATCH);

    Custodian* c = registry.find_mut(r.custodian_id);
    if (c) {
        c->escrowed_amount = c->escrowed_amount >= r.amount ? c->escrowed_amount - r.amount : 0;
        c->minted_amount = c->minted_amount >= r.amount ? c->minted_amount - r.amount : 0;
    }
    r.paid_amount = claimed_amount;
    r.payment_txid = v.txid;
    used_payments_.insert(v.txid);
    set_status(r, RedemptionStatus::FULFILLED, now, ev,
               "txid=" + to_hex_rev(v.txid) + " paid=" + std::to_string(claimed_amount));
    if (verified) *verified = std::move(v);
    return RedemptionError::OK;
}

RedemptionError RedemptionManager::expire(const RedemptionId& id, uint64_t now, EventLog& ev) {
    auto it = redemptions_.find(id);
    if (it == redemptions_.end()) return reject("expire", RedemptionError::UNKNOWN_REDEMPTION);
    Redemption& r = it->second;
    if (r.status != RedemptionStatus::PENDING) return reject("expire", RedemptionError::WRONG_STATUS);
    if (now <= r.deadline) return reject("expire", RedemptionError::NOT_TIMED_OUT);
    set_status(r, RedemptionStatus::TIMED_OUT, now, ev, "");
    return RedemptionError::OK;
}

RedemptionError RedemptionManager::flag_default(const AuthorizationContext& auth, const RedemptionId& id,
                                                const std::string& reason, CustodianRegistry& registry,
                                                uint64_t now, EventLog& ev) {
    if (!auth.has(Role::ARBITER)) return reject("default", RedemptionError::UNAUTHORIZED);
    return force_default(id, reason, registry, now, ev);
}

RedemptionError RedemptionManager::force_default(const RedemptionId& id, const std::string& reason,
                                                 CustodianRegistry& registry, uint64_t now, EventLog& ev) {
    auto it = redemptions_.find(id);
    if (it == redemptions_.end()) return reject("default", RedemptionError::UNKNOWN_REDEMPTION);
    Redemption& r = it->second;
    if (r.status != RedemptionStatus::PENDING && r.status != RedemptionStatus::TIMED_OUT)
        return reject("default", RedemptionError::WRONG_STATUS);

    Custodian* c = registry.find_mut(r.custodian_id);
    if (c) {
        c->escrowed_amount = c->escrowed_amount >= r.amount ? c->escrowed_amount - r.amount : 0;
        c->defaulted_amount += r.amount;
    }
    r.default_reason = reason;
    set_status(r, RedemptionStatus::DEFAULTED, now, ev, "reason=" + reason);

    if (c && c->status == CustodianStatus::ACTIVE) {
        const RegistryError re = registry.set_status(r.custodian_id, CustodianStatus::UNDER_REVIEW,
                                                     "redemption_default", StatusSource::AUTOMATIC, now, ev);
        if (re != RegistryError::OK) {
            log_error(LogCategory::REDEMPTION, std::string("redemption: status trigger failed: ")
                      + registry_error_str(re));
        }
    }
    return RedemptionError::OK;
}

bool RedemptionManager::is_timed_out(const RedemptionId& id, uint64_t now) const {
    const Redemption* r = get(id);
    if (!r) return false;
    if (r->status == RedemptionStatus::TIMED_OUT) return true;
    return r->status == RedemptionStatus::PENDING && now > r->deadline;
}

const Redemption* RedemptionManager::get(const RedemptionId& id) const {
    auto it = redemptions_.find(id);
    return it == redemptions_.end() ? nullptr : &it->second;
}

std::vector<RedemptionId> RedemptionManager::pending_for(const std::string& custodian_id) const {
    std::vector<RedemptionId> out;
    for (const auto& kv : redemptions_) {
        if (kv.second.custodian_id == custodian_id && kv.second.status == RedemptionStatus::PENDING)
            out.push_back(kv.first);
    }
    return out;
}

}  // namespace qcb
