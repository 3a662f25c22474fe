#include "reserve_ledger.h"
#include "custodian_registry.h"
#include "log.h"
#include <algorithm>

namespace qcb {

const char* ledger_error_str(LedgerError e) {
    switch (e) {
        case LedgerError::OK:                      return "ok";
        case LedgerError::UNAUTHORIZED:            return "unauthorized";
        case LedgerError::UNKNOWN_CUSTODIAN:       return "unknown_custodian";
        case LedgerError::FUTURE_TIMESTAMP:        return "future_timestamp";
        case LedgerError::TIMESTAMP_TOO_OLD:       return "timestamp_too_old";
        case LedgerError::NON_MONOTONIC_TIMESTAMP: return "non_monotonic_timestamp";
    }
    return "unknown";
}

static LedgerError reject(LedgerError e) {
    QCB_LOG_DEBUG(LogCategory::LEDGER, std::string("ledger: attestation rejected: ") + ledger_error_str(e));
    return e;
}

uint64_t median_balance(std::vector<uint64_t> balances) {
    if (balances.empty()) return 0;
    std::sort(balances.begin(), balances.end());
    const size_t mid = balances.size() / 2;
    if (balances.size() % 2) return balances[mid];
    const uint64_t lo = balances[mid - 1], hi = balances[mid];
    return lo + (hi - lo) / 2;
}

LedgerError ReserveLedger::submit_attestation(const AuthorizationContext& auth, const std::string& custodian_id,
                                              uint64_t balance, uint64_t timestamp, const SystemParams& params,
                                              CustodianRegistry& registry, uint64_t now, EventLog& ev) {
    if (!auth.has(Role::ATTESTER)) return reject(LedgerError::UNAUTHORIZED);
    const Custodian* c = registry.find(custodian_id);
    if (!c) return reject(LedgerError::UNKNOWN_CUSTODIAN);
    if (timestamp > now) return reject(LedgerError::FUTURE_TIMESTAMP);
    if (now - timestamp > params.max_attestation_age) return reject(LedgerError::TIMESTAMP_TOO_OLD);

    const Attestation* cur = current(custodian_id);
    if (cur && timestamp < cur->timestamp) return reject(LedgerError::NON_MONOTONIC_TIMESTAMP);

    auto& pend = pending_[custodian_id];
    auto prev = pend.find(auth.caller());
    if (prev != pend.end() && timestamp < prev->second.timestamp) return reject(LedgerError::NON_MONOTONIC_TIMESTAMP);

    Attestation a;
    a.custodian_id = custodian_id;
    a.balance = balance;
    a.timestamp = timestamp;
    a.attester = auth.caller();
    a.recorded_at = now;
    pend[auth.caller()] = a;

    ev.emit(EventType::ATTESTATION_RECORDED, now, custodian_id,
            "balance=" + std::to_string(balance) + " timestamp=" + std::to_string(timestamp)
            + " attester=" + auth.caller());
    log_info(LogCategory::LEDGER, "ledger: " + custodian_id + " attested " + std::to_string(balance)
             + " sat at " + std::to_string(timestamp) + " by " + auth.caller());

    expire_pending(custodian_id, now, params);
    if (pend.size() < params.reserve_consensus_threshold) {
        QCB_LOG_DEBUG(LogCategory::LEDGER, "ledger: " + custodian_id + " has " + std::to_string(pend.size()) + " of "
                      + std::to_string(params.reserve_consensus_threshold) + " attestations");
        return LedgerError::OK;
    }

    // The oldest report dates the consensus balance.
    std::vector<uint64_t> balances;
    Attestation agreed = a;
    for (const auto& kv : pend) {
        balances.push_back(kv.second.balance);
        agreed.timestamp = std::min(agreed.timestamp, kv.second.timestamp);
    }
    if (cur) agreed.timestamp = std::max(agreed.timestamp, cur->timestamp);
    agreed.balance = median_balance(balances);
    agreed.reports = static_cast<uint32_t>(pend.size());
    pend.clear();
    history_[custodian_id].push_back(agreed);

    ev.emit(EventType::RESERVE_CONSENSUS_REACHED, now, custodian_id,
            "balance=" + std::to_string(agreed.balance) + " attestations=" + std::to_string(agreed.reports));
    log_info(LogCategory::LEDGER, "ledger: " + custodian_id + " reserve balance " + std::to_string(agreed.balance)
             + " sat from " + std::to_string(agreed.reports) + " attestations");

    if (c->minted_amount > agreed.balance && c->status == CustodianStatus::ACTIVE) {
        log_warn(LogCategory::LEDGER, "ledger: " + custodian_id + " undercollateralized, minted="
                 + std::to_string(c->minted_amount) + " balance=" + std::to_string(agreed.balance));
        const RegistryError re = registry.set_status(custodian_id, CustodianStatus::UNDER_REVIEW,
                                                     "undercollateralized", StatusSource::AUTOMATIC, now, ev);
        if (re != RegistryError::OK) {
            log_error(LogCategory::LEDGER, std::string("ledger: status trigger failed: ") + registry_error_str(re));
        }
    }
    return LedgerError::OK;
}

void ReserveLedger::expire_pending(const std::string& custodian_id, uint64_t now, const SystemParams& params) {
    auto it = pending_.find(custodian_id);
    if (it == pending_.end()) return;
    for (auto p = it->second.begin(); p != it->second.end();) {
        if (now > p->second.timestamp && now - p->second.timestamp > params.max_attestation_age) {
            QCB_LOG_DEBUG(LogCategory::LEDGER, "ledger: dropping expired attestation from " + p->first
                          + " for " + custodian_id);
            p = it->second.erase(p);
        } else {
            ++p;
        }
    }
}

const Attestation* ReserveLedger::current(const std::string& custodian_id) const {
    auto it = history_.find(custodian_id);
    if (it == history_.end() || it->second.empty()) return nullptr;
    return &it->second.back();
}

const std::map<ActorId, Attestation>& ReserveLedger::pending(const std::string& custodian_id) const {
    static const std::map<ActorId, Attestation> empty;
    auto it = pending_.find(custodian_id);
    return it == pending_.end() ? empty : it->second;
}

const std::vector<Attestation>& ReserveLedger::history(const std::string& custodian_id) const {
    static const std::vector<Attestation> empty;
    auto it = history_.find(custodian_id);
    return it == history_.end() ? empty : it->second;
}

bool ReserveLedger::is_stale(const std::string& custodian_id, uint64_t now, const SystemParams& params) const {
    const Attestation* a = current(custodian_id);
    if (!a) return true;
    if (now < a->timestamp) return false;
    return now - a->timestamp > params.stale_threshold;
}

uint64_t ReserveLedger::attested_balance(const std::string& custodian_id) const {
    const Attestation* a = current(custodian_id);
    return a ? a->balance : 0;
}

uint64_t ReserveLedger::available_capacity(const Custodian& c) const {
    const uint64_t backed = std::min(c.max_minting_cap, attested_balance(c.id));
    return backed > c.minted_amount ? backed - c.minted_amount : 0;
}

}  // namespace qcb
