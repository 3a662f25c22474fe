#include "enforcement.h"
#include "custodian_registry.h"
#include "log.h"
#include "reserve_ledger.h"

namespace qcb {

const char* violation_reason_str(ViolationReason r) {
    switch (r) {
        case ViolationReason::INSUFFICIENT_RESERVES: return "INSUFFICIENT_RESERVES";
        case ViolationReason::STALE_ATTESTATIONS:    return "STALE_ATTESTATIONS";
    }
    return "UNKNOWN";
}

bool parse_violation_reason(const std::string& s, ViolationReason& out) {
    if (s == "INSUFFICIENT_RESERVES") out = ViolationReason::INSUFFICIENT_RESERVES;
    else if (s == "STALE_ATTESTATIONS") out = ViolationReason::STALE_ATTESTATIONS;
    else return false;
    return true;
}

const char* enforcement_error_str(EnforcementError e) {
    switch (e) {
        case EnforcementError::OK:                   return "ok";
        case EnforcementError::UNKNOWN_CUSTODIAN:    return "unknown_custodian";
        case EnforcementError::CUSTODIAN_NOT_ACTIVE: return "custodian_not_active";
        case EnforcementError::VIOLATION_NOT_FOUND:  return "violation_not_found";
    }
    return "unknown";
}

bool check_violation(const std::string& custodian_id, ViolationReason reason, const CustodianRegistry& registry,
                     const ReserveLedger& ledger, const SystemParams& params, uint64_t now) {
    const Custodian* c = registry.find(custodian_id);
    if (!c) return false;
    switch (reason) {
        case ViolationReason::INSUFFICIENT_RESERVES:
            return ledger.attested_balance(custodian_id) < c->minted_amount;
        case ViolationReason::STALE_ATTESTATIONS:
            return ledger.is_stale(custodian_id, now, params);
    }
    return false;
}

std::vector<std::string> batch_check_violations(const std::vector<std::string>& ids, ViolationReason reason,
                                                const CustodianRegistry& registry, const ReserveLedger& ledger,
                                                const SystemParams& params, uint64_t now) {
    std::vector<std::string> out;
    for (const auto& id : ids) {
        if (check_violation(id, reason, registry, ledger, params, now)) out.push_back(id);
    }
    return out;
}

EnforcementError enforce_objective_violation(const std::string& reporter, const std::string& custodian_id,
                                             ViolationReason reason, CustodianRegistry& registry,
                                             const ReserveLedger& ledger, const SystemParams& params,
                                             uint64_t now, EventLog& ev) {
    const Custodian* c = registry.find(custodian_id);
    if (!c) return EnforcementError::UNKNOWN_CUSTODIAN;
    if (c->status != CustodianStatus::ACTIVE) return EnforcementError::CUSTODIAN_NOT_ACTIVE;
    if (!check_violation(custodian_id, reason, registry, ledger, params, now)) {
        QCB_LOG_DEBUG(LogCategory::REGISTRY, std::string("enforce: ") + violation_reason_str(reason)
                      + " does not hold for " + custodian_id);
        return EnforcementError::VIOLATION_NOT_FOUND;
    }

    const RegistryError re = registry.set_status(custodian_id, CustodianStatus::UNDER_REVIEW,
                                                 violation_reason_str(reason), StatusSource::AUTOMATIC, now, ev);
    if (re != RegistryError::OK) {
        log_error(LogCategory::REGISTRY, std::string("enforce: status change failed: ") + registry_error_str(re));
        return EnforcementError::CUSTODIAN_NOT_ACTIVE;
    }
    ev.emit(EventType::VIOLATION_ENFORCED, now, custodian_id,
            std::string("reason=") + violation_reason_str(reason) + " reporter=" + reporter);
    log_warn(LogCategory::REGISTRY, std::string("enforce: ") + violation_reason_str(reason) + " on "
             + custodian_id + " reported by " + reporter);
    return EnforcementError::OK;
}

}  // namespace qcb
