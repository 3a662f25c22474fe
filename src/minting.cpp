#include "minting.h"
#include "custodian_registry.h"
#include "log.h"
#include "reserve_ledger.h"
#include "token_bank.h"

namespace qcb {

const char* mint_error_str(MintError e) {
    switch (e) {
        case MintError::OK:                    return "ok";
        case MintError::UNAUTHORIZED:          return "unauthorized";
        case MintError::PAUSED:                return "paused";
        case MintError::UNKNOWN_CUSTODIAN:     return "unknown_custodian";
        case MintError::CUSTODIAN_NOT_ACTIVE:  return "custodian_not_active";
        case MintError::STALE_ATTESTATION:     return "stale_attestation";
        case MintError::AMOUNT_OUT_OF_RANGE:   return "amount_out_of_range";
        case MintError::INSUFFICIENT_CAPACITY: return "insufficient_capacity";
        case MintError::BANK_REJECTED:         return "bank_rejected";
    }
    return "unknown";
}

static MintError reject(MintError e) {
    QCB_LOG_DEBUG(LogCategory::LEDGER, std::string("mint: rejected: ") + mint_error_str(e));
    return e;
}

MintError mint(const AuthorizationContext& auth, const std::string& custodian_id, const ActorId& recipient,
               uint64_t amount, const SystemState& sys, CustodianRegistry& registry,
               const ReserveLedger& ledger, TokenBank& bank, uint64_t now, EventLog& ev) {
    if (!auth.has(Role::MINTER)) return reject(MintError::UNAUTHORIZED);
    if (sys.pauses.minting) return reject(MintError::PAUSED);

    Custodian* c = registry.find_mut(custodian_id);
    if (!c) return reject(MintError::UNKNOWN_CUSTODIAN);
    if (c->status != CustodianStatus::ACTIVE) return reject(MintError::CUSTODIAN_NOT_ACTIVE);
    if (ledger.is_stale(custodian_id, now, sys.params)) return reject(MintError::STALE_ATTESTATION);
    if (amount < sys.params.min_mint_amount || amount > sys.params.max_mint_amount)
        return reject(MintError::AMOUNT_OUT_OF_RANGE);
    if (amount > ledger.available_capacity(*c)) return reject(MintError::INSUFFICIENT_CAPACITY);

    std::string err;
    if (!bank.credit(recipient, amount, &err)) {
        log_warn(LogCategory::LEDGER, "mint: bank rejected credit to " + recipient + ": " + err);
        return MintError::BANK_REJECTED;
    }

    c->minted_amount += amount;
    ev.emit(EventType::MINTED, now, custodian_id,
            "recipient=" + recipient + " amount=" + std::to_string(amount)
            + " minted=" + std::to_string(c->minted_amount));
    log_info(LogCategory::LEDGER, "mint: " + std::to_string(amount) + " sat against " + custodian_id
             + " to " + recipient);
    return MintError::OK;
}

}  // namespace qcb
