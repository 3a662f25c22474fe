#pragma once
#include <cstdint>
#include <string>
#include "auth.h"
#include "events.h"
#include "params.h"

namespace qcb {

class CustodianRegistry;
class ReserveLedger;
class TokenBank;

enum class MintError {
    OK = 0,
    UNAUTHORIZED,
    PAUSED,
    UNKNOWN_CUSTODIAN,
    CUSTODIAN_NOT_ACTIVE,
    STALE_ATTESTATION,
    AMOUNT_OUT_OF_RANGE,
    INSUFFICIENT_CAPACITY,
    BANK_REJECTED
};

const char* mint_error_str(MintError e);

// Mint `amount` against the custodian's attested reserves and credit it to
// `recipient`. The bank is called last; on any failure neither the
// custodian nor the bank has changed.
MintError mint(const AuthorizationContext& auth, const std::string& custodian_id, const ActorId& recipient,
               uint64_t amount, const SystemState& sys, CustodianRegistry& registry,
               const ReserveLedger& ledger, TokenBank& bank, uint64_t now, EventLog& ev);

}  // namespace qcb
