#pragma once
// Objective violations anyone may report. A violation that holds moves an
// Active custodian to UnderReview; anything subjective goes through
// WatchdogConsensus instead.
#include <cstdint>
#include <string>
#include <vector>
#include "events.h"
#include "params.h"

namespace qcb {

class CustodianRegistry;
class ReserveLedger;

enum class ViolationReason : uint8_t {
    INSUFFICIENT_RESERVES = 0,   // attested balance < minted amount
    STALE_ATTESTATIONS = 1       // no attestation within stale_threshold
};

const char* violation_reason_str(ViolationReason r);
bool parse_violation_reason(const std::string& s, ViolationReason& out);

enum class EnforcementError {
    OK = 0,
    UNKNOWN_CUSTODIAN,
    CUSTODIAN_NOT_ACTIVE,
    VIOLATION_NOT_FOUND
};

const char* enforcement_error_str(EnforcementError e);

bool check_violation(const std::string& custodian_id, ViolationReason reason, const CustodianRegistry& registry,
                     const ReserveLedger& ledger, const SystemParams& params, uint64_t now);

// Ids from `ids` whose violation currently holds.
std::vector<std::string> batch_check_violations(const std::vector<std::string>& ids, ViolationReason reason,
                                                const CustodianRegistry& registry, const ReserveLedger& ledger,
                                                const SystemParams& params, uint64_t now);

EnforcementError enforce_objective_violation(const std::string& reporter, const std::string& custodian_id,
                                             ViolationReason reason, CustodianRegistry& registry,
                                             const ReserveLedger& ledger, const SystemParams& params,
                                             uint64_t now, EventLog& ev);

}  // namespace qcb
