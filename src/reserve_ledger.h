#pragma once
// Reserve attestations and the minting capacity they back.
//
// Each attester holds at most one pending report per custodian. Once
// reserve_consensus_threshold fresh reports are pending, their median
// becomes the custodian's attested balance and the pending set is cleared.
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "auth.h"
#include "events.h"
#include "params.h"

namespace qcb {

class CustodianRegistry;
struct Custodian;

enum class LedgerError {
    OK = 0,
    UNAUTHORIZED,
    UNKNOWN_CUSTODIAN,
    FUTURE_TIMESTAMP,
    TIMESTAMP_TOO_OLD,
    NON_MONOTONIC_TIMESTAMP
};

const char* ledger_error_str(LedgerError e);

struct Attestation {
    std::string custodian_id;
    uint64_t    balance{0};      // satoshis
    uint64_t    timestamp{0};
    ActorId     attester;      // for a consensus record, the attester that completed it
    uint64_t    recorded_at{0};
    uint32_t    reports{1};    // pending reports the balance was taken from
    bool        valid{true};
};

// Median of the balances; the mean of the two middle values, rounded down,
// for an even count. Zero for an empty list.
uint64_t median_balance(std::vector<uint64_t> balances);

class ReserveLedger {
public:
    // Records the caller's pending report, replacing an earlier one from the
    // same attester. Reaching the threshold appends the median to the
    // custodian's history and advances its current pointer; if that balance
    // is below the custodian's minted amount an Active custodian is moved to
    // UnderReview in the same call.
    LedgerError submit_attestation(const AuthorizationContext& auth, const std::string& custodian_id,
                                   uint64_t balance, uint64_t timestamp, const SystemParams& params,
                                   CustodianRegistry& registry, uint64_t now, EventLog& ev);

    const Attestation* current(const std::string& custodian_id) const;
    // Reports still waiting for consensus, by attester.
    const std::map<ActorId, Attestation>& pending(const std::string& custodian_id) const;
    const std::vector<Attestation>& history(const std::string& custodian_id) const;

    // now - current.timestamp > stale_threshold. No attestation is stale.
    bool is_stale(const std::string& custodian_id, uint64_t now, const SystemParams& params) const;

    // min(max cap, attested balance) - minted, floored at zero.
    uint64_t available_capacity(const Custodian& c) const;

    // Attested balance, 0 without an attestation.
    uint64_t attested_balance(const std::string& custodian_id) const;

private:
    void expire_pending(const std::string& custodian_id, uint64_t now, const SystemParams& params);

    std::map<std::string, std::vector<Attestation>> history_;
    std::map<std::string, std::map<ActorId, Attestation>> pending_;
};

}  // namespace qcb
