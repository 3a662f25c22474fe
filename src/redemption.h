#pragma once
// =============================================================================
// Redemption lifecycle: Pending -> {Fulfilled, TimedOut, Defaulted}.
//
// Initiation burns the redeemer's tokens and escrows the amount against the
// custodian. A fulfillment proof releases the escrow and lowers the
// custodian's minted amount; a default moves the escrow into the
// custodian's defaulted total. TimedOut may still be resolved to Defaulted;
// every other terminal state is final. Expiry is never automatic: it is an
// explicit call compared against the stored deadline.
// =============================================================================
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "address.h"
#include "auth.h"
#include "events.h"
#include "params.h"
#include "spv.h"

namespace qcb {

class CustodianRegistry;
class TokenBank;

enum class RedemptionStatus : uint8_t {
    PENDING = 0,
    FULFILLED = 1,
    DEFAULTED = 2,
    TIMED_OUT = 3
};

const char* redemption_status_str(RedemptionStatus s);

enum class RedemptionError {
    OK = 0,
    UNAUTHORIZED,
    PAUSED,
    UNKNOWN_CUSTODIAN,
    CUSTODIAN_NOT_ACTIVE,
    AMOUNT_OUT_OF_RANGE,
    INSUFFICIENT_MINTED,
    INSUFFICIENT_BALANCE,
    INVALID_ADDRESS,
    UNKNOWN_REDEMPTION,
    WRONG_STATUS,
    DEADLINE_PASSED,
    NOT_TIMED_OUT,
    ADDRESS_MISMATCH,
    AMOUNT_BELOW_TOLERANCE,
    PROOF_INVALID,
    PAYMENT_MISMATCH,
    PAYMENT_ALREADY_USED
};

const char* redemption_error_str(RedemptionError e);

using RedemptionId = Bytes;   // 32 bytes

struct Redemption {
    RedemptionId     id;
    ActorId          requester;
    std::string      custodian_id;
    uint64_t         amount{0};          // satoshis
    std::string      destination;        // address as given
    DecodedAddress   dest;
    uint64_t         nonce{0};
    RedemptionStatus status{RedemptionStatus::PENDING};
    uint64_t         created_at{0};
    uint64_t         deadline{0};
    uint64_t         resolved_at{0};
    uint64_t         paid_amount{0};
    Bytes            payment_txid;
    std::string      default_reason;
};

// sha256(len||requester || len||custodian || u64 amount || u64 nonce)
RedemptionId redemption_id(const ActorId& requester, const std::string& custodian_id,
                           uint64_t amount, uint64_t nonce);

// Smallest payment accepted for `amount`: the tolerance amount * bps / 10000
// is rounded down, so the redeemer never loses a fractional satoshi.
uint64_t min_acceptable_payment(uint64_t amount, uint64_t fee_tolerance_bps);

class RedemptionManager {
public:
    RedemptionError initiate(const AuthorizationContext& auth, const std::string& custodian_id,
                             uint64_t amount, const std::string& destination, const SystemState& sys,
                             CustodianRegistry& registry, TokenBank& bank, uint64_t now,
                             RedemptionId& id_out, EventLog& ev);

    // claimed_address must name the redemption's destination; some output
    // of the proved transaction must pay that script at least
    // claimed_amount, which in turn must cover the requested amount minus
    // the fee tolerance.
    RedemptionError record_fulfillment(const AuthorizationContext& auth, const RedemptionId& id,
                                       const std::string& claimed_address, uint64_t claimed_amount,
                                       const Bytes& raw_tx, const SpvProof& proof, const SpvVerifier& verifier,
                                       const SystemState& sys, CustodianRegistry& registry, uint64_t now,
                                       EventLog& ev, VerifiedTx* verified = nullptr,
                                       SpvError* spv_err = nullptr);

    // Anyone, once now > deadline.
    RedemptionError expire(const RedemptionId& id, uint64_t now, EventLog& ev);

    // Arbiter path; Pending or TimedOut -> Defaulted.
    RedemptionError flag_default(const AuthorizationContext& auth, const RedemptionId& id,
                                 const std::string& reason, CustodianRegistry& registry, uint64_t now,
                                 EventLog& ev);

    // Consensus path; same transition without a role check.
    RedemptionError force_default(const RedemptionId& id, const std::string& reason,
                                  CustodianRegistry& registry, uint64_t now, EventLog& ev);

    bool is_timed_out(const RedemptionId& id, uint64_t now) const;
    const Redemption* get(const RedemptionId& id) const;
    std::vector<RedemptionId> pending_for(const std::string& custodian_id) const;
    bool payment_used(const Bytes& txid) const { return used_payments_.count(txid) != 0; }

private:
    void set_status(Redemption& r, RedemptionStatus to, uint64_t now, EventLog& ev, const std::string& note);

    std::map<RedemptionId, Redemption> redemptions_;
    std::set<Bytes> used_payments_;   // txids that already fulfilled a redemption
    uint64_t next_nonce_{0};
};

}  // namespace qcb
