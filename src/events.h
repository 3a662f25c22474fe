#pragma once
// Observable side effects of committed operations.
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "serialize.h"

namespace qcb {

enum class EventType : uint8_t {
    ATTESTATION_RECORDED = 1,
    CUSTODIAN_REGISTERED,
    STATUS_CHANGED,
    WALLET_BINDING_REQUESTED,
    WALLET_BOUND,
    WALLET_DEREGISTERED,
    MINTED,
    REDEMPTION_INITIATED,
    REDEMPTION_STATE_CHANGED,
    PROPOSAL_CREATED,
    VOTE_CAST,
    PROPOSAL_EXECUTED,
    PROPOSAL_EXPIRED,
    PAUSE_CHANGED,
    PARAMETER_CHANGED,
    ROLE_CHANGED,
    VOTER_SET_CHANGED,
    THRESHOLD_CHANGED,
    VIOLATION_ENFORCED,
    EPOCH_ADVANCED,
    RESERVE_CONSENSUS_REACHED
};

const char* event_type_str(EventType t);

struct Event {
    EventType   type{EventType::ATTESTATION_RECORDED};
    uint64_t    time{0};
    std::string subject;   // custodian id, redemption id (hex), proposal id ...
    std::string detail;    // short human readable "k=v k=v" text
};

Bytes serialize_event(const Event& e);
ParseError parse_event(const Bytes& b, Event& out);

// One accepted SPV proof, kept for audit.
struct SpvAuditRecord {
    std::string purpose;          // "redemption" or "wallet_binding"
    std::string subject;
    Bytes       txid;
    Bytes       block_hash;
    uint32_t    confirmations{0};
    std::string accumulated_work; // hex
    uint64_t    time{0};
};

Bytes serialize_spv_audit(const SpvAuditRecord& r);
ParseError parse_spv_audit(const Bytes& b, SpvAuditRecord& out);

using EventListener = std::function<void(const Event&)>;

// Events staged by one operation; published only if it commits.
class EventLog {
public:
    void emit(EventType t, uint64_t time, std::string subject, std::string detail = {});
    void add_proof(SpvAuditRecord r) { proofs_.push_back(std::move(r)); }

    const std::vector<Event>& events() const { return events_; }
    const std::vector<SpvAuditRecord>& proofs() const { return proofs_; }
    bool empty() const { return events_.empty() && proofs_.empty(); }

private:
    std::vector<Event> events_;
    std::vector<SpvAuditRecord> proofs_;
};

// Durable destination for committed EventLogs.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual bool append(const EventLog& log, std::string* err) = 0;
};

}  // namespace qcb
