#include "events.h"

namespace qcb {

const char* event_type_str(EventType t) {
    switch (t) {
        case EventType::ATTESTATION_RECORDED:     return "attestation_recorded";
        case EventType::CUSTODIAN_REGISTERED:     return "custodian_registered";
        case EventType::STATUS_CHANGED:           return "status_changed";
        case EventType::WALLET_BINDING_REQUESTED: return "wallet_binding_requested";
        case EventType::WALLET_BOUND:             return "wallet_bound";
        case EventType::WALLET_DEREGISTERED:      return "wallet_deregistered";
        case EventType::MINTED:                   return "minted";
        case EventType::REDEMPTION_INITIATED:     return "redemption_initiated";
        case EventType::REDEMPTION_STATE_CHANGED: return "redemption_state_changed";
        case EventType::PROPOSAL_CREATED:         return "proposal_created";
        case EventType::VOTE_CAST:                return "vote_cast";
        case EventType::PROPOSAL_EXECUTED:        return "proposal_executed";
        case EventType::PROPOSAL_EXPIRED:         return "proposal_expired";
        case EventType::PAUSE_CHANGED:            return "pause_changed";
        case EventType::PARAMETER_CHANGED:        return "parameter_changed";
        case EventType::ROLE_CHANGED:             return "role_changed";
        case EventType::VOTER_SET_CHANGED:        return "voter_set_changed";
        case EventType::THRESHOLD_CHANGED:        return "threshold_changed";
        case EventType::VIOLATION_ENFORCED:       return "violation_enforced";
        case EventType::EPOCH_ADVANCED:           return "epoch_advanced";
        case EventType::RESERVE_CONSENSUS_REACHED: return "reserve_consensus_reached";
    }
    return "unknown";
}

void EventLog::emit(EventType t, uint64_t time, std::string subject, std::string detail) {
    Event e;
    e.type = t;
    e.time = time;
    e.subject = std::move(subject);
    e.detail = std::move(detail);
    events_.push_back(std::move(e));
}

// u8 type | u64 time | str subject | str detail
Bytes serialize_event(const Event& e) {
    Bytes b;
    b.push_back(static_cast<uint8_t>(e.type));
    put_u64_le(b, e.time);
    put_string(b, e.subject);
    put_string(b, e.detail);
    return b;
}

ParseError parse_event(const Bytes& b, Event& out) {
    ByteCursor cur(b);
    Event e;
    uint8_t t = 0;
    ParseError pe;
    if ((pe = cur.read_u8(t)) != ParseError::OK) return pe;
    if (t < static_cast<uint8_t>(EventType::ATTESTATION_RECORDED) ||
        t > static_cast<uint8_t>(EventType::RESERVE_CONSENSUS_REACHED)) {
        return ParseError::BAD_SCRIPT;
    }
    e.type = static_cast<EventType>(t);
    if ((pe = cur.read_u64_le(e.time)) != ParseError::OK) return pe;
    if ((pe = cur.read_string(e.subject)) != ParseError::OK) return pe;
    if ((pe = cur.read_string(e.detail)) != ParseError::OK) return pe;
    if (!cur.at_end()) return ParseError::TRAILING_BYTES;
    out = std::move(e);
    return ParseError::OK;
}

// str purpose | str subject | varbytes txid | varbytes block | u32 confs | str work | u64 time
Bytes serialize_spv_audit(const SpvAuditRecord& r) {
    Bytes b;
    put_string(b, r.purpose);
    put_string(b, r.subject);
    put_varbytes(b, r.txid);
    put_varbytes(b, r.block_hash);
    put_u32_le(b, r.confirmations);
    put_string(b, r.accumulated_work);
    put_u64_le(b, r.time);
    return b;
}

ParseError parse_spv_audit(const Bytes& b, SpvAuditRecord& out) {
    ByteCursor cur(b);
    SpvAuditRecord r;
    ParseError pe;
    if ((pe = cur.read_string(r.purpose)) != ParseError::OK) return pe;
    if ((pe = cur.read_string(r.subject)) != ParseError::OK) return pe;
    if ((pe = cur.read_varbytes(r.txid)) != ParseError::OK) return pe;
    if ((pe = cur.read_varbytes(r.block_hash)) != ParseError::OK) return pe;
    if ((pe = cur.read_u32_le(r.confirmations)) != ParseError::OK) return pe;
    if ((pe = cur.read_string(r.accumulated_work)) != ParseError::OK) return pe;
    if ((pe = cur.read_u64_le(r.time)) != ParseError::OK) return pe;
    if (!cur.at_end()) return ParseError::TRAILING_BYTES;
    out = std::move(r);
    return ParseError::OK;
}

}  // namespace qcb
