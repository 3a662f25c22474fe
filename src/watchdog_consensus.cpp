#include "watchdog_consensus.h"
#include "log.h"

namespace qcb {

const char* proposal_type_str(ProposalType t) {
    switch (t) {
        case ProposalType::STATUS_CHANGE:         return "status_change";
        case ProposalType::REDEMPTION_DEFAULT:    return "redemption_default";
        case ProposalType::FORCE_INTERVENTION:    return "force_intervention";
        case ProposalType::PARAMETER_CHANGE:      return "parameter_change";
        case ProposalType::WALLET_DEREGISTRATION: return "wallet_deregistration";
    }
    return "unknown";
}

bool parse_proposal_type(const std::string& s, ProposalType& out) {
    for (size_t i = 0; i < PROPOSAL_TYPE_COUNT; ++i) {
        const ProposalType t = static_cast<ProposalType>(i);
        if (s == proposal_type_str(t)) {
            out = t;
            return true;
        }
    }
    return false;
}

const char* consensus_error_str(ConsensusError e) {
    switch (e) {
        case ConsensusError::OK:                return "ok";
        case ConsensusError::UNAUTHORIZED:      return "unauthorized";
        case ConsensusError::UNKNOWN_VOTER:     return "unknown_voter";
        case ConsensusError::UNKNOWN_PROPOSAL:  return "unknown_proposal";
        case ConsensusError::ALREADY_VOTED:     return "already_voted";
        case ConsensusError::VOTING_ENDED:      return "voting_ended";
        case ConsensusError::ALREADY_EXECUTED:  return "already_executed";
        case ConsensusError::PROPOSAL_EXPIRED:  return "proposal_expired";
        case ConsensusError::INVALID_PAYLOAD:   return "invalid_payload";
        case ConsensusError::INVALID_THRESHOLD: return "invalid_threshold";
        case ConsensusError::VOTER_EXISTS:      return "voter_exists";
        case ConsensusError::EXECUTION_FAILED:  return "execution_failed";
    }
    return "unknown";
}

static ConsensusError reject(const char* op, ConsensusError e) {
    QCB_LOG_DEBUG(LogCategory::CONSENSUS, std::string("consensus: ") + op + " rejected: " + consensus_error_str(e));
    return e;
}

static void emit_vote(const Proposal& p, const ActorId& voter, bool in_favor, uint64_t now, EventLog& ev) {
    ev.emit(EventType::VOTE_CAST, now, std::to_string(p.id),
            "voter=" + voter + " in_favor=" + (in_favor ? "1" : "0")
            + " yes=" + std::to_string(p.yes_votes) + " no=" + std::to_string(p.no_votes));
}

WatchdogConsensus::WatchdogConsensus() {
    for (auto& t : thresholds_) t = DEFAULT_THRESHOLD;
}

ConsensusError WatchdogConsensus::add_voter(const AuthorizationContext& auth, const ActorId& voter,
                                            uint64_t now, EventLog& ev) {
    if (!auth.has(Role::ADMIN)) return reject("add_voter", ConsensusError::UNAUTHORIZED);
    if (voter.empty()) return reject("add_voter", ConsensusError::UNKNOWN_VOTER);
    if (!voters_.insert(voter).second) return reject("add_voter", ConsensusError::VOTER_EXISTS);
    ev.emit(EventType::VOTER_SET_CHANGED, now, voter, "added=1 voters=" + std::to_string(voters_.size()));
    log_info(LogCategory::CONSENSUS, "consensus: voter " + voter + " added");
    return ConsensusError::OK;
}

ConsensusError WatchdogConsensus::remove_voter(const AuthorizationContext& auth, const ActorId& voter,
                                               uint64_t now, EventLog& ev) {
    if (!auth.has(Role::ADMIN)) return reject("remove_voter", ConsensusError::UNAUTHORIZED);
    if (voters_.erase(voter) == 0) return reject("remove_voter", ConsensusError::UNKNOWN_VOTER);
    ev.emit(EventType::VOTER_SET_CHANGED, now, voter, "added=0 voters=" + std::to_string(voters_.size()));
    log_info(LogCategory::CONSENSUS, "consensus: voter " + voter + " removed");
    return ConsensusError::OK;
}

ConsensusError WatchdogConsensus::set_threshold(const AuthorizationContext& auth, ProposalType type, uint32_t m,
                                                uint64_t now, EventLog& ev) {
    if (!auth.has(Role::ADMIN)) return reject("set_threshold", ConsensusError::UNAUTHORIZED);
    if (m < MIN_THRESHOLD || m > MAX_THRESHOLD) return reject("set_threshold", ConsensusError::INVALID_THRESHOLD);
    thresholds_[static_cast<size_t>(type)] = m;
    ev.emit(EventType::THRESHOLD_CHANGED, now, proposal_type_str(type), "threshold=" + std::to_string(m));
    log_info(LogCategory::CONSENSUS, std::string("consensus: threshold for ") + proposal_type_str(type)
             + " set to " + std::to_string(m));
    if (m > voters_.size()) {
        log_warn(LogCategory::CONSENSUS, "consensus: threshold " + std::to_string(m) + " exceeds voter count "
                 + std::to_string(voters_.size()));
    }
    return ConsensusError::OK;
}

ConsensusError WatchdogConsensus::propose(const AuthorizationContext& auth, ProposalType type, const Bytes& payload,
                                          const std::string& justification, uint64_t voting_period,
                                          const ProposalExecutor& exec, uint64_t now, uint64_t& id_out,
                                          EventLog& ev) {
    if (!is_voter(auth.caller())) return reject("propose", ConsensusError::UNKNOWN_VOTER);
    std::string err;
    if (!exec.validate(type, payload, &err)) {
        QCB_LOG_DEBUG(LogCategory::CONSENSUS, "consensus: bad payload: " + err);
        return reject("propose", ConsensusError::INVALID_PAYLOAD);
    }

    Proposal p;
    p.id = next_id_++;
    p.type = type;
    p.payload = payload;
    p.justification = justification;
    p.proposer = auth.caller();
    p.threshold = threshold(type);
    p.created_at = now;
    p.deadline = now + voting_period;
    p.votes[auth.caller()] = true;
    p.yes_votes = 1;
    id_out = p.id;

    ev.emit(EventType::PROPOSAL_CREATED, now, std::to_string(p.id),
            std::string("type=") + proposal_type_str(type) + " proposer=" + p.proposer
            + " threshold=" + std::to_string(p.threshold) + " deadline=" + std::to_string(p.deadline));
    log_info(LogCategory::CONSENSUS, "consensus: proposal " + std::to_string(p.id) + " ("
             + proposal_type_str(type) + ") by " + p.proposer + ": " + justification);
    proposals_.emplace(p.id, std::move(p));
    return ConsensusError::OK;
}

ConsensusError WatchdogConsensus::vote(const AuthorizationContext& auth, uint64_t id, bool in_favor,
                                       ProposalExecutor& exec, uint64_t now, bool& executed, EventLog& ev) {
    executed = false;
    if (!is_voter(auth.caller())) return reject("vote", ConsensusError::UNKNOWN_VOTER);
    auto it = proposals_.find(id);
    if (it == proposals_.end()) return reject("vote", ConsensusError::UNKNOWN_PROPOSAL);
    Proposal& p = it->second;

    if (p.executed) return reject("vote", ConsensusError::ALREADY_EXECUTED);
    if (p.expired) return reject("vote", ConsensusError::PROPOSAL_EXPIRED);
    if (now > p.deadline) return reject("vote", ConsensusError::VOTING_ENDED);
    if (p.votes.count(auth.caller())) return reject("vote", ConsensusError::ALREADY_VOTED);

    const bool deciding = in_favor && p.yes_votes + 1 == p.threshold;
    if (deciding) {
        // The proposal is executed against the tally including this vote.
        Proposal tally = p;
        tally.votes[auth.caller()] = true;
        ++tally.yes_votes;
        EventLog staged;
        std::string err;
        if (!exec.execute(tally, now, staged, &err)) {
            log_warn(LogCategory::CONSENSUS, "consensus: proposal " + std::to_string(id) + " execution failed: " + err);
            return ConsensusError::EXECUTION_FAILED;
        }
        p = std::move(tally);
        p.executed = true;
        p.executed_at = now;
        executed = true;
        emit_vote(p, auth.caller(), true, now, ev);
        for (const auto& e : staged.events()) ev.emit(e.type, e.time, e.subject, e.detail);
        ev.emit(EventType::PROPOSAL_EXECUTED, now, std::to_string(id),
                std::string("type=") + proposal_type_str(p.type) + " yes=" + std::to_string(p.yes_votes));
        log_info(LogCategory::CONSENSUS, "consensus: proposal " + std::to_string(id) + " executed");
        return ConsensusError::OK;
    }

    p.votes[auth.caller()] = in_favor;
    if (in_favor) ++p.yes_votes;
    else ++p.no_votes;
    emit_vote(p, auth.caller(), in_favor, now, ev);
    return ConsensusError::OK;
}

bool WatchdogConsensus::can_vote(uint64_t id, const ActorId& voter, uint64_t now) const {
    if (!is_voter(voter)) return false;
    const Proposal* p = get(id);
    if (!p || p->executed || p->expired || now > p->deadline) return false;
    return p->votes.count(voter) == 0;
}

size_t WatchdogConsensus::cleanup_expired(const std::vector<uint64_t>& ids, uint64_t now, EventLog& ev) {
    size_t n = 0;
    for (uint64_t id : ids) {
        auto it = proposals_.find(id);
        if (it == proposals_.end()) continue;
        Proposal& p = it->second;
        if (p.executed || p.expired || now <= p.deadline) continue;
        p.expired = true;
        ++n;
        ev.emit(EventType::PROPOSAL_EXPIRED, now, std::to_string(id),
                "yes=" + std::to_string(p.yes_votes) + " threshold=" + std::to_string(p.threshold));
        log_info(LogCategory::CONSENSUS, "consensus: proposal " + std::to_string(id) + " expired");
    }
    return n;
}

const Proposal* WatchdogConsensus::get(uint64_t id) const {
    auto it = proposals_.find(id);
    return it == proposals_.end() ? nullptr : &it->second;
}

}  // namespace qcb
