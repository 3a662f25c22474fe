#pragma once
// =============================================================================
// M-of-N watchdog voting.
//
// The proposer's vote counts as the first "yes". Only positive votes move a
// proposal toward its threshold; negative votes are recorded and block
// nothing. The call that casts the deciding vote executes the proposal
// before it returns, so a proposal is either open, executed or expired,
// never "passed but pending". The threshold is captured when the proposal
// is created.
// =============================================================================
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "auth.h"
#include "events.h"
#include "serialize.h"

namespace qcb {

enum class ProposalType : uint8_t {
    STATUS_CHANGE = 0,
    REDEMPTION_DEFAULT = 1,
    FORCE_INTERVENTION = 2,
    PARAMETER_CHANGE = 3,
    WALLET_DEREGISTRATION = 4
};

constexpr size_t PROPOSAL_TYPE_COUNT = 5;

const char* proposal_type_str(ProposalType t);
bool parse_proposal_type(const std::string& s, ProposalType& out);

enum class ConsensusError {
    OK = 0,
    UNAUTHORIZED,
    UNKNOWN_VOTER,
    UNKNOWN_PROPOSAL,
    ALREADY_VOTED,
    VOTING_ENDED,
    ALREADY_EXECUTED,
    PROPOSAL_EXPIRED,
    INVALID_PAYLOAD,
    INVALID_THRESHOLD,
    VOTER_EXISTS,
    EXECUTION_FAILED
};

const char* consensus_error_str(ConsensusError e);

constexpr uint32_t MIN_THRESHOLD = 2;
constexpr uint32_t MAX_THRESHOLD = 7;
constexpr uint32_t DEFAULT_THRESHOLD = 2;

struct Proposal {
    uint64_t     id{0};
    ProposalType type{ProposalType::STATUS_CHANGE};
    Bytes        payload;
    std::string  justification;
    ActorId      proposer;
    uint32_t     threshold{DEFAULT_THRESHOLD};
    uint32_t     yes_votes{0};
    uint32_t     no_votes{0};
    uint64_t     created_at{0};
    uint64_t     deadline{0};
    uint64_t     executed_at{0};
    bool         executed{false};
    bool         expired{false};
    std::map<ActorId, bool> votes;   // voter -> in favor
};

// Applies an approved proposal. A false return fails the deciding vote.
class ProposalExecutor {
public:
    virtual ~ProposalExecutor() = default;
    virtual bool validate(ProposalType type, const Bytes& payload, std::string* err) const = 0;
    virtual bool execute(const Proposal& p, uint64_t now, EventLog& ev, std::string* err) = 0;
};

class WatchdogConsensus {
public:
    WatchdogConsensus();

    ConsensusError add_voter(const AuthorizationContext& auth, const ActorId& voter, uint64_t now, EventLog& ev);
    ConsensusError remove_voter(const AuthorizationContext& auth, const ActorId& voter, uint64_t now, EventLog& ev);
    // MIN_THRESHOLD..MAX_THRESHOLD. Open proposals keep their own value.
    ConsensusError set_threshold(const AuthorizationContext& auth, ProposalType type, uint32_t m,
                                 uint64_t now, EventLog& ev);

    ConsensusError propose(const AuthorizationContext& auth, ProposalType type, const Bytes& payload,
                           const std::string& justification, uint64_t voting_period,
                           const ProposalExecutor& exec, uint64_t now, uint64_t& id_out, EventLog& ev);

    // executed is true only on the call that reached the threshold.
    ConsensusError vote(const AuthorizationContext& auth, uint64_t id, bool in_favor, ProposalExecutor& exec,
                        uint64_t now, bool& executed, EventLog& ev);

    bool can_vote(uint64_t id, const ActorId& voter, uint64_t now) const;

    // Marks unexecuted proposals past their deadline as expired; returns how
    // many changed.
    size_t cleanup_expired(const std::vector<uint64_t>& ids, uint64_t now, EventLog& ev);

    bool is_voter(const ActorId& who) const { return voters_.count(who) != 0; }
    size_t voter_count() const { return voters_.size(); }
    uint32_t threshold(ProposalType t) const { return thresholds_[static_cast<size_t>(t)]; }
    const Proposal* get(uint64_t id) const;
    // Config load; bounds are checked by the caller.
    void init_threshold(ProposalType t, uint32_t m) { thresholds_[static_cast<size_t>(t)] = m; }

private:
    std::set<ActorId> voters_;
    uint32_t thresholds_[PROPOSAL_TYPE_COUNT];
    std::map<uint64_t, Proposal> proposals_;
    uint64_t next_id_{1};
};

}  // namespace qcb
