// End-to-end flows through the Bridge: staged commit, publication and
// proposals executed by watchdog votes.
#include "address.h"
#include "bridge.h"
#include "proposal_payload.h"
#include "script.h"
#include "token_bank.h"
#include "test_util.h"
#include <cstdio>

using namespace qcb;

// Keeps every committed log; can be told to fail.
class RecordingSink : public EventSink {
public:
    bool append(const EventLog& log, std::string* err) override {
        if (fail) {
            if (err) *err = "disk full";
            return false;
        }
        logs.push_back(log);
        return true;
    }
    bool fail{false};
    std::vector<EventLog> logs;
};

int main(){
    BridgeConfig cfg;
    cfg.epoch_current_bits = qcbtest::EASY_BITS;
    cfg.epoch_previous_bits = qcbtest::EASY_BITS;
    std::string err;
    TEST_CHECK(validate_config(cfg, &err), "default config validates");

    ManualClock clock(1700000000);
    InMemoryTokenBank bank;
    Bridge b(cfg, "admin", clock, bank);
    RecordingSink sink;
    b.attach_journal(&sink);
    std::vector<Event> seen;
    b.subscribe([&](const Event& e) { seen.push_back(e); });

    // Administration.
    {
        TEST_CHECK(b.grant_role("mallory", "mallory", Role::ADMIN) == AdminError::UNAUTHORIZED, "non-admin grant");
        TEST_CHECK(seen.empty() && sink.logs.empty(), "rejections publish nothing");
        TEST_CHECK(b.grant_role("admin", "registrar", Role::REGISTRAR) == AdminError::OK, "grant registrar");
        TEST_CHECK(b.grant_role("admin", "registrar", Role::REGISTRAR) == AdminError::INVALID_ROLE_CHANGE,
                   "grant twice");
        TEST_CHECK(b.grant_role("admin", "attester", Role::ATTESTER) == AdminError::OK, "grant attester");
        TEST_CHECK(b.grant_role("admin", "minter", Role::MINTER) == AdminError::OK, "grant minter");
        TEST_CHECK(b.grant_role("admin", "arbiter", Role::ARBITER) == AdminError::OK, "grant arbiter");
        TEST_CHECK(b.grant_role("admin", "alice", Role::REDEEMER) == AdminError::OK, "grant redeemer");
        TEST_CHECK(b.revoke_role("admin", "admin", Role::ADMIN) == AdminError::INVALID_ROLE_CHANGE,
                   "admin keeps its own role");
        TEST_CHECK(b.revoke_role("admin", "alice", Role::MINTER) == AdminError::INVALID_ROLE_CHANGE,
                   "revoke a role never held");
        TEST_CHECK(seen.size() == 5 && seen[0].type == EventType::ROLE_CHANGED, "one event per grant");
        TEST_CHECK(sink.logs.size() == 5, "one journal append per commit");

        TEST_CHECK(b.set_parameter("admin", ParamKey::FEE_TOLERANCE_BPS, 10001) == AdminError::INVALID_PARAMETER,
                   "out of range parameter");
        TEST_CHECK(b.set_parameter("admin", ParamKey::PROOF_DIFFICULTY_FACTOR, 0) == AdminError::INVALID_PARAMETER,
                   "zero factor");
        TEST_CHECK(b.state().sys.params.proof_difficulty_factor == 6, "parameters untouched");
        TEST_CHECK(b.advance_epoch("admin", 0) == AdminError::INVALID_PARAMETER, "zero target");
        TEST_CHECK(b.pause("admin", PauseFlag::MINTING) == AdminError::OK, "pause");
        TEST_CHECK(b.pause("admin", PauseFlag::MINTING) == AdminError::ALREADY_PAUSED, "pause twice");
        TEST_CHECK(b.unpause("admin", PauseFlag::MINTING) == AdminError::OK, "unpause");
        TEST_CHECK(b.unpause("admin", PauseFlag::MINTING) == AdminError::NOT_PAUSED, "unpause twice");
        std::printf("  [PASS] administration\n");
    }

    // Custodian, reserves and mint.
    {
        TEST_CHECK(b.register_custodian("registrar", "qc1", 10000000) == RegistryError::OK, "register");
        TEST_CHECK(b.submit_attestation("attester", "qc1", 2000000, clock.now()) == LedgerError::OK, "attest");
        TEST_CHECK(b.available_capacity("qc1") == 2000000, "capacity");
        TEST_CHECK(!b.is_stale("qc1"), "fresh");
        TEST_CHECK(b.mint("minter", "qc1", "alice", 1000000) == MintError::OK, "mint");
        TEST_CHECK(bank.balance_of("alice") == 1000000, "alice credited");
        TEST_CHECK(b.available_capacity("qc1") == 1000000, "capacity consumed");
        std::printf("  [PASS] mint\n");
    }

    // A journal failure is logged; the committed state stays.
    {
        sink.fail = true;
        clock.advance(60);
        const size_t before = seen.size();
        TEST_CHECK(b.submit_attestation("attester", "qc1", 2000000, clock.now()) == LedgerError::OK,
                   "commit with failing journal");
        TEST_CHECK(seen.size() == before + 2, "listeners still notified");
        TEST_CHECK(b.state().ledger.history("qc1").size() == 2, "state committed");
        sink.fail = false;
        std::printf("  [PASS] journal failure\n");
    }

    // Redemption settled by an SPV-proved payment.
    const Bytes dest_hash(20, 0x6c);
    const std::string dest = encode_btc_address(ScriptType::P2WPKH, dest_hash);
    RedemptionId rid;
    {
        TEST_CHECK(b.initiate_redemption("alice", "qc1", 100000, dest, rid) == RedemptionError::OK, "initiate");
        TEST_CHECK(bank.balance_of("alice") == 900000, "burned");
        const Bytes raw = serialize_btc_tx(qcbtest::payment_tx(script_for_hash(ScriptType::P2WPKH, dest_hash), 100000));
        const SpvProof proof = qcbtest::prove(raw, 6);
        VerifiedTx vt;
        TEST_CHECK(b.verify_proof(raw, proof, vt) == SpvError::OK, "proof verifies");

        const size_t logs = sink.logs.size();
        SpvError se = SpvError::OK;
        TEST_CHECK(b.record_redemption_fulfillment("arbiter", rid, dest, 100000, raw, qcbtest::prove(raw, 1), &se)
                   == RedemptionError::PROOF_INVALID && se == SpvError::INSUFFICIENT_WORK, "weak proof");
        TEST_CHECK(sink.logs.size() == logs, "failed fulfillment not journaled");
        TEST_CHECK(b.record_redemption_fulfillment("arbiter", rid, dest, 100000, raw, proof) == RedemptionError::OK,
                   "fulfilled");
        TEST_CHECK(b.state().redemptions.get(rid)->status == RedemptionStatus::FULFILLED, "status");
        TEST_CHECK(sink.logs.back().proofs().size() == 1, "proof audited");
        TEST_CHECK(sink.logs.back().proofs()[0].purpose == "redemption", "audit purpose");
        TEST_CHECK(sink.logs.back().proofs()[0].txid == vt.txid, "audited txid");
        TEST_CHECK(b.state().registry.find("qc1")->minted_amount == 900000, "minted reduced");
        std::printf("  [PASS] redemption\n");
    }

    // Watchdog proposals execute against bridge state.
    uint64_t failed_pid = 0;
    {
        for (const char* w : {"w1", "w2", "w3"})
            TEST_CHECK(b.add_voter("admin", w) == ConsensusError::OK, "add voter");

        uint64_t pid = 0;
        bool executed = false;
        ParameterChangePayload bad;
        bad.key = ParamKey::FEE_TOLERANCE_BPS;
        bad.value = 20000;
        TEST_CHECK(b.propose("w1", ProposalType::PARAMETER_CHANGE, encode_payload(bad), "raise", pid)
                   == ConsensusError::INVALID_PAYLOAD, "invalid parameter rejected at creation");

        ParameterChangePayload pc;
        pc.key = ParamKey::FEE_TOLERANCE_BPS;
        pc.value = 50;
        TEST_CHECK(b.propose("w1", ProposalType::PARAMETER_CHANGE, encode_payload(pc), "fees", pid)
                   == ConsensusError::OK, "propose parameter change");
        TEST_CHECK(b.vote("w2", pid, true, executed) == ConsensusError::OK && executed, "executed");
        TEST_CHECK(b.state().sys.params.fee_tolerance_bps == 50, "parameter applied");

        ForceInterventionPayload fi;
        fi.action = InterventionAction::PAUSE;
        fi.flag = PauseFlag::MINTING;
        TEST_CHECK(b.propose("w1", ProposalType::FORCE_INTERVENTION, encode_payload(fi), "incident", pid)
                   == ConsensusError::OK, "propose pause");
        TEST_CHECK(b.vote("w3", pid, true, executed) == ConsensusError::OK && executed, "pause executed");
        TEST_CHECK(b.mint("minter", "qc1", "alice", 50000) == MintError::PAUSED, "minting paused by watchdogs");

        // Pausing twice fails execution; the vote is not recorded.
        TEST_CHECK(b.propose("w1", ProposalType::FORCE_INTERVENTION, encode_payload(fi), "again", pid)
                   == ConsensusError::OK, "propose second pause");
        TEST_CHECK(b.vote("w2", pid, true, executed) == ConsensusError::EXECUTION_FAILED && !executed,
                   "execution failure");
        TEST_CHECK(b.state().consensus.get(pid)->yes_votes == 1, "vote rolled back");
        failed_pid = pid;

        StatusChangePayload sc;
        sc.custodian_id = "qc1";
        sc.status = CustodianStatus::TERMINATED;
        sc.reason = "fraud";
        TEST_CHECK(b.set_custodian_status("arbiter", "qc1", CustodianStatus::TERMINATED, "fraud")
                   == RegistryError::UNAUTHORIZED, "arbiter cannot terminate");
        TEST_CHECK(b.propose("w2", ProposalType::STATUS_CHANGE, encode_payload(sc), "fraud", pid)
                   == ConsensusError::OK, "propose termination");
        TEST_CHECK(b.vote("w3", pid, true, executed) == ConsensusError::OK && executed, "terminated");
        TEST_CHECK(b.state().registry.status_of("qc1") == CustodianStatus::TERMINATED, "custodian terminated");
        TEST_CHECK(seen.back().type == EventType::PROPOSAL_EXECUTED, "execution event published");
        std::printf("  [PASS] watchdog proposals\n");
    }

    // Cleanup and enforcement.
    {
        TEST_CHECK(b.register_custodian("registrar", "qc2", 1000000) == RegistryError::OK, "register qc2");
        TEST_CHECK(b.has_violation("qc2", ViolationReason::STALE_ATTESTATIONS), "never attested");
        TEST_CHECK(b.enforce_violation("anyone", "qc2", ViolationReason::STALE_ATTESTATIONS) == EnforcementError::OK,
                   "enforced");
        TEST_CHECK(b.state().registry.status_of("qc2") == CustodianStatus::UNDER_REVIEW, "under review");

        uint64_t pid = 0;
        ForceInterventionPayload un;
        un.action = InterventionAction::UNPAUSE;
        un.flag = PauseFlag::MINTING;
        TEST_CHECK(b.propose("w1", ProposalType::FORCE_INTERVENTION, encode_payload(un), "resume", pid)
                   == ConsensusError::OK, "propose unpause");
        clock.advance(b.state().sys.params.voting_period + 1);
        bool executed = false;
        TEST_CHECK(b.vote("w2", pid, true, executed) == ConsensusError::VOTING_ENDED, "too late");
        TEST_CHECK(b.cleanup_expired({failed_pid, pid}) == 2, "both open proposals expire");
        TEST_CHECK(b.state().consensus.get(pid)->expired, "expired");
        std::printf("  [PASS] cleanup and enforcement\n");
    }

    std::printf("All bridge tests passed\n");
    return 0;
}
