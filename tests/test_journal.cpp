// Durable audit journal on the key-value store.
#include "journal.h"
#include "log.h"
#include "test_util.h"
#include <cstdio>

using namespace qcb;

int main(){
    log_set_level(LogLevel::WARN);
    const std::string dir = qcbtest::make_temp_dir("qcb_journal");
    TEST_CHECK(!dir.empty(), "temp dir");

    SpvAuditRecord proof;
    proof.purpose = "redemption";
    proof.subject = "ab01";
    proof.txid = Bytes(32, 0x21);
    proof.block_hash = Bytes(32, 0x22);
    proof.confirmations = 6;
    proof.accumulated_work = "0c";
    proof.time = 1700000600;

    {
        AuditJournal j;
        std::string err;
        TEST_CHECK(j.open(dir, &err), "open");
        TEST_CHECK(j.event_count() == 0 && j.proof_count() == 0, "empty journal");

        EventLog first;
        first.emit(EventType::CUSTODIAN_REGISTERED, 1700000000, "qc1", "cap=1000");
        first.emit(EventType::ATTESTATION_RECORDED, 1700000000, "qc1", "balance=800");
        TEST_CHECK(j.append(first, &err), "append");

        EventLog empty;
        TEST_CHECK(j.append(empty, &err), "empty log is a no-op");

        EventLog second;
        second.emit(EventType::REDEMPTION_STATE_CHANGED, 1700000600, "ab01", "from=pending to=fulfilled");
        second.add_proof(proof);
        TEST_CHECK(j.append(second, &err), "append with proof");
        TEST_CHECK(j.event_count() == 3 && j.proof_count() == 1, "counters");
        j.close();
    }

    // Reopening resumes the counters and preserves order.
    {
        AuditJournal j;
        std::string err;
        TEST_CHECK(j.open(dir, &err), "reopen");
        TEST_CHECK(j.event_count() == 3 && j.proof_count() == 1, "counters persisted");

        std::vector<Event> events;
        std::vector<SpvAuditRecord> proofs;
        TEST_CHECK(j.load_events(events, &err), "load events");
        TEST_CHECK(j.load_proofs(proofs, &err), "load proofs");
        TEST_CHECK(events.size() == 3, "three events");
        TEST_CHECK(events[0].type == EventType::CUSTODIAN_REGISTERED && events[0].detail == "cap=1000", "first");
        TEST_CHECK(events[2].type == EventType::REDEMPTION_STATE_CHANGED && events[2].subject == "ab01", "last");
        TEST_CHECK(proofs.size() == 1, "one proof");
        TEST_CHECK(proofs[0].purpose == "redemption" && proofs[0].txid == proof.txid
                   && proofs[0].confirmations == 6 && proofs[0].accumulated_work == "0c"
                   && proofs[0].time == proof.time, "proof fields");

        EventLog more;
        more.emit(EventType::MINTED, 1700001200, "qc1", "amount=100");
        TEST_CHECK(j.append(more, &err), "append after reopen");
        events.clear();
        TEST_CHECK(j.load_events(events, &err) && events.size() == 4 && events[3].type == EventType::MINTED,
                   "appended after existing entries");
        j.close();
    }
    std::printf("  [PASS] audit journal\n");

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::printf("All journal tests passed\n");
    return 0;
}
