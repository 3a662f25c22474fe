#pragma once
// Append-only audit trail of committed events and accepted SPV proofs.
#include <cstdint>
#include <string>
#include <vector>
#include "events.h"
#include "kvdb.h"

namespace qcb {

class AuditJournal : public EventSink {
public:
    bool open(const std::string& datadir, std::string* err = nullptr);
    void close() { db_.close(); }
    bool is_open() const { return db_.is_open(); }

    // One atomic write per committed operation.
    bool append(const EventLog& log, std::string* err = nullptr) override;

    bool load_events(std::vector<Event>& out, std::string* err = nullptr) const;
    bool load_proofs(std::vector<SpvAuditRecord>& out, std::string* err = nullptr) const;

    uint64_t event_count() const { return next_event_; }
    uint64_t proof_count() const { return next_proof_; }

private:
    KVDB db_;
    uint64_t next_event_{0};
    uint64_t next_proof_{0};
};

}
