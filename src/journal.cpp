#include "journal.h"
#include "log.h"

namespace qcb {

static const char* K_EVENT = "e";
static const char* K_PROOF = "p";
static const char* K_META_EVENTS = "m:events";
static const char* K_META_PROOFS = "m:proofs";

static std::string be64(uint64_t v){
    std::string s(8, '\0');
    for (int i = 7; i >= 0; --i) { s[i] = char(v & 0xff); v >>= 8; }
    return s;
}

static bool read_counter(const KVDB& db, const char* key, uint64_t& out, std::string* err){
    std::string v;
    std::string e;
    if (!db.get(key, v, &e)) {
        if (!e.empty()) { if (err) *err = e; return false; }
        out = 0;
        return true;
    }
    if (v.size() != 8) { if (err) *err = std::string("corrupt counter ") + key; return false; }
    uint64_t x = 0;
    for (char c : v) x = (x << 8) | uint8_t(c);
    out = x;
    return true;
}

bool AuditJournal::open(const std::string& datadir, std::string* err){
    if (!db_.open(datadir, err)) return false;
    if (!read_counter(db_, K_META_EVENTS, next_event_, err) ||
        !read_counter(db_, K_META_PROOFS, next_proof_, err)) {
        db_.close();
        return false;
    }
    log_info(LogCategory::DB, "audit journal at " + datadir + ": "
             + std::to_string(next_event_) + " events, " + std::to_string(next_proof_) + " proofs");
    return true;
}

bool AuditJournal::append(const EventLog& log, std::string* err){
    if (log.empty()) return true;
    uint64_t ne = next_event_, np = next_proof_;
    KVDB::Batch b(db_);
    for (const auto& e : log.events()) {
        const Bytes v = serialize_event(e);
        b.put(K_EVENT + be64(ne++), std::string(v.begin(), v.end()));
    }
    for (const auto& p : log.proofs()) {
        const Bytes v = serialize_spv_audit(p);
        b.put(K_PROOF + be64(np++), std::string(v.begin(), v.end()));
    }
    b.put(K_META_EVENTS, be64(ne));
    b.put(K_META_PROOFS, be64(np));
    if (!b.commit(true, err)) return false;
    next_event_ = ne;
    next_proof_ = np;
    return true;
}

bool AuditJournal::load_events(std::vector<Event>& out, std::string* err) const {
    out.clear();
    bool ok = true;
    bool scanned = db_.scan_prefix(K_EVENT, [&](const std::string&, const std::string& v){
        Event e;
        ParseError pe = parse_event(Bytes(v.begin(), v.end()), e);
        if (pe != ParseError::OK) {
            if (err) *err = std::string("bad event record: ") + parse_error_str(pe);
            ok = false;
            return false;
        }
        out.push_back(std::move(e));
        return true;
    }, err);
    return scanned && ok;
}

bool AuditJournal::load_proofs(std::vector<SpvAuditRecord>& out, std::string* err) const {
    out.clear();
    bool ok = true;
    bool scanned = db_.scan_prefix(K_PROOF, [&](const std::string&, const std::string& v){
        SpvAuditRecord r;
        ParseError pe = parse_spv_audit(Bytes(v.begin(), v.end()), r);
        if (pe != ParseError::OK) {
            if (err) *err = std::string("bad proof record: ") + parse_error_str(pe);
            ok = false;
            return false;
        }
        out.push_back(std::move(r));
        return true;
    }, err);
    return scanned && ok;
}

}
