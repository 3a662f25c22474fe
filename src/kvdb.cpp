#include "kvdb.h"
#include "log.h"
#include <sys/stat.h>

#ifdef _WIN32
  #include <direct.h>
  static inline void qcb_mkdir(const std::string& p){ _mkdir(p.c_str()); }
#else
  #include <unistd.h>
  static inline void qcb_mkdir(const std::string& p){ mkdir(p.c_str(), 0755); }
#endif

namespace qcb {

KVDB::~KVDB(){ close(); }

bool KVDB::open(const std::string& path, std::string* err){
    close();
    path_ = path;
    qcb_mkdir(path_);

    options_ = qcbdb_backend::Options();
    options_.create_if_missing = true;
    options_.paranoid_checks = true;
#if QCB_USE_ROCKSDB
    options_.bytes_per_sync = 1<<20; // 1MB
#else
    block_cache_.reset(qcbdb_backend::NewLRUCache(8*1024*1024)); // 8MB
    bloom_ = qcbdb_backend::NewBloomFilterPolicy(10);
    options_.block_cache = block_cache_.get();
    options_.filter_policy = bloom_;
#endif
    qcbdb_backend::DB* db=nullptr;
    auto s = qcbdb_backend::DB::Open(options_, path_, &db);
    if(!s.ok()){
        if(err) *err = s.ToString();
        log_error(LogCategory::DB, "open " + path_ + " failed: " + s.ToString());
        close();
        return false;
    }
    db_ = db;
    log_debug(LogCategory::DB, "opened " + path_);
    return true;
}

bool KVDB::get(const std::string& k, std::string& v, std::string* err) const {
    if(!db_) { if(err)*err="db not open"; return false; }
    auto s = db_->Get(qcbdb_backend::ReadOptions(), k, &v);
    if(s.IsNotFound()) return false;
    if(!s.ok()){ if(err) *err = s.ToString(); return false; }
    return true;
}

bool KVDB::scan_prefix(const std::string& prefix,
                       const std::function<bool(const std::string&, const std::string&)>& fn,
                       std::string* err) const {
    if(!db_) { if(err)*err="db not open"; return false; }
    std::unique_ptr<qcbdb_backend::Iterator> it(db_->NewIterator(qcbdb_backend::ReadOptions()));
    for(it->Seek(prefix); it->Valid(); it->Next()){
        const std::string k = it->key().ToString();
        if(k.compare(0, prefix.size(), prefix) != 0) break;
        if(!fn(k, it->value().ToString())) break;
    }
    auto s = it->status();
    if(!s.ok()){ if(err)*err=s.ToString(); return false; }
    return true;
}

KVDB::Batch::Batch(KVDB& db) : db_(db) {}

void KVDB::Batch::put(const std::string& k, const std::string& v){
    wb_.Put(k, v);
}
bool KVDB::Batch::commit(bool sync, std::string* err){
    if(!db_.db_){ if(err)*err="db not open"; return false; }
    qcbdb_backend::WriteOptions wo;
    wo.sync = sync;
    auto s = db_.db_->Write(wo, &wb_);
    if(!s.ok()){ if(err)*err=s.ToString(); return false; }
    return true;
}

void KVDB::close(){
    delete db_;
    db_ = nullptr;
#if !QCB_USE_ROCKSDB
    // The filter policy must outlive the DB that references it.
    delete bloom_;
    bloom_ = nullptr;
    options_.filter_policy = nullptr;
    options_.block_cache = nullptr;
    block_cache_.reset();
#endif
}

}
