#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <memory>
#include <functional>

// Select backend (default: LevelDB)
#ifndef QCB_USE_ROCKSDB
#define QCB_USE_LEVELDB 1
#endif

#if QCB_USE_ROCKSDB
  #include <rocksdb/db.h>
  #include <rocksdb/options.h>
  #include <rocksdb/slice.h>
  #include <rocksdb/iterator.h>
  #include <rocksdb/write_batch.h>
  namespace qcbdb_backend = rocksdb;
#else
  #include <leveldb/db.h>
  #include <leveldb/iterator.h>
  #include <leveldb/write_batch.h>
  #include <leveldb/cache.h>
  #include <leveldb/filter_policy.h>
  namespace qcbdb_backend = leveldb;
#endif

namespace qcb {

class KVDB {
public:
    KVDB() = default;
    ~KVDB();

    // Create/open a database directory. Creates it if missing.
    bool open(const std::string& path, std::string* err = nullptr);
    bool is_open() const { return db_ != nullptr; }

    // Returns false on not-found without touching err.
    bool get(const std::string& k, std::string& v, std::string* err = nullptr) const;

    // Visit keys starting with prefix in key order. Returning false from fn stops.
    bool scan_prefix(const std::string& prefix,
                     const std::function<bool(const std::string&, const std::string&)>& fn,
                     std::string* err = nullptr) const;

    // Batched writer (atomic).
    class Batch {
    public:
        explicit Batch(KVDB& db);
        void put(const std::string& k, const std::string& v);
        bool commit(bool sync=true, std::string* err = nullptr);
    private:
        KVDB& db_;
        qcbdb_backend::WriteBatch wb_;
    };

    void close();

private:
    KVDB(const KVDB&) = delete;
    KVDB& operator=(const KVDB&) = delete;

    qcbdb_backend::DB* db_ = nullptr;
    qcbdb_backend::Options options_;
#if !QCB_USE_ROCKSDB
    std::unique_ptr<qcbdb_backend::Cache> block_cache_;
    const qcbdb_backend::FilterPolicy* bloom_ = nullptr;
#endif
    std::string path_;
};

}
