// MATEICO - Database Backends
// Copyright (c) 2024 MATEICO Developers
// MIT License
//
// LevelDB implementation of the database interface, and an in-memory
// store with the same semantics for tests.

#ifndef MATEICO_DB_LEVELDB_H
#define MATEICO_DB_LEVELDB_H

#include "mateico/db/database.h"

#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/write_batch.h>

#include <map>
#include <mutex>

namespace mateico {
namespace db {

// ============================================================================
// LevelDB Database
// ============================================================================

class LevelDBDatabase : public Database {
public:
    /// Takes ownership of db and cache
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache, const std::filesystem::path& path);
    ~LevelDBDatabase() override;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;

    const std::filesystem::path& GetPath() const { return path_; }

    static Status ConvertStatus(const leveldb::Status& s);

private:
    std::unique_ptr<leveldb::DB> db_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::filesystem::path path_;
};

// ============================================================================
// In-Memory Database
// ============================================================================

class MemoryDatabase : public Database {
private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;

public:
    MemoryDatabase() = default;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        data_.clear();
    }
};

} // namespace db
} // namespace mateico

#endif // MATEICO_DB_LEVELDB_H
