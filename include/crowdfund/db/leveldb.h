// CROWDFUND - Database Backends
// Copyright (c) 2024 CROWDFUND Developers
// MIT License

#ifndef CROWDFUND_DB_LEVELDB_H
#define CROWDFUND_DB_LEVELDB_H

#include "crowdfund/db/database.h"

#include <leveldb/cache.h>
#include <leveldb/db.h>

#include <map>
#include <mutex>

namespace crowdfund {
namespace db {

/// On-disk backend. Takes ownership of the handle and of its block cache.
class LevelDBDatabase : public Database {
public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache) : cache_(cache), db_(db) {}

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

private:
    // db_ is declared last so it closes before the cache it reads through
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<leveldb::DB> db_;
};

/**
 * Map-backed backend used by tests.
 * An iterator works on a copy of the contents taken when it is created.
 */
class MemoryDatabase : public Database {
public:
    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> data_;
};

} // namespace db
} // namespace crowdfund

#endif // CROWDFUND_DB_LEVELDB_H
