// CROWDFUND - Database Implementation
// Copyright (c) 2024 CROWDFUND Developers
// MIT License

#include "crowdfund/db/database.h"
#include "crowdfund/db/leveldb.h"
#include "crowdfund/util/logging.h"

#include <leveldb/write_batch.h>

namespace crowdfund {
namespace db {

namespace {

const char* CodeName(Status::Code code) {
    switch (code) {
        case Status::OK: return "OK";
        case Status::NOT_FOUND: return "NotFound";
        case Status::CORRUPTION: return "Corruption";
        case Status::NOT_SUPPORTED: return "NotSupported";
        case Status::INVALID_ARGUMENT: return "InvalidArgument";
        case Status::IO_ERROR: return "IOError";
    }
    return "Unknown";
}

Status Convert(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();

    Status::Code code = Status::IO_ERROR;
    if (s.IsNotFound()) {
        code = Status::NOT_FOUND;
    } else if (s.IsCorruption()) {
        code = Status::CORRUPTION;
    } else if (s.IsNotSupportedError()) {
        code = Status::NOT_SUPPORTED;
    } else if (s.IsInvalidArgument()) {
        code = Status::INVALID_ARGUMENT;
    }
    return Status(code, s.ToString());
}

leveldb::Slice Raw(const Slice& s) {
    return leveldb::Slice(s.data(), s.size());
}

Slice Wrap(const leveldb::Slice& s) {
    return Slice(s.data(), s.size());
}

leveldb::ReadOptions Raw(const ReadOptions& options) {
    leveldb::ReadOptions ro;
    ro.verify_checksums = options.verify_checksums;
    ro.fill_cache = options.fill_cache;
    return ro;
}

leveldb::WriteOptions Raw(const WriteOptions& options) {
    leveldb::WriteOptions wo;
    wo.sync = options.sync;
    return wo;
}

class LevelDBIterator : public Iterator {
public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }
    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override { iter_->Seek(Raw(target)); }
    void Next() override { iter_->Next(); }
    Slice key() const override { return Wrap(iter_->key()); }
    Slice value() const override { return Wrap(iter_->value()); }
    Status status() const override { return Convert(iter_->status()); }

private:
    std::unique_ptr<leveldb::Iterator> iter_;
};

class MemoryIterator : public Iterator {
public:
    using Map = std::map<std::string, std::string>;

    explicit MemoryIterator(Map contents) : contents_(std::move(contents)), pos_(contents_.end()) {}

    bool Valid() const override { return pos_ != contents_.end(); }
    void SeekToFirst() override { pos_ = contents_.begin(); }
    void Seek(const Slice& target) override { pos_ = contents_.lower_bound(target.ToString()); }
    void Next() override {
        if (Valid()) ++pos_;
    }
    Slice key() const override { return Slice(pos_->first); }
    Slice value() const override { return Slice(pos_->second); }
    Status status() const override { return Status::Ok(); }

private:
    Map contents_;
    Map::const_iterator pos_;
};

} // namespace

std::string Status::ToString() const {
    if (ok()) {
        return CodeName(code_);
    }
    return std::string(CodeName(code_)) + ": " + message_;
}

// ============================================================================
// LevelDBDatabase
// ============================================================================

Status LevelDBDatabase::Get(const ReadOptions& options, const Slice& key, std::string* value) {
    return Convert(db_->Get(Raw(options), Raw(key), value));
}

Status LevelDBDatabase::Put(const WriteOptions& options, const Slice& key, const Slice& value) {
    return Convert(db_->Put(Raw(options), Raw(key), Raw(value)));
}

Status LevelDBDatabase::Delete(const WriteOptions& options, const Slice& key) {
    return Convert(db_->Delete(Raw(options), Raw(key)));
}

Status LevelDBDatabase::Write(const WriteOptions& options, WriteBatch* batch) {
    leveldb::WriteBatch updates;
    batch->Iterate([&updates](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            updates.Put(key, *value);
        } else {
            updates.Delete(key);
        }
    });
    return Convert(db_->Write(Raw(options), &updates));
}

std::unique_ptr<Iterator> LevelDBDatabase::NewIterator(const ReadOptions& options) {
    return std::make_unique<LevelDBIterator>(db_->NewIterator(Raw(options)));
}

// ============================================================================
// MemoryDatabase
// ============================================================================

Status MemoryDatabase::Get(const ReadOptions&, const Slice& key, std::string* value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = data_.find(key.ToString());
    if (found == data_.end()) {
        return Status::NotFound(key.ToString());
    }
    *value = found->second;
    return Status::Ok();
}

Status MemoryDatabase::Put(const WriteOptions&, const Slice& key, const Slice& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key.ToString()] = value.ToString();
    return Status::Ok();
}

Status MemoryDatabase::Delete(const WriteOptions&, const Slice& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.erase(key.ToString());
    return Status::Ok();
}

Status MemoryDatabase::Write(const WriteOptions&, WriteBatch* batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    batch->Iterate([this](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            data_[key] = *value;
        } else {
            data_.erase(key);
        }
    });
    return Status::Ok();
}

std::unique_ptr<Iterator> MemoryDatabase::NewIterator(const ReadOptions&) {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_unique<MemoryIterator>(data_);
}

size_t MemoryDatabase::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

// ============================================================================
// Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            return {Status::IOError(path.string() + ": " + ec.message()), nullptr};
        }
    }

    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.write_buffer_size = options.write_buffer_size;
    std::unique_ptr<leveldb::Cache> cache;
    if (options.block_cache_size > 0) {
        cache.reset(leveldb::NewLRUCache(options.block_cache_size));
        lo.block_cache = cache.get();
    }

    leveldb::DB* handle = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &handle);
    if (!s.ok()) {
        LogErrorF(util::LogCategory::DB, "Cannot open store at %s: %s",
                  path.string().c_str(), s.ToString().c_str());
        return {Convert(s), nullptr};
    }

    LogDebugF(util::LogCategory::DB, "Opened store at %s", path.string().c_str());
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(handle, cache.release())};
}

Status DestroyDatabase(const std::filesystem::path& path) {
    return Convert(leveldb::DestroyDB(path.string(), leveldb::Options()));
}

std::unique_ptr<Database> CreateMemoryDatabase() {
    return std::make_unique<MemoryDatabase>();
}

} // namespace db
} // namespace crowdfund
