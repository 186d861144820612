// CROWDFUND - Database Abstraction Layer
// Copyright (c) 2024 CROWDFUND Developers
// MIT License
//
// Ordered key-value store holding campaign snapshots. LevelDB backs it on
// disk; MemoryDatabase serves tests and dry runs. Keys are a one-byte
// record prefix followed by the record's own key bytes.

#ifndef CROWDFUND_DB_DATABASE_H
#define CROWDFUND_DB_DATABASE_H

#include "crowdfund/core/serialize.h"
#include "crowdfund/core/types.h"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <ios>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace crowdfund {
namespace db {

// ============================================================================
// Status
// ============================================================================

class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND,
        CORRUPTION,
        NOT_SUPPORTED,
        INVALID_ARGUMENT,
        IO_ERROR,
    };

    Status() = default;
    Status(Code code, std::string message) : code_(code), message_(std::move(message)) {}

    static Status Ok() { return {}; }
    static Status NotFound(std::string msg) { return {NOT_FOUND, std::move(msg)}; }
    static Status Corruption(std::string msg) { return {CORRUPTION, std::move(msg)}; }
    static Status NotSupported(std::string msg) { return {NOT_SUPPORTED, std::move(msg)}; }
    static Status InvalidArgument(std::string msg) { return {INVALID_ARGUMENT, std::move(msg)}; }
    static Status IOError(std::string msg) { return {IO_ERROR, std::move(msg)}; }

    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }
    bool IsIOError() const { return code_ == IO_ERROR; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    /// "OK" or "<CodeName>: <message>"
    std::string ToString() const;

private:
    Code code_{OK};
    std::string message_;
};

// ============================================================================
// Slice
// ============================================================================

/// Borrowed byte range; the referenced buffer must outlive it
class Slice {
public:
    Slice() = default;
    Slice(const char* data, size_t size) : data_(data), size_(size) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const char* s) : data_(s), size_(std::strlen(s)) {}

    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    std::string ToString() const { return std::string(data_, size_); }

    bool starts_with(const Slice& prefix) const {
        return prefix.size_ <= size_ && std::memcmp(data_, prefix.data_, prefix.size_) == 0;
    }

    bool operator==(const Slice& other) const {
        return size_ == other.size_ && std::memcmp(data_, other.data_, size_) == 0;
    }
    bool operator!=(const Slice& other) const { return !(*this == other); }

private:
    const char* data_{""};
    size_t size_{0};
};

// ============================================================================
// Options
// ============================================================================

struct Options {
    bool create_if_missing = true;
    bool error_if_exists = false;

    /// Memtable size before a flush to disk
    size_t write_buffer_size = 4 * 1024 * 1024;

    /// LRU block cache; 0 disables it
    size_t block_cache_size = 8 * 1024 * 1024;
};

struct ReadOptions {
    /// Check block checksums (snapshot loads turn this on)
    bool verify_checksums = false;

    /// Keep blocks read by this call in the cache (full scans turn this off)
    bool fill_cache = true;
};

struct WriteOptions {
    /// fsync before the write returns
    bool sync = false;
};

// ============================================================================
// WriteBatch
// ============================================================================

/// Puts and deletes applied atomically, in insertion order, by Database::Write
class WriteBatch {
public:
    void Put(const Slice& key, const Slice& value) {
        ops_.push_back({key.ToString(), value.ToString()});
    }
    void Delete(const Slice& key) { ops_.push_back({key.ToString(), std::nullopt}); }

    void Clear() { ops_.clear(); }
    size_t Count() const { return ops_.size(); }
    bool Empty() const { return ops_.empty(); }

    /// func(key, value); a nullopt value is a delete
    template<typename Func>
    void Iterate(Func&& func) const {
        for (const Op& op : ops_) {
            func(op.key, op.value);
        }
    }

private:
    struct Op {
        std::string key;
        std::optional<std::string> value;
    };
    std::vector<Op> ops_;
};

// ============================================================================
// Iterator and Database
// ============================================================================

class Iterator {
public:
    virtual ~Iterator() = default;

    virtual bool Valid() const = 0;
    virtual void SeekToFirst() = 0;
    virtual void Seek(const Slice& target) = 0;
    virtual void Next() = 0;
    virtual Slice key() const = 0;
    virtual Slice value() const = 0;
    virtual Status status() const = 0;
};

class Database {
public:
    virtual ~Database() = default;

    virtual Status Get(const ReadOptions& options, const Slice& key, std::string* value) = 0;
    virtual Status Put(const WriteOptions& options, const Slice& key, const Slice& value) = 0;
    virtual Status Delete(const WriteOptions& options, const Slice& key) = 0;
    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;
    virtual std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) = 0;

    Status Get(const Slice& key, std::string* value) { return Get(ReadOptions(), key, value); }
    Status Put(const Slice& key, const Slice& value) { return Put(WriteOptions(), key, value); }
    Status Delete(const Slice& key) { return Delete(WriteOptions(), key); }
    Status Write(WriteBatch* batch) { return Write(WriteOptions(), batch); }
    std::unique_ptr<Iterator> NewIterator() { return NewIterator(ReadOptions()); }

    bool Exists(const Slice& key) {
        std::string ignored;
        return Get(key, &ignored).ok();
    }
};

/**
 * Visit every entry whose key starts with `prefix`, in key order.
 * visit(key, value) returns false to stop early.
 * @return The iterator status after the scan
 */
template<typename Visitor>
Status ScanPrefix(Database& db, const Slice& prefix, Visitor&& visit,
                  const ReadOptions& options = ReadOptions()) {
    std::unique_ptr<Iterator> it = db.NewIterator(options);
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        if (!visit(it->key(), it->value())) {
            break;
        }
    }
    return it->status();
}

// ============================================================================
// Factory Functions
// ============================================================================

/**
 * Open a LevelDB database, creating the directory when create_if_missing
 * is set.
 * @return (status, database); the pointer is null on failure
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

/// Remove every file of the LevelDB database at `path`
Status DestroyDatabase(const std::filesystem::path& path);

std::unique_ptr<Database> CreateMemoryDatabase();

// ============================================================================
// Record Encoding
// ============================================================================

template<typename T>
std::string SerializeToString(const T& obj) {
    DataStream ss;
    Serialize(ss, obj);
    return ss.str();
}

/// False on truncated or malformed input, or when bytes are left over
template<typename T>
bool DeserializeFromString(const std::string& data, T& obj) {
    try {
        DataStream ss(reinterpret_cast<const uint8_t*>(data.data()), data.size());
        Unserialize(ss, obj);
        return ss.empty();
    } catch (const std::ios_base::failure&) {
        return false;
    }
}

namespace prefix {
    constexpr char CONFIG = 'c';          // campaign id -> CampaignConfig
    constexpr char STATE = 's';           // campaign id -> CampaignTotals
    constexpr char ACCOUNT = 'a';         // campaign id + address -> AccountState
    constexpr char ALLOWANCE = 'w';       // campaign id + owner + spender -> amount
    constexpr char VERSION = 'V';         // -> store format version
}

inline std::string MakeKey(char prefix, const Slice& key) {
    std::string result(1, prefix);
    result.append(key.data(), key.size());
    return result;
}

inline std::string MakeKey(char prefix) {
    return std::string(1, prefix);
}

} // namespace db
} // namespace crowdfund

#endif // CROWDFUND_DB_DATABASE_H
