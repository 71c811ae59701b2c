// DAOSTAKE - LevelDB Wrapper
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License
//
// LevelDB implementation of the database interface, plus an in-memory
// implementation with the same ordering semantics for tests.

#ifndef DAOSTAKE_DB_LEVELDB_H
#define DAOSTAKE_DB_LEVELDB_H

#include "daostake/db/database.h"

#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/filter_policy.h>
#include <leveldb/write_batch.h>

#include <map>
#include <mutex>

namespace daostake {
namespace db {

// ============================================================================
// LevelDB Iterator Wrapper
// ============================================================================

class LevelDBIterator : public Iterator {
private:
    std::unique_ptr<leveldb::Iterator> iter_;

public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }

    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }

    void Next() override { iter_->Next(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }

    Status status() const override;
};

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
private:
    std::unique_ptr<leveldb::DB> db_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filter_policy_;
    std::filesystem::path path_;

public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter,
                    const std::filesystem::path& path)
        : db_(db), cache_(cache), filter_policy_(filter), path_(path) {}

    ~LevelDBDatabase() override {
        // The DB references cache and filter, close it first
        db_.reset();
        cache_.reset();
        filter_policy_.reset();
    }

    /// Map a LevelDB status onto ours
    static Status ConvertStatus(const leveldb::Status& s);

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    const std::filesystem::path& GetPath() const { return path_; }
};

// ============================================================================
// In-Memory Database
// ============================================================================

/**
 * Simple in-memory database for tests.
 */
class MemoryDatabase : public Database {
private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;

public:
    MemoryDatabase() = default;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        data_.clear();
    }
};

/**
 * Iterator for MemoryDatabase. Holds a reference to the map, so the
 * database must not be written while the iterator is alive.
 */
class MemoryIterator : public Iterator {
private:
    const std::map<std::string, std::string>& data_;
    std::map<std::string, std::string>::const_iterator iter_;

public:
    explicit MemoryIterator(const std::map<std::string, std::string>& data)
        : data_(data), iter_(data_.end()) {}

    bool Valid() const override { return iter_ != data_.end(); }

    void SeekToFirst() override { iter_ = data_.begin(); }

    void Seek(const Slice& target) override {
        iter_ = data_.lower_bound(target.ToString());
    }

    void Next() override {
        if (iter_ != data_.end()) {
            ++iter_;
        }
    }

    Slice key() const override { return Slice(iter_->first); }

    Slice value() const override { return Slice(iter_->second); }

    Status status() const override { return Status::Ok(); }
};

} // namespace db
} // namespace daostake

#endif // DAOSTAKE_DB_LEVELDB_H
