// DAOSTAKE - Database Implementation
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License

#include "daostake/db/database.h"
#include "daostake/db/leveldb.h"

namespace daostake {
namespace db {

// ============================================================================
// LevelDB
// ============================================================================

Status LevelDBIterator::status() const {
    return LevelDBDatabase::ConvertStatus(iter_->status());
}

Status LevelDBDatabase::ConvertStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsIOError()) return Status::IOError(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

Status LevelDBDatabase::Get(const ReadOptions& options, const Slice& key, std::string* value) {
    leveldb::ReadOptions lo;
    lo.verify_checksums = options.verify_checksums;
    lo.fill_cache = options.fill_cache;
    return ConvertStatus(db_->Get(lo, leveldb::Slice(key.data(), key.size()), value));
}

Status LevelDBDatabase::Put(const WriteOptions& options, const Slice& key, const Slice& value) {
    leveldb::WriteOptions lo;
    lo.sync = options.sync;
    return ConvertStatus(db_->Put(lo, leveldb::Slice(key.data(), key.size()),
                                  leveldb::Slice(value.data(), value.size())));
}

Status LevelDBDatabase::Delete(const WriteOptions& options, const Slice& key) {
    leveldb::WriteOptions lo;
    lo.sync = options.sync;
    return ConvertStatus(db_->Delete(lo, leveldb::Slice(key.data(), key.size())));
}

Status LevelDBDatabase::Write(const WriteOptions& options, WriteBatch* batch) {
    leveldb::WriteBatch lb;
    batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            lb.Put(key, *value);
        } else {
            lb.Delete(key);
        }
    });
    leveldb::WriteOptions lo;
    lo.sync = options.sync;
    return ConvertStatus(db_->Write(lo, &lb));
}

std::unique_ptr<Iterator> LevelDBDatabase::NewIterator(const ReadOptions& options) {
    leveldb::ReadOptions lo;
    lo.verify_checksums = options.verify_checksums;
    lo.fill_cache = options.fill_cache;
    return std::make_unique<LevelDBIterator>(db_->NewIterator(lo));
}

// ============================================================================
// Database
// ============================================================================

Status Database::ScanPrefix(const Slice& prefix, const PrefixVisitor& visit) {
    const std::string start = prefix.ToString();
    auto it = NewIterator();
    for (it->Seek(start); it->Valid() && it->key().starts_with(start); it->Next()) {
        Status s = visit(it->key(), it->value());
        if (!s.ok()) {
            return s;
        }
    }
    return it->status();
}

// ============================================================================
// MemoryDatabase
// ============================================================================

Status MemoryDatabase::Get(const ReadOptions&, const Slice& key, std::string* value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key.ToString());
    if (it == data_.end()) {
        return Status::NotFound();
    }
    *value = it->second;
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
    return std::make_unique<MemoryIterator>(data_);
}

// ============================================================================
// Database Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.paranoid_checks = options.paranoid_checks;
    lo.write_buffer_size = options.write_buffer_size;
    lo.max_open_files = options.max_open_files;

    leveldb::Cache* cache = nullptr;
    if (options.block_cache_size > 0) {
        cache = leveldb::NewLRUCache(options.block_cache_size);
        lo.block_cache = cache;
    }

    const leveldb::FilterPolicy* filter = nullptr;
    if (options.bloom_filter_bits > 0) {
        filter = leveldb::NewBloomFilterPolicy(options.bloom_filter_bits);
        lo.filter_policy = filter;
    }

    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            delete cache;
            delete filter;
            return {Status::IOError(ec.message()), nullptr};
        }
    }

    leveldb::DB* db = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &db);

    if (!s.ok()) {
        delete cache;
        delete filter;
        return {LevelDBDatabase::ConvertStatus(s), nullptr};
    }

    return {Status::Ok(),
            std::make_unique<LevelDBDatabase>(db, cache, filter, path)};
}

Status DestroyDatabase(const std::filesystem::path& path) {
    leveldb::Status s = leveldb::DestroyDB(path.string(), leveldb::Options());
    if (!s.ok()) {
        return Status::IOError(s.ToString());
    }
    return Status::Ok();
}

} // namespace db
} // namespace daostake
