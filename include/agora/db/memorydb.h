// AGORA - In-Memory Database
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// std::map backed implementation of the database interface. Used by tests
// and by hosts that keep DAO state in process.

#ifndef AGORA_DB_MEMORYDB_H
#define AGORA_DB_MEMORYDB_H

#include <agora/db/database.h>
#include <map>
#include <mutex>

namespace agora {
namespace db {

class MemoryDatabase : public Database {
public:
    MemoryDatabase() = default;

    Status Get(const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;

    /// Iterates over a snapshot taken at creation time
    std::unique_ptr<Iterator> NewIterator() override;

    using Database::Put;
    using Database::Delete;
    using Database::Write;

    size_t Size() const;
    void Clear();

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
};

/**
 * Iterator over a MemoryDatabase snapshot.
 */
class MemoryIterator : public Iterator {
public:
    explicit MemoryIterator(std::map<std::string, std::string> snapshot)
        : data_(std::move(snapshot)), iter_(data_.end()) {}

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

private:
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string>::const_iterator iter_;
};

} // namespace db
} // namespace agora

#endif // AGORA_DB_MEMORYDB_H
