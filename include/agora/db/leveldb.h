// AGORA - LevelDB Wrapper
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// LevelDB implementation of the database interface. Only available when
// the project is built with AGORA_USE_LEVELDB.

#ifndef AGORA_DB_LEVELDB_H
#define AGORA_DB_LEVELDB_H

#include <agora/db/database.h>

#ifdef AGORA_USE_LEVELDB
#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/filter_policy.h>
#include <leveldb/write_batch.h>

namespace agora {
namespace db {

/// Map a LevelDB status onto ours
Status FromLevelDBStatus(const leveldb::Status& s);

class LevelDBIterator : public Iterator {
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

    Status status() const override { return FromLevelDBStatus(iter_->status()); }

private:
    std::unique_ptr<leveldb::Iterator> iter_;
};

class LevelDBDatabase : public Database {
public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter);
    ~LevelDBDatabase() override;

    Status Get(const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator() override;

    using Database::Put;
    using Database::Delete;
    using Database::Write;

private:
    // Declaration order matters: db_ must be destroyed before the cache and
    // filter policy it references.
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filterPolicy_;
    std::unique_ptr<leveldb::DB> db_;
};

} // namespace db
} // namespace agora

#endif // AGORA_USE_LEVELDB

#endif // AGORA_DB_LEVELDB_H
