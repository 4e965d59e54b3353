// AGORA - LevelDB Wrapper Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <agora/db/leveldb.h>

#ifdef AGORA_USE_LEVELDB

namespace agora {
namespace db {

Status FromLevelDBStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

LevelDBDatabase::LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                                 const leveldb::FilterPolicy* filter)
    : cache_(cache), filterPolicy_(filter), db_(db) {}

LevelDBDatabase::~LevelDBDatabase() = default;

Status LevelDBDatabase::Get(const Slice& key, std::string* value) {
    return FromLevelDBStatus(
        db_->Get(leveldb::ReadOptions(), leveldb::Slice(key.data(), key.size()), value));
}

Status LevelDBDatabase::Put(const WriteOptions& options, const Slice& key, const Slice& value) {
    leveldb::WriteOptions lo;
    lo.sync = options.sync;
    return FromLevelDBStatus(db_->Put(lo, leveldb::Slice(key.data(), key.size()),
                                      leveldb::Slice(value.data(), value.size())));
}

Status LevelDBDatabase::Delete(const WriteOptions& options, const Slice& key) {
    leveldb::WriteOptions lo;
    lo.sync = options.sync;
    return FromLevelDBStatus(db_->Delete(lo, leveldb::Slice(key.data(), key.size())));
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
    return FromLevelDBStatus(db_->Write(lo, &lb));
}

std::unique_ptr<Iterator> LevelDBDatabase::NewIterator() {
    return std::make_unique<LevelDBIterator>(db_->NewIterator(leveldb::ReadOptions()));
}

} // namespace db
} // namespace agora

#endif // AGORA_USE_LEVELDB
