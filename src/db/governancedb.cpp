// AGORA - Governance Database Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <agora/db/governancedb.h>
#include <agora/util/logging.h>

#include <algorithm>

namespace agora {
namespace db {

namespace {

/// Proposal value: its position in creation order, then the proposal
struct ProposalRecord {
    uint64_t position{0};
    governance::Proposal proposal;
};

template<typename Stream>
void Serialize(Stream& s, const ProposalRecord& record) {
    ser_writedata64(s, record.position);
    Serialize(s, record.proposal);
}

template<typename Stream>
void Unserialize(Stream& s, ProposalRecord& record) {
    record.position = ser_readdata64(s);
    Unserialize(s, record.proposal);
}

std::string ShortId(const Hash256& id) {
    return id.ToHex().substr(0, 16);
}

} // namespace

GovernanceDB::GovernanceDB(Database& db) : db_(db) {}

// ============================================================================
// DAO State
// ============================================================================

Status GovernanceDB::SaveState(const governance::GovernanceState& state) {
    WriteBatch batch;
    batch.Put(MakeKey(prefix::DAO_CONFIG, state.daoId), SerializeToString(state.config));
    batch.Put(MakeKey(prefix::SEQUENCE, state.daoId), SerializeToString(state.nextSequence));

    for (size_t i = 0; i < state.proposals.size(); ++i) {
        ProposalRecord record;
        record.position = i;
        record.proposal = state.proposals[i];
        batch.Put(MakeKey(prefix::PROPOSAL, state.daoId, record.proposal.id),
                  SerializeToString(record));
    }

    WriteOptions options;
    options.sync = true;
    Status s = db_.Write(options, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB)
            << "Failed to save DAO " << ShortId(state.daoId) << ": " << s.ToString();
        return s;
    }

    LOG_DEBUG(util::LogCategory::DB)
        << "Saved DAO " << ShortId(state.daoId) << " (" << state.proposals.size()
        << " proposals, " << batch.Count() << " records)";
    return s;
}

Status GovernanceDB::LoadState(const DaoId& daoId, governance::GovernanceState& state) {
    governance::GovernanceState loaded;
    loaded.daoId = daoId;

    std::string value;
    Status s = db_.Get(MakeKey(prefix::DAO_CONFIG, daoId), &value);
    if (!s.ok()) {
        return s;
    }
    if (!DeserializeFromString(value, loaded.config)) {
        return Status::Corruption("bad config record for DAO " + ShortId(daoId));
    }

    s = db_.Get(MakeKey(prefix::SEQUENCE, daoId), &value);
    if (s.IsNotFound()) {
        return Status::Corruption("missing sequence record for DAO " + ShortId(daoId));
    }
    if (!s.ok()) {
        return s;
    }
    if (!DeserializeFromString(value, loaded.nextSequence)) {
        return Status::Corruption("bad sequence record for DAO " + ShortId(daoId));
    }

    std::vector<ProposalRecord> records;
    std::string keyPrefix = MakeKey(prefix::PROPOSAL, daoId);
    auto iter = db_.NewIterator();
    for (iter->Seek(Slice(keyPrefix)); iter->Valid(); iter->Next()) {
        if (!iter->key().starts_with(Slice(keyPrefix))) {
            break;
        }
        ProposalRecord record;
        if (!DeserializeFromString(iter->value().ToString(), record)) {
            return Status::Corruption("bad proposal record for DAO " + ShortId(daoId));
        }
        records.push_back(std::move(record));
    }
    if (!iter->status().ok()) {
        return iter->status();
    }

    std::sort(records.begin(), records.end(),
              [](const ProposalRecord& a, const ProposalRecord& b) {
                  return a.position < b.position;
              });
    for (size_t i = 0; i < records.size(); ++i) {
        if (records[i].position != i) {
            return Status::Corruption("proposal positions not contiguous for DAO " +
                                      ShortId(daoId));
        }
        loaded.proposals.push_back(std::move(records[i].proposal));
    }

    LOG_DEBUG(util::LogCategory::DB)
        << "Loaded DAO " << ShortId(daoId) << " (" << loaded.proposals.size()
        << " proposals)";

    state = std::move(loaded);
    return Status::Ok();
}

bool GovernanceDB::HasState(const DaoId& daoId) {
    return db_.Exists(MakeKey(prefix::DAO_CONFIG, daoId));
}

// ============================================================================
// Vote Receipts
// ============================================================================

Status GovernanceDB::StashReceipt(governance::VoteReceipt&& receipt) {
    if (receipt.IsEmpty()) {
        return Status::InvalidArgument("empty receipt");
    }

    DataStream ss;
    receipt.SerializeTo(ss);
    Status s = db_.Put(MakeKey(prefix::RECEIPT, receipt.GetDaoId(), receipt.GetId()), ss.Str());
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB)
            << "Failed to stash receipt " << ShortId(receipt.GetId()) << ": " << s.ToString();
        return s;
    }

    LOG_DEBUG(util::LogCategory::DB)
        << "Stashed receipt " << ShortId(receipt.GetId()) << " ("
        << receipt.GetStakedAmount() << ")";
    receipt.Clear();
    return s;
}

std::pair<Status, std::optional<governance::VoteReceipt>> GovernanceDB::ReclaimReceipt(
    const DaoId& daoId, const ReceiptId& receiptId) {

    std::string key = MakeKey(prefix::RECEIPT, daoId, receiptId);
    std::string value;
    Status s = db_.Get(key, &value);
    if (!s.ok()) {
        return {s, std::nullopt};
    }

    governance::VoteReceipt receipt;
    try {
        DataStream ss(value);
        receipt.UnserializeFrom(ss);
        if (!ss.empty()) {
            return {Status::Corruption("trailing bytes in receipt record"), std::nullopt};
        }
    } catch (const std::ios_base::failure& e) {
        return {Status::Corruption(std::string("bad receipt record: ") + e.what()),
                std::nullopt};
    }
    if (receipt.GetDaoId() != daoId || receipt.GetId() != receiptId || receipt.IsEmpty()) {
        return {Status::Corruption("receipt record does not match its key"), std::nullopt};
    }

    s = db_.Delete(key);
    if (!s.ok()) {
        return {s, std::nullopt};
    }

    LOG_DEBUG(util::LogCategory::DB)
        << "Reclaimed receipt " << ShortId(receiptId) << " ("
        << receipt.GetStakedAmount() << ")";
    return {Status::Ok(), std::move(receipt)};
}

std::vector<ReceiptId> GovernanceDB::ListReceipts(const DaoId& daoId) {
    std::vector<ReceiptId> result;
    std::string keyPrefix = MakeKey(prefix::RECEIPT, daoId);
    auto iter = db_.NewIterator();
    for (iter->Seek(Slice(keyPrefix)); iter->Valid(); iter->Next()) {
        Slice key = iter->key();
        if (!key.starts_with(Slice(keyPrefix))) {
            break;
        }
        if (key.size() != keyPrefix.size() + ReceiptId::SIZE) {
            LOG_WARN(util::LogCategory::DB) << "Skipping malformed receipt key";
            continue;
        }
        const Byte* raw = reinterpret_cast<const Byte*>(key.data()) + keyPrefix.size();
        result.emplace_back(Hash256(raw, ReceiptId::SIZE));
    }
    return result;
}

} // namespace db
} // namespace agora
