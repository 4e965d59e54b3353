// AGORA - Governance Database
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Persists DAO governance state and stashed vote receipts in a key-value
// Database.

#ifndef AGORA_DB_GOVERNANCEDB_H
#define AGORA_DB_GOVERNANCEDB_H

#include <agora/db/database.h>
#include <agora/governance/governance.h>
#include <agora/governance/vote_receipt.h>

#include <optional>
#include <utility>
#include <vector>

namespace agora {
namespace db {

/**
 * Governance state on top of a Database.
 *
 * Layout (see prefix):
 *   'c' dao id                -> DaoConfig
 *   's' dao id                -> next id sequence
 *   'p' dao id, proposal id   -> creation position, Proposal
 *   'r' dao id, receipt id    -> VoteReceipt
 *
 * The database must outlive this object.
 */
class GovernanceDB {
public:
    explicit GovernanceDB(Database& db);

    GovernanceDB(const GovernanceDB&) = delete;
    GovernanceDB& operator=(const GovernanceDB&) = delete;

    // ========================================================================
    // DAO State
    // ========================================================================

    /// Write configuration, sequence and all proposals in one batch
    Status SaveState(const governance::GovernanceState& state);

    /**
     * Read a DAO's state. NotFound if the DAO was never saved, Corruption
     * if any record fails to decode. state is only assigned on success.
     */
    Status LoadState(const DaoId& daoId, governance::GovernanceState& state);

    /// True if a state has been saved for the DAO
    bool HasState(const DaoId& daoId);

    // ========================================================================
    // Vote Receipts
    // ========================================================================

    /**
     * Store a receipt. On success the receipt is moved into the database
     * and the argument is left empty; on failure it is untouched.
     */
    Status StashReceipt(governance::VoteReceipt&& receipt);

    /**
     * Take a stashed receipt back out, erasing it from the database.
     */
    std::pair<Status, std::optional<governance::VoteReceipt>> ReclaimReceipt(
        const DaoId& daoId, const ReceiptId& receiptId);

    /// Ids of all receipts stashed for a DAO, in key order
    std::vector<ReceiptId> ListReceipts(const DaoId& daoId);

private:
    Database& db_;
};

} // namespace db
} // namespace agora

#endif // AGORA_DB_GOVERNANCEDB_H
