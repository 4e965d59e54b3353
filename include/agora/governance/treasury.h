// AGORA - DAO Treasury
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Pooled funds owned by one DAO. Funds only leave through an executed
// TreasuryTransfer action.

#ifndef AGORA_GOVERNANCE_TREASURY_H
#define AGORA_GOVERNANCE_TREASURY_H

#include <agora/core/types.h>
#include <agora/governance/action.h>
#include <agora/governance/custody.h>
#include <agora/governance/errors.h>
#include <agora/governance/events.h>

#include <memory>
#include <mutex>

namespace agora {
namespace governance {

class Treasury {
public:
    /**
     * Create an empty treasury for a DAO.
     *
     * @param daoId DAO that owns the funds
     * @param custody Token custody holding the pooled funds (required)
     * @param sink Event sink (may be null)
     */
    Treasury(const DaoId& daoId, std::shared_ptr<ITokenCustody> custody,
             std::shared_ptr<IEventSink> sink);

    Treasury(const Treasury&) = delete;
    Treasury& operator=(const Treasury&) = delete;

    // ========================================================================
    // Fund Management
    // ========================================================================

    /// Move amount from a holder's balance into the treasury
    GovernanceError Deposit(const Address& from, Amount amount);

    /**
     * Apply an executed TreasuryTransfer action, paying the recipient.
     *
     * Rejects actions from another DAO, of another kind, already consumed,
     * or for more than the balance. On rejection the action is untouched.
     */
    GovernanceError ApplyTransfer(ProposalAction&& action);

    Amount GetBalance() const;
    const DaoId& GetDaoId() const { return daoId_; }

private:
    /// Releases the lock before notifying the sink
    void EmitEvent(std::unique_lock<std::mutex>& lock, const GovernanceEvent& event);

    const DaoId daoId_;
    std::shared_ptr<ITokenCustody> custody_;
    std::shared_ptr<IEventSink> sink_;

    mutable std::mutex mutex_;
    Amount balance_{0};
};

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_TREASURY_H
