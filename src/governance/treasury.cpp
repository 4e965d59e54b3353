// AGORA - DAO Treasury Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <agora/governance/treasury.h>
#include <agora/util/logging.h>

#include <stdexcept>

namespace agora {
namespace governance {

Treasury::Treasury(const DaoId& daoId, std::shared_ptr<ITokenCustody> custody,
                   std::shared_ptr<IEventSink> sink)
    : daoId_(daoId), custody_(std::move(custody)), sink_(std::move(sink)) {
    if (!custody_) {
        throw std::invalid_argument("Treasury requires a token custody");
    }
}

void Treasury::EmitEvent(std::unique_lock<std::mutex>& lock, const GovernanceEvent& event) {
    lock.unlock();
    if (sink_) {
        sink_->Emit(event);
    }
}

GovernanceError Treasury::Deposit(const Address& from, Amount amount) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (amount == 0) {
        return GovernanceError::None;
    }

    Amount newBalance;
    if (!CheckedAdd(balance_, amount, newBalance)) {
        return GovernanceError::ArithmeticOverflow;
    }
    if (!custody_->Lock(from, amount)) {
        LOG_DEBUG(util::LogCategory::TREASURY)
            << "Deposit of " << amount << " rejected: "
            << GovernanceErrorToString(GovernanceError::InsufficientBalance);
        return GovernanceError::InsufficientBalance;
    }
    balance_ = newBalance;

    LOG_INFO(util::LogCategory::TREASURY)
        << "Deposited " << amount << " from " << from.ToHex().substr(0, 16)
        << ", balance " << balance_;

    EmitEvent(lock, TreasuryDeposited{daoId_, from, amount, balance_});
    return GovernanceError::None;
}

GovernanceError Treasury::ApplyTransfer(ProposalAction&& action) {
    std::unique_lock<std::mutex> lock(mutex_);

    GovernanceError err = action.CheckConsumable<TreasuryTransfer>(daoId_);
    if (err != GovernanceError::None) {
        LOG_DEBUG(util::LogCategory::TREASURY)
            << "Transfer rejected: " << GovernanceErrorToString(err);
        return err;
    }

    const TreasuryTransfer* pending = action.Peek<TreasuryTransfer>();
    if (pending->amount > balance_) {
        LOG_DEBUG(util::LogCategory::TREASURY)
            << "Transfer of " << pending->amount << " rejected, balance " << balance_;
        return GovernanceError::InsufficientTreasuryFunds;
    }

    // Funds are in custody whenever balance_ covers them
    if (!custody_->Release(pending->recipient, pending->amount)) {
        LOG_ERROR(util::LogCategory::TREASURY)
            << "Custody refused release of " << pending->amount
            << " with treasury balance " << balance_;
        return GovernanceError::InsufficientTreasuryFunds;
    }

    TreasuryTransfer transfer = action.Consume<TreasuryTransfer>(daoId_).Take();
    balance_ -= transfer.amount;

    LOG_INFO(util::LogCategory::TREASURY)
        << "Transferred " << transfer.amount << " to "
        << transfer.recipient.ToHex().substr(0, 16)
        << " (proposal " << action.GetProposalId().ToHex().substr(0, 16)
        << "), balance " << balance_;

    EmitEvent(lock, TreasuryTransferred{daoId_, action.GetProposalId(), transfer.recipient,
                                        transfer.amount, balance_});
    return GovernanceError::None;
}

Amount Treasury::GetBalance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return balance_;
}

} // namespace governance
} // namespace agora
