// AGORA - Token Custody Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <agora/governance/custody.h>

namespace agora {
namespace governance {

GovernanceError TokenLedger::Credit(const Address& holder, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Every balance is bounded by the supply, so checking the supply suffices
    Amount newSupply;
    if (!CheckedAdd(supply_, amount, newSupply)) {
        return GovernanceError::ArithmeticOverflow;
    }
    supply_ = newSupply;
    balances_[holder] += amount;
    return GovernanceError::None;
}

bool TokenLedger::Lock(const Address& holder, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(holder);
    Amount balance = it == balances_.end() ? 0 : it->second;
    if (balance < amount) {
        return false;
    }
    if (amount == 0) {
        return true;
    }
    it->second -= amount;
    locked_ += amount;
    return true;
}

bool TokenLedger::Release(const Address& holder, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount > locked_) {
        return false;
    }
    locked_ -= amount;
    balances_[holder] += amount;
    return true;
}

Amount TokenLedger::BalanceOf(const Address& holder) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(holder);
    return it == balances_.end() ? 0 : it->second;
}

Amount TokenLedger::TotalLocked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locked_;
}

Amount TokenLedger::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return supply_;
}

} // namespace governance
} // namespace agora
