// AGORA - Token Custody
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Interface to the governance token's balances. Stake locked by a vote, and
// funds held by a treasury, leave the holder's liquid balance and come back
// only through Release.

#ifndef AGORA_GOVERNANCE_CUSTODY_H
#define AGORA_GOVERNANCE_CUSTODY_H

#include <agora/core/types.h>
#include <agora/governance/errors.h>

#include <map>
#include <mutex>

namespace agora {
namespace governance {

class ITokenCustody {
public:
    virtual ~ITokenCustody() = default;

    /// Move amount out of holder's liquid balance into custody.
    /// Returns false (and changes nothing) if the balance is short.
    virtual bool Lock(const Address& holder, Amount amount) = 0;

    /// Return amount from custody to holder's liquid balance.
    /// Returns false (and changes nothing) if custody holds less.
    virtual bool Release(const Address& holder, Amount amount) = 0;

    /// Liquid balance of a holder
    virtual Amount BalanceOf(const Address& holder) const = 0;
};

// ============================================================================
// Token Ledger
// ============================================================================

/**
 * In-memory ledger of liquid balances plus a single pooled custody amount.
 */
class TokenLedger : public ITokenCustody {
public:
    TokenLedger() = default;

    /// Mint amount to holder. ArithmeticOverflow if the supply would overflow.
    GovernanceError Credit(const Address& holder, Amount amount);

    bool Lock(const Address& holder, Amount amount) override;
    bool Release(const Address& holder, Amount amount) override;
    Amount BalanceOf(const Address& holder) const override;

    /// Amount currently held in custody
    Amount TotalLocked() const;

    /// Liquid plus locked
    Amount TotalSupply() const;

private:
    mutable std::mutex mutex_;
    std::map<Address, Amount> balances_;
    Amount locked_{0};
    Amount supply_{0};
};

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_CUSTODY_H
