// AGORA - Governance Errors
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Failure reasons reported by governance operations, and the result type
// carried by operations that produce a value.

#ifndef AGORA_GOVERNANCE_ERRORS_H
#define AGORA_GOVERNANCE_ERRORS_H

#include <optional>
#include <utility>

namespace agora {
namespace governance {

/**
 * Reason a governance operation was rejected. Every rejection leaves all
 * state exactly as it was before the call.
 */
enum class GovernanceError {
    /// Operation succeeded
    None = 0,

    // Configuration validation
    InvalidQuorumRate,
    ZeroVotingDelay,
    ZeroVotingPeriod,
    ZeroMinActionDelay,
    ZeroMinQuorumVotes,

    // Proposal preconditions
    ActionDelayTooSmall,
    MinQuorumVotesTooSmall,
    ProposalNotActive,
    ProposalNotPassed,
    CannotExecuteProposal,
    TooEarlyToExecute,
    ProposalNotFound,

    // Vote consistency
    ZeroStakeRejected,
    ReceiptProposalMismatch,
    ProposalStillActive,
    InsufficientBalance,
    VoteOverflow,

    // Identity
    DuplicateWitness,
    DaoMismatch,
    ActionKindMismatch,
    ActionAlreadyConsumed,

    // Treasury and custody
    InsufficientTreasuryFunds,
    ArithmeticOverflow,

    // Restored state
    InconsistentState,
};

/// Convert error to string
const char* GovernanceErrorToString(GovernanceError error);

/**
 * Outcome of an operation that yields a value on success.
 */
template<typename T>
struct GovernanceResult {
    std::optional<T> value;
    GovernanceError error{GovernanceError::None};

    static GovernanceResult Success(T v) {
        GovernanceResult r;
        r.value.emplace(std::move(v));
        return r;
    }

    static GovernanceResult Failure(GovernanceError e) {
        GovernanceResult r;
        r.error = e;
        return r;
    }

    bool IsValid() const { return error == GovernanceError::None && value.has_value(); }
    explicit operator bool() const { return IsValid(); }

    T& operator*() { return *value; }
    const T& operator*() const { return *value; }
    T* operator->() { return &*value; }
    const T* operator->() const { return &*value; }

    /// Move the value out (undefined if !IsValid())
    T Take() { return std::move(*value); }
};

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_ERRORS_H
