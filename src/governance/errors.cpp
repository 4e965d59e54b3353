// AGORA - Governance Errors Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <agora/governance/errors.h>

namespace agora {
namespace governance {

const char* GovernanceErrorToString(GovernanceError error) {
    switch (error) {
        case GovernanceError::None: return "ok";
        case GovernanceError::InvalidQuorumRate: return "invalid quorum rate";
        case GovernanceError::ZeroVotingDelay: return "voting delay must be positive";
        case GovernanceError::ZeroVotingPeriod: return "voting period must be positive";
        case GovernanceError::ZeroMinActionDelay: return "min action delay must be positive";
        case GovernanceError::ZeroMinQuorumVotes: return "min quorum votes must be positive";
        case GovernanceError::ActionDelayTooSmall: return "action delay below DAO minimum";
        case GovernanceError::MinQuorumVotesTooSmall: return "quorum votes below DAO minimum";
        case GovernanceError::ProposalNotActive: return "proposal is not active";
        case GovernanceError::ProposalNotPassed: return "proposal has not passed";
        case GovernanceError::CannotExecuteProposal: return "proposal cannot be executed";
        case GovernanceError::TooEarlyToExecute: return "too early to execute";
        case GovernanceError::ProposalNotFound: return "proposal not found";
        case GovernanceError::ZeroStakeRejected: return "stake must be positive";
        case GovernanceError::ReceiptProposalMismatch: return "receipt belongs to another proposal";
        case GovernanceError::ProposalStillActive: return "proposal is still active";
        case GovernanceError::InsufficientBalance: return "insufficient balance";
        case GovernanceError::VoteOverflow: return "vote tally out of range";
        case GovernanceError::DuplicateWitness: return "witness already used";
        case GovernanceError::DaoMismatch: return "object belongs to another DAO";
        case GovernanceError::ActionKindMismatch: return "wrong action kind";
        case GovernanceError::ActionAlreadyConsumed: return "action already consumed";
        case GovernanceError::InsufficientTreasuryFunds: return "insufficient treasury funds";
        case GovernanceError::ArithmeticOverflow: return "arithmetic overflow";
        case GovernanceError::InconsistentState: return "inconsistent stored state";
        default: return "unknown";
    }
}

} // namespace governance
} // namespace agora
