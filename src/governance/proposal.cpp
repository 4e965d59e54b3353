// AGORA - Proposal Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <agora/governance/proposal.h>
#include <agora/governance/quorum.h>

#include <sstream>

namespace agora {
namespace governance {

const char* ProposalStateToString(ProposalState state) {
    switch (state) {
        case ProposalState::Pending: return "Pending";
        case ProposalState::Active: return "Active";
        case ProposalState::Defeated: return "Defeated";
        case ProposalState::Agreed: return "Agreed";
        case ProposalState::Queued: return "Queued";
        case ProposalState::Executable: return "Executable";
        case ProposalState::Extracted: return "Extracted";
        default: return "Unknown";
    }
}

// ============================================================================
// State Derivation
// ============================================================================

ProposalState Proposal::GetState(Timestamp now) const {
    if (now < startTime) {
        return ProposalState::Pending;
    }
    if (now <= endTime) {
        return ProposalState::Active;
    }
    if (!HasQuorum(forVotes, againstVotes, quorumVotes, quorumRate)) {
        return ProposalState::Defeated;
    }
    if (eta == 0) {
        return ProposalState::Agreed;
    }
    if (now < eta) {
        return ProposalState::Queued;
    }
    if (payload.has_value()) {
        return ProposalState::Executable;
    }
    return ProposalState::Extracted;
}

Timestamp Proposal::GetExecutableAfter() const {
    Timestamp t;
    if (!CheckedAdd(endTime, actionDelay, t)) {
        return MAX_AMOUNT;
    }
    return t;
}

std::optional<ActionKind> Proposal::GetActionKind() const {
    if (!payload) {
        return std::nullopt;
    }
    return governance::GetActionKind(*payload);
}

// ============================================================================
// Voting
// ============================================================================

GovernanceError Proposal::CheckAddVote(Amount amount, Timestamp now) const {
    if (GetState(now) != ProposalState::Active) {
        return GovernanceError::ProposalNotActive;
    }
    if (amount == 0) {
        return GovernanceError::ZeroStakeRejected;
    }
    // Keep for + against representable
    Amount total, newTotal;
    if (!CheckedAdd(forVotes, againstVotes, total) ||
        !CheckedAdd(total, amount, newTotal)) {
        return GovernanceError::VoteOverflow;
    }
    return GovernanceError::None;
}

GovernanceError Proposal::AddVote(VoteSide side, Amount amount, Timestamp now) {
    GovernanceError err = CheckAddVote(amount, now);
    if (err != GovernanceError::None) {
        return err;
    }
    if (side == VoteSide::For) {
        forVotes += amount;
    } else {
        againstVotes += amount;
    }
    return GovernanceError::None;
}

GovernanceError Proposal::MoveVote(VoteSide from, Amount amount, Timestamp now) {
    if (GetState(now) != ProposalState::Active) {
        return GovernanceError::ProposalNotActive;
    }
    Amount& source = from == VoteSide::For ? forVotes : againstVotes;
    Amount& target = from == VoteSide::For ? againstVotes : forVotes;
    if (source < amount) {
        return GovernanceError::VoteOverflow;
    }
    source -= amount;
    target += amount;
    return GovernanceError::None;
}

GovernanceError Proposal::RemoveVote(VoteSide side, Amount amount, Timestamp now) {
    if (GetState(now) != ProposalState::Active) {
        return GovernanceError::ProposalNotActive;
    }
    Amount& tally = side == VoteSide::For ? forVotes : againstVotes;
    if (tally < amount) {
        return GovernanceError::VoteOverflow;
    }
    tally -= amount;
    return GovernanceError::None;
}

// ============================================================================
// Execution Pipeline
// ============================================================================

GovernanceError Proposal::Queue(Timestamp now) {
    if (GetState(now) != ProposalState::Agreed) {
        return GovernanceError::ProposalNotPassed;
    }
    Timestamp newEta;
    if (!CheckedAdd(now, actionDelay, newEta)) {
        return GovernanceError::ArithmeticOverflow;
    }
    eta = newEta;
    return GovernanceError::None;
}

GovernanceResult<ActionPayload> Proposal::Extract(Timestamp now) {
    if (GetState(now) != ProposalState::Executable) {
        return GovernanceResult<ActionPayload>::Failure(GovernanceError::CannotExecuteProposal);
    }
    // eta >= endTime + actionDelay already holds for any queued proposal;
    // checked again against the snapshotted fields.
    if (now < GetExecutableAfter()) {
        return GovernanceResult<ActionPayload>::Failure(GovernanceError::TooEarlyToExecute);
    }
    ActionPayload extracted = std::move(*payload);
    payload.reset();
    return GovernanceResult<ActionPayload>::Success(std::move(extracted));
}

std::string Proposal::ToString() const {
    std::ostringstream oss;
    oss << "Proposal(" << id.ToHex().substr(0, 16)
        << " start=" << startTime
        << " end=" << endTime
        << " for=" << forVotes
        << " against=" << againstVotes
        << " eta=" << eta
        << " delay=" << actionDelay
        << " quorum=" << quorumVotes << "/" << FormatQuorumRate(quorumRate);
    if (payload) {
        oss << " " << ActionPayloadToString(*payload);
    }
    oss << ")";
    return oss.str();
}

} // namespace governance
} // namespace agora
