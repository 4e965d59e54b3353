// AGORA - Proposal
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// The proposal state machine. A proposal's state is never stored: it is
// derived from the current time, the tallies, eta and payload presence.
//
//   Pending -> Active -> Defeated
//                     -> Agreed -> Queued -> Executable -> Extracted

#ifndef AGORA_GOVERNANCE_PROPOSAL_H
#define AGORA_GOVERNANCE_PROPOSAL_H

#include <agora/core/serialize.h>
#include <agora/core/types.h>
#include <agora/governance/action.h>
#include <agora/governance/errors.h>
#include <agora/governance/vote_receipt.h>

#include <optional>
#include <string>

namespace agora {
namespace governance {

/// Lifecycle states, in progression order
enum class ProposalState : uint8_t {
    /// Created, voting has not started
    Pending = 0,

    /// Voting window open
    Active = 1,

    /// Voting closed without a qualifying supermajority
    Defeated = 2,

    /// Passed, not yet queued
    Agreed = 3,

    /// Queued, action delay not yet elapsed
    Queued = 4,

    /// Ready to execute, payload still present
    Executable = 5,

    /// Terminal, payload consumed (or never present)
    Extracted = 6
};

/// Convert state to string
const char* ProposalStateToString(ProposalState state);

/**
 * One governance motion.
 */
struct Proposal {
    ProposalId id;
    DaoId daoId;
    Address proposer;

    /// Voting opens (creation time + voting delay)
    Timestamp startTime{0};

    /// Voting closes, inclusive (start time + voting period)
    Timestamp endTime{0};

    Amount forVotes{0};
    Amount againstVotes{0};

    /// 0 until queued, then queue time + action delay
    Timestamp eta{0};

    /// Snapshotted at creation
    Duration actionDelay{0};
    Amount quorumVotes{0};
    FixedPoint quorumRate{0};

    /// Present until executed. A proposal created without one is a
    /// signal-only motion.
    std::optional<ActionPayload> payload;

    /// Derive the state at time now
    ProposalState GetState(Timestamp now) const;

    /// Earliest time Extract may succeed (endTime + actionDelay, saturating)
    Timestamp GetExecutableAfter() const;

    /// Tally for one side
    Amount GetVotes(VoteSide side) const {
        return side == VoteSide::For ? forVotes : againstVotes;
    }

    /// Kind of the payload, if any remains
    std::optional<ActionKind> GetActionKind() const;

    // ------------------------------------------------------------------------
    // Mutations. Each checks its own preconditions and changes nothing on
    // failure.
    // ------------------------------------------------------------------------

    /// Preconditions for adding a vote, without applying it
    GovernanceError CheckAddVote(Amount amount, Timestamp now) const;

    /// Add amount to one side's tally
    GovernanceError AddVote(VoteSide side, Amount amount, Timestamp now);

    /// Move amount from one side's tally to the other
    GovernanceError MoveVote(VoteSide from, Amount amount, Timestamp now);

    /// Remove amount from one side's tally
    GovernanceError RemoveVote(VoteSide side, Amount amount, Timestamp now);

    /// Agreed -> Queued; sets eta = now + actionDelay
    GovernanceError Queue(Timestamp now);

    /// Executable -> Extracted; hands out the payload exactly once
    GovernanceResult<ActionPayload> Extract(Timestamp now);

    std::string ToString() const;
};

// ============================================================================
// Serialization
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const Proposal& p) {
    Serialize(s, p.id);
    Serialize(s, p.daoId);
    Serialize(s, p.proposer);
    ser_writedata64(s, p.startTime);
    ser_writedata64(s, p.endTime);
    ser_writedata64(s, p.forVotes);
    ser_writedata64(s, p.againstVotes);
    ser_writedata64(s, p.eta);
    ser_writedata64(s, p.actionDelay);
    ser_writedata64(s, p.quorumVotes);
    ser_writedata64(s, p.quorumRate);
    Serialize(s, p.payload);
}

template<typename Stream>
void Unserialize(Stream& s, Proposal& p) {
    Unserialize(s, p.id);
    Unserialize(s, p.daoId);
    Unserialize(s, p.proposer);
    p.startTime = ser_readdata64(s);
    p.endTime = ser_readdata64(s);
    p.forVotes = ser_readdata64(s);
    p.againstVotes = ser_readdata64(s);
    p.eta = ser_readdata64(s);
    p.actionDelay = ser_readdata64(s);
    p.quorumVotes = ser_readdata64(s);
    p.quorumRate = ser_readdata64(s);
    Unserialize(s, p.payload);
}

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_PROPOSAL_H
