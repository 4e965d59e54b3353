// AGORA - Governance Engine
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// The governance facade for one DAO. It owns the DAO's configuration and
// proposals, locks and releases voting stake through token custody, and
// hands executed payloads out as single-use ProposalActions.
//
// Every operation reads the clock once, checks all of its preconditions,
// and only then mutates state. A rejected call changes nothing.

#ifndef AGORA_GOVERNANCE_GOVERNANCE_H
#define AGORA_GOVERNANCE_GOVERNANCE_H

#include <agora/core/types.h>
#include <agora/governance/action.h>
#include <agora/governance/custody.h>
#include <agora/governance/dao_config.h>
#include <agora/governance/errors.h>
#include <agora/governance/events.h>
#include <agora/governance/proposal.h>
#include <agora/governance/vote_receipt.h>
#include <agora/util/time.h>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agora {
namespace governance {

/// Tag mixed into proposal identifiers
constexpr const char* PROPOSAL_ID_TAG = "proposal";

/// Tag mixed into receipt identifiers
constexpr const char* RECEIPT_ID_TAG = "receipt";

/**
 * Complete persistent state of one DAO's governance.
 */
struct GovernanceState {
    DaoId daoId;
    DaoConfig config;

    /// In creation order
    std::vector<Proposal> proposals;

    /// Next value of the identifier sequence
    uint64_t nextSequence{0};
};

// ============================================================================
// Governance Engine
// ============================================================================

class Governance {
public:
    /**
     * Create the governance engine for a new DAO.
     *
     * @param daoId DAO identity
     * @param config Genesis configuration, validated here
     * @param clock Time source (required)
     * @param custody Token custody for voting stake (required)
     * @param sink Event sink (may be null)
     * @throws std::invalid_argument if clock or custody is null
     */
    static GovernanceResult<std::unique_ptr<Governance>> Create(
        const DaoId& daoId,
        const DaoConfig& config,
        std::shared_ptr<util::Clock> clock,
        std::shared_ptr<ITokenCustody> custody,
        std::shared_ptr<IEventSink> sink);

    /**
     * Rebuild an engine from exported or loaded state. The configuration is
     * revalidated and every proposal must belong to state.daoId.
     */
    static GovernanceResult<std::unique_ptr<Governance>> FromState(
        GovernanceState state,
        std::shared_ptr<util::Clock> clock,
        std::shared_ptr<ITokenCustody> custody,
        std::shared_ptr<IEventSink> sink);

    Governance(const Governance&) = delete;
    Governance& operator=(const Governance&) = delete;

    // === Proposal Lifecycle ===

    /**
     * Create a proposal. Voting opens after the configured voting delay
     * and lasts the configured voting period.
     *
     * @param proposer Creator of the proposal
     * @param payload Action executed if the proposal passes; none for a
     *                signal-only motion
     * @param actionDelay Delay between queueing and execution, at least
     *                    the configured minimum
     * @param quorumVotes Minimum for-votes, at least the configured minimum
     */
    GovernanceResult<ProposalId> Propose(const Address& proposer,
                                         std::optional<ActionPayload> payload,
                                         Duration actionDelay,
                                         Amount quorumVotes);

    /// Agreed -> Queued
    GovernanceError Queue(const ProposalId& id);

    /// Executable -> Extracted. The returned action must be dispatched.
    GovernanceResult<ProposalAction> Execute(const ProposalId& id);

    /**
     * Apply an executed ConfigUpdate action to this DAO's configuration.
     * The merged configuration is validated as a whole; on rejection both
     * the configuration and the action are unchanged.
     */
    GovernanceError ApplyConfigUpdate(ProposalAction&& action);

    // === Voting ===

    /// Lock stake from voter and add it to one side of an Active proposal
    GovernanceResult<VoteReceipt> CastVote(const Address& voter, const ProposalId& id,
                                           Amount stake, VoteSide side);

    /// Flip a receipt's side while the proposal is Active
    GovernanceError ChangeVote(const ProposalId& id, VoteReceipt& receipt);

    /// Withdraw a vote while Active; returns the released stake
    GovernanceResult<Amount> RevokeVote(const ProposalId& id, VoteReceipt&& receipt);

    /// Reclaim stake once voting has closed; tallies are kept
    GovernanceResult<Amount> UnstakeVote(const ProposalId& id, VoteReceipt&& receipt);

    // === Queries ===

    GovernanceResult<ProposalState> GetState(const ProposalId& id) const;
    std::optional<Proposal> GetProposal(const ProposalId& id) const;

    /// All proposals in creation order
    std::vector<Proposal> ListProposals() const;

    std::vector<Proposal> GetProposalsByState(ProposalState state) const;
    size_t GetProposalCount() const;

    DaoConfig GetConfig() const;
    const DaoId& GetDaoId() const { return daoId_; }

    /// Snapshot for persistence
    GovernanceState ExportState() const;

private:
    Governance(const DaoId& daoId, const DaoConfig& config,
               std::shared_ptr<util::Clock> clock,
               std::shared_ptr<ITokenCustody> custody,
               std::shared_ptr<IEventSink> sink);

    Proposal* FindProposal(const ProposalId& id);
    const Proposal* FindProposal(const ProposalId& id) const;

    /// Common receipt checks for change/revoke/unstake
    GovernanceError CheckReceipt(const ProposalId& id, const VoteReceipt& receipt) const;

    /// SHA256(daoId || tag || sequence), advancing the sequence
    Hash256 NextId(const char* tag);

    /// Releases the lock, then notifies the sink. The sink may call back in.
    void EmitEvent(std::unique_lock<std::mutex>& lock, const GovernanceEvent& event);

    const DaoId daoId_;
    std::shared_ptr<util::Clock> clock_;
    std::shared_ptr<ITokenCustody> custody_;
    std::shared_ptr<IEventSink> sink_;

    mutable std::mutex mutex_;
    DaoConfig config_;
    std::vector<Proposal> proposals_;
    std::map<ProposalId, size_t> index_;
    uint64_t nextSequence_{0};
};

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_GOVERNANCE_H
