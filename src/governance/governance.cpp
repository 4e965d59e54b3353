// AGORA - Governance Engine Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <agora/governance/governance.h>
#include <agora/crypto/sha256.h>
#include <agora/util/logging.h>

#include <stdexcept>

namespace agora {
namespace governance {

namespace {

std::string ShortId(const Hash256& id) {
    return id.ToHex().substr(0, 16);
}

GovernanceError Reject(const char* operation, const Hash256& id, GovernanceError err) {
    LOG_DEBUG(util::LogCategory::GOVERNANCE)
        << operation << " " << ShortId(id) << " rejected: " << GovernanceErrorToString(err);
    return err;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

Governance::Governance(const DaoId& daoId, const DaoConfig& config,
                       std::shared_ptr<util::Clock> clock,
                       std::shared_ptr<ITokenCustody> custody,
                       std::shared_ptr<IEventSink> sink)
    : daoId_(daoId), clock_(std::move(clock)), custody_(std::move(custody)),
      sink_(std::move(sink)), config_(config) {
    if (!clock_) {
        throw std::invalid_argument("Governance requires a clock");
    }
    if (!custody_) {
        throw std::invalid_argument("Governance requires a token custody");
    }
}

GovernanceResult<std::unique_ptr<Governance>> Governance::Create(
    const DaoId& daoId,
    const DaoConfig& config,
    std::shared_ptr<util::Clock> clock,
    std::shared_ptr<ITokenCustody> custody,
    std::shared_ptr<IEventSink> sink) {

    using Result = GovernanceResult<std::unique_ptr<Governance>>;

    GovernanceError err = config.Validate();
    if (err != GovernanceError::None) {
        LOG_WARN(util::LogCategory::GOVERNANCE)
            << "Rejected genesis config for DAO " << ShortId(daoId) << ": "
            << GovernanceErrorToString(err);
        return Result::Failure(err);
    }

    std::unique_ptr<Governance> gov(new Governance(daoId, config, std::move(clock),
                                                   std::move(custody), std::move(sink)));

    LOG_INFO(util::LogCategory::GOVERNANCE)
        << "Created governance for DAO " << ShortId(daoId) << " " << config.ToString();

    return Result::Success(std::move(gov));
}

GovernanceResult<std::unique_ptr<Governance>> Governance::FromState(
    GovernanceState state,
    std::shared_ptr<util::Clock> clock,
    std::shared_ptr<ITokenCustody> custody,
    std::shared_ptr<IEventSink> sink) {

    using Result = GovernanceResult<std::unique_ptr<Governance>>;

    GovernanceError err = state.config.Validate();
    if (err != GovernanceError::None) {
        LOG_WARN(util::LogCategory::GOVERNANCE)
            << "Rejected stored config for DAO " << ShortId(state.daoId) << ": "
            << GovernanceErrorToString(err);
        return Result::Failure(err);
    }

    std::unique_ptr<Governance> gov(new Governance(state.daoId, state.config,
                                                   std::move(clock), std::move(custody),
                                                   std::move(sink)));

    // Every id consumed one sequence number
    if (state.nextSequence < state.proposals.size()) {
        LOG_WARN(util::LogCategory::GOVERNANCE)
            << "Stored sequence " << state.nextSequence << " for DAO " << ShortId(state.daoId)
            << " is behind its " << state.proposals.size() << " proposals";
        return Result::Failure(GovernanceError::InconsistentState);
    }

    for (auto& proposal : state.proposals) {
        if (proposal.daoId != state.daoId) {
            LOG_WARN(util::LogCategory::GOVERNANCE)
                << "Stored proposal " << ShortId(proposal.id) << " belongs to another DAO";
            return Result::Failure(GovernanceError::DaoMismatch);
        }
        ProposalId id = proposal.id;
        if (!gov->index_.emplace(id, gov->proposals_.size()).second) {
            LOG_WARN(util::LogCategory::GOVERNANCE)
                << "Stored proposal " << ShortId(id) << " appears twice";
            return Result::Failure(GovernanceError::InconsistentState);
        }
        gov->proposals_.push_back(std::move(proposal));
    }
    gov->nextSequence_ = state.nextSequence;

    LOG_INFO(util::LogCategory::GOVERNANCE)
        << "Restored governance for DAO " << ShortId(state.daoId) << " with "
        << gov->proposals_.size() << " proposals";

    return Result::Success(std::move(gov));
}

// ============================================================================
// Helpers
// ============================================================================

Proposal* Governance::FindProposal(const ProposalId& id) {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &proposals_[it->second];
}

const Proposal* Governance::FindProposal(const ProposalId& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &proposals_[it->second];
}

Hash256 Governance::NextId(const char* tag) {
    Byte hash[SHA256::OUTPUT_SIZE];
    SHA256 hasher;
    hasher.Write(daoId_.data(), daoId_.size())
          .Write(std::string(tag))
          .WriteU64(nextSequence_++);
    hasher.Finalize(hash);
    return Hash256(hash, sizeof(hash));
}

void Governance::EmitEvent(std::unique_lock<std::mutex>& lock,
                           const GovernanceEvent& event) {
    lock.unlock();
    if (sink_) {
        sink_->Emit(event);
    }
}

GovernanceError Governance::CheckReceipt(const ProposalId& id,
                                         const VoteReceipt& receipt) const {
    if (!FindProposal(id)) {
        return GovernanceError::ProposalNotFound;
    }
    if (receipt.GetDaoId() != daoId_) {
        return GovernanceError::DaoMismatch;
    }
    if (receipt.GetProposalId() != id) {
        return GovernanceError::ReceiptProposalMismatch;
    }
    return GovernanceError::None;
}

// ============================================================================
// Proposal Lifecycle
// ============================================================================

GovernanceResult<ProposalId> Governance::Propose(const Address& proposer,
                                                 std::optional<ActionPayload> payload,
                                                 Duration actionDelay,
                                                 Amount quorumVotes) {
    using Result = GovernanceResult<ProposalId>;

    std::unique_lock<std::mutex> lock(mutex_);
    Timestamp now = clock_->Now();

    if (actionDelay < config_.minActionDelay) {
        return Result::Failure(Reject("Propose for DAO", daoId_,
                                      GovernanceError::ActionDelayTooSmall));
    }
    if (quorumVotes < config_.minQuorumVotes) {
        return Result::Failure(Reject("Propose for DAO", daoId_,
                                      GovernanceError::MinQuorumVotesTooSmall));
    }

    Timestamp startTime, endTime;
    if (!CheckedAdd(now, config_.votingDelay, startTime) ||
        !CheckedAdd(startTime, config_.votingPeriod, endTime)) {
        return Result::Failure(Reject("Propose for DAO", daoId_,
                                      GovernanceError::ArithmeticOverflow));
    }

    Proposal proposal;
    proposal.id = ProposalId(NextId(PROPOSAL_ID_TAG));
    proposal.daoId = daoId_;
    proposal.proposer = proposer;
    proposal.startTime = startTime;
    proposal.endTime = endTime;
    proposal.actionDelay = actionDelay;
    proposal.quorumVotes = quorumVotes;
    proposal.quorumRate = config_.quorumRate;
    proposal.payload = std::move(payload);

    ProposalId id = proposal.id;
    std::optional<ActionKind> kind = proposal.GetActionKind();

    LOG_INFO(util::LogCategory::GOVERNANCE)
        << "New proposal " << ShortId(id) << " by " << proposer.ToHex().substr(0, 16)
        << ": voting " << startTime << ".." << endTime
        << " (" << util::FormatDurationMillis(config_.votingPeriod) << ")"
        << ", action " << (kind ? ActionKindToString(*kind) : "none");

    index_[id] = proposals_.size();
    proposals_.push_back(std::move(proposal));

    ProposalCreated event;
    event.daoId = daoId_;
    event.proposalId = id;
    event.proposer = proposer;
    event.startTime = startTime;
    event.endTime = endTime;
    event.actionDelay = actionDelay;
    event.quorumVotes = quorumVotes;
    event.quorumRate = config_.quorumRate;
    event.actionKind = kind;
    EmitEvent(lock, event);

    return Result::Success(id);
}

GovernanceError Governance::Queue(const ProposalId& id) {
    std::unique_lock<std::mutex> lock(mutex_);
    Timestamp now = clock_->Now();

    Proposal* proposal = FindProposal(id);
    if (!proposal) {
        return Reject("Queue", id, GovernanceError::ProposalNotFound);
    }

    GovernanceError err = proposal->Queue(now);
    if (err != GovernanceError::None) {
        return Reject("Queue", id, err);
    }

    LOG_INFO(util::LogCategory::GOVERNANCE)
        << "Queued proposal " << ShortId(id) << ", eta " << proposal->eta
        << " (" << util::FormatDurationMillis(proposal->actionDelay) << " delay)";

    EmitEvent(lock, ProposalQueued{daoId_, id, proposal->eta});
    return GovernanceError::None;
}

GovernanceResult<ProposalAction> Governance::Execute(const ProposalId& id) {
    using Result = GovernanceResult<ProposalAction>;

    std::unique_lock<std::mutex> lock(mutex_);
    Timestamp now = clock_->Now();

    Proposal* proposal = FindProposal(id);
    if (!proposal) {
        return Result::Failure(Reject("Execute", id, GovernanceError::ProposalNotFound));
    }

    GovernanceResult<ActionPayload> extracted = proposal->Extract(now);
    if (!extracted) {
        return Result::Failure(Reject("Execute", id, extracted.error));
    }

    ActionKind kind = GetActionKind(*extracted);

    LOG_INFO(util::LogCategory::GOVERNANCE)
        << "Executed proposal " << ShortId(id) << ": " << ActionPayloadToString(*extracted);

    EmitEvent(lock, ProposalExecuted{daoId_, id, kind, now});
    return Result::Success(ProposalAction(daoId_, id, extracted.Take()));
}

GovernanceError Governance::ApplyConfigUpdate(ProposalAction&& action) {
    std::unique_lock<std::mutex> lock(mutex_);

    GovernanceError err = action.CheckConsumable<ConfigUpdate>(daoId_);
    if (err != GovernanceError::None) {
        LOG_DEBUG(util::LogCategory::CONFIG)
            << "Config update rejected: " << GovernanceErrorToString(err);
        return err;
    }

    GovernanceResult<DaoConfig> merged =
        governance::ApplyConfigUpdate(config_, *action.Peek<ConfigUpdate>());
    if (!merged) {
        LOG_DEBUG(util::LogCategory::CONFIG)
            << "Config update from proposal " << ShortId(action.GetProposalId())
            << " rejected: " << GovernanceErrorToString(merged.error);
        return merged.error;
    }

    GovernanceResult<ConfigUpdate> consumed = action.Consume<ConfigUpdate>(daoId_);
    if (!consumed) {
        LOG_ERROR(util::LogCategory::CONFIG)
            << "Config update from proposal " << ShortId(action.GetProposalId())
            << " could not be consumed: " << GovernanceErrorToString(consumed.error);
        return consumed.error;
    }
    config_ = merged.Take();

    LOG_INFO(util::LogCategory::CONFIG)
        << "DAO " << ShortId(daoId_) << " config updated to " << config_.ToString();

    EmitEvent(lock, ConfigUpdated{daoId_, action.GetProposalId(), config_});
    return GovernanceError::None;
}

// ============================================================================
// Voting
// ============================================================================

GovernanceResult<VoteReceipt> Governance::CastVote(const Address& voter,
                                                   const ProposalId& id,
                                                   Amount stake, VoteSide side) {
    using Result = GovernanceResult<VoteReceipt>;

    std::unique_lock<std::mutex> lock(mutex_);
    Timestamp now = clock_->Now();

    Proposal* proposal = FindProposal(id);
    if (!proposal) {
        return Result::Failure(Reject("Vote on", id, GovernanceError::ProposalNotFound));
    }

    GovernanceError err = proposal->CheckAddVote(stake, now);
    if (err != GovernanceError::None) {
        return Result::Failure(Reject("Vote on", id, err));
    }

    if (!custody_->Lock(voter, stake)) {
        return Result::Failure(Reject("Vote on", id, GovernanceError::InsufficientBalance));
    }

    // Cannot fail: preconditions checked above under the same lock
    proposal->AddVote(side, stake, now);

    ReceiptId receiptId(NextId(RECEIPT_ID_TAG));
    VoteReceipt receipt(receiptId, daoId_, id, voter, stake, side, proposal->endTime);

    LOG_INFO(util::LogCategory::VOTING)
        << "Vote " << VoteSideToString(side) << " " << stake << " on " << ShortId(id)
        << " by " << voter.ToHex().substr(0, 16)
        << " (for=" << proposal->forVotes << " against=" << proposal->againstVotes << ")";

    EmitEvent(lock, VoteCast{daoId_, id, receiptId, voter, side, stake, proposal->endTime});
    return Result::Success(std::move(receipt));
}

GovernanceError Governance::ChangeVote(const ProposalId& id, VoteReceipt& receipt) {
    std::unique_lock<std::mutex> lock(mutex_);
    Timestamp now = clock_->Now();

    GovernanceError err = CheckReceipt(id, receipt);
    if (err != GovernanceError::None) {
        return Reject("Change vote on", id, err);
    }

    Proposal* proposal = FindProposal(id);
    err = proposal->MoveVote(receipt.GetSide(), receipt.GetStakedAmount(), now);
    if (err != GovernanceError::None) {
        return Reject("Change vote on", id, err);
    }
    receipt.SetSide(Opposite(receipt.GetSide()));

    LOG_INFO(util::LogCategory::VOTING)
        << "Vote " << ShortId(receipt.GetId()) << " changed to "
        << VoteSideToString(receipt.GetSide()) << " on " << ShortId(id)
        << " (for=" << proposal->forVotes << " against=" << proposal->againstVotes << ")";

    EmitEvent(lock, VoteChanged{daoId_, id, receipt.GetId(), receipt.GetVoter(),
                          receipt.GetSide(), receipt.GetStakedAmount()});
    return GovernanceError::None;
}

GovernanceResult<Amount> Governance::RevokeVote(const ProposalId& id, VoteReceipt&& receipt) {
    using Result = GovernanceResult<Amount>;

    std::unique_lock<std::mutex> lock(mutex_);
    Timestamp now = clock_->Now();

    GovernanceError err = CheckReceipt(id, receipt);
    if (err != GovernanceError::None) {
        return Result::Failure(Reject("Revoke vote on", id, err));
    }

    Proposal* proposal = FindProposal(id);
    Amount amount = receipt.GetStakedAmount();
    VoteSide side = receipt.GetSide();

    if (proposal->GetState(now) != ProposalState::Active) {
        return Result::Failure(Reject("Revoke vote on", id, GovernanceError::ProposalNotActive));
    }
    if (proposal->GetVotes(side) < amount) {
        return Result::Failure(Reject("Revoke vote on", id, GovernanceError::VoteOverflow));
    }
    if (!custody_->Release(receipt.GetVoter(), amount)) {
        LOG_ERROR(util::LogCategory::VOTING)
            << "Custody refused to release " << amount << " for receipt "
            << ShortId(receipt.GetId());
        return Result::Failure(GovernanceError::InsufficientBalance);
    }
    // State and tally checked above
    proposal->RemoveVote(side, amount, now);

    LOG_INFO(util::LogCategory::VOTING)
        << "Vote " << ShortId(receipt.GetId()) << " revoked on " << ShortId(id)
        << ", released " << amount
        << " (for=" << proposal->forVotes << " against=" << proposal->againstVotes << ")";

    EmitEvent(lock, VoteRevoked{daoId_, id, receipt.GetId(), receipt.GetVoter(), side, amount});
    receipt.Clear();
    return Result::Success(amount);
}

GovernanceResult<Amount> Governance::UnstakeVote(const ProposalId& id, VoteReceipt&& receipt) {
    using Result = GovernanceResult<Amount>;

    std::unique_lock<std::mutex> lock(mutex_);
    Timestamp now = clock_->Now();

    GovernanceError err = CheckReceipt(id, receipt);
    if (err != GovernanceError::None) {
        return Result::Failure(Reject("Unstake on", id, err));
    }

    ProposalState state = FindProposal(id)->GetState(now);
    if (state == ProposalState::Pending) {
        return Result::Failure(Reject("Unstake on", id, GovernanceError::ProposalNotActive));
    }
    if (state == ProposalState::Active) {
        return Result::Failure(Reject("Unstake on", id, GovernanceError::ProposalStillActive));
    }

    Amount amount = receipt.GetStakedAmount();
    if (!custody_->Release(receipt.GetVoter(), amount)) {
        LOG_ERROR(util::LogCategory::VOTING)
            << "Custody refused to release " << amount << " for receipt "
            << ShortId(receipt.GetId());
        return Result::Failure(GovernanceError::InsufficientBalance);
    }

    LOG_INFO(util::LogCategory::VOTING)
        << "Unstaked " << amount << " from " << ShortId(id)
        << " (" << ProposalStateToString(state) << ")";

    EmitEvent(lock, VoteUnstaked{daoId_, id, receipt.GetId(), receipt.GetVoter(), amount});
    receipt.Clear();
    return Result::Success(amount);
}

// ============================================================================
// Queries
// ============================================================================

GovernanceResult<ProposalState> Governance::GetState(const ProposalId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Proposal* proposal = FindProposal(id);
    if (!proposal) {
        return GovernanceResult<ProposalState>::Failure(GovernanceError::ProposalNotFound);
    }
    return GovernanceResult<ProposalState>::Success(proposal->GetState(clock_->Now()));
}

std::optional<Proposal> Governance::GetProposal(const ProposalId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Proposal* proposal = FindProposal(id);
    if (!proposal) {
        return std::nullopt;
    }
    return *proposal;
}

std::vector<Proposal> Governance::ListProposals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proposals_;
}

std::vector<Proposal> Governance::GetProposalsByState(ProposalState state) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Timestamp now = clock_->Now();
    std::vector<Proposal> result;
    for (const auto& proposal : proposals_) {
        if (proposal.GetState(now) == state) {
            result.push_back(proposal);
        }
    }
    return result;
}

size_t Governance::GetProposalCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proposals_.size();
}

DaoConfig Governance::GetConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

GovernanceState Governance::ExportState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    GovernanceState state;
    state.daoId = daoId_;
    state.config = config_;
    state.proposals = proposals_;
    state.nextSequence = nextSequence_;
    return state;
}

} // namespace governance
} // namespace agora
