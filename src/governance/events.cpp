// AGORA - Governance Events Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <agora/governance/events.h>
#include <agora/governance/quorum.h>
#include <agora/util/logging.h>

#include <sstream>

namespace agora {
namespace governance {

namespace {

std::string ShortHex(const Hash256& hash) {
    return hash.ToHex().substr(0, 16);
}

std::string ShortHex(const Hash160& hash) {
    return hash.ToHex().substr(0, 16);
}

struct EventNamer {
    const char* operator()(const DaoCreated&) const { return "DaoCreated"; }
    const char* operator()(const ProposalCreated&) const { return "ProposalCreated"; }
    const char* operator()(const VoteCast&) const { return "VoteCast"; }
    const char* operator()(const VoteChanged&) const { return "VoteChanged"; }
    const char* operator()(const VoteRevoked&) const { return "VoteRevoked"; }
    const char* operator()(const VoteUnstaked&) const { return "VoteUnstaked"; }
    const char* operator()(const ProposalQueued&) const { return "ProposalQueued"; }
    const char* operator()(const ProposalExecuted&) const { return "ProposalExecuted"; }
    const char* operator()(const ConfigUpdated&) const { return "ConfigUpdated"; }
    const char* operator()(const TreasuryDeposited&) const { return "TreasuryDeposited"; }
    const char* operator()(const TreasuryTransferred&) const { return "TreasuryTransferred"; }
};

struct EventFormatter {
    std::ostringstream& oss;

    void operator()(const DaoCreated& e) const {
        oss << "dao=" << ShortHex(e.daoId) << " token=" << e.tokenType
            << " " << e.config.ToString();
    }

    void operator()(const ProposalCreated& e) const {
        oss << "dao=" << ShortHex(e.daoId) << " proposal=" << ShortHex(e.proposalId)
            << " proposer=" << ShortHex(e.proposer)
            << " start=" << e.startTime << " end=" << e.endTime
            << " delay=" << e.actionDelay
            << " quorum=" << e.quorumVotes << "/" << FormatQuorumRate(e.quorumRate)
            << " action=" << (e.actionKind ? ActionKindToString(*e.actionKind) : "none");
    }

    void operator()(const VoteCast& e) const {
        oss << "proposal=" << ShortHex(e.proposalId) << " receipt=" << ShortHex(e.receiptId)
            << " voter=" << ShortHex(e.voter) << " " << VoteSideToString(e.side)
            << " amount=" << e.amount << " end=" << e.endTime;
    }

    void operator()(const VoteChanged& e) const {
        oss << "proposal=" << ShortHex(e.proposalId) << " receipt=" << ShortHex(e.receiptId)
            << " voter=" << ShortHex(e.voter) << " now " << VoteSideToString(e.side)
            << " amount=" << e.amount;
    }

    void operator()(const VoteRevoked& e) const {
        oss << "proposal=" << ShortHex(e.proposalId) << " receipt=" << ShortHex(e.receiptId)
            << " voter=" << ShortHex(e.voter) << " " << VoteSideToString(e.side)
            << " amount=" << e.amount;
    }

    void operator()(const VoteUnstaked& e) const {
        oss << "proposal=" << ShortHex(e.proposalId) << " receipt=" << ShortHex(e.receiptId)
            << " voter=" << ShortHex(e.voter) << " amount=" << e.amount;
    }

    void operator()(const ProposalQueued& e) const {
        oss << "proposal=" << ShortHex(e.proposalId) << " eta=" << e.eta;
    }

    void operator()(const ProposalExecuted& e) const {
        oss << "proposal=" << ShortHex(e.proposalId) << " action=" << ActionKindToString(e.kind)
            << " at=" << e.executedAt;
    }

    void operator()(const ConfigUpdated& e) const {
        oss << "dao=" << ShortHex(e.daoId) << " proposal=" << ShortHex(e.proposalId)
            << " " << e.config.ToString();
    }

    void operator()(const TreasuryDeposited& e) const {
        oss << "dao=" << ShortHex(e.daoId) << " from=" << ShortHex(e.from)
            << " amount=" << e.amount << " balance=" << e.balance;
    }

    void operator()(const TreasuryTransferred& e) const {
        oss << "dao=" << ShortHex(e.daoId) << " proposal=" << ShortHex(e.proposalId)
            << " to=" << ShortHex(e.recipient)
            << " amount=" << e.amount << " balance=" << e.balance;
    }
};

} // namespace

const char* EventName(const GovernanceEvent& event) {
    return std::visit(EventNamer{}, event);
}

std::string EventToString(const GovernanceEvent& event) {
    std::ostringstream oss;
    oss << EventName(event) << "(";
    std::visit(EventFormatter{oss}, event);
    oss << ")";
    return oss.str();
}

// ============================================================================
// RecordingEventSink
// ============================================================================

void RecordingEventSink::Emit(const GovernanceEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
}

std::vector<GovernanceEvent> RecordingEventSink::GetEvents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

size_t RecordingEventSink::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

void RecordingEventSink::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

// ============================================================================
// LoggingEventSink
// ============================================================================

void LoggingEventSink::Emit(const GovernanceEvent& event) {
    LOG_INFO(util::LogCategory::GOVERNANCE) << "event " << EventToString(event);
}

} // namespace governance
} // namespace agora
