// AGORA - Governance Events
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Notifications emitted by the governance engine, and the sinks that
// receive them.

#ifndef AGORA_GOVERNANCE_EVENTS_H
#define AGORA_GOVERNANCE_EVENTS_H

#include <agora/core/types.h>
#include <agora/governance/action.h>
#include <agora/governance/dao_config.h>
#include <agora/governance/vote_receipt.h>

#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace agora {
namespace governance {

// ============================================================================
// Event Types
// ============================================================================

struct DaoCreated {
    DaoId daoId;
    std::string tokenType;
    DaoConfig config;
};

struct ProposalCreated {
    DaoId daoId;
    ProposalId proposalId;
    Address proposer;
    Timestamp startTime{0};
    Timestamp endTime{0};
    Duration actionDelay{0};
    Amount quorumVotes{0};
    FixedPoint quorumRate{0};
    std::optional<ActionKind> actionKind;
};

struct VoteCast {
    DaoId daoId;
    ProposalId proposalId;
    ReceiptId receiptId;
    Address voter;
    VoteSide side{VoteSide::For};
    Amount amount{0};
    Timestamp endTime{0};
};

/// Receipt flipped; side is the new side
struct VoteChanged {
    DaoId daoId;
    ProposalId proposalId;
    ReceiptId receiptId;
    Address voter;
    VoteSide side{VoteSide::For};
    Amount amount{0};
};

struct VoteRevoked {
    DaoId daoId;
    ProposalId proposalId;
    ReceiptId receiptId;
    Address voter;
    VoteSide side{VoteSide::For};
    Amount amount{0};
};

struct VoteUnstaked {
    DaoId daoId;
    ProposalId proposalId;
    ReceiptId receiptId;
    Address voter;
    Amount amount{0};
};

struct ProposalQueued {
    DaoId daoId;
    ProposalId proposalId;
    Timestamp eta{0};
};

struct ProposalExecuted {
    DaoId daoId;
    ProposalId proposalId;
    ActionKind kind{ActionKind::ConfigUpdate};
    Timestamp executedAt{0};
};

/// Carries the full configuration after the update
struct ConfigUpdated {
    DaoId daoId;
    ProposalId proposalId;
    DaoConfig config;
};

struct TreasuryDeposited {
    DaoId daoId;
    Address from;
    Amount amount{0};
    Amount balance{0};
};

struct TreasuryTransferred {
    DaoId daoId;
    ProposalId proposalId;
    Address recipient;
    Amount amount{0};
    Amount balance{0};
};

using GovernanceEvent = std::variant<
    DaoCreated,
    ProposalCreated,
    VoteCast,
    VoteChanged,
    VoteRevoked,
    VoteUnstaked,
    ProposalQueued,
    ProposalExecuted,
    ConfigUpdated,
    TreasuryDeposited,
    TreasuryTransferred
>;

/// Short name of an event's type, e.g. "VoteCast"
const char* EventName(const GovernanceEvent& event);

/// One-line description
std::string EventToString(const GovernanceEvent& event);

// ============================================================================
// Event Sinks
// ============================================================================

/// Receiver of governance notifications
class IEventSink {
public:
    virtual ~IEventSink() = default;

    virtual void Emit(const GovernanceEvent& event) = 0;
};

/**
 * Keeps every event in memory, in emission order. Used by indexers and
 * tests.
 */
class RecordingEventSink : public IEventSink {
public:
    void Emit(const GovernanceEvent& event) override;

    /// Copy of all recorded events
    std::vector<GovernanceEvent> GetEvents() const;

    size_t Count() const;

    /// Number of recorded events of type T
    template<typename T>
    size_t CountOf() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& event : events_) {
            if (std::holds_alternative<T>(event)) {
                ++n;
            }
        }
        return n;
    }

    /// Most recent event of type T, if any
    template<typename T>
    std::optional<T> Last() const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
            if (const T* event = std::get_if<T>(&*it)) {
                return *event;
            }
        }
        return std::nullopt;
    }

    void Clear();

private:
    mutable std::mutex mutex_;
    std::vector<GovernanceEvent> events_;
};

/// Forwards every event to the logger at Info level
class LoggingEventSink : public IEventSink {
public:
    void Emit(const GovernanceEvent& event) override;
};

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_EVENTS_H
