// AGORA - Proposal Actions
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Action payloads carried by proposals, and the single-use ProposalAction
// handed out when a proposal is executed.

#ifndef AGORA_GOVERNANCE_ACTION_H
#define AGORA_GOVERNANCE_ACTION_H

#include <agora/core/serialize.h>
#include <agora/core/types.h>
#include <agora/governance/dao_config.h>
#include <agora/governance/errors.h>

#include <optional>
#include <string>
#include <variant>

namespace agora {
namespace governance {

class Governance;

// ============================================================================
// Payloads
// ============================================================================

/// Move funds from the DAO treasury to a recipient
struct TreasuryTransfer {
    Address recipient;
    Amount amount{0};
    std::string memo;

    bool operator==(const TreasuryTransfer& other) const {
        return recipient == other.recipient && amount == other.amount &&
               memo == other.memo;
    }
};

/// Anything a proposal can execute
using ActionPayload = std::variant<ConfigUpdate, TreasuryTransfer>;

/// Kind of action, matching the ActionPayload alternatives in order
enum class ActionKind : uint8_t {
    ConfigUpdate = 0,
    TreasuryTransfer = 1
};

/// Convert action kind to string
const char* ActionKindToString(ActionKind kind);

/// Kind of a payload
inline ActionKind GetActionKind(const ActionPayload& payload) {
    return static_cast<ActionKind>(payload.index());
}

/// Human-readable payload description
std::string ActionPayloadToString(const ActionPayload& payload);

// ============================================================================
// Proposal Action
// ============================================================================

/**
 * An executed proposal's payload together with proof of where it came from.
 *
 * Must be consumed exactly once by the handler for its kind. It cannot be
 * copied or created outside the governance facade. Destroying an action
 * that still holds its payload logs an error.
 */
class ProposalAction {
public:
    ProposalAction(const ProposalAction&) = delete;
    ProposalAction& operator=(const ProposalAction&) = delete;

    ProposalAction(ProposalAction&& other) noexcept;
    ProposalAction& operator=(ProposalAction&& other) noexcept;

    ~ProposalAction();

    const DaoId& GetDaoId() const { return daoId_; }
    const ProposalId& GetProposalId() const { return proposalId_; }
    ActionKind GetKind() const { return kind_; }

    /// True once the payload has been taken (or the action moved from)
    bool IsConsumed() const { return !payload_.has_value(); }

    /// Inspect the payload without consuming it. nullptr if consumed or of
    /// another kind.
    template<typename T>
    const T* Peek() const {
        if (!payload_) return nullptr;
        return std::get_if<T>(&*payload_);
    }

    /**
     * Check that this action can be consumed as a T by the handler for
     * daoId, without consuming it.
     */
    template<typename T>
    GovernanceError CheckConsumable(const DaoId& daoId) const {
        if (!payload_) {
            return GovernanceError::ActionAlreadyConsumed;
        }
        if (daoId != daoId_) {
            return GovernanceError::DaoMismatch;
        }
        if (!std::holds_alternative<T>(*payload_)) {
            return GovernanceError::ActionKindMismatch;
        }
        return GovernanceError::None;
    }

    /**
     * Take the payload as a T. On any mismatch the action is left intact.
     */
    template<typename T>
    GovernanceResult<T> Consume(const DaoId& daoId) {
        GovernanceError err = CheckConsumable<T>(daoId);
        if (err != GovernanceError::None) {
            return GovernanceResult<T>::Failure(err);
        }
        T value = std::get<T>(std::move(*payload_));
        payload_.reset();
        return GovernanceResult<T>::Success(std::move(value));
    }

private:
    friend class Governance;

    ProposalAction(const DaoId& daoId, const ProposalId& proposalId, ActionPayload payload);

    DaoId daoId_;
    ProposalId proposalId_;
    ActionKind kind_;
    std::optional<ActionPayload> payload_;
};

// ============================================================================
// Serialization
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const TreasuryTransfer& transfer) {
    Serialize(s, transfer.recipient);
    ser_writedata64(s, transfer.amount);
    Serialize(s, transfer.memo);
}

template<typename Stream>
void Unserialize(Stream& s, TreasuryTransfer& transfer) {
    Unserialize(s, transfer.recipient);
    transfer.amount = ser_readdata64(s);
    Unserialize(s, transfer.memo);
}

template<typename Stream>
void Serialize(Stream& s, const ActionPayload& payload) {
    ser_writedata8(s, static_cast<uint8_t>(payload.index()));
    std::visit([&s](const auto& p) { Serialize(s, p); }, payload);
}

template<typename Stream>
void Unserialize(Stream& s, ActionPayload& payload) {
    switch (static_cast<ActionKind>(ser_readdata8(s))) {
        case ActionKind::ConfigUpdate: {
            ConfigUpdate update;
            Unserialize(s, update);
            payload = std::move(update);
            break;
        }
        case ActionKind::TreasuryTransfer: {
            TreasuryTransfer transfer;
            Unserialize(s, transfer);
            payload = std::move(transfer);
            break;
        }
        default:
            throw std::ios_base::failure("unknown action kind");
    }
}

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_ACTION_H
