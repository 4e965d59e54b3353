// AGORA - Proposal Actions Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <agora/governance/action.h>
#include <agora/util/logging.h>

#include <sstream>

namespace agora {
namespace governance {

const char* ActionKindToString(ActionKind kind) {
    switch (kind) {
        case ActionKind::ConfigUpdate: return "ConfigUpdate";
        case ActionKind::TreasuryTransfer: return "TreasuryTransfer";
        default: return "Unknown";
    }
}

std::string ActionPayloadToString(const ActionPayload& payload) {
    if (const auto* update = std::get_if<ConfigUpdate>(&payload)) {
        return update->ToString();
    }
    const auto& transfer = std::get<TreasuryTransfer>(payload);
    std::ostringstream oss;
    oss << "TreasuryTransfer(" << transfer.amount << " to "
        << transfer.recipient.ToHex().substr(0, 16);
    if (!transfer.memo.empty()) {
        oss << " \"" << transfer.memo << "\"";
    }
    oss << ")";
    return oss.str();
}

ProposalAction::ProposalAction(const DaoId& daoId, const ProposalId& proposalId,
                               ActionPayload payload)
    : daoId_(daoId), proposalId_(proposalId), kind_(GetActionKind(payload)),
      payload_(std::move(payload)) {}

ProposalAction::ProposalAction(ProposalAction&& other) noexcept
    : daoId_(other.daoId_), proposalId_(other.proposalId_), kind_(other.kind_),
      payload_(std::move(other.payload_)) {
    other.payload_.reset();
}

ProposalAction& ProposalAction::operator=(ProposalAction&& other) noexcept {
    if (this != &other) {
        if (payload_) {
            LOG_ERROR(util::LogCategory::GOVERNANCE)
                << "Unconsumed " << ActionKindToString(kind_) << " action for proposal "
                << proposalId_.ToHex() << " overwritten";
        }
        daoId_ = other.daoId_;
        proposalId_ = other.proposalId_;
        kind_ = other.kind_;
        payload_ = std::move(other.payload_);
        other.payload_.reset();
    }
    return *this;
}

ProposalAction::~ProposalAction() {
    if (payload_) {
        LOG_ERROR(util::LogCategory::GOVERNANCE)
            << "Unconsumed " << ActionKindToString(kind_) << " action for proposal "
            << proposalId_.ToHex() << " dropped";
    }
}

} // namespace governance
} // namespace agora
