// AGORA - Action Dispatcher Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <agora/governance/dispatcher.h>
#include <agora/governance/governance.h>
#include <agora/governance/treasury.h>
#include <agora/util/logging.h>

namespace agora {
namespace governance {

ActionDispatcher::ActionDispatcher(Governance& governance, Treasury& treasury)
    : governance_(governance), treasury_(treasury) {}

GovernanceError ActionDispatcher::Dispatch(ProposalAction&& action) {
    LOG_DEBUG(util::LogCategory::GOVERNANCE)
        << "Dispatching " << ActionKindToString(action.GetKind()) << " from proposal "
        << action.GetProposalId().ToHex().substr(0, 16);

    switch (action.GetKind()) {
        case ActionKind::ConfigUpdate:
            return governance_.ApplyConfigUpdate(std::move(action));
        case ActionKind::TreasuryTransfer:
            return treasury_.ApplyTransfer(std::move(action));
    }
    return GovernanceError::ActionKindMismatch;
}

} // namespace governance
} // namespace agora
