// AGORA - Action Dispatcher
// Copyright (c) 2024 AGORA Developers
// MIT License

#ifndef AGORA_GOVERNANCE_DISPATCHER_H
#define AGORA_GOVERNANCE_DISPATCHER_H

#include <agora/governance/action.h>
#include <agora/governance/errors.h>

namespace agora {
namespace governance {

class Governance;
class Treasury;

/**
 * Routes an executed ProposalAction to the handler for its kind:
 * ConfigUpdate to the governance engine, TreasuryTransfer to the treasury.
 * Both must belong to the same DAO.
 */
class ActionDispatcher {
public:
    ActionDispatcher(Governance& governance, Treasury& treasury);

    /// On rejection the action is left unconsumed with the caller
    GovernanceError Dispatch(ProposalAction&& action);

private:
    Governance& governance_;
    Treasury& treasury_;
};

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_DISPATCHER_H
