// AGORA - DAO Factory Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <agora/governance/factory.h>
#include <agora/crypto/sha256.h>
#include <agora/governance/governance.h>
#include <agora/util/logging.h>

#include <stdexcept>

namespace agora {
namespace governance {

DaoFactory::DaoFactory(std::shared_ptr<util::Clock> clock,
                       std::shared_ptr<ITokenCustody> custody,
                       std::shared_ptr<IEventSink> sink)
    : clock_(std::move(clock)), custody_(std::move(custody)), sink_(std::move(sink)) {
    if (!clock_ || !custody_) {
        throw std::invalid_argument("DaoFactory requires a clock and a token custody");
    }
}

DaoId DaoFactory::DeriveDaoId(const std::string& tokenType) {
    return DaoId(SHA256Hash(tokenType));
}

GovernanceResult<std::unique_ptr<Governance>> DaoFactory::CreateDao(DaoWitness&& witness,
                                                                    const DaoConfig& config) {
    using Result = GovernanceResult<std::unique_ptr<Governance>>;

    std::unique_lock<std::mutex> lock(mutex_);

    GovernanceError err = config.Validate();
    if (err != GovernanceError::None) {
        LOG_DEBUG(util::LogCategory::GOVERNANCE)
            << "DAO creation for " << witness.GetTokenType() << " rejected: "
            << GovernanceErrorToString(err);
        return Result::Failure(err);
    }

    if (witness.IsConsumed() || registered_.count(witness.GetTokenType()) > 0) {
        LOG_DEBUG(util::LogCategory::GOVERNANCE)
            << "DAO creation for " << witness.GetTokenType() << " rejected: "
            << GovernanceErrorToString(GovernanceError::DuplicateWitness);
        return Result::Failure(GovernanceError::DuplicateWitness);
    }

    DaoId daoId = DeriveDaoId(witness.GetTokenType());
    Result created = Governance::Create(daoId, config, clock_, custody_, sink_);
    if (!created) {
        return created;
    }

    witness.consumed_ = true;
    registered_.emplace(witness.GetTokenType(), daoId);

    LOG_INFO(util::LogCategory::GOVERNANCE)
        << "DAO " << daoId.ToHex().substr(0, 16) << " created for token "
        << witness.GetTokenType();

    lock.unlock();
    if (sink_) {
        sink_->Emit(DaoCreated{daoId, witness.GetTokenType(), config});
    }
    return created;
}

bool DaoFactory::IsRegistered(const std::string& tokenType) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registered_.count(tokenType) > 0;
}

size_t DaoFactory::GetDaoCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registered_.size();
}

} // namespace governance
} // namespace agora
