// AGORA - DAO Factory
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Creates one DAO per governance token type. Creation consumes a one-time
// DaoWitness for the token type.

#ifndef AGORA_GOVERNANCE_FACTORY_H
#define AGORA_GOVERNANCE_FACTORY_H

#include <agora/core/types.h>
#include <agora/governance/custody.h>
#include <agora/governance/dao_config.h>
#include <agora/governance/errors.h>
#include <agora/governance/events.h>
#include <agora/util/time.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace agora {
namespace governance {

class Governance;

/**
 * One-time proof that the holder may create the DAO for a token type.
 * Move-only; moving or using it leaves the source consumed.
 */
class DaoWitness {
public:
    explicit DaoWitness(std::string tokenType)
        : tokenType_(std::move(tokenType)) {}

    DaoWitness(const DaoWitness&) = delete;
    DaoWitness& operator=(const DaoWitness&) = delete;

    DaoWitness(DaoWitness&& other) noexcept
        : tokenType_(std::move(other.tokenType_)), consumed_(other.consumed_) {
        other.consumed_ = true;
    }

    DaoWitness& operator=(DaoWitness&& other) noexcept {
        if (this != &other) {
            tokenType_ = std::move(other.tokenType_);
            consumed_ = other.consumed_;
            other.consumed_ = true;
        }
        return *this;
    }

    const std::string& GetTokenType() const { return tokenType_; }
    bool IsConsumed() const { return consumed_; }

private:
    friend class DaoFactory;

    std::string tokenType_;
    bool consumed_{false};
};

class DaoFactory {
public:
    /**
     * @param clock Time source shared by all created DAOs (required)
     * @param custody Token custody shared by all created DAOs (required)
     * @param sink Event sink (may be null)
     */
    DaoFactory(std::shared_ptr<util::Clock> clock,
               std::shared_ptr<ITokenCustody> custody,
               std::shared_ptr<IEventSink> sink);

    /**
     * Create the DAO for the witness's token type.
     *
     * Fails with the configuration's validation error, or DuplicateWitness
     * if the witness was already used or a DAO exists for its token type.
     * On success the witness is consumed.
     */
    GovernanceResult<std::unique_ptr<Governance>> CreateDao(DaoWitness&& witness,
                                                            const DaoConfig& config);

    /// SHA256 of the token type
    static DaoId DeriveDaoId(const std::string& tokenType);

    bool IsRegistered(const std::string& tokenType) const;
    size_t GetDaoCount() const;

private:
    std::shared_ptr<util::Clock> clock_;
    std::shared_ptr<ITokenCustody> custody_;
    std::shared_ptr<IEventSink> sink_;

    mutable std::mutex mutex_;
    std::map<std::string, DaoId> registered_;
};

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_FACTORY_H
