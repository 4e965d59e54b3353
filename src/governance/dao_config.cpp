// AGORA - DAO Configuration Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <agora/governance/dao_config.h>
#include <agora/governance/quorum.h>
#include <agora/util/config.h>
#include <agora/util/logging.h>

#include <sstream>

namespace agora {
namespace governance {

GovernanceError DaoConfig::Validate() const {
    if (!IsValidQuorumRate(quorumRate)) {
        return GovernanceError::InvalidQuorumRate;
    }
    if (votingDelay == 0) {
        return GovernanceError::ZeroVotingDelay;
    }
    if (votingPeriod == 0) {
        return GovernanceError::ZeroVotingPeriod;
    }
    if (minActionDelay == 0) {
        return GovernanceError::ZeroMinActionDelay;
    }
    if (minQuorumVotes == 0) {
        return GovernanceError::ZeroMinQuorumVotes;
    }
    return GovernanceError::None;
}

std::string DaoConfig::ToString() const {
    std::ostringstream oss;
    oss << "DaoConfig(v" << version
        << " delay=" << votingDelay
        << " period=" << votingPeriod
        << " rate=" << FormatQuorumRate(quorumRate)
        << " minActionDelay=" << minActionDelay
        << " minQuorumVotes=" << minQuorumVotes << ")";
    return oss.str();
}

std::string ConfigUpdate::ToString() const {
    std::ostringstream oss;
    oss << "ConfigUpdate(";
    bool first = true;
    auto field = [&](const char* name, const std::optional<uint64_t>& v) {
        if (!v) return;
        if (!first) oss << " ";
        oss << name << "=" << *v;
        first = false;
    };
    field("delay", votingDelay);
    field("period", votingPeriod);
    field("rate", quorumRate);
    field("minActionDelay", minActionDelay);
    field("minQuorumVotes", minQuorumVotes);
    oss << ")";
    return oss.str();
}

GovernanceResult<DaoConfig> ApplyConfigUpdate(const DaoConfig& current,
                                              const ConfigUpdate& update) {
    DaoConfig next = current;
    if (update.votingDelay) next.votingDelay = *update.votingDelay;
    if (update.votingPeriod) next.votingPeriod = *update.votingPeriod;
    if (update.quorumRate) next.quorumRate = *update.quorumRate;
    if (update.minActionDelay) next.minActionDelay = *update.minActionDelay;
    if (update.minQuorumVotes) next.minQuorumVotes = *update.minQuorumVotes;

    GovernanceError err = next.Validate();
    if (err != GovernanceError::None) {
        return GovernanceResult<DaoConfig>::Failure(err);
    }

    next.version = current.version + 1;
    return GovernanceResult<DaoConfig>::Success(next);
}

GovernanceResult<DaoConfig> LoadDaoConfig(const util::ConfigManager& config,
                                          const std::string& section) {
    namespace keys = util::ConfigKeys;

    auto readUInt = [&](const char* key) -> uint64_t {
        auto value = config.TryGetUInt(key, section);
        if (!value && config.HasKey(key, section)) {
            LOG_WARN(util::LogCategory::CONFIG) << "Malformed value for [" << section
                                                << "] " << key;
        }
        return value.value_or(0);
    };

    DaoConfig result;
    result.votingDelay = readUInt(keys::VOTING_DELAY);
    result.votingPeriod = readUInt(keys::VOTING_PERIOD);
    result.minActionDelay = readUInt(keys::MIN_ACTION_DELAY);
    result.minQuorumVotes = readUInt(keys::MIN_QUORUM_VOTES);

    auto rateStr = config.TryGetString(keys::QUORUM_RATE, section);
    if (rateStr) {
        auto rate = ParseQuorumRate(*rateStr);
        if (!rate) {
            LOG_WARN(util::LogCategory::CONFIG) << "Malformed quorum_rate in [" << section
                                                << "]: " << *rateStr;
            return GovernanceResult<DaoConfig>::Failure(GovernanceError::InvalidQuorumRate);
        }
        result.quorumRate = *rate;
    }

    GovernanceError err = result.Validate();
    if (err != GovernanceError::None) {
        LOG_WARN(util::LogCategory::CONFIG) << "Rejected DAO config [" << section << "]: "
                                            << GovernanceErrorToString(err);
        return GovernanceResult<DaoConfig>::Failure(err);
    }

    LOG_DEBUG(util::LogCategory::CONFIG) << "Loaded " << result.ToString()
                                         << " from [" << section << "]";
    return GovernanceResult<DaoConfig>::Success(result);
}

} // namespace governance
} // namespace agora
