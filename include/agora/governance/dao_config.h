// AGORA - DAO Configuration
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Per-DAO voting policy. Created at genesis and afterwards only changed by
// an executed ConfigUpdate action. Every change revalidates all fields.

#ifndef AGORA_GOVERNANCE_DAO_CONFIG_H
#define AGORA_GOVERNANCE_DAO_CONFIG_H

#include <agora/core/serialize.h>
#include <agora/core/types.h>
#include <agora/governance/errors.h>

#include <optional>
#include <string>

namespace agora {

namespace util {
class ConfigManager;
}

namespace governance {

// ============================================================================
// DAO Configuration
// ============================================================================

struct DaoConfig {
    /// Gap between proposal creation and voting start (ms)
    Duration votingDelay{0};

    /// Length of the voting window (ms)
    Duration votingPeriod{0};

    /// Required for-vote fraction of cast votes, on the QUORUM_RATE_SCALE
    FixedPoint quorumRate{0};

    /// Lower bound for a proposal's action delay (ms)
    Duration minActionDelay{0};

    /// Lower bound for a proposal's absolute quorum
    Amount minQuorumVotes{0};

    /// Incremented on every committed update; 0 at genesis
    uint64_t version{0};

    /// Check all invariants, reporting the first violation
    GovernanceError Validate() const;

    bool IsValid() const { return Validate() == GovernanceError::None; }

    std::string ToString() const;

    bool operator==(const DaoConfig& other) const {
        return votingDelay == other.votingDelay &&
               votingPeriod == other.votingPeriod &&
               quorumRate == other.quorumRate &&
               minActionDelay == other.minActionDelay &&
               minQuorumVotes == other.minQuorumVotes &&
               version == other.version;
    }
    bool operator!=(const DaoConfig& other) const { return !(*this == other); }
};

// ============================================================================
// Configuration Update
// ============================================================================

/**
 * Action payload overriding some configuration fields. Unset fields keep
 * their current value.
 */
struct ConfigUpdate {
    std::optional<Duration> votingDelay;
    std::optional<Duration> votingPeriod;
    std::optional<FixedPoint> quorumRate;
    std::optional<Duration> minActionDelay;
    std::optional<Amount> minQuorumVotes;

    /// True if no field is overridden
    bool IsEmpty() const {
        return !votingDelay && !votingPeriod && !quorumRate &&
               !minActionDelay && !minQuorumVotes;
    }

    std::string ToString() const;

    bool operator==(const ConfigUpdate& other) const {
        return votingDelay == other.votingDelay &&
               votingPeriod == other.votingPeriod &&
               quorumRate == other.quorumRate &&
               minActionDelay == other.minActionDelay &&
               minQuorumVotes == other.minQuorumVotes;
    }
};

/**
 * Substitute every present override into a copy of current and validate
 * the result as a whole. On success the returned config has its version
 * bumped; on failure current is untouched.
 */
GovernanceResult<DaoConfig> ApplyConfigUpdate(const DaoConfig& current,
                                              const ConfigUpdate& update);

/**
 * Read a configuration from a section of an INI file.
 *
 * Keys: voting_delay, voting_period, quorum_rate, min_action_delay,
 * min_quorum_votes. quorum_rate accepts a raw scaled integer or a
 * percentage such as "50%". Missing or malformed keys fail validation.
 */
GovernanceResult<DaoConfig> LoadDaoConfig(const util::ConfigManager& config,
                                          const std::string& section);

// ============================================================================
// Serialization
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const DaoConfig& config) {
    ser_writedata64(s, config.votingDelay);
    ser_writedata64(s, config.votingPeriod);
    ser_writedata64(s, config.quorumRate);
    ser_writedata64(s, config.minActionDelay);
    ser_writedata64(s, config.minQuorumVotes);
    ser_writedata64(s, config.version);
}

template<typename Stream>
void Unserialize(Stream& s, DaoConfig& config) {
    config.votingDelay = ser_readdata64(s);
    config.votingPeriod = ser_readdata64(s);
    config.quorumRate = ser_readdata64(s);
    config.minActionDelay = ser_readdata64(s);
    config.minQuorumVotes = ser_readdata64(s);
    config.version = ser_readdata64(s);
}

template<typename Stream>
void Serialize(Stream& s, const ConfigUpdate& update) {
    Serialize(s, update.votingDelay);
    Serialize(s, update.votingPeriod);
    Serialize(s, update.quorumRate);
    Serialize(s, update.minActionDelay);
    Serialize(s, update.minQuorumVotes);
}

template<typename Stream>
void Unserialize(Stream& s, ConfigUpdate& update) {
    Unserialize(s, update.votingDelay);
    Unserialize(s, update.votingPeriod);
    Unserialize(s, update.quorumRate);
    Unserialize(s, update.minActionDelay);
    Unserialize(s, update.minQuorumVotes);
}

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_DAO_CONFIG_H
