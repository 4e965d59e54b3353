// AGORA - Quorum Math
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Fixed-point supermajority check. Quorum rates are integers on a 1e9
// scale, so 1'000'000'000 is 100% and 500'000'000 is 50%.

#ifndef AGORA_GOVERNANCE_QUORUM_H
#define AGORA_GOVERNANCE_QUORUM_H

#include <agora/core/types.h>

#include <optional>
#include <string>

namespace agora {
namespace governance {

/// Fixed-point scale for quorum rates (represents 100%)
constexpr FixedPoint QUORUM_RATE_SCALE = 1'000'000'000;

/// One percent on the quorum scale
constexpr FixedPoint QUORUM_RATE_PERCENT = QUORUM_RATE_SCALE / 100;

/// True if rate is in (0, 100%]
inline bool IsValidQuorumRate(FixedPoint rate) {
    return rate > 0 && rate <= QUORUM_RATE_SCALE;
}

/**
 * Fixed-point division rounded down: numerator * SCALE / denominator.
 * Saturates at the maximum FixedPoint value.
 * @throws std::domain_error if denominator is zero
 */
FixedPoint DivDown(uint64_t numerator, uint64_t denominator);

/**
 * Supermajority check for a resolved vote.
 *
 * Passes only if for > against, for >= quorumVotes and
 * for / (for + against) >= quorumRate. Zero total votes never pass.
 */
bool HasQuorum(Amount forVotes, Amount againstVotes,
               Amount quorumVotes, FixedPoint quorumRate);

/// Format a rate as a percentage with two decimals (e.g. "50.00%")
std::string FormatQuorumRate(FixedPoint rate);

/**
 * Parse a quorum rate from either a raw scaled integer ("500000000") or a
 * percentage with up to seven decimals ("50%", "66.5%").
 * Returns nullopt on malformed input. Range is not checked.
 */
std::optional<FixedPoint> ParseQuorumRate(const std::string& str);

} // namespace governance
} // namespace agora

#endif // AGORA_GOVERNANCE_QUORUM_H
