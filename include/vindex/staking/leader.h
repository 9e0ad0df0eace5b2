// VINDEX - Leader Selection
// Copyright (c) 2024 VINDEX Developers
// MIT License
//
// Choice of the next block producer from the active validator set.

#ifndef VINDEX_STAKING_LEADER_H
#define VINDEX_STAKING_LEADER_H

#include "vindex/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vindex {
namespace staking {

/// Address and stake weight of one eligible validator
struct LeaderCandidate {
    Address address;
    Amount stake{0.0};
};

/**
 * Chooses a block producer. Implementations must be pure functions of
 * (candidates, blockIndex) so that a selection can be re-verified later.
 */
class LeaderSelector {
public:
    virtual ~LeaderSelector() = default;

    /// Producer for blockIndex; nullopt if there are no candidates
    virtual std::optional<Address> Select(const std::vector<LeaderCandidate>& candidates,
                                          uint64_t blockIndex) const = 0;

    virtual std::string GetName() const = 0;
};

/**
 * Stake-weighted pick driven by a linear congruential step:
 *
 *   seed     = blockIndex * 1103515245 + 12345
 *   fraction = (seed mod 2147483647) / 2147483647
 *   target   = fraction * sum(stake)
 *
 * Returns the first candidate whose running stake total reaches target.
 * Not manipulation resistant. The seed is exact 64-bit integer arithmetic;
 * a double-precision evaluation of the same formula picks differently once
 * the seed passes 2^53 (block index above about 8.16 million).
 */
class LcgLeaderSelector : public LeaderSelector {
public:
    std::optional<Address> Select(const std::vector<LeaderCandidate>& candidates,
                                  uint64_t blockIndex) const override;

    std::string GetName() const override { return "lcg-weighted"; }

    /// The pseudo-random fraction in [0, 1) for a block index
    static double Fraction(uint64_t blockIndex);
};

} // namespace staking
} // namespace vindex

#endif // VINDEX_STAKING_LEADER_H
