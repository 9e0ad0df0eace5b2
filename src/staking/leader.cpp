// VINDEX - Leader Selection Implementation
// Copyright (c) 2024 VINDEX Developers
// MIT License

#include "vindex/staking/leader.h"

namespace vindex {
namespace staking {

namespace {
constexpr uint64_t LCG_MULTIPLIER = 1103515245ULL;
constexpr uint64_t LCG_INCREMENT = 12345ULL;
constexpr uint64_t LCG_MODULUS = 2147483647ULL;
}

double LcgLeaderSelector::Fraction(uint64_t blockIndex) {
    uint64_t seed = blockIndex * LCG_MULTIPLIER + LCG_INCREMENT;
    return static_cast<double>(seed % LCG_MODULUS) / static_cast<double>(LCG_MODULUS);
}

std::optional<Address> LcgLeaderSelector::Select(const std::vector<LeaderCandidate>& candidates,
                                                 uint64_t blockIndex) const {
    if (candidates.empty()) {
        return std::nullopt;
    }

    Amount totalStake = 0.0;
    for (const auto& candidate : candidates) {
        totalStake += candidate.stake;
    }

    const Amount target = Fraction(blockIndex) * totalStake;
    Amount cumulative = 0.0;
    for (const auto& candidate : candidates) {
        cumulative += candidate.stake;
        if (cumulative >= target) {
            return candidate.address;
        }
    }
    // Rounding left the target above the final running total
    return candidates.front().address;
}

} // namespace staking
} // namespace vindex
