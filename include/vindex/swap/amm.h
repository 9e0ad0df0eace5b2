// VINDEX - Constant-Product Swap Pools
// Copyright (c) 2024 VINDEX Developers
// MIT License
//
// Two-asset pools priced by x * y = k with the pool fee taken from the input.

#ifndef VINDEX_SWAP_AMM_H
#define VINDEX_SWAP_AMM_H

#include "vindex/core/types.h"
#include "vindex/util/json.h"

#include <optional>
#include <string>

namespace vindex {
namespace swap {

/// Default pool fee (0.3%)
constexpr double DEFAULT_SWAP_FEE = 0.003;

/// Canonical key of an unordered pair: min(A, B) + "-" + max(A, B)
std::string MakePairKey(const std::string& tokenA, const std::string& tokenB);

// ============================================================================
// Swap Pool
// ============================================================================

struct SwapPool {
    std::string tokenA;
    std::string tokenB;
    Amount reserveA{0.0};
    Amount reserveB{0.0};
    double fee{DEFAULT_SWAP_FEE};

    /// sqrt(reserveA * reserveB) at creation; informational only
    Amount totalLiquidity{0.0};

    SwapPool() = default;
    SwapPool(std::string a, std::string b, Amount ra, Amount rb,
             double feeRate = DEFAULT_SWAP_FEE);

    std::string GetKey() const { return MakePairKey(tokenA, tokenB); }

    bool Contains(const std::string& token) const {
        return token == tokenA || token == tokenB;
    }

    /// Reserve held for token (0 if the token is not in this pool)
    Amount ReserveOf(const std::string& token) const;

    /// The other token of the pair
    const std::string& Counterpart(const std::string& token) const {
        return token == tokenA ? tokenB : tokenA;
    }

    /// reserveA * reserveB
    Amount GetProduct() const { return reserveA * reserveB; }

    /**
     * Move reserves for a swap already priced by ComputeSwapOutput():
     * the input reserve grows by amountIn, the other shrinks by amountOut.
     */
    void Apply(const std::string& inputToken, Amount amountIn, Amount amountOut);

    util::JSONValue ToJSON() const;
};

// ============================================================================
// Pricing
// ============================================================================

/**
 * Output of swapping amountIn of inputToken:
 *
 *   out = reserveOut * in * (1 - fee) / (reserveIn + in * (1 - fee))
 *
 * nullopt if inputToken is not in the pool, amountIn is not positive or
 * the pool has an empty reserve.
 */
std::optional<Amount> ComputeSwapOutput(const SwapPool& pool, const std::string& inputToken,
                                        Amount amountIn);

/// Quote for a prospective swap
struct SwapQuote {
    std::string inputToken;
    std::string outputToken;
    Amount amountIn{0.0};
    Amount amountOut{0.0};
    Amount feePaid{0.0};

    /// Output per unit of input for this trade
    double executionPrice{0.0};

    /// Relative drop of the execution price against the pre-trade spot price
    double priceImpact{0.0};

    util::JSONValue ToJSON() const;
};

std::optional<SwapQuote> QuoteSwap(const SwapPool& pool, const std::string& inputToken,
                                   Amount amountIn);

} // namespace swap
} // namespace vindex

#endif // VINDEX_SWAP_AMM_H
