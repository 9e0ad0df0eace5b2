// VINDEX - Constant-Product Swap Pools Implementation
// Copyright (c) 2024 VINDEX Developers
// MIT License

#include "vindex/swap/amm.h"

#include <cmath>
#include <utility>

namespace vindex {
namespace swap {

std::string MakePairKey(const std::string& tokenA, const std::string& tokenB) {
    return tokenA < tokenB ? tokenA + "-" + tokenB : tokenB + "-" + tokenA;
}

// ============================================================================
// SwapPool
// ============================================================================

SwapPool::SwapPool(std::string a, std::string b, Amount ra, Amount rb, double feeRate)
    : tokenA(std::move(a)), tokenB(std::move(b)), reserveA(ra), reserveB(rb),
      fee(feeRate), totalLiquidity(std::sqrt(ra * rb)) {}

Amount SwapPool::ReserveOf(const std::string& token) const {
    if (token == tokenA) {
        return reserveA;
    }
    if (token == tokenB) {
        return reserveB;
    }
    return 0.0;
}

void SwapPool::Apply(const std::string& inputToken, Amount amountIn, Amount amountOut) {
    if (inputToken == tokenA) {
        reserveA += amountIn;
        reserveB -= amountOut;
    } else {
        reserveB += amountIn;
        reserveA -= amountOut;
    }
}

util::JSONValue SwapPool::ToJSON() const {
    util::JSONValue::Object obj;
    obj["tokenA"] = tokenA;
    obj["tokenB"] = tokenB;
    obj["reserveA"] = reserveA;
    obj["reserveB"] = reserveB;
    obj["fee"] = fee;
    obj["totalLiquidity"] = totalLiquidity;
    return util::JSONValue(std::move(obj));
}

// ============================================================================
// Pricing
// ============================================================================

std::optional<Amount> ComputeSwapOutput(const SwapPool& pool, const std::string& inputToken,
                                        Amount amountIn) {
    if (!pool.Contains(inputToken) || !(amountIn > 0.0)) {
        return std::nullopt;
    }
    const Amount reserveIn = pool.ReserveOf(inputToken);
    const Amount reserveOut = pool.ReserveOf(pool.Counterpart(inputToken));
    if (reserveIn <= 0.0 || reserveOut <= 0.0) {
        return std::nullopt;
    }

    const Amount inWithFee = amountIn * (1.0 - pool.fee);
    return (reserveOut * inWithFee) / (reserveIn + inWithFee);
}

util::JSONValue SwapQuote::ToJSON() const {
    util::JSONValue::Object obj;
    obj["inputToken"] = inputToken;
    obj["outputToken"] = outputToken;
    obj["amountIn"] = amountIn;
    obj["amountOut"] = amountOut;
    obj["feePaid"] = feePaid;
    obj["executionPrice"] = executionPrice;
    obj["priceImpact"] = priceImpact;
    return util::JSONValue(std::move(obj));
}

std::optional<SwapQuote> QuoteSwap(const SwapPool& pool, const std::string& inputToken,
                                   Amount amountIn) {
    auto out = ComputeSwapOutput(pool, inputToken, amountIn);
    if (!out) {
        return std::nullopt;
    }

    SwapQuote quote;
    quote.inputToken = inputToken;
    quote.outputToken = pool.Counterpart(inputToken);
    quote.amountIn = amountIn;
    quote.amountOut = *out;
    quote.feePaid = amountIn * pool.fee;
    quote.executionPrice = *out / amountIn;

    const double spot = pool.ReserveOf(quote.outputToken) / pool.ReserveOf(inputToken);
    quote.priceImpact = spot > 0.0 ? 1.0 - quote.executionPrice / spot : 0.0;
    return quote;
}

} // namespace swap
} // namespace vindex
