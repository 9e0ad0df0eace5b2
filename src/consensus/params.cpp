// VINDEX - Chain Parameters Implementation
// Copyright (c) 2024 VINDEX Developers
// MIT License

#include "vindex/consensus/params.h"
#include "vindex/util/config.h"
#include "vindex/util/logging.h"

#include <limits>
#include <optional>

namespace vindex {
namespace consensus {

namespace {

void WarnInvalid(const util::ConfigManager& config, const char* key) {
    LOG_WARN(util::LogCategory::CONFIG)
        << "Ignoring invalid [" << CHAIN_CONFIG_SECTION << "] " << key << "="
        << config.GetString(key, "", CHAIN_CONFIG_SECTION);
}

/// Integer override within [minValue, maxValue], nullopt if absent or invalid
std::optional<int64_t> ReadInt(const util::ConfigManager& config, const char* key,
                               int64_t minValue,
                               int64_t maxValue = std::numeric_limits<int64_t>::max()) {
    if (!config.HasKey(key, CHAIN_CONFIG_SECTION)) {
        return std::nullopt;
    }
    auto value = config.TryGetInt(key, CHAIN_CONFIG_SECTION);
    if (!value || *value < minValue || *value > maxValue) {
        WarnInvalid(config, key);
        return std::nullopt;
    }
    return value;
}

/// Real override within [minValue, maxValue), nullopt if absent or invalid
std::optional<double> ReadDouble(const util::ConfigManager& config, const char* key,
                                 double minValue,
                                 double maxValue = std::numeric_limits<double>::infinity()) {
    if (!config.HasKey(key, CHAIN_CONFIG_SECTION)) {
        return std::nullopt;
    }
    auto value = config.TryGetDouble(key, CHAIN_CONFIG_SECTION);
    if (!value || !(*value >= minValue) || !(*value < maxValue)) {
        WarnInvalid(config, key);
        return std::nullopt;
    }
    return value;
}

} // namespace

ChainParams ChainParams::FromConfig(const util::ConfigManager& config) {
    ChainParams params;

    if (auto v = ReadDouble(config, "totalsupply", 1.0)) params.totalSupply = *v;
    if (auto v = ReadInt(config, "maxtxperblock", 1)) params.maxTxPerBlock = static_cast<size_t>(*v);
    if (auto v = ReadInt(config, "blocktimems", 1)) params.blockTimeMs = *v;
    if (auto v = ReadDouble(config, "minstake", AMOUNT_EPSILON)) params.minStake = *v;
    if (auto v = ReadInt(config, "maxvalidators", 1)) params.maxValidators = static_cast<size_t>(*v);
    if (auto v = ReadInt(config, "unbondingms", 0)) params.unbondingMs = *v;
    if (auto v = ReadDouble(config, "defaultcommission", 0.0, 1.0)) {
        params.defaultCommission = *v;
    }
    if (auto v = ReadDouble(config, "basereward", 0.0)) params.reward.baseReward = *v;
    if (auto v = ReadInt(config, "halvinginterval", 1)) {
        params.reward.halvingInterval = static_cast<uint64_t>(*v);
    }
    if (auto v = ReadDouble(config, "swapfee", 0.0, 1.0)) params.swapFee = *v;

    LOG_DEBUG(util::LogCategory::CONFIG)
        << "Chain params: supply=" << params.totalSupply
        << " maxTxPerBlock=" << params.maxTxPerBlock
        << " blockTimeMs=" << params.blockTimeMs
        << " minStake=" << params.minStake
        << " maxValidators=" << params.maxValidators
        << " unbondingMs=" << params.unbondingMs
        << " defaultCommission=" << params.defaultCommission
        << " swapFee=" << params.swapFee;
    return params;
}

} // namespace consensus
} // namespace vindex
