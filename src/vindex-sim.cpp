// VINDEX Simulator - Main Entry Point
// Copyright (c) 2024 VINDEX Developers
// MIT License
//
// Runs the ledger engine in-process through a short scripted session:
// funds demo accounts, submits transfers, a stake, a swap and an unstake,
// mines, burns from the treasury and reports chain statistics.

#include <vindex/chain/ledger.h>
#include <vindex/consensus/params.h>
#include <vindex/crypto/keys.h>
#include <vindex/util/config.h>
#include <vindex/util/logging.h>
#include <vindex/util/time.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace vindex {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "VINDEX Simulator";

namespace defaults {
    constexpr const char* LOG_LEVEL = "info";
    constexpr const char* DEMO_TOKEN = "USDV";
}

// ============================================================================
// Command Line
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: vindex-sim [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                      Show this help message\n";
    std::cout << "  -version                   Show version information\n";
    std::cout << "  -conf=FILE                 Read options from FILE\n";
    std::cout << "  -export=FILE               Write the final chain export to FILE\n";
    std::cout << "\nLogging Options:\n";
    std::cout << "  -loglevel=LEVEL            trace, debug, info, warn, error (default: info)\n";
    std::cout << "  -logfile=FILE              Also append log output to FILE\n";
    std::cout << "  -printtoconsole=0/1        Print log output to console (default: 1)\n";
    std::cout << "  -debug=CATEGORY            Only log CATEGORY (ledger, mempool, staking, ...)\n";
    std::cout << "\nChain Options ([chain] section, or -chain.KEY=VALUE):\n";
    std::cout << "  totalsupply, maxtxperblock, blocktimems, minstake, maxvalidators,\n";
    std::cout << "  unbondingms, basereward, halvinginterval, swapfee\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 VINDEX Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Logging
// ============================================================================

bool SetupLogging(const util::ConfigManager& config) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();
    logger.SetLevel(util::LogLevelFromString(config.GetString("loglevel", defaults::LOG_LEVEL)));

    if (config.GetBool("printtoconsole", true)) {
        logger.AddSink(std::make_shared<util::ConsoleSink>());
    }

    auto logFile = config.TryGetString("logfile");
    if (logFile && !logFile->empty()) {
        auto fileSink = std::make_shared<util::FileSink>(*logFile, true);
        if (!fileSink->IsOpen()) {
            std::cerr << "Error: Cannot open log file: " << *logFile << "\n";
            return false;
        }
        logger.AddSink(fileSink);
    }

    auto debugCategory = config.TryGetString("debug");
    if (debugCategory && !debugCategory->empty()) {
        logger.EnableCategory(*debugCategory);
    }
    return true;
}

// ============================================================================
// Scripted Session
// ============================================================================

Transaction MakeSigned(const Address& from, const Address& to, Amount amount, TxType type,
                       TxPayload payload = TxPayload()) {
    Transaction tx = Transaction::Create(from, to, amount, type, std::move(payload));
    tx.Sign(DeterministicKeyStore::DeriveKey(from, KeyRole::Account));
    return tx;
}

void Submit(chain::LedgerEngine& engine, const Transaction& tx) {
    consensus::ValidationState state;
    if (!engine.AddTransaction(tx, state)) {
        throw std::runtime_error("transaction " + tx.GetId() + " rejected: " + state.ToString());
    }
}

Block MineOrThrow(chain::LedgerEngine& engine) {
    auto block = engine.MineBlock();
    if (!block) {
        throw std::runtime_error("mining produced no block");
    }
    LOG_INFO(util::LogCategory::MINING) << block->ToString();
    return *block;
}

void RunSession(chain::LedgerEngine& engine) {
    const std::vector<Address> funders = {
        "vindex_genesis_validator_1", "vindex_genesis_validator_2", "vindex_genesis_validator_3"};
    const std::vector<Address> users = {"alice", "bob", "carol"};

    // Fund the demo accounts
    for (size_t i = 0; i < users.size(); ++i) {
        Submit(engine, MakeSigned(funders[i], users[i], 10000.0 * (i + 1), TxType::Transfer));
    }
    MineOrThrow(engine);

    // alice delegates, bob swaps against a fresh pool
    consensus::ValidationState poolState;
    if (!engine.CreateSwapPool(NATIVE_TOKEN, defaults::DEMO_TOKEN, 100000.0, 250000.0, poolState)) {
        throw std::runtime_error("pool creation failed: " + poolState.ToString());
    }

    TxPayload stakePayload;
    stakePayload.validator = funders[0];
    Submit(engine, MakeSigned("alice", funders[0], 2500.0, TxType::Stake, stakePayload));

    TxPayload swapPayload;
    swapPayload.tokenA = NATIVE_TOKEN;
    swapPayload.tokenB = defaults::DEMO_TOKEN;
    auto quote = engine.QuoteSwap(NATIVE_TOKEN, defaults::DEMO_TOKEN, 1000.0);
    if (!quote) {
        throw std::runtime_error("no quote for demo swap");
    }
    swapPayload.minAmountOut = quote->amountOut * 0.99;
    Submit(engine, MakeSigned("bob", swap::MakePairKey(NATIVE_TOKEN, defaults::DEMO_TOKEN),
                              1000.0, TxType::Swap, swapPayload));

    Submit(engine, MakeSigned("carol", "alice", 750.0, TxType::Transfer));
    MineOrThrow(engine);

    // alice starts unbonding part of her stake
    TxPayload unstakePayload;
    unstakePayload.validator = funders[0];
    Submit(engine, MakeSigned("alice", funders[0], 500.0, TxType::Unstake, unstakePayload));
    MineOrThrow(engine);

    consensus::ValidationState burnState;
    if (!engine.BurnTokens(1000.0, burnState)) {
        throw std::runtime_error("burn failed: " + burnState.ToString());
    }

    for (const auto& user : users) {
        LOG_INFO(util::LogCategory::LEDGER)
            << user << ": " << util::FormatNumber(engine.GetBalance(user)) << " " << NATIVE_TOKEN
            << ", " << util::FormatNumber(engine.GetTokenBalance(user, defaults::DEMO_TOKEN))
            << " " << defaults::DEMO_TOKEN;
    }
}

bool WriteExport(const chain::LedgerEngine& engine, const std::string& path) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Cannot open export file " << path;
        return false;
    }
    out << engine.ExportChain().ToJSON(true) << "\n";
    if (!out) {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Failed writing export file " << path;
        return false;
    }
    LOG_INFO(util::LogCategory::DEFAULT) << "Exported chain to " << path;
    return true;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;
    auto result = config.ParseCommandLine(argc, argv);
    if (!result.success) {
        std::cerr << "Error: " << result.ToString() << "\n";
        return 1;
    }
    if (config.GetBool("help", false)) {
        PrintHelp();
        return 0;
    }
    if (config.GetBool("version", false)) {
        PrintVersion();
        return 0;
    }

    auto confPath = config.TryGetString("conf");
    if (confPath) {
        // Command-line values stay ahead of the file
        auto fileResult = config.ParseFile(*confPath);
        if (!fileResult.success) {
            std::cerr << "Error: " << fileResult.ToString() << "\n";
            return 1;
        }
    }

    if (!SetupLogging(config)) {
        return 1;
    }
    LOG_INFO(util::LogCategory::DEFAULT) << CLIENT_NAME << " v" << VERSION << " starting...";

    const consensus::ChainParams params = consensus::ChainParams::FromConfig(config);
    chain::LedgerEngine engine(params);

    util::Timer sessionTimer;
    try {
        RunSession(engine);
    } catch (const std::exception& e) {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Session failed: " << e.what();
        util::Logger::Instance().Shutdown();
        return 1;
    }
    LOG_INFO(util::LogCategory::DEFAULT)
        << "Session finished in " << util::FormatDurationMillis(sessionTimer.ElapsedMillis());

    consensus::ValidationState chainState;
    const bool chainValid = engine.IsChainValid(chainState);
    const bool supplyValid = engine.CheckSupplyInvariant();

    auto stats = engine.GetNetworkStats();
    std::cout << stats.ToJSON().ToJSON(true) << "\n";
    std::cout << "Chain valid: " << (chainValid ? "yes" : "no")
              << ", supply accounted: " << (supplyValid ? "yes" : "no") << "\n";

    bool ok = chainValid && supplyValid;
    auto exportPath = config.TryGetString("export");
    if (exportPath && !exportPath->empty()) {
        ok = WriteExport(engine, *exportPath) && ok;
    }

    util::Logger::Instance().Shutdown();
    return ok ? 0 : 1;
}

} // namespace vindex

int main(int argc, char* argv[]) {
    return vindex::AppMain(argc, argv);
}
