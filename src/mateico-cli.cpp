// MATEICO CLI - Command Line Interface
// Copyright (c) 2024 MATEICO Developers
// MIT License
//
// mateico-cli operates the staking and vesting ledgers stored in the data
// directory. Each invocation restores the ledger, runs one command as the
// given caller at the given time, and persists the result.

#include "mateico/core/amount.h"
#include "mateico/crypto/sha256.h"
#include "mateico/ledger/events.h"
#include "mateico/node/context.h"
#include "mateico/util/config.h"
#include "mateico/util/logging.h"
#include "mateico/util/time.h"

#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mateico {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "MATEICO CLI";

// ============================================================================
// CLI Configuration
// ============================================================================

struct CLIConfig {
    std::string dataDir;
    std::string logLevel{"warn"};
    std::vector<std::string> debugCategories;
    bool printToConsole{true};
    std::string logFile;

    std::string tokenName{"Mateico"};
    std::string tokenSymbol{"MATE"};

    std::string caller;
    std::optional<int64_t> time;

    std::string command;
    std::vector<std::string> args;

    bool showHelp{false};
    bool showVersion{false};
};

void PrintVersion() {
    std::cout << CLIENT_NAME << " version " << VERSION << "\n";
}

void PrintHelp() {
    PrintVersion();
    std::cout << R"(
Usage: mateico-cli [options] <command> [args...]

Options:
  -datadir=<dir>       Data directory (default: ~/.mateico)
  -conf=<file>         Configuration file (default: <datadir>/mateico.conf)
  -caller=<addr>       Caller address (40 hex digits) or label
  -time=<ts>           Current time, Unix seconds or YYYY-MM-DDTHH:MM:SSZ
  -loglevel=<level>    trace, debug, info, warn, error (default: warn)
  -debug=<cat,...>     Restrict logging to categories
  -logfile=<file>      Also log to a file
  -noprinttoconsole    Do not log to the console
  -tokenname=<name>    Token name used by init (default: Mateico)
  -tokensymbol=<sym>   Token symbol used by init (default: MATE)
  -help, -version

Addresses may also be given as 'staking', 'vesting' or 'token'.
Amounts are decimal tokens ("10.5"); 'max' is the unlimited allowance.

Token:
  init <supply>                            Create the ledger owned by caller
  transfer <to> <amount>
  approve <spender> <amount|max>
  balance [account]

Staking:
  createpool <min> <max> <start> <end> <rateMilli> <lock> <maxTotal>
  deposit <pool> <amount>
  claim
  claimone <index>
  reclaim
  setbridgepool <pool>
  recover [amount]
  pools
  stakes [account]

Vesting:
  addlock <beneficiary> <startAmount> <totalAmount> <startDate> <endDate>
  vestclaim
  claim2stake
  vestings [account]
  bindstake

Ownership:
  giveownership <address>
  acceptownership
  renounceownership

  info
)";
}

// ============================================================================
// Argument Helpers
// ============================================================================

std::optional<Address> ParseAddress(const std::string& str) {
    if (str == "staking") return addresses::Staking();
    if (str == "vesting") return addresses::Vesting();
    if (str == "token") return addresses::Token();

    std::string hex = str;
    if (hex.size() > 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex = hex.substr(2);
    }
    if (hex.size() == Address::SIZE * 2 && IsValidHex(hex)) {
        return Address::FromHex(hex);
    }
    if (str.empty()) {
        return std::nullopt;
    }
    return AddressFromLabel(str);
}

std::optional<Amount> ParseAmountArg(const std::string& str) {
    if (str == "max") {
        return MAX_AMOUNT;
    }
    return ParseAmount(str);
}

std::optional<uint64_t> ParseIndex(const std::string& str) {
    if (str.empty() || str.size() > 19) {
        return std::nullopt;
    }
    uint64_t value = 0;
    for (char c : str) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    return value;
}

/// Thrown for malformed command arguments
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

template<typename T>
T Require(const std::optional<T>& value, const std::string& what) {
    if (!value) {
        throw UsageError("invalid " + what);
    }
    return *value;
}

const std::string& Arg(const std::vector<std::string>& args, size_t i, const char* name) {
    if (i >= args.size()) {
        throw UsageError(std::string("missing argument <") + name + ">");
    }
    return args[i];
}

int ReportError(ledger::LedgerError error) {
    std::cerr << "Error: " << ledger::LedgerErrorToString(error) << " ("
              << ledger::LedgerErrorMessage(error) << ")\n";
    return 1;
}

void PrintPool(size_t index, const ledger::Pool& pool) {
    std::cout << "pool " << index << "\n"
              << "  hash:      " << pool.poolHash.ToHex() << "\n"
              << "  stake:     " << FormatAmount(pool.minStake) << " - "
              << FormatAmount(pool.maxStake) << "\n"
              << "  window:    " << util::FormatISO8601(pool.startTime) << " - "
              << util::FormatISO8601(pool.endTime) << "\n"
              << "  rate:      " << pool.rewardRateMilli << "/1000\n"
              << "  lock:      " << util::FormatDuration(pool.lockPeriod) << "\n"
              << "  staked:    " << FormatAmount(pool.totalStaked) << " / "
              << FormatAmount(pool.maxTotalStaked) << "\n";
}

// ============================================================================
// Commands
// ============================================================================

struct CommandContext {
    LedgerContext& ledger;
    const CLIConfig& config;
    Address caller;
    const std::vector<std::string>& args;
};

using CommandHandler = std::function<int(CommandContext&)>;

struct Command {
    CommandHandler handler;
    bool mutates;
};

int CmdTransfer(CommandContext& c) {
    Address to = Require(ParseAddress(Arg(c.args, 0, "to")), "address");
    Amount amount = Require(ParseAmountArg(Arg(c.args, 1, "amount")), "amount");
    if (!c.ledger.token->Transfer(c.caller, to, amount)) {
        return ReportError(ledger::LedgerError::TransferFailed);
    }
    std::cout << "Transferred " << FormatAmount(amount) << " to " << to.ToHex() << "\n";
    return 0;
}

int CmdApprove(CommandContext& c) {
    Address spender = Require(ParseAddress(Arg(c.args, 0, "spender")), "address");
    Amount amount = Require(ParseAmountArg(Arg(c.args, 1, "amount")), "amount");
    if (!c.ledger.token->Approve(c.caller, spender, amount)) {
        return ReportError(ledger::LedgerError::ZeroAddress);
    }
    std::cout << "Approved " << (amount == MAX_AMOUNT ? "max" : FormatAmount(amount))
              << " for " << spender.ToHex() << "\n";
    return 0;
}

int CmdBalance(CommandContext& c) {
    Address account = c.args.empty() ? c.caller : Require(ParseAddress(c.args[0]), "address");
    std::cout << FormatAmount(c.ledger.token->BalanceOf(account)) << " "
              << c.ledger.token->GetSymbol() << "\n";
    return 0;
}

int CmdCreatePool(CommandContext& c) {
    ledger::PoolParams params;
    params.minStake = Require(ParseAmount(Arg(c.args, 0, "min")), "min stake");
    params.maxStake = Require(ParseAmount(Arg(c.args, 1, "max")), "max stake");
    params.startTime = Require(util::ParseTimestamp(Arg(c.args, 2, "start")), "start time");
    params.endTime = Require(util::ParseTimestamp(Arg(c.args, 3, "end")), "end time");
    params.rewardRateMilli = Require(ParseIndex(Arg(c.args, 4, "rateMilli")), "rate");
    params.lockPeriod = Require(util::ParseDuration(Arg(c.args, 5, "lock")), "lock period");
    params.maxTotalStaked = Require(ParseAmount(Arg(c.args, 6, "maxTotal")), "max total");

    ledger::LedgerError error = c.ledger.staking->CreatePool(c.caller, params);
    if (error != ledger::LedgerError::OK) {
        return ReportError(error);
    }
    size_t index = c.ledger.staking->GetPoolCount() - 1;
    PrintPool(index, *c.ledger.staking->GetPool(index));
    return 0;
}

int CmdDeposit(CommandContext& c) {
    uint64_t pool = Require(ParseIndex(Arg(c.args, 0, "pool")), "pool index");
    Amount amount = Require(ParseAmount(Arg(c.args, 1, "amount")), "amount");
    ledger::LedgerError error = c.ledger.staking->Deposit(c.caller, pool, amount);
    return error == ledger::LedgerError::OK ? 0 : ReportError(error);
}

int CmdClaim(CommandContext& c) {
    auto result = c.ledger.staking->ClaimAll(c.caller);
    return result.IsOk() ? 0 : ReportError(result.error);
}

int CmdClaimOne(CommandContext& c) {
    uint64_t index = Require(ParseIndex(Arg(c.args, 0, "index")), "position index");
    auto result = c.ledger.staking->ClaimOne(c.caller, index);
    return result.IsOk() ? 0 : ReportError(result.error);
}

int CmdReclaim(CommandContext& c) {
    auto result = c.ledger.staking->ReclaimExpiredPools(c.caller);
    if (!result.IsOk()) {
        return ReportError(result.error);
    }
    std::cout << "Reclaimed " << FormatAmount(result.amount) << "\n";
    return 0;
}

int CmdSetBridgePool(CommandContext& c) {
    uint64_t pool = Require(ParseIndex(Arg(c.args, 0, "pool")), "pool index");
    ledger::LedgerError error = c.ledger.staking->SetBridgePool(c.caller, pool);
    return error == ledger::LedgerError::OK ? 0 : ReportError(error);
}

int CmdRecover(CommandContext& c) {
    Amount amount = c.args.empty() ? 0 : Require(ParseAmount(c.args[0]), "amount");
    auto result = c.ledger.staking->RecoverStrayTokens(c.caller, amount);
    if (!result.IsOk()) {
        return ReportError(result.error);
    }
    std::cout << "Recovered " << FormatAmount(result.amount) << "\n";
    return 0;
}

int CmdPools(CommandContext& c) {
    auto pools = c.ledger.staking->GetPools();
    for (size_t i = 0; i < pools.size(); ++i) {
        PrintPool(i, pools[i]);
    }
    std::cout << "free rewards:      " << FormatAmount(c.ledger.staking->GetTotalFreeRewards()) << "\n"
              << "staked and reward: " << FormatAmount(c.ledger.staking->GetTotalStakedAndReward()) << "\n";
    if (auto bridge = c.ledger.staking->GetBridgePool()) {
        std::cout << "bridge pool:       " << bridge->poolIndex << " ("
                  << bridge->poolHash.ToHex().substr(0, 16) << ")\n";
    }
    return 0;
}

int CmdStakes(CommandContext& c) {
    Address user = c.args.empty() ? c.caller : Require(ParseAddress(c.args[0]), "address");
    auto stakes = c.ledger.staking->GetUserStakes(user);
    int64_t now = util::GetTime();
    for (size_t i = 0; i < stakes.size(); ++i) {
        std::cout << std::setw(3) << i << "  " << FormatAmount(stakes[i].totalAmount)
                  << "  unlocks " << util::FormatISO8601(stakes[i].unlockTime)
                  << (stakes[i].IsMatured(now) ? "  (claimable)" : "") << "\n";
    }
    std::cout << "total:     " << FormatAmount(c.ledger.staking->GetStakedWithRewards(user)) << "\n"
              << "claimable: " << FormatAmount(c.ledger.staking->GetClaimable(user)) << "\n";
    return 0;
}

int CmdAddLock(CommandContext& c) {
    Address beneficiary = Require(ParseAddress(Arg(c.args, 0, "beneficiary")), "address");
    Amount startAmount = Require(ParseAmount(Arg(c.args, 1, "startAmount")), "start amount");
    Amount totalAmount = Require(ParseAmount(Arg(c.args, 2, "totalAmount")), "total amount");
    int64_t startDate = Require(util::ParseTimestamp(Arg(c.args, 3, "startDate")), "start date");
    int64_t endDate = Require(util::ParseTimestamp(Arg(c.args, 4, "endDate")), "end date");

    ledger::LedgerError error = c.ledger.vesting->AddLock(c.caller, beneficiary, startAmount,
                                                          totalAmount, startDate, endDate);
    return error == ledger::LedgerError::OK ? 0 : ReportError(error);
}

int CmdVestClaim(CommandContext& c) {
    auto result = c.ledger.vesting->ClaimAll(c.caller);
    return result.IsOk() ? 0 : ReportError(result.error);
}

int CmdClaimToStake(CommandContext& c) {
    auto result = c.ledger.vesting->ClaimToStake(c.caller);
    return result.IsOk() ? 0 : ReportError(result.error);
}

int CmdVestings(CommandContext& c) {
    Address user = c.args.empty() ? c.caller : Require(ParseAddress(c.args[0]), "address");
    auto vests = c.ledger.vesting->GetVestings(user);
    for (size_t i = 0; i < vests.size(); ++i) {
        const auto& v = vests[i];
        std::cout << std::setw(3) << i << "  " << FormatAmount(v.totalAmount)
                  << " (" << FormatAmount(v.startAmount) << " at start)  "
                  << util::FormatISO8601(v.startDate) << " - " << util::FormatISO8601(v.endDate)
                  << "  claimed " << FormatAmount(v.claimed) << "\n";
    }
    std::cout << "balance:   " << FormatAmount(c.ledger.vesting->BalanceOf(user)) << " "
              << c.ledger.vesting->Symbol() << "\n"
              << "claimable: " << FormatAmount(c.ledger.vesting->GetClaimable(user)) << "\n";
    return 0;
}

int CmdBindStake(CommandContext& c) {
    ledger::LedgerError error = c.ledger.vesting->SetStakeLedger(c.caller, c.ledger.staking);
    if (error != ledger::LedgerError::OK) {
        return ReportError(error);
    }
    std::cout << "Vesting ledger bound to " << c.ledger.staking->GetAddress().ToHex() << "\n";
    return 0;
}

int CmdGiveOwnership(CommandContext& c) {
    Address newOwner = Require(ParseAddress(Arg(c.args, 0, "address")), "address");
    ledger::LedgerError error = c.ledger.ownership->GiveOwnership(c.caller, newOwner);
    return error == ledger::LedgerError::OK ? 0 : ReportError(error);
}

int CmdAcceptOwnership(CommandContext& c) {
    ledger::LedgerError error = c.ledger.ownership->AcceptOwnership(c.caller);
    return error == ledger::LedgerError::OK ? 0 : ReportError(error);
}

int CmdRenounceOwnership(CommandContext& c) {
    ledger::LedgerError error = c.ledger.ownership->RenounceOwnership(c.caller);
    return error == ledger::LedgerError::OK ? 0 : ReportError(error);
}

int CmdInfo(CommandContext& c) {
    auto& l = c.ledger;
    std::cout << "token:          " << l.token->GetName() << " (" << l.token->GetSymbol() << ")"
              << ", supply " << FormatAmount(l.token->TotalSupply()) << "\n"
              << "owner:          " << l.ownership->GetOwner().ToHex() << "\n";
    if (!l.ownership->GetPendingOwner().IsNull()) {
        std::cout << "pending owner:  " << l.ownership->GetPendingOwner().ToHex() << "\n";
    }
    std::cout << "staking:        " << l.staking->GetAddress().ToHex()
              << ", balance " << FormatAmount(l.token->BalanceOf(l.staking->GetAddress())) << "\n"
              << "  pools:        " << l.staking->GetPoolCount() << "\n"
              << "  free rewards: " << FormatAmount(l.staking->GetTotalFreeRewards()) << "\n"
              << "  staked:       " << FormatAmount(l.staking->GetTotalStakedAndReward()) << "\n"
              << "vesting:        " << l.vesting->GetAddress().ToHex()
              << ", balance " << FormatAmount(l.token->BalanceOf(l.vesting->GetAddress())) << "\n"
              << "  name:         " << l.vesting->Name() << " (" << l.vesting->Symbol() << ")\n"
              << "  vested:       " << FormatAmount(l.vesting->GetVestedTotal()) << "\n"
              << "  bound to:     " << (l.vesting->GetStakeAddress().IsNull()
                                            ? std::string("(none)")
                                            : l.vesting->GetStakeAddress().ToHex()) << "\n"
              << "time:           " << util::FormatISO8601(util::GetTime()) << "\n";
    return 0;
}

const std::map<std::string, Command>& Commands() {
    static const std::map<std::string, Command> commands = {
        {"transfer",          {CmdTransfer, true}},
        {"approve",           {CmdApprove, true}},
        {"balance",           {CmdBalance, false}},
        {"createpool",        {CmdCreatePool, true}},
        {"deposit",           {CmdDeposit, true}},
        {"claim",             {CmdClaim, true}},
        {"claimone",          {CmdClaimOne, true}},
        {"reclaim",           {CmdReclaim, true}},
        {"setbridgepool",     {CmdSetBridgePool, true}},
        {"recover",           {CmdRecover, true}},
        {"pools",             {CmdPools, false}},
        {"stakes",            {CmdStakes, false}},
        {"addlock",           {CmdAddLock, true}},
        {"vestclaim",         {CmdVestClaim, true}},
        {"claim2stake",       {CmdClaimToStake, true}},
        {"vestings",          {CmdVestings, false}},
        {"bindstake",         {CmdBindStake, true}},
        {"giveownership",     {CmdGiveOwnership, true}},
        {"acceptownership",   {CmdAcceptOwnership, true}},
        {"renounceownership", {CmdRenounceOwnership, true}},
        {"info",              {CmdInfo, false}},
    };
    return commands;
}

// ============================================================================
// Setup
// ============================================================================

bool LoadConfig(int argc, char* argv[], CLIConfig& config) {
    util::ConfigManager manager;
    std::vector<std::string> positional;

    auto result = manager.ParseCommandLine(argc, argv, &positional);
    if (!result.success) {
        std::cerr << "Error: " << result.errorMessage << "\n";
        return false;
    }

    config.showHelp = manager.GetBool("help", false) || manager.GetBool("h", false);
    config.showVersion = manager.GetBool("version", false);
    if (config.showHelp || config.showVersion) {
        return true;
    }

    result = manager.LoadConfigFile();
    if (!result.success) {
        std::cerr << "Error reading config: " << result.errorMessage;
        if (!result.errorFile.empty()) {
            std::cerr << " (" << result.errorFile << ":" << result.errorLine << ")";
        }
        std::cerr << "\n";
        return false;
    }

    for (const char* key : {util::ConfigKeys::DATADIR, util::ConfigKeys::CONF,
                            util::ConfigKeys::LOGLEVEL, util::ConfigKeys::DEBUG,
                            util::ConfigKeys::PRINTTOCONSOLE, util::ConfigKeys::LOGFILE,
                            util::ConfigKeys::TOKENNAME, util::ConfigKeys::TOKENSYMBOL,
                            util::ConfigKeys::CALLER, util::ConfigKeys::TIME}) {
        manager.AllowKey(key);
    }
    for (const auto& warning : manager.Validate()) {
        std::cerr << "Warning: " << warning << "\n";
    }

    config.dataDir = manager.GetDataDir();
    config.logLevel = manager.GetString(util::ConfigKeys::LOGLEVEL, config.logLevel);
    config.debugCategories = manager.GetList(util::ConfigKeys::DEBUG);
    config.printToConsole = manager.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true);
    config.logFile = manager.GetPath(util::ConfigKeys::LOGFILE);
    config.tokenName = manager.GetString(util::ConfigKeys::TOKENNAME, config.tokenName);
    config.tokenSymbol = manager.GetString(util::ConfigKeys::TOKENSYMBOL, config.tokenSymbol);
    config.caller = manager.GetString(util::ConfigKeys::CALLER, "");

    if (auto timeStr = manager.TryGetString(util::ConfigKeys::TIME)) {
        config.time = util::ParseTimestamp(*timeStr);
        if (!config.time) {
            std::cerr << "Error: invalid -time value '" << *timeStr << "'\n";
            return false;
        }
    }

    if (!positional.empty()) {
        config.command = positional.front();
        config.args.assign(positional.begin() + 1, positional.end());
    }
    return true;
}

void SetupLogging(const CLIConfig& config) {
    auto& logger = util::Logger::Instance();
    logger.Initialize();

    // Initialize() installs a default console sink
    logger.ClearSinks();

    util::LogLevel level = util::LogLevelFromString(config.logLevel);
    logger.SetLevel(level);

    if (config.printToConsole) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        consoleConfig.useStderr = true;
        consoleConfig.showTimestamp = false;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    if (!config.logFile.empty()) {
        auto fileSink = std::make_shared<util::FileSink>(config.logFile);
        if (fileSink->IsOpen()) {
            logger.AddSink(fileSink);
        } else {
            std::cerr << "Warning: cannot open log file " << config.logFile << "\n";
        }
    }

    for (const auto& cat : config.debugCategories) {
        if (cat == "all" || cat == "1") {
            logger.EnableAllCategories();
            break;
        }
        logger.EnableCategory(cat);
    }
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    CLIConfig config;
    if (!LoadConfig(argc, argv, config)) {
        return 1;
    }

    if (config.showHelp) {
        PrintHelp();
        return 0;
    }
    if (config.showVersion) {
        PrintVersion();
        return 0;
    }
    if (config.command.empty()) {
        std::cerr << "Error: No command specified.\n"
                  << "Use 'mateico-cli -help' for usage information.\n";
        return 1;
    }

    SetupLogging(config);

    if (config.time) {
        util::EnableMockTime();
        util::SetMockTime(*config.time);
    }

    auto caller = ParseAddress(config.caller);
    if (!caller && config.command != "info" && config.command != "pools") {
        std::cerr << "Error: -caller is required for '" << config.command << "'\n";
        return 1;
    }

    LedgerInitOptions options;
    options.dataDir = config.dataDir;
    options.tokenName = config.tokenName;
    options.tokenSymbol = config.tokenSymbol;

    LedgerContext ctx;
    db::Status status = OpenLedger(ctx, options);
    if (!status.ok()) {
        std::cerr << "Error: cannot open ledger: " << status.ToString() << "\n";
        return 1;
    }

    if (config.command == "init") {
        Amount supply = Require(ParseAmount(Arg(config.args, 0, "supply")), "supply");
        status = CreateGenesis(ctx, options, *caller, supply);
        if (!status.ok()) {
            std::cerr << "Error: " << status.ToString() << "\n";
            return 1;
        }
        std::cout << "Created " << config.tokenName << " with supply " << FormatAmount(supply)
                  << " owned by " << caller->ToHex() << "\n";
        return 0;
    }

    auto it = Commands().find(config.command);
    if (it == Commands().end()) {
        std::cerr << "Error: unknown command '" << config.command << "'\n";
        return 1;
    }
    if (!ctx.IsReady()) {
        std::cerr << "Error: no ledger in " << config.dataDir << "; run 'init' first\n";
        return 1;
    }

    auto printEvent = [](const ledger::LedgerEvent& event) {
        std::cout << ledger::EventToString(event) << "\n";
    };
    ctx.staking->SetEventCallback(printEvent);
    ctx.vesting->SetEventCallback(printEvent);

    CommandContext cmd{ctx, config, caller.value_or(Address()), config.args};
    int rc = it->second.handler(cmd);

    if (rc == 0 && it->second.mutates) {
        status = FlushLedger(ctx);
        if (!status.ok()) {
            std::cerr << "Error: cannot save ledger: " << status.ToString() << "\n";
            return 1;
        }
    }
    return rc;
}

} // namespace cli
} // namespace mateico

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return mateico::cli::AppMain(argc, argv);
    } catch (const mateico::cli::UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n"
                  << "Use 'mateico-cli -help' for usage information.\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
