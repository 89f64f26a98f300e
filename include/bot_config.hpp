#pragma once
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "bybit_client.hpp"
#include "exchange_error.hpp"
#include "market_types.hpp"
#include "position_state_machine.hpp"

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class AdapterKind { Bybit, Paper };

struct ExchangeSettings {
    AdapterKind adapter = AdapterKind::Bybit;
    BybitConfig bybit;                 // key/secret come from the environment
    long connection_timeout_s = 0;
    std::set<int> non_fatal_codes;
    std::vector<std::string> non_fatal_messages;

    ErrorClassifier classifier() const { return ErrorClassifier(non_fatal_codes, non_fatal_messages); }
};

struct EngineSettings {
    int trade_cycle_interval_s = 60;
    std::string journal_path;       // empty = no journal
    std::string publish_endpoint;   // empty = no publisher
};

struct MarketConfig {
    MarketSpec spec;
    bool enabled = true;
    StrategyConfig strategy;
};

struct BotConfig {
    ExchangeSettings exchange;
    EngineSettings engine;
    BalanceMap paper_balances;
    std::vector<MarketConfig> markets;

    std::vector<MarketConfig> enabled_markets() const;
};

using EnvGetter = std::function<std::optional<std::string>(const std::string&)>;

std::optional<std::string> process_env(const std::string& name);

// Strategy settings arrive as a flat name -> value map (numbers as decimal text).
StrategyConfig parse_strategy_config(const std::map<std::string, std::string>& items,
                                     const std::string& market_id);

// Validates everything up front; throws ConfigError naming the offending key.
BotConfig build_bot_config(const nlohmann::json& j, const EnvGetter& env);
BotConfig load_config_file(const std::string& path, const EnvGetter& env = process_env);
