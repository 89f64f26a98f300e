#include "bot_config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <limits>
#include <utility>

using json = nlohmann::json;

// Defaults mirror the usual transient failures in front of exchange REST APIs.
static const std::set<int> kDefaultNonFatalCodes = {502, 503, 504};
static const std::vector<std::string> kDefaultNonFatalMessages = {
    "Connection refused",
    "Connection reset",
    "Remote host closed connection during handshake",
};

static const json& require(const json& j, const std::string& key, const std::string& ctx) {
    if (!j.is_object() || !j.contains(key) || j.at(key).is_null())
        throw ConfigError("missing mandatory key '" + ctx + key + "'");
    return j.at(key);
}

static std::string as_text(const json& v, const std::string& name) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number()) return v.dump();
    throw ConfigError("'" + name + "' must be a string or number");
}

static Money as_money(const std::string& text, const std::string& name) {
    try {
        return Money::parse(text);
    } catch (const std::exception&) {
        throw ConfigError("'" + name + "' is not a decimal: '" + text + "'");
    }
}

static long long as_int(const json& v, const std::string& name) {
    if (v.is_number_unsigned() && v.get<unsigned long long>() > (unsigned long long)std::numeric_limits<long long>::max())
        throw ConfigError("'" + name + "' is out of range");
    if (v.is_number_integer()) return v.get<long long>();
    if (v.is_string()) {
        const auto s = v.get<std::string>();
        try {
            std::size_t pos = 0;
            long long out = std::stoll(s, &pos);
            if (pos == s.size()) return out;
        } catch (const std::exception&) {
            // fall through to the ConfigError below
        }
    }
    throw ConfigError("'" + name + "' must be an integer");
}

template <typename T>
static T narrow(long long v, const std::string& name) {
    if (v < std::numeric_limits<T>::min() || v > std::numeric_limits<T>::max())
        throw ConfigError("'" + name + "' is out of range: " + std::to_string(v));
    return static_cast<T>(v);
}

template <typename T>
static T int_or(const json& j, const std::string& key, T def, const std::string& ctx) {
    if (!j.is_object() || !j.contains(key)) return def;
    return narrow<T>(as_int(j.at(key), ctx + key), ctx + key);
}

static std::string str_or(const json& j, const std::string& key, const std::string& def, const std::string& ctx) {
    if (!j.is_object() || !j.contains(key)) return def;
    if (!j.at(key).is_string()) throw ConfigError("'" + ctx + key + "' must be a string");
    return j.at(key).get<std::string>();
}

static std::string require_str(const json& j, const std::string& key, const std::string& ctx) {
    const json& v = require(j, key, ctx);
    if (!v.is_string() || v.get<std::string>().empty())
        throw ConfigError("'" + ctx + key + "' must be a non-empty string");
    return v.get<std::string>();
}

static ExchangeSettings parse_exchange(const json& ex, const EnvGetter& env) {
    const std::string ctx = "exchange.";
    ExchangeSettings s;

    const std::string adapter = str_or(ex, "adapter", "bybit", ctx);
    if (adapter == "bybit") s.adapter = AdapterKind::Bybit;
    else if (adapter == "paper") s.adapter = AdapterKind::Paper;
    else throw ConfigError("'exchange.adapter' must be 'bybit' or 'paper', got '" + adapter + "'");

    s.connection_timeout_s = narrow<long>(as_int(require(ex, "connectionTimeout", ctx), ctx + "connectionTimeout"),
                                          ctx + "connectionTimeout");
    if (s.connection_timeout_s <= 0) throw ConfigError("'exchange.connectionTimeout' must be > 0");

    s.bybit.base_url = str_or(ex, "baseUrl", s.bybit.base_url, ctx);
    s.bybit.category = str_or(ex, "category", s.bybit.category, ctx);
    if (s.bybit.category != "spot")
        throw ConfigError("'exchange.category' must be 'spot', got '" + s.bybit.category + "'");

    s.bybit.max_retries = int_or(ex, "maxRetries", s.bybit.max_retries, ctx);
    s.bybit.retry_backoff_ms = int_or(ex, "retryBackoffMs", s.bybit.retry_backoff_ms, ctx);
    s.bybit.recv_window_ms = int_or(ex, "recvWindowMs", s.bybit.recv_window_ms, ctx);
    s.bybit.book_depth = int_or(ex, "bookDepth", s.bybit.book_depth, ctx);
    if (s.bybit.max_retries < 0) throw ConfigError("'exchange.maxRetries' must be >= 0");
    if (s.bybit.retry_backoff_ms < 0) throw ConfigError("'exchange.retryBackoffMs' must be >= 0");
    if (s.bybit.recv_window_ms <= 0) throw ConfigError("'exchange.recvWindowMs' must be > 0");
    if (s.bybit.book_depth <= 0) throw ConfigError("'exchange.bookDepth' must be > 0");

    if (ex.contains("nonFatalErrorCodes")) {
        const json& codes = ex.at("nonFatalErrorCodes");
        if (!codes.is_array()) throw ConfigError("'exchange.nonFatalErrorCodes' must be a list");
        for (const auto& c : codes)
            s.non_fatal_codes.insert(narrow<int>(as_int(c, ctx + "nonFatalErrorCodes[]"), ctx + "nonFatalErrorCodes[]"));
    } else {
        s.non_fatal_codes = kDefaultNonFatalCodes;
    }

    if (ex.contains("nonFatalErrorMessages")) {
        const json& msgs = ex.at("nonFatalErrorMessages");
        if (!msgs.is_array()) throw ConfigError("'exchange.nonFatalErrorMessages' must be a list");
        for (const auto& m : msgs) {
            if (!m.is_string() || m.get<std::string>().empty())
                throw ConfigError("'exchange.nonFatalErrorMessages[]' must be non-empty strings");
            s.non_fatal_messages.push_back(m.get<std::string>());
        }
    } else {
        s.non_fatal_messages = kDefaultNonFatalMessages;
    }

    s.bybit.api_key = env("BYBIT_API_KEY").value_or("");
    s.bybit.api_secret = env("BYBIT_API_SECRET").value_or("");
    if (s.adapter == AdapterKind::Bybit) {
        if (s.bybit.api_key.empty()) throw ConfigError("missing mandatory key 'BYBIT_API_KEY' (environment)");
        if (s.bybit.api_secret.empty()) throw ConfigError("missing mandatory key 'BYBIT_API_SECRET' (environment)");
    }
    return s;
}

static EngineSettings parse_engine(const json& j) {
    const std::string ctx = "engine.";
    EngineSettings s;
    if (!j.contains("engine")) return s;

    const json& en = j.at("engine");
    if (!en.is_object()) throw ConfigError("'engine' must be an object");
    s.trade_cycle_interval_s = int_or(en, "tradeCycleIntervalSeconds", s.trade_cycle_interval_s, ctx);
    if (s.trade_cycle_interval_s <= 0) throw ConfigError("'engine.tradeCycleIntervalSeconds' must be > 0");
    s.journal_path = str_or(en, "journalPath", "", ctx);
    s.publish_endpoint = str_or(en, "publishEndpoint", "", ctx);
    return s;
}

static BalanceMap parse_paper_balances(const json& j) {
    BalanceMap out;
    if (!j.contains("paper")) return out;

    const json& p = j.at("paper");
    if (!p.is_object() || !p.contains("balances")) return out;
    const json& b = p.at("balances");
    if (!b.is_object()) throw ConfigError("'paper.balances' must be an object");

    for (auto it = b.begin(); it != b.end(); ++it) {
        const std::string name = "paper.balances." + it.key();
        const Money amount = as_money(as_text(it.value(), name), name);
        if (amount.is_negative()) throw ConfigError("'" + name + "' must be >= 0");
        out[it.key()] = Balance{amount, Money()};
    }
    return out;
}

static MarketConfig parse_market(const json& m, std::size_t idx) {
    const std::string ctx = "markets[" + std::to_string(idx) + "].";
    if (!m.is_object()) throw ConfigError("'" + ctx.substr(0, ctx.size() - 1) + "' must be an object");

    MarketConfig mc;
    mc.spec.id = require_str(m, "id", ctx);
    mc.spec.base_currency = require_str(m, "baseCurrency", ctx);
    mc.spec.counter_currency = require_str(m, "counterCurrency", ctx);

    if (m.contains("enabled")) {
        if (!m.at("enabled").is_boolean()) throw ConfigError("'" + ctx + "enabled' must be true or false");
        mc.enabled = m.at("enabled").get<bool>();
    }

    const json& st = require(m, "strategy", ctx);
    if (!st.is_object()) throw ConfigError("'" + ctx + "strategy' must be an object");

    std::map<std::string, std::string> items;
    for (auto it = st.begin(); it != st.end(); ++it)
        items[it.key()] = as_text(it.value(), ctx + "strategy." + it.key());

    mc.strategy = parse_strategy_config(items, mc.spec.id);
    return mc;
}

std::optional<std::string> process_env(const std::string& name) {
    const char* v = std::getenv(name.c_str());
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

std::vector<MarketConfig> BotConfig::enabled_markets() const {
    std::vector<MarketConfig> out;
    for (const auto& m : markets)
        if (m.enabled) out.push_back(m);
    return out;
}

StrategyConfig parse_strategy_config(const std::map<std::string, std::string>& items,
                                     const std::string& market_id) {
    const std::string ctx = "markets[" + market_id + "].strategy.";

    auto money = [&](const char* key) {
        auto it = items.find(key);
        if (it == items.end() || it->second.empty())
            throw ConfigError("missing mandatory key '" + ctx + key + "'");
        return as_money(it->second, ctx + key);
    };
    auto integer = [&](const char* key, int def) {
        auto it = items.find(key);
        if (it == items.end()) return def;
        return narrow<int>(as_int(json(it->second), ctx + key), ctx + key);
    };

    StrategyConfig c;
    c.entry_budget = money("entryBudget");
    c.min_profit_pct = money("minProfitPct");
    c.max_loss_pct = money("maxLossPct");
    c.trailing_pct = money("trailingPct");
    c.quantity_precision = integer("quantityPrecision", 8);
    c.entry_order_max_cycles = integer("entryOrderMaxCycles", 0);

    const Money one = Money::from_int(1);
    if (!c.entry_budget.is_positive())
        throw ConfigError("'" + ctx + "entryBudget' must be > 0");
    if (!c.max_loss_pct.is_positive() || c.max_loss_pct >= one)
        throw ConfigError("'" + ctx + "maxLossPct' must be in (0, 1)");
    if (c.min_profit_pct.is_negative())
        throw ConfigError("'" + ctx + "minProfitPct' must be >= 0");
    if (c.trailing_pct.is_negative() || c.trailing_pct >= one)
        throw ConfigError("'" + ctx + "trailingPct' must be in [0, 1)");
    if (c.quantity_precision < 0 || c.quantity_precision > Money::kScale)
        throw ConfigError("'" + ctx + "quantityPrecision' must be in [0, 8]");
    if (c.entry_order_max_cycles < 0)
        throw ConfigError("'" + ctx + "entryOrderMaxCycles' must be >= 0");
    return c;
}

BotConfig build_bot_config(const json& j, const EnvGetter& env) {
    if (!j.is_object()) throw ConfigError("config root must be an object");

    BotConfig cfg;
    const json& ex = require(j, "exchange", "");
    if (!ex.is_object()) throw ConfigError("'exchange' must be an object");
    cfg.exchange = parse_exchange(ex, env);
    cfg.engine = parse_engine(j);
    cfg.paper_balances = parse_paper_balances(j);

    const json& markets = require(j, "markets", "");
    if (!markets.is_array()) throw ConfigError("'markets' must be a list");

    std::set<std::string> seen;
    for (std::size_t i = 0; i < markets.size(); ++i) {
        MarketConfig mc = parse_market(markets.at(i), i);
        if (!seen.insert(mc.spec.id).second)
            throw ConfigError("duplicate market id '" + mc.spec.id + "'");
        cfg.markets.push_back(std::move(mc));
    }

    if (cfg.enabled_markets().empty()) throw ConfigError("no enabled market in 'markets'");
    return cfg;
}

BotConfig load_config_file(const std::string& path, const EnvGetter& env) {
    std::ifstream in(path);
    if (!in.is_open()) throw ConfigError("failed to open " + path);

    json j = json::parse(in, nullptr, false);
    if (j.is_discarded()) throw ConfigError("failed to parse " + path + ": not valid JSON");
    return build_bot_config(j, env);
}
