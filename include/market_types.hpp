#pragma once
#include <chrono>
#include <map>
#include <string>

#include "money.hpp"

enum class Side { Buy, Sell };

inline const char* side_str(Side s) { return s == Side::Buy ? "Buy" : "Sell"; }

struct MarketSpec {
    std::string id;                // exchange symbol, e.g. "BTCUSDT"
    std::string base_currency;     // "BTC"
    std::string counter_currency;  // "USDT"
};

// Best bid/ask sampled once per cycle.
struct PriceSnapshot {
    std::string market_id;
    Money bid;
    Money ask;
    std::chrono::system_clock::time_point observed_at;
};

struct OrderRequest {
    std::string market_id;
    Side side = Side::Buy;
    Money quantity;
    Money limit_price;
};

// A resting order as reported by the exchange.
struct OpenOrder {
    std::string id;
    std::string market_id;
    Side side = Side::Buy;
    Money price;
    Money quantity;
};

struct Ticker {
    Money last;
    Money bid;
    Money ask;
    Money high;
    Money low;
    Money volume;
};

struct Balance {
    Money available;
    Money on_hold;
};

using BalanceMap = std::map<std::string, Balance>;
