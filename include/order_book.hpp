#pragma once
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "money.hpp"

struct BookLevel {
    Money price;
    Money quantity;
};

class OrderBook {
public:
    std::string market_id;

    // Bids: highest price first
    std::map<Money, Money, std::greater<Money>> bids;
    // Asks: lowest price first
    std::map<Money, Money> asks;

    void clear() {
        bids.clear();
        asks.clear();
    }

    // Apply full snapshot; non-positive quantities are dropped
    void apply_snapshot(const std::vector<std::pair<Money, Money>>& bid_lvls,
                        const std::vector<std::pair<Money, Money>>& ask_lvls)
    {
        clear();
        for (const auto& [px, qty] : bid_lvls) {
            if (qty.is_positive()) bids[px] = qty;
        }
        for (const auto& [px, qty] : ask_lvls) {
            if (qty.is_positive()) asks[px] = qty;
        }
    }

    std::optional<BookLevel> best_bid() const {
        if (bids.empty()) return std::nullopt;
        return BookLevel{bids.begin()->first, bids.begin()->second};
    }

    std::optional<BookLevel> best_ask() const {
        if (asks.empty()) return std::nullopt;
        return BookLevel{asks.begin()->first, asks.begin()->second};
    }
};
