#pragma once
#include <string>
#include <vector>

#include "exchange_error.hpp"
#include "market_types.hpp"
#include "order_book.hpp"

// Capability set every exchange adapter provides. One instance per market:
// calls on an instance are serialised, so an order submission never races
// a read of the same market's open orders.
//
// Every operation reports failure by throwing ExchangeError.
class ExchangeClient {
public:
    virtual ~ExchangeClient() = default;

    virtual std::string name() const = 0;

    virtual Money get_latest_price(const std::string& market_id) = 0;
    virtual Ticker get_ticker(const std::string& market_id) = 0;

    // An empty side is returned as-is; callers decide what "no book" means.
    virtual OrderBook get_order_book(const std::string& market_id) = 0;

    virtual std::vector<OpenOrder> get_open_orders(const std::string& market_id) = 0;

    // Returns the exchange order id.
    virtual std::string place_order(const std::string& market_id,
                                    Side side,
                                    const Money& quantity,
                                    const Money& price) = 0;

    // true  -> the order was cancelled
    // false -> the order no longer exists (filled, or never known)
    virtual bool cancel_order(const std::string& order_id, const std::string& market_id) = 0;

    // Base quantity executed on an order so far, whether it is still open or not.
    virtual Money get_filled_quantity(const std::string& order_id, const std::string& market_id) = 0;

    virtual BalanceMap get_balances() = 0;
};
