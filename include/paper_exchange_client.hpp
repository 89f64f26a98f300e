#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "exchange_client.hpp"
#include "virtual_wallet.hpp"

// Simulated execution on live market data.
//
// Reads are forwarded to `feed`. Orders rest in memory and fill at their limit
// price once a later order book crosses them: a buy when best ask <= price,
// a sell when best bid >= price. Matching runs on every get_order_book().
class PaperExchangeClient : public ExchangeClient {
public:
    PaperExchangeClient(std::unique_ptr<ExchangeClient> feed, MarketSpec market, BalanceMap initial);

    std::string name() const override;
    Money get_latest_price(const std::string& market_id) override;
    Ticker get_ticker(const std::string& market_id) override;
    OrderBook get_order_book(const std::string& market_id) override;
    std::vector<OpenOrder> get_open_orders(const std::string& market_id) override;
    std::string place_order(const std::string& market_id,
                            Side side,
                            const Money& quantity,
                            const Money& price) override;
    bool cancel_order(const std::string& order_id, const std::string& market_id) override;
    Money get_filled_quantity(const std::string& order_id, const std::string& market_id) override;
    BalanceMap get_balances() override;

    Money realized_pnl() const;
    std::size_t fills() const;

private:
    void match(const OrderBook& book);
    void check_market(const std::string& market_id) const;

    std::unique_ptr<ExchangeClient> feed_;
    MarketSpec market_;

    mutable std::mutex mtx_;
    VirtualWallet wallet_;
    std::vector<OpenOrder> resting_;
    std::map<std::string, Money> closed_;   // executed qty of filled or cancelled orders
    std::uint64_t next_id_ = 1;
    std::size_t fills_ = 0;
};
