#pragma once
#include <string>

#include "market_types.hpp"

// Paper balances per currency. Funds for a resting order move from
// available to on_hold and leave the wallet when the order fills.
class VirtualWallet {
public:
    explicit VirtualWallet(BalanceMap initial);

    // Throws ExchangeError(Fatal) on insufficient funds.
    void hold(const std::string& ccy, const Money& amount);
    void release(const std::string& ccy, const Money& amount);

    // Resting buy of qty base @ price filled: held counter is spent.
    void on_fill_buy(const MarketSpec& m, const Money& qty, const Money& price);
    // Resting sell of qty base @ price filled: held base is spent.
    void on_fill_sell(const MarketSpec& m, const Money& qty, const Money& price);

    const BalanceMap& balances() const { return bal_; }
    Money realized_pnl() const { return realized_pnl_; }

private:
    BalanceMap bal_;
    Money pos_;
    Money avg_entry_;
    Money realized_pnl_;
};
