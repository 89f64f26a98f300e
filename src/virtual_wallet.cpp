#include "virtual_wallet.hpp"

#include <utility>

#include "exchange_error.hpp"

VirtualWallet::VirtualWallet(BalanceMap initial)
    : bal_(std::move(initial)) {}

void VirtualWallet::hold(const std::string& ccy, const Money& amount) {
    Balance& b = bal_[ccy];
    if (b.available < amount) {
        throw ExchangeError(ErrorKind::Fatal,
                            "insufficient funds: need " + amount.to_string() + " " + ccy +
                            ", available " + b.available.to_string());
    }
    b.available = b.available - amount;
    b.on_hold = b.on_hold + amount;
}

void VirtualWallet::release(const std::string& ccy, const Money& amount) {
    Balance& b = bal_[ccy];
    b.on_hold = b.on_hold - amount;
    b.available = b.available + amount;
}

void VirtualWallet::on_fill_buy(const MarketSpec& m, const Money& qty, const Money& price) {
    Balance& counter = bal_[m.counter_currency];
    Balance& base = bal_[m.base_currency];

    counter.on_hold = counter.on_hold - qty * price;
    base.available = base.available + qty;

    const Money new_pos = pos_ + qty;
    if (pos_.is_zero())
        avg_entry_ = price;
    else
        avg_entry_ = (pos_ * avg_entry_ + qty * price) / new_pos;
    pos_ = new_pos;
}

void VirtualWallet::on_fill_sell(const MarketSpec& m, const Money& qty, const Money& price) {
    Balance& counter = bal_[m.counter_currency];
    Balance& base = bal_[m.base_currency];

    base.on_hold = base.on_hold - qty;
    counter.available = counter.available + qty * price;

    realized_pnl_ = realized_pnl_ + qty * (price - avg_entry_);
    pos_ = pos_ - qty;
    if (!pos_.is_positive()) {
        pos_ = Money();
        avg_entry_ = Money();
    }
}
