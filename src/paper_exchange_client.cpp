#include "paper_exchange_client.hpp"

#include <algorithm>
#include <utility>

#include "log.hpp"

PaperExchangeClient::PaperExchangeClient(std::unique_ptr<ExchangeClient> feed, MarketSpec market, BalanceMap initial)
    : feed_(std::move(feed)),
      market_(std::move(market)),
      wallet_(std::move(initial)) {}

std::string PaperExchangeClient::name() const {
    return "Paper (" + feed_->name() + ")";
}

void PaperExchangeClient::check_market(const std::string& market_id) const {
    if (market_id != market_.id) {
        throw ExchangeError(ErrorKind::Fatal,
                            "paper client for " + market_.id + " asked about " + market_id);
    }
}

Money PaperExchangeClient::get_latest_price(const std::string& market_id) {
    std::lock_guard<std::mutex> lk(mtx_);
    return feed_->get_latest_price(market_id);
}

Ticker PaperExchangeClient::get_ticker(const std::string& market_id) {
    std::lock_guard<std::mutex> lk(mtx_);
    return feed_->get_ticker(market_id);
}

OrderBook PaperExchangeClient::get_order_book(const std::string& market_id) {
    std::lock_guard<std::mutex> lk(mtx_);
    check_market(market_id);
    OrderBook book = feed_->get_order_book(market_id);
    match(book);
    return book;
}

void PaperExchangeClient::match(const OrderBook& book) {
    const auto bid = book.best_bid();
    const auto ask = book.best_ask();

    auto it = resting_.begin();
    while (it != resting_.end()) {
        const bool crossed = (it->side == Side::Buy) ? (ask && ask->price <= it->price)
                                                     : (bid && bid->price >= it->price);
        if (!crossed) {
            ++it;
            continue;
        }

        if (it->side == Side::Buy) wallet_.on_fill_buy(market_, it->quantity, it->price);
        else wallet_.on_fill_sell(market_, it->quantity, it->price);
        ++fills_;

        log_info("PAPER") << "fill " << it->id << " " << side_str(it->side) << " "
                          << it->quantity << " " << market_.id << " @ " << it->price
                          << " realized_pnl=" << wallet_.realized_pnl();
        closed_[it->id] = it->quantity;
        it = resting_.erase(it);
    }
}

std::vector<OpenOrder> PaperExchangeClient::get_open_orders(const std::string& market_id) {
    std::lock_guard<std::mutex> lk(mtx_);
    check_market(market_id);
    return resting_;
}

std::string PaperExchangeClient::place_order(const std::string& market_id,
                                             Side side,
                                             const Money& quantity,
                                             const Money& price) {
    std::lock_guard<std::mutex> lk(mtx_);
    check_market(market_id);

    if (!quantity.is_positive() || !price.is_positive()) {
        throw ExchangeError(ErrorKind::Fatal,
                            "invalid order: qty=" + quantity.to_string() + " price=" + price.to_string());
    }

    if (side == Side::Buy) wallet_.hold(market_.counter_currency, quantity * price);
    else wallet_.hold(market_.base_currency, quantity);

    OpenOrder o;
    o.id = "PAPER-" + std::to_string(next_id_++);
    o.market_id = market_id;
    o.side = side;
    o.price = price;
    o.quantity = quantity;
    resting_.push_back(o);

    log_info("PAPER") << "accepted " << o.id << " " << side_str(side) << " "
                      << quantity << " " << market_id << " @ " << price;
    return o.id;
}

bool PaperExchangeClient::cancel_order(const std::string& order_id, const std::string& market_id) {
    std::lock_guard<std::mutex> lk(mtx_);
    check_market(market_id);

    auto it = std::find_if(resting_.begin(), resting_.end(),
                           [&](const OpenOrder& o) { return o.id == order_id; });
    if (it == resting_.end()) return false;

    if (it->side == Side::Buy) wallet_.release(market_.counter_currency, it->quantity * it->price);
    else wallet_.release(market_.base_currency, it->quantity);

    log_info("PAPER") << "cancelled " << order_id;
    closed_[order_id] = Money();
    resting_.erase(it);
    return true;
}

// Fills are all-or-nothing here, so a resting order has executed nothing.
Money PaperExchangeClient::get_filled_quantity(const std::string& order_id, const std::string& market_id) {
    std::lock_guard<std::mutex> lk(mtx_);
    check_market(market_id);

    auto closed = closed_.find(order_id);
    if (closed != closed_.end()) return closed->second;

    auto open = std::find_if(resting_.begin(), resting_.end(),
                             [&](const OpenOrder& o) { return o.id == order_id; });
    if (open != resting_.end()) return Money();

    throw ExchangeError(ErrorKind::Fatal, "paper order " + order_id + " does not exist");
}

BalanceMap PaperExchangeClient::get_balances() {
    std::lock_guard<std::mutex> lk(mtx_);
    return wallet_.balances();
}

Money PaperExchangeClient::realized_pnl() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return wallet_.realized_pnl();
}

std::size_t PaperExchangeClient::fills() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return fills_;
}
