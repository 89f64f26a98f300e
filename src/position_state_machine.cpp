#include "position_state_machine.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

static const Money kOne = Money::from_int(1);

static bool is_open(const std::vector<OpenOrder>& open_orders, const std::optional<std::string>& id) {
    if (!id) return false;
    return std::any_of(open_orders.begin(), open_orders.end(),
                       [&](const OpenOrder& o) { return o.id == *id; });
}

static Decision no_action(const Position& pos, std::string note) {
    Decision d;
    d.next = pos;
    d.note = std::move(note);
    return d;
}

static Decision sell_all(const Position& pos, const PriceSnapshot& snap, ExitReason why, const Money& hwm) {
    Decision d;
    d.next = pos;
    d.next.status = PositionStatus::PendingExit;
    d.next.high_water_mark = hwm;
    d.next.exit_price = snap.ask;
    d.next.exit_reason = why;
    d.next.exit_order_id.reset();
    d.next.pending_cycles = 0;

    d.order = OrderRequest{snap.market_id, Side::Sell, pos.quantity, snap.ask};

    std::ostringstream oss;
    oss << exit_reason_str(why) << ": sell " << pos.quantity << " @ " << snap.ask
        << " (entry " << pos.entry_price << ")";
    d.note = oss.str();
    return d;
}

static Position flat_after(const Position& pos) {
    Position p;
    p.status = PositionStatus::Flat;
    p.entry_price = pos.entry_price;
    p.quantity = pos.quantity;
    p.exit_price = pos.exit_price;
    return p;
}

static Decision decide_flat(const Position& pos, const PriceSnapshot& snap, const StrategyConfig& cfg) {
    if (!snap.bid.is_positive()) return no_action(pos, "no usable bid");

    const Money qty = (cfg.entry_budget / snap.bid).round_down(cfg.quantity_precision);
    if (!qty.is_positive()) {
        return no_action(pos, "entry budget " + cfg.entry_budget.to_string() +
                              " buys nothing at bid " + snap.bid.to_string());
    }

    Decision d;
    d.next = Position{};
    d.next.status = PositionStatus::PendingEntry;
    d.next.entry_price = snap.bid;
    d.next.quantity = qty;
    d.next.high_water_mark = Money();

    d.order = OrderRequest{snap.market_id, Side::Buy, qty, snap.bid};
    d.note = "entry: buy " + qty.to_string() + " @ " + snap.bid.to_string();
    return d;
}

static Decision decide_pending_entry(const Position& pos,
                              const std::vector<OpenOrder>& open_orders,
                              const StrategyConfig& cfg) {
    if (!is_open(open_orders, pos.entry_order_id)) {
        Decision d;
        d.next = entry_filled(pos);
        d.note = "entry order " + pos.entry_order_id.value_or("?") + " filled @ " + pos.entry_price.to_string();
        return d;
    }

    const int seen = pos.pending_cycles + 1;
    if (cfg.entry_order_max_cycles > 0 && seen >= cfg.entry_order_max_cycles) {
        Decision d;
        d.next = flat_after(pos);
        d.cancel_order_id = *pos.entry_order_id;
        d.note = "entry order " + *pos.entry_order_id + " still open after " +
                 std::to_string(seen) + " cycles, cancelling";
        return d;
    }

    Position next = pos;
    next.pending_cycles = seen;
    return no_action(next, "entry order " + *pos.entry_order_id + " still open");
}

static Decision decide_holding(const Position& pos, const PriceSnapshot& snap, const StrategyConfig& cfg) {
    const Money& ask = snap.ask;
    if (!ask.is_positive()) return no_action(pos, "no usable ask");

    // 1) stop-loss, strictly below
    if (ask < cfg.stop_loss_price(pos.entry_price)) {
        return sell_all(pos, snap, ExitReason::StopLoss, pos.high_water_mark);
    }

    // 2) target never reached yet
    const Money target = cfg.profit_target_price(pos.entry_price);
    if (ask <= target && pos.high_water_mark <= target) {
        return no_action(pos, "ask " + ask.to_string() + " <= target " + target.to_string());
    }

    // 3) trailing stop rides the high-water mark
    const Money hwm = max(pos.high_water_mark, ask);
    if (ask < cfg.trailing_stop_price(hwm)) {
        return sell_all(pos, snap, ExitReason::TrailingStop, hwm);
    }

    Position next = pos;
    next.high_water_mark = hwm;
    return no_action(next, "riding: ask " + ask.to_string() + " hwm " + hwm.to_string() +
                           " stop " + cfg.trailing_stop_price(hwm).to_string());
}

static Decision decide_pending_exit(const Position& pos, const PriceSnapshot& snap,
                             const std::vector<OpenOrder>& open_orders) {
    if (!is_open(open_orders, pos.exit_order_id)) {
        Decision d;
        d.next = flat_after(pos);
        d.note = "exit order " + pos.exit_order_id.value_or("?") + " filled @ " + pos.exit_price.to_string();
        return d;
    }

    Position next = pos;
    next.pending_cycles = pos.pending_cycles + 1;

    std::string rel;
    if (snap.ask < pos.exit_price) rel = "below";
    else if (snap.ask > pos.exit_price) rel = "above";
    else rel = "equal to";
    return no_action(next, "exit order " + *pos.exit_order_id + " still open, ask " + snap.ask.to_string() +
                           " is " + rel + " exit price " + pos.exit_price.to_string());
}


const char* position_status_str(PositionStatus s) {
    switch (s) {
        case PositionStatus::Flat:         return "Flat";
        case PositionStatus::PendingEntry: return "PendingEntry";
        case PositionStatus::Holding:      return "Holding";
        case PositionStatus::PendingExit:  return "PendingExit";
    }
    return "?";
}

const char* exit_reason_str(ExitReason r) {
    switch (r) {
        case ExitReason::None:         return "none";
        case ExitReason::StopLoss:     return "stop-loss";
        case ExitReason::TrailingStop: return "trailing-stop";
    }
    return "?";
}

Money StrategyConfig::stop_loss_price(const Money& entry) const {
    return entry * (kOne - max_loss_pct);
}

Money StrategyConfig::profit_target_price(const Money& entry) const {
    return entry * (kOne + min_profit_pct);
}

Money StrategyConfig::trailing_stop_price(const Money& high_water_mark) const {
    return high_water_mark * (kOne - trailing_pct);
}

Position entry_filled(const Position& pos) {
    Position p = pos;
    p.status = PositionStatus::Holding;
    p.high_water_mark = pos.entry_price;
    p.pending_cycles = 0;
    return p;
}

Position entry_cancelled(const Position& pos, const Money& filled) {
    if (!filled.is_positive()) return flat_after(pos);

    Position p = entry_filled(pos);
    if (filled < pos.quantity) p.quantity = filled;
    return p;
}

Decision decide(const Position& pos,
                const PriceSnapshot& snap,
                const std::vector<OpenOrder>& open_orders,
                const StrategyConfig& cfg) {
    switch (pos.status) {
        case PositionStatus::Flat:         return decide_flat(pos, snap, cfg);
        case PositionStatus::PendingEntry: return decide_pending_entry(pos, open_orders, cfg);
        case PositionStatus::Holding:      return decide_holding(pos, snap, cfg);
        case PositionStatus::PendingExit:  return decide_pending_exit(pos, snap, open_orders);
    }
    return no_action(pos, "unknown status");
}

PositionStateMachine::PositionStateMachine(std::string market_id, StrategyConfig cfg)
    : market_id_(std::move(market_id)), cfg_(std::move(cfg)) {}

Decision PositionStateMachine::evaluate(const PriceSnapshot& snap,
                                       const std::vector<OpenOrder>& open_orders) const {
    return decide(pos_, snap, open_orders, cfg_);
}

PositionStateMachine::StepResult PositionStateMachine::execute(Decision d, ExchangeClient& client) {
    StepResult r;

    if (d.order) {
        const std::string id = client.place_order(market_id_, d.order->side, d.order->quantity, d.order->limit_price);
        r.order_id = id;
        if (d.order->side == Side::Buy) d.next.entry_order_id = id;
        else d.next.exit_order_id = id;
    } else if (d.cancel_order_id) {
        const std::string id = *d.cancel_order_id;
        const bool cancelled = client.cancel_order(id, market_id_);
        r.cancelled = cancelled;

        // The cancel is out; what we hold now depends on the fill, so a failed
        // read here leaves the position unknown.
        Money filled;
        try {
            filled = client.get_filled_quantity(id, market_id_);
        } catch (const ExchangeError& e) {
            throw ExchangeError(ErrorKind::AmbiguousWrite,
                                "entry order " + id + " cancel sent but its fill could not be read: " + e.what(),
                                e.status());
        }

        d.next = entry_cancelled(pos_, filled);
        if (!filled.is_positive())
            d.note = "entry order " + id + (cancelled ? " cancelled unfilled" : " gone without a fill");
        else if (filled < pos_.quantity)
            d.note = "entry order " + id + " cancelled after partial fill of " + filled.to_string();
        else
            d.note = "entry order " + id + " filled before cancel";
    }

    pos_ = d.next;
    r.decision = std::move(d);
    return r;
}
