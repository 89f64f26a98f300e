#pragma once
#include <optional>
#include <string>
#include <vector>

#include "exchange_client.hpp"
#include "market_types.hpp"
#include "money.hpp"

enum class PositionStatus { Flat, PendingEntry, Holding, PendingExit };
enum class ExitReason { None, StopLoss, TrailingStop };

const char* position_status_str(PositionStatus s);
const char* exit_reason_str(ExitReason r);

struct Position {
    PositionStatus status = PositionStatus::Flat;

    std::optional<std::string> entry_order_id;
    std::optional<std::string> exit_order_id;

    Money entry_price;
    Money quantity;
    Money high_water_mark;

    Money exit_price;
    ExitReason exit_reason = ExitReason::None;

    int pending_cycles = 0;   // consecutive cycles spent in the current Pending* state
};

// Percentages are fractions: 0.02 means 2%.
struct StrategyConfig {
    Money entry_budget;     // counter currency spent per entry
    Money min_profit_pct;
    Money max_loss_pct;
    Money trailing_pct;
    int quantity_precision = 8;
    int entry_order_max_cycles = 0;   // 0 = never cancel a resting entry

    Money stop_loss_price(const Money& entry) const;
    Money profit_target_price(const Money& entry) const;
    Money trailing_stop_price(const Money& high_water_mark) const;
};

// What one evaluation wants done. At most one of order / cancel_order_id is set.
// `next` is the position to adopt once that action has succeeded; for a placed
// order its id is filled in by PositionStateMachine::step().
struct Decision {
    Position next;
    std::optional<OrderRequest> order;
    std::optional<std::string> cancel_order_id;
    std::string note;

    bool has_action() const { return order.has_value() || cancel_order_id.has_value(); }
};

// Pure transition function. Never touches the network.
Decision decide(const Position& pos,
                const PriceSnapshot& snap,
                const std::vector<OpenOrder>& open_orders,
                const StrategyConfig& cfg);

// PendingEntry -> Holding with the high-water mark seeded at the entry price.
Position entry_filled(const Position& pos);

// Settles a cancelled entry on what actually executed: nothing -> Flat,
// anything -> Holding with the quantity cut down to the filled amount.
Position entry_cancelled(const Position& pos, const Money& filled);

class PositionStateMachine {
public:
    struct StepResult {
        Decision decision;
        std::optional<std::string> order_id;   // set if an order was placed
        std::optional<bool> cancelled;         // set if a cancel was issued
    };

    PositionStateMachine(std::string market_id, StrategyConfig cfg);

    // decide() on the current position. No side effects.
    Decision evaluate(const PriceSnapshot& snap, const std::vector<OpenOrder>& open_orders) const;

    // Performs the decision's single order action through the client.
    // The new position is adopted only if that action succeeded; anything
    // thrown by the client propagates and leaves the position untouched.
    StepResult execute(Decision d, ExchangeClient& client);

    StepResult step(const PriceSnapshot& snap,
                    const std::vector<OpenOrder>& open_orders,
                    ExchangeClient& client) {
        return execute(evaluate(snap, open_orders), client);
    }

    const Position& position() const { return pos_; }
    const StrategyConfig& config() const { return cfg_; }
    const std::string& market_id() const { return market_id_; }

private:
    std::string market_id_;
    StrategyConfig cfg_;
    Position pos_;
};
