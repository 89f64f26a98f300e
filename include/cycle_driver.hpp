#pragma once
#include <optional>
#include <string>

#include "exchange_client.hpp"
#include "market_types.hpp"
#include "position_state_machine.hpp"

enum class CycleStatus { Completed, Skipped, FatalAbort };

enum class SkipReason {
    None,
    TransientNetwork,         // read failed with a retryable error
    ReadFailed,               // read failed with a fatal error; only this cycle is dropped
    InsufficientMarketData,   // an order book side was empty
    WriteNotApplied,          // write failed and the client confirmed it did not take effect
    EvaluationFailed          // arithmetic on the snapshot failed before any write
};

const char* cycle_status_str(CycleStatus s);
const char* skip_reason_str(SkipReason r);

struct CycleOutcome {
    CycleStatus status = CycleStatus::Completed;
    SkipReason skip_reason = SkipReason::None;
    std::string reason;   // decision note or error text

    std::optional<PriceSnapshot> snapshot;
    std::optional<OrderRequest> order;
    std::optional<std::string> order_id;
    std::optional<std::string> cancelled_order_id;

    PositionStatus before = PositionStatus::Flat;
    PositionStatus after = PositionStatus::Flat;
};

// Runs one market: order book -> snapshot -> (open orders) -> state machine.
// After a FatalAbort the driver is halted for good and never calls the
// exchange again.
class CycleDriver {
public:
    CycleDriver(MarketSpec market, StrategyConfig cfg, ExchangeClient& client);

    CycleOutcome run_one_cycle();

    bool halted() const { return halted_; }
    const std::string& halt_reason() const { return halt_reason_; }
    const Position& position() const { return psm_.position(); }

private:
    CycleOutcome skipped(CycleOutcome out, SkipReason why, const std::string& detail) const;
    CycleOutcome halt(CycleOutcome out, const std::string& why);

    MarketSpec market_;
    ExchangeClient& client_;
    PositionStateMachine psm_;

    bool halted_ = false;
    std::string halt_reason_;
};
