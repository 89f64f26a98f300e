#include "cycle_driver.hpp"

#include <chrono>
#include <utility>
#include <vector>

const char* cycle_status_str(CycleStatus s) {
    switch (s) {
        case CycleStatus::Completed:  return "completed";
        case CycleStatus::Skipped:    return "skipped";
        case CycleStatus::FatalAbort: return "fatal-abort";
    }
    return "?";
}

const char* skip_reason_str(SkipReason r) {
    switch (r) {
        case SkipReason::None:                   return "none";
        case SkipReason::TransientNetwork:       return "transient-network";
        case SkipReason::ReadFailed:             return "read-failed";
        case SkipReason::InsufficientMarketData: return "insufficient-market-data";
        case SkipReason::WriteNotApplied:        return "write-not-applied";
        case SkipReason::EvaluationFailed:       return "evaluation-failed";
    }
    return "?";
}

CycleDriver::CycleDriver(MarketSpec market, StrategyConfig cfg, ExchangeClient& client)
    : market_(std::move(market)),
      client_(client),
      psm_(market_.id, std::move(cfg)) {}

CycleOutcome CycleDriver::skipped(CycleOutcome out, SkipReason why, const std::string& detail) const {
    out.status = CycleStatus::Skipped;
    out.skip_reason = why;
    out.reason = detail;
    out.after = psm_.position().status;
    return out;
}

CycleOutcome CycleDriver::halt(CycleOutcome out, const std::string& why) {
    halted_ = true;
    halt_reason_ = why;
    out.status = CycleStatus::FatalAbort;
    out.reason = why;
    out.after = psm_.position().status;
    return out;
}

CycleOutcome CycleDriver::run_one_cycle() {
    CycleOutcome out;
    out.before = out.after = psm_.position().status;

    if (halted_) {
        out.status = CycleStatus::FatalAbort;
        out.reason = "halted: " + halt_reason_;
        return out;
    }

    // 1) market data
    OrderBook book;
    try {
        book = client_.get_order_book(market_.id);
    } catch (const ExchangeError& e) {
        return skipped(std::move(out),
                       e.transient() ? SkipReason::TransientNetwork : SkipReason::ReadFailed,
                       e.what());
    }

    const auto bid = book.best_bid();
    const auto ask = book.best_ask();
    if (!bid || !ask) {
        return skipped(std::move(out), SkipReason::InsufficientMarketData,
                       !bid ? "empty bid side" : "empty ask side");
    }

    PriceSnapshot snap;
    snap.market_id = market_.id;
    snap.bid = bid->price;
    snap.ask = ask->price;
    snap.observed_at = std::chrono::system_clock::now();
    out.snapshot = snap;

    // 2) only a pending order needs the open-orders view
    std::vector<OpenOrder> open_orders;
    const PositionStatus st = psm_.position().status;
    if (st == PositionStatus::PendingEntry || st == PositionStatus::PendingExit) {
        try {
            open_orders = client_.get_open_orders(market_.id);
        } catch (const ExchangeError& e) {
            return skipped(std::move(out),
                           e.transient() ? SkipReason::TransientNetwork : SkipReason::ReadFailed,
                           e.what());
        }
    }

    // 3) decide: arithmetic only, nothing has been sent yet
    Decision decision;
    try {
        decision = psm_.evaluate(snap, open_orders);
    } catch (const std::exception& e) {
        return skipped(std::move(out), SkipReason::EvaluationFailed, e.what());
    }

    // 4) act
    try {
        auto r = psm_.execute(std::move(decision), client_);
        out.reason = r.decision.note;
        out.order = r.decision.order;
        out.order_id = r.order_id;
        if (r.cancelled) out.cancelled_order_id = r.decision.cancel_order_id;
    } catch (const ExchangeError& e) {
        if (e.transient()) {
            return skipped(std::move(out), SkipReason::WriteNotApplied, e.what());
        }
        return halt(std::move(out), std::string(error_kind_str(e.kind())) + ": " + e.what());
    } catch (const std::exception& e) {
        // Unclassified failure mid-write: whether the order landed is unknown.
        return halt(std::move(out), std::string(error_kind_str(ErrorKind::AmbiguousWrite)) +
                                    ": unclassified write failure: " + e.what());
    }

    out.status = CycleStatus::Completed;
    out.after = psm_.position().status;
    return out;
}
