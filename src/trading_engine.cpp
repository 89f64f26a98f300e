#include "trading_engine.hpp"

#include <nlohmann/json.hpp>

#include "core/zmq_publisher.hpp"
#include "log.hpp"
#include "storage/trade_journal.hpp"

using json = nlohmann::json;

static std::int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string outcome_payload(const std::string& market, const CycleOutcome& out) {
    json j;
    j["schema"] = "cycle_outcome_v1";
    j["market"] = market;
    j["ts_ms"] = now_ms();
    j["status"] = cycle_status_str(out.status);
    if (out.status == CycleStatus::Skipped) j["skip_reason"] = skip_reason_str(out.skip_reason);
    j["reason"] = out.reason;
    j["position_before"] = position_status_str(out.before);
    j["position_after"] = position_status_str(out.after);

    if (out.snapshot) {
        j["top_of_book"] = {
            {"bid", out.snapshot->bid.to_string()},
            {"ask", out.snapshot->ask.to_string()},
        };
    }
    if (out.order) {
        j["order"] = {
            {"side", side_str(out.order->side)},
            {"quantity", out.order->quantity.to_string()},
            {"price", out.order->limit_price.to_string()},
            {"order_id", out.order_id.value_or("")},
        };
    }
    if (out.cancelled_order_id) j["cancelled_order_id"] = *out.cancelled_order_id;
    return j.dump();
}

JournalEntry journal_entry(const std::string& market, const CycleOutcome& out) {
    JournalEntry e;
    e.ts_ms = now_ms();
    e.market = market;
    e.status = cycle_status_str(out.status);
    e.reason = out.reason;
    if (out.status == CycleStatus::Skipped)
        e.reason = std::string(skip_reason_str(out.skip_reason)) + ": " + out.reason;
    e.position_before = position_status_str(out.before);
    e.position_after = position_status_str(out.after);

    if (out.order) {
        e.side = side_str(out.order->side);
        e.quantity = out.order->quantity.to_string();
        e.price = out.order->limit_price.to_string();
        e.order_id = out.order_id.value_or("");
    } else if (out.cancelled_order_id) {
        e.side = "Cancel";
        e.order_id = *out.cancelled_order_id;
    }
    if (out.snapshot) {
        e.bid = out.snapshot->bid.to_string();
        e.ask = out.snapshot->ask.to_string();
    }
    return e;
}

TradingEngine::TradingEngine(const std::vector<MarketConfig>& markets,
                             const ClientFactory& make_client,
                             std::chrono::milliseconds interval,
                             TradeJournal* journal,
                             CyclePublisher* publisher)
    : interval_(interval),
      journal_(journal),
      publisher_(publisher)
{
    for (const auto& m : markets) {
        if (!m.enabled) continue;

        auto w = std::make_unique<MarketWorker>();
        w->market = m.spec;
        w->client = make_client(m.spec);
        w->driver = std::make_unique<CycleDriver>(m.spec, m.strategy, *w->client);

        log_info("engine") << m.spec.id << " via " << w->client->name()
                           << " budget=" << m.strategy.entry_budget
                           << " minProfit=" << m.strategy.min_profit_pct
                           << " maxLoss=" << m.strategy.max_loss_pct
                           << " trailing=" << m.strategy.trailing_pct;
        workers_.push_back(std::move(w));
    }
}

TradingEngine::~TradingEngine() {
    stop();
    join_all();
}

void TradingEngine::start_all(bool once) {
    if (running_.exchange(true)) return;

    live_ = workers_.size();
    for (auto& w : workers_) {
        MarketWorker* wp = w.get();
        threads_.emplace_back([this, wp, once] {
            market_loop(*wp, once);
            --live_;
        });
    }
}

void TradingEngine::join_all() {
    for (auto& t : threads_)
        if (t.joinable()) t.join();
    threads_.clear();
}

void TradingEngine::stop() {
    {
        std::lock_guard<std::mutex> lk(stop_mtx_);
        running_ = false;
    }
    stop_cv_.notify_all();
}

std::string TradingEngine::fatal_reason() const {
    std::lock_guard<std::mutex> lk(fatal_mtx_);
    return fatal_reason_;
}

bool TradingEngine::wait_interval() {
    std::unique_lock<std::mutex> lk(stop_mtx_);
    return !stop_cv_.wait_for(lk, interval_, [&] { return !running_; });
}

void TradingEngine::on_fatal(const std::string& market, const std::string& why) {
    {
        std::lock_guard<std::mutex> lk(fatal_mtx_);
        if (!fatal_) fatal_reason_ = market + ": " + why;
        fatal_ = true;
    }
    log_error("engine") << "fatal abort on " << market << ", stopping all markets: " << why;
    stop();
}

void TradingEngine::report(const MarketWorker& w, const CycleOutcome& out) {
    const std::string& id = w.market.id;

    switch (out.status) {
        case CycleStatus::Completed:
            if (out.order || out.cancelled_order_id || out.before != out.after) {
                log_info("cycle") << id << " " << position_status_str(out.before) << " -> "
                                  << position_status_str(out.after) << " | " << out.reason
                                  << (out.order_id ? " orderId=" + *out.order_id : std::string());
            } else {
                log_info("cycle") << id << " " << position_status_str(out.after) << " | " << out.reason;
            }
            break;
        case CycleStatus::Skipped:
            log_warn("cycle") << id << " skipped (" << skip_reason_str(out.skip_reason) << "): " << out.reason;
            break;
        case CycleStatus::FatalAbort:
            log_error("cycle") << id << " FATAL: " << out.reason;
            break;
    }

    if (journal_) journal_->push(journal_entry(id, out));
    if (publisher_) publisher_->publish(id, outcome_payload(id, out));
}

void TradingEngine::market_loop(MarketWorker& w, bool once) {
    while (running_) {
        CycleOutcome out;
        try {
            out = w.driver->run_one_cycle();
        } catch (const std::exception& e) {
            // Nothing outside ExchangeError should escape a cycle.
            on_fatal(w.market.id, std::string("unexpected error: ") + e.what());
            return;
        }
        ++cycles_;
        report(w, out);

        if (out.status == CycleStatus::FatalAbort) {
            on_fatal(w.market.id, out.reason);
            return;
        }
        if (once) return;
        if (!wait_interval()) return;
    }
}
