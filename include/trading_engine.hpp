#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "bot_config.hpp"
#include "cycle_driver.hpp"
#include "exchange_client.hpp"

class TradeJournal;
class CyclePublisher;
struct JournalEntry;

using ClientFactory = std::function<std::unique_ptr<ExchangeClient>(const MarketSpec&)>;

// JSON published on "cycle.<market>".
std::string outcome_payload(const std::string& market, const CycleOutcome& out);
JournalEntry journal_entry(const std::string& market, const CycleOutcome& out);

/* ================= TradingEngine ================= */

// One worker thread per market, each with its own client and driver.
// A FatalAbort on any market stops every market.
class TradingEngine {
public:
    TradingEngine(const std::vector<MarketConfig>& markets,
                  const ClientFactory& make_client,
                  std::chrono::milliseconds interval,
                  TradeJournal* journal = nullptr,
                  CyclePublisher* publisher = nullptr);
    ~TradingEngine();

    TradingEngine(const TradingEngine&) = delete;
    TradingEngine& operator=(const TradingEngine&) = delete;

    // once=true: a single cycle per market, then the worker exits.
    void start_all(bool once = false);
    void join_all();

    // Takes effect before the next cycle; a running cycle is never interrupted.
    void stop();

    bool fatal() const { return fatal_.load(); }
    std::string fatal_reason() const;
    std::size_t cycles_run() const { return cycles_.load(); }
    bool finished() const { return live_.load() == 0; }   // every worker has exited

private:
    struct MarketWorker {
        MarketSpec market;
        std::unique_ptr<ExchangeClient> client;
        std::unique_ptr<CycleDriver> driver;
    };

    void market_loop(MarketWorker& w, bool once);
    void report(const MarketWorker& w, const CycleOutcome& out);
    void on_fatal(const std::string& market, const std::string& why);
    bool wait_interval();   // false once stopping

private:
    std::vector<std::unique_ptr<MarketWorker>> workers_;
    std::vector<std::thread> threads_;

    std::chrono::milliseconds interval_;
    TradeJournal* journal_;
    CyclePublisher* publisher_;

    std::mutex stop_mtx_;
    std::condition_variable stop_cv_;
    std::atomic<bool> running_{false};

    std::atomic<bool> fatal_{false};
    mutable std::mutex fatal_mtx_;
    std::string fatal_reason_;

    std::atomic<std::size_t> cycles_{0};
    std::atomic<std::size_t> live_{0};
};
