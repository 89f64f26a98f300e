#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>

#include "bot_config.hpp"
#include "bybit_client.hpp"
#include "core/zmq_publisher.hpp"
#include "log.hpp"
#include "paper_exchange_client.hpp"
#include "storage/trade_journal.hpp"
#include "trading_engine.hpp"

// Exit codes
static constexpr int kExitOk = 0;
static constexpr int kExitConfig = 1;
static constexpr int kExitFatal = 2;

// ---- Ctrl+C / SIGTERM stop flag ----
static std::atomic<bool> g_stop{false};
static void on_signal(int) { g_stop.store(true); }

static std::unique_ptr<BybitClient> make_bybit(const ExchangeSettings& ex) {
    return std::make_unique<BybitClient>(ex.bybit, ex.classifier(),
                                         std::make_unique<CurlTransport>(ex.connection_timeout_s));
}

static void log_balances(const BalanceMap& bal) {
    for (const auto& [ccy, b] : bal) {
        if (b.available.is_zero() && b.on_hold.is_zero()) continue;
        log_info("engine") << "balance " << ccy << " available=" << b.available << " on_hold=" << b.on_hold;
    }
}

int main(int argc, char** argv) {
    std::string config_path = "config.json";
    bool once = false;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--once") once = true;
        else config_path = a;
    }

    // ---------- Config ----------
    BotConfig cfg;
    try {
        cfg = load_config_file(config_path);
    } catch (const ConfigError& e) {
        log_error("config") << e.what();
        return kExitConfig;
    }

    const ExchangeSettings& ex = cfg.exchange;
    const bool paper = (ex.adapter == AdapterKind::Paper);
    log_info("config") << "loaded " << config_path << " adapter=" << (paper ? "paper" : "bybit")
                       << " markets=" << cfg.enabled_markets().size()
                       << " interval_s=" << cfg.engine.trade_cycle_interval_s;

    // ---------- Startup probe ----------
    if (!paper) {
        auto probe = make_bybit(ex);
        bool ok = probe->sync_time();
        log_info("BYBIT") << "time sync " << (ok ? "OK" : "FAILED");
        try {
            log_balances(probe->get_balances());
        } catch (const ExchangeError& e) {
            log_error("BYBIT") << "startup balance check failed (" << error_kind_str(e.kind()) << "): " << e.what();
            return kExitFatal;
        }
    } else {
        log_balances(cfg.paper_balances);
    }

    // ---------- Journal / publisher (optional, never fatal) ----------
    std::unique_ptr<TradeJournal> journal;
    if (!cfg.engine.journal_path.empty()) {
        journal = std::make_unique<TradeJournal>(cfg.engine.journal_path);
        if (!journal->start()) {
            log_warn("journal") << "could not open " << cfg.engine.journal_path << ", continuing without journal";
            journal.reset();
        }
    }

    std::unique_ptr<CyclePublisher> publisher;
    if (!cfg.engine.publish_endpoint.empty()) {
        try {
            publisher = std::make_unique<CyclePublisher>(cfg.engine.publish_endpoint);
            log_info("publish") << "cycle outcomes on " << cfg.engine.publish_endpoint;
        } catch (const zmq::error_t& e) {
            log_warn("publish") << "bind " << cfg.engine.publish_endpoint << " failed: " << e.what()
                                << ", continuing without publisher";
        }
    }

    // ---------- Engine ----------
    ClientFactory factory = [&](const MarketSpec& m) -> std::unique_ptr<ExchangeClient> {
        auto bybit = make_bybit(ex);
        if (paper) return std::make_unique<PaperExchangeClient>(std::move(bybit), m, cfg.paper_balances);
        if (!bybit->sync_time())
            log_warn("BYBIT") << m.id << " time sync failed, using local clock";
        return bybit;
    };

    TradingEngine engine(cfg.markets, factory,
                         std::chrono::seconds(cfg.engine.trade_cycle_interval_s),
                         journal.get(), publisher.get());

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    engine.start_all(once);
    while (!g_stop.load() && !engine.finished()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    if (g_stop.load()) log_info("engine") << "stop requested, finishing current cycles";

    engine.stop();
    engine.join_all();
    if (journal) journal->stop();

    log_info("engine") << "cycles run: " << engine.cycles_run();
    if (engine.fatal()) {
        log_error("engine") << "exiting after fatal abort: " << engine.fatal_reason();
        return kExitFatal;
    }
    return kExitOk;
}
