#include "trading_engine.hpp"
#include "fakes.hpp"
#include "storage/trade_journal.hpp"
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <thread>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

MarketConfig market(const std::string& id, const std::string& base, bool enabled = true) {
    MarketConfig m;
    m.spec = MarketSpec{id, base, "USDT"};
    m.enabled = enabled;
    m.strategy.entry_budget = M("100");
    m.strategy.min_profit_pct = M("0.02");
    m.strategy.max_loss_pct = M("0.05");
    m.strategy.trailing_pct = M("0.01");
    return m;
}

// Fakes are owned by the engine; place_error is set for markets listed in `failing`.
ClientFactory fake_factory(const std::vector<std::string>& failing = {}) {
    return [failing](const MarketSpec& spec) {
        auto c = std::make_unique<FakeExchangeClient>();
        c->set_top("100", "100.5");
        for (const auto& id : failing) {
            if (id == spec.id)
                c->place_error = ExchangeError(ErrorKind::Fatal, "retCode=10003 retMsg=API key is invalid.");
        }
        return std::unique_ptr<ExchangeClient>(std::move(c));
    };
}

bool wait_for(const std::function<bool()>& pred, std::chrono::milliseconds limit) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // namespace

TEST(TradingEngineTest, OnceRunsOneCyclePerEnabledMarket)
{
    std::vector<MarketConfig> markets = {
        market("BTCUSDT", "BTC"), market("ETHUSDT", "ETH"), market("SOLUSDT", "SOL", false)};

    TradingEngine engine(markets, fake_factory(), 1h);
    engine.start_all(true);
    engine.join_all();

    EXPECT_EQ(2u, engine.cycles_run());
    EXPECT_TRUE(engine.finished());
    EXPECT_FALSE(engine.fatal());
}

TEST(TradingEngineTest, FatalOnOneMarketStopsAll)
{
    std::vector<MarketConfig> markets = {market("BTCUSDT", "BTC"), market("ETHUSDT", "ETH")};

    TradingEngine engine(markets, fake_factory({"ETHUSDT"}), 1h);
    engine.start_all();

    // with an hour between cycles this only returns if the fatal woke BTCUSDT
    ASSERT_TRUE(wait_for([&] { return engine.finished(); }, 5s));
    engine.join_all();

    EXPECT_TRUE(engine.fatal());
    EXPECT_NE(std::string::npos, engine.fatal_reason().find("ETHUSDT"));
    EXPECT_NE(std::string::npos, engine.fatal_reason().find("API key is invalid"));
}

TEST(TradingEngineTest, StopInterruptsWait)
{
    TradingEngine engine({market("BTCUSDT", "BTC")}, fake_factory(), 1h);
    engine.start_all();

    ASSERT_TRUE(wait_for([&] { return engine.cycles_run() >= 1; }, 5s));
    engine.stop();
    ASSERT_TRUE(wait_for([&] { return engine.finished(); }, 5s));
    engine.join_all();

    EXPECT_EQ(1u, engine.cycles_run());
    EXPECT_FALSE(engine.fatal());
}

TEST(TradingEngineTest, KeepsCyclingAtInterval)
{
    TradingEngine engine({market("BTCUSDT", "BTC")}, fake_factory(), 10ms);
    engine.start_all();

    EXPECT_TRUE(wait_for([&] { return engine.cycles_run() >= 3; }, 5s));
    engine.stop();
    engine.join_all();
    EXPECT_FALSE(engine.fatal());
}

TEST(TradingEngineTest, OutcomePayloadForEntry)
{
    CycleOutcome out;
    out.status = CycleStatus::Completed;
    out.reason = "entering";
    out.before = PositionStatus::Flat;
    out.after = PositionStatus::PendingEntry;
    out.snapshot = PriceSnapshot{"BTCUSDT", M("100"), M("100.5"), {}};
    out.order = OrderRequest{"BTCUSDT", Side::Buy, M("1"), M("100")};
    out.order_id = "ORD-7";

    json j = json::parse(outcome_payload("BTCUSDT", out));
    EXPECT_EQ("cycle_outcome_v1", j.at("schema").get<std::string>());
    EXPECT_EQ("BTCUSDT", j.at("market").get<std::string>());
    EXPECT_EQ("completed", j.at("status").get<std::string>());
    EXPECT_FALSE(j.contains("skip_reason"));
    EXPECT_EQ("Flat", j.at("position_before").get<std::string>());
    EXPECT_EQ("PendingEntry", j.at("position_after").get<std::string>());
    EXPECT_EQ("100.5", j.at("top_of_book").at("ask").get<std::string>());
    EXPECT_EQ("Buy", j.at("order").at("side").get<std::string>());
    EXPECT_EQ("100", j.at("order").at("price").get<std::string>());
    EXPECT_EQ("ORD-7", j.at("order").at("order_id").get<std::string>());
}

TEST(TradingEngineTest, SkippedOutcomeCarriesReason)
{
    CycleOutcome out;
    out.status = CycleStatus::Skipped;
    out.skip_reason = SkipReason::InsufficientMarketData;
    out.reason = "empty ask side";

    json j = json::parse(outcome_payload("ETHUSDT", out));
    EXPECT_EQ("skipped", j.at("status").get<std::string>());
    EXPECT_EQ(skip_reason_str(SkipReason::InsufficientMarketData), j.at("skip_reason").get<std::string>());
    EXPECT_FALSE(j.contains("order"));
    EXPECT_FALSE(j.contains("top_of_book"));

    JournalEntry e = journal_entry("ETHUSDT", out);
    EXPECT_EQ("skipped", e.status);
    EXPECT_NE(std::string::npos, e.reason.find("empty ask side"));
    EXPECT_TRUE(e.side.empty());
    EXPECT_TRUE(e.bid.empty());
}

TEST(TradingEngineTest, CancelGoesToJournalAsCancelRow)
{
    CycleOutcome out;
    out.before = PositionStatus::PendingEntry;
    out.after = PositionStatus::Flat;
    out.cancelled_order_id = "ORD-3";

    JournalEntry e = journal_entry("BTCUSDT", out);
    EXPECT_EQ("Cancel", e.side);
    EXPECT_EQ("ORD-3", e.order_id);
    EXPECT_EQ("Flat", e.position_after);
}
