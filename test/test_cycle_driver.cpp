#include "cycle_driver.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>

#include <stdexcept>

namespace {

// Write path that fails outside the ExchangeError taxonomy, e.g. a malformed
// success body blowing up in the JSON layer after the order went out.
class ThrowingPlaceClient : public FakeExchangeClient {
public:
    int place_calls = 0;

    std::string place_order(const std::string&, Side, const Money&, const Money&) override {
        ++place_calls;
        throw std::runtime_error("[json.exception.type_error.302] type must be string, but is number");
    }
};

} // namespace

class CycleDriverTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg.entry_budget = M("100");
        cfg.min_profit_pct = M("0.02");
        cfg.max_loss_pct = M("0.05");
        cfg.trailing_pct = M("0.01");
        client.set_top("100", "100.5");
    }

    CycleDriver make_driver() { return CycleDriver(market, cfg, client); }

    MarketSpec market{"BTCUSDT", "BTC", "USDT"};
    StrategyConfig cfg;
    FakeExchangeClient client;
};

TEST_F(CycleDriverTest, FlatCycleEntersPosition)
{
    CycleDriver driver = make_driver();
    CycleOutcome out = driver.run_one_cycle();

    EXPECT_EQ(CycleStatus::Completed, out.status);
    EXPECT_EQ(PositionStatus::Flat, out.before);
    EXPECT_EQ(PositionStatus::PendingEntry, out.after);
    ASSERT_TRUE(out.order.has_value());
    EXPECT_EQ(Side::Buy, out.order->side);
    EXPECT_EQ(M("100"), out.order->limit_price);
    EXPECT_EQ("ORD-1", out.order_id.value_or(""));
    ASSERT_TRUE(out.snapshot.has_value());
    EXPECT_EQ(M("100.5"), out.snapshot->ask);

    // open orders are only needed once something is pending
    EXPECT_EQ(0, client.open_orders_calls);
}

TEST_F(CycleDriverTest, EmptyBidSideSkipsWithoutOrder)
{
    client.set_top(nullptr, "100.5");
    CycleDriver driver = make_driver();

    CycleOutcome out = driver.run_one_cycle();
    EXPECT_EQ(CycleStatus::Skipped, out.status);
    EXPECT_EQ(SkipReason::InsufficientMarketData, out.skip_reason);
    EXPECT_TRUE(client.placed.empty());
    EXPECT_EQ(PositionStatus::Flat, driver.position().status);
}

TEST_F(CycleDriverTest, EmptyAskSideSkips)
{
    client.set_top("100", nullptr);
    CycleDriver driver = make_driver();

    CycleOutcome out = driver.run_one_cycle();
    EXPECT_EQ(SkipReason::InsufficientMarketData, out.skip_reason);
    EXPECT_TRUE(client.placed.empty());
}

TEST_F(CycleDriverTest, ReadErrorsSkipAndKeepState)
{
    CycleDriver driver = make_driver();

    client.book_error = ExchangeError(ErrorKind::Transient, "HTTP 503", 503);
    CycleOutcome t = driver.run_one_cycle();
    EXPECT_EQ(CycleStatus::Skipped, t.status);
    EXPECT_EQ(SkipReason::TransientNetwork, t.skip_reason);

    client.book_error = ExchangeError(ErrorKind::Fatal, "HTTP 401", 401);
    CycleOutcome f = driver.run_one_cycle();
    EXPECT_EQ(CycleStatus::Skipped, f.status);
    EXPECT_EQ(SkipReason::ReadFailed, f.skip_reason);
    EXPECT_FALSE(driver.halted());

    client.book_error.reset();
    EXPECT_EQ(CycleStatus::Completed, driver.run_one_cycle().status);
    EXPECT_EQ(1u, client.placed.size());
}

TEST_F(CycleDriverTest, OpenOrdersReadErrorSkips)
{
    CycleDriver driver = make_driver();
    driver.run_one_cycle();   // -> PendingEntry

    client.open_orders_error = ExchangeError(ErrorKind::Transient, "Connection reset");
    CycleOutcome out = driver.run_one_cycle();
    EXPECT_EQ(CycleStatus::Skipped, out.status);
    EXPECT_EQ(PositionStatus::PendingEntry, driver.position().status);
}

TEST_F(CycleDriverTest, FatalWriteAbortsAndStopsOrdering)
{
    client.place_error = ExchangeError(ErrorKind::Fatal, "retCode=170131 retMsg=Insufficient balance.");
    CycleDriver driver = make_driver();

    CycleOutcome out = driver.run_one_cycle();
    EXPECT_EQ(CycleStatus::FatalAbort, out.status);
    EXPECT_TRUE(driver.halted());
    EXPECT_NE(std::string::npos, out.reason.find("Insufficient balance"));

    // even once the exchange would accept orders again, nothing more is sent
    client.place_error.reset();
    const int calls = client.book_calls;
    CycleOutcome again = driver.run_one_cycle();
    EXPECT_EQ(CycleStatus::FatalAbort, again.status);
    EXPECT_EQ(calls, client.book_calls);
    EXPECT_TRUE(client.placed.empty());
}

TEST_F(CycleDriverTest, AmbiguousWriteAborts)
{
    client.place_error = ExchangeError(ErrorKind::AmbiguousWrite, "could not confirm");
    CycleDriver driver = make_driver();

    CycleOutcome out = driver.run_one_cycle();
    EXPECT_EQ(CycleStatus::FatalAbort, out.status);
    EXPECT_NE(std::string::npos, out.reason.find("AmbiguousWrite"));
    EXPECT_TRUE(driver.halted());
    EXPECT_EQ(out.reason, driver.halt_reason());
}

TEST_F(CycleDriverTest, TransientWriteSkipsAndRetriesNextCycle)
{
    client.place_error = ExchangeError(ErrorKind::Transient, "HTTP 503", 503);
    CycleDriver driver = make_driver();

    CycleOutcome out = driver.run_one_cycle();
    EXPECT_EQ(CycleStatus::Skipped, out.status);
    EXPECT_EQ(SkipReason::WriteNotApplied, out.skip_reason);
    EXPECT_EQ(PositionStatus::Flat, driver.position().status);
    EXPECT_FALSE(driver.halted());

    client.place_error.reset();
    EXPECT_EQ(PositionStatus::PendingEntry, driver.run_one_cycle().after);
}

TEST_F(CycleDriverTest, FullRoundTripKeepsQuantity)
{
    CycleDriver driver = make_driver();

    // entry: buy 1 @ 100
    driver.run_one_cycle();
    const std::string entry_id = driver.position().entry_order_id.value_or("");
    client.fill(entry_id);

    // filled -> Holding
    EXPECT_EQ(PositionStatus::Holding, driver.run_one_cycle().after);

    // ask 103 rides, ask 101.5 trails out
    client.set_top("102.9", "103");
    EXPECT_EQ(PositionStatus::Holding, driver.run_one_cycle().after);
    client.set_top("101.4", "101.5");
    CycleOutcome exit = driver.run_one_cycle();
    EXPECT_EQ(PositionStatus::PendingExit, exit.after);
    ASSERT_TRUE(exit.order.has_value());
    EXPECT_EQ(Side::Sell, exit.order->side);
    EXPECT_EQ(M("101.5"), exit.order->limit_price);

    client.fill(driver.position().exit_order_id.value_or(""));
    CycleOutcome flat = driver.run_one_cycle();
    EXPECT_EQ(PositionStatus::Flat, flat.after);
    EXPECT_EQ(M("1"), driver.position().quantity);
    EXPECT_EQ(M("100"), driver.position().entry_price);

    // next cycle re-enters
    client.set_top("101", "101.2");
    EXPECT_EQ(PositionStatus::PendingEntry, driver.run_one_cycle().after);
    EXPECT_EQ(3u, client.placed.size());
}

TEST_F(CycleDriverTest, UnclassifiedWriteFailureHaltsWithoutResubmitting)
{
    ThrowingPlaceClient throwing;
    throwing.set_top("100", "100.5");
    CycleDriver driver(market, cfg, throwing);

    CycleOutcome first = driver.run_one_cycle();
    EXPECT_EQ(CycleStatus::FatalAbort, first.status);
    EXPECT_TRUE(driver.halted());
    EXPECT_NE(std::string::npos, first.reason.find("type must be string"));
    EXPECT_EQ(PositionStatus::Flat, driver.position().status);

    CycleOutcome second = driver.run_one_cycle();
    EXPECT_EQ(CycleStatus::FatalAbort, second.status);
    EXPECT_EQ(1, throwing.place_calls);
}

TEST_F(CycleDriverTest, StaleEntryPartlyFilledKeepsTheFilledBase)
{
    cfg.entry_order_max_cycles = 1;
    CycleDriver driver = make_driver();

    driver.run_one_cycle();
    const std::string entry_id = driver.position().entry_order_id.value_or("");
    client.partial_fill(entry_id, "0.4");
    client.cancel_result = true;

    CycleOutcome out = driver.run_one_cycle();
    EXPECT_EQ(CycleStatus::Completed, out.status);
    EXPECT_EQ(entry_id, out.cancelled_order_id.value_or(""));
    EXPECT_EQ(PositionStatus::Holding, out.after);
    EXPECT_EQ(M("0.4"), driver.position().quantity);
    EXPECT_EQ(M("100"), driver.position().entry_price);

    // the stop-loss sells what was bought, not the original order size
    client.set_top("93.9", "94");
    CycleOutcome exit = driver.run_one_cycle();
    ASSERT_TRUE(exit.order.has_value());
    EXPECT_EQ(Side::Sell, exit.order->side);
    EXPECT_EQ(M("0.4"), exit.order->quantity);
}
