#include "storage/trade_journal.hpp"
#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class TradeJournalTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = (fs::temp_directory_path() / "scalper_trade_journal_test.db").string();
        remove_files();
    }

    void TearDown() override { remove_files(); }

    void remove_files() {
        std::error_code ec;
        fs::remove(path, ec);
        fs::remove(path + "-wal", ec);
        fs::remove(path + "-shm", ec);
    }

    // Every row as text columns, ordered by id; NULL reads back as "<null>".
    std::vector<std::vector<std::string>> read_rows() {
        std::vector<std::vector<std::string>> rows;
        sqlite3* db = nullptr;
        if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
            sqlite3_close(db);
            return rows;
        }

        sqlite3_stmt* st = nullptr;
        const char* sql = "SELECT market, status, reason, position_before, position_after,"
                          " side, quantity, price, order_id, bid, ask FROM cycle_journal ORDER BY id;";
        if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) == SQLITE_OK) {
            while (sqlite3_step(st) == SQLITE_ROW) {
                std::vector<std::string> row;
                for (int c = 0; c < sqlite3_column_count(st); ++c) {
                    const unsigned char* txt = sqlite3_column_text(st, c);
                    row.push_back(txt ? reinterpret_cast<const char*>(txt) : "<null>");
                }
                rows.push_back(row);
            }
        }
        sqlite3_finalize(st);
        sqlite3_close(db);
        return rows;
    }

    std::string path;
};

static JournalEntry entry(const std::string& status, const std::string& side) {
    JournalEntry e;
    e.ts_ms = 1700000000000;
    e.market = "BTCUSDT";
    e.status = status;
    e.reason = "note";
    e.position_before = "Flat";
    e.position_after = side.empty() ? "Flat" : "PendingEntry";
    e.side = side;
    if (!side.empty()) {
        e.quantity = "0.5";
        e.price = "100.25";
        e.order_id = "ORD-1";
    }
    e.bid = "100.25";
    e.ask = "100.5";
    return e;
}

TEST_F(TradeJournalTest, StopFlushesQueuedRows)
{
    TradeJournal journal(path, 50);
    ASSERT_TRUE(journal.start());

    journal.push(entry("completed", "Buy"));
    journal.push(entry("skipped", ""));
    journal.stop();

    auto rows = read_rows();
    ASSERT_EQ(2u, rows.size());

    EXPECT_EQ("BTCUSDT", rows[0][0]);
    EXPECT_EQ("completed", rows[0][1]);
    EXPECT_EQ("PendingEntry", rows[0][4]);
    EXPECT_EQ("Buy", rows[0][5]);
    EXPECT_EQ("0.5", rows[0][6]);
    EXPECT_EQ("100.25", rows[0][7]);
    EXPECT_EQ("ORD-1", rows[0][8]);

    EXPECT_EQ("skipped", rows[1][1]);
    EXPECT_EQ("<null>", rows[1][5]);
    EXPECT_EQ("<null>", rows[1][8]);
    EXPECT_EQ("100.5", rows[1][10]);
    EXPECT_EQ(0u, journal.dropped());
}

TEST_F(TradeJournalTest, PushOutsideRunningIsIgnored)
{
    TradeJournal journal(path, 50);
    journal.push(entry("completed", "Buy"));   // not started yet

    ASSERT_TRUE(journal.start());
    journal.push(entry("completed", "Sell"));
    journal.stop();
    journal.push(entry("completed", "Buy"));   // already stopped

    auto rows = read_rows();
    ASSERT_EQ(1u, rows.size());
    EXPECT_EQ("Sell", rows[0][5]);
}

TEST_F(TradeJournalTest, AppendsAcrossRestarts)
{
    {
        TradeJournal journal(path, 50);
        ASSERT_TRUE(journal.start());
        journal.push(entry("completed", "Buy"));
    }   // destructor drains

    TradeJournal journal(path, 50);
    ASSERT_TRUE(journal.start());
    journal.push(entry("fatal-abort", ""));
    journal.stop();

    auto rows = read_rows();
    ASSERT_EQ(2u, rows.size());
    EXPECT_EQ("fatal-abort", rows[1][1]);
}

TEST_F(TradeJournalTest, StartFailsOnUnwritablePath)
{
    TradeJournal journal("/nonexistent-dir/scalper/journal.db");
    EXPECT_FALSE(journal.start());
    journal.push(entry("completed", "Buy"));
    journal.stop();
}
