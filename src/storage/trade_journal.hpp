#pragma once
#include <sqlite3.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// One row of cycle_journal. Prices and quantities are kept as exact decimal text.
struct JournalEntry {
    std::int64_t ts_ms{0};
    std::string market;
    std::string status;           // completed / skipped / fatal-abort
    std::string reason;
    std::string position_before;
    std::string position_after;

    std::string side;             // empty when no order was placed
    std::string quantity;
    std::string price;
    std::string order_id;

    std::string bid;
    std::string ask;
};

// Append-only audit trail. Market threads push(); a writer thread batches
// rows into SQLite (WAL). Failures are logged and never reach the caller.
class TradeJournal {
public:
    explicit TradeJournal(std::string db_path,
                          int flush_ms = 200,
                          std::size_t max_queue = 10000);
    ~TradeJournal();

    TradeJournal(const TradeJournal&) = delete;
    TradeJournal& operator=(const TradeJournal&) = delete;

    void push(JournalEntry e);

    bool start();
    void stop();   // drains the queue before returning

    std::size_t dropped() const { return dropped_.load(); }

private:
    bool open_db();     // open, pragmas, schema, prepared insert
    void close_db();

    void writer_loop();
    std::vector<JournalEntry> take_queued();   // mtx_ held
    bool write_batch(const std::vector<JournalEntry>& batch);
    bool insert_one(const JournalEntry& e);

    std::string db_path_;
    int flush_ms_;
    std::size_t max_queue_;

    sqlite3* db_{nullptr};
    sqlite3_stmt* stmt_insert_{nullptr};

    std::atomic<bool> running_{false};
    std::atomic<std::size_t> dropped_{0};
    std::thread writer_;

    std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<JournalEntry> q_;
};
