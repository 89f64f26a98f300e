#include "trade_journal.hpp"

#include <chrono>
#include <utility>

#include "log.hpp"

static const char* kSchema[] = {
    "PRAGMA journal_mode=WAL;",
    "PRAGMA synchronous=NORMAL;",
    "PRAGMA busy_timeout=2000;",
    "CREATE TABLE IF NOT EXISTS cycle_journal ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  ts_ms INTEGER NOT NULL,"
    "  market TEXT NOT NULL,"
    "  status TEXT NOT NULL,"
    "  reason TEXT NOT NULL,"
    "  position_before TEXT NOT NULL,"
    "  position_after TEXT NOT NULL,"
    "  side TEXT,"
    "  quantity TEXT,"
    "  price TEXT,"
    "  order_id TEXT,"
    "  bid TEXT,"
    "  ask TEXT"
    ");",
    "CREATE INDEX IF NOT EXISTS idx_cycle_journal_market ON cycle_journal(market, ts_ms);",
};

static const char* kInsert =
    "INSERT INTO cycle_journal (ts_ms, market, status, reason, position_before, position_after,"
    " side, quantity, price, order_id, bid, ask) VALUES (?,?,?,?,?,?,?,?,?,?,?,?);";

static bool run_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) == SQLITE_OK) return true;
    log_error("journal") << "sql failed: " << (err ? err : sqlite3_errmsg(db)) << " | " << sql;
    sqlite3_free(err);
    return false;
}

static void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), -1, SQLITE_TRANSIENT);
}

// Optional columns: empty text goes in as NULL.
static void bind_opt_text(sqlite3_stmt* st, int idx, const std::string& v) {
    if (v.empty()) sqlite3_bind_null(st, idx);
    else bind_text(st, idx, v);
}

TradeJournal::TradeJournal(std::string db_path, int flush_ms, std::size_t max_queue)
    : db_path_(std::move(db_path)), flush_ms_(flush_ms), max_queue_(max_queue) {}

TradeJournal::~TradeJournal() { stop(); }

bool TradeJournal::start() {
    if (running_.load()) return true;
    if (!open_db()) {
        close_db();
        return false;
    }

    running_ = true;
    writer_ = std::thread(&TradeJournal::writer_loop, this);
    log_info("journal") << "appending cycle outcomes to " << db_path_;
    return true;
}

void TradeJournal::stop() {
    if (!running_.exchange(false)) return;

    cv_.notify_all();
    if (writer_.joinable()) writer_.join();
    close_db();
}

void TradeJournal::push(JournalEntry e) {
    if (!running_) return;

    std::unique_lock<std::mutex> lk(mtx_);
    if (q_.size() >= max_queue_) {
        // writer fell behind: oldest row goes
        q_.pop_front();
        dropped_.fetch_add(1);
    }
    q_.push_back(std::move(e));
    lk.unlock();
    cv_.notify_one();
}

bool TradeJournal::open_db() {
    if (sqlite3_open(db_path_.c_str(), &db_) != SQLITE_OK) {
        log_error("journal") << "cannot open " << db_path_ << ": "
                             << (db_ ? sqlite3_errmsg(db_) : "out of memory");
        return false;
    }
    for (const char* sql : kSchema) {
        if (!run_sql(db_, sql)) return false;
    }
    if (sqlite3_prepare_v2(db_, kInsert, -1, &stmt_insert_, nullptr) != SQLITE_OK) {
        log_error("journal") << "prepare insert: " << sqlite3_errmsg(db_);
        stmt_insert_ = nullptr;
        return false;
    }
    return true;
}

void TradeJournal::close_db() {
    if (stmt_insert_) sqlite3_finalize(stmt_insert_);
    stmt_insert_ = nullptr;
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
}

bool TradeJournal::insert_one(const JournalEntry& e) {
    sqlite3_reset(stmt_insert_);
    sqlite3_clear_bindings(stmt_insert_);

    sqlite3_bind_int64(stmt_insert_, 1, static_cast<sqlite3_int64>(e.ts_ms));
    bind_text(stmt_insert_, 2, e.market);
    bind_text(stmt_insert_, 3, e.status);
    bind_text(stmt_insert_, 4, e.reason);
    bind_text(stmt_insert_, 5, e.position_before);
    bind_text(stmt_insert_, 6, e.position_after);
    bind_opt_text(stmt_insert_, 7, e.side);
    bind_opt_text(stmt_insert_, 8, e.quantity);
    bind_opt_text(stmt_insert_, 9, e.price);
    bind_opt_text(stmt_insert_, 10, e.order_id);
    bind_opt_text(stmt_insert_, 11, e.bid);
    bind_opt_text(stmt_insert_, 12, e.ask);

    if (sqlite3_step(stmt_insert_) == SQLITE_DONE) return true;
    log_error("journal") << "insert " << e.market << ": " << sqlite3_errmsg(db_);
    return false;
}

// One transaction per batch; a failed row rolls back the whole batch.
bool TradeJournal::write_batch(const std::vector<JournalEntry>& batch) {
    if (batch.empty()) return true;
    if (!run_sql(db_, "BEGIN IMMEDIATE;")) return false;

    for (const auto& e : batch) {
        if (!insert_one(e)) {
            run_sql(db_, "ROLLBACK;");
            return false;
        }
    }
    if (run_sql(db_, "COMMIT;")) return true;
    run_sql(db_, "ROLLBACK;");
    return false;
}

std::vector<JournalEntry> TradeJournal::take_queued() {
    std::vector<JournalEntry> out;
    out.reserve(q_.size());
    for (auto& e : q_) out.push_back(std::move(e));
    q_.clear();
    return out;
}

void TradeJournal::writer_loop() {
    for (;;) {
        std::vector<JournalEntry> batch;
        bool last = false;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait_for(lk, std::chrono::milliseconds(flush_ms_),
                         [&] { return !running_ || !q_.empty(); });
            batch = take_queued();
            last = !running_;
        }

        // rows pushed before stop() are all in this final batch
        if (!write_batch(batch))
            log_error("journal") << batch.size() << " rows lost";
        if (last) return;
    }
}
