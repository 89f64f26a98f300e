#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "exchange_client.hpp"
#include "http_transport.hpp"

struct BybitConfig {
    std::string base_url = "https://api.bybit.com";
    std::string api_key;
    std::string api_secret;
    std::string category = "spot";   // "spot" only; linear/inverse are margin products
    long recv_window_ms = 5000;
    int max_retries = 3;             // extra attempts after the first one
    long retry_backoff_ms = 500;     // linear: backoff * attempt
    int book_depth = 50;
};

// HMAC-SHA256 of msg, lower-case hex.
std::string hmac_sha256_hex(const std::string& key, const std::string& msg);

// Bybit V5 REST adapter.
//
// Reads are retried on Transient errors. Writes are only retried after a
// lookup confirms the previous attempt did not take effect; when that lookup
// itself fails the call surfaces AmbiguousWrite instead of risking a duplicate.
class BybitClient : public ExchangeClient {
public:
    BybitClient(BybitConfig cfg, ErrorClassifier classifier, std::unique_ptr<HttpTransport> transport);

    // ---- TIME SYNC (retCode=10002) ----
    // Call once at startup; also done automatically on a 10002 response.
    bool sync_time();
    long long time_offset_ms() const { return time_offset_ms_.load(); }

    std::string name() const override;
    Money get_latest_price(const std::string& market_id) override;
    Ticker get_ticker(const std::string& market_id) override;
    OrderBook get_order_book(const std::string& market_id) override;
    std::vector<OpenOrder> get_open_orders(const std::string& market_id) override;
    std::string place_order(const std::string& market_id,
                            Side side,
                            const Money& quantity,
                            const Money& price) override;
    bool cancel_order(const std::string& order_id, const std::string& market_id) override;
    Money get_filled_quantity(const std::string& order_id, const std::string& market_id) override;
    BalanceMap get_balances() override;

private:
    struct OrderLookup {
        std::string order_id;
        std::string status;   // Bybit orderStatus: New, PartiallyFilled, Filled, Cancelled, ...
        Money filled;         // cumExecQty
    };

    // Single attempt. Throws ExchangeError; retCodes in `tolerated` are returned, not thrown.
    nlohmann::json call(const std::string& method,
                        const std::string& path,
                        const std::string& query_or_body,
                        bool sign,
                        const std::set<int>& tolerated = {});

    // GET with bounded retry on Transient.
    nlohmann::json read(const std::string& path, const std::string& query, bool sign);

    std::optional<OrderLookup> lookup_order(const std::string& path,
                                            const std::string& market_id,
                                            const std::string& key,
                                            const std::string& value);

    Ticker ticker_locked(const std::string& market_id);
    bool sync_time_locked();
    long long next_timestamp_ms();
    std::string next_order_link_id();
    void backoff(int attempt) const;

    BybitConfig cfg_;
    ErrorClassifier classifier_;
    std::unique_ptr<HttpTransport> transport_;

    std::mutex io_mtx_;   // one logical call in flight per client

    // server_ms - local_ms (if local clock is ahead, offset will be negative)
    std::atomic<long long> time_offset_ms_{0};
    long long last_ts_ms_ = 0;     // guarded by io_mtx_
    std::uint64_t link_seq_ = 0;   // guarded by io_mtx_
};
