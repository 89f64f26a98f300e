#include "bybit_client.hpp"

#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <chrono>
#include <iomanip>
#include <sstream>
#include <thread>

#include "log.hpp"

using json = nlohmann::json;

static constexpr int kRetOk = 0;
static constexpr int kRetTimestampWindow = 10002;
static constexpr int kRetOrderNotExists = 110001;        // derivatives wording
static constexpr int kRetSpotOrderNotExists = 170213;    // spot wording

static long long now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

static std::string hex_encode(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    for (size_t i = 0; i < len; i++)
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    return oss.str();
}

// Bybit sends numbers as strings; "" means zero.
static Money money_field(const json& j, const char* key) {
    if (!j.contains(key)) return Money();
    const json& v = j.at(key);
    if (v.is_string()) {
        const auto s = v.get<std::string>();
        return s.empty() ? Money() : Money::parse(s);
    }
    if (v.is_number()) return Money::parse(v.dump());
    return Money();
}

static Side parse_side(const std::string& s) {
    if (s == "Buy") return Side::Buy;
    if (s == "Sell") return Side::Sell;
    throw std::invalid_argument("unknown side '" + s + "'");
}

static bool is_open_status(const std::string& st) {
    return st == "New" || st == "PartiallyFilled" || st == "Untriggered";
}

static bool is_cancelled_status(const std::string& st) {
    return st == "Cancelled" || st == "PartiallyFilledCanceled" || st == "Deactivated";
}

static std::string truncate(const std::string& s, std::size_t n = 200) {
    return s.size() <= n ? s : s.substr(0, n) + "...";
}

// retMsg is free text; anything that is not a string is shown as raw JSON.
static std::string ret_msg(const json& j) {
    if (!j.contains("retMsg")) return "";
    const json& m = j.at("retMsg");
    return m.is_string() ? m.get<std::string>() : m.dump();
}

std::string hmac_sha256_hex(const std::string& key, const std::string& msg) {
    unsigned int outlen = 0;
    unsigned char out[EVP_MAX_MD_SIZE];
    HMAC(EVP_sha256(),
         key.data(), (int)key.size(),
         (const unsigned char*)msg.data(), msg.size(),
         out, &outlen);
    return hex_encode(out, outlen);
}

BybitClient::BybitClient(BybitConfig cfg, ErrorClassifier classifier, std::unique_ptr<HttpTransport> transport)
    : cfg_(std::move(cfg)),
      classifier_(std::move(classifier)),
      transport_(std::move(transport)) {}

std::string BybitClient::name() const {
    return "Bybit V5 REST (" + cfg_.category + ")";
}

long long BybitClient::next_timestamp_ms() {
    // Doubles as the request nonce: strictly increasing per client.
    long long ts = now_ms() + time_offset_ms_.load();
    if (ts <= last_ts_ms_) ts = last_ts_ms_ + 1;
    last_ts_ms_ = ts;
    return ts;
}

std::string BybitClient::next_order_link_id() {
    return "scalper-" + std::to_string(now_ms()) + "-" + std::to_string(++link_seq_);
}

void BybitClient::backoff(int attempt) const {
    if (cfg_.retry_backoff_ms <= 0) return;
    std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.retry_backoff_ms * attempt));
}

json BybitClient::call(const std::string& method,
                       const std::string& path,
                       const std::string& query_or_body,
                       bool sign,
                       const std::set<int>& tolerated) {
    const bool is_get = (method == "GET");

    HttpRequest req;
    req.method = method;
    req.url = cfg_.base_url + path;
    if (is_get && !query_or_body.empty()) req.url += "?" + query_or_body;
    if (!is_get) req.body = query_or_body;

    if (sign) {
        const std::string ts = std::to_string(next_timestamp_ms());
        const std::string recv_window = std::to_string(cfg_.recv_window_ms);

        // V5 signature: ts + apiKey + recvWindow + (queryString | body)
        const std::string payload = ts + cfg_.api_key + recv_window + query_or_body;
        const std::string sig = hmac_sha256_hex(cfg_.api_secret, payload);

        req.headers.push_back("X-BAPI-API-KEY: " + cfg_.api_key);
        req.headers.push_back("X-BAPI-SIGN: " + sig);
        req.headers.push_back("X-BAPI-TIMESTAMP: " + ts);
        req.headers.push_back("X-BAPI-RECV-WINDOW: " + recv_window);
    }
    req.headers.push_back("Content-Type: application/json");

    HttpResponse resp;
    try {
        resp = transport_->send(req);
    } catch (const TransportFailure& e) {
        throw classifier_.make_error(0, std::string(e.what()) + " (" + path + ")", e.timed_out());
    }

    const int status = static_cast<int>(resp.status);
    if (status < 200 || status >= 300) {
        throw classifier_.make_error(
            status, "HTTP " + std::to_string(status) + " " + path + ": " + truncate(resp.body));
    }

    json j = json::parse(resp.body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("retCode") || !j["retCode"].is_number_integer()) {
        throw ExchangeError(ErrorKind::Fatal, "malformed response from " + path + ": " + truncate(resp.body), status);
    }

    const int ret_code = j["retCode"].get<int>();
    if (ret_code == kRetOk || tolerated.count(ret_code) > 0) return j;

    const std::string msg = "retCode=" + std::to_string(ret_code) +
                            " retMsg=" + ret_msg(j) + " (" + path + ")";

    if (ret_code == kRetTimestampWindow) {
        log_warn("BYBIT") << "timestamp outside recv window, resyncing clock";
        sync_time_locked();
        throw ExchangeError(ErrorKind::Transient, msg, status);
    }
    throw classifier_.make_error(status, msg);
}

json BybitClient::read(const std::string& path, const std::string& query, bool sign) {
    for (int attempt = 0;; ++attempt) {
        try {
            return call("GET", path, query, sign);
        } catch (const ExchangeError& e) {
            if (!e.transient() || attempt >= cfg_.max_retries) throw;
            log_warn("BYBIT") << "transient read failure on " << path
                              << " (attempt " << attempt + 1 << "): " << e.what();
            backoff(attempt + 1);
        }
    }
}

bool BybitClient::sync_time() {
    std::lock_guard<std::mutex> lk(io_mtx_);
    return sync_time_locked();
}

bool BybitClient::sync_time_locked() {
    try {
        const long long t0 = now_ms();
        json j = call("GET", "/v5/market/time", "", false);
        const long long t1 = now_ms();

        long long server_ms = j.value("time", 0LL);
        if (server_ms <= 0 && j.contains("result") && j["result"].contains("timeSecond")) {
            server_ms = std::stoll(j["result"]["timeSecond"].get<std::string>()) * 1000;
        }
        if (server_ms <= 0) {
            log_warn("BYBIT") << "time sync: no server time in response";
            return false;
        }

        time_offset_ms_.store(server_ms - (t0 + t1) / 2);
        log_info("BYBIT") << "time sync OK offset_ms=" << time_offset_ms_.load();
        return true;
    } catch (const ExchangeError& e) {
        log_warn("BYBIT") << "time sync failed: " << e.what();
    } catch (const std::exception& e) {
        log_warn("BYBIT") << "time sync failed, bad payload: " << e.what();
    }
    return false;
}

Ticker BybitClient::ticker_locked(const std::string& market_id) {
    json j = read("/v5/market/tickers", "category=" + cfg_.category + "&symbol=" + market_id, false);
    try {
        const auto& list = j.at("result").at("list");
        if (!list.is_array() || list.empty())
            throw ExchangeError(ErrorKind::Fatal, "no ticker returned for " + market_id);

        const auto& t = list.at(0);
        Ticker out;
        out.last   = money_field(t, "lastPrice");
        out.bid    = money_field(t, "bid1Price");
        out.ask    = money_field(t, "ask1Price");
        out.high   = money_field(t, "highPrice24h");
        out.low    = money_field(t, "lowPrice24h");
        out.volume = money_field(t, "volume24h");
        return out;
    } catch (const json::exception& e) {
        throw ExchangeError(ErrorKind::Fatal, std::string("malformed ticker: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ExchangeError(ErrorKind::Fatal, std::string("malformed ticker: ") + e.what());
    }
}

Ticker BybitClient::get_ticker(const std::string& market_id) {
    std::lock_guard<std::mutex> lk(io_mtx_);
    return ticker_locked(market_id);
}

Money BybitClient::get_latest_price(const std::string& market_id) {
    std::lock_guard<std::mutex> lk(io_mtx_);
    return ticker_locked(market_id).last;
}

OrderBook BybitClient::get_order_book(const std::string& market_id) {
    std::lock_guard<std::mutex> lk(io_mtx_);

    json j = read("/v5/market/orderbook",
                  "category=" + cfg_.category + "&symbol=" + market_id +
                  "&limit=" + std::to_string(cfg_.book_depth),
                  false);
    try {
        const auto& r = j.at("result");
        auto levels = [](const json& arr) {
            std::vector<std::pair<Money, Money>> out;
            if (!arr.is_array()) return out;
            for (const auto& lvl : arr) {
                if (lvl.size() < 2) continue;
                out.emplace_back(Money::parse(lvl[0].get<std::string>()),
                                 Money::parse(lvl[1].get<std::string>()));
            }
            return out;
        };

        OrderBook ob;
        ob.market_id = market_id;
        ob.apply_snapshot(levels(r.value("b", json::array())), levels(r.value("a", json::array())));
        return ob;
    } catch (const json::exception& e) {
        throw ExchangeError(ErrorKind::Fatal, std::string("malformed order book: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ExchangeError(ErrorKind::Fatal, std::string("malformed order book: ") + e.what());
    }
}

std::vector<OpenOrder> BybitClient::get_open_orders(const std::string& market_id) {
    std::lock_guard<std::mutex> lk(io_mtx_);

    json j = read("/v5/order/realtime", "category=" + cfg_.category + "&symbol=" + market_id, true);
    try {
        std::vector<OpenOrder> out;
        for (const auto& o : j.at("result").at("list")) {
            if (!is_open_status(o.value("orderStatus", std::string()))) continue;

            OpenOrder oo;
            oo.id        = o.at("orderId").get<std::string>();
            oo.market_id = o.value("symbol", market_id);
            oo.side      = parse_side(o.value("side", std::string()));
            oo.price     = money_field(o, "price");
            oo.quantity  = money_field(o, "leavesQty");
            if (oo.quantity.is_zero()) oo.quantity = money_field(o, "qty");
            out.push_back(std::move(oo));
        }
        return out;
    } catch (const json::exception& e) {
        throw ExchangeError(ErrorKind::Fatal, std::string("malformed open orders: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ExchangeError(ErrorKind::Fatal, std::string("malformed open orders: ") + e.what());
    }
}

std::optional<BybitClient::OrderLookup> BybitClient::lookup_order(const std::string& path,
                                                                  const std::string& market_id,
                                                                  const std::string& key,
                                                                  const std::string& value) {
    json j = read(path, "category=" + cfg_.category + "&symbol=" + market_id + "&" + key + "=" + value, true);
    try {
        const auto& list = j.at("result").at("list");
        if (!list.is_array() || list.empty()) return std::nullopt;
        const auto& o = list.at(0);
        return OrderLookup{o.at("orderId").get<std::string>(),
                           o.value("orderStatus", std::string()),
                           money_field(o, "cumExecQty")};
    } catch (const json::exception& e) {
        throw ExchangeError(ErrorKind::Fatal, std::string("malformed order lookup: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ExchangeError(ErrorKind::Fatal, std::string("malformed order lookup: ") + e.what());
    }
}

std::string BybitClient::place_order(const std::string& market_id,
                                     Side side,
                                     const Money& quantity,
                                     const Money& price) {
    std::lock_guard<std::mutex> lk(io_mtx_);

    const std::string link_id = next_order_link_id();

    json body;
    body["category"]    = cfg_.category;
    body["symbol"]      = market_id;
    body["side"]        = side_str(side);
    body["orderType"]   = "Limit";
    body["qty"]         = quantity.to_string();
    body["price"]       = price.to_string();
    body["timeInForce"] = "GTC";
    body["orderLinkId"] = link_id;
    const std::string payload = body.dump();

    for (int attempt = 0;; ++attempt) {
        json resp;
        try {
            resp = call("POST", "/v5/order/create", payload, true);
        } catch (const ExchangeError& e) {
            if (!e.transient()) throw;

            // Did the order land anyway? Only a definite "no" makes a resend safe.
            std::optional<OrderLookup> found;
            try {
                found = lookup_order("/v5/order/realtime", market_id, "orderLinkId", link_id);
            } catch (const ExchangeError& le) {
                throw ExchangeError(ErrorKind::AmbiguousWrite,
                                    "place_order " + link_id + " failed (" + e.what() +
                                    ") and could not be confirmed: " + le.what());
            }

            if (found) {
                log_warn("BYBIT") << "place_order " << link_id << " hit a transient error but was accepted"
                                  << " orderId=" << found->order_id;
                return found->order_id;
            }
            if (attempt >= cfg_.max_retries) throw;

            log_warn("BYBIT") << "place_order " << link_id << " not applied, retrying (attempt "
                              << attempt + 1 << "): " << e.what();
            backoff(attempt + 1);
            continue;
        }

        if (resp.contains("result") && resp["result"].contains("orderId") &&
            resp["result"]["orderId"].is_string()) {
            return resp["result"]["orderId"].get<std::string>();
        }
        throw ExchangeError(ErrorKind::AmbiguousWrite,
                            "order " + link_id + " accepted but no orderId in response: " + truncate(resp.dump()));
    }
}

bool BybitClient::cancel_order(const std::string& order_id, const std::string& market_id) {
    std::lock_guard<std::mutex> lk(io_mtx_);

    json body;
    body["category"] = cfg_.category;
    body["symbol"]   = market_id;
    body["orderId"]  = order_id;
    const std::string payload = body.dump();

    for (int attempt = 0;; ++attempt) {
        try {
            json resp = call("POST", "/v5/order/cancel", payload, true,
                             {kRetOrderNotExists, kRetSpotOrderNotExists});
            return resp["retCode"].get<int>() == kRetOk;
        } catch (const ExchangeError& e) {
            if (!e.transient()) throw;

            std::optional<OrderLookup> found;
            try {
                found = lookup_order("/v5/order/realtime", market_id, "orderId", order_id);
            } catch (const ExchangeError& le) {
                throw ExchangeError(ErrorKind::AmbiguousWrite,
                                    "cancel_order " + order_id + " failed (" + e.what() +
                                    ") and could not be confirmed: " + le.what());
            }
            if (!found) {
                throw ExchangeError(ErrorKind::AmbiguousWrite,
                                    "cancel_order " + order_id + " failed (" + e.what() +
                                    ") and the order is unknown to the exchange");
            }
            if (is_cancelled_status(found->status)) return true;
            if (!is_open_status(found->status)) return false;   // Filled / Rejected
            if (attempt >= cfg_.max_retries) throw;

            log_warn("BYBIT") << "cancel_order " << order_id << " still open, retrying (attempt "
                              << attempt + 1 << "): " << e.what();
            backoff(attempt + 1);
        }
    }
}

// Orders drop off /v5/order/realtime some time after they close; history has them then.
Money BybitClient::get_filled_quantity(const std::string& order_id, const std::string& market_id) {
    std::lock_guard<std::mutex> lk(io_mtx_);

    auto found = lookup_order("/v5/order/realtime", market_id, "orderId", order_id);
    if (!found) found = lookup_order("/v5/order/history", market_id, "orderId", order_id);
    if (!found) {
        throw ExchangeError(ErrorKind::Fatal, "order " + order_id + " is unknown to the exchange");
    }
    log_info("BYBIT") << "order " << order_id << " status=" << found->status
                      << " cumExecQty=" << found->filled;
    return found->filled;
}

BalanceMap BybitClient::get_balances() {
    std::lock_guard<std::mutex> lk(io_mtx_);

    json j = read("/v5/account/wallet-balance", "accountType=UNIFIED", true);
    try {
        BalanceMap out;
        const auto& list = j.at("result").at("list");
        if (!list.is_array() || list.empty()) return out;

        for (const auto& c : list.at(0).at("coin")) {
            const Money wallet = money_field(c, "walletBalance");
            const Money locked = money_field(c, "locked");
            out[c.at("coin").get<std::string>()] = Balance{wallet - locked, locked};
        }
        return out;
    } catch (const json::exception& e) {
        throw ExchangeError(ErrorKind::Fatal, std::string("malformed wallet balance: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ExchangeError(ErrorKind::Fatal, std::string("malformed wallet balance: ") + e.what());
    }
}
