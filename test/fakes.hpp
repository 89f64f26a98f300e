#pragma once
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "exchange_client.hpp"
#include "http_transport.hpp"

inline Money M(const char* s) { return Money::parse(s); }

// Scripted in-memory exchange.
class FakeExchangeClient : public ExchangeClient {
public:
    OrderBook book;
    std::optional<ExchangeError> book_error;

    std::vector<OpenOrder> open_orders;
    std::optional<ExchangeError> open_orders_error;

    std::optional<ExchangeError> place_error;
    std::optional<ExchangeError> cancel_error;
    bool cancel_result = true;

    // Executed base per order id; absent means nothing filled.
    std::map<std::string, Money> filled;
    std::optional<ExchangeError> fill_query_error;

    // Placed orders show up in open_orders until fill() removes them.
    bool rest_placed_orders = true;

    std::vector<OrderRequest> placed;
    std::vector<std::string> cancelled;
    int book_calls = 0;
    int open_orders_calls = 0;
    int fill_queries = 0;

    void set_top(const char* bid, const char* ask) {
        std::vector<std::pair<Money, Money>> b, a;
        if (bid) b.push_back({M(bid), M("1")});
        if (ask) a.push_back({M(ask), M("1")});
        book.apply_snapshot(b, a);
    }

    // Fully fills a resting order: it leaves open_orders with its whole quantity executed.
    void fill(const std::string& id) {
        for (auto it = open_orders.begin(); it != open_orders.end(); ++it) {
            if (it->id == id) {
                filled[id] = it->quantity;
                open_orders.erase(it);
                return;
            }
        }
    }

    void partial_fill(const std::string& id, const char* qty) { filled[id] = M(qty); }

    std::string last_order_id() const { return "ORD-" + std::to_string(next_id_ - 1); }

    std::string name() const override { return "fake"; }

    Money get_latest_price(const std::string&) override {
        auto b = book.best_bid();
        return b ? b->price : Money();
    }

    Ticker get_ticker(const std::string&) override {
        Ticker t;
        if (auto b = book.best_bid()) t.bid = b->price;
        if (auto a = book.best_ask()) t.ask = a->price;
        t.last = t.bid;
        return t;
    }

    OrderBook get_order_book(const std::string& market_id) override {
        ++book_calls;
        if (book_error) throw *book_error;
        OrderBook ob = book;
        ob.market_id = market_id;
        return ob;
    }

    std::vector<OpenOrder> get_open_orders(const std::string&) override {
        ++open_orders_calls;
        if (open_orders_error) throw *open_orders_error;
        return open_orders;
    }

    std::string place_order(const std::string& market_id, Side side,
                            const Money& quantity, const Money& price) override {
        if (place_error) throw *place_error;
        placed.push_back(OrderRequest{market_id, side, quantity, price});
        const std::string id = "ORD-" + std::to_string(next_id_++);
        if (rest_placed_orders) open_orders.push_back(OpenOrder{id, market_id, side, price, quantity});
        return id;
    }

    bool cancel_order(const std::string& order_id, const std::string&) override {
        if (cancel_error) throw *cancel_error;
        cancelled.push_back(order_id);
        remove_open(order_id);
        return cancel_result;
    }

    Money get_filled_quantity(const std::string& order_id, const std::string&) override {
        ++fill_queries;
        if (fill_query_error) throw *fill_query_error;
        auto it = filled.find(order_id);
        return it == filled.end() ? Money() : it->second;
    }

    BalanceMap get_balances() override { return {}; }

private:
    void remove_open(const std::string& id) {
        for (auto it = open_orders.begin(); it != open_orders.end(); ++it) {
            if (it->id == id) {
                open_orders.erase(it);
                return;
            }
        }
    }

    int next_id_ = 1;
};

// HTTP transport answering per path ("/v5/order/create"). Each route plays its
// scripted replies in order and then keeps repeating the last one.
class FakeTransport : public HttpTransport {
public:
    struct Reply {
        long status = 200;
        std::string body;
        bool fail = false;        // throw TransportFailure instead of answering
        bool timed_out = false;
    };

    explicit FakeTransport(std::string base_url) : base_(std::move(base_url)) {}

    void on(const std::string& path, Reply r) { routes_[path].push_back(std::move(r)); }

    static Reply ok(const std::string& body) { return Reply{200, body, false, false}; }
    static Reply http(long status, const std::string& body = "") { return Reply{status, body, false, false}; }
    static Reply timeout() { return Reply{0, "", true, true}; }

    std::vector<HttpRequest> requests;

    std::vector<HttpRequest> requests_to(const std::string& path) const {
        std::vector<HttpRequest> out;
        for (const auto& r : requests)
            if (path_of(r.url) == path) out.push_back(r);
        return out;
    }

    HttpResponse send(const HttpRequest& req) override {
        requests.push_back(req);
        auto it = routes_.find(path_of(req.url));
        if (it == routes_.end() || it->second.empty())
            throw TransportFailure("no route for " + req.url, false);

        Reply r = it->second.front();
        if (it->second.size() > 1) it->second.pop_front();

        if (r.fail) throw TransportFailure("Timeout was reached", r.timed_out);
        return HttpResponse{r.status, r.body};
    }

    std::string path_of(const std::string& url) const {
        std::string p = url.substr(base_.size());
        auto q = p.find('?');
        return q == std::string::npos ? p : p.substr(0, q);
    }

private:
    std::string base_;
    std::map<std::string, std::deque<Reply>> routes_;
};

inline std::string header_value(const HttpRequest& req, const std::string& name) {
    const std::string prefix = name + ": ";
    for (const auto& h : req.headers)
        if (h.compare(0, prefix.size(), prefix) == 0) return h.substr(prefix.size());
    return "";
}
