#pragma once
#include <zmq.hpp>

#include <mutex>
#include <string>

#include "log.hpp"

// PUB socket for cycle outcomes: topic "cycle.<market>", JSON payload.
// Shared by all market threads, so sends are serialised.
class CyclePublisher {
public:
    explicit CyclePublisher(const std::string& bind_addr)
        : ctx_(1), pub_(ctx_, zmq::socket_type::pub)
    {
        // High-water mark: drop if subscriber is slow
        pub_.set(zmq::sockopt::sndhwm, 10000);
        pub_.set(zmq::sockopt::linger, 0);
        pub_.bind(bind_addr);
    }

    static std::string topic_for(const std::string& market) { return "cycle." + market; }

    void publish(const std::string& market, const std::string& payload) {
        const std::string topic = topic_for(market);
        zmq::message_t t(topic.data(), topic.size());
        zmq::message_t p(payload.data(), payload.size());

        std::lock_guard<std::mutex> lk(mtx_);
        try {
            pub_.send(t, zmq::send_flags::sndmore);
            pub_.send(p, zmq::send_flags::dontwait);
        } catch (const zmq::error_t& e) {
            log_warn("publish") << topic << " dropped: " << e.what();
        }
    }

private:
    zmq::context_t ctx_;
    zmq::socket_t  pub_;
    std::mutex mtx_;
};
