#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include "simulation/price_sink.hpp"

namespace pmsim {

/**
 * Decouples a slow sink from the producing thread.
 *
 * on_price() only enqueues; a worker thread delivers to the wrapped sink
 * in order. The queue is bounded: when full, the oldest pending point is
 * dropped and counted. When not started, delivery is synchronous.
 */
class AsyncPriceSink : public PriceSink {
public:
    explicit AsyncPriceSink(std::shared_ptr<PriceSink> inner, size_t capacity = 1024);
    ~AsyncPriceSink() override;

    AsyncPriceSink(const AsyncPriceSink&) = delete;
    AsyncPriceSink& operator=(const AsyncPriceSink&) = delete;

    void on_price(const PricePoint& point) override;
    std::string name() const override;

    void start();
    // Delivers what is still queued, then joins the worker
    void stop();

    // Wait until the queue is empty and nothing is in flight
    bool flush(std::chrono::milliseconds timeout);

    size_t queue_size() const;
    int64_t delivered() const { return delivered_.load(); }
    int64_t dropped() const { return dropped_.load(); }
    int64_t failures() const { return failures_.load(); }

private:
    std::shared_ptr<PriceSink> inner_;
    size_t capacity_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<PricePoint> queue_;
    bool in_flight_{false};

    std::atomic<bool> running_{false};
    std::thread worker_thread_;

    std::atomic<int64_t> delivered_{0};
    std::atomic<int64_t> dropped_{0};
    std::atomic<int64_t> failures_{0};

    void worker_loop();
    void deliver(const PricePoint& point);
};

} // namespace pmsim
