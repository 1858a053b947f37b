#include "simulation/async_price_sink.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace pmsim {

AsyncPriceSink::AsyncPriceSink(std::shared_ptr<PriceSink> inner, size_t capacity)
    : inner_(std::move(inner))
    , capacity_(capacity)
{
    if (!inner_) {
        throw std::invalid_argument("AsyncPriceSink requires a sink");
    }
    if (capacity_ == 0) {
        throw std::invalid_argument("AsyncPriceSink capacity must be positive");
    }
}

AsyncPriceSink::~AsyncPriceSink() {
    stop();
}

std::string AsyncPriceSink::name() const {
    return "async(" + inner_->name() + ")";
}

void AsyncPriceSink::on_price(const PricePoint& point) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (running_.load()) {
            if (queue_.size() >= capacity_) {
                queue_.pop_front();
                dropped_++;
            }
            queue_.push_back(point);
            queue_cv_.notify_one();
            return;
        }
    }

    // No worker to hand off to
    deliver(point);
}

void AsyncPriceSink::start() {
    if (running_.load()) return;

    running_.store(true);
    worker_thread_ = std::thread(&AsyncPriceSink::worker_loop, this);
    spdlog::info("{} started (capacity {})", name(), capacity_);
}

void AsyncPriceSink::stop() {
    if (!running_.load()) return;

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_.store(false);
    }
    queue_cv_.notify_all();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    spdlog::info("{} stopped: delivered={}, dropped={}, failures={}",
                 name(), delivered_.load(), dropped_.load(), failures_.load());
}

bool AsyncPriceSink::flush(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return queue_.empty() && !in_flight_; });
}

size_t AsyncPriceSink::queue_size() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void AsyncPriceSink::worker_loop() {
    while (true) {
        PricePoint point;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !queue_.empty() || !running_.load(); });

            if (queue_.empty()) break;  // stopped and drained

            point = queue_.front();
            queue_.pop_front();
            in_flight_ = true;
        }

        deliver(point);

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            in_flight_ = false;
        }
        idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}

void AsyncPriceSink::deliver(const PricePoint& point) {
    try {
        inner_->on_price(point);
        delivered_++;
    } catch (const std::exception& e) {
        failures_++;
        spdlog::error("{} failed on point {}: {}", name(), point.sequence_index, e.what());
    } catch (...) {
        failures_++;
        spdlog::error("{} threw a non-standard exception on point {}", name(), point.sequence_index);
    }
}

} // namespace pmsim
