#include <gtest/gtest.h>
#include <condition_variable>
#include <mutex>
#include "simulation/async_price_sink.hpp"

using namespace pmsim;
using namespace std::chrono_literals;

namespace {

/**
 * Records delivered indices. When gated, the first delivery blocks until
 * release() is called.
 */
class RecordingSink : public PriceSink {
public:
    explicit RecordingSink(bool gated = false) : gated_(gated) {}

    void on_price(const PricePoint& point) override {
        std::unique_lock<std::mutex> lock(mutex_);
        if (gated_ && !released_) {
            entered_ = true;
            cv_.notify_all();
            cv_.wait(lock, [this] { return released_; });
        }
        indices_.push_back(point.sequence_index);
        thread_ids_.push_back(std::this_thread::get_id());
    }

    std::string name() const override { return "recording"; }

    bool wait_entered(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return entered_; });
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        cv_.notify_all();
    }

    std::vector<int64_t> indices() {
        std::lock_guard<std::mutex> lock(mutex_);
        return indices_;
    }

    std::vector<std::thread::id> thread_ids() {
        std::lock_guard<std::mutex> lock(mutex_);
        return thread_ids_;
    }

private:
    bool gated_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool entered_{false};
    bool released_{false};
    std::vector<int64_t> indices_;
    std::vector<std::thread::id> thread_ids_;
};

class ThrowingSink : public PriceSink {
public:
    void on_price(const PricePoint&) override { throw std::runtime_error("sink down"); }
    std::string name() const override { return "throwing"; }
};

PricePoint point_at(int64_t index) {
    PricePoint p;
    p.sequence_index = index;
    p.price = 50.0;
    p.timestamp = wall_now();
    return p;
}

} // namespace

TEST(AsyncPriceSinkTest, RejectsBadArguments) {
    EXPECT_THROW(AsyncPriceSink(nullptr), std::invalid_argument);
    EXPECT_THROW(AsyncPriceSink(std::make_shared<RecordingSink>(), 0), std::invalid_argument);
}

TEST(AsyncPriceSinkTest, DeliversSynchronouslyWhenNotStarted) {
    auto inner = std::make_shared<RecordingSink>();
    AsyncPriceSink sink(inner);

    sink.on_price(point_at(0));

    ASSERT_EQ(inner->indices().size(), 1u);
    EXPECT_EQ(inner->thread_ids()[0], std::this_thread::get_id());
    EXPECT_EQ(sink.delivered(), 1);
    EXPECT_EQ(sink.name(), "async(recording)");
}

TEST(AsyncPriceSinkTest, DeliversInOrderOnWorker) {
    auto inner = std::make_shared<RecordingSink>();
    AsyncPriceSink sink(inner);
    sink.start();

    for (int64_t i = 0; i < 100; i++) {
        sink.on_price(point_at(i));
    }
    ASSERT_TRUE(sink.flush(5000ms));

    auto indices = inner->indices();
    ASSERT_EQ(indices.size(), 100u);
    for (int64_t i = 0; i < 100; i++) {
        EXPECT_EQ(indices[i], i);
    }
    EXPECT_NE(inner->thread_ids()[0], std::this_thread::get_id());
    EXPECT_EQ(sink.dropped(), 0);
    sink.stop();
}

TEST(AsyncPriceSinkTest, DropsOldestWhenFull) {
    auto inner = std::make_shared<RecordingSink>(true);
    AsyncPriceSink sink(inner, 2);
    sink.start();

    sink.on_price(point_at(0));
    ASSERT_TRUE(inner->wait_entered(5000ms));

    // Point 0 is in flight; the queue holds at most two of the rest
    for (int64_t i = 1; i <= 4; i++) {
        sink.on_price(point_at(i));
    }
    EXPECT_EQ(sink.queue_size(), 2u);
    EXPECT_EQ(sink.dropped(), 2);

    inner->release();
    ASSERT_TRUE(sink.flush(5000ms));

    EXPECT_EQ(inner->indices(), (std::vector<int64_t>{0, 3, 4}));
    EXPECT_EQ(sink.delivered(), 3);
    sink.stop();
}

TEST(AsyncPriceSinkTest, StopDrainsQueue) {
    auto inner = std::make_shared<RecordingSink>();
    AsyncPriceSink sink(inner);
    sink.start();

    for (int64_t i = 0; i < 20; i++) {
        sink.on_price(point_at(i));
    }
    sink.stop();

    EXPECT_EQ(inner->indices().size(), 20u);
    EXPECT_EQ(sink.queue_size(), 0u);
}

TEST(AsyncPriceSinkTest, CountsInnerFailures) {
    AsyncPriceSink sink(std::make_shared<ThrowingSink>());
    sink.start();

    sink.on_price(point_at(0));
    sink.on_price(point_at(1));
    ASSERT_TRUE(sink.flush(5000ms));

    EXPECT_EQ(sink.failures(), 2);
    EXPECT_EQ(sink.delivered(), 0);
    sink.stop();
}

TEST(AsyncPriceSinkTest, CountsNonStandardInnerFailures) {
    auto inner = std::make_shared<CallbackSink>([](const PricePoint&) { throw 42; }, "int-thrower");
    AsyncPriceSink sink(inner);
    sink.start();

    sink.on_price(point_at(0));
    ASSERT_TRUE(sink.flush(5000ms));
    EXPECT_EQ(sink.failures(), 1);
    sink.stop();

    // Synchronous path after stop is isolated too
    sink.on_price(point_at(1));
    EXPECT_EQ(sink.failures(), 2);
}

TEST(AsyncPriceSinkTest, DeliversDirectlyAfterStop) {
    auto inner = std::make_shared<RecordingSink>();
    AsyncPriceSink sink(inner);
    sink.start();
    sink.on_price(point_at(0));
    sink.stop();

    sink.on_price(point_at(1));

    EXPECT_EQ(inner->indices(), (std::vector<int64_t>{0, 1}));
    EXPECT_EQ(inner->thread_ids()[1], std::this_thread::get_id());
    EXPECT_EQ(sink.queue_size(), 0u);
}
