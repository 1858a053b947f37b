#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "simulation/price_exporter.hpp"
#include "simulation/price_sink.hpp"

namespace pmsim {

enum class SimulationState {
    STOPPED,
    RUNNING,
    PAUSED,
    COMPLETED
};

inline std::string simulation_state_to_string(SimulationState s) {
    switch (s) {
        case SimulationState::STOPPED: return "stopped";
        case SimulationState::RUNNING: return "running";
        case SimulationState::PAUSED: return "paused";
        case SimulationState::COMPLETED: return "completed";
    }
    return "unknown";
}

enum class RunMode {
    MANUAL,
    AUTO
};

inline std::string run_mode_to_string(RunMode m) {
    return m == RunMode::AUTO ? "auto" : "manual";
}

inline std::optional<RunMode> run_mode_from_string(const std::string& s) {
    if (s == "auto") return RunMode::AUTO;
    if (s == "manual") return RunMode::MANUAL;
    return std::nullopt;
}

using SubscriptionId = uint64_t;

struct SimulationStats {
    SimulationState state{SimulationState::STOPPED};
    int64_t current_index{0};
    int total_points{0};
    double progress_percent{0.0};
    Price current_price{0.0};
    Outcome target_resolution{Outcome::YES};
    Price target_price{0.0};
    bool is_trending{false};
    int64_t time_interval_ms{0};
    int64_t points_generated{0};
    int64_t callback_failures{0};
    size_t subscriber_count{0};
};

/**
 * Stochastic generator of the underlying price path.
 *
 * The binary outcome is drawn once at construction and fixed for the
 * engine's lifetime. Before the threshold index the path is a bounded,
 * mean-reverting random walk with a faint pull toward the target; after it
 * the pull strengthens progressively while volatility decays.
 *
 * Lifecycle: STOPPED -> RUNNING <-> PAUSED -> COMPLETED, with RUNNING or
 * PAUSED -> STOPPED on stop(). In auto mode a single worker thread produces
 * one point per interval. Manual step() works in any state but COMPLETED.
 *
 * Subscribers are notified synchronously, in registration order, on the
 * producing thread. They must not call start/stop/step/reset from inside
 * the callback; read accessors are fine.
 */
class MarketSimulator {
public:
    explicit MarketSimulator(const SimulationConfig& config);
    ~MarketSimulator();

    MarketSimulator(const MarketSimulator&) = delete;
    MarketSimulator& operator=(const MarketSimulator&) = delete;

    // CSV export, applied on the next start()
    void set_export(const ExportConfig& config);

    // Lifecycle
    bool start(std::chrono::milliseconds interval, RunMode mode);
    bool start(RunMode mode);
    bool pause();
    bool resume();
    void stop();
    void reset();

    // Produce the next point now. std::nullopt once complete.
    std::optional<PricePoint> step();

    // Subscription
    SubscriptionId subscribe(std::shared_ptr<PriceSink> sink);
    SubscriptionId subscribe(PriceCallback callback);
    bool unsubscribe(SubscriptionId id);

    // Queries
    SimulationState state() const;
    SimulationStats stats() const;
    Price current_price() const;
    std::optional<PricePoint> current_point() const;
    std::vector<PricePoint> history() const;
    std::vector<PricePoint> recent_history(size_t n) const;
    std::vector<PricePoint> history_range(size_t start, size_t end) const;
    Price final_price() const;

    Outcome final_resolution() const { return outcome_; }
    Price target_price() const { return target_price_; }
    int threshold_index() const { return threshold_index_; }
    int total_points() const { return config_.total_points; }
    Price initial_price() const { return initial_price_; }
    const SimulationConfig& config() const { return config_; }
    std::string export_path() const;

    // Dampens moves that would leave the warning zone, then hard-clamps
    static Price apply_soft_bounds(Price price, double movement, bool pre_threshold);

private:
    struct Subscriber {
        SubscriptionId id;
        std::shared_ptr<PriceSink> sink;
    };

    SimulationConfig config_;
    int threshold_index_{0};
    Price initial_price_{50.0};
    Outcome outcome_{Outcome::YES};
    Price target_price_{95.0};

    // Lock order: lifecycle_mutex_ -> step_mutex_ -> control_mutex_ -> data_mutex_
    std::mutex lifecycle_mutex_;

    // Serializes generation, export writes and publication
    std::mutex step_mutex_;
    std::mt19937 rng_;
    PriceExporter exporter_;
    ExportConfig export_config_;

    // Worker control
    mutable std::mutex control_mutex_;
    std::condition_variable control_cv_;
    SimulationState state_{SimulationState::STOPPED};
    bool stop_requested_{false};
    RunMode mode_{RunMode::MANUAL};
    std::chrono::milliseconds interval_{0};
    std::thread worker_;

    // Price-process state and history
    mutable std::mutex data_mutex_;
    std::vector<PricePoint> history_;
    int64_t next_index_{0};
    Price current_price_{50.0};
    double previous_movement_{0.0};
    bool terminal_adjusted_{false};
    WallClock start_time_;
    std::string export_path_;

    mutable std::mutex subscribers_mutex_;
    std::vector<Subscriber> subscribers_;
    SubscriptionId next_subscription_id_{1};

    std::atomic<int64_t> points_generated_{0};
    std::atomic<int64_t> callback_failures_{0};

    void worker_loop(std::chrono::milliseconds interval);
    void launch_worker(std::chrono::milliseconds interval);
    void stop_internal();

    // Require step_mutex_
    std::optional<PricePoint> generate_next();
    double next_movement(int64_t index, Price current, double previous);
    double gaussian(double sigma);
    void complete();
    void apply_terminal_adjustment();
    void open_export();
    void publish(const PricePoint& point);
};

} // namespace pmsim
