#include "simulation/market_simulator.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace pmsim {

namespace {

constexpr double MIN_INITIAL_PRICE = 15.0;
constexpr double MAX_INITIAL_PRICE = 85.0;
constexpr double YES_TARGET = 95.0;
constexpr double NO_TARGET = 5.0;
constexpr double TERMINAL_PULL = 0.4;

double round_to(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

} // namespace

MarketSimulator::MarketSimulator(const SimulationConfig& config)
    : config_(config)
{
    auto error = config_.validation_error();
    if (!error.empty()) {
        throw std::invalid_argument("Invalid simulation config: " + error);
    }

    auto seed = config_.seed != 0
        ? static_cast<std::mt19937::result_type>(config_.seed)
        : std::random_device{}();
    rng_.seed(seed);

    threshold_index_ = static_cast<int>(std::floor(config_.total_points * config_.threshold_fraction));
    initial_price_ = std::clamp(config_.initial_price, MIN_INITIAL_PRICE, MAX_INITIAL_PRICE);

    // Outcome is committed before any point exists
    std::bernoulli_distribution coin(0.5);
    outcome_ = coin(rng_) ? Outcome::YES : Outcome::NO;
    target_price_ = outcome_ == Outcome::YES ? YES_TARGET : NO_TARGET;

    current_price_ = initial_price_;
    start_time_ = wall_now();
    interval_ = std::chrono::milliseconds(config_.time_interval_ms);
    export_config_.enabled = false;

    spdlog::info("Market simulator created: {} points, threshold at {}, start {:.2f}",
                 config_.total_points, threshold_index_, initial_price_);
    spdlog::debug("Committed outcome {} (target {:.0f})", outcome_to_string(outcome_), target_price_);
}

MarketSimulator::~MarketSimulator() {
    stop();
}

void MarketSimulator::set_export(const ExportConfig& config) {
    std::lock_guard<std::mutex> lock(step_mutex_);
    export_config_ = config;
}

// ============================================================================
// LIFECYCLE
// ============================================================================

bool MarketSimulator::start(RunMode mode) {
    return start(std::chrono::milliseconds(config_.time_interval_ms), mode);
}

bool MarketSimulator::start(std::chrono::milliseconds interval, RunMode mode) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    if (interval.count() < 0) {
        spdlog::warn("Cannot start simulation with negative interval");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        if (state_ == SimulationState::RUNNING || state_ == SimulationState::PAUSED) {
            spdlog::warn("Simulation already {}", simulation_state_to_string(state_));
            return false;
        }
        if (state_ == SimulationState::COMPLETED) {
            spdlog::warn("Simulation completed, reset before starting again");
            return false;
        }
    }

    // A stopped run left its worker joined in stop_internal()
    {
        std::lock_guard<std::mutex> step_lock(step_mutex_);
        open_export();
        std::lock_guard<std::mutex> data_lock(data_mutex_);
        terminal_adjusted_ = false;
    }

    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        stop_requested_ = false;
        mode_ = mode;
        interval_ = interval;
        state_ = mode == RunMode::AUTO ? SimulationState::RUNNING : SimulationState::PAUSED;
    }

    if (mode == RunMode::AUTO) {
        launch_worker(interval);
        spdlog::info("Simulation started in AUTO mode (interval: {}ms)", interval.count());
    } else {
        spdlog::info("Simulation started in MANUAL mode (call step() to advance)");
    }
    return true;
}

void MarketSimulator::launch_worker(std::chrono::milliseconds interval) {
    worker_ = std::thread(&MarketSimulator::worker_loop, this, interval);
}

bool MarketSimulator::pause() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (state_ != SimulationState::RUNNING) {
        return false;
    }
    state_ = SimulationState::PAUSED;
    spdlog::info("Simulation paused");
    return true;
}

bool MarketSimulator::resume() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    bool needs_worker = false;
    std::chrono::milliseconds interval{0};
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        if (state_ != SimulationState::PAUSED) {
            return false;
        }
        state_ = SimulationState::RUNNING;
        // Resuming a manual run hands it to the timer
        needs_worker = !worker_.joinable();
        if (needs_worker) mode_ = RunMode::AUTO;
        interval = interval_;
    }
    control_cv_.notify_all();

    if (needs_worker) {
        launch_worker(interval);
    }
    spdlog::info("Simulation resumed");
    return true;
}

void MarketSimulator::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    stop_internal();
}

void MarketSimulator::stop_internal() {
    if (worker_.joinable() && worker_.get_id() == std::this_thread::get_id()) {
        spdlog::error("stop() called from the simulation thread, ignored");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        stop_requested_ = true;
    }
    control_cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }

    std::lock_guard<std::mutex> step_lock(step_mutex_);
    bool halted = false;
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        if (state_ == SimulationState::RUNNING || state_ == SimulationState::PAUSED) {
            state_ = SimulationState::STOPPED;
            halted = true;
        }
        stop_requested_ = false;
    }

    if (halted) {
        apply_terminal_adjustment();
        spdlog::info("Simulation stopped at point {}/{}", points_generated_.load(), config_.total_points);
    }
    exporter_.close();
}

void MarketSimulator::reset() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    stop_internal();

    std::lock_guard<std::mutex> step_lock(step_mutex_);
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        state_ = SimulationState::STOPPED;
    }
    {
        std::lock_guard<std::mutex> lock(data_mutex_);
        history_.clear();
        next_index_ = 0;
        current_price_ = initial_price_;
        previous_movement_ = 0.0;
        terminal_adjusted_ = false;
        start_time_ = wall_now();
        export_path_.clear();
    }
    points_generated_ = 0;
    callback_failures_ = 0;

    spdlog::info("Simulation reset to beginning (outcome unchanged)");
}

void MarketSimulator::worker_loop(std::chrono::milliseconds interval) {
    spdlog::debug("Simulation worker started");

    while (true) {
        {
            std::unique_lock<std::mutex> lock(control_mutex_);
            control_cv_.wait(lock, [this] {
                return stop_requested_ || state_ != SimulationState::PAUSED;
            });
            if (stop_requested_ || state_ != SimulationState::RUNNING) break;
        }

        std::optional<PricePoint> point;
        {
            std::lock_guard<std::mutex> step_lock(step_mutex_);
            point = generate_next();
        }
        if (!point || state() == SimulationState::COMPLETED) break;

        if (interval.count() > 0) {
            std::unique_lock<std::mutex> lock(control_mutex_);
            if (control_cv_.wait_for(lock, interval, [this] { return stop_requested_; })) {
                break;
            }
        }
    }

    spdlog::debug("Simulation worker exited");
}

// ============================================================================
// GENERATION
// ============================================================================

std::optional<PricePoint> MarketSimulator::step() {
    if (state() == SimulationState::COMPLETED) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> step_lock(step_mutex_);
    return generate_next();
}

std::optional<PricePoint> MarketSimulator::generate_next() {
    int64_t index;
    Price current;
    double previous;
    WallClock start;
    {
        std::lock_guard<std::mutex> lock(data_mutex_);
        index = next_index_;
        current = current_price_;
        previous = previous_movement_;
        start = start_time_;
    }

    if (index >= config_.total_points) {
        complete();
        return std::nullopt;
    }

    double movement = 0.0;
    Price price = current;
    if (index > 0) {
        movement = next_movement(index, current, previous);
        price = apply_soft_bounds(current, movement, index < threshold_index_);
    }

    double magnitude = std::abs(movement);
    std::uniform_int_distribution<int> base_volume(50, 200);
    std::uniform_real_distribution<double> spread_noise(-0.2, 0.2);

    PricePoint point;
    point.sequence_index = index;
    point.timestamp = start + std::chrono::seconds(
        static_cast<int64_t>(config_.point_spacing_seconds) * index);
    point.price = round_to(price, 2);
    point.movement = round_to(movement, 3);
    point.volume = static_cast<int64_t>(base_volume(rng_) * (1.0 + 0.5 * magnitude));
    point.bid_ask_spread = round_to(std::max(0.1, 0.5 + spread_noise(rng_) + 0.1 * magnitude), 2);
    point.resolved_outcome = outcome_ == Outcome::YES;

    {
        std::lock_guard<std::mutex> lock(data_mutex_);
        current_price_ = price;
        if (index > 0) previous_movement_ = movement;
        history_.push_back(point);
        next_index_ = index + 1;
    }
    points_generated_++;

    spdlog::debug("Point {}: price={:.2f} movement={:.3f}", index, point.price, point.movement);

    exporter_.write(point, outcome_);
    publish(point);

    if (index + 1 >= config_.total_points) {
        complete();
    }
    return point;
}

double MarketSimulator::gaussian(double sigma) {
    if (sigma <= 0.0) return 0.0;
    std::normal_distribution<double> dist(0.0, sigma);
    return dist(rng_);
}

double MarketSimulator::next_movement(int64_t index, Price current, double previous) {
    double movement;
    if (index < threshold_index_) {
        double momentum = 0.2 * previous;
        double weak_signal = 0.01 * (target_price_ - current) / 100.0;
        movement = momentum + gaussian(config_.volatility) + weak_signal;
    } else {
        double span = static_cast<double>(config_.total_points - threshold_index_);
        double progress = static_cast<double>(index - threshold_index_) / span;
        double base_trend = config_.trend_strength * (target_price_ - current) / 100.0;
        double trend = base_trend * (0.1 + 0.9 * progress);

        double remaining = static_cast<double>(config_.total_points - index);
        double sigma = config_.volatility * (0.75 + 0.25 * remaining / span);

        movement = trend + gaussian(sigma) + 0.15 * previous;
    }
    return std::clamp(movement, -config_.max_movement, config_.max_movement);
}

Price MarketSimulator::apply_soft_bounds(Price price, double movement, bool pre_threshold) {
    double comfort_low = pre_threshold ? 12.0 : 5.0;
    double comfort_high = pre_threshold ? 88.0 : 95.0;
    double warning_low = pre_threshold ? 8.0 : 2.0;
    double warning_high = pre_threshold ? 92.0 : 98.0;

    Price next = price + movement;

    if (next < warning_low) {
        double dampening = std::min(0.6, (comfort_low - next) * 0.1);
        next = price + movement * (1.0 - dampening);
    } else if (next > warning_high) {
        double dampening = std::min(0.6, (next - comfort_high) * 0.1);
        next = price + movement * (1.0 - dampening);
    }

    if (pre_threshold) {
        return std::clamp(next, 5.0, 95.0);
    }
    return std::clamp(next, 1.0, 99.0);
}

void MarketSimulator::complete() {
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        if (state_ == SimulationState::COMPLETED) return;
        state_ = SimulationState::COMPLETED;
    }
    control_cv_.notify_all();

    apply_terminal_adjustment();
    exporter_.close();
    spdlog::info("Simulation completed: {} points, final price {:.2f}, outcome {}",
                 config_.total_points, final_price(), outcome_to_string(outcome_));
}

void MarketSimulator::apply_terminal_adjustment() {
    std::lock_guard<std::mutex> lock(data_mutex_);
    if (terminal_adjusted_ || history_.empty()) return;

    Price before = current_price_;
    Price adjusted = current_price_ + TERMINAL_PULL * (target_price_ - current_price_);
    current_price_ = std::clamp(adjusted, 2.0, 98.0);
    history_.back().price = round_to(current_price_, 2);
    terminal_adjusted_ = true;

    spdlog::info("Terminal adjustment: {:.2f} -> {:.2f} (target {:.0f})",
                 before, current_price_, target_price_);
}

void MarketSimulator::open_export() {
    if (!export_config_.enabled || exporter_.is_open()) return;

    std::string file_name = export_config_.file_name.empty()
        ? PriceExporter::default_file_name(outcome_, config_.total_points, wall_now())
        : export_config_.file_name;
    std::string path = (std::filesystem::path(export_config_.directory) / file_name).string();

    if (!exporter_.open(path)) {
        spdlog::error("Continuing without price export");
        return;
    }
    std::lock_guard<std::mutex> lock(data_mutex_);
    export_path_ = path;
}

// ============================================================================
// SUBSCRIPTION
// ============================================================================

SubscriptionId MarketSimulator::subscribe(std::shared_ptr<PriceSink> sink) {
    if (!sink) {
        throw std::invalid_argument("Cannot subscribe a null sink");
    }
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    SubscriptionId id = next_subscription_id_++;
    spdlog::debug("Subscriber {} ({}) registered", id, sink->name());
    subscribers_.push_back(Subscriber{id, std::move(sink)});
    return id;
}

SubscriptionId MarketSimulator::subscribe(PriceCallback callback) {
    return subscribe(std::make_shared<CallbackSink>(std::move(callback)));
}

bool MarketSimulator::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                           [id](const Subscriber& s) { return s.id == id; });
    if (it == subscribers_.end()) {
        return false;
    }
    subscribers_.erase(it);
    return true;
}

void MarketSimulator::publish(const PricePoint& point) {
    std::vector<Subscriber> targets;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        targets = subscribers_;
    }

    for (const auto& sub : targets) {
        time_utils::LatencyTimer timer;
        timer.start();
        try {
            sub.sink->on_price(point);
        } catch (const std::exception& e) {
            callback_failures_++;
            spdlog::error("Subscriber {} ({}) failed on point {}: {}",
                          sub.id, sub.sink->name(), point.sequence_index, e.what());
        } catch (...) {
            callback_failures_++;
            spdlog::error("Subscriber {} ({}) threw a non-standard exception on point {}",
                          sub.id, sub.sink->name(), point.sequence_index);
        }
        timer.stop();

        if (config_.slow_subscriber_warn_ms > 0 && timer.elapsed_ms() > config_.slow_subscriber_warn_ms) {
            spdlog::warn("Subscriber {} ({}) took {}ms on point {}",
                         sub.id, sub.sink->name(), timer.elapsed_ms(), point.sequence_index);
        }
    }
}

// ============================================================================
// QUERIES
// ============================================================================

SimulationState MarketSimulator::state() const {
    std::lock_guard<std::mutex> lock(control_mutex_);
    return state_;
}

SimulationStats MarketSimulator::stats() const {
    SimulationStats s;
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        s.state = state_;
        s.time_interval_ms = interval_.count();
    }
    {
        std::lock_guard<std::mutex> lock(data_mutex_);
        s.current_index = next_index_;
        s.current_price = current_price_;
    }
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        s.subscriber_count = subscribers_.size();
    }
    s.total_points = config_.total_points;
    s.progress_percent = 100.0 * static_cast<double>(s.current_index) / config_.total_points;
    s.target_resolution = outcome_;
    s.target_price = target_price_;
    s.is_trending = s.current_index >= threshold_index_;
    s.points_generated = points_generated_.load();
    s.callback_failures = callback_failures_.load();
    return s;
}

Price MarketSimulator::current_price() const {
    std::lock_guard<std::mutex> lock(data_mutex_);
    return current_price_;
}

Price MarketSimulator::final_price() const {
    std::lock_guard<std::mutex> lock(data_mutex_);
    return history_.empty() ? current_price_ : history_.back().price;
}

std::optional<PricePoint> MarketSimulator::current_point() const {
    std::lock_guard<std::mutex> lock(data_mutex_);
    if (history_.empty()) return std::nullopt;
    return history_.back();
}

std::vector<PricePoint> MarketSimulator::history() const {
    std::lock_guard<std::mutex> lock(data_mutex_);
    return history_;
}

std::vector<PricePoint> MarketSimulator::recent_history(size_t n) const {
    std::lock_guard<std::mutex> lock(data_mutex_);
    size_t count = std::min(n, history_.size());
    return std::vector<PricePoint>(history_.end() - static_cast<std::ptrdiff_t>(count), history_.end());
}

std::vector<PricePoint> MarketSimulator::history_range(size_t start, size_t end) const {
    std::lock_guard<std::mutex> lock(data_mutex_);
    end = std::min(end, history_.size());
    if (start >= end) return {};
    return std::vector<PricePoint>(history_.begin() + static_cast<std::ptrdiff_t>(start),
                                   history_.begin() + static_cast<std::ptrdiff_t>(end));
}

std::string MarketSimulator::export_path() const {
    std::lock_guard<std::mutex> lock(data_mutex_);
    return export_path_;
}

} // namespace pmsim
