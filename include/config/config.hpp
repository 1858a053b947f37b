#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace pmsim {

struct SimulationConfig {
    int total_points{1500};
    double initial_price{50.0};              // Clamped to [15, 85]
    double volatility{1.8};                  // Std dev of per-step noise
    double threshold_fraction{0.7};          // Trend bias starts here
    double trend_strength{0.08};
    double max_movement{4.0};                // Per-step clamp
    int time_interval_ms{1000};              // Auto mode tick
    int point_spacing_seconds{300};          // Simulated time between points
    uint64_t seed{0};                        // 0 = seed from random_device
    int slow_subscriber_warn_ms{250};

    // Empty when valid
    std::string validation_error() const;
};

struct PortfolioConfig {
    double default_starting_cash{15000.0};
    std::vector<double> strikes{0.3, 0.4, 0.5, 0.6, 0.7, 0.8};
    double max_position_fraction{0.2};       // Of current cash, per strike
    int min_liquidity{10};                   // Floor for the position limit
    double decay_rate{1.5};
    int decay_horizon_points{0};             // <= 1 disables time decay

    // Empty when valid
    std::string validation_error() const;
};

struct PersistenceConfig {
    std::string db_path{"./data/pmsim.db"};
    int busy_timeout_ms{2000};
};

struct ExportConfig {
    bool enabled{true};
    std::string directory{"./data/market_data"};
    std::string file_name;                   // Empty = generated
};

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};           // debug, info, warn, error
    bool log_to_console{true};
    bool log_to_file{true};
    bool json_format{false};                 // JSON lines format
    int max_log_file_size_mb{100};
    int max_log_files{5};
};

struct Config {
    SimulationConfig simulation;
    PortfolioConfig portfolio;
    PersistenceConfig persistence;
    ExportConfig export_;
    LoggingConfig logging;

    // Load from file
    static Config load(const std::string& path);

    // Save to file
    void save(const std::string& path) const;

    // Validate configuration
    bool validate() const;

    // Get environment variable with default
    static std::string get_env(const std::string& name, const std::string& default_val = "");
};

// JSON serialization
void to_json(nlohmann::json& j, const SimulationConfig& c);
void from_json(const nlohmann::json& j, SimulationConfig& c);
void to_json(nlohmann::json& j, const PortfolioConfig& c);
void from_json(const nlohmann::json& j, PortfolioConfig& c);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace pmsim
