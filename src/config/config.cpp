#include "config/config.hpp"
#include <fstream>
#include <cstdlib>
#include <cmath>
#include <spdlog/spdlog.h>

namespace pmsim {

std::string SimulationConfig::validation_error() const {
    if (total_points <= 0) return "total_points must be positive";
    if (!std::isfinite(initial_price)) return "initial_price must be finite";
    if (!std::isfinite(volatility) || volatility < 0) return "volatility must be non-negative";
    if (!(threshold_fraction > 0.0 && threshold_fraction < 1.0)) {
        return "threshold_fraction must be in (0, 1)";
    }
    if (!std::isfinite(trend_strength) || trend_strength < 0) return "trend_strength must be non-negative";
    if (!std::isfinite(max_movement) || max_movement <= 0) return "max_movement must be positive";
    if (time_interval_ms < 0) return "time_interval_ms must be non-negative";
    if (point_spacing_seconds <= 0) return "point_spacing_seconds must be positive";
    return "";
}

std::string PortfolioConfig::validation_error() const {
    if (!std::isfinite(default_starting_cash) || default_starting_cash < 0) {
        return "default_starting_cash must be non-negative";
    }
    if (strikes.empty()) return "strikes must not be empty";
    for (double k : strikes) {
        if (!(k > 0.0 && k < 1.0)) return "strikes must be in (0, 1)";
    }
    if (!(max_position_fraction > 0.0 && max_position_fraction <= 1.0)) {
        return "max_position_fraction must be in (0, 1]";
    }
    if (min_liquidity < 0) return "min_liquidity must be non-negative";
    if (!std::isfinite(decay_rate) || decay_rate < 0) return "decay_rate must be non-negative";
    return "";
}

void to_json(nlohmann::json& j, const SimulationConfig& c) {
    j = nlohmann::json{
        {"total_points", c.total_points},
        {"initial_price", c.initial_price},
        {"volatility", c.volatility},
        {"threshold_fraction", c.threshold_fraction},
        {"trend_strength", c.trend_strength},
        {"max_movement", c.max_movement},
        {"time_interval_ms", c.time_interval_ms},
        {"point_spacing_seconds", c.point_spacing_seconds},
        {"seed", c.seed},
        {"slow_subscriber_warn_ms", c.slow_subscriber_warn_ms}
    };
}

void from_json(const nlohmann::json& j, SimulationConfig& c) {
    if (j.contains("total_points")) j.at("total_points").get_to(c.total_points);
    if (j.contains("initial_price")) j.at("initial_price").get_to(c.initial_price);
    if (j.contains("volatility")) j.at("volatility").get_to(c.volatility);
    if (j.contains("threshold_fraction")) j.at("threshold_fraction").get_to(c.threshold_fraction);
    if (j.contains("trend_strength")) j.at("trend_strength").get_to(c.trend_strength);
    if (j.contains("max_movement")) j.at("max_movement").get_to(c.max_movement);
    if (j.contains("time_interval_ms")) j.at("time_interval_ms").get_to(c.time_interval_ms);
    if (j.contains("point_spacing_seconds")) j.at("point_spacing_seconds").get_to(c.point_spacing_seconds);
    if (j.contains("seed")) j.at("seed").get_to(c.seed);
    if (j.contains("slow_subscriber_warn_ms")) j.at("slow_subscriber_warn_ms").get_to(c.slow_subscriber_warn_ms);
}

void to_json(nlohmann::json& j, const PortfolioConfig& c) {
    j = nlohmann::json{
        {"default_starting_cash", c.default_starting_cash},
        {"strikes", c.strikes},
        {"max_position_fraction", c.max_position_fraction},
        {"min_liquidity", c.min_liquidity},
        {"decay_rate", c.decay_rate},
        {"decay_horizon_points", c.decay_horizon_points}
    };
}

void from_json(const nlohmann::json& j, PortfolioConfig& c) {
    if (j.contains("default_starting_cash")) j.at("default_starting_cash").get_to(c.default_starting_cash);
    if (j.contains("strikes")) j.at("strikes").get_to(c.strikes);
    if (j.contains("max_position_fraction")) j.at("max_position_fraction").get_to(c.max_position_fraction);
    if (j.contains("min_liquidity")) j.at("min_liquidity").get_to(c.min_liquidity);
    if (j.contains("decay_rate")) j.at("decay_rate").get_to(c.decay_rate);
    if (j.contains("decay_horizon_points")) j.at("decay_horizon_points").get_to(c.decay_horizon_points);
}

void to_json(nlohmann::json& j, const PersistenceConfig& c) {
    j = nlohmann::json{
        {"db_path", c.db_path},
        {"busy_timeout_ms", c.busy_timeout_ms}
    };
}

void from_json(const nlohmann::json& j, PersistenceConfig& c) {
    if (j.contains("db_path")) j.at("db_path").get_to(c.db_path);
    if (j.contains("busy_timeout_ms")) j.at("busy_timeout_ms").get_to(c.busy_timeout_ms);
}

void to_json(nlohmann::json& j, const ExportConfig& c) {
    j = nlohmann::json{
        {"enabled", c.enabled},
        {"directory", c.directory},
        {"file_name", c.file_name}
    };
}

void from_json(const nlohmann::json& j, ExportConfig& c) {
    if (j.contains("enabled")) j.at("enabled").get_to(c.enabled);
    if (j.contains("directory")) j.at("directory").get_to(c.directory);
    if (j.contains("file_name")) j.at("file_name").get_to(c.file_name);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"json_format", c.json_format},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("json_format")) j.at("json_format").get_to(c.json_format);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"simulation", c.simulation},
        {"portfolio", c.portfolio},
        {"persistence", c.persistence},
        {"export", c.export_},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("simulation")) j.at("simulation").get_to(c.simulation);
    if (j.contains("portfolio")) j.at("portfolio").get_to(c.portfolio);
    if (j.contains("persistence")) j.at("persistence").get_to(c.persistence);
    if (j.contains("export")) j.at("export").get_to(c.export_);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }

    Config config;
    from_json(j, config);

    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration in: " + path);
    }

    return config;
}

void Config::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

bool Config::validate() const {
    auto sim_error = simulation.validation_error();
    if (!sim_error.empty()) {
        spdlog::error("simulation: {}", sim_error);
        return false;
    }

    auto portfolio_error = portfolio.validation_error();
    if (!portfolio_error.empty()) {
        spdlog::error("portfolio: {}", portfolio_error);
        return false;
    }

    if (simulation.initial_price < 15.0 || simulation.initial_price > 85.0) {
        spdlog::warn("initial_price {:.2f} will be clamped to [15, 85]", simulation.initial_price);
    }

    if (persistence.db_path.empty()) {
        spdlog::error("persistence.db_path must not be empty");
        return false;
    }

    if (persistence.busy_timeout_ms < 0) {
        spdlog::error("persistence.busy_timeout_ms must be non-negative");
        return false;
    }

    return true;
}

std::string Config::get_env(const std::string& name, const std::string& default_val) {
    const char* val = std::getenv(name.c_str());
    return val ? std::string(val) : default_val;
}

} // namespace pmsim
