#include <iostream>
#include <csignal>
#include <atomic>
#include <filesystem>
#include <thread>
#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "common/types.hpp"
#include "config/config.hpp"
#include "persistence/sqlite_ledger_store.hpp"
#include "portfolio/ledger_price_sink.hpp"
#include "portfolio/portfolio_ledger.hpp"
#include "simulation/async_price_sink.hpp"
#include "simulation/market_simulator.hpp"
#include "utils/time_utils.hpp"

using namespace pmsim;

// Global shutdown flag
std::atomic<bool> g_shutdown{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown = true;
    }
}

void setup_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.log_to_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (config.log_to_file) {
        std::filesystem::create_directories(config.log_dir);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_dir + "/pmsim.log",
            static_cast<size_t>(config.max_log_file_size_mb) * 1024 * 1024,
            static_cast<size_t>(config.max_log_files)
        );
        if (config.json_format) {
            file_sink->set_pattern(R"({"time":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})");
        }
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("pmsim", sinks.begin(), sinks.end());

    if (config.log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (config.log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (config.log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
}

/**
 * Toy participant: every `every` points, buys on an up-move and sells
 * half of what it holds on a down-move, one strike per user.
 */
class DemoTrader : public PriceSink {
public:
    DemoTrader(std::shared_ptr<PortfolioLedger> ledger, std::vector<std::string> user_ids, int every)
        : ledger_(std::move(ledger))
        , user_ids_(std::move(user_ids))
        , every_(every)
    {
    }

    void on_price(const PricePoint& point) override {
        if (every_ <= 0 || point.sequence_index == 0 || point.sequence_index % every_ != 0) {
            last_price_ = point.price;
            return;
        }

        const auto& strikes = ledger_->config().strikes;
        for (size_t i = 0; i < user_ids_.size(); i++) {
            double strike = strikes[i % strikes.size()];
            auto result = point.price >= last_price_
                ? ledger_->execute_trade(user_ids_[i], strike, 5, Side::BUY)
                : sell_half(user_ids_[i], strike);
            if (result.success) trades_++;
        }
        last_price_ = point.price;
    }

    std::string name() const override { return "demo-trader"; }
    int trades() const { return trades_; }

private:
    std::shared_ptr<PortfolioLedger> ledger_;
    std::vector<std::string> user_ids_;
    int every_;
    Price last_price_{0.0};
    int trades_{0};

    TradeResult sell_half(const std::string& user_id, double strike) {
        auto pos = ledger_->position(user_id, strike);
        int64_t qty = pos ? pos->net_quantity / 2 : 0;
        if (qty <= 0) return TradeResult{};
        return ledger_->execute_trade(user_id, strike, qty, Side::SELL);
    }
};

void print_portfolio(const PortfolioSnapshot& p) {
    std::cout << fmt::format("{:<14} cash ${:>10.2f}  value ${:>10.2f}  realized {:>+9.2f}  unrealized {:>+9.2f}\n",
                             p.user.username, p.cash, p.total_portfolio_value,
                             p.total_realized_pnl, p.total_unrealized_pnl);
    for (const auto& pos : p.positions) {
        std::cout << fmt::format("    K={:.2f} qty {:>4}  avg {:.4f}  {}  settled ${:.2f}\n",
                                 pos.strike, pos.quantity, pos.average_cost,
                                 position_status_to_string(pos.status), pos.settlement_value);
    }
}

int main(int argc, char* argv[]) {
    // CLI parsing
    CLI::App app{"pmsim - Synthetic prediction market simulator"};

    std::string config_path = "configs/pmsim.json";
    std::string mode_str = "auto";
    int points = 0;
    int interval_ms = -1;
    uint64_t seed = 0;
    std::string db_path;
    bool no_export = false;
    int demo_users = 3;
    int trade_every = 50;
    bool show_version = false;

    app.add_option("-c,--config", config_path, "Path to configuration file");
    app.add_option("--mode", mode_str, "Run mode")
        ->check(CLI::IsMember(std::vector<std::string>{"auto", "manual"}));
    app.add_option("--points", points, "Total points to simulate (overrides config)");
    app.add_option("--interval-ms", interval_ms, "Milliseconds between points in auto mode");
    app.add_option("--seed", seed, "Random seed (0 = nondeterministic)");
    app.add_option("--db", db_path, "SQLite ledger path (overrides config and PMSIM_DB_PATH)");
    app.add_flag("--no-export", no_export, "Do not write the CSV price export");
    app.add_option("--users", demo_users, "Number of demo users")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--trade-every", trade_every, "Demo users trade every N points (0 = never)");
    app.add_flag("-v,--version", show_version, "Show version information");

    CLI11_PARSE(app, argc, argv);

    if (show_version) {
        std::cout << "pmsim v1.0.0\n";
        std::cout << "Built with C++20\n";
        return 0;
    }

    // Load config
    Config config;
    try {
        if (std::filesystem::exists(config_path)) {
            config = Config::load(config_path);
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }

    // Command line overrides
    if (points > 0) config.simulation.total_points = points;
    if (interval_ms >= 0) config.simulation.time_interval_ms = interval_ms;
    if (seed != 0) config.simulation.seed = seed;
    if (no_export) config.export_.enabled = false;
    config.persistence.db_path = Config::get_env("PMSIM_DB_PATH", config.persistence.db_path);
    if (!db_path.empty()) config.persistence.db_path = db_path;

    setup_logging(config.logging);

    if (!config.validate()) {
        spdlog::critical("Invalid configuration, exiting");
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        std::filesystem::path db_file(config.persistence.db_path);
        if (db_file.has_parent_path()) {
            std::filesystem::create_directories(db_file.parent_path());
        }

        auto store = std::make_shared<SqliteLedgerStore>(config.persistence.db_path,
                                                         config.persistence.busy_timeout_ms);
        auto ledger = std::make_shared<PortfolioLedger>(config.portfolio, store);

        if (ledger->is_resolved()) {
            spdlog::info("Stored market is resolved, starting a fresh ledger");
            ledger->clear();
        }

        std::vector<std::string> user_ids;
        for (int i = 1; i <= demo_users; i++) {
            user_ids.push_back(ledger->create_user(fmt::format("trader_{}", i)));
        }

        MarketSimulator simulator(config.simulation);
        simulator.set_export(config.export_);

        auto ledger_sink = std::make_shared<LedgerPriceSink>(ledger);
        simulator.subscribe(ledger_sink);

        auto trader = std::make_shared<DemoTrader>(ledger, user_ids, trade_every);
        auto async_trader = std::make_shared<AsyncPriceSink>(trader);
        async_trader->start();
        simulator.subscribe(async_trader);

        RunMode mode = run_mode_from_string(mode_str).value_or(RunMode::AUTO);
        if (!simulator.start(mode)) {
            spdlog::critical("Simulation failed to start");
            return 1;
        }

        auto started = std::chrono::steady_clock::now();
        while (!g_shutdown.load() && simulator.state() != SimulationState::COMPLETED) {
            if (mode == RunMode::MANUAL) {
                simulator.step();
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        }

        if (g_shutdown.load()) {
            spdlog::info("Shutdown signal received");
        }
        simulator.stop();
        async_trader->stop();

        auto stats = simulator.stats();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        spdlog::info("Simulation {} after {} points in {} ({} ledger updates, {} demo trades)",
                     simulation_state_to_string(stats.state), stats.points_generated,
                     time_utils::format_duration_ms(elapsed), ledger_sink->update_count(), trader->trades());

        auto summary = ledger->resolve_market(simulator.final_price());
        std::cout << fmt::format("\nMarket resolved {} at {:.2f}: {} positions settled, ${:.2f} paid out\n\n",
                                 outcome_to_string(simulator.final_resolution()), summary.final_price,
                                 summary.positions_settled, summary.total_settlement);

        for (const auto& user : ledger->list_users()) {
            auto portfolio = ledger->get_portfolio(user.id);
            if (portfolio) print_portfolio(*portfolio);
        }

        if (!simulator.export_path().empty()) {
            std::cout << "\nPrice path written to " << simulator.export_path() << "\n";
        }
    } catch (const std::exception& e) {
        spdlog::critical("Fatal: {}", e.what());
        return 1;
    }

    spdlog::info("pmsim shutdown complete.");
    return 0;
}
