#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "persistence/ledger_store.hpp"
#include "position/position.hpp"

namespace pmsim {

/**
 * Outcome of a trade request. Ordinary rejections are reported here and
 * never thrown.
 */
struct TradeResult {
    bool success{false};
    std::string message;
    std::optional<Trade> trade;
};

struct PositionView {
    double strike{0.0};
    int64_t quantity{0};
    Price average_cost{0.0};
    Price current_price{0.0};       // mid while open, payoff once settled
    Notional position_value{0.0};
    Notional unrealized_pnl{0.0};
    Notional cost_basis{0.0};
    PositionStatus status{PositionStatus::OPEN};
    Notional settlement_value{0.0};
};

struct PortfolioSnapshot {
    User user;
    std::vector<PositionView> positions;
    Notional cash{0.0};
    Notional total_position_value{0.0};
    Notional total_portfolio_value{0.0};
    Notional total_unrealized_pnl{0.0};
    Notional total_realized_pnl{0.0};
    Notional total_pnl{0.0};
    bool market_resolved{false};
    bool has_market_data{false};
};

struct ResolutionSummary {
    bool already_resolved{false};
    Price final_price{0.0};
    int users_settled{0};
    int positions_settled{0};
    Notional total_settlement{0.0};
    int persistence_failures{0};
};

struct MarketSummary {
    std::optional<Price> current_price;
    std::optional<int64_t> sequence_index;
    bool resolved{false};
    std::optional<Price> final_price;
    std::vector<double> strikes;
    std::vector<OptionQuote> quotes;
};

/**
 * Per-user cash and positions against the current quote set.
 *
 * All account mutation is serialized by one ledger lock, so a trade's
 * validation and application are atomic with respect to every other trade.
 * Quotes are a shared_ptr<const QuoteSet> swapped whole by update_market();
 * a trade reads the pointer once and prices off that single set.
 *
 * With a store, state is rebuilt from persisted trades at construction and
 * every accepted trade is written through before it is reported.
 */
class PortfolioLedger {
public:
    explicit PortfolioLedger(const PortfolioConfig& config,
                             std::shared_ptr<LedgerStore> store = nullptr);

    // Users
    std::string create_user(const std::string& username,
                            std::optional<Notional> starting_cash = std::nullopt);
    std::optional<User> get_user(const std::string& user_id) const;
    std::optional<User> find_user_by_username(const std::string& username) const;
    std::vector<User> list_users() const;

    // Market data
    void update_market(const PricePoint& point);
    std::shared_ptr<const QuoteSet> current_quotes() const;
    std::optional<Price> option_price(double strike, PriceSide side) const;
    MarketSummary market_summary() const;

    // Limits. Throws std::invalid_argument for an unknown user.
    int position_limit(const std::string& user_id, double strike) const;
    std::map<double, int> position_limits(const std::string& user_id) const;

    // Trading
    TradeResult execute_trade(const std::string& user_id, double strike,
                              int64_t quantity, Side side);

    // Queries
    std::optional<PortfolioSnapshot> get_portfolio(const std::string& user_id) const;
    std::optional<Position> position(const std::string& user_id, double strike) const;
    std::vector<Trade> trade_history(const std::string& user_id) const;  // most recent first

    // Resolution. Throws std::invalid_argument if final_price is outside [0, 100].
    ResolutionSummary resolve_market(Price final_price);
    bool is_resolved() const;

    // Drops every user, trade and position, in memory and in the store
    void clear();

    const PortfolioConfig& config() const { return config_; }

private:
    struct Account {
        User user;
        std::map<double, Position> positions;  // keyed by configured strike
        std::vector<Trade> trades;
    };

    struct PriceLookup {
        std::optional<Price> price;
        bool used_fallback{false};
        bool no_market_data{false};  // underlying itself is unusable
    };

    PortfolioConfig config_;
    std::shared_ptr<LedgerStore> store_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Account> accounts_;
    std::unordered_map<std::string, std::string> username_index_;
    bool resolved_{false};
    ResolutionSummary resolution_;

    // Guards only the pointer; taken after mutex_ when both are needed
    mutable std::mutex quotes_mutex_;
    std::shared_ptr<const QuoteSet> quotes_;

    void load_from_store();
    std::shared_ptr<const QuoteSet> quote_snapshot() const;
    std::optional<double> configured_strike(double strike) const;
    PriceLookup resolve_price(const QuoteSet* quotes, double strike, PriceSide side) const;
    int limit_for(const Account& account, double strike, const QuoteSet* quotes) const;
    PortfolioSnapshot build_snapshot(const Account& account, const QuoteSet* quotes) const;
    int64_t decay_total_index() const { return config_.decay_horizon_points - 1; }
};

} // namespace pmsim
