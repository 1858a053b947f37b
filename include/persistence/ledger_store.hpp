#pragma once

#include <string>
#include <vector>
#include <optional>
#include "common/types.hpp"
#include "position/position.hpp"

namespace pmsim {

/**
 * Persisted market resolution state.
 */
struct MarketState {
    bool resolved{false};
    Price final_price{0.0};
    int64_t last_sequence_index{-1};
    WallClock updated_at;
};

/**
 * Durable backing for the portfolio ledger.
 *
 * Trades are authoritative: positions are rebuilt from them on load.
 * All methods throw std::runtime_error on storage faults.
 */
class LedgerStore {
public:
    virtual ~LedgerStore() = default;

    virtual void initialize() = 0;

    // Users
    virtual void upsert_user(const User& user) = 0;
    virtual std::vector<User> load_users() = 0;
    virtual void update_user_cash(const std::string& user_id, Notional cash, Notional realized_pnl) = 0;

    // Trades. append_trade writes the trade and the user's resulting cash
    // in one transaction.
    virtual void append_trade(const Trade& trade, Notional resulting_cash) = 0;
    virtual std::vector<Trade> trades_for_user(const std::string& user_id) = 0;

    // Settlement. Writes the settled positions and final cash atomically.
    virtual void record_settlement(const std::string& user_id,
                                   const std::vector<Position>& positions,
                                   Notional cash,
                                   Notional realized_pnl) = 0;
    virtual std::vector<Position> settled_positions_for_user(const std::string& user_id) = 0;

    // Market
    virtual void save_market_state(const MarketState& state) = 0;
    virtual std::optional<MarketState> load_market_state() = 0;

    virtual void clear() = 0;
};

} // namespace pmsim
