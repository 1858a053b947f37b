#pragma once

#include <string>
#include <vector>
#include "common/types.hpp"

namespace pmsim {

enum class PositionStatus {
    OPEN,
    SETTLED
};

inline std::string position_status_to_string(PositionStatus s) {
    return s == PositionStatus::OPEN ? "OPEN" : "SETTLED";
}

inline PositionStatus position_status_from_string(const std::string& s) {
    if (s == "SETTLED" || s == "settled") return PositionStatus::SETTLED;
    return PositionStatus::OPEN;
}

/**
 * Holding of one user in one strike.
 *
 * Always the fold of its trade list: net_quantity is the signed sum of
 * quantities and cost_basis the sum of signed_total_cost. Transitions
 * OPEN -> SETTLED exactly once.
 */
struct Position {
    std::string user_id;
    double strike{0.0};

    int64_t net_quantity{0};
    Notional cost_basis{0.0};

    PositionStatus status{PositionStatus::OPEN};
    Notional settlement_value{0.0};

    std::vector<Trade> trades;

    // Fold one more trade in. Throws std::logic_error if settled or the
    // trade belongs to another (user, strike).
    void apply(const Trade& trade);

    // Settle at the final underlying price (0..100). A second call returns
    // the stored settlement_value without changing anything.
    Notional settle(Price final_price);

    bool is_open() const { return status == PositionStatus::OPEN; }
    bool is_flat() const { return net_quantity == 0; }

    Price average_cost() const {
        return net_quantity != 0 ? cost_basis / static_cast<double>(net_quantity) : 0.0;
    }

    Notional market_value(Price mid) const {
        return static_cast<double>(net_quantity) * mid;
    }

    Notional unrealized_pnl(Price mid) const {
        return market_value(mid) - cost_basis;
    }

    // Per-contract payoff at resolution: max(final/100 - strike, 0)
    static double payoff(Price final_price, double strike);

    static Position from_trades(const std::string& user_id, double strike,
                                const std::vector<Trade>& trades);
};

} // namespace pmsim
