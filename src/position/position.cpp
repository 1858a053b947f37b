#include "position/position.hpp"
#include <algorithm>
#include <stdexcept>

namespace pmsim {

void Position::apply(const Trade& trade) {
    if (status == PositionStatus::SETTLED) {
        throw std::logic_error("Cannot apply trade to settled position");
    }
    if (trade.user_id != user_id || !same_strike(trade.strike, strike)) {
        throw std::logic_error("Trade " + trade.id + " does not belong to this position");
    }

    net_quantity += trade.signed_quantity();
    cost_basis += trade.signed_total_cost;
    trades.push_back(trade);
}

Notional Position::settle(Price final_price) {
    if (status == PositionStatus::SETTLED) {
        return settlement_value;
    }

    settlement_value = static_cast<double>(net_quantity) * payoff(final_price, strike);
    status = PositionStatus::SETTLED;
    return settlement_value;
}

double Position::payoff(Price final_price, double strike) {
    return std::max(final_price / 100.0 - strike, 0.0);
}

Position Position::from_trades(const std::string& user_id, double strike,
                               const std::vector<Trade>& trades) {
    Position pos;
    pos.user_id = user_id;
    pos.strike = strike;
    for (const auto& trade : trades) {
        pos.apply(trade);
    }
    return pos;
}

} // namespace pmsim
