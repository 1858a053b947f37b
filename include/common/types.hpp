#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <vector>
#include <cstdint>

namespace pmsim {

// Time types
using Timestamp = std::chrono::time_point<std::chrono::steady_clock>;
using WallClock = std::chrono::time_point<std::chrono::system_clock>;
using Duration = std::chrono::nanoseconds;

inline Timestamp now() {
    return std::chrono::steady_clock::now();
}

inline WallClock wall_now() {
    return std::chrono::system_clock::now();
}

// Underlying price is quoted 0..100, option prices in dollars per contract
using Price = double;
using Notional = double;

// Trade side
enum class Side {
    BUY,
    SELL
};

inline std::string side_to_string(Side s) {
    return s == Side::BUY ? "BUY" : "SELL";
}

inline Side side_from_string(const std::string& s) {
    if (s == "SELL" || s == "sell") return Side::SELL;
    return Side::BUY;
}

// Which side of a quote to read
enum class PriceSide {
    BID,
    ASK,
    MID
};

inline std::string price_side_to_string(PriceSide s) {
    switch (s) {
        case PriceSide::BID: return "bid";
        case PriceSide::ASK: return "ask";
        case PriceSide::MID: return "mid";
    }
    return "unknown";
}

// Binary market outcome
enum class Outcome {
    YES,
    NO
};

inline std::string outcome_to_string(Outcome o) {
    return o == Outcome::YES ? "YES" : "NO";
}

/**
 * One emitted point of the underlying price path.
 */
struct PricePoint {
    int64_t sequence_index{0};
    WallClock timestamp;
    Price price{0.0};               // 0..100
    double movement{0.0};
    int64_t volume{0};
    double bid_ask_spread{0.0};
    std::optional<bool> resolved_outcome;  // true = YES
};

/**
 * Underlying probability pair used by the pricing transform.
 */
struct UnderlyingSnapshot {
    double yes{0.0};   // price / 100
    double no{0.0};    // 1 - yes

    static UnderlyingSnapshot from_price(Price price) {
        UnderlyingSnapshot s;
        s.yes = price / 100.0;
        s.no = 1.0 - s.yes;
        return s;
    }
};

/**
 * Bid/ask for a single strike.
 */
struct OptionQuote {
    double strike{0.0};
    Price bid{0.0};
    Price ask{0.0};

    Price mid() const { return (bid + ask) / 2.0; }
};

/**
 * Full set of quotes computed from one price point. Replaced wholesale
 * on every update.
 */
struct QuoteSet {
    int64_t sequence_index{0};
    WallClock timestamp;
    Price underlying_price{0.0};
    double decay_multiplier{1.0};
    std::vector<OptionQuote> quotes;

    const OptionQuote* find(double strike) const;
};

/**
 * Immutable record of an executed trade.
 */
struct Trade {
    std::string id;
    std::string user_id;
    WallClock timestamp;
    Side side{Side::BUY};
    double strike{0.0};
    int64_t quantity{0};
    Price price_per_contract{0.0};
    Notional signed_total_cost{0.0};   // +cost for BUY, -proceeds for SELL
    Price underlying_price_at_trade{0.0};

    int64_t signed_quantity() const {
        return side == Side::BUY ? quantity : -quantity;
    }
};

struct User {
    std::string id;
    std::string username;
    Notional starting_cash{0.0};
    Notional current_cash{0.0};
    Notional realized_pnl{0.0};
    WallClock created_at;
};

// Strikes are configured values; compare with tolerance
constexpr double STRIKE_EPSILON = 1e-9;

inline bool same_strike(double a, double b) {
    double d = a - b;
    return d < STRIKE_EPSILON && d > -STRIKE_EPSILON;
}

inline const OptionQuote* QuoteSet::find(double strike) const {
    for (const auto& q : quotes) {
        if (same_strike(q.strike, strike)) return &q;
    }
    return nullptr;
}

} // namespace pmsim
