#include "pricing/pricing_engine.hpp"
#include <algorithm>
#include <cmath>

namespace pmsim {

double PricingEngine::decay_multiplier(double decay_rate, int64_t elapsed_index, int64_t total_index) {
    if (total_index <= 0) {
        return 1.0;
    }
    double progress = static_cast<double>(elapsed_index) / static_cast<double>(total_index);
    return std::exp(-decay_rate * progress);
}

std::optional<OptionQuote> PricingEngine::price(
    const std::optional<UnderlyingSnapshot>& snapshot,
    double strike,
    double decay_rate,
    int64_t elapsed_index,
    int64_t total_index
) {
    if (!snapshot) {
        return std::nullopt;
    }

    double m = decay_multiplier(decay_rate, elapsed_index, total_index);
    double moneyness = 1.0 - strike;

    OptionQuote quote;
    quote.strike = strike;
    quote.bid = snapshot->yes * moneyness * m;
    quote.ask = (1.0 - snapshot->no) * moneyness * m;
    return quote;
}

QuoteSet PricingEngine::quote_set(
    const PricePoint& point,
    const std::vector<double>& strikes,
    double decay_rate,
    int64_t total_index
) {
    QuoteSet set;
    set.sequence_index = point.sequence_index;
    set.timestamp = point.timestamp;
    set.underlying_price = point.price;
    set.decay_multiplier = decay_multiplier(decay_rate, point.sequence_index, total_index);
    set.quotes.reserve(strikes.size());

    auto snapshot = UnderlyingSnapshot::from_price(point.price);
    for (double strike : strikes) {
        auto quote = price(snapshot, strike, decay_rate, point.sequence_index, total_index);
        if (quote) {
            set.quotes.push_back(*quote);
        }
    }
    return set;
}

double PricingEngine::fallback_price(double underlying, double strike) {
    double intrinsic = std::max(underlying - strike, 0.0);
    double time_value = 0.05 * (1.0 - strike);
    return std::max(intrinsic + time_value, MIN_FALLBACK_PRICE);
}

} // namespace pmsim
