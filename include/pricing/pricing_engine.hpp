#pragma once

#include <optional>
#include <vector>
#include "common/types.hpp"

namespace pmsim {

/**
 * Maps an underlying probability snapshot to option quotes.
 *
 * For a snapshot (yes, no) and strike K:
 *   m   = 1                           if total_index <= 0
 *       = exp(-k * elapsed / total)   otherwise
 *   bid = yes * (1 - K) * m
 *   ask = (1 - no) * (1 - K) * m
 *
 * Pure and stateless. A missing snapshot yields std::nullopt rather than NaN.
 */
class PricingEngine {
public:
    // Floor for the fallback estimate
    static constexpr double MIN_FALLBACK_PRICE = 0.001;

    static std::optional<OptionQuote> price(
        const std::optional<UnderlyingSnapshot>& snapshot,
        double strike,
        double decay_rate,
        int64_t elapsed_index,
        int64_t total_index
    );

    static double decay_multiplier(double decay_rate, int64_t elapsed_index, int64_t total_index);

    // Quotes for every strike from a single price point
    static QuoteSet quote_set(
        const PricePoint& point,
        const std::vector<double>& strikes,
        double decay_rate,
        int64_t total_index
    );

    // Intrinsic plus time value, used when a computed price is not finite.
    // underlying is the 0..1 probability, not the 0..100 price.
    static double fallback_price(double underlying, double strike);
};

} // namespace pmsim
