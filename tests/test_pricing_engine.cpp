#include <gtest/gtest.h>
#include <cmath>
#include "pricing/pricing_engine.hpp"

using namespace pmsim;

class PricingEngineTest : public ::testing::Test {
protected:
    static constexpr double kDecay = 1.5;

    PricePoint make_point(int64_t index, Price price) {
        PricePoint p;
        p.sequence_index = index;
        p.price = price;
        p.timestamp = wall_now();
        return p;
    }
};

// ============================================================================
// Quote formula
// ============================================================================

TEST_F(PricingEngineTest, SingleSampleHasNoDecay) {
    auto quote = PricingEngine::price(UnderlyingSnapshot::from_price(80.0), 0.5, kDecay, 0, 0);

    ASSERT_TRUE(quote.has_value());
    EXPECT_DOUBLE_EQ(quote->strike, 0.5);
    EXPECT_NEAR(quote->bid, 0.40, 1e-12);
    EXPECT_NEAR(quote->ask, 0.40, 1e-12);
    EXPECT_NEAR(quote->mid(), 0.40, 1e-12);
}

TEST_F(PricingEngineTest, AskUsesComplementOfNoLeg) {
    UnderlyingSnapshot snap;
    snap.yes = 0.6;
    snap.no = 0.3;

    auto quote = PricingEngine::price(snap, 0.5, kDecay, 0, 0);

    ASSERT_TRUE(quote.has_value());
    EXPECT_NEAR(quote->bid, 0.30, 1e-12);
    EXPECT_NEAR(quote->ask, 0.35, 1e-12);
    EXPECT_GE(quote->ask, quote->bid);
}

TEST_F(PricingEngineTest, MissingSnapshotIsUnavailable) {
    auto quote = PricingEngine::price(std::nullopt, 0.5, kDecay, 3, 10);
    EXPECT_FALSE(quote.has_value());
}

TEST_F(PricingEngineTest, DecayMultiplierFollowsExponential) {
    EXPECT_DOUBLE_EQ(PricingEngine::decay_multiplier(kDecay, 0, 100), 1.0);
    EXPECT_DOUBLE_EQ(PricingEngine::decay_multiplier(kDecay, 57, 0), 1.0);
    EXPECT_NEAR(PricingEngine::decay_multiplier(kDecay, 50, 100), std::exp(-0.75), 1e-12);
    EXPECT_NEAR(PricingEngine::decay_multiplier(kDecay, 100, 100), std::exp(-1.5), 1e-12);
}

TEST_F(PricingEngineTest, QuotesDecayMonotonicallyWithElapsedIndex) {
    auto snap = UnderlyingSnapshot::from_price(55.0);
    double last_bid = 1e9;
    double last_ask = 1e9;

    for (int64_t i = 0; i <= 200; i += 5) {
        auto quote = PricingEngine::price(snap, 0.4, kDecay, i, 200);
        ASSERT_TRUE(quote.has_value());
        EXPECT_LE(quote->bid, last_bid);
        EXPECT_LE(quote->ask, last_ask);
        last_bid = quote->bid;
        last_ask = quote->ask;
    }
}

TEST_F(PricingEngineTest, HigherStrikeIsCheaper) {
    auto snap = UnderlyingSnapshot::from_price(50.0);
    auto low = PricingEngine::price(snap, 0.3, kDecay, 0, 0);
    auto high = PricingEngine::price(snap, 0.8, kDecay, 0, 0);

    ASSERT_TRUE(low && high);
    EXPECT_GT(low->ask, high->ask);
}

// ============================================================================
// Quote sets
// ============================================================================

TEST_F(PricingEngineTest, QuoteSetCoversEveryStrike) {
    std::vector<double> strikes{0.3, 0.4, 0.5, 0.6, 0.7, 0.8};
    auto set = PricingEngine::quote_set(make_point(25, 62.0), strikes, kDecay, 99);

    EXPECT_EQ(set.sequence_index, 25);
    EXPECT_DOUBLE_EQ(set.underlying_price, 62.0);
    EXPECT_NEAR(set.decay_multiplier, std::exp(-kDecay * 25.0 / 99.0), 1e-12);
    ASSERT_EQ(set.quotes.size(), strikes.size());

    for (double k : strikes) {
        const OptionQuote* q = set.find(k);
        ASSERT_NE(q, nullptr) << "strike " << k;
        EXPECT_NEAR(q->bid, 0.62 * (1.0 - k) * set.decay_multiplier, 1e-12);
    }
    EXPECT_EQ(set.find(0.55), nullptr);
}

// ============================================================================
// Fallback estimate
// ============================================================================

TEST_F(PricingEngineTest, FallbackIsIntrinsicPlusTimeValue) {
    EXPECT_NEAR(PricingEngine::fallback_price(0.65, 0.5), 0.15 + 0.025, 1e-12);
    EXPECT_NEAR(PricingEngine::fallback_price(0.20, 0.5), 0.025, 1e-12);
}

TEST_F(PricingEngineTest, FallbackIsFloored) {
    EXPECT_DOUBLE_EQ(PricingEngine::fallback_price(0.0, 0.99), PricingEngine::MIN_FALLBACK_PRICE);
}
