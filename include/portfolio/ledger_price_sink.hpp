#pragma once

#include <atomic>
#include <memory>
#include "portfolio/portfolio_ledger.hpp"
#include "simulation/price_sink.hpp"

namespace pmsim {

/**
 * Feeds published price points into a ledger's quote cache.
 */
class LedgerPriceSink : public PriceSink {
public:
    explicit LedgerPriceSink(std::shared_ptr<PortfolioLedger> ledger, int log_every = 25);

    void on_price(const PricePoint& point) override;
    std::string name() const override { return "ledger"; }

    int64_t update_count() const { return update_count_.load(); }
    int64_t last_sequence_index() const { return last_sequence_index_.load(); }

private:
    std::shared_ptr<PortfolioLedger> ledger_;
    int log_every_;
    std::atomic<int64_t> update_count_{0};
    std::atomic<int64_t> last_sequence_index_{-1};
};

} // namespace pmsim
