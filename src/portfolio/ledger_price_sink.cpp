#include "portfolio/ledger_price_sink.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace pmsim {

LedgerPriceSink::LedgerPriceSink(std::shared_ptr<PortfolioLedger> ledger, int log_every)
    : ledger_(std::move(ledger))
    , log_every_(log_every)
{
    if (!ledger_) {
        throw std::invalid_argument("LedgerPriceSink requires a ledger");
    }
}

void LedgerPriceSink::on_price(const PricePoint& point) {
    ledger_->update_market(point);
    last_sequence_index_ = point.sequence_index;
    int64_t count = ++update_count_;

    if (log_every_ > 0 && count % log_every_ == 0) {
        spdlog::info("Ledger updated {} times, underlying {:.2f}", count, point.price);
    }
}

} // namespace pmsim
