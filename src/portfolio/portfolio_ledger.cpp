#include "portfolio/portfolio_ledger.hpp"
#include "pricing/pricing_engine.hpp"
#include "utils/uuid.hpp"
#include <algorithm>
#include <climits>
#include <cmath>
#include <stdexcept>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace pmsim {

namespace {

TradeResult reject(const std::string& user_id, const std::string& reason) {
    spdlog::warn("Trade rejected for {}: {}", user_id, reason);
    TradeResult result;
    result.success = false;
    result.message = reason;
    return result;
}

// Cash and positions recomputed from trades must match stored cash to this
constexpr double CASH_TOLERANCE = 1e-6;

} // namespace

PortfolioLedger::PortfolioLedger(const PortfolioConfig& config, std::shared_ptr<LedgerStore> store)
    : config_(config)
    , store_(std::move(store))
{
    auto error = config_.validation_error();
    if (!error.empty()) {
        throw std::invalid_argument("Invalid portfolio config: " + error);
    }

    if (store_) {
        load_from_store();
    }
}

// ============================================================================
// USERS
// ============================================================================

std::string PortfolioLedger::create_user(const std::string& username, std::optional<Notional> starting_cash) {
    if (username.empty()) {
        throw std::invalid_argument("Username must not be empty");
    }
    Notional cash = starting_cash.value_or(config_.default_starting_cash);
    if (!std::isfinite(cash) || cash < 0) {
        throw std::invalid_argument("Starting cash must be a non-negative amount");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto existing = username_index_.find(username);
    if (existing != username_index_.end()) {
        spdlog::debug("User {} already exists", username);
        return existing->second;
    }

    User user;
    user.id = generate_uuid();
    user.username = username;
    user.starting_cash = cash;
    user.current_cash = cash;
    user.realized_pnl = 0.0;
    user.created_at = wall_now();

    // Write-through first so a store failure leaves memory untouched
    if (store_) {
        store_->upsert_user(user);
    }

    Account account;
    account.user = user;
    accounts_.emplace(user.id, std::move(account));
    username_index_.emplace(username, user.id);

    spdlog::info("Created user {} ({}) with ${:.2f}", username, user.id, cash);
    return user.id;
}

std::optional<User> PortfolioLedger::get_user(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(user_id);
    if (it == accounts_.end()) return std::nullopt;
    return it->second.user;
}

std::optional<User> PortfolioLedger::find_user_by_username(const std::string& username) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto idx = username_index_.find(username);
    if (idx == username_index_.end()) return std::nullopt;
    return accounts_.at(idx->second).user;
}

std::vector<User> PortfolioLedger::list_users() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<User> users;
    users.reserve(accounts_.size());
    for (const auto& [id, account] : accounts_) {
        users.push_back(account.user);
    }
    std::sort(users.begin(), users.end(), [](const User& a, const User& b) {
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.username < b.username;
    });
    return users;
}

// ============================================================================
// MARKET DATA
// ============================================================================

void PortfolioLedger::update_market(const PricePoint& point) {
    auto set = std::make_shared<const QuoteSet>(
        PricingEngine::quote_set(point, config_.strikes, config_.decay_rate, decay_total_index()));

    {
        std::lock_guard<std::mutex> lock(quotes_mutex_);
        quotes_ = std::move(set);
    }
    spdlog::debug("Quotes updated from point {} (price {:.2f})", point.sequence_index, point.price);
}

std::shared_ptr<const QuoteSet> PortfolioLedger::quote_snapshot() const {
    std::lock_guard<std::mutex> lock(quotes_mutex_);
    return quotes_;
}

std::shared_ptr<const QuoteSet> PortfolioLedger::current_quotes() const {
    return quote_snapshot();
}

std::optional<double> PortfolioLedger::configured_strike(double strike) const {
    for (double k : config_.strikes) {
        if (same_strike(k, strike)) return k;
    }
    return std::nullopt;
}

PortfolioLedger::PriceLookup PortfolioLedger::resolve_price(const QuoteSet* quotes, double strike,
                                                            PriceSide side) const {
    PriceLookup lookup;
    const OptionQuote* quote = quotes ? quotes->find(strike) : nullptr;
    if (!quote) {
        return lookup;
    }

    Price value = quote->mid();
    if (side == PriceSide::BID) value = quote->bid;
    else if (side == PriceSide::ASK) value = quote->ask;

    if (std::isfinite(value)) {
        lookup.price = value;
        return lookup;
    }

    double underlying = quotes->underlying_price / 100.0;
    if (!std::isfinite(underlying)) {
        spdlog::warn("No usable {} for strike {:.2f}: underlying is not finite",
                     price_side_to_string(side), strike);
        lookup.no_market_data = true;
        return lookup;
    }

    Price estimate = PricingEngine::fallback_price(underlying, strike);
    spdlog::warn("Non-finite {} for strike {:.2f}, using fallback estimate {:.4f}",
                 price_side_to_string(side), strike, estimate);
    lookup.price = estimate;
    lookup.used_fallback = true;
    return lookup;
}

std::optional<Price> PortfolioLedger::option_price(double strike, PriceSide side) const {
    auto quotes = quote_snapshot();
    auto key = configured_strike(strike);
    if (!key) return std::nullopt;
    return resolve_price(quotes.get(), *key, side).price;
}

MarketSummary PortfolioLedger::market_summary() const {
    MarketSummary summary;
    summary.strikes = config_.strikes;

    auto quotes = quote_snapshot();
    if (quotes) {
        summary.current_price = quotes->underlying_price;
        summary.sequence_index = quotes->sequence_index;
        summary.quotes = quotes->quotes;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    summary.resolved = resolved_;
    if (resolved_) {
        summary.final_price = resolution_.final_price;
    }
    return summary;
}

// ============================================================================
// LIMITS
// ============================================================================

int PortfolioLedger::limit_for(const Account& account, double strike, const QuoteSet* quotes) const {
    double by_cash = 0.0;
    auto ask = resolve_price(quotes, strike, PriceSide::ASK).price;
    if (ask && *ask > 0.0) {
        by_cash = std::floor(account.user.current_cash * config_.max_position_fraction / *ask);
    }
    by_cash = std::min(by_cash, static_cast<double>(INT_MAX));
    return std::max(config_.min_liquidity, static_cast<int>(by_cash));
}

int PortfolioLedger::position_limit(const std::string& user_id, double strike) const {
    auto quotes = quote_snapshot();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(user_id);
    if (it == accounts_.end()) {
        throw std::invalid_argument("Unknown user: " + user_id);
    }
    return limit_for(it->second, configured_strike(strike).value_or(strike), quotes.get());
}

std::map<double, int> PortfolioLedger::position_limits(const std::string& user_id) const {
    auto quotes = quote_snapshot();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(user_id);
    if (it == accounts_.end()) {
        throw std::invalid_argument("Unknown user: " + user_id);
    }

    std::map<double, int> limits;
    for (double strike : config_.strikes) {
        limits[strike] = limit_for(it->second, strike, quotes.get());
    }
    return limits;
}

// ============================================================================
// TRADING
// ============================================================================

TradeResult PortfolioLedger::execute_trade(const std::string& user_id, double strike,
                                           int64_t quantity, Side side) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = accounts_.find(user_id);
    if (it == accounts_.end()) {
        return reject(user_id, "User not found");
    }
    if (resolved_) {
        return reject(user_id, "Market has already resolved - no more trading allowed");
    }
    if (quantity <= 0) {
        return reject(user_id, "Quantity must be positive");
    }

    // One snapshot for the whole trade
    auto quotes = quote_snapshot();
    if (!quotes) {
        return reject(user_id, "No market data available for trading");
    }
    auto key = configured_strike(strike);
    if (!key || !quotes->find(*key)) {
        return reject(user_id, fmt::format("Strike {:.2f} not available", strike));
    }

    auto lookup = resolve_price(quotes.get(), *key, side == Side::BUY ? PriceSide::ASK : PriceSide::BID);
    if (lookup.no_market_data) {
        return reject(user_id, "No market data available for trading");
    }
    if (!lookup.price || !std::isfinite(*lookup.price) || *lookup.price <= 0.0) {
        return reject(user_id, "Invalid option price");
    }
    Price price = *lookup.price;

    Account& account = it->second;
    auto pos_it = account.positions.find(*key);
    bool had_position = pos_it != account.positions.end();
    int64_t held = had_position ? pos_it->second.net_quantity : 0;
    Notional amount = price * static_cast<double>(quantity);

    if (side == Side::BUY) {
        int limit = limit_for(account, *key, quotes.get());
        if (quantity > limit - held) {
            return reject(user_id, fmt::format("Would exceed position limit of {} contracts", limit));
        }
        if (account.user.current_cash < amount) {
            return reject(user_id, fmt::format("Insufficient cash. Need ${:.2f}, have ${:.2f}",
                                               amount, account.user.current_cash));
        }
    } else if (quantity > held) {
        return reject(user_id, fmt::format("Cannot sell {} contracts, only own {}", quantity, held));
    }

    Trade trade;
    trade.id = generate_uuid();
    trade.user_id = user_id;
    trade.timestamp = wall_now();
    trade.side = side;
    trade.strike = *key;
    trade.quantity = quantity;
    trade.price_per_contract = price;
    trade.signed_total_cost = side == Side::BUY ? amount : -amount;
    trade.underlying_price_at_trade = quotes->underlying_price;

    // Apply in memory, remembering enough to undo
    Notional cash_before = account.user.current_cash;
    int64_t quantity_before = held;
    Notional cost_basis_before = had_position ? pos_it->second.cost_basis : 0.0;

    account.user.current_cash -= trade.signed_total_cost;
    Position& pos = account.positions[*key];
    if (!had_position) {
        pos.user_id = user_id;
        pos.strike = *key;
    }
    pos.apply(trade);
    account.trades.push_back(trade);

    if (store_) {
        try {
            store_->append_trade(trade, account.user.current_cash);
        } catch (const std::exception& e) {
            account.user.current_cash = cash_before;
            account.trades.pop_back();
            if (had_position) {
                pos.net_quantity = quantity_before;
                pos.cost_basis = cost_basis_before;
                pos.trades.pop_back();
            } else {
                account.positions.erase(*key);
            }
            spdlog::error("Trade for {} rolled back: {}", user_id, e.what());
            TradeResult failed;
            failed.success = false;
            failed.message = std::string("Persistence failure: ") + e.what();
            return failed;
        }
    }

    spdlog::info("{} {} x K={:.2f} @ ${:.4f}{} for {} (cash ${:.2f})",
                 side_to_string(side), quantity, *key, price,
                 lookup.used_fallback ? " (fallback)" : "",
                 account.user.username, account.user.current_cash);

    TradeResult result;
    result.success = true;
    result.message = fmt::format("{} {} contracts at strike {:.2f} for ${:.4f} each",
                                 side == Side::BUY ? "Bought" : "Sold", quantity, *key, price);
    result.trade = trade;
    return result;
}

// ============================================================================
// QUERIES
// ============================================================================

PortfolioSnapshot PortfolioLedger::build_snapshot(const Account& account, const QuoteSet* quotes) const {
    PortfolioSnapshot snap;
    snap.user = account.user;
    snap.cash = account.user.current_cash;
    snap.market_resolved = resolved_;
    snap.has_market_data = quotes != nullptr;

    for (const auto& [strike, pos] : account.positions) {
        if (pos.net_quantity == 0) continue;

        PositionView view;
        view.strike = strike;
        view.quantity = pos.net_quantity;
        view.average_cost = pos.average_cost();
        view.cost_basis = pos.cost_basis;
        view.status = pos.status;
        view.settlement_value = pos.settlement_value;

        if (pos.status == PositionStatus::SETTLED) {
            view.current_price = Position::payoff(resolution_.final_price, strike);
        } else {
            auto mid = resolve_price(quotes, strike, PriceSide::MID).price;
            if (mid) {
                view.current_price = *mid;
                view.position_value = pos.market_value(*mid);
                view.unrealized_pnl = pos.unrealized_pnl(*mid);
            } else {
                snap.has_market_data = false;
            }
        }

        snap.total_position_value += view.position_value;
        snap.total_unrealized_pnl += view.unrealized_pnl;
        snap.positions.push_back(view);
    }

    snap.total_realized_pnl = account.user.realized_pnl;
    snap.total_portfolio_value = snap.cash + snap.total_position_value;
    snap.total_pnl = snap.total_unrealized_pnl + snap.total_realized_pnl;
    return snap;
}

std::optional<PortfolioSnapshot> PortfolioLedger::get_portfolio(const std::string& user_id) const {
    auto quotes = quote_snapshot();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(user_id);
    if (it == accounts_.end()) return std::nullopt;
    return build_snapshot(it->second, quotes.get());
}

std::optional<Position> PortfolioLedger::position(const std::string& user_id, double strike) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(user_id);
    if (it == accounts_.end()) return std::nullopt;
    for (const auto& [k, pos] : it->second.positions) {
        if (same_strike(k, strike)) return pos;
    }
    return std::nullopt;
}

std::vector<Trade> PortfolioLedger::trade_history(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(user_id);
    if (it == accounts_.end()) return {};
    return std::vector<Trade>(it->second.trades.rbegin(), it->second.trades.rend());
}

// ============================================================================
// RESOLUTION
// ============================================================================

ResolutionSummary PortfolioLedger::resolve_market(Price final_price) {
    if (!std::isfinite(final_price) || final_price < 0.0 || final_price > 100.0) {
        throw std::invalid_argument(fmt::format("Final price {} outside [0, 100]", final_price));
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (resolved_) {
        spdlog::info("Market already resolved at {:.2f}", resolution_.final_price);
        ResolutionSummary repeat = resolution_;
        repeat.already_resolved = true;
        return repeat;
    }

    ResolutionSummary summary;
    summary.final_price = final_price;

    for (auto& [user_id, account] : accounts_) {
        std::vector<Position> settled;
        for (auto& [strike, pos] : account.positions) {
            if (!pos.is_open() || pos.net_quantity == 0) continue;

            Notional value = pos.settle(final_price);
            account.user.current_cash += value;
            summary.total_settlement += value;
            summary.positions_settled++;

            Position record = pos;
            record.trades.clear();
            settled.push_back(record);
        }
        account.user.realized_pnl = account.user.current_cash - account.user.starting_cash;
        summary.users_settled++;

        if (store_) {
            try {
                store_->record_settlement(user_id, settled, account.user.current_cash,
                                          account.user.realized_pnl);
            } catch (const std::exception& e) {
                summary.persistence_failures++;
                spdlog::error("Failed to persist settlement for {}: {}", account.user.username, e.what());
            }
        }
    }

    resolved_ = true;
    resolution_ = summary;

    if (store_) {
        MarketState state;
        state.resolved = true;
        state.final_price = final_price;
        auto quotes = quote_snapshot();
        state.last_sequence_index = quotes ? quotes->sequence_index : -1;
        state.updated_at = wall_now();
        try {
            store_->save_market_state(state);
        } catch (const std::exception& e) {
            resolution_.persistence_failures++;
            summary.persistence_failures++;
            spdlog::error("Failed to persist market resolution: {}", e.what());
        }
    }

    spdlog::info("Market resolved at {:.2f}: {} positions settled across {} users, ${:.2f} paid",
                 final_price, summary.positions_settled, summary.users_settled, summary.total_settlement);
    return summary;
}

bool PortfolioLedger::is_resolved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolved_;
}

void PortfolioLedger::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (store_) {
        store_->clear();
    }
    accounts_.clear();
    username_index_.clear();
    resolved_ = false;
    resolution_ = ResolutionSummary{};
    {
        std::lock_guard<std::mutex> quotes_lock(quotes_mutex_);
        quotes_.reset();
    }
    spdlog::info("Ledger cleared");
}

// ============================================================================
// REBUILD
// ============================================================================

void PortfolioLedger::load_from_store() {
    store_->initialize();

    auto market = store_->load_market_state();
    bool resolved = market && market->resolved;

    size_t trade_total = 0;
    for (const auto& stored : store_->load_users()) {
        Account account;
        account.user = stored;

        auto trades = store_->trades_for_user(stored.id);
        Notional cash = stored.starting_cash;
        for (const auto& trade : trades) {
            double key = configured_strike(trade.strike).value_or(trade.strike);
            auto [entry, inserted] = account.positions.try_emplace(key);
            if (inserted) {
                entry->second.user_id = stored.id;
                entry->second.strike = key;
            }
            entry->second.apply(trade);
            cash -= trade.signed_total_cost;
        }
        account.trades = trades;
        trade_total += trades.size();

        for (const auto& record : store_->settled_positions_for_user(stored.id)) {
            auto found = std::find_if(account.positions.begin(), account.positions.end(),
                [&](const auto& entry) { return same_strike(entry.first, record.strike); });
            if (found == account.positions.end() || found->second.net_quantity != record.net_quantity) {
                throw std::runtime_error(fmt::format(
                    "Corrupted ledger state: settled position {} K={:.2f} does not match its trades",
                    stored.username, record.strike));
            }
            if (record.status == PositionStatus::SETTLED) {
                found->second.status = PositionStatus::SETTLED;
                found->second.settlement_value = record.settlement_value;
                cash += record.settlement_value;
            }
        }

        if (std::abs(cash - stored.current_cash) > CASH_TOLERANCE) {
            spdlog::warn("Stored cash ${:.2f} for {} disagrees with trades (${:.2f}), using trades",
                         stored.current_cash, stored.username, cash);
        }
        account.user.current_cash = cash;

        if (resolved) {
            // Settlement writes that failed at resolution time are redone here
            std::vector<Position> recovered;
            for (auto& [strike, pos] : account.positions) {
                if (!pos.is_open() || pos.net_quantity == 0) continue;
                account.user.current_cash += pos.settle(market->final_price);
                Position record = pos;
                record.trades.clear();
                recovered.push_back(record);
            }
            account.user.realized_pnl = account.user.current_cash - stored.starting_cash;

            if (!recovered.empty()) {
                spdlog::warn("Settling {} unsettled positions for {} at {:.2f}",
                             recovered.size(), stored.username, market->final_price);
                try {
                    store_->record_settlement(stored.id, recovered, account.user.current_cash,
                                              account.user.realized_pnl);
                } catch (const std::exception& e) {
                    resolution_.persistence_failures++;
                    spdlog::error("Failed to persist recovered settlement for {}: {}",
                                  stored.username, e.what());
                }
            }
        }

        username_index_[stored.username] = stored.id;
        accounts_[stored.id] = std::move(account);
    }

    if (resolved) {
        resolved_ = true;
        resolution_.final_price = market->final_price;
        for (const auto& [id, account] : accounts_) {
            resolution_.users_settled++;
            for (const auto& [strike, pos] : account.positions) {
                if (pos.status == PositionStatus::SETTLED) {
                    resolution_.positions_settled++;
                    resolution_.total_settlement += pos.settlement_value;
                }
            }
        }
    }

    spdlog::info("Ledger loaded {} users and {} trades{}", accounts_.size(), trade_total,
                 resolved_ ? fmt::format(", market resolved at {:.2f}", resolution_.final_price) : "");
}

} // namespace pmsim
