#pragma once

#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include <cstdint>
#include <stdexcept>
#include "persistence/ledger_store.hpp"

// Forward declare sqlite3
struct sqlite3;
struct sqlite3_stmt;

namespace pmsim {

// ============================================================================
// SQLITE LEDGER STORE
//
// Tables:
//   users         one row per participant, cash as of the last write
//   trades        append-only, replayed in timestamp order on load
//   positions     written only at settlement
//   market_state  single row, resolution flag and final price
//
// All timestamps are UTC microseconds.
// ============================================================================

class SqliteLedgerStore : public LedgerStore {
public:
    explicit SqliteLedgerStore(const std::string& db_path, int busy_timeout_ms = 2000);
    ~SqliteLedgerStore() override;

    // Non-copyable
    SqliteLedgerStore(const SqliteLedgerStore&) = delete;
    SqliteLedgerStore& operator=(const SqliteLedgerStore&) = delete;

    // Connection management
    bool is_open() const;
    void close();
    const std::string& path() const { return db_path_; }

    // Schema management
    void initialize() override;
    int get_schema_version();

    // Users
    void upsert_user(const User& user) override;
    std::vector<User> load_users() override;
    void update_user_cash(const std::string& user_id, Notional cash, Notional realized_pnl) override;

    // Trades
    void append_trade(const Trade& trade, Notional resulting_cash) override;
    std::vector<Trade> trades_for_user(const std::string& user_id) override;
    int64_t trade_count();

    // Settlement
    void record_settlement(const std::string& user_id,
                           const std::vector<Position>& positions,
                           Notional cash,
                           Notional realized_pnl) override;
    std::vector<Position> settled_positions_for_user(const std::string& user_id) override;

    // Market
    void save_market_state(const MarketState& state) override;
    std::optional<MarketState> load_market_state() override;

    void clear() override;

    // Runs raw SQL under the store lock
    void execute(const std::string& sql);

private:
    sqlite3* db_{nullptr};
    std::string db_path_;
    bool in_transaction_{false};
    std::mutex mutex_;

    void run(const std::string& sql);
    void begin_transaction();
    void commit_transaction();
    void rollback_transaction();
    void rollback_after_failure(const std::exception& cause);

    // Statement preparation helpers
    sqlite3_stmt* prepare(const std::string& sql);
    void bind_text(sqlite3_stmt* stmt, int index, const std::string& value);
    void bind_int64(sqlite3_stmt* stmt, int index, int64_t value);
    void bind_double(sqlite3_stmt* stmt, int index, double value);
    void step_done(sqlite3_stmt* stmt);
    void finalize(sqlite3_stmt* stmt);

    // Result extraction helpers
    std::string get_text(sqlite3_stmt* stmt, int col);
    int64_t get_int64(sqlite3_stmt* stmt, int col);
    double get_double(sqlite3_stmt* stmt, int col);

    // Unlocked bodies shared by public methods
    void write_user_cash(const std::string& user_id, Notional cash, Notional realized_pnl);

    void create_tables();
    void create_indexes();
};

} // namespace pmsim
