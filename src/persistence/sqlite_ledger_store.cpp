#include "persistence/sqlite_ledger_store.hpp"
#include "utils/time_utils.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace pmsim {

// ============================================================================
// CONNECTION
// ============================================================================

SqliteLedgerStore::SqliteLedgerStore(const std::string& db_path, int busy_timeout_ms)
    : db_path_(db_path)
{
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    // Fail with SQLITE_BUSY instead of waiting forever on a locked file
    sqlite3_busy_timeout(db_, busy_timeout_ms);

    run("PRAGMA foreign_keys = ON;");
    run("PRAGMA journal_mode = WAL;");

    spdlog::info("Ledger store opened: {}", db_path);
}

SqliteLedgerStore::~SqliteLedgerStore() {
    close();
}

bool SqliteLedgerStore::is_open() const {
    return db_ != nullptr;
}

void SqliteLedgerStore::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        spdlog::info("Ledger store closed");
    }
}

void SqliteLedgerStore::execute(const std::string& sql) {
    std::lock_guard<std::mutex> lock(mutex_);
    run(sql);
}

void SqliteLedgerStore::run(const std::string& sql) {
    if (!db_) {
        throw std::runtime_error("Ledger store is closed");
    }

    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string error = errmsg ? errmsg : "Unknown error";
        sqlite3_free(errmsg);
        throw std::runtime_error("SQL error: " + error + " in: " + sql);
    }
}

void SqliteLedgerStore::begin_transaction() {
    if (!in_transaction_) {
        run("BEGIN IMMEDIATE TRANSACTION;");
        in_transaction_ = true;
    }
}

void SqliteLedgerStore::commit_transaction() {
    if (in_transaction_) {
        run("COMMIT;");
        in_transaction_ = false;
    }
}

void SqliteLedgerStore::rollback_transaction() {
    if (in_transaction_) {
        in_transaction_ = false;
        run("ROLLBACK;");
    }
}

void SqliteLedgerStore::rollback_after_failure(const std::exception& cause) {
    try {
        rollback_transaction();
    } catch (const std::exception& e) {
        spdlog::error("Rollback failed after '{}': {}", cause.what(), e.what());
    }
}

sqlite3_stmt* SqliteLedgerStore::prepare(const std::string& sql) {
    if (!db_) {
        throw std::runtime_error("Ledger store is closed");
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " +
                                 std::string(sqlite3_errmsg(db_)));
    }
    return stmt;
}

void SqliteLedgerStore::bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void SqliteLedgerStore::bind_int64(sqlite3_stmt* stmt, int index, int64_t value) {
    sqlite3_bind_int64(stmt, index, value);
}

void SqliteLedgerStore::bind_double(sqlite3_stmt* stmt, int index, double value) {
    sqlite3_bind_double(stmt, index, value);
}

void SqliteLedgerStore::step_done(sqlite3_stmt* stmt) {
    int rc = sqlite3_step(stmt);
    finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("SQL step failed: " + std::string(sqlite3_errmsg(db_)));
    }
}

void SqliteLedgerStore::finalize(sqlite3_stmt* stmt) {
    sqlite3_finalize(stmt);
}

std::string SqliteLedgerStore::get_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

int64_t SqliteLedgerStore::get_int64(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_int64(stmt, col);
}

double SqliteLedgerStore::get_double(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_double(stmt, col);
}

// ============================================================================
// SCHEMA
// ============================================================================

void SqliteLedgerStore::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    create_tables();
    create_indexes();
    spdlog::info("Ledger schema initialized");
}

void SqliteLedgerStore::create_tables() {
    run(R"(
        CREATE TABLE IF NOT EXISTS users (
            user_id TEXT PRIMARY KEY,
            username TEXT UNIQUE NOT NULL,
            starting_cash REAL NOT NULL,
            current_cash REAL NOT NULL,
            total_realized_pnl REAL NOT NULL DEFAULT 0,
            created_at INTEGER NOT NULL
        );
    )");

    run(R"(
        CREATE TABLE IF NOT EXISTS trades (
            trade_id TEXT PRIMARY KEY,
            user_id TEXT NOT NULL,
            timestamp INTEGER NOT NULL,
            trade_type TEXT NOT NULL,
            strike_price REAL NOT NULL,
            quantity INTEGER NOT NULL,
            price_per_contract REAL NOT NULL,
            total_cost REAL NOT NULL,
            market_price_at_trade REAL NOT NULL,
            FOREIGN KEY (user_id) REFERENCES users(user_id)
        );
    )");

    run(R"(
        CREATE TABLE IF NOT EXISTS positions (
            user_id TEXT NOT NULL,
            strike_price REAL NOT NULL,
            quantity INTEGER NOT NULL,
            cost_basis REAL NOT NULL,
            status TEXT NOT NULL,
            settlement_value REAL NOT NULL,
            updated_at INTEGER NOT NULL,
            PRIMARY KEY (user_id, strike_price),
            FOREIGN KEY (user_id) REFERENCES users(user_id)
        );
    )");

    run(R"(
        CREATE TABLE IF NOT EXISTS market_state (
            id INTEGER PRIMARY KEY CHECK (id = 1),
            resolved INTEGER NOT NULL,
            final_price REAL NOT NULL,
            last_sequence_index INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );
    )");

    run(R"(
        CREATE TABLE IF NOT EXISTS schema_version (
            version INTEGER PRIMARY KEY
        );
    )");

    run("INSERT OR IGNORE INTO schema_version (version) VALUES (1);");
}

void SqliteLedgerStore::create_indexes() {
    run("CREATE INDEX IF NOT EXISTS idx_trades_user_time ON trades(user_id, timestamp);");
    run("CREATE INDEX IF NOT EXISTS idx_positions_user ON positions(user_id);");
}

int SqliteLedgerStore::get_schema_version() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare("SELECT version FROM schema_version LIMIT 1;");
    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        version = static_cast<int>(get_int64(stmt, 0));
    }
    finalize(stmt);
    return version;
}

// ============================================================================
// USERS
// ============================================================================

void SqliteLedgerStore::upsert_user(const User& user) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(R"(
        INSERT INTO users (
            user_id, username, starting_cash, current_cash, total_realized_pnl, created_at
        ) VALUES (?, ?, ?, ?, ?, ?)
        ON CONFLICT(user_id) DO UPDATE SET
            username = excluded.username,
            starting_cash = excluded.starting_cash,
            current_cash = excluded.current_cash,
            total_realized_pnl = excluded.total_realized_pnl;
    )");

    bind_text(stmt, 1, user.id);
    bind_text(stmt, 2, user.username);
    bind_double(stmt, 3, user.starting_cash);
    bind_double(stmt, 4, user.current_cash);
    bind_double(stmt, 5, user.realized_pnl);
    bind_int64(stmt, 6, time_utils::to_micros(user.created_at));

    step_done(stmt);
}

std::vector<User> SqliteLedgerStore::load_users() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(R"(
        SELECT user_id, username, starting_cash, current_cash, total_realized_pnl, created_at
        FROM users ORDER BY created_at, rowid;
    )");

    std::vector<User> result;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        User u;
        u.id = get_text(stmt, 0);
        u.username = get_text(stmt, 1);
        u.starting_cash = get_double(stmt, 2);
        u.current_cash = get_double(stmt, 3);
        u.realized_pnl = get_double(stmt, 4);
        u.created_at = time_utils::from_micros(get_int64(stmt, 5));
        result.push_back(u);
    }

    finalize(stmt);
    return result;
}

void SqliteLedgerStore::update_user_cash(const std::string& user_id, Notional cash, Notional realized_pnl) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_user_cash(user_id, cash, realized_pnl);
}

void SqliteLedgerStore::write_user_cash(const std::string& user_id, Notional cash, Notional realized_pnl) {
    auto stmt = prepare(
        "UPDATE users SET current_cash = ?, total_realized_pnl = ? WHERE user_id = ?;"
    );
    bind_double(stmt, 1, cash);
    bind_double(stmt, 2, realized_pnl);
    bind_text(stmt, 3, user_id);
    step_done(stmt);

    if (sqlite3_changes(db_) != 1) {
        throw std::runtime_error("No stored user with id " + user_id);
    }
}

// ============================================================================
// TRADES
// ============================================================================

void SqliteLedgerStore::append_trade(const Trade& trade, Notional resulting_cash) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_transaction();
    try {
        auto stmt = prepare(R"(
            INSERT INTO trades (
                trade_id, user_id, timestamp, trade_type, strike_price, quantity,
                price_per_contract, total_cost, market_price_at_trade
            ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);
        )");

        bind_text(stmt, 1, trade.id);
        bind_text(stmt, 2, trade.user_id);
        bind_int64(stmt, 3, time_utils::to_micros(trade.timestamp));
        bind_text(stmt, 4, side_to_string(trade.side));
        bind_double(stmt, 5, trade.strike);
        bind_int64(stmt, 6, trade.quantity);
        bind_double(stmt, 7, trade.price_per_contract);
        bind_double(stmt, 8, trade.signed_total_cost);
        bind_double(stmt, 9, trade.underlying_price_at_trade);
        step_done(stmt);

        auto cash_stmt = prepare("UPDATE users SET current_cash = ? WHERE user_id = ?;");
        bind_double(cash_stmt, 1, resulting_cash);
        bind_text(cash_stmt, 2, trade.user_id);
        step_done(cash_stmt);

        commit_transaction();
    } catch (const std::exception& e) {
        rollback_after_failure(e);
        throw;
    }
}

std::vector<Trade> SqliteLedgerStore::trades_for_user(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(R"(
        SELECT trade_id, user_id, timestamp, trade_type, strike_price, quantity,
               price_per_contract, total_cost, market_price_at_trade
        FROM trades WHERE user_id = ? ORDER BY timestamp, rowid;
    )");
    bind_text(stmt, 1, user_id);

    std::vector<Trade> result;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        Trade t;
        t.id = get_text(stmt, 0);
        t.user_id = get_text(stmt, 1);
        t.timestamp = time_utils::from_micros(get_int64(stmt, 2));
        t.side = side_from_string(get_text(stmt, 3));
        t.strike = get_double(stmt, 4);
        t.quantity = get_int64(stmt, 5);
        t.price_per_contract = get_double(stmt, 6);
        t.signed_total_cost = get_double(stmt, 7);
        t.underlying_price_at_trade = get_double(stmt, 8);
        result.push_back(t);
    }

    finalize(stmt);
    return result;
}

int64_t SqliteLedgerStore::trade_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare("SELECT COUNT(*) FROM trades;");
    int64_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = get_int64(stmt, 0);
    }
    finalize(stmt);
    return count;
}

// ============================================================================
// SETTLEMENT
// ============================================================================

void SqliteLedgerStore::record_settlement(const std::string& user_id,
                                          const std::vector<Position>& positions,
                                          Notional cash,
                                          Notional realized_pnl) {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_transaction();
    try {
        int64_t now_us = time_utils::to_micros(wall_now());
        for (const auto& pos : positions) {
            auto stmt = prepare(R"(
                INSERT OR REPLACE INTO positions (
                    user_id, strike_price, quantity, cost_basis, status, settlement_value, updated_at
                ) VALUES (?, ?, ?, ?, ?, ?, ?);
            )");
            bind_text(stmt, 1, user_id);
            bind_double(stmt, 2, pos.strike);
            bind_int64(stmt, 3, pos.net_quantity);
            bind_double(stmt, 4, pos.cost_basis);
            bind_text(stmt, 5, position_status_to_string(pos.status));
            bind_double(stmt, 6, pos.settlement_value);
            bind_int64(stmt, 7, now_us);
            step_done(stmt);
        }

        write_user_cash(user_id, cash, realized_pnl);
        commit_transaction();
    } catch (const std::exception& e) {
        rollback_after_failure(e);
        throw;
    }
}

std::vector<Position> SqliteLedgerStore::settled_positions_for_user(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(R"(
        SELECT strike_price, quantity, cost_basis, status, settlement_value
        FROM positions WHERE user_id = ? ORDER BY strike_price;
    )");
    bind_text(stmt, 1, user_id);

    std::vector<Position> result;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        Position p;
        p.user_id = user_id;
        p.strike = get_double(stmt, 0);
        p.net_quantity = get_int64(stmt, 1);
        p.cost_basis = get_double(stmt, 2);
        p.status = position_status_from_string(get_text(stmt, 3));
        p.settlement_value = get_double(stmt, 4);
        result.push_back(p);
    }

    finalize(stmt);
    return result;
}

// ============================================================================
// MARKET
// ============================================================================

void SqliteLedgerStore::save_market_state(const MarketState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(R"(
        INSERT OR REPLACE INTO market_state (
            id, resolved, final_price, last_sequence_index, updated_at
        ) VALUES (1, ?, ?, ?, ?);
    )");
    bind_int64(stmt, 1, state.resolved ? 1 : 0);
    bind_double(stmt, 2, state.final_price);
    bind_int64(stmt, 3, state.last_sequence_index);
    bind_int64(stmt, 4, time_utils::to_micros(state.updated_at));
    step_done(stmt);
}

std::optional<MarketState> SqliteLedgerStore::load_market_state() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(
        "SELECT resolved, final_price, last_sequence_index, updated_at FROM market_state WHERE id = 1;"
    );

    std::optional<MarketState> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        MarketState s;
        s.resolved = get_int64(stmt, 0) != 0;
        s.final_price = get_double(stmt, 1);
        s.last_sequence_index = get_int64(stmt, 2);
        s.updated_at = time_utils::from_micros(get_int64(stmt, 3));
        result = s;
    }

    finalize(stmt);
    return result;
}

void SqliteLedgerStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    begin_transaction();
    try {
        run("DELETE FROM positions;");
        run("DELETE FROM trades;");
        run("DELETE FROM users;");
        run("DELETE FROM market_state;");
        commit_transaction();
    } catch (const std::exception& e) {
        rollback_after_failure(e);
        throw;
    }
    spdlog::info("Ledger store cleared");
}

} // namespace pmsim
