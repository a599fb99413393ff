#include "chronicle/db.hpp"
#include "chronicle/log.hpp"
#include <algorithm>
#include <chrono>
#include <sstream>
#include <thread>

namespace chronicle {

namespace {

constexpr int k_busy_timeout_ms = 5000;
constexpr int k_max_backoff_ms = 1000;
constexpr int k_max_begin_wait_ms = 30000;

void append_columns(std::ostringstream& sql, const std::vector<std::string>& columns) {
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) sql << ", ";
        sql << columns[i];
    }
}

} // namespace

// ============================================================================
// database::statement - prepared statement, finalized on scope exit
// ============================================================================

class database::statement {
public:
    statement(sqlite3* db, const std::string& sql) : db_(db), sql_(sql) {
        if (sqlite3_prepare_v2(db_, sql_.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            fail("Failed to prepare statement");
        }
    }

    ~statement() { sqlite3_finalize(stmt_); }

    statement(const statement&) = delete;
    statement& operator=(const statement&) = delete;

    void bind(const std::vector<column_value_t>& params) {
        int index = 1;
        for (const auto& param : params) {
            std::visit([&](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::nullptr_t>) {
                    sqlite3_bind_null(stmt_, index);
                } else if constexpr (std::is_same_v<T, int64_t>) {
                    sqlite3_bind_int64(stmt_, index, v);
                } else if constexpr (std::is_same_v<T, double>) {
                    sqlite3_bind_double(stmt_, index, v);
                } else {
                    sqlite3_bind_text(stmt_, index, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
                }
            }, param);
            ++index;
        }
    }

    /// True while rows are produced, false once the statement is done.
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        fail("Execution failed");
    }

    row_t row() const {
        row_t out;
        int count = sqlite3_column_count(stmt_);
        for (int i = 0; i < count; ++i) {
            out[sqlite3_column_name(stmt_, i)] = column(i);
        }
        return out;
    }

private:
    column_value_t column(int i) const {
        switch (sqlite3_column_type(stmt_, i)) {
            case SQLITE_INTEGER:
                return static_cast<int64_t>(sqlite3_column_int64(stmt_, i));
            case SQLITE_FLOAT:
                return sqlite3_column_double(stmt_, i);
            case SQLITE_TEXT: {
                const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, i));
                if (!text) return std::string();
                return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt_, i)));
            }
            case SQLITE_NULL:
                return nullptr;
            default:
                throw db_error(std::string("Column '") + sqlite3_column_name(stmt_, i) +
                               "' holds a blob (SQL: " + sql_ + ")");
        }
    }

    [[noreturn]] void fail(const char* what) const {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "%s: %s (SQL: %s)", what, error.c_str(), sql_.c_str());
        throw db_error(std::string(what) + ": " + error + " (SQL: " + sql_ + ")");
    }

    sqlite3* db_;
    std::string sql_;
    sqlite3_stmt* stmt_ = nullptr;
};

// ============================================================================
// database
// ============================================================================

database::database(const std::string& path) : path_(path) {
    int rc = sqlite3_open_v2(path.c_str(), &db_,
                             SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open database %s: %s", path.c_str(), error.c_str());
        throw db_error("Failed to open database: " + error);
    }

    sqlite3_busy_timeout(db_, k_busy_timeout_ms);
    execute("PRAGMA foreign_keys = ON");

    // WAL lets readers of the audit log run alongside the writing transaction
    if (path != ":memory:") {
        execute("PRAGMA journal_mode = WAL");
    }
    LOG_DEBUG("db", "Opened %s", path.c_str());
}

database::~database() {
    sqlite3_close(db_);
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    statement stmt(db_, sql);
    stmt.bind(params);
    while (stmt.step()) {
    }
}

std::vector<database::row_t> database::query(const std::string& sql,
                                             const std::vector<column_value_t>& params) {
    statement stmt(db_, sql);
    stmt.bind(params);

    std::vector<row_t> rows;
    while (stmt.step()) {
        rows.push_back(stmt.row());
    }
    return rows;
}

std::optional<primary_key_t> database::insert(const std::string& table,
                                              const std::vector<std::pair<std::string, column_value_t>>& values,
                                              const std::vector<std::string>& conflict_columns) {
    std::vector<std::string> columns;
    std::vector<column_value_t> params;
    columns.reserve(values.size());
    params.reserve(values.size());
    for (const auto& [column, value] : values) {
        columns.push_back(column);
        params.push_back(value);
    }

    std::ostringstream sql;
    sql << "INSERT INTO " << table << " (";
    append_columns(sql, columns);
    sql << ") VALUES (";
    for (size_t i = 0; i < params.size(); ++i) {
        sql << (i > 0 ? ", ?" : "?");
    }
    sql << ")";

    // Identity rows: concurrent first writers converge on the UNIQUE key
    if (!conflict_columns.empty()) {
        sql << " ON CONFLICT (";
        append_columns(sql, conflict_columns);
        sql << ") DO NOTHING";
    }

    execute(sql.str(), params);
    if (sqlite3_changes(db_) == 0) {
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(db_);
}

void database::begin_transaction() {
    // IMMEDIATE takes the write lock up front so identity-row upserts never
    // hit a lock upgrade failure halfway through an audit batch.
    int backoff_ms = 1;
    int waited_ms = 0;
    int rc = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);
    while ((rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && waited_ms < k_max_begin_wait_ms) {
        LOG_DEBUG("db", "Write lock busy on %s, retrying in %d ms", path_.c_str(), backoff_ms);
        std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
        waited_ms += backoff_ms;
        backoff_ms = std::min(backoff_ms * 2, k_max_backoff_ms);
        rc = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);
    }

    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "Failed to begin transaction after %d ms: %s", waited_ms, error.c_str());
        throw db_error("Failed to begin transaction: " + error);
    }
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

bool database::is_in_transaction() const {
    return sqlite3_get_autocommit(db_) == 0;
}

// ============================================================================
// transaction
// ============================================================================

transaction::transaction(database& db) : db_(db) {
    db_.begin_transaction();
}

transaction::~transaction() {
    if (completed_ || !db_.is_in_transaction()) {
        return;
    }
    try {
        db_.rollback();
    } catch (const db_error& e) {
        LOG_ERROR("db", "Rollback on scope exit failed: %s", e.what());
    }
}

void transaction::commit() {
    db_.commit();
    completed_ = true;
}

void transaction::rollback() {
    db_.rollback();
    completed_ = true;
}

} // namespace chronicle
