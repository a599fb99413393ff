#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace chronicle {

class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg) : std::runtime_error(msg) {}
};

// Values bound to and read from audit statements
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string
>;

inline column_value_t to_column(const std::optional<std::string>& v) {
    if (!v) return nullptr;
    return *v;
}

// ============================================================================
// database - one read/write SQLite connection
//
// The audit engine never owns transactions; it writes through whatever
// transaction the caller has open on this connection.
// ============================================================================

class database {
public:
    explicit database(const std::string& path);
    ~database();

    database(const database&) = delete;
    database& operator=(const database&) = delete;

    /// Insert one row. With conflict_columns, a row that collides on them is
    /// skipped (ON CONFLICT DO NOTHING) and nullopt is returned.
    std::optional<primary_key_t> insert(const std::string& table,
                                        const std::vector<std::pair<std::string, column_value_t>>& values,
                                        const std::vector<std::string>& conflict_columns = {});

    using row_t = std::unordered_map<std::string, column_value_t>;
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

    const std::string& path() const { return path_; }

private:
    class statement;

    sqlite3* db_ = nullptr;
    std::string path_;
};

// RAII transaction guard - rolls back unless committed
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();
    void rollback();
    bool completed() const { return completed_; }

private:
    database& db_;
    bool completed_ = false;
};

// Typed column access for query rows
namespace detail {
    inline const column_value_t* find_column(const database::row_t& row, const std::string& name) {
        auto it = row.find(name);
        return it == row.end() ? nullptr : &it->second;
    }

    inline int64_t column_int(const database::row_t& row, const std::string& name) {
        const auto* v = find_column(row, name);
        if (!v || !std::holds_alternative<int64_t>(*v)) {
            throw db_error("Column '" + name + "' is missing or not an integer");
        }
        return std::get<int64_t>(*v);
    }

    inline std::optional<std::string> column_text(const database::row_t& row, const std::string& name) {
        const auto* v = find_column(row, name);
        if (!v || std::holds_alternative<std::nullptr_t>(*v)) return std::nullopt;
        if (!std::holds_alternative<std::string>(*v)) {
            throw db_error("Column '" + name + "' is not text");
        }
        return std::get<std::string>(*v);
    }
} // namespace detail

} // namespace chronicle

#endif // __cplusplus
