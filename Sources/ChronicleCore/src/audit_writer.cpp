#include "chronicle/audit_writer.hpp"
#include "chronicle/log.hpp"
#include <sstream>

namespace chronicle {

namespace {

template<typename Key>
const primary_key_t* find_id(const std::map<Key, primary_key_t>& staged,
                             const std::map<Key, primary_key_t>& durable,
                             const Key& key) {
    auto it = staged.find(key);
    if (it != staged.end()) return &it->second;
    it = durable.find(key);
    if (it != durable.end()) return &it->second;
    return nullptr;
}

const column_value_t& value_of(const std::vector<std::pair<std::string, column_value_t>>& values,
                               const std::string& column) {
    for (const auto& [name, v] : values) {
        if (name == column) return v;
    }
    throw db_error("Identity key column '" + column + "' has no value");
}

} // namespace

const char* table_name(audit_table table) {
    switch (table) {
        case audit_table::tables: return "ChronicleTables";
        case audit_table::fields: return "ChronicleFields";
        case audit_table::resources: return "ChronicleResources";
        case audit_table::log: return "ChronicleLog";
    }
    return "unknown";
}

audit_writer::audit_writer(database& db) : db_(db) {}

void audit_writer::ensure_tables() {
    db_.execute(R"(
        CREATE TABLE IF NOT EXISTS ChronicleTables (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            tableName TEXT NOT NULL UNIQUE,
            resourceIdField TEXT NOT NULL,
            label TEXT NOT NULL
        )
    )");

    db_.execute(R"(
        CREATE TABLE IF NOT EXISTS ChronicleFields (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            tableId INTEGER NOT NULL REFERENCES ChronicleTables(id),
            fieldName TEXT NOT NULL,
            UNIQUE(tableId, fieldName)
        )
    )");

    db_.execute(R"(
        CREATE TABLE IF NOT EXISTS ChronicleResources (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            tableId INTEGER NOT NULL REFERENCES ChronicleTables(id),
            resourceId TEXT NOT NULL,
            UNIQUE(tableId, resourceId)
        )
    )");

    db_.execute(R"(
        CREATE TABLE IF NOT EXISTS ChronicleLog (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            fieldId INTEGER NOT NULL REFERENCES ChronicleFields(id),
            resourceRowId INTEGER NOT NULL REFERENCES ChronicleResources(id),
            oldValue TEXT,
            newValue TEXT,
            timestamp INTEGER NOT NULL,
            changedBy TEXT,
            reason TEXT,
            impersonatedBy TEXT
        )
    )");

    db_.execute("CREATE INDEX IF NOT EXISTS idx_ChronicleLog_resource ON ChronicleLog(resourceRowId, timestamp)");
    db_.execute("CREATE INDEX IF NOT EXISTS idx_ChronicleLog_changedBy ON ChronicleLog(changedBy)");
}

primary_key_t audit_writer::upsert_identity(const std::string& table,
                                            const std::vector<std::pair<std::string, column_value_t>>& values,
                                            const std::vector<std::string>& key_columns) {
    if (auto id = db_.insert(table, values, key_columns)) {
        return *id;
    }

    // Another writer (or an earlier, uncached batch) created the row first
    std::ostringstream sql;
    sql << "SELECT id FROM " << table << " WHERE ";
    std::vector<column_value_t> params;
    for (size_t i = 0; i < key_columns.size(); ++i) {
        if (i > 0) sql << " AND ";
        sql << key_columns[i] << " = ?";
        params.push_back(value_of(values, key_columns[i]));
    }

    auto rows = db_.query(sql.str(), params);
    if (rows.empty()) {
        LOG_ERROR("writer", "Identity row in %s vanished after conflict", table.c_str());
        throw db_error("Identity row in " + table + " not found after insert conflict");
    }
    return detail::column_int(rows.front(), "id");
}

primary_key_t audit_writer::table_id(const tracked_schema& schema) {
    const std::string& key = schema.table_name();
    if (const auto* id = find_id(staged_.tables, durable_.tables, key)) {
        return *id;
    }
    primary_key_t id = upsert_identity(table_name(audit_table::tables),
                                       {{"tableName", key},
                                        {"resourceIdField", schema.resource_id_field},
                                        {"label", schema.label}},
                                       {"tableName"});
    staged_.tables.emplace(key, id);
    return id;
}

primary_key_t audit_writer::field_id(primary_key_t table, const std::string& field) {
    field_key key{table, field};
    if (const auto* id = find_id(staged_.fields, durable_.fields, key)) {
        return *id;
    }
    primary_key_t id = upsert_identity(table_name(audit_table::fields),
                                       {{"tableId", table}, {"fieldName", field}},
                                       {"tableId", "fieldName"});
    staged_.fields.emplace(std::move(key), id);
    return id;
}

primary_key_t audit_writer::resource_id(primary_key_t table, const std::string& resource) {
    field_key key{table, resource};
    if (const auto* id = find_id(staged_.resources, durable_.resources, key)) {
        return *id;
    }
    primary_key_t id = upsert_identity(table_name(audit_table::resources),
                                       {{"tableId", table}, {"resourceId", resource}},
                                       {"tableId", "resourceId"});
    staged_.resources.emplace(std::move(key), id);
    return id;
}

void audit_writer::write(const std::vector<pending_change>& changes,
                         const effective_context& context,
                         timestamp_t timestamp) {
    if (changes.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const int64_t nanos = to_unix_nanos(timestamp);

    for (const auto& change : changes) {
        if (!change.schema) {
            throw chronicle_error("Pending change for field '" + change.field + "' has no schema");
        }

        primary_key_t table = table_id(*change.schema);
        primary_key_t field = field_id(table, change.field);
        primary_key_t resource = resource_id(table, change.resource_id);

        // The record's owner stands in for an unresolved actor
        const auto& changed_by = context.acting_user_id ? context.acting_user_id : change.owner_user_id;

        db_.insert(table_name(audit_table::log), {
            {"fieldId", field},
            {"resourceRowId", resource},
            {"oldValue", to_column(change.old_value)},
            {"newValue", to_column(change.new_value)},
            {"timestamp", nanos},
            {"changedBy", to_column(changed_by)},
            {"reason", to_column(context.reason)},
            {"impersonatedBy", to_column(context.impersonated_by)}
        });
    }

    LOG_DEBUG("writer", "Wrote %zu change(s) at %lld", changes.size(), static_cast<long long>(nanos));
}

timestamp_t audit_writer::next_timestamp(timestamp_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (last_timestamp_ && now <= *last_timestamp_) {
        now = *last_timestamp_ + std::chrono::nanoseconds(1);
    }
    last_timestamp_ = now;
    return now;
}

void audit_writer::on_commit() {
    std::lock_guard<std::mutex> lock(mutex_);
    durable_.tables.merge(staged_.tables);
    durable_.fields.merge(staged_.fields);
    durable_.resources.merge(staged_.resources);
    staged_.clear();
}

void audit_writer::on_rollback() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!staged_.tables.empty() || !staged_.fields.empty() || !staged_.resources.empty()) {
        LOG_DEBUG("writer", "Dropping %zu staged identity id(s)",
                  staged_.tables.size() + staged_.fields.size() + staged_.resources.size());
    }
    staged_.clear();
}

int64_t audit_writer::count(audit_table table) {
    auto rows = db_.query(std::string("SELECT COUNT(*) AS n FROM ") + table_name(table));
    return rows.empty() ? 0 : detail::column_int(rows.front(), "n");
}

} // namespace chronicle
