#pragma once

#ifdef __cplusplus

#include "context.hpp"
#include "db.hpp"
#include "diff_engine.hpp"
#include "types.hpp"
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chronicle {

/// Tables owned by the audit store.
enum class audit_table {
    tables,     // ChronicleTables
    fields,     // ChronicleFields
    resources,  // ChronicleResources
    log         // ChronicleLog
};

const char* table_name(audit_table table);

// ============================================================================
// audit_writer - appends change log rows inside the caller's transaction
//
// Labels are normalized into identity rows (table, field, resource) that are
// created on first use and memoized. Ids first seen inside a transaction stay
// staged until on_commit(); on_rollback() forgets them, because the rows
// they point at were rolled back with the transaction.
// ============================================================================

class audit_writer {
public:
    explicit audit_writer(database& db);

    audit_writer(const audit_writer&) = delete;
    audit_writer& operator=(const audit_writer&) = delete;

    /// Create the audit tables and indexes if they do not exist.
    void ensure_tables();

    /// One log row per change, all sharing timestamp and context.
    /// Never begins or commits a transaction.
    void write(const std::vector<pending_change>& changes,
               const effective_context& context,
               timestamp_t timestamp);

    /// max(now, last + 1ns): batches from one writer are strictly ordered.
    timestamp_t next_timestamp(timestamp_t now);

    void on_commit();
    void on_rollback();

    int64_t count(audit_table table);

private:
    using field_key = std::pair<primary_key_t, std::string>;

    struct identity_cache {
        std::map<std::string, primary_key_t> tables;
        std::map<field_key, primary_key_t> fields;
        std::map<field_key, primary_key_t> resources;

        void clear() {
            tables.clear();
            fields.clear();
            resources.clear();
        }
    };

    primary_key_t table_id(const tracked_schema& schema);
    primary_key_t field_id(primary_key_t table, const std::string& field);
    primary_key_t resource_id(primary_key_t table, const std::string& resource);

    // INSERT ... ON CONFLICT DO NOTHING, then SELECT the surviving row
    primary_key_t upsert_identity(const std::string& table,
                                  const std::vector<std::pair<std::string, column_value_t>>& values,
                                  const std::vector<std::string>& key_columns);

    database& db_;
    std::mutex mutex_;
    identity_cache durable_;
    identity_cache staged_;
    std::optional<timestamp_t> last_timestamp_;
};

} // namespace chronicle

#endif // __cplusplus
