#pragma once

#ifdef __cplusplus

#include "audit_writer.hpp"
#include "context.hpp"
#include "db.hpp"
#include "diff_engine.hpp"
#include "dirty_record.hpp"
#include "retriever.hpp"
#include "schema.hpp"
#include "type_registry.hpp"
#include "types.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chronicle {

using timestamp_factory_t = std::function<timestamp_t()>;

// ============================================================================
// Configuration for auditor
// ============================================================================

struct configuration {
    /// Database file path. Use ":memory:" for an in-memory store.
    std::string path = ":memory:";

    /// Field consulted as the record owner when a declaration names none.
    /// Only applied to record types that actually have the field.
    std::optional<std::string> default_user_id_field;

    /// Resolves the acting user when no context frame names one.
    identity_callback_t identity_callback;

    /// Clock for commit timestamps. Empty = system_clock::now.
    timestamp_factory_t timestamp_factory;

    /// Handler registry. nullptr = the process-wide type_registry::shared().
    std::shared_ptr<type_registry> types;

    configuration() = default;

    explicit configuration(const std::string& p) : path(p) {}
};

// ============================================================================
// auditor - tracked declarations, commit hooks and change queries
//
// Owns its connection when built from a configuration, or writes through a
// host's connection so audit rows share the host's transaction.
// ============================================================================

class auditor {
public:
    auditor() : auditor(configuration()) {}

    explicit auditor(const configuration& config);

    /// Borrow a host connection. config.path is ignored.
    explicit auditor(database& db, const configuration& config = configuration());

    auditor(const auditor&) = delete;
    auditor& operator=(const auditor&) = delete;
    auditor(auditor&&) = delete;
    auditor& operator=(auditor&&) = delete;

    // ========================================================================
    // Declarations
    // ========================================================================

    /// Usage: audit.track<Customer>({"name", "email"});
    template<typename T>
    const tracked_schema& track(const std::vector<std::string>& fields, const track_options& options = {}) {
        return schemas_.declare<T>(fields, options);
    }

    const tracked_schema& declare(const record_type& type,
                                  const std::vector<std::string>& fields,
                                  const track_options& options = {}) {
        return schemas_.declare(type, fields, options);
    }

    // ========================================================================
    // Transaction hooks
    //
    // before_commit runs inside the open transaction on db(). Any exception
    // leaves the transaction to be rolled back by the caller, who must then
    // call after_rollback().
    // ========================================================================

    /// Returns the number of change log rows written.
    size_t before_commit(const std::vector<const dirty_record*>& records, const context_stack& context);

    void after_commit() { writer_.on_commit(); }
    void after_rollback() { writer_.on_rollback(); }

    /// Open a transaction, run block(session), commit with auditing.
    /// Usage: audit.write(ctx, [&](audit_session& s) { s.stage(record_change<Customer>::created(c)); });
    template<typename F>
    size_t write(context_stack& context, F&& block);

    // ========================================================================
    // Queries
    // ========================================================================

    template<typename T>
    std::vector<change_record> query(const change_filter& filter) const {
        const auto* schema = schemas_.lookup<T>();
        if (!schema) {
            throw configuration_error(std::string("Record type '") + record_traits<T>::describe().name +
                                      "' is not tracked");
        }
        return retriever_.query(*schema, filter);
    }

    std::vector<change_record> query(const tracked_schema& schema, const change_filter& filter) const {
        return retriever_.query(schema, filter);
    }

    std::vector<change_record> query(std::string_view record_name, const change_filter& filter) const;

    type_registry& types() { return *types_; }
    const schema_registry& schemas() const { return schemas_; }
    audit_writer& writer() { return writer_; }
    database& db() { return *db_; }
    const configuration& config() const { return config_; }

private:
    timestamp_t now() const;

    configuration config_;
    std::unique_ptr<database> owned_db_;
    database* db_;
    std::shared_ptr<type_registry> types_;
    schema_registry schemas_;
    diff_engine diff_;
    audit_writer writer_;
    change_retriever retriever_;
};

// ============================================================================
// audit_session - one transaction with the audit hooks wired in
//
// Begins a transaction on construction. Host writes go through db(), dirty
// records are staged, and commit() audits them before committing. Leaving
// scope without commit() rolls back.
// ============================================================================

class audit_session {
public:
    audit_session(auditor& owner, context_stack& context);
    ~audit_session();

    audit_session(const audit_session&) = delete;
    audit_session& operator=(const audit_session&) = delete;

    template<typename T>
    void stage(record_change<T> change) {
        stage(std::make_unique<record_change<T>>(std::move(change)));
    }

    void stage(std::unique_ptr<dirty_record> record);

    /// Audit staged records and commit. On failure the transaction is rolled
    /// back and the exception rethrown. Returns the number of log rows written.
    size_t commit();

    void rollback();

    bool active() const { return active_; }
    size_t staged() const { return staged_.size(); }

    database& db() { return auditor_.db(); }
    context_stack& context() { return context_; }

private:
    auditor& auditor_;
    context_stack& context_;
    std::vector<std::unique_ptr<dirty_record>> staged_;
    bool active_ = false;
};

template<typename F>
size_t auditor::write(context_stack& context, F&& block) {
    audit_session session(*this, context);
    block(session);
    return session.commit();
}

} // namespace chronicle

#endif // __cplusplus
