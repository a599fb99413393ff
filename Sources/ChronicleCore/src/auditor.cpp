#include "chronicle/auditor.hpp"
#include "chronicle/log.hpp"

namespace chronicle {

auditor::auditor(const configuration& config)
    : config_(config)
    , owned_db_(std::make_unique<database>(config.path))
    , db_(owned_db_.get())
    , types_(config.types ? config.types : type_registry::shared())
    , schemas_(types_, config.default_user_id_field)
    , diff_(schemas_, *types_)
    , writer_(*db_)
    , retriever_(*db_, *types_) {
    writer_.ensure_tables();
    LOG_INFO("auditor", "Opened audit store %s", config_.path.c_str());
}

auditor::auditor(database& db, const configuration& config)
    : config_(config)
    , owned_db_(nullptr)
    , db_(&db)
    , types_(config.types ? config.types : type_registry::shared())
    , schemas_(types_, config.default_user_id_field)
    , diff_(schemas_, *types_)
    , writer_(*db_)
    , retriever_(*db_, *types_) {
    config_.path = db.path();
    writer_.ensure_tables();
    LOG_INFO("auditor", "Attached to host connection %s", config_.path.c_str());
}

timestamp_t auditor::now() const {
    return config_.timestamp_factory ? config_.timestamp_factory() : std::chrono::system_clock::now();
}

size_t auditor::before_commit(const std::vector<const dirty_record*>& records, const context_stack& context) {
    if (!db_->is_in_transaction()) {
        LOG_ERROR("auditor", "before_commit called without an open transaction");
        throw chronicle_error("Audit rows must be written inside the caller's transaction");
    }

    auto changes = diff_.compute_changes(records);
    if (changes.empty()) {
        LOG_DEBUG("auditor", "%zu dirty record(s), nothing to audit", records.size());
        return 0;
    }

    effective_context effective = context.current(config_.identity_callback);
    timestamp_t stamp = writer_.next_timestamp(now());
    writer_.write(changes, effective, stamp);

    LOG_DEBUG("auditor", "Audited %zu change(s) from %zu record(s)", changes.size(), records.size());
    return changes.size();
}

std::vector<change_record> auditor::query(std::string_view record_name, const change_filter& filter) const {
    const auto* schema = schemas_.lookup(record_name);
    if (!schema) {
        throw configuration_error("Record type '" + std::string(record_name) + "' is not tracked");
    }
    return retriever_.query(*schema, filter);
}

// ============================================================================
// audit_session
// ============================================================================

audit_session::audit_session(auditor& owner, context_stack& context)
    : auditor_(owner), context_(context) {
    auditor_.db().begin_transaction();
    active_ = true;
}

audit_session::~audit_session() {
    if (!active_) {
        return;
    }
    try {
        rollback();
    } catch (const std::exception& e) {
        LOG_ERROR("session", "Rollback on scope exit failed: %s", e.what());
    }
}

void audit_session::stage(std::unique_ptr<dirty_record> record) {
    if (!active_) {
        throw chronicle_error("Cannot stage a record on a finished session");
    }
    if (record) {
        staged_.push_back(std::move(record));
    }
}

size_t audit_session::commit() {
    if (!active_) {
        throw chronicle_error("Session has already been committed or rolled back");
    }

    size_t written = 0;
    try {
        std::vector<const dirty_record*> records;
        records.reserve(staged_.size());
        for (const auto& r : staged_) {
            records.push_back(r.get());
        }
        written = auditor_.before_commit(records, context_);
        auditor_.db().commit();
    } catch (...) {
        LOG_WARN("session", "Commit failed, rolling back");
        rollback();
        throw;
    }

    active_ = false;
    staged_.clear();
    auditor_.after_commit();
    return written;
}

void audit_session::rollback() {
    if (!active_) {
        return;
    }
    active_ = false;
    staged_.clear();
    auditor_.after_rollback();
    if (auditor_.db().is_in_transaction()) {
        auditor_.db().rollback();
    }
}

} // namespace chronicle
