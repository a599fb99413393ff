#pragma once

#ifdef __cplusplus

#include "dirty_record.hpp"
#include "schema.hpp"
#include "type_registry.hpp"
#include <optional>
#include <string>
#include <vector>

namespace chronicle {

/// One field transition waiting to be written. Values are already in stored form.
struct pending_change {
    const tracked_schema* schema = nullptr;
    record_state state = record_state::updated;
    std::string resource_id;
    std::string field;
    stored_form old_value;   // nullopt on creation
    stored_form new_value;   // nullopt on deletion
    std::optional<std::string> owner_user_id;  // value of the schema's user_id_field, if any
};

// ============================================================================
// diff_engine - turns dirty records into field-level changes
//
// Two values are equal when their stored forms are equal, which is exactly the
// equality the type handlers' round trip preserves. Output order is tracked
// field declaration order within a record, records in input order.
// ============================================================================

class diff_engine {
public:
    diff_engine(const schema_registry& schemas, const type_registry& types)
        : schemas_(schemas), types_(types) {}

    /// All-or-nothing: any serialization failure throws and nothing is returned.
    std::vector<pending_change> compute_changes(const std::vector<const dirty_record*>& records) const;

    std::vector<pending_change> compute_changes(const dirty_record& record) const {
        return compute_changes(std::vector<const dirty_record*>{&record});
    }

private:
    void diff_record(const dirty_record& record,
                     const tracked_schema& schema,
                     std::vector<pending_change>& out) const;

    stored_form to_stored(const tracked_schema& schema,
                          const std::string& field,
                          const optional_value& v) const;

    const schema_registry& schemas_;
    const type_registry& types_;
};

} // namespace chronicle

#endif // __cplusplus
