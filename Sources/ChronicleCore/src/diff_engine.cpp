#include "chronicle/diff_engine.hpp"
#include "chronicle/log.hpp"

namespace chronicle {

stored_form diff_engine::to_stored(const tracked_schema& schema,
                                   const std::string& field,
                                   const optional_value& v) const {
    if (!v.has_value() || !v->has_value()) {
        return std::nullopt;
    }
    auto declared = schema.field_type(field);
    if (v->type() != declared) {
        throw unsupported_type_error("Field '" + field + "' on " + schema.table_name() + " is declared as " +
                                     types_.type_name(declared) + " but the record holds " +
                                     types_.type_name(v->type()));
    }
    return types_.serialize(*v);
}

void diff_engine::diff_record(const dirty_record& record,
                              const tracked_schema& schema,
                              std::vector<pending_change>& out) const {
    const record_state state = record.state();
    const bool has_before = state != record_state::created;
    const bool has_after = state != record_state::deleted;

    // Business key of the instance: pending value unless the record is gone
    optional_value key = has_after ? record.pending_value(schema.resource_id_field) : std::nullopt;
    if (!key.has_value() || !key->has_value()) {
        key = record.previous_value(schema.resource_id_field);
    }
    if (!key.has_value() || !key->has_value()) {
        throw resource_id_error("Record of type '" + schema.table_name() + "' has no value for resource id field '" +
                                schema.resource_id_field + "'");
    }
    std::string resource_id = types_.serialize(*key);

    std::optional<std::string> owner;
    if (schema.user_id_field) {
        optional_value owner_value = has_after ? record.pending_value(*schema.user_id_field)
                                               : record.previous_value(*schema.user_id_field);
        if (owner_value && owner_value->has_value()) {
            if (types_.is_serializable(owner_value)) {
                owner = types_.serialize(*owner_value);
            } else {
                LOG_DEBUG("diff", "Owner field '%s' on %s is not serializable, ignoring",
                          schema.user_id_field->c_str(), schema.table_name().c_str());
            }
        }
    }

    for (const auto& field : schema.tracked_fields) {
        stored_form old_form = has_before ? to_stored(schema, field, record.previous_value(field)) : std::nullopt;
        stored_form new_form = has_after ? to_stored(schema, field, record.pending_value(field)) : std::nullopt;

        if (old_form == new_form) {
            continue;
        }

        pending_change change;
        change.schema = &schema;
        change.state = state;
        change.resource_id = resource_id;
        change.field = field;
        change.old_value = std::move(old_form);
        change.new_value = std::move(new_form);
        change.owner_user_id = owner;
        out.push_back(std::move(change));
    }
}

std::vector<pending_change> diff_engine::compute_changes(const std::vector<const dirty_record*>& records) const {
    std::vector<pending_change> changes;
    for (const auto* record : records) {
        if (!record) continue;

        const auto* schema = schemas_.lookup(record->record_name());
        if (!schema) {
            continue;
        }

        size_t before = changes.size();
        diff_record(*record, *schema, changes);
        LOG_DEBUG("diff", "%s %s: %zu field change(s)", to_string(record->state()),
                  schema->table_name().c_str(), changes.size() - before);
    }
    return changes;
}

} // namespace chronicle
